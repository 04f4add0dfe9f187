/**
 * @file Combine.cpp
 * @brief Implementation of combine strategies
 */

#include "patchwork/Combine.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/Format.hpp"

namespace patchwork {

Value combine(const Combine& config, const std::vector<Value>& values) {
    if (values.empty()) {
        throw CombineRequiresVariables();
    }

    switch (config.strategy) {
        case CombineStrategy::String:
            if (!config.string) {
                throw CombineConfigMissing(to_string(config.strategy));
            }
            return format_values(config.string->format, values);
    }
    throw CombineConfigMissing(to_string(config.strategy));
}

} // namespace patchwork
