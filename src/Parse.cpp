/**
 * @file Parse.cpp
 * @brief Implementation of command-line value parsing
 */

#include "patchwork/Parse.hpp"
#include "patchwork/Util.hpp"

#include <cstdint>
#include <regex>
#include <stdexcept>

namespace patchwork {

namespace {
    const std::regex kIntegerPattern("^-?[0-9]+$");
    const std::regex kFloatPattern("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    if (std::regex_match(str, kIntegerPattern)) {
        try {
            return static_cast<std::int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            // Too large for int64: keep the text
            return str;
        }
    }

    if (std::regex_match(str, kFloatPattern)) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            return str;
        }
    }

    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

} // namespace patchwork
