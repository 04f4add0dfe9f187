/**
 * @file Combine.hpp
 * @brief Combine several source values into one
 */

#ifndef PATCHWORK_COMBINE_HPP
#define PATCHWORK_COMBINE_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"
#include <vector>

namespace patchwork {

/**
 * @brief Merge values according to a combine strategy
 *
 * The string strategy renders its format with the values as positional
 * arguments, in variable order.
 *
 * @param config Combine configuration (variables are not read here)
 * @param values One value per combine variable
 * @return Combined value
 * @throws CombineRequiresVariables if values is empty
 * @throws CombineConfigMissing if the strategy's configuration block is absent
 * @throws FormatError if the format does not fit the values
 *
 * ```cpp
 * Combine c;
 * c.string = StringCombine{"%s-%s"};
 * combine(c, {"foo", "bar"});   // "foo-bar"
 * ```
 */
Value combine(const Combine& config, const std::vector<Value>& values);

} // namespace patchwork

#endif // PATCHWORK_COMBINE_HPP
