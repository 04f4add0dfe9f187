/**
 * @file Format.hpp
 * @brief printf-style formatting of Values
 *
 * Used by the String transform (one value) and the string combine strategy
 * (one value per combine variable).
 *
 * Supported directives: %s %v %d %f %e %g %q %t %x %X and the literal %%.
 * Each directive may carry flags (- + space 0 #), a width and a precision,
 * e.g. "%-8s", "%05d", "%.2f".
 */

#ifndef PATCHWORK_FORMAT_HPP
#define PATCHWORK_FORMAT_HPP

#include "patchwork/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace patchwork {

/**
 * @brief Render values into a positional format template
 *
 * Values are consumed left to right, one per directive.
 *
 * @param format Template such as "%s-%s"
 * @param values Values to substitute, in order
 * @return Rendered string
 * @throws FormatError if the number of directives differs from the number
 *         of values, a directive is unknown, or a value has the wrong kind
 *         for its directive (e.g. %d with a string)
 *
 * ```cpp
 * format_values("%s-%s", {"foo", "bar"});   // "foo-bar"
 * format_values("%05.1f", {3.14159});       // "003.1"
 * format_values("%s-%s", {"foo"});          // throws FormatError
 * ```
 */
std::string format_values(const std::string& format, const std::vector<Value>& values);

/**
 * @brief Count the value-consuming directives in a format template
 * @throws FormatError if the template is malformed
 */
std::size_t count_directives(const std::string& format);

} // namespace patchwork

#endif // PATCHWORK_FORMAT_HPP
