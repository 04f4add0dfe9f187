/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for command-line input
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (matches ^-?[0-9]+$ and fits in int64)
 * - Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON object or array ({...} or [...])
 * - Quoted string ("...", JSON escapes apply)
 * - Raw string (fallback)
 */

#ifndef PATCHWORK_PARSE_HPP
#define PATCHWORK_PARSE_HPP

#include "patchwork/Value.hpp"
#include <string>

namespace patchwork {

/**
 * @brief Parse a string into the most specific Value it spells
 *
 * @param str Input string to parse
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * - "true" → true
 * - "42" → 42
 * - "4.20" → 4.2
 * - "{\"a\":1}" → {"a": 1}
 * - "\"42\"" → "42"
 * - "web" → "web"
 */
Value parse_value(const std::string& str);

} // namespace patchwork

#endif // PATCHWORK_PARSE_HPP
