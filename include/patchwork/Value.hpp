/**
 * @file Value.hpp
 * @brief Value type for documents and values flowing through patches
 *
 * Uses nlohmann::json as the underlying value model. It is a closed variant:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t, or uint64_t for large parsed literals)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef PATCHWORK_VALUE_HPP
#define PATCHWORK_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace patchwork {

/**
 * @brief JSON-like value type used for documents and transform values
 *
 * Both the composite and the composed documents are Values, as is every
 * intermediate value produced by the combine and transform stages.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Render a value the way it reads when printed as text
 *
 * Strings are returned verbatim (no quotes). Integers print in decimal,
 * floats in plain decimal from their shortest round-trip digits with a
 * trailing ".0" dropped (1e20 prints as 100000000000000000000),
 * booleans as "true"/"false", null as "null". Containers render as
 * compact JSON.
 */
std::string to_display_string(const Value& val);

} // namespace patchwork

#endif // PATCHWORK_VALUE_HPP
