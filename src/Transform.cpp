/**
 * @file Transform.cpp
 * @brief Implementation of the transform pipeline
 */

#include "patchwork/Transform.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/Format.hpp"
#include "patchwork/Util.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace patchwork {

namespace {

constexpr std::int64_t kMaxExactInt = std::int64_t{1} << 53;

// 2^63 as a double; the int64 range is [-2^63, 2^63)
constexpr double kInt64Bound = 9223372036854775808.0;

/**
 * @brief Classify a value as the transform I/O type it currently holds
 */
TransformIOType io_type_of(const Value& v) {
    if (v.is_string()) return TransformIOType::String;
    if (v.is_number_integer()) return TransformIOType::Int64;
    if (v.is_number_float()) return TransformIOType::Float64;
    if (v.is_boolean()) return TransformIOType::Bool;
    if (v.is_object()) return TransformIOType::Object;
    if (v.is_array()) return TransformIOType::Array;
    throw TransformError("cannot convert " + type_name(v) + " input");
}

TransformIOType normalize(TransformIOType t) {
    return t == TransformIOType::Int ? TransformIOType::Int64 : t;
}

std::int64_t as_int64(const Value& v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw TransformError("integer " + std::to_string(u) + " overflows int64");
        }
        return static_cast<std::int64_t>(u);
    }
    return v.get<std::int64_t>();
}

bool is_scalar_text(const Value& v) {
    return v.is_string() || v.is_number() || v.is_boolean();
}

std::int64_t parse_int64(const std::string& s) {
    const bool starts_ok = !s.empty() &&
        (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '-' || s[0] == '+');
    if (starts_ok) {
        try {
            std::size_t pos = 0;
            const long long n = std::stoll(s, &pos, 10);
            if (pos == s.size()) return static_cast<std::int64_t>(n);
        } catch (const std::out_of_range&) {
            throw TransformError("cannot convert \"" + s + "\" to int64: out of range");
        } catch (const std::invalid_argument&) {
            // reported below
        }
    }
    throw TransformError("cannot convert \"" + s + "\" to int64");
}

double parse_float64(const std::string& s) {
    const bool starts_ok = !s.empty() &&
        (std::isdigit(static_cast<unsigned char>(s[0])) || s[0] == '-' || s[0] == '+' || s[0] == '.');
    if (starts_ok) {
        try {
            std::size_t pos = 0;
            const double d = std::stod(s, &pos);
            if (pos == s.size() && std::isfinite(d)) return d;
        } catch (const std::out_of_range&) {
            throw TransformError("cannot convert \"" + s + "\" to float64: out of range");
        } catch (const std::invalid_argument&) {
            // reported below
        }
    }
    throw TransformError("cannot convert \"" + s + "\" to float64");
}

bool parse_bool(const std::string& s) {
    const std::string lower = to_lower(s);
    if (lower == "true" || lower == "t" || lower == "1") return true;
    if (lower == "false" || lower == "f" || lower == "0") return false;
    throw TransformError("cannot convert \"" + s + "\" to bool");
}

Value convert_from_string(const std::string& s, TransformIOType to) {
    switch (to) {
        case TransformIOType::Int64: return parse_int64(s);
        case TransformIOType::Float64: return parse_float64(s);
        case TransformIOType::Bool: return parse_bool(s);
        default: break;
    }
    throw TransformError("cannot convert string to " + to_string(to) + " without format json");
}

Value convert_from_int(const Value& v, TransformIOType to) {
    if (v.is_number_unsigned() && to == TransformIOType::String) {
        return std::to_string(v.get<std::uint64_t>());
    }
    const std::int64_t i = as_int64(v);
    switch (to) {
        case TransformIOType::String:
            return std::to_string(i);
        case TransformIOType::Float64:
            if (i > kMaxExactInt || i < -kMaxExactInt) {
                throw TransformError("int64 " + std::to_string(i) +
                                     " cannot be represented exactly as float64");
            }
            return static_cast<double>(i);
        case TransformIOType::Bool:
            if (i == 0) return false;
            if (i == 1) return true;
            throw TransformError("cannot convert int64 " + std::to_string(i) + " to bool");
        default: break;
    }
    throw TransformError("cannot convert int64 to " + to_string(to));
}

Value convert_from_float(double d, TransformIOType to) {
    switch (to) {
        case TransformIOType::String:
            return to_display_string(Value(d));
        case TransformIOType::Int64:
            if (std::trunc(d) != d || d < -kInt64Bound || d >= kInt64Bound) {
                throw TransformError("float64 " + to_display_string(Value(d)) +
                                     " cannot be represented exactly as int64");
            }
            return static_cast<std::int64_t>(d);
        case TransformIOType::Bool:
            if (d == 0.0) return false;
            if (d == 1.0) return true;
            throw TransformError("cannot convert float64 " + to_display_string(Value(d)) + " to bool");
        default: break;
    }
    throw TransformError("cannot convert float64 to " + to_string(to));
}

Value convert_from_bool(bool b, TransformIOType to) {
    switch (to) {
        case TransformIOType::String: return b ? "true" : "false";
        case TransformIOType::Int64: return static_cast<std::int64_t>(b ? 1 : 0);
        case TransformIOType::Float64: return b ? 1.0 : 0.0;
        default: break;
    }
    throw TransformError("cannot convert bool to " + to_string(to));
}

Value convert_json(const Value& input, TransformIOType to) {
    if (!input.is_string()) {
        throw TransformError("format json requires a string input, got " + type_name(input));
    }
    if (to != TransformIOType::Object && to != TransformIOType::Array) {
        throw TransformError("format json can only convert to object or array, not " + to_string(to));
    }

    Value parsed;
    try {
        parsed = Value::parse(input.get<std::string>());
    } catch (const nlohmann::json::parse_error& e) {
        throw TransformError(std::string("cannot parse input as json: ") + e.what());
    }
    if (normalize(io_type_of(parsed)) != to) {
        throw TransformError("json input is " + type_name(parsed) + ", expected " + to_string(to));
    }
    return parsed;
}

/**
 * @brief Multiplier for a quantity suffix, or 0 if the suffix is unknown
 */
long double quantity_multiplier(const std::string& suffix) {
    if (suffix.empty()) return 1.0L;
    if (suffix == "Ki") return 1024.0L;
    if (suffix == "Mi") return 1024.0L * 1024;
    if (suffix == "Gi") return 1024.0L * 1024 * 1024;
    if (suffix == "Ti") return 1024.0L * 1024 * 1024 * 1024;
    if (suffix == "Pi") return 1024.0L * 1024 * 1024 * 1024 * 1024;
    if (suffix == "Ei") return 1024.0L * 1024 * 1024 * 1024 * 1024 * 1024;
    if (suffix == "n") return 1e-9L;
    if (suffix == "u") return 1e-6L;
    if (suffix == "m") return 1e-3L;
    if (suffix == "k") return 1e3L;
    if (suffix == "M") return 1e6L;
    if (suffix == "G") return 1e9L;
    if (suffix == "T") return 1e12L;
    if (suffix == "P") return 1e15L;
    if (suffix == "E") return 1e18L;
    return 0.0L;
}

std::string render_input(const Value& input, const char* transform) {
    if (!is_scalar_text(input)) {
        throw TransformError(std::string(transform) + " transform requires a scalar input, got " +
                             type_name(input));
    }
    return to_display_string(input);
}

std::regex compile_regex(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw TransformError("invalid regexp \"" + pattern + "\": " + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// Convert
// ============================================================================

Value parse_quantity(const std::string& text, TransformIOType to_type) {
    const TransformIOType to = normalize(to_type);
    if (to != TransformIOType::Int64 && to != TransformIOType::Float64) {
        throw TransformError("format quantity can only convert to int64 or float64, not " +
                             to_string(to_type));
    }

    // <sign><digits>[.<digits>][(e|E)<sign><digits>]<suffix>
    std::size_t pos = 0;
    const std::size_t n = text.size();
    if (pos < n && (text[pos] == '+' || text[pos] == '-')) ++pos;
    const std::size_t digits_start = pos;
    while (pos < n && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos < n && text[pos] == '.') {
        ++pos;
        while (pos < n && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    }
    if (pos == digits_start || (pos == digits_start + 1 && text[digits_start] == '.')) {
        throw TransformError("invalid quantity \"" + text + "\"");
    }
    if (pos + 1 < n && (text[pos] == 'e' || text[pos] == 'E')) {
        std::size_t exp = pos + 1;
        if (text[exp] == '+' || text[exp] == '-') ++exp;
        if (exp < n && std::isdigit(static_cast<unsigned char>(text[exp]))) {
            while (exp < n && std::isdigit(static_cast<unsigned char>(text[exp]))) ++exp;
            pos = exp;
        }
    }

    const std::string number = text.substr(0, pos);
    const long double multiplier = quantity_multiplier(text.substr(pos));
    if (multiplier == 0.0L) {
        throw TransformError("invalid quantity suffix in \"" + text + "\"");
    }

    long double value = 0.0L;
    try {
        value = std::stold(number) * multiplier;
    } catch (const std::exception&) {
        throw TransformError("invalid quantity \"" + text + "\"");
    }

    if (to == TransformIOType::Float64) {
        return static_cast<double>(value);
    }
    const long double rounded = std::ceil(value);
    if (rounded < -static_cast<long double>(kInt64Bound) ||
        rounded >= static_cast<long double>(kInt64Bound)) {
        throw TransformError("quantity \"" + text + "\" overflows int64");
    }
    return static_cast<std::int64_t>(rounded);
}

Value convert_value(const Value& input, TransformIOType to_type,
                    std::optional<ConvertFormat> format) {
    const TransformIOType to = normalize(to_type);
    const ConvertFormat fmt = format.value_or(ConvertFormat::None);

    if (fmt == ConvertFormat::Json) {
        return convert_json(input, to);
    }
    if (fmt == ConvertFormat::Quantity) {
        if (!input.is_string()) {
            throw TransformError("format quantity requires a string input, got " + type_name(input));
        }
        return parse_quantity(input.get<std::string>(), to);
    }

    const TransformIOType from = io_type_of(input);
    if (from == to) {
        return input;
    }

    switch (from) {
        case TransformIOType::String: return convert_from_string(input.get<std::string>(), to);
        case TransformIOType::Int64: return convert_from_int(input, to);
        case TransformIOType::Float64: return convert_from_float(input.get<double>(), to);
        case TransformIOType::Bool: return convert_from_bool(input.get<bool>(), to);
        default: break;
    }
    throw TransformError("cannot convert " + type_name(input) + " to " + to_string(to));
}

Value resolve_convert(const ConvertTransform& t, const Value& input) {
    return convert_value(input, t.to_type, t.format);
}

// ============================================================================
// Math
// ============================================================================

Value resolve_math(const MathTransform& t, const Value& input) {
    if (!input.is_number()) {
        throw TransformError("math transform requires a numeric input, got " + type_name(input));
    }

    switch (t.type) {
        case MathTransformType::Multiply: {
            if (!t.multiply) {
                throw TransformError("math transform of type Multiply requires multiply");
            }
            const std::int64_t m = *t.multiply;
            if (input.is_number_float()) {
                return input.get<double>() * static_cast<double>(m);
            }
            const std::int64_t x = as_int64(input);
            const long double product = static_cast<long double>(x) * static_cast<long double>(m);
            if (product >= static_cast<long double>(kInt64Bound) ||
                product < -static_cast<long double>(kInt64Bound)) {
                throw TransformError("math transform overflows int64: " + std::to_string(x) +
                                     " * " + std::to_string(m));
            }
            return x * m;
        }
        case MathTransformType::ClampMin:
        case MathTransformType::ClampMax: {
            const bool is_min = t.type == MathTransformType::ClampMin;
            const std::optional<std::int64_t>& bound = is_min ? t.clamp_min : t.clamp_max;
            if (!bound) {
                throw TransformError("math transform of type " + to_string(t.type) + " requires " +
                                     (is_min ? "clampMin" : "clampMax"));
            }
            if (input.is_number_float()) {
                const double x = input.get<double>();
                const double b = static_cast<double>(*bound);
                return (is_min ? x < b : x > b) ? b : x;
            }
            const std::int64_t x = as_int64(input);
            return (is_min ? x < *bound : x > *bound) ? *bound : x;
        }
    }
    throw TransformError("math transform type " + std::to_string(static_cast<int>(t.type)) +
                         " is unsupported");
}

// ============================================================================
// Map / Match
// ============================================================================

Value resolve_map(const MapTransform& t, const Value& input) {
    const std::string key = render_input(input, "map");
    auto it = t.pairs.find(key);
    if (it != t.pairs.end()) {
        return it->second;
    }
    if (t.fallback_value) {
        return *t.fallback_value;
    }
    throw TransformError("key \"" + key + "\" is not found in map");
}

Value resolve_match(const MatchTransform& t, const Value& input) {
    const std::string text = render_input(input, "match");

    for (std::size_t i = 0; i < t.patterns.size(); ++i) {
        const MatchPattern& p = t.patterns[i];
        bool matched = false;
        if (p.type == MatchPatternType::Literal) {
            if (!p.literal) {
                throw TransformError("match pattern at index " + std::to_string(i) +
                                     " of type literal requires literal");
            }
            matched = text == *p.literal;
        } else {
            if (!p.regexp) {
                throw TransformError("match pattern at index " + std::to_string(i) +
                                     " of type regexp requires regexp");
            }
            matched = std::regex_search(text, compile_regex(*p.regexp));
        }
        if (matched) {
            return p.result;
        }
    }

    if (t.fallback_to == MatchFallbackTo::Input) {
        return input;
    }
    return t.fallback_value.value_or(Value());
}

// ============================================================================
// String
// ============================================================================

Value resolve_string(const StringTransform& t, const Value& input) {
    switch (t.type) {
        case StringTransformType::Format:
            if (!t.format) {
                throw TransformError("string transform of type Format requires fmt");
            }
            return format_values(*t.format, {input});

        case StringTransformType::Convert: {
            if (!t.convert) {
                throw TransformError("string transform of type Convert requires convert");
            }
            if (*t.convert == StringConversionType::ToJson) {
                return input.dump();
            }
            const std::string text = render_input(input, "string");
            switch (*t.convert) {
                case StringConversionType::ToUpper: return to_upper(text);
                case StringConversionType::ToLower: return to_lower(text);
                case StringConversionType::ToBase64: return base64_encode(text);
                case StringConversionType::FromBase64: {
                    auto decoded = base64_decode(text);
                    if (!decoded) {
                        throw TransformError("input is not valid base64: \"" + text + "\"");
                    }
                    return *decoded;
                }
                default: break;
            }
            throw TransformError("string conversion type " + to_string(*t.convert) + " is unsupported");
        }

        case StringTransformType::TrimPrefix:
        case StringTransformType::TrimSuffix: {
            if (!t.trim) {
                throw TransformError("string transform of type " + to_string(t.type) + " requires trim");
            }
            std::string text = render_input(input, "string");
            if (t.type == StringTransformType::TrimPrefix) {
                if (starts_with(text, *t.trim)) text.erase(0, t.trim->size());
            } else {
                if (ends_with(text, *t.trim)) text.erase(text.size() - t.trim->size());
            }
            return text;
        }

        case StringTransformType::Regexp: {
            if (!t.regexp) {
                throw TransformError("string transform of type Regexp requires regexp");
            }
            const std::string text = render_input(input, "string");
            const std::regex re = compile_regex(t.regexp->match);
            std::smatch m;
            if (!std::regex_search(text, m, re)) {
                throw TransformError("regexp \"" + t.regexp->match + "\" had no matches in \"" +
                                     text + "\"");
            }
            const int group = t.regexp->group.value_or(0);
            if (group < 0 || static_cast<std::size_t>(group) >= m.size()) {
                throw TransformError("regexp \"" + t.regexp->match + "\" has no capture group " +
                                     std::to_string(group));
            }
            return m[static_cast<std::size_t>(group)].str();
        }
    }
    throw TransformError("string transform type " + std::to_string(static_cast<int>(t.type)) +
                         " is unsupported");
}

// ============================================================================
// Pipeline
// ============================================================================

Value resolve_transform(const Transform& transform, const Value& input) {
    struct Resolver {
        const Value& input;
        Value operator()(const ConvertTransform& t) const { return resolve_convert(t, input); }
        Value operator()(const MathTransform& t) const { return resolve_math(t, input); }
        Value operator()(const MapTransform& t) const { return resolve_map(t, input); }
        Value operator()(const MatchTransform& t) const { return resolve_match(t, input); }
        Value operator()(const StringTransform& t) const { return resolve_string(t, input); }
    };
    return std::visit(Resolver{input}, transform);
}

Value resolve_transforms(const std::vector<Transform>& transforms, const Value& input) {
    Value current = input;
    for (const auto& t : transforms) {
        current = resolve_transform(t, current);
    }
    return current;
}

} // namespace patchwork
