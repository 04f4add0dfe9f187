/**
 * @file Schema.cpp
 * @brief Implementation of rule encoding and decoding
 */

#include "patchwork/Schema.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/Util.hpp"

#include <cstdint>
#include <string>

namespace patchwork {

// ============================================================================
// Helpers
// ============================================================================

namespace {

void expect_object(const Value& j, const std::string& what) {
    if (!j.is_object()) {
        throw SchemaError(what + " must be an object, got " + type_name(j));
    }
}

bool has(const Value& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

std::string read_string(const Value& j, const char* key, const std::string& what) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw SchemaError(what + "." + key + " is required");
    }
    if (!it->is_string()) {
        throw SchemaError(what + "." + key + " must be a string, got " + type_name(*it));
    }
    return it->get<std::string>();
}

std::optional<std::string> read_optional_string(const Value& j, const char* key,
                                                const std::string& what) {
    if (!has(j, key)) return std::nullopt;
    return read_string(j, key, what);
}

std::optional<std::int64_t> read_optional_int(const Value& j, const char* key,
                                              const std::string& what) {
    if (!has(j, key)) return std::nullopt;
    const Value& v = j.at(key);
    if (!v.is_number_integer()) {
        throw SchemaError(what + "." + key + " must be an integer, got " + type_name(v));
    }
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
        throw SchemaError(what + "." + key + " is out of range");
    }
    return v.get<std::int64_t>();
}

const Value& read_array(const Value& j, const char* key, const std::string& what) {
    const Value& v = j.at(key);
    if (!v.is_array()) {
        throw SchemaError(what + "." + key + " must be an array, got " + type_name(v));
    }
    return v;
}

template <typename T>
std::vector<T> read_list(const Value& j, const char* key, const std::string& what) {
    std::vector<T> out;
    if (!has(j, key)) return out;
    for (const auto& item : read_array(j, key, what)) {
        out.push_back(item.get<T>());
    }
    return out;
}

template <typename T>
Value write_list(const std::vector<T>& items) {
    Value arr = Value::array();
    for (const auto& item : items) {
        arr.push_back(Value(item));
    }
    return arr;
}

/**
 * @brief Look up an enum value by its wire name
 *
 * @tparam Error Exception thrown for an unknown name
 */
template <typename Error, typename Enum, std::size_t N>
Enum parse_enum(const std::string& name, const Enum (&values)[N], const std::string& what,
                bool ignore_case = false) {
    for (Enum e : values) {
        const std::string wire = to_string(e);
        if (wire == name || (ignore_case && to_lower(wire) == to_lower(name))) {
            return e;
        }
    }
    throw Error(what + " " + name + " is unsupported");
}

constexpr FromFieldPathPolicy kPolicies[] = {
    FromFieldPathPolicy::Optional, FromFieldPathPolicy::Required};

constexpr TransformIOType kIOTypes[] = {
    TransformIOType::String, TransformIOType::Int, TransformIOType::Int64,
    TransformIOType::Float64, TransformIOType::Bool, TransformIOType::Object,
    TransformIOType::Array};

constexpr ConvertFormat kConvertFormats[] = {
    ConvertFormat::None, ConvertFormat::Quantity, ConvertFormat::Json};

constexpr MathTransformType kMathTypes[] = {
    MathTransformType::Multiply, MathTransformType::ClampMin, MathTransformType::ClampMax};

constexpr MatchPatternType kMatchPatternTypes[] = {
    MatchPatternType::Literal, MatchPatternType::Regexp};

constexpr MatchFallbackTo kFallbackTos[] = {MatchFallbackTo::Value, MatchFallbackTo::Input};

constexpr StringTransformType kStringTypes[] = {
    StringTransformType::Format, StringTransformType::Convert,
    StringTransformType::TrimPrefix, StringTransformType::TrimSuffix,
    StringTransformType::Regexp};

constexpr StringConversionType kConversions[] = {
    StringConversionType::ToUpper, StringConversionType::ToLower,
    StringConversionType::ToBase64, StringConversionType::FromBase64,
    StringConversionType::ToJson};

// Unknown patch type names raise InvalidPatchType rather than SchemaError.
PatchType parse_patch_type(const std::string& name) {
    for (PatchType t : {PatchType::FromCompositeFieldPath, PatchType::ToCompositeFieldPath,
                        PatchType::CombineFromComposite, PatchType::CombineToComposite,
                        PatchType::PatchSet}) {
        if (to_string(t) == name) return t;
    }
    throw InvalidPatchType(name);
}

// ============================================================================
// Transforms
// ============================================================================

ConvertTransform convert_from_json(const Value& j) {
    expect_object(j, "convert");
    ConvertTransform t;
    t.to_type = parse_enum<TransformError>(read_string(j, "toType", "convert"), kIOTypes,
                                           "convert toType");
    if (auto f = read_optional_string(j, "format", "convert")) {
        t.format = parse_enum<TransformError>(*f, kConvertFormats, "convert format");
    }
    return t;
}

Value convert_to_json(const ConvertTransform& t) {
    Value j = {{"toType", to_string(t.to_type)}};
    if (t.format) j["format"] = to_string(*t.format);
    return j;
}

MathTransform math_from_json(const Value& j) {
    expect_object(j, "math");
    MathTransform t;
    if (auto type = read_optional_string(j, "type", "math")) {
        t.type = parse_enum<TransformError>(*type, kMathTypes, "math transform type");
    }
    t.multiply = read_optional_int(j, "multiply", "math");
    t.clamp_min = read_optional_int(j, "clampMin", "math");
    t.clamp_max = read_optional_int(j, "clampMax", "math");
    return t;
}

Value math_to_json(const MathTransform& t) {
    Value j = {{"type", to_string(t.type)}};
    if (t.multiply) j["multiply"] = *t.multiply;
    if (t.clamp_min) j["clampMin"] = *t.clamp_min;
    if (t.clamp_max) j["clampMax"] = *t.clamp_max;
    return j;
}

MapTransform map_from_json(const Value& j) {
    expect_object(j, "map");
    MapTransform t;

    // {pairs: {...}, fallbackValue?} or a bare key -> value object
    auto pairs = j.find("pairs");
    if (pairs != j.end() && pairs->is_object()) {
        for (auto it = pairs->begin(); it != pairs->end(); ++it) {
            t.pairs.emplace(it.key(), it.value());
        }
        auto fallback = j.find("fallbackValue");
        if (fallback != j.end()) {
            t.fallback_value = *fallback;
        }
        return t;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        t.pairs.emplace(it.key(), it.value());
    }
    return t;
}

Value map_to_json(const MapTransform& t) {
    Value pairs = Value::object();
    for (const auto& [key, value] : t.pairs) {
        pairs[key] = value;
    }
    Value j = {{"pairs", pairs}};
    if (t.fallback_value) j["fallbackValue"] = *t.fallback_value;
    return j;
}

MatchTransform match_from_json(const Value& j) {
    expect_object(j, "match");
    MatchTransform t;
    if (has(j, "patterns")) {
        for (const auto& p : read_array(j, "patterns", "match")) {
            expect_object(p, "match pattern");
            MatchPattern pattern;
            pattern.type = parse_enum<TransformError>(read_string(p, "type", "match pattern"),
                                                      kMatchPatternTypes, "match pattern type");
            pattern.literal = read_optional_string(p, "literal", "match pattern");
            pattern.regexp = read_optional_string(p, "regexp", "match pattern");
            auto result = p.find("result");
            if (result != p.end()) pattern.result = *result;
            t.patterns.push_back(std::move(pattern));
        }
    }
    auto fallback = j.find("fallbackValue");
    if (fallback != j.end()) {
        t.fallback_value = *fallback;
    }
    if (auto to = read_optional_string(j, "fallbackTo", "match")) {
        t.fallback_to = parse_enum<TransformError>(*to, kFallbackTos, "match fallbackTo");
    }
    return t;
}

Value match_to_json(const MatchTransform& t) {
    Value patterns = Value::array();
    for (const auto& p : t.patterns) {
        Value pj = {{"type", to_string(p.type)}, {"result", p.result}};
        if (p.literal) pj["literal"] = *p.literal;
        if (p.regexp) pj["regexp"] = *p.regexp;
        patterns.push_back(std::move(pj));
    }
    Value j = {{"patterns", patterns}, {"fallbackTo", to_string(t.fallback_to)}};
    if (t.fallback_value) j["fallbackValue"] = *t.fallback_value;
    return j;
}

StringTransform string_from_json(const Value& j) {
    expect_object(j, "string");
    StringTransform t;
    if (auto type = read_optional_string(j, "type", "string")) {
        t.type = parse_enum<TransformError>(*type, kStringTypes, "string transform type");
    }
    t.format = read_optional_string(j, "fmt", "string");
    if (auto convert = read_optional_string(j, "convert", "string")) {
        t.convert = parse_enum<TransformError>(*convert, kConversions, "string conversion type");
    }
    t.trim = read_optional_string(j, "trim", "string");
    if (has(j, "regexp")) {
        const Value& r = j.at("regexp");
        expect_object(r, "string.regexp");
        StringTransformRegexp regexp;
        regexp.match = read_string(r, "match", "string.regexp");
        if (auto group = read_optional_int(r, "group", "string.regexp")) {
            regexp.group = static_cast<int>(*group);
        }
        t.regexp = std::move(regexp);
    }
    return t;
}

Value string_to_json(const StringTransform& t) {
    Value j = {{"type", to_string(t.type)}};
    if (t.format) j["fmt"] = *t.format;
    if (t.convert) j["convert"] = to_string(*t.convert);
    if (t.trim) j["trim"] = *t.trim;
    if (t.regexp) {
        Value r = {{"match", t.regexp->match}};
        if (t.regexp->group) r["group"] = *t.regexp->group;
        j["regexp"] = r;
    }
    return j;
}

const Value& transform_payload(const Value& j, const char* kind) {
    if (!has(j, kind)) {
        throw TransformError(std::string("given transform type ") + kind +
                             " requires configuration");
    }
    return j.at(kind);
}

} // anonymous namespace

Transform transform_from_json(const Value& j) {
    expect_object(j, "transform");
    const std::string type = to_lower(read_string(j, "type", "transform"));

    if (type == "convert") return convert_from_json(transform_payload(j, "convert"));
    if (type == "math") return math_from_json(transform_payload(j, "math"));
    if (type == "map") return map_from_json(transform_payload(j, "map"));
    if (type == "match") return match_from_json(transform_payload(j, "match"));
    if (type == "string") return string_from_json(transform_payload(j, "string"));

    throw TransformError("transform type " + j.at("type").get<std::string>() + " is unsupported");
}

Value transform_to_json(const Transform& t) {
    struct Encoder {
        Value operator()(const ConvertTransform& c) const { return convert_to_json(c); }
        Value operator()(const MathTransform& m) const { return math_to_json(m); }
        Value operator()(const MapTransform& m) const { return map_to_json(m); }
        Value operator()(const MatchTransform& m) const { return match_to_json(m); }
        Value operator()(const StringTransform& s) const { return string_to_json(s); }
    };
    const std::string kind = transform_type_name(t);
    return Value{{"type", kind}, {kind, std::visit(Encoder{}, t)}};
}

// ============================================================================
// Patches
// ============================================================================

void from_json(const Value& j, PatchPolicy& p) {
    expect_object(j, "policy");
    p = PatchPolicy{};
    if (auto from = read_optional_string(j, "fromFieldPath", "policy")) {
        p.from_field_path = parse_enum<SchemaError>(*from, kPolicies, "policy fromFieldPath");
    }
}

void to_json(Value& j, const PatchPolicy& p) {
    j = Value::object();
    if (p.from_field_path) j["fromFieldPath"] = to_string(*p.from_field_path);
}

void from_json(const Value& j, Combine& c) {
    expect_object(j, "combine");
    c = Combine{};
    if (has(j, "variables")) {
        for (const auto& v : read_array(j, "variables", "combine")) {
            expect_object(v, "combine variable");
            c.variables.push_back(
                CombineVariable{read_string(v, "fromFieldPath", "combine variable")});
        }
    }

    const std::string strategy = read_string(j, "strategy", "combine");
    if (strategy != to_string(CombineStrategy::String)) {
        throw CombineConfigMissing(strategy);
    }
    c.strategy = CombineStrategy::String;

    if (has(j, "string")) {
        const Value& s = j.at("string");
        expect_object(s, "combine.string");
        // "fmt" is the canonical key; "format" is accepted as an alias
        auto format = read_optional_string(s, "fmt", "combine.string");
        if (!format) format = read_optional_string(s, "format", "combine.string");
        if (!format) {
            throw SchemaError("combine.string.fmt is required");
        }
        c.string = StringCombine{*format};
    }
}

void to_json(Value& j, const Combine& c) {
    Value variables = Value::array();
    for (const auto& v : c.variables) {
        variables.push_back(Value{{"fromFieldPath", v.from_field_path}});
    }
    j = {{"variables", variables}, {"strategy", to_string(c.strategy)}};
    if (c.string) j["string"] = {{"fmt", c.string->format}};
}

void from_json(const Value& j, Patch& p) {
    expect_object(j, "patch");
    p = Patch{};
    if (auto type = read_optional_string(j, "type", "patch")) {
        p.type = parse_patch_type(*type);
    }
    p.from_field_path = read_optional_string(j, "fromFieldPath", "patch");
    p.to_field_path = read_optional_string(j, "toFieldPath", "patch");
    p.patch_set_name = read_optional_string(j, "patchSetName", "patch");
    if (has(j, "combine")) p.combine = j.at("combine").get<Combine>();
    if (has(j, "policy")) p.policy = j.at("policy").get<PatchPolicy>();
    if (has(j, "transforms")) {
        for (const auto& t : read_array(j, "transforms", "patch")) {
            p.transforms.push_back(transform_from_json(t));
        }
    }
}

void to_json(Value& j, const Patch& p) {
    j = {{"type", to_string(p.type)}};
    if (p.from_field_path) j["fromFieldPath"] = *p.from_field_path;
    if (p.to_field_path) j["toFieldPath"] = *p.to_field_path;
    if (p.patch_set_name) j["patchSetName"] = *p.patch_set_name;
    if (p.combine) j["combine"] = *p.combine;
    if (p.policy) j["policy"] = *p.policy;
    if (!p.transforms.empty()) {
        Value transforms = Value::array();
        for (const auto& t : p.transforms) {
            transforms.push_back(transform_to_json(t));
        }
        j["transforms"] = transforms;
    }
}

void from_json(const Value& j, PatchSet& s) {
    expect_object(j, "patchSet");
    s.name = read_string(j, "name", "patchSet");
    s.patches = read_list<Patch>(j, "patches", "patchSet");
}

void to_json(Value& j, const PatchSet& s) {
    j = {{"name", s.name}, {"patches", write_list(s.patches)}};
}

void from_json(const Value& j, ComposedTemplate& t) {
    expect_object(j, "resource");
    t.name = read_optional_string(j, "name", "resource");
    t.base = has(j, "base") ? j.at("base") : Value();
    t.patches = read_list<Patch>(j, "patches", "resource");
}

void to_json(Value& j, const ComposedTemplate& t) {
    j = Value::object();
    if (t.name) j["name"] = *t.name;
    if (!t.base.is_null()) j["base"] = t.base;
    j["patches"] = write_list(t.patches);
}

void from_json(const Value& j, Composition& c) {
    expect_object(j, "composition");
    c.patch_sets = read_list<PatchSet>(j, "patchSets", "composition");
    c.resources = read_list<ComposedTemplate>(j, "resources", "composition");
}

void to_json(Value& j, const Composition& c) {
    j = {{"patchSets", write_list(c.patch_sets)}, {"resources", write_list(c.resources)}};
}

} // namespace patchwork
