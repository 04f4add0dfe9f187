/**
 * @file Types.cpp
 * @brief Names and equality for rule types
 */

#include "patchwork/Types.hpp"

namespace patchwork {

std::string to_string(PatchType type) {
    switch (type) {
        case PatchType::FromCompositeFieldPath: return "FromCompositeFieldPath";
        case PatchType::ToCompositeFieldPath: return "ToCompositeFieldPath";
        case PatchType::CombineFromComposite: return "CombineFromComposite";
        case PatchType::CombineToComposite: return "CombineToComposite";
        case PatchType::PatchSet: return "PatchSet";
    }
    return "PatchType(" + std::to_string(static_cast<int>(type)) + ")";
}

std::string to_string(FromFieldPathPolicy policy) {
    switch (policy) {
        case FromFieldPathPolicy::Optional: return "Optional";
        case FromFieldPathPolicy::Required: return "Required";
    }
    return "unknown";
}

std::string to_string(CombineStrategy strategy) {
    switch (strategy) {
        case CombineStrategy::String: return "string";
    }
    return "unknown";
}

std::string to_string(TransformIOType type) {
    switch (type) {
        case TransformIOType::String: return "string";
        case TransformIOType::Int: return "int";
        case TransformIOType::Int64: return "int64";
        case TransformIOType::Float64: return "float64";
        case TransformIOType::Bool: return "bool";
        case TransformIOType::Object: return "object";
        case TransformIOType::Array: return "array";
    }
    return "unknown";
}

std::string to_string(ConvertFormat format) {
    switch (format) {
        case ConvertFormat::None: return "none";
        case ConvertFormat::Quantity: return "quantity";
        case ConvertFormat::Json: return "json";
    }
    return "unknown";
}

std::string to_string(MathTransformType type) {
    switch (type) {
        case MathTransformType::Multiply: return "Multiply";
        case MathTransformType::ClampMin: return "ClampMin";
        case MathTransformType::ClampMax: return "ClampMax";
    }
    return "unknown";
}

std::string to_string(MatchPatternType type) {
    switch (type) {
        case MatchPatternType::Literal: return "literal";
        case MatchPatternType::Regexp: return "regexp";
    }
    return "unknown";
}

std::string to_string(MatchFallbackTo fallback) {
    switch (fallback) {
        case MatchFallbackTo::Value: return "Value";
        case MatchFallbackTo::Input: return "Input";
    }
    return "unknown";
}

std::string to_string(StringTransformType type) {
    switch (type) {
        case StringTransformType::Format: return "Format";
        case StringTransformType::Convert: return "Convert";
        case StringTransformType::TrimPrefix: return "TrimPrefix";
        case StringTransformType::TrimSuffix: return "TrimSuffix";
        case StringTransformType::Regexp: return "Regexp";
    }
    return "unknown";
}

std::string to_string(StringConversionType type) {
    switch (type) {
        case StringConversionType::ToUpper: return "ToUpper";
        case StringConversionType::ToLower: return "ToLower";
        case StringConversionType::ToBase64: return "ToBase64";
        case StringConversionType::FromBase64: return "FromBase64";
        case StringConversionType::ToJson: return "ToJson";
    }
    return "unknown";
}

std::string transform_type_name(const Transform& transform) {
    struct Namer {
        std::string operator()(const ConvertTransform&) const { return "convert"; }
        std::string operator()(const MathTransform&) const { return "math"; }
        std::string operator()(const MapTransform&) const { return "map"; }
        std::string operator()(const MatchTransform&) const { return "match"; }
        std::string operator()(const StringTransform&) const { return "string"; }
    };
    return std::visit(Namer{}, transform);
}

namespace {
    bool same_optional_value(const std::optional<Value>& a, const std::optional<Value>& b) {
        if (a.has_value() != b.has_value()) return false;
        return !a.has_value() || *a == *b;
    }
}

bool operator==(const PatchPolicy& a, const PatchPolicy& b) {
    return a.from_field_path == b.from_field_path;
}

bool operator==(const CombineVariable& a, const CombineVariable& b) {
    return a.from_field_path == b.from_field_path;
}

bool operator==(const StringCombine& a, const StringCombine& b) {
    return a.format == b.format;
}

bool operator==(const Combine& a, const Combine& b) {
    return a.variables == b.variables && a.strategy == b.strategy && a.string == b.string;
}

bool operator==(const ConvertTransform& a, const ConvertTransform& b) {
    return a.to_type == b.to_type && a.format == b.format;
}

bool operator==(const MathTransform& a, const MathTransform& b) {
    return a.type == b.type && a.multiply == b.multiply &&
           a.clamp_min == b.clamp_min && a.clamp_max == b.clamp_max;
}

bool operator==(const MapTransform& a, const MapTransform& b) {
    return a.pairs == b.pairs && same_optional_value(a.fallback_value, b.fallback_value);
}

bool operator==(const MatchPattern& a, const MatchPattern& b) {
    return a.type == b.type && a.literal == b.literal &&
           a.regexp == b.regexp && a.result == b.result;
}

bool operator==(const MatchTransform& a, const MatchTransform& b) {
    return a.patterns == b.patterns &&
           same_optional_value(a.fallback_value, b.fallback_value) &&
           a.fallback_to == b.fallback_to;
}

bool operator==(const StringTransformRegexp& a, const StringTransformRegexp& b) {
    return a.match == b.match && a.group == b.group;
}

bool operator==(const StringTransform& a, const StringTransform& b) {
    return a.type == b.type && a.format == b.format && a.convert == b.convert &&
           a.trim == b.trim && a.regexp == b.regexp;
}

bool operator==(const Patch& a, const Patch& b) {
    return a.type == b.type &&
           a.from_field_path == b.from_field_path &&
           a.to_field_path == b.to_field_path &&
           a.combine == b.combine &&
           a.patch_set_name == b.patch_set_name &&
           a.policy == b.policy &&
           a.transforms == b.transforms;
}

bool operator==(const PatchSet& a, const PatchSet& b) {
    return a.name == b.name && a.patches == b.patches;
}

bool operator==(const ComposedTemplate& a, const ComposedTemplate& b) {
    return a.name == b.name && a.base == b.base && a.patches == b.patches;
}

} // namespace patchwork
