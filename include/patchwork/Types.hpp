/**
 * @file Types.hpp
 * @brief Rule types: patches, patch sets, combines and transforms
 *
 * These mirror the declarative rule schema. They are plain values built by
 * the caller (or decoded by Schema.hpp), consumed once and discarded.
 */

#ifndef PATCHWORK_TYPES_HPP
#define PATCHWORK_TYPES_HPP

#include "patchwork/Value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace patchwork {

// ============================================================================
// Patches
// ============================================================================

enum class PatchType {
    FromCompositeFieldPath,
    ToCompositeFieldPath,
    CombineFromComposite,
    CombineToComposite,
    PatchSet
};

/**
 * @brief Behavior when a patch's source field does not exist
 */
enum class FromFieldPathPolicy {
    Optional, ///< Skip the patch
    Required  ///< Fail the patch
};

struct PatchPolicy {
    std::optional<FromFieldPathPolicy> from_field_path;
};

enum class CombineStrategy {
    String
};

struct CombineVariable {
    std::string from_field_path;
};

struct StringCombine {
    std::string format;
};

/**
 * @brief Merge several source values into one
 *
 * `string` holds the configuration of the String strategy; it must be set
 * when `strategy` is CombineStrategy::String.
 */
struct Combine {
    std::vector<CombineVariable> variables;
    CombineStrategy strategy = CombineStrategy::String;
    std::optional<StringCombine> string;
};

// ============================================================================
// Transforms
// ============================================================================

enum class TransformIOType {
    String,
    Int,
    Int64,
    Float64,
    Bool,
    Object,
    Array
};

enum class ConvertFormat {
    None,
    Quantity,
    Json
};

struct ConvertTransform {
    TransformIOType to_type = TransformIOType::String;
    std::optional<ConvertFormat> format;
};

enum class MathTransformType {
    Multiply,
    ClampMin,
    ClampMax
};

struct MathTransform {
    MathTransformType type = MathTransformType::Multiply;
    std::optional<std::int64_t> multiply;
    std::optional<std::int64_t> clamp_min;
    std::optional<std::int64_t> clamp_max;
};

struct MapTransform {
    std::map<std::string, Value> pairs;
    std::optional<Value> fallback_value;
};

enum class MatchPatternType {
    Literal,
    Regexp
};

struct MatchPattern {
    MatchPatternType type = MatchPatternType::Literal;
    std::optional<std::string> literal;
    std::optional<std::string> regexp;
    Value result;
};

enum class MatchFallbackTo {
    Value,
    Input
};

struct MatchTransform {
    std::vector<MatchPattern> patterns;
    std::optional<Value> fallback_value;
    MatchFallbackTo fallback_to = MatchFallbackTo::Value;
};

enum class StringTransformType {
    Format,
    Convert,
    TrimPrefix,
    TrimSuffix,
    Regexp
};

enum class StringConversionType {
    ToUpper,
    ToLower,
    ToBase64,
    FromBase64,
    ToJson
};

struct StringTransformRegexp {
    std::string match;
    std::optional<int> group;
};

struct StringTransform {
    StringTransformType type = StringTransformType::Format;
    std::optional<std::string> format;
    std::optional<StringConversionType> convert;
    std::optional<std::string> trim;
    std::optional<StringTransformRegexp> regexp;
};

/**
 * @brief One step of a transform pipeline
 *
 * Closed sum type: a transform carries exactly the parameters of its kind.
 */
using Transform = std::variant<ConvertTransform, MathTransform, MapTransform,
                               MatchTransform, StringTransform>;

// ============================================================================
// Patch, PatchSet, ComposedTemplate, Composition
// ============================================================================

/**
 * @brief A declarative rule that moves a value between two documents
 *
 * Which optional members are required depends on `type`:
 * - FromCompositeFieldPath / ToCompositeFieldPath: from_field_path
 * - CombineFromComposite / CombineToComposite: combine and to_field_path
 * - PatchSet: patch_set_name
 */
struct Patch {
    PatchType type = PatchType::FromCompositeFieldPath;
    std::optional<std::string> from_field_path;
    std::optional<std::string> to_field_path;
    std::optional<Combine> combine;
    std::optional<std::string> patch_set_name;
    std::optional<PatchPolicy> policy;
    std::vector<Transform> transforms;
};

struct PatchSet {
    std::string name;
    std::vector<Patch> patches;
};

/**
 * @brief A composed resource template
 *
 * `base` is the document the composed resource starts from; null means an
 * empty object.
 */
struct ComposedTemplate {
    std::optional<std::string> name;
    Value base;
    std::vector<Patch> patches;
};

struct Composition {
    std::vector<PatchSet> patch_sets;
    std::vector<ComposedTemplate> resources;
};

// ============================================================================
// Names and predicates
// ============================================================================

std::string to_string(PatchType type);
std::string to_string(FromFieldPathPolicy policy);
std::string to_string(CombineStrategy strategy);
std::string to_string(TransformIOType type);
std::string to_string(ConvertFormat format);
std::string to_string(MathTransformType type);
std::string to_string(MatchPatternType type);
std::string to_string(MatchFallbackTo fallback);
std::string to_string(StringTransformType type);
std::string to_string(StringConversionType type);

/**
 * @brief Name of a transform's kind ("convert", "math", "map", "match", "string")
 */
std::string transform_type_name(const Transform& transform);

inline bool is_combine(PatchType type) {
    return type == PatchType::CombineFromComposite || type == PatchType::CombineToComposite;
}

/**
 * @brief True for patch types that read the composite and write the composed resource
 */
inline bool is_from_composite(PatchType type) {
    return type == PatchType::FromCompositeFieldPath || type == PatchType::CombineFromComposite;
}

// ============================================================================
// Equality
// ============================================================================

bool operator==(const PatchPolicy& a, const PatchPolicy& b);
bool operator==(const CombineVariable& a, const CombineVariable& b);
bool operator==(const StringCombine& a, const StringCombine& b);
bool operator==(const Combine& a, const Combine& b);
bool operator==(const ConvertTransform& a, const ConvertTransform& b);
bool operator==(const MathTransform& a, const MathTransform& b);
bool operator==(const MapTransform& a, const MapTransform& b);
bool operator==(const MatchPattern& a, const MatchPattern& b);
bool operator==(const MatchTransform& a, const MatchTransform& b);
bool operator==(const StringTransformRegexp& a, const StringTransformRegexp& b);
bool operator==(const StringTransform& a, const StringTransform& b);
bool operator==(const Patch& a, const Patch& b);
bool operator==(const PatchSet& a, const PatchSet& b);
bool operator==(const ComposedTemplate& a, const ComposedTemplate& b);

inline bool operator!=(const Patch& a, const Patch& b) { return !(a == b); }
inline bool operator!=(const PatchSet& a, const PatchSet& b) { return !(a == b); }
inline bool operator!=(const ComposedTemplate& a, const ComposedTemplate& b) { return !(a == b); }

} // namespace patchwork

#endif // PATCHWORK_TYPES_HPP
