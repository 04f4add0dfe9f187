/**
 * @file test_schema.cpp
 * @brief Unit tests for rule encoding and decoding (GoogleTest)
 */

#include <gtest/gtest.h>
#include "patchwork/Schema.hpp"
#include "patchwork/Errors.hpp"

using namespace patchwork;

// ============================================================================
// Patches
// ============================================================================

TEST(SchemaPatch, DecodesFieldPathPatch) {
    const Value j = {
        {"type", "FromCompositeFieldPath"},
        {"fromFieldPath", "spec.region"},
        {"toFieldPath", "spec.forProvider.region"},
        {"policy", {{"fromFieldPath", "Required"}}}
    };
    const Patch p = j.get<Patch>();
    EXPECT_EQ(p.type, PatchType::FromCompositeFieldPath);
    EXPECT_EQ(p.from_field_path, std::optional<std::string>("spec.region"));
    EXPECT_EQ(p.to_field_path, std::optional<std::string>("spec.forProvider.region"));
    ASSERT_TRUE(p.policy.has_value());
    EXPECT_EQ(p.policy->from_field_path, FromFieldPathPolicy::Required);
    EXPECT_TRUE(p.transforms.empty());
}

TEST(SchemaPatch, TypeDefaultsToFromCompositeFieldPath) {
    const Patch p = Value({{"fromFieldPath", "metadata.name"}}).get<Patch>();
    EXPECT_EQ(p.type, PatchType::FromCompositeFieldPath);
}

TEST(SchemaPatch, DecodesCombinePatch) {
    const Value j = {
        {"type", "CombineFromComposite"},
        {"combine", {
            {"variables", {{{"fromFieldPath", "a"}}, {{"fromFieldPath", "b"}}}},
            {"strategy", "string"},
            {"string", {{"fmt", "%s-%s"}}}
        }},
        {"toFieldPath", "c"}
    };
    const Patch p = j.get<Patch>();
    ASSERT_TRUE(p.combine.has_value());
    ASSERT_EQ(p.combine->variables.size(), 2u);
    EXPECT_EQ(p.combine->variables[1].from_field_path, "b");
    EXPECT_EQ(p.combine->strategy, CombineStrategy::String);
    ASSERT_TRUE(p.combine->string.has_value());
    EXPECT_EQ(p.combine->string->format, "%s-%s");
}

TEST(SchemaPatch, CombineAcceptsFormatAlias) {
    const Value j = {{"variables", {{{"fromFieldPath", "a"}}}},
                     {"strategy", "string"},
                     {"string", {{"format", "%s"}}}};
    EXPECT_EQ(j.get<Combine>().string->format, "%s");
}

TEST(SchemaPatch, CombineWithoutStringBlockDecodes) {
    const Value j = {{"variables", {{{"fromFieldPath", "a"}}}}, {"strategy", "string"}};
    EXPECT_FALSE(j.get<Combine>().string.has_value());
}

TEST(SchemaPatch, UnknownCombineStrategy) {
    const Value j = {{"variables", {{{"fromFieldPath", "a"}}}}, {"strategy", "concat"}};
    EXPECT_THROW(j.get<Combine>(), CombineConfigMissing);
}

TEST(SchemaPatch, UnknownPatchType) {
    const Value j = {{"type", "invalid-patchtype"}};
    try {
        j.get<Patch>();
        FAIL() << "Expected InvalidPatchType";
    } catch (const InvalidPatchType& e) {
        EXPECT_STREQ(e.what(), "patch type invalid-patchtype is unsupported");
    }
}

TEST(SchemaPatch, WrongShapes) {
    EXPECT_THROW(Value("patch").get<Patch>(), SchemaError);
    EXPECT_THROW(Value({{"fromFieldPath", 3}}).get<Patch>(), SchemaError);
    EXPECT_THROW(Value({{"transforms", "none"}}).get<Patch>(), SchemaError);
    EXPECT_THROW(Value({{"policy", {{"fromFieldPath", "Sometimes"}}}}).get<Patch>(), SchemaError);
}

TEST(SchemaPatch, EncodingOmitsUnsetFields) {
    Patch p;
    p.type = PatchType::ToCompositeFieldPath;
    p.from_field_path = "status.id";
    const Value j = p;
    EXPECT_EQ(j, Value({{"type", "ToCompositeFieldPath"}, {"fromFieldPath", "status.id"}}));
}

// ============================================================================
// Transforms
// ============================================================================

TEST(SchemaTransform, TypeIsCaseInsensitive) {
    const Transform t = transform_from_json(
        {{"type", "Convert"}, {"convert", {{"toType", "int64"}}}});
    ASSERT_TRUE(std::holds_alternative<ConvertTransform>(t));
    EXPECT_EQ(std::get<ConvertTransform>(t).to_type, TransformIOType::Int64);
}

TEST(SchemaTransform, MapAcceptsPairsOrBareObject) {
    const Transform wrapped = transform_from_json(
        {{"type", "map"}, {"map", {{"pairs", {{"a", 1}}}, {"fallbackValue", 0}}}});
    const Transform bare = transform_from_json({{"type", "map"}, {"map", {{"a", 1}}}});

    const auto& w = std::get<MapTransform>(wrapped);
    EXPECT_EQ(w.pairs.at("a"), 1);
    ASSERT_TRUE(w.fallback_value.has_value());
    EXPECT_EQ(*w.fallback_value, 0);

    const auto& b = std::get<MapTransform>(bare);
    EXPECT_EQ(b.pairs.at("a"), 1);
    EXPECT_FALSE(b.fallback_value.has_value());
}

TEST(SchemaTransform, MathDefaultsToMultiply) {
    const Transform t = transform_from_json({{"type", "math"}, {"math", {{"multiply", 3}}}});
    const auto& m = std::get<MathTransform>(t);
    EXPECT_EQ(m.type, MathTransformType::Multiply);
    EXPECT_EQ(m.multiply, std::optional<std::int64_t>(3));
}

TEST(SchemaTransform, DecodesMatchAndString) {
    const Transform match = transform_from_json({
        {"type", "match"},
        {"match", {
            {"patterns", {{{"type", "literal"}, {"literal", "a"}, {"result", 1}}}},
            {"fallbackTo", "Input"}
        }}
    });
    const auto& m = std::get<MatchTransform>(match);
    ASSERT_EQ(m.patterns.size(), 1u);
    EXPECT_EQ(m.patterns[0].literal, std::optional<std::string>("a"));
    EXPECT_EQ(m.patterns[0].result, 1);
    EXPECT_EQ(m.fallback_to, MatchFallbackTo::Input);

    const Transform str = transform_from_json({
        {"type", "string"},
        {"string", {{"type", "Regexp"}, {"regexp", {{"match", "([a-z]+)"}, {"group", 1}}}}}
    });
    const auto& s = std::get<StringTransform>(str);
    EXPECT_EQ(s.type, StringTransformType::Regexp);
    ASSERT_TRUE(s.regexp.has_value());
    EXPECT_EQ(s.regexp->group, std::optional<int>(1));
}

TEST(SchemaTransform, Errors) {
    EXPECT_THROW(transform_from_json({{"type", "sha256"}}), TransformError);
    EXPECT_THROW(transform_from_json({{"type", "convert"}}), TransformError);
    EXPECT_THROW(transform_from_json({{"type", "convert"}, {"convert", {{"toType", "uint8"}}}}),
                 TransformError);
    EXPECT_THROW(transform_from_json({{"type", "math"}, {"math", {{"multiply", "two"}}}}),
                 SchemaError);
    EXPECT_THROW(transform_from_json(Value::array()), SchemaError);
}

// ============================================================================
// Round trips
// ============================================================================

TEST(SchemaRoundTrip, CompositionSurvivesEncodeDecode) {
    const Value j = {
        {"patchSets", {{
            {"name", "common"},
            {"patches", {{
                {"type", "FromCompositeFieldPath"},
                {"fromFieldPath", "metadata.labels"},
                {"transforms", {{
                    {"type", "string"},
                    {"string", {{"type", "Convert"}, {"convert", "ToUpper"}}}
                }}}
            }}}
        }}},
        {"resources", {{
            {"name", "bucket"},
            {"base", {{"kind", "Bucket"}}},
            {"patches", {
                {{"type", "PatchSet"}, {"patchSetName", "common"}},
                {
                    {"type", "CombineToComposite"},
                    {"combine", {
                        {"variables", {{{"fromFieldPath", "status.a"}}}},
                        {"strategy", "string"},
                        {"string", {{"fmt", "%s"}}}
                    }},
                    {"toFieldPath", "status.b"},
                    {"policy", {{"fromFieldPath", "Optional"}}}
                }
            }}
        }}}
    };

    const Composition decoded = j.get<Composition>();
    ASSERT_EQ(decoded.patch_sets.size(), 1u);
    ASSERT_EQ(decoded.resources.size(), 1u);
    ASSERT_EQ(decoded.resources[0].patches.size(), 2u);
    EXPECT_EQ(decoded.resources[0].patches[0].type, PatchType::PatchSet);

    const Value encoded = decoded;
    EXPECT_EQ(encoded.get<Composition>().resources, decoded.resources);
    EXPECT_EQ(encoded.get<Composition>().patch_sets, decoded.patch_sets);
}
