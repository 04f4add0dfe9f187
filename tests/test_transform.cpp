/**
 * @file test_transform.cpp
 * @brief Unit tests for the transform pipeline (GoogleTest)
 *
 * Tests cover:
 * - Pipeline folding and error propagation
 * - Convert (plain, quantity and json formats)
 * - Math, Map, Match and String transforms
 */

#include <gtest/gtest.h>
#include "patchwork/Transform.hpp"
#include "patchwork/Errors.hpp"

#include <cstdint>

using namespace patchwork;

namespace {

Transform to_type(TransformIOType t, std::optional<ConvertFormat> format = std::nullopt) {
    return ConvertTransform{t, format};
}

Transform multiply(std::int64_t m) {
    MathTransform t;
    t.type = MathTransformType::Multiply;
    t.multiply = m;
    return t;
}

StringTransform string_transform(StringTransformType type) {
    StringTransform t;
    t.type = type;
    return t;
}

} // anonymous namespace

// ============================================================================
// Pipeline
// ============================================================================

TEST(ResolveTransforms, EmptyPipelineIsIdentity) {
    const Value input = {{"a", 1}};
    EXPECT_EQ(resolve_transforms({}, input), input);
}

TEST(ResolveTransforms, ConvertToFloatThenMultiply) {
    const Value out = resolve_transforms({to_type(TransformIOType::Float64), multiply(2)}, 2);
    EXPECT_TRUE(out.is_number_float());
    EXPECT_DOUBLE_EQ(out.get<double>(), 4.0);
}

TEST(ResolveTransforms, ConvertToIntThenMultiply) {
    const Value out = resolve_transforms({to_type(TransformIOType::Int64), multiply(2)}, 2);
    EXPECT_TRUE(out.is_number_integer());
    EXPECT_EQ(out, 4);
}

TEST(ResolveTransforms, StepsSeePreviousOutput) {
    MapTransform map;
    map.pairs = {{"4", "four"}};
    const Value out = resolve_transforms({multiply(2), map}, 2);
    EXPECT_EQ(out, "four");
}

TEST(ResolveTransforms, FirstFailureAborts) {
    MathTransform missing_operand;
    missing_operand.type = MathTransformType::Multiply;
    EXPECT_THROW(resolve_transforms({multiply(2), missing_operand, multiply(3)}, 1),
                 TransformError);
}

// ============================================================================
// Convert
// ============================================================================

TEST(ConvertValue, SameTypeIsIdentity) {
    EXPECT_EQ(convert_value("x", TransformIOType::String), "x");
    EXPECT_EQ(convert_value(5, TransformIOType::Int), 5);
    EXPECT_EQ(convert_value(true, TransformIOType::Bool), true);
}

TEST(ConvertValue, FromString) {
    EXPECT_EQ(convert_value("42", TransformIOType::Int64), 42);
    EXPECT_EQ(convert_value("-7", TransformIOType::Int), -7);
    EXPECT_DOUBLE_EQ(convert_value("2.5", TransformIOType::Float64).get<double>(), 2.5);
    EXPECT_EQ(convert_value("TRUE", TransformIOType::Bool), true);
    EXPECT_EQ(convert_value("f", TransformIOType::Bool), false);
    EXPECT_EQ(convert_value("0", TransformIOType::Bool), false);
}

TEST(ConvertValue, FromStringRejectsPartialInput) {
    EXPECT_THROW(convert_value("42abc", TransformIOType::Int64), TransformError);
    EXPECT_THROW(convert_value(" 42", TransformIOType::Int64), TransformError);
    EXPECT_THROW(convert_value("", TransformIOType::Int64), TransformError);
    EXPECT_THROW(convert_value("1.5x", TransformIOType::Float64), TransformError);
    EXPECT_THROW(convert_value("yes", TransformIOType::Bool), TransformError);
    EXPECT_THROW(convert_value("99999999999999999999", TransformIOType::Int64), TransformError);
}

TEST(ConvertValue, FromInt) {
    EXPECT_EQ(convert_value(42, TransformIOType::String), "42");
    EXPECT_TRUE(convert_value(3, TransformIOType::Float64).is_number_float());
    EXPECT_EQ(convert_value(1, TransformIOType::Bool), true);
    EXPECT_EQ(convert_value(0, TransformIOType::Bool), false);
    EXPECT_THROW(convert_value(2, TransformIOType::Bool), TransformError);
}

TEST(ConvertValue, IntToFloatMustBeExact) {
    const std::int64_t big = (std::int64_t{1} << 53) + 1;
    EXPECT_THROW(convert_value(big, TransformIOType::Float64), TransformError);
    EXPECT_NO_THROW(convert_value(std::int64_t{1} << 53, TransformIOType::Float64));
}

TEST(ConvertValue, FromFloat) {
    EXPECT_EQ(convert_value(2.5, TransformIOType::String), "2.5");
    EXPECT_EQ(convert_value(4.0, TransformIOType::String), "4");
    EXPECT_EQ(convert_value(4.0, TransformIOType::Int64), 4);
    EXPECT_THROW(convert_value(4.5, TransformIOType::Int64), TransformError);
    EXPECT_THROW(convert_value(1e300, TransformIOType::Int64), TransformError);
    EXPECT_EQ(convert_value(1.0, TransformIOType::Bool), true);
    EXPECT_THROW(convert_value(0.5, TransformIOType::Bool), TransformError);
}

TEST(ConvertValue, FloatToStringUsesPlainDecimal) {
    EXPECT_EQ(convert_value(1e20, TransformIOType::String), "100000000000000000000");
    EXPECT_EQ(convert_value(-2.5e16, TransformIOType::String), "-25000000000000000");
    EXPECT_EQ(convert_value(1.5e-7, TransformIOType::String), "0.00000015");
}

TEST(ConvertValue, FromBool) {
    EXPECT_EQ(convert_value(true, TransformIOType::String), "true");
    EXPECT_EQ(convert_value(false, TransformIOType::Int64), 0);
    EXPECT_DOUBLE_EQ(convert_value(true, TransformIOType::Float64).get<double>(), 1.0);
}

TEST(ConvertValue, NullAndContainersAreNotConvertible) {
    EXPECT_THROW(convert_value(nullptr, TransformIOType::String), TransformError);
    EXPECT_THROW(convert_value(Value::array({1}), TransformIOType::String), TransformError);
    EXPECT_THROW(convert_value("{}", TransformIOType::Object), TransformError);
}

TEST(ConvertValue, JsonFormatParsesContainers) {
    EXPECT_EQ(convert_value("{\"a\":1}", TransformIOType::Object, ConvertFormat::Json),
              Value({{"a", 1}}));
    EXPECT_EQ(convert_value("[1,2]", TransformIOType::Array, ConvertFormat::Json),
              Value::array({1, 2}));
}

TEST(ConvertValue, JsonFormatChecksShape) {
    EXPECT_THROW(convert_value("[1,2]", TransformIOType::Object, ConvertFormat::Json),
                 TransformError);
    EXPECT_THROW(convert_value("{nope", TransformIOType::Object, ConvertFormat::Json),
                 TransformError);
    EXPECT_THROW(convert_value(1, TransformIOType::Object, ConvertFormat::Json),
                 TransformError);
    EXPECT_THROW(convert_value("1", TransformIOType::Int64, ConvertFormat::Json),
                 TransformError);
}

TEST(ConvertValue, QuantityFormat) {
    EXPECT_EQ(convert_value("1Ki", TransformIOType::Int64, ConvertFormat::Quantity), 1024);
    EXPECT_EQ(convert_value("2G", TransformIOType::Int64, ConvertFormat::Quantity), 2000000000);
    EXPECT_EQ(convert_value("250m", TransformIOType::Int64, ConvertFormat::Quantity), 1);
    EXPECT_DOUBLE_EQ(convert_value("250m", TransformIOType::Float64, ConvertFormat::Quantity)
                         .get<double>(), 0.25);
    EXPECT_DOUBLE_EQ(convert_value("1.5e3", TransformIOType::Float64, ConvertFormat::Quantity)
                         .get<double>(), 1500.0);
}

TEST(ConvertValue, InvalidQuantities) {
    EXPECT_THROW(parse_quantity("", TransformIOType::Int64), TransformError);
    EXPECT_THROW(parse_quantity("Ki", TransformIOType::Int64), TransformError);
    EXPECT_THROW(parse_quantity("1Xi", TransformIOType::Int64), TransformError);
    EXPECT_THROW(parse_quantity("1", TransformIOType::String), TransformError);
    EXPECT_THROW(convert_value(5, TransformIOType::Int64, ConvertFormat::Quantity),
                 TransformError);
}

// ============================================================================
// Math
// ============================================================================

TEST(ResolveMath, MultiplyKeepsNumericKind) {
    MathTransform t;
    t.multiply = 3;
    const Value i = resolve_math(t, 5);
    EXPECT_TRUE(i.is_number_integer());
    EXPECT_EQ(i, 15);

    const Value f = resolve_math(t, 1.5);
    EXPECT_TRUE(f.is_number_float());
    EXPECT_DOUBLE_EQ(f.get<double>(), 4.5);
}

TEST(ResolveMath, Clamps) {
    MathTransform min;
    min.type = MathTransformType::ClampMin;
    min.clamp_min = 10;
    EXPECT_EQ(resolve_math(min, 3), 10);
    EXPECT_EQ(resolve_math(min, 30), 30);
    EXPECT_DOUBLE_EQ(resolve_math(min, 2.5).get<double>(), 10.0);

    MathTransform max;
    max.type = MathTransformType::ClampMax;
    max.clamp_max = 10;
    EXPECT_EQ(resolve_math(max, 30), 10);
    EXPECT_EQ(resolve_math(max, -4), -4);
}

TEST(ResolveMath, Errors) {
    MathTransform t;
    t.multiply = 2;
    EXPECT_THROW(resolve_math(t, "2"), TransformError);
    EXPECT_THROW(resolve_math(t, true), TransformError);

    MathTransform overflow;
    overflow.multiply = INT64_MAX;
    EXPECT_THROW(resolve_math(overflow, 2), TransformError);

    MathTransform no_clamp;
    no_clamp.type = MathTransformType::ClampMin;
    EXPECT_THROW(resolve_math(no_clamp, 1), TransformError);
}

// ============================================================================
// Map
// ============================================================================

TEST(ResolveMap, LooksUpByStringRendering) {
    MapTransform t;
    t.pairs = {{"us-east", "virginia"}, {"3", Value({{"replicas", 3}})}, {"true", "yes"}};
    EXPECT_EQ(resolve_map(t, "us-east"), "virginia");
    EXPECT_EQ(resolve_map(t, 3), Value({{"replicas", 3}}));
    EXPECT_EQ(resolve_map(t, true), "yes");
}

TEST(ResolveMap, MissingKey) {
    MapTransform t;
    t.pairs = {{"a", 1}};
    EXPECT_THROW(resolve_map(t, "b"), TransformError);
    t.fallback_value = Value("default");
    EXPECT_EQ(resolve_map(t, "b"), "default");
}

TEST(ResolveMap, ContainerInputIsRejected) {
    MapTransform t;
    EXPECT_THROW(resolve_map(t, Value::object()), TransformError);
}

// ============================================================================
// Match
// ============================================================================

class ResolveMatchTest : public ::testing::Test {
protected:
    MatchTransform t;

    void SetUp() override {
        MatchPattern literal;
        literal.type = MatchPatternType::Literal;
        literal.literal = "small";
        literal.result = 1;

        MatchPattern regexp;
        regexp.type = MatchPatternType::Regexp;
        regexp.regexp = "^large-[0-9]+$";
        regexp.result = 8;

        t.patterns = {literal, regexp};
    }
};

TEST_F(ResolveMatchTest, FirstMatchWins) {
    EXPECT_EQ(resolve_match(t, "small"), 1);
    EXPECT_EQ(resolve_match(t, "large-2"), 8);
}

TEST_F(ResolveMatchTest, FallbackValue) {
    EXPECT_TRUE(resolve_match(t, "medium").is_null());
    t.fallback_value = Value(4);
    EXPECT_EQ(resolve_match(t, "medium"), 4);
}

TEST_F(ResolveMatchTest, FallbackToInput) {
    t.fallback_to = MatchFallbackTo::Input;
    EXPECT_EQ(resolve_match(t, "medium"), "medium");
}

TEST_F(ResolveMatchTest, InvalidPatterns) {
    t.patterns[1].regexp = "([unclosed";
    EXPECT_THROW(resolve_match(t, "other"), TransformError);

    t.patterns[0].literal.reset();
    EXPECT_THROW(resolve_match(t, "small"), TransformError);
}

// ============================================================================
// String
// ============================================================================

TEST(ResolveString, Format) {
    StringTransform t = string_transform(StringTransformType::Format);
    t.format = "prefix-%s";
    EXPECT_EQ(resolve_string(t, "x"), "prefix-x");
    t.format = "%d replicas";
    EXPECT_EQ(resolve_string(t, 3), "3 replicas");
    t.format = "%s-%s";
    EXPECT_THROW(resolve_string(t, "x"), FormatError);
}

TEST(ResolveString, Convert) {
    StringTransform t = string_transform(StringTransformType::Convert);
    t.convert = StringConversionType::ToUpper;
    EXPECT_EQ(resolve_string(t, "abc"), "ABC");
    t.convert = StringConversionType::ToLower;
    EXPECT_EQ(resolve_string(t, "AbC"), "abc");
    t.convert = StringConversionType::ToBase64;
    EXPECT_EQ(resolve_string(t, "hello"), "aGVsbG8=");
    t.convert = StringConversionType::FromBase64;
    EXPECT_EQ(resolve_string(t, "aGVsbG8="), "hello");
    EXPECT_THROW(resolve_string(t, "not base64!"), TransformError);
    t.convert = StringConversionType::ToJson;
    EXPECT_EQ(resolve_string(t, Value({{"a", 1}})), "{\"a\":1}");
    EXPECT_EQ(resolve_string(t, "x"), "\"x\"");
}

TEST(ResolveString, Trim) {
    StringTransform t = string_transform(StringTransformType::TrimPrefix);
    t.trim = "arn:";
    EXPECT_EQ(resolve_string(t, "arn:aws"), "aws");
    EXPECT_EQ(resolve_string(t, "aws"), "aws");

    t.type = StringTransformType::TrimSuffix;
    t.trim = "-suffix";
    EXPECT_EQ(resolve_string(t, "name-suffix"), "name");
}

TEST(ResolveString, Regexp) {
    StringTransform t = string_transform(StringTransformType::Regexp);
    t.regexp = StringTransformRegexp{"([a-z]+)-([0-9]+)", std::nullopt};
    EXPECT_EQ(resolve_string(t, "id: web-42"), "web-42");

    t.regexp->group = 2;
    EXPECT_EQ(resolve_string(t, "id: web-42"), "42");

    t.regexp->group = 3;
    EXPECT_THROW(resolve_string(t, "id: web-42"), TransformError);

    t.regexp->group = 1;
    EXPECT_THROW(resolve_string(t, "nothing here"), TransformError);
}

TEST(ResolveString, MissingPayloadThrows) {
    EXPECT_THROW(resolve_string(string_transform(StringTransformType::Format), "x"),
                 TransformError);
    EXPECT_THROW(resolve_string(string_transform(StringTransformType::Convert), "x"),
                 TransformError);
    EXPECT_THROW(resolve_string(string_transform(StringTransformType::TrimPrefix), "x"),
                 TransformError);
    EXPECT_THROW(resolve_string(string_transform(StringTransformType::Regexp), "x"),
                 TransformError);
}
