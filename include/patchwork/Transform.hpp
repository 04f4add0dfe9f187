/**
 * @file Transform.hpp
 * @brief Transform pipeline: convert, math, map, match and string steps
 *
 * Behavioral rules:
 * - resolve_transforms() folds the steps left to right, each step consuming
 *   the previous step's output; an empty list returns the input unchanged
 * - The first failing step aborts the pipeline and its error propagates
 *   unchanged; no partial value is produced
 * - Numeric kind is carried forward: an integer stays an integer through
 *   Math, a float stays a float, unless a Convert step changed it
 */

#ifndef PATCHWORK_TRANSFORM_HPP
#define PATCHWORK_TRANSFORM_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace patchwork {

/**
 * @brief Run an ordered list of transforms over a value
 *
 * @param transforms Steps to apply, in order
 * @param input Value entering the first step
 * @return Output of the last step (the input itself if there are no steps)
 * @throws TransformError (or FormatError) from the first failing step
 *
 * ```cpp
 * std::vector<Transform> ts = {
 *     ConvertTransform{TransformIOType::Float64, std::nullopt},
 *     MathTransform{MathTransformType::Multiply, 2, std::nullopt, std::nullopt},
 * };
 * resolve_transforms(ts, 2);   // 4.0 (float)
 * ```
 */
Value resolve_transforms(const std::vector<Transform>& transforms, const Value& input);

/**
 * @brief Apply a single transform step
 */
Value resolve_transform(const Transform& transform, const Value& input);

Value resolve_convert(const ConvertTransform& t, const Value& input);
Value resolve_math(const MathTransform& t, const Value& input);
Value resolve_map(const MapTransform& t, const Value& input);
Value resolve_match(const MatchTransform& t, const Value& input);
Value resolve_string(const StringTransform& t, const Value& input);

/**
 * @brief Convert a value to another scalar (or, with format json, container) type
 *
 * | from \ to | string       | int64              | float64 | bool          |
 * |-----------|--------------|--------------------|---------|---------------|
 * | string    | identity     | base-10 integer    | number  | true/false/1/0/t/f |
 * | int64     | decimal      | identity           | exact   | 0/1 only      |
 * | float64   | shortest     | integral, in range | identity| 0.0/1.0 only  |
 * | bool      | true/false   | 1/0                | 1.0/0.0 | identity      |
 *
 * @throws TransformError if the value cannot be represented exactly as the
 *         target type, or the pair is not convertible
 */
Value convert_value(const Value& input, TransformIOType to_type,
                    std::optional<ConvertFormat> format = std::nullopt);

/**
 * @brief Parse a Kubernetes-style resource quantity ("250m", "1Ki", "2G", "1.5e3")
 *
 * @param text Quantity text
 * @param to_type Int64 (rounded up to a whole number) or Float64
 * @throws TransformError if the text is not a valid quantity
 */
Value parse_quantity(const std::string& text, TransformIOType to_type);

} // namespace patchwork

#endif // PATCHWORK_TRANSFORM_HPP
