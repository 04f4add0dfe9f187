/**
 * @file Schema.hpp
 * @brief JSON encoding and decoding of patch rules
 *
 * Rules use camelCase wire names:
 *
 * ```json
 * {
 *   "type": "CombineFromComposite",
 *   "combine": {
 *     "variables": [{"fromFieldPath": "metadata.name"},
 *                   {"fromFieldPath": "spec.region"}],
 *     "strategy": "string",
 *     "string": {"fmt": "%s-%s"}
 *   },
 *   "toFieldPath": "metadata.annotations.id",
 *   "policy": {"fromFieldPath": "Required"},
 *   "transforms": [{"type": "string", "string": {"type": "Convert", "convert": "ToUpper"}}]
 * }
 * ```
 *
 * The functions below are found by nlohmann::json through ADL, so
 * `value.get<Patch>()` and `Value v = patch;` both work. Unset optional
 * fields are omitted when encoding.
 *
 * Decoding errors:
 * - unknown patch type: InvalidPatchType
 * - unknown transform type, value or missing transform payload: TransformError
 * - unknown combine strategy: CombineConfigMissing
 * - anything else of the wrong shape: SchemaError
 */

#ifndef PATCHWORK_SCHEMA_HPP
#define PATCHWORK_SCHEMA_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"

namespace patchwork {

Transform transform_from_json(const Value& j);
Value transform_to_json(const Transform& t);

void from_json(const Value& j, PatchPolicy& p);
void to_json(Value& j, const PatchPolicy& p);

void from_json(const Value& j, Combine& c);
void to_json(Value& j, const Combine& c);

void from_json(const Value& j, Patch& p);
void to_json(Value& j, const Patch& p);

void from_json(const Value& j, PatchSet& s);
void to_json(Value& j, const PatchSet& s);

void from_json(const Value& j, ComposedTemplate& t);
void to_json(Value& j, const ComposedTemplate& t);

void from_json(const Value& j, Composition& c);
void to_json(Value& j, const Composition& c);

} // namespace patchwork

#endif // PATCHWORK_SCHEMA_HPP
