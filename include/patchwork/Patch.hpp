/**
 * @file Patch.hpp
 * @brief Apply a single patch between a composite and a composed document
 *
 * Behavioral rules:
 * - FromComposite* patches read the composite and write the composed
 *   document; ToComposite* patches do the reverse
 * - A missing source field is a no-op under the Optional policy (the
 *   default) and a FieldPathNotFound under Required
 * - Combine patches read every variable before combining; any optional
 *   miss skips the whole patch
 * - Transforms run on the source value before it is written
 * - A wildcarded destination writes the same value to every element the
 *   wildcard expands to
 * - Neither document is modified when apply() throws
 */

#ifndef PATCHWORK_PATCH_HPP
#define PATCHWORK_PATCH_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"
#include <vector>

namespace patchwork {

/**
 * @brief Apply one patch
 *
 * @param patch Patch to apply (PatchSet references must already be expanded)
 * @param composite Composite document
 * @param composed Composed document
 * @param only If non-empty, patches whose type is not listed are skipped
 * @throws RequiredFieldMissing if the patch lacks a field its type needs
 * @throws InvalidPatchType for PatchSet patches and unknown types
 * @throws CombineRequiresVariables, CombineConfigMissing for bad combines
 * @throws FieldPathNotFound if a Required source field is missing
 * @throws FieldPathError, ArrayExpansionFailure, TransformError from the
 *         read, transform and write steps
 *
 * ```cpp
 * Value xr = {{"metadata", {{"labels", {{"app", "web"}}}}}};
 * Value cd = Value::object();
 * Patch p;
 * p.type = PatchType::FromCompositeFieldPath;
 * p.from_field_path = "metadata.labels";
 * apply(p, xr, cd);   // cd == {"metadata": {"labels": {"app": "web"}}}
 * ```
 */
void apply(const Patch& patch, Value& composite, Value& composed,
           const std::vector<PatchType>& only = {});

} // namespace patchwork

#endif // PATCHWORK_PATCH_HPP
