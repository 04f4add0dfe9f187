/**
 * @file PatchSet.hpp
 * @brief Expansion of PatchSet references into concrete patches
 */

#ifndef PATCHWORK_PATCHSET_HPP
#define PATCHWORK_PATCHSET_HPP

#include "patchwork/Types.hpp"
#include <vector>

namespace patchwork {

/**
 * @brief Replace every PatchSet patch with the patches of the named set
 *
 * Spliced patches keep their order within the set, and the set keeps the
 * position of the reference it replaces. Templates without references are
 * returned unchanged.
 *
 * @param patch_sets Named patch sets available for reference
 * @param templates Composed templates to expand
 * @return Copies of @p templates with no PatchSet patches left
 * @throws NestedPatchSet if a patch set itself contains a PatchSet patch
 * @throws UndefinedPatchSet if a reference names no supplied set
 *
 * ```cpp
 * // set "labels" = [A1, A2]; template patches = [B1, {PatchSet labels}, B2]
 * composed_templates(sets, templates);   // template patches = [B1, A1, A2, B2]
 * ```
 */
std::vector<ComposedTemplate> composed_templates(const std::vector<PatchSet>& patch_sets,
                                                 const std::vector<ComposedTemplate>& templates);

} // namespace patchwork

#endif // PATCHWORK_PATCHSET_HPP
