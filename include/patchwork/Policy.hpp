/**
 * @file Policy.hpp
 * @brief Optional/Required handling of missing source fields
 */

#ifndef PATCHWORK_POLICY_HPP
#define PATCHWORK_POLICY_HPP

#include "patchwork/Types.hpp"
#include <exception>
#include <optional>

namespace patchwork {

/**
 * @brief Effective source-field policy of a patch
 *
 * An absent policy, or a policy without fromFieldPath, means Optional.
 */
FromFieldPathPolicy resolve_policy(const std::optional<PatchPolicy>& policy);

/**
 * @brief True if err is a missing-field error that the policy turns into a no-op
 *
 * Only FieldPathNotFound qualifies; traversal errors, transform errors and
 * everything else are always reported.
 */
bool is_optional_field_path_not_found(const std::exception& err, FromFieldPathPolicy policy);

bool is_optional_field_path_not_found(const std::exception& err,
                                      const std::optional<PatchPolicy>& policy);

} // namespace patchwork

#endif // PATCHWORK_POLICY_HPP
