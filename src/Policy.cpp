/**
 * @file Policy.cpp
 * @brief Implementation of the source-field policy
 */

#include "patchwork/Policy.hpp"
#include "patchwork/Errors.hpp"

namespace patchwork {

FromFieldPathPolicy resolve_policy(const std::optional<PatchPolicy>& policy) {
    if (policy && policy->from_field_path) {
        return *policy->from_field_path;
    }
    return FromFieldPathPolicy::Optional;
}

bool is_optional_field_path_not_found(const std::exception& err, FromFieldPathPolicy policy) {
    if (policy != FromFieldPathPolicy::Optional) {
        return false;
    }
    return dynamic_cast<const FieldPathNotFound*>(&err) != nullptr;
}

bool is_optional_field_path_not_found(const std::exception& err,
                                      const std::optional<PatchPolicy>& policy) {
    return is_optional_field_path_not_found(err, resolve_policy(policy));
}

} // namespace patchwork
