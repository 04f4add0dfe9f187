/**
 * @file Patch.cpp
 * @brief Implementation of patch application
 */

#include "patchwork/Patch.hpp"
#include "patchwork/Combine.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/FieldPath.hpp"
#include "patchwork/Policy.hpp"
#include "patchwork/Transform.hpp"

#include <algorithm>
#include <optional>

namespace patchwork {

namespace {

void validate(const Patch& patch) {
    switch (patch.type) {
        case PatchType::FromCompositeFieldPath:
        case PatchType::ToCompositeFieldPath:
            if (!patch.from_field_path) {
                throw RequiredFieldMissing("FromFieldPath", to_string(patch.type));
            }
            return;

        case PatchType::CombineFromComposite:
        case PatchType::CombineToComposite:
            if (!patch.combine) {
                throw RequiredFieldMissing("Combine", to_string(patch.type));
            }
            if (patch.combine->variables.empty()) {
                throw CombineRequiresVariables();
            }
            if (patch.combine->strategy == CombineStrategy::String && !patch.combine->string) {
                throw CombineConfigMissing(to_string(patch.combine->strategy));
            }
            if (!patch.to_field_path) {
                throw RequiredFieldMissing("ToFieldPath", to_string(patch.type));
            }
            return;

        case PatchType::PatchSet:
            break;
    }
    throw InvalidPatchType(to_string(patch.type));
}

/**
 * @brief Read a source field, or nullopt if the policy skips a missing one
 */
std::optional<Value> read_source(const Value& from, const std::string& path,
                                 FromFieldPathPolicy policy) {
    try {
        return get_value(from, path);
    } catch (const FieldPathNotFound& e) {
        if (is_optional_field_path_not_found(e, policy)) {
            return std::nullopt;
        }
        throw;
    }
}

void write_destination(Value& to, const std::string& path, const Value& value) {
    if (!has_wildcard(path)) {
        set_value(to, path, value);
        return;
    }

    const std::vector<std::string> paths = expand_wildcards(to, path);
    Value staged = to;
    for (const auto& concrete : paths) {
        set_value(staged, concrete, value);
    }
    to = std::move(staged);
}

} // anonymous namespace

void apply(const Patch& patch, Value& composite, Value& composed,
           const std::vector<PatchType>& only) {
    if (!only.empty() && std::find(only.begin(), only.end(), patch.type) == only.end()) {
        return;
    }

    validate(patch);

    const FromFieldPathPolicy policy = resolve_policy(patch.policy);
    const bool from_composite = is_from_composite(patch.type);
    const Value& from = from_composite ? composite : composed;
    Value& to = from_composite ? composed : composite;

    Value input;
    if (is_combine(patch.type)) {
        std::vector<Value> values;
        values.reserve(patch.combine->variables.size());
        for (const auto& variable : patch.combine->variables) {
            std::optional<Value> v = read_source(from, variable.from_field_path, policy);
            if (!v) {
                return;
            }
            values.push_back(std::move(*v));
        }
        input = combine(*patch.combine, values);
    } else {
        std::optional<Value> v = read_source(from, *patch.from_field_path, policy);
        if (!v) {
            return;
        }
        input = std::move(*v);
    }

    const Value output = resolve_transforms(patch.transforms, input);
    const std::string& destination = patch.to_field_path ? *patch.to_field_path
                                                         : *patch.from_field_path;
    write_destination(to, destination, output);
}

} // namespace patchwork
