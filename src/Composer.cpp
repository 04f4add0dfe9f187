/**
 * @file Composer.cpp
 * @brief Implementation of composition rendering
 */

#include "patchwork/Composer.hpp"
#include "patchwork/Errors.hpp"
#include "patchwork/Patch.hpp"
#include "patchwork/PatchSet.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace patchwork {

namespace {

const std::vector<PatchType> kFromComposite = {
    PatchType::FromCompositeFieldPath, PatchType::CombineFromComposite};

const std::vector<PatchType> kToComposite = {
    PatchType::ToCompositeFieldPath, PatchType::CombineToComposite};

void apply_all(const std::string& name, const std::vector<Patch>& patches,
               Value& composite, Value& composed, const std::vector<PatchType>& only) {
    for (std::size_t i = 0; i < patches.size(); ++i) {
        try {
            apply(patches[i], composite, composed, only);
        } catch (const PatchError& e) {
            throw CompositionError(name, i, e.what());
        }
    }
}

} // anonymous namespace

std::string resource_name(const ComposedTemplate& resource, std::size_t index) {
    if (resource.name && !resource.name->empty()) {
        return *resource.name;
    }
    return "resource-" + std::to_string(index);
}

RenderResult render(const Composition& composition, const Value& composite,
                    const std::map<std::string, Value>& observed) {
    const std::vector<ComposedTemplate> templates =
        composed_templates(composition.patch_sets, composition.resources);

    RenderResult result;
    result.composite = composite;

    for (std::size_t i = 0; i < templates.size(); ++i) {
        const ComposedTemplate& tmpl = templates[i];
        const std::string name = resource_name(tmpl, i);

        Value desired = tmpl.base.is_null() ? Value::object() : tmpl.base;
        spdlog::debug("Rendering resource {} ({} patches)", name, tmpl.patches.size());
        apply_all(name, tmpl.patches, result.composite, desired, kFromComposite);

        auto it = observed.find(name);
        if (it != observed.end()) {
            // The observed document is only read by ToComposite* patches
            Value observed_doc = it->second;
            spdlog::debug("Applying observed state of resource {} to the composite", name);
            apply_all(name, tmpl.patches, result.composite, observed_doc, kToComposite);
        } else {
            spdlog::debug("No observed state for resource {}", name);
        }

        result.composed[name] = std::move(desired);
    }

    spdlog::debug("Rendered {} resources", result.composed.size());
    return result;
}

} // namespace patchwork
