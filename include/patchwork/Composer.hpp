/**
 * @file Composer.hpp
 * @brief Render a composition against a composite document
 *
 * Rendering runs two passes per resource:
 * 1. FromComposite* patches fill the resource's desired document, starting
 *    from its base
 * 2. If an observed document exists for the resource, its ToComposite*
 *    patches copy observed values back into the composite
 *
 * PatchSet references are expanded before either pass.
 */

#ifndef PATCHWORK_COMPOSER_HPP
#define PATCHWORK_COMPOSER_HPP

#include "patchwork/Types.hpp"
#include "patchwork/Value.hpp"
#include <map>
#include <string>

namespace patchwork {

struct RenderResult {
    /// The composite after ToComposite* patches were applied
    Value composite;

    /// Desired document of each resource, keyed by resource name
    std::map<std::string, Value> composed;
};

/**
 * @brief Name a resource is rendered under: its own name, or "resource-<index>"
 */
std::string resource_name(const ComposedTemplate& resource, std::size_t index);

/**
 * @brief Render every resource of a composition
 *
 * @param composition Patch sets and resource templates
 * @param composite Composite document (copied, not modified)
 * @param observed Observed documents keyed by resource name
 * @return Updated composite and the desired resource documents
 * @throws UndefinedPatchSet, NestedPatchSet from PatchSet expansion
 * @throws CompositionError wrapping the first patch that fails
 */
RenderResult render(const Composition& composition, const Value& composite,
                    const std::map<std::string, Value>& observed = {});

} // namespace patchwork

#endif // PATCHWORK_COMPOSER_HPP
