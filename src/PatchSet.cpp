/**
 * @file PatchSet.cpp
 * @brief Implementation of PatchSet expansion
 */

#include "patchwork/PatchSet.hpp"
#include "patchwork/Errors.hpp"

#include <map>
#include <string>

namespace patchwork {

std::vector<ComposedTemplate> composed_templates(const std::vector<PatchSet>& patch_sets,
                                                 const std::vector<ComposedTemplate>& templates) {
    std::map<std::string, const PatchSet*> by_name;
    for (const auto& set : patch_sets) {
        for (const auto& p : set.patches) {
            if (p.type == PatchType::PatchSet) {
                throw NestedPatchSet(set.name, p.patch_set_name.value_or(""));
            }
        }
        // Later definitions replace earlier ones of the same name
        by_name[set.name] = &set;
    }

    std::vector<ComposedTemplate> out;
    out.reserve(templates.size());
    for (const auto& tmpl : templates) {
        ComposedTemplate expanded = tmpl;
        expanded.patches.clear();
        for (const auto& p : tmpl.patches) {
            if (p.type != PatchType::PatchSet) {
                expanded.patches.push_back(p);
                continue;
            }
            if (!p.patch_set_name) {
                throw RequiredFieldMissing("PatchSetName", to_string(p.type));
            }
            auto it = by_name.find(*p.patch_set_name);
            if (it == by_name.end()) {
                throw UndefinedPatchSet(*p.patch_set_name);
            }
            const auto& spliced = it->second->patches;
            expanded.patches.insert(expanded.patches.end(), spliced.begin(), spliced.end());
        }
        out.push_back(std::move(expanded));
    }
    return out;
}

} // namespace patchwork
