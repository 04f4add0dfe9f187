/**
 * @file FieldPath.hpp
 * @brief Field-path access into documents
 *
 * Field paths address a location inside a document:
 * - "metadata.name"                      map keys separated by dots
 * - "spec.containers[0].image"           bracketed array index
 * - "metadata.labels['app.kubernetes.io/name']"  quoted key (may contain dots)
 * - "metadata.ownerReferences[*].name"   wildcard over every array element
 *
 * Behavioral rules:
 * - get_value() raises FieldPathNotFound when a segment does not exist and
 *   FieldPathError when traversal meets the wrong kind of value
 * - set_value() creates intermediate objects and arrays; an existing value
 *   of the wrong kind blocks the write and leaves the document unmodified
 * - expand_wildcards() returns only concrete paths that fully resolve
 */

#ifndef PATCHWORK_FIELDPATH_HPP
#define PATCHWORK_FIELDPATH_HPP

#include "patchwork/Value.hpp"
#include "patchwork/Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace patchwork {

/**
 * @brief One step of a parsed field path
 */
struct Segment {
    enum class Kind {
        Field,   ///< Object key
        Index,   ///< Array index
        Wildcard ///< Every element of an array
    };

    Kind kind = Kind::Field;
    std::string field;
    std::size_t index = 0;

    static Segment make_field(std::string name) {
        Segment s;
        s.kind = Kind::Field;
        s.field = std::move(name);
        return s;
    }

    static Segment make_index(std::size_t idx) {
        Segment s;
        s.kind = Kind::Index;
        s.index = idx;
        return s;
    }

    static Segment make_wildcard() {
        Segment s;
        s.kind = Kind::Wildcard;
        return s;
    }

    bool operator==(const Segment& other) const {
        return kind == other.kind && field == other.field && index == other.index;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

using Segments = std::vector<Segment>;

/**
 * @brief Parse a field path into segments
 *
 * @param path Field path like "a.b[0].c"
 * @return Parsed segments
 * @throws FieldPathError for malformed paths (empty field names,
 *         unterminated brackets, non-numeric unquoted indices)
 *
 * Examples:
 * - "a.b"          → [Field a, Field b]
 * - "a[2].b"       → [Field a, Index 2, Field b]
 * - "a['x.y']"     → [Field a, Field x.y]
 * - "a[*].b"       → [Field a, Wildcard, Field b]
 * - ""             → []
 */
Segments parse_field_path(const std::string& path);

/**
 * @brief Render segments back into a field path string
 *
 * Keys that contain '.', '[' or ']' are written in bracket-quoted form so
 * that parse_field_path(join_field_path(s)) == s.
 */
std::string join_field_path(const Segments& segments);

/**
 * @brief Check whether a path contains a [*] wildcard
 * @throws FieldPathError if the path is malformed
 */
bool has_wildcard(const std::string& path);

/**
 * @brief Read the value at a field path
 *
 * @param data Document to read
 * @param path Field path without wildcards
 * @return Reference to the value inside @p data
 * @throws FieldPathNotFound if a key is missing or an index is out of range
 * @throws FieldPathError on wildcards or traversal into the wrong kind
 *
 * ```cpp
 * Value doc = {{"metadata", {{"labels", {{"app", "web"}}}}}};
 * get_value(doc, "metadata.labels.app");  // "web"
 * get_value(doc, "metadata.name");        // throws FieldPathNotFound
 * get_value(doc, "metadata.labels.app.x");// throws FieldPathError
 * ```
 */
const Value& get_value(const Value& data, const std::string& path);

/**
 * @brief Check whether a field path resolves
 *
 * Returns false for missing segments and for traversal into the wrong kind
 * of value. Malformed paths still throw FieldPathError.
 */
bool contains(const Value& data, const std::string& path);

/**
 * @brief Write a value at a field path
 *
 * Missing intermediate objects and arrays are created. Index segments grow
 * arrays as needed, padding new slots with null. A null intermediate is
 * replaced by the container the next segment needs.
 *
 * @param data Document to modify in place
 * @param path Field path without wildcards
 * @param value Value to write
 * @throws FieldPathError if an existing value of the wrong kind blocks the
 *         path, or the path contains a wildcard; @p data is left unmodified
 */
void set_value(Value& data, const std::string& path, const Value& value);

/**
 * @brief Expand [*] wildcards into concrete paths
 *
 * Each wildcard is replaced by every index of the array found at that
 * position. Only concrete paths that fully resolve in @p data are kept. A
 * path without wildcards is returned unchanged (even if it does not
 * resolve).
 *
 * @param data Document to expand against
 * @param path Field path, possibly containing wildcards
 * @return Concrete paths, in document order
 * @throws ArrayExpansionFailure if a wildcarded path yields no concrete path
 *
 * ```cpp
 * Value doc = {{"refs", {{{"name", ""}}, {{"name", ""}}}}};
 * expand_wildcards(doc, "refs[*].name");  // {"refs[0].name", "refs[1].name"}
 * expand_wildcards(doc, "refs[*].nope");  // throws ArrayExpansionFailure
 * ```
 */
std::vector<std::string> expand_wildcards(const Value& data, const std::string& path);

} // namespace patchwork

#endif // PATCHWORK_FIELDPATH_HPP
