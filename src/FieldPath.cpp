/**
 * @file FieldPath.cpp
 * @brief Implementation of field-path parsing and document access
 */

#include "patchwork/FieldPath.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace patchwork {

namespace {
    /**
     * @brief Check if token represents an array index
     * @return true if token is a non-negative integer without leading zeros
     */
    bool is_array_index(const std::string& token) {
        if (token.empty()) return false;
        if (token[0] == '0' && token.size() > 1) return false;
        return std::all_of(token.begin(), token.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    bool needs_quoting(const std::string& field) {
        return field.empty() || field.find_first_of(".[]") != std::string::npos;
    }

    std::string describe(const Segment& seg) {
        switch (seg.kind) {
            case Segment::Kind::Field: return seg.field;
            case Segment::Kind::Index: return "[" + std::to_string(seg.index) + "]";
            case Segment::Kind::Wildcard: return "[*]";
        }
        return "";
    }

    bool contains_wildcard(const Segments& segments) {
        return std::any_of(segments.begin(), segments.end(), [](const Segment& s) {
            return s.kind == Segment::Kind::Wildcard;
        });
    }

    // Non-throwing lookup: nullptr when a segment is missing or the
    // traversal meets the wrong kind of value.
    const Value* find_value(const Value& data, const Segments& segments) {
        const Value* current = &data;
        for (const auto& seg : segments) {
            if (seg.kind == Segment::Kind::Field) {
                if (!current->is_object()) return nullptr;
                auto it = current->find(seg.field);
                if (it == current->end()) return nullptr;
                current = &*it;
            } else if (seg.kind == Segment::Kind::Index) {
                if (!current->is_array() || seg.index >= current->size()) return nullptr;
                current = &(*current)[seg.index];
            } else {
                return nullptr;
            }
        }
        return current;
    }

    void expand_into(const Value& node, const Segments& segments, std::size_t pos,
                     Segments& prefix, std::vector<std::string>& out) {
        if (pos == segments.size()) {
            out.push_back(join_field_path(prefix));
            return;
        }

        const Segment& seg = segments[pos];
        switch (seg.kind) {
            case Segment::Kind::Field: {
                if (!node.is_object()) return;
                auto it = node.find(seg.field);
                if (it == node.end()) return;
                prefix.push_back(seg);
                expand_into(*it, segments, pos + 1, prefix, out);
                prefix.pop_back();
                break;
            }
            case Segment::Kind::Index: {
                if (!node.is_array() || seg.index >= node.size()) return;
                prefix.push_back(seg);
                expand_into(node[seg.index], segments, pos + 1, prefix, out);
                prefix.pop_back();
                break;
            }
            case Segment::Kind::Wildcard: {
                if (!node.is_array()) return;
                for (std::size_t i = 0; i < node.size(); ++i) {
                    prefix.push_back(Segment::make_index(i));
                    expand_into(node[i], segments, pos + 1, prefix, out);
                    prefix.pop_back();
                }
                break;
            }
        }
    }
}

Segments parse_field_path(const std::string& path) {
    Segments segments;
    const std::size_t n = path.size();
    std::size_t i = 0;

    while (i < n) {
        if (path[i] == '[') {
            ++i;
            if (i < n && (path[i] == '\'' || path[i] == '"')) {
                const char quote = path[i++];
                const std::size_t end = path.find(quote, i);
                if (end == std::string::npos || end + 1 >= n || path[end + 1] != ']') {
                    throw FieldPathError(path, "unterminated quoted key");
                }
                segments.push_back(Segment::make_field(path.substr(i, end - i)));
                i = end + 2;
            } else {
                const std::size_t end = path.find(']', i);
                if (end == std::string::npos) {
                    throw FieldPathError(path, "unterminated '['");
                }
                const std::string token = path.substr(i, end - i);
                if (token == "*") {
                    segments.push_back(Segment::make_wildcard());
                } else if (is_array_index(token)) {
                    std::size_t index = 0;
                    try {
                        index = std::stoull(token);
                    } catch (const std::out_of_range&) {
                        throw FieldPathError(path, "array index '" + token + "' is out of range");
                    }
                    segments.push_back(Segment::make_index(index));
                } else {
                    throw FieldPathError(path, "invalid array index '" + token + "'");
                }
                i = end + 1;
            }

            // After ']' only '.', '[' or the end of the path may follow
            if (i < n) {
                if (path[i] == '.') {
                    ++i;
                    if (i == n) throw FieldPathError(path, "trailing '.'");
                    if (path[i] == '[') throw FieldPathError(path, "'.' followed by '['");
                } else if (path[i] != '[') {
                    throw FieldPathError(path, "unexpected character after ']'");
                }
            }
            continue;
        }

        const std::size_t start = i;
        while (i < n && path[i] != '.' && path[i] != '[') ++i;
        if (i == start) {
            throw FieldPathError(path, "empty field name at offset " + std::to_string(start));
        }
        segments.push_back(Segment::make_field(path.substr(start, i - start)));

        if (i < n && path[i] == '.') {
            ++i;
            if (i == n) throw FieldPathError(path, "trailing '.'");
            if (path[i] == '[') throw FieldPathError(path, "'.' followed by '['");
        }
    }

    return segments;
}

std::string join_field_path(const Segments& segments) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : segments) {
        switch (seg.kind) {
            case Segment::Kind::Field:
                if (needs_quoting(seg.field)) {
                    const char quote = seg.field.find('\'') == std::string::npos ? '\'' : '"';
                    oss << '[' << quote << seg.field << quote << ']';
                } else {
                    if (!first) oss << '.';
                    oss << seg.field;
                }
                break;
            case Segment::Kind::Index:
                oss << '[' << seg.index << ']';
                break;
            case Segment::Kind::Wildcard:
                oss << "[*]";
                break;
        }
        first = false;
    }
    return oss.str();
}

bool has_wildcard(const std::string& path) {
    return contains_wildcard(parse_field_path(path));
}

const Value& get_value(const Value& data, const std::string& path) {
    const auto segments = parse_field_path(path);
    if (contains_wildcard(segments)) {
        throw FieldPathError(path, "wildcards are not supported when reading");
    }

    const Value* current = &data;
    for (const auto& seg : segments) {
        // A null intermediate reads as "nothing here", not as a type error
        if (current->is_null()) {
            throw FieldPathNotFound(path, describe(seg));
        }

        if (seg.kind == Segment::Kind::Field) {
            if (!current->is_object()) {
                throw FieldPathError(path, "cannot access field '" + seg.field +
                                           "' of " + type_name(*current));
            }
            auto it = current->find(seg.field);
            if (it == current->end()) {
                throw FieldPathNotFound(path, seg.field);
            }
            current = &*it;
        } else {
            if (!current->is_array()) {
                throw FieldPathError(path, "cannot index " + type_name(*current));
            }
            if (seg.index >= current->size()) {
                throw FieldPathNotFound(path, describe(seg));
            }
            current = &(*current)[seg.index];
        }
    }

    return *current;
}

bool contains(const Value& data, const std::string& path) {
    return find_value(data, parse_field_path(path)) != nullptr;
}

void set_value(Value& data, const std::string& path, const Value& value) {
    const auto segments = parse_field_path(path);
    if (contains_wildcard(segments)) {
        throw FieldPathError(path, "wildcards must be expanded before writing");
    }

    // Every blocking check happens on a pre-existing value; once a node is
    // created all deeper nodes are new, so a throw never follows a mutation.
    Value* current = &data;
    for (const auto& seg : segments) {
        if (seg.kind == Segment::Kind::Field) {
            if (current->is_null()) {
                *current = Value::object();
            } else if (!current->is_object()) {
                throw FieldPathError(path, "cannot set field '" + seg.field +
                                           "' in " + type_name(*current));
            }
            current = &(*current)[seg.field];
        } else {
            if (current->is_null()) {
                *current = Value::array();
            } else if (!current->is_array()) {
                throw FieldPathError(path, "cannot set index " + describe(seg) +
                                           " in " + type_name(*current));
            }
            while (current->size() <= seg.index) {
                current->push_back(nullptr);
            }
            current = &(*current)[seg.index];
        }
    }

    *current = value;
}

std::vector<std::string> expand_wildcards(const Value& data, const std::string& path) {
    const auto segments = parse_field_path(path);
    if (!contains_wildcard(segments)) {
        return {path};
    }

    std::vector<std::string> out;
    Segments prefix;
    expand_into(data, segments, 0, prefix, out);

    if (out.empty()) {
        throw ArrayExpansionFailure(path);
    }
    return out;
}

} // namespace patchwork
