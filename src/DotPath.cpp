/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path parsing and resolution
 */

#include "statpatch/DotPath.hpp"
#include "statpatch/Util.hpp"
#include <algorithm>
#include <limits>

namespace statpatch {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

PathSegment classify_segment(const std::string& text) {
    PathSegment seg;
    seg.text = text;

    const bool all_digits = !text.empty() &&
        std::all_of(text.begin(), text.end(),
                    [](unsigned char c) { return c >= '0' && c <= '9'; });
    if (!all_digits) {
        return seg;
    }

    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t value = 0;
    for (char c : text) {
        const std::size_t digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) {
            throw ValidationError("Array index out of range: " + text);
        }
        value = value * 10 + digit;
    }

    seg.kind = PathSegment::Kind::Index;
    seg.index = value;
    return seg;
}

Path parse_path(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw ValidationError("Missing or invalid path");
    }

    Path path;
    path.text = trimmed;
    for (const auto& part : split_dot_path(trimmed)) {
        path.segments.push_back(classify_segment(part));
    }
    if (path.segments.empty()) {
        throw ValidationError("Missing or invalid path");
    }
    return path;
}

namespace {
    Value empty_container(bool array) {
        return array ? Value::array() : Value::object();
    }

    void check_index(const PathSegment& seg, const Path& path, const ResolveOptions& options) {
        if (seg.is_index() && seg.index > options.max_index) {
            throw ValidationError("Array index " + seg.text + " exceeds limit of " +
                                  std::to_string(options.max_index) +
                                  " in path '" + path.text + "'");
        }
    }

    /**
     * @brief Locate the slot for seg inside container
     *
     * container already has the shape seg needs. With create, arrays are
     * padded with nulls and missing object keys are inserted as null.
     */
    Value* step(Value& container, const PathSegment& seg, const Path& path, bool create) {
        if (seg.is_index()) {
            if (seg.index >= container.size()) {
                if (!create) {
                    throw MissingPathError(path.text, seg.text);
                }
                while (container.size() <= seg.index) {
                    container.push_back(nullptr);
                }
            }
            return &container[seg.index];
        }

        auto it = container.find(seg.text);
        if (it == container.end()) {
            if (!create) {
                throw MissingPathError(path.text, seg.text);
            }
            return &container[seg.text];
        }
        return &*it;
    }

    /**
     * @brief Make slot the container the following segment needs
     *
     * A null slot counts as absent.
     */
    void ensure_shape(Value& slot, const PathSegment& seg, const PathSegment& next,
                      const Path& path, bool create, TypeConflictPolicy policy) {
        const bool want_array = next.is_index();
        if (slot.is_null()) {
            if (!create) {
                throw MissingPathError(path.text, seg.text);
            }
            slot = empty_container(want_array);
            return;
        }

        if (want_array ? slot.is_array() : slot.is_object()) {
            return;
        }

        if (!create || policy == TypeConflictPolicy::Fail) {
            throw TypeMismatchError(path.text, want_array ? "array" : "object", type_name(slot));
        }
        // Destructive by default: the old subtree is dropped.
        slot = empty_container(want_array);
    }
}

ParentRef resolve_parent(Value& root, const Path& path, bool create,
                         const ResolveOptions& options) {
    const auto& segments = path.segments;
    if (segments.empty()) {
        throw ValidationError("Missing or invalid path");
    }
    if (segments.front().is_index()) {
        throw ValidationError("Path must start with a field name: '" + path.text + "'");
    }

    if (!root.is_object()) {
        if (!create || (!root.is_null() && options.on_conflict == TypeConflictPolicy::Fail)) {
            throw TypeMismatchError(path.text, "object", type_name(root));
        }
        root = Value::object();
    }

    Value* current = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        check_index(segments[i], path, options);
        Value* child = step(*current, segments[i], path, create);
        ensure_shape(*child, segments[i], segments[i + 1], path, create, options.on_conflict);
        current = child;
    }

    check_index(segments.back(), path, options);
    return ParentRef{current, segments.back()};
}

const Value& get_by_dot(const Value& root, const std::string& path) {
    const auto parts = split_dot_path(path);
    const Value* current = &root;

    for (const auto& part : parts) {
        if (!is_container(*current)) {
            throw TypeMismatchError(path, "object or array", type_name(*current));
        }

        if (current->is_object()) {
            auto it = current->find(part);
            if (it == current->end()) {
                throw MissingPathError(path, part);
            }
            current = &*it;
            continue;
        }

        const PathSegment seg = classify_segment(part);
        if (!seg.is_index()) {
            throw MissingPathError(path, part + " (not a valid array index)");
        }
        if (seg.index >= current->size()) {
            throw MissingPathError(path, part + " (index out of range)");
        }
        current = &(*current)[seg.index];
    }

    return *current;
}

} // namespace statpatch
