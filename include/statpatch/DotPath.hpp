/**
 * @file DotPath.hpp
 * @brief Dot-notation paths over a statistics document
 *
 * A path like "countries.MX" or "recent.0.name" is split on '.' into
 * segments. A segment made only of digits is an index segment and
 * addresses an array slot; anything else is a field segment and addresses
 * an object key. Classification is purely syntactic.
 *
 * resolve_parent() walks to the container holding the final segment,
 * optionally creating (or replacing) containers on the way:
 * - an absent or null position is materialized as an object, or as an
 *   array when the following segment is an index
 * - a container of the wrong shape is replaced by an empty one of the
 *   right shape (TypeConflictPolicy::Replace) or rejected
 *   (TypeConflictPolicy::Fail)
 * - arrays are padded with nulls up to an addressed index
 */

#ifndef STATPATCH_DOTPATH_HPP
#define STATPATCH_DOTPATH_HPP

#include "statpatch/Value.hpp"
#include "statpatch/Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace statpatch {

/// Upper bound on an addressed array index unless configured otherwise.
constexpr std::size_t kDefaultMaxArrayIndex = 100000;

/**
 * @brief One component of a dot-path
 */
struct PathSegment {
    enum class Kind { Field, Index };

    Kind kind = Kind::Field;
    std::string text;
    std::size_t index = 0; ///< Valid only for Kind::Index

    bool is_index() const noexcept { return kind == Kind::Index; }
};

/**
 * @brief A parsed, non-empty dot-path
 */
struct Path {
    std::string text;
    std::vector<PathSegment> segments;
};

/**
 * @brief What to do when an existing container has the wrong shape
 */
enum class TypeConflictPolicy {
    Replace, ///< Discard the container and start an empty one of the needed shape
    Fail,    ///< Throw TypeMismatchError
};

struct ResolveOptions {
    TypeConflictPolicy on_conflict = TypeConflictPolicy::Replace;
    std::size_t max_index = kDefaultMaxArrayIndex;
};

/**
 * @brief Result of resolve_parent(): the container and the final segment
 *
 * When parent is an object, last is a field segment; when parent is an
 * array, last is an index segment. The final slot itself may be absent.
 */
struct ParentRef {
    Value* parent = nullptr;
    PathSegment last;
};

/**
 * @brief Split a dot-path into segments, discarding empty fragments
 *
 * Examples:
 * - "totals.visits" → ["totals", "visits"]
 * - "a..b." → ["a", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Classify a segment as field or index
 *
 * Index iff every character is an ASCII digit. Leading zeros are accepted
 * ("007" is index 7); "-1" is a field.
 *
 * @throws ValidationError if the digits do not fit in std::size_t
 */
PathSegment classify_segment(const std::string& text);

/**
 * @brief Parse and validate a dot-path
 *
 * Surrounding whitespace is trimmed before splitting.
 *
 * @throws ValidationError "Missing or invalid path" for blank input or a
 *         path with no segments
 */
Path parse_path(const std::string& text);

/**
 * @brief Walk to the parent container of the final segment
 *
 * @param root Document root; must be an object
 * @param path Parsed path; its first segment must be a field
 * @param create Materialize absent positions and, under
 *               TypeConflictPolicy::Replace, replace wrong-shaped ones
 * @param options Conflict policy and index bound
 * @return Parent container and final segment
 * @throws MissingPathError if create=false and a position is absent
 * @throws TypeMismatchError if a container has the wrong shape and may not
 *         be replaced
 * @throws ValidationError for an index above options.max_index or a path
 *         starting with an index
 *
 * Example:
 * ```cpp
 * Value doc = Value::object();
 * auto ref = resolve_parent(doc, parse_path("list.0.value"), true);
 * // doc == {"list": [{}]}, *ref.parent is doc["list"][0], ref.last == "value"
 * ```
 */
ParentRef resolve_parent(Value& root, const Path& path, bool create,
                         const ResolveOptions& options = {});

/**
 * @brief Get value using dot-path (strict)
 *
 * @throws MissingPathError if any segment is not found
 * @throws TypeMismatchError if traversal hits a scalar before the end
 */
const Value& get_by_dot(const Value& root, const std::string& path);

} // namespace statpatch

#endif // STATPATCH_DOTPATH_HPP
