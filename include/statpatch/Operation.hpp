/**
 * @file Operation.hpp
 * @brief Typed patch operations and their application to a document
 *
 * Wire shape of one operation:
 * ```json
 * {"op": "set" | "inc" | "delete" | "merge" | "append",
 *  "path": "dot.delimited.path",
 *  "value": <any>,   // set, merge (object), append
 *  "by": <number>}   // inc, default 1
 * ```
 *
 * Every operation resolves its path with creation enabled. Operations
 * mutate the document in place; a thrown ValidationError leaves the
 * document partially modified, so callers discard it on failure.
 */

#ifndef STATPATCH_OPERATION_HPP
#define STATPATCH_OPERATION_HPP

#include "statpatch/Value.hpp"
#include "statpatch/DotPath.hpp"
#include <variant>

namespace statpatch {

/// parent[last] = value, padding arrays with nulls.
struct SetOp {
    Path path;
    Value value;
};

/// parent[last] = (parent[last] or 0) + by.
struct IncOp {
    Path path;
    Value by = 1;
};

/// Remove key or array element; no-op when absent.
struct DeleteOp {
    Path path;
};

/// Deep-merge an object into parent[last] (non-objects start over as {}).
struct MergeOp {
    Path path;
    Value value;
};

/// Push value onto the array at parent[last], wrapping a non-array first.
struct AppendOp {
    Path path;
    Value value;
};

using Operation = std::variant<SetOp, IncOp, DeleteOp, MergeOp, AppendOp>;

/**
 * @brief Decode one operation from its JSON shape
 *
 * @throws ValidationError for a non-object, an unknown "op", a missing or
 *         blank path, a missing value, a non-numeric "by" or a non-object
 *         merge value
 */
Operation parse_operation(const Value& raw);

/**
 * @brief Apply one operation to doc
 *
 * @throws ValidationError if the target of an inc is not numeric, or the
 *         path cannot be resolved under options
 */
void apply_operation(Value& doc, const Operation& op, const ResolveOptions& options = {});

/**
 * @brief Sum two numbers the way an inc does
 *
 * Integer + integer stays an integer while the result fits in int64;
 * otherwise the sum is a double.
 */
Value add_numbers(const Value& a, const Value& b);

} // namespace statpatch

#endif // STATPATCH_OPERATION_HPP
