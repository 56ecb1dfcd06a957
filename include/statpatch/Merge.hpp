/**
 * @file Merge.hpp
 * @brief Deep merge of document objects
 *
 * - Both objects: keys are combined, recursing where both sides hold objects
 * - Anything else: the incoming value replaces the existing one, including
 *   type changes (object → scalar) and arrays (never merged element-wise)
 */

#ifndef STATPATCH_MERGE_HPP
#define STATPATCH_MERGE_HPP

#include "statpatch/Value.hpp"

namespace statpatch {

/**
 * @brief Merge src into dst in place
 *
 * If dst or src is not an object, dst becomes a copy of src.
 *
 * Example:
 * ```cpp
 * Value dst = {{"a", {{"x", 1}}}};
 * deep_merge_into(dst, {{"a", {{"y", 2}}}, {"b", 3}});
 * // dst == {"a": {"x": 1, "y": 2}, "b": 3}
 * ```
 */
void deep_merge_into(Value& dst, const Value& src);

/**
 * @brief Deep merge two values, returning the result
 *
 * @param base Lower precedence value
 * @param override_val Higher precedence value
 * @return base with override_val merged in
 */
Value deep_merge(const Value& base, const Value& override_val);

} // namespace statpatch

#endif // STATPATCH_MERGE_HPP
