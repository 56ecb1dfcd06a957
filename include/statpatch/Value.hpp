/**
 * @file Value.hpp
 * @brief Document value type for the statistics blob
 *
 * Uses nlohmann::json as the underlying tree:
 * - Object ({String: Value, ...}), always the shape of a document root
 * - Array ([Value, ...])
 * - Scalars: null, bool, integer, unsigned, float, string
 */

#ifndef STATPATCH_VALUE_HPP
#define STATPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace statpatch {

/**
 * @brief JSON-like value type used for documents and operation payloads
 *
 * Alias for nlohmann::json. Every traversal in this library switches on
 * is_object() / is_array() / scalar, so the alias doubles as the tagged
 * union of the document model.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Serialize a document the way it is stored: compact, UTF-8 kept as is
 */
inline std::string to_compact_json(const Value& val) {
    return val.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace statpatch

#endif // STATPATCH_VALUE_HPP
