/**
 * @file Request.hpp
 * @brief Patch request decoding and response payloads
 *
 * Request:
 * ```json
 * {"appName": "zoo_landing_page",
 *  "ops": [{"op": "inc", "path": "totals.visits"}],
 *  "createIfMissing": true,
 *  "dryRun": false,
 *  "ifMatchEtag": "\"5d41...\""}
 * ```
 *
 * Success: {"ok": true, "bucket", "key", "stats", "etag", "versionId", "dryRun"}
 * Failure: {"ok": false, "error": "<message>"}
 */

#ifndef STATPATCH_REQUEST_HPP
#define STATPATCH_REQUEST_HPP

#include "statpatch/Value.hpp"
#include <optional>
#include <string>

namespace statpatch {

struct PatchRequest {
    std::string app_name;
    // Kept raw: each entry is decoded by parse_operation() when it is
    // applied, after loading and the version check.
    Value ops = Value::array();
    bool create_if_missing = true;
    bool dry_run = false;
    std::optional<std::string> if_match_etag;
};

/**
 * @brief Decode a request payload
 *
 * A missing "ops" is an empty list; "ifMatchEtag": null is treated as absent.
 *
 * @throws MalformedRequestError if payload is not an object, appName is
 *         missing or blank, ops is not an array, or a flag has the wrong type
 */
PatchRequest parse_request(const Value& payload);

/**
 * @brief Object key of an application's statistics blob
 */
std::string stats_key(const std::string& app_name);

/**
 * @brief Success payload
 *
 * versionId is only emitted for persisted (non dry-run) results, as null
 * when the store keeps no versions.
 */
Value success_body(const std::string& bucket, const std::string& key, const Value& stats,
                   const std::optional<std::string>& etag,
                   const std::optional<std::string>& version_id, bool dry_run);

/**
 * @brief Failure payload {"ok": false, "error": message}
 */
Value error_body(const std::string& message);

} // namespace statpatch

#endif // STATPATCH_REQUEST_HPP
