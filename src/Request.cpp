#include "statpatch/Request.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Util.hpp"

namespace statpatch {

namespace {
    bool optional_flag(const Value& payload, const char* name, bool fallback) {
        auto it = payload.find(name);
        if (it == payload.end()) return fallback;
        if (!it->is_boolean()) {
            throw MalformedRequestError(std::string(name) + " must be a boolean");
        }
        return it->get<bool>();
    }

    Value optional_string(const std::optional<std::string>& s) {
        return s ? Value(*s) : Value(nullptr);
    }
}

PatchRequest parse_request(const Value& payload) {
    if (!payload.is_object()) {
        throw MalformedRequestError("Body must be a JSON object");
    }

    PatchRequest request;

    auto app = payload.find("appName");
    if (app == payload.end() || !app->is_string() || trim(app->get<std::string>()).empty()) {
        throw MalformedRequestError("Missing or invalid appName");
    }
    request.app_name = app->get<std::string>();

    auto ops = payload.find("ops");
    if (ops != payload.end()) {
        if (!ops->is_array()) {
            throw MalformedRequestError("Missing or invalid ops (must be array)");
        }
        request.ops = *ops;
    }

    request.create_if_missing = optional_flag(payload, "createIfMissing", true);
    request.dry_run = optional_flag(payload, "dryRun", false);

    // An explicit null is no expectation at all, rather than an expected
    // tag that can never match.
    auto etag = payload.find("ifMatchEtag");
    if (etag != payload.end() && !etag->is_null()) {
        if (!etag->is_string()) {
            throw MalformedRequestError("ifMatchEtag must be a string");
        }
        request.if_match_etag = etag->get<std::string>();
    }

    return request;
}

std::string stats_key(const std::string& app_name) {
    return app_name + "/stats.json";
}

Value success_body(const std::string& bucket, const std::string& key, const Value& stats,
                   const std::optional<std::string>& etag,
                   const std::optional<std::string>& version_id, bool dry_run) {
    Value body = {
        {"ok", true},
        {"bucket", bucket},
        {"key", key},
        {"stats", stats},
        {"etag", optional_string(etag)},
        {"dryRun", dry_run},
    };
    if (!dry_run) {
        body["versionId"] = optional_string(version_id);
    }
    return body;
}

Value error_body(const std::string& message) {
    return {{"ok", false}, {"error", message}};
}

} // namespace statpatch
