/**
 * @file Handler.cpp
 * @brief Event decoding, status mapping and request logging
 */

#include "statpatch/Handler.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Request.hpp"
#include "statpatch/Util.hpp"

#include <exception>

namespace statpatch {

namespace {
    HttpResponse bad_request(const std::string& message) {
        return json_response(400, error_body(message));
    }

    HttpResponse server_error() {
        return json_response(500, error_body("Internal error"));
    }
}

Value HttpResponse::to_json() const {
    Value hdrs = Value::object();
    for (const auto& [name, value] : headers) {
        hdrs[name] = value;
    }
    return {{"statusCode", status}, {"headers", hdrs}, {"body", body}};
}

HttpResponse json_response(int status, const Value& payload) {
    HttpResponse res;
    res.status = status;
    res.headers["Content-Type"] = "application/json";
    res.body = to_compact_json(payload);
    return res;
}

int status_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedRequest:
        case ErrorKind::Validation:
        case ErrorKind::NotFound:
        case ErrorKind::Conflict:
            return 400;
        case ErrorKind::Storage:
            return 500;
    }
    return 500;
}

StatsHandler::StatsHandler(DocumentStore& store, ServiceSettings settings, const Logger& logger)
    : settings_(std::move(settings))
    , logger_(logger)
    , guard_(store, PatchOptions{settings_.resolve_options()})
{}

std::string StatsHandler::decode_body(const Value& event) const {
    if (!event.is_object()) {
        throw MalformedRequestError("Missing body");
    }
    auto body = event.find("body");
    if (body == event.end() || body->is_null() ||
        (body->is_string() && body->get_ref<const std::string&>().empty())) {
        throw MalformedRequestError("Missing body");
    }

    auto b64 = event.find("isBase64Encoded");
    if (b64 != event.end() && b64->is_boolean() && b64->get<bool>()) {
        if (!body->is_string()) {
            throw MalformedRequestError("Body is base64Encoded but not a string");
        }
        auto decoded = decode_base64(body->get<std::string>());
        if (!decoded) {
            throw MalformedRequestError("Body is not valid base64");
        }
        return *decoded;
    }

    if (body->is_string()) {
        return body->get<std::string>();
    }
    return to_compact_json(*body);
}

HttpResponse StatsHandler::handle(const Value& event, const std::string& request_id) const {
    std::string text;
    try {
        text = decode_body(event);
        logger_.debug("Decoded body", {{"requestId", request_id}, {"decodedLen", text.size()}});
    } catch (const MalformedRequestError& e) {
        logger_.error("Failed to decode body", {{"requestId", request_id}, {"error", e.what()}});
        return bad_request(e.what());
    }

    Value payload;
    try {
        payload = Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        logger_.error("Body is not valid JSON", {{"requestId", request_id}, {"error", e.what()}});
        return bad_request("Body is not valid JSON");
    }

    return handle_payload(payload, request_id);
}

HttpResponse StatsHandler::handle_payload(const Value& payload, const std::string& request_id) const {
    PatchRequest request;
    try {
        request = parse_request(payload);
    } catch (const MalformedRequestError& e) {
        logger_.debug("Rejected request", {{"requestId", request_id}, {"error", e.what()}});
        return bad_request(e.what());
    }

    const std::string key = stats_key(request.app_name);
    const std::string& bucket = settings_.bucket;

    PatchResult result;
    try {
        result = guard_.run(key, request, settings_.dry_run);
    } catch (const std::exception& e) {
        logger_.error("Failed while applying ops", {
            {"requestId", request_id}, {"bucket", bucket}, {"key", key}, {"error", e.what()},
        });
        return server_error();
    }

    if (!result.ok()) {
        const ErrorKind kind = *result.error;
        if (kind == ErrorKind::Storage) {
            logger_.error(result.stage == Stage::Persisting ? "Failed to write stats" : "Failed to read stats", {
                {"requestId", request_id}, {"bucket", bucket}, {"key", key}, {"error", result.message},
            });
            return server_error();
        }
        logger_.debug("Rejected request", {
            {"requestId", request_id}, {"key", key}, {"kind", to_string(kind)},
            {"stage", to_string(result.stage)}, {"applied", result.applied}, {"error", result.message},
        });
        return json_response(status_for(kind), error_body(result.message));
    }

    const std::size_t op_count = request.ops.size();
    if (result.dry_run) {
        logger_.info("Dry run result", {
            {"requestId", request_id}, {"appName", request.app_name}, {"bucket", bucket},
            {"key", key}, {"ops", op_count}, {"dryRun", true},
        });
    } else {
        logger_.info("Updated stats", {
            {"requestId", request_id}, {"appName", request.app_name}, {"bucket", bucket},
            {"key", key}, {"etag", result.etag ? Value(*result.etag) : Value(nullptr)}, {"ops", op_count},
        });
    }

    return json_response(200, success_body(bucket, key, result.document, result.etag,
                                           result.version_id, result.dry_run));
}

} // namespace statpatch
