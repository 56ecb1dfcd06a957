/**
 * @file Handler.hpp
 * @brief Gateway-style entry point: event in, HTTP response out
 *
 * An event is a JSON object:
 * ```json
 * {"body": "<request JSON text>", "isBase64Encoded": false}
 * ```
 * The body may also be any JSON value, which is re-serialized and decoded
 * as if it had been sent as text.
 *
 * Status codes:
 * - 200: applied (or computed, for dry runs)
 * - 400: malformed request, invalid operation, missing document, tag mismatch
 * - 500: storage failure or anything unexpected; the body is always
 *        {"ok": false, "error": "Internal error"} and details go to the log
 */

#ifndef STATPATCH_HANDLER_HPP
#define STATPATCH_HANDLER_HPP

#include "statpatch/ConcurrencyGuard.hpp"
#include "statpatch/DocumentStore.hpp"
#include "statpatch/Logging.hpp"
#include "statpatch/Settings.hpp"
#include <map>
#include <string>

namespace statpatch {

struct HttpResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    /// {"statusCode", "headers", "body"} as returned to the gateway
    Value to_json() const;
};

/**
 * @brief JSON response with Content-Type set and a compact body
 */
HttpResponse json_response(int status, const Value& payload);

/**
 * @brief Status code for a request-level failure
 */
int status_for(ErrorKind kind) noexcept;

class StatsHandler {
public:
    /**
     * @param store Must outlive the handler
     * @param logger Must outlive the handler
     */
    StatsHandler(DocumentStore& store, ServiceSettings settings, const Logger& logger);

    /**
     * @brief Decode an event and process its request
     */
    HttpResponse handle(const Value& event, const std::string& request_id = "-") const;

    /**
     * @brief Process an already decoded request payload
     */
    HttpResponse handle_payload(const Value& payload, const std::string& request_id = "-") const;

    const ServiceSettings& settings() const noexcept { return settings_; }

private:
    std::string decode_body(const Value& event) const;

    ServiceSettings settings_;
    const Logger& logger_;
    ConcurrencyGuard guard_;
};

} // namespace statpatch

#endif // STATPATCH_HANDLER_HPP
