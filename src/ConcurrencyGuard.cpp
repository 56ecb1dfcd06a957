/**
 * @file ConcurrencyGuard.cpp
 * @brief Load, check, mutate and persist a statistics document
 */

#include "statpatch/ConcurrencyGuard.hpp"
#include "statpatch/Operation.hpp"

namespace statpatch {

const char* to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Loading: return "loading";
        case Stage::Checking: return "checking";
        case Stage::Mutating: return "mutating";
        case Stage::Persisting: return "persisting";
        case Stage::DryRunReturn: return "dry_run_return";
        case Stage::Done: return "done";
    }
    return "unknown";
}

StoredDocument ConcurrencyGuard::load(const std::string& key) const {
    const std::optional<std::string> probed = store_.probe(key);
    std::optional<StoredDocument> body = store_.read_body(key);
    if (!body) {
        return StoredDocument{};
    }
    if (probed) {
        body->version_tag = probed;
    }
    return std::move(*body);
}

PatchResult ConcurrencyGuard::run(const std::string& key, const PatchRequest& request,
                                  bool force_dry_run) const {
    PatchResult result;
    result.dry_run = request.dry_run || force_dry_run;

    try {
        result.stage = Stage::Loading;
        StoredDocument current = load(key);
        if (current.document.empty() && !request.create_if_missing) {
            throw NotFoundError(key);
        }

        result.stage = Stage::Checking;
        if (request.if_match_etag && current.version_tag &&
            *request.if_match_etag != *current.version_tag) {
            throw ConflictError(*request.if_match_etag, *current.version_tag);
        }

        result.stage = Stage::Mutating;
        Value doc = std::move(current.document);
        for (const auto& raw : request.ops) {
            apply_operation(doc, parse_operation(raw), options_.resolve);
            ++result.applied;
        }

        if (result.dry_run) {
            result.stage = Stage::DryRunReturn;
            result.etag = current.version_tag;
        } else {
            result.stage = Stage::Persisting;
            WriteReceipt receipt = store_.write(key, doc);
            result.etag = std::move(receipt.version_tag);
            result.version_id = std::move(receipt.version_id);
        }

        result.document = std::move(doc);
        result.stage = Stage::Done;
    } catch (const StatsError& e) {
        result.error = e.kind();
        result.message = e.what();
        result.document = Value::object();
    }

    return result;
}

} // namespace statpatch
