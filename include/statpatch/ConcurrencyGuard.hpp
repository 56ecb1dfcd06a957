/**
 * @file ConcurrencyGuard.hpp
 * @brief Optimistic read-modify-write of one statistics document
 *
 * Per request:
 *   Loading → Checking → Mutating → Persisting | DryRunReturn → Done
 *
 * 1. Loading: probe the tag, then read the body. An absent body is the
 *    empty object with no tag; the probed tag wins over the body's tag.
 *    An empty document with creation disallowed is NotFound.
 * 2. Checking: an expected tag that differs from the current tag is a
 *    Conflict. A document without a tag never conflicts.
 * 3. Mutating: operations are decoded and applied in the given order;
 *    the first failure abandons the whole batch.
 * 4. Persisting: the full document is written back, unless dry-run.
 *
 * The tag check is client-side only. Another writer may persist between
 * our read and our write and its update is then overwritten; closing that
 * window needs a conditional write on the DocumentStore interface.
 */

#ifndef STATPATCH_CONCURRENCYGUARD_HPP
#define STATPATCH_CONCURRENCYGUARD_HPP

#include "statpatch/DocumentStore.hpp"
#include "statpatch/DotPath.hpp"
#include "statpatch/Errors.hpp"
#include "statpatch/Request.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace statpatch {

enum class Stage {
    Loading,
    Checking,
    Mutating,
    Persisting,
    DryRunReturn,
    Done,
};

const char* to_string(Stage stage) noexcept;

struct PatchOptions {
    ResolveOptions resolve;
};

/**
 * @brief Outcome of ConcurrencyGuard::run()
 *
 * On failure, stage is where processing stopped and document is empty.
 * On success, stage is Done.
 */
struct PatchResult {
    Stage stage = Stage::Loading;
    std::optional<ErrorKind> error;
    std::string message;
    Value document = Value::object();
    std::optional<std::string> etag;       ///< New tag, or the loaded tag for a dry run
    std::optional<std::string> version_id;
    bool dry_run = false;
    std::size_t applied = 0;               ///< Operations applied before stopping

    bool ok() const noexcept { return !error.has_value(); }
};

class ConcurrencyGuard {
public:
    explicit ConcurrencyGuard(DocumentStore& store, PatchOptions options = {})
        : store_(store)
        , options_(options)
    {}

    /**
     * @brief Apply request to the document stored under key
     *
     * @param force_dry_run Process-wide override; never write when set
     * @return Explicit result; StatsError failures never escape. Anything
     *         else (e.g. std::bad_alloc) propagates to the caller.
     */
    PatchResult run(const std::string& key, const PatchRequest& request,
                    bool force_dry_run = false) const;

    const PatchOptions& options() const noexcept { return options_; }

private:
    StoredDocument load(const std::string& key) const;

    DocumentStore& store_;
    PatchOptions options_;
};

} // namespace statpatch

#endif // STATPATCH_CONCURRENCYGUARD_HPP
