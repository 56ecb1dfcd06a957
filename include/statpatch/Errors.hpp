/**
 * @file Errors.hpp
 * @brief Exception types for statpatch
 *
 * Every request-level failure maps onto one ErrorKind:
 * - MalformedRequest: body missing, not JSON, bad appName or ops
 * - Validation: bad operation, bad path, non-numeric inc target
 * - NotFound: document absent and creation disallowed
 * - Conflict: expected version tag differs from the stored one
 * - Storage: the document store failed for a reason other than absence
 *
 * Exceptions never cross ConcurrencyGuard::run() or the handler; they are
 * turned into PatchResult / HttpResponse values there.
 */

#ifndef STATPATCH_ERRORS_HPP
#define STATPATCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace statpatch {

enum class ErrorKind {
    MalformedRequest,
    Validation,
    NotFound,
    Conflict,
    Storage,
};

/**
 * @brief Stable lower-case name of an error kind, used in logs
 */
inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MalformedRequest: return "malformed_request";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Storage: return "storage";
    }
    return "unknown";
}

/**
 * @brief Base class for all request-level statpatch exceptions
 */
class StatsError : public std::runtime_error {
public:
    StatsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Request envelope could not be decoded or lacks required fields
 */
class MalformedRequestError : public StatsError {
public:
    explicit MalformedRequestError(const std::string& message)
        : StatsError(ErrorKind::MalformedRequest, message)
    {}
};

/**
 * @brief An operation or its path is invalid, or cannot apply to the document
 */
class ValidationError : public StatsError {
public:
    explicit ValidationError(const std::string& message)
        : StatsError(ErrorKind::Validation, message)
    {}
};

/**
 * @brief Path segment not found during non-creating traversal
 */
class MissingPathError : public ValidationError {
public:
    /**
     * @param path Full dot-path being resolved (e.g., "totals.visits")
     * @param segment The segment that doesn't exist (e.g., "totals")
     */
    MissingPathError(std::string path, std::string segment)
        : ValidationError("Path segment not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Container at a path position has the wrong shape for the segment
 *
 * Raised when a field segment meets an array (or an index segment meets an
 * object) and the traversal may not replace the container.
 */
class TypeMismatchError : public ValidationError {
public:
    /**
     * @param path Full dot-path being resolved
     * @param expected Expected container type ("object" or "array")
     * @param actual Type actually found (see type_name())
     */
    TypeMismatchError(std::string path, std::string expected, std::string actual)
        : ValidationError("Cannot traverse into " + actual +
                          " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Document absent and the caller did not allow creating it
 */
class NotFoundError : public StatsError {
public:
    explicit NotFoundError(std::string key)
        : StatsError(ErrorKind::NotFound, "Stats file not found")
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Caller's expected version tag differs from the stored one
 */
class ConflictError : public StatsError {
public:
    ConflictError(std::string expected, std::string current)
        : StatsError(ErrorKind::Conflict, "ETag mismatch, please retry")
        , expected_(std::move(expected))
        , current_(std::move(current))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& current() const noexcept {
        return current_;
    }

private:
    std::string expected_;
    std::string current_;
};

/**
 * @brief Document store failure other than "absent"
 *
 * The message carries collaborator detail for logs. It is never returned
 * to a caller.
 */
class StorageError : public StatsError {
public:
    StorageError(std::string key, const std::string& details)
        : StatsError(ErrorKind::Storage, "Storage failure for '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Invalid service settings (config file, environment or flags)
 */
class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace statpatch

#endif // STATPATCH_ERRORS_HPP
