/**
 * @file Logging.hpp
 * @brief Structured one-line JSON logging
 *
 * Each record is a single JSON object on its own line:
 * ```
 * {"level":"INFO","message":"Updated stats","appName":"zoo","ops":3,...}
 * ```
 * Records below the threshold are dropped. Invalid UTF-8 in messages or
 * fields is replaced, so logging never throws on bad input.
 */

#ifndef STATPATCH_LOGGING_HPP
#define STATPATCH_LOGGING_HPP

#include "statpatch/Value.hpp"
#include <cstdio>
#include <string>
#include <string_view>

namespace statpatch {

enum class LogLevel {
    Debug = 10,
    Info = 20,
    Error = 40,
};

const char* to_string(LogLevel level) noexcept;

/**
 * @brief Parse "DEBUG" / "INFO" / "ERROR" (case-insensitive)
 *
 * Unknown names fall back to Info.
 */
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    explicit Logger(LogLevel threshold = LogLevel::Info, std::FILE* sink = stdout)
        : threshold_(threshold)
        , sink_(sink)
    {}

    bool should_log(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(threshold_);
    }

    /**
     * @param fields Object whose members are appended after level/message
     */
    void log(LogLevel level, std::string_view message, const Value& fields = Value::object()) const;

    void debug(std::string_view message, const Value& fields = Value::object()) const {
        log(LogLevel::Debug, message, fields);
    }

    void info(std::string_view message, const Value& fields = Value::object()) const {
        log(LogLevel::Info, message, fields);
    }

    void error(std::string_view message, const Value& fields = Value::object()) const {
        log(LogLevel::Error, message, fields);
    }

    LogLevel threshold() const noexcept { return threshold_; }
    void set_threshold(LogLevel level) noexcept { threshold_ = level; }

private:
    LogLevel threshold_;
    std::FILE* sink_;
};

/**
 * @brief Render one record without writing it
 */
std::string format_record(LogLevel level, std::string_view message, const Value& fields);

} // namespace statpatch

#endif // STATPATCH_LOGGING_HPP
