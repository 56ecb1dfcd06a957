#include "statpatch/Logging.hpp"
#include "statpatch/Util.hpp"

#include <fmt/format.h>

namespace statpatch {

namespace {
    std::string quote(std::string_view s) {
        return to_compact_json(Value(std::string(s)));
    }
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name) {
    const std::string upper = to_upper(trim(name));
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

std::string format_record(LogLevel level, std::string_view message, const Value& fields) {
    std::string line = fmt::format("{{\"level\":{},\"message\":{}", quote(to_string(level)), quote(message));
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            line += fmt::format(",{}:{}", quote(it.key()), to_compact_json(it.value()));
        }
    } else if (!fields.is_null()) {
        line += fmt::format(",\"_text\":{}", quote(to_compact_json(fields)));
    }
    line += '}';
    return line;
}

void Logger::log(LogLevel level, std::string_view message, const Value& fields) const {
    if (!should_log(level) || sink_ == nullptr) {
        return;
    }
    fmt::print(sink_, "{}\n", format_record(level, message, fields));
    std::fflush(sink_);
}

} // namespace statpatch
