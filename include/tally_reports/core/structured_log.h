#pragma once

#include <cctype>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "tally_reports/core/report_config.h"

namespace tally_reports {

using LogFields = std::vector<std::pair<std::string, std::string>>;

enum class LogLevel {
    kDebug = 10,
    kInfo = 20,
    kWarn = 30,
    kError = 40,
};

// Unknown names log at info.
inline LogLevel ParseLogLevel(const std::string& text) {
    std::string name;
    name.reserve(text.size());
    for (const char ch : text) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

inline const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
        case LogLevel::kInfo:
            break;
    }
    return "info";
}

// One key=value line per event; values are quoted with '"', '\\' and newlines escaped.
inline void EmitStructuredLog(const ReportRuntimeConfig* runtime,
                              const std::string& app,
                              const std::string& level,
                              const std::string& event,
                              const LogFields& fields = {}) {
    const LogLevel event_level = ParseLogLevel(level);
    const LogLevel threshold =
        runtime == nullptr ? LogLevel::kInfo : ParseLogLevel(runtime->log_level);
    if (static_cast<int>(event_level) < static_cast<int>(threshold)) {
        return;
    }

    std::string line = "ts_ns=";
    line += std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count());
    line += " level=";
    line += LogLevelName(event_level);
    line += " app=" + app + " event=" + event;
    for (const auto& [key, value] : fields) {
        line += " " + key + "=\"";
        for (const char ch : value) {
            if (ch == '\n') {
                line += "\\n";
                continue;
            }
            if (ch == '"' || ch == '\\') {
                line.push_back('\\');
            }
            line.push_back(ch);
        }
        line.push_back('"');
    }
    line.push_back('\n');

    // The config loader lowercases log_sink.
    const bool to_stdout = runtime != nullptr && runtime->log_sink == "stdout";
    (to_stdout ? std::cout : std::cerr) << line;
}

}  // namespace tally_reports
