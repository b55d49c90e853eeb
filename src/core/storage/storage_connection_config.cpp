#include "tally_reports/core/storage_connection_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace tally_reports {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

int GetEnvOrDefaultInt(const char* key, int default_value) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return default_value;
    }
    try {
        return std::stoi(raw);
    } catch (const std::exception&) {
        return default_value;
    }
}

bool ParseBoolWithDefault(const std::string& raw, bool default_value) {
    const auto value = ToLower(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

StorageBackendMode ParseMode(const std::string& raw, StorageBackendMode default_mode) {
    const auto value = ToLower(raw);
    if (value == "external" || value == "postgres") {
        return StorageBackendMode::kExternal;
    }
    if (value == "in_memory" || value == "inmemory" || value == "memory") {
        return StorageBackendMode::kInMemory;
    }
    return default_mode;
}

}  // namespace

std::string GetEnvOrDefault(const char* key, const std::string& default_value) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return default_value;
    }
    return std::string(raw);
}

StorageConnectionConfig StorageConnectionConfig::FromEnvironment() {
    StorageConnectionConfig config;
    auto& pg = config.postgres;
    pg.mode = ParseMode(GetEnvOrDefault("TALLY_REPORTS_STORE_MODE", "in_memory"),
                        StorageBackendMode::kInMemory);
    pg.dsn = GetEnvOrDefault("TALLY_REPORTS_PG_DSN", pg.dsn);
    pg.host = GetEnvOrDefault("TALLY_REPORTS_PG_HOST", pg.host);
    pg.port = GetEnvOrDefaultInt("TALLY_REPORTS_PG_PORT", pg.port);
    pg.database = GetEnvOrDefault("TALLY_REPORTS_PG_DB", pg.database);
    pg.user = GetEnvOrDefault("TALLY_REPORTS_PG_USER", pg.user);
    pg.password = GetEnvOrDefault("TALLY_REPORTS_PG_PASSWORD", pg.password);
    pg.ssl_mode = GetEnvOrDefault("TALLY_REPORTS_PG_SSLMODE", pg.ssl_mode);
    pg.connect_timeout_ms =
        GetEnvOrDefaultInt("TALLY_REPORTS_PG_CONNECT_TIMEOUT_MS", pg.connect_timeout_ms);
    pg.schema = GetEnvOrDefault("TALLY_REPORTS_SCHEMA", pg.schema);

    config.allow_inmemory_fallback = ParseBoolWithDefault(
        GetEnvOrDefault("TALLY_REPORTS_STORE_ALLOW_FALLBACK", "false"), false);
    return config;
}

}  // namespace tally_reports
