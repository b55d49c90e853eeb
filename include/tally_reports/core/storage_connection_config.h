#pragma once

#include <string>

namespace tally_reports {

enum class StorageBackendMode {
    kInMemory,
    kExternal,
};

struct PostgresConnectionConfig {
    StorageBackendMode mode{StorageBackendMode::kInMemory};
    std::string dsn;
    std::string host{"127.0.0.1"};
    int port{5432};
    std::string database{"tally"};
    std::string user;
    std::string password;
    std::string ssl_mode{"disable"};
    int connect_timeout_ms{2000};
    std::string schema;
};

struct StorageConnectionConfig {
    PostgresConnectionConfig postgres;
    bool allow_inmemory_fallback{false};

    static StorageConnectionConfig FromEnvironment();
};

std::string GetEnvOrDefault(const char* key, const std::string& default_value);

}  // namespace tally_reports
