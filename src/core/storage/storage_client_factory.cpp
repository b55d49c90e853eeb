#include "tally_reports/core/storage_client_factory.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tally_reports/core/libpq_sql_client.h"

namespace tally_reports {

namespace {

class UnavailableSqlClient : public ISqlClient {
public:
    explicit UnavailableSqlClient(std::string reason) : reason_(std::move(reason)) {}

    bool InsertRow(const std::string& table, const SqlRow& row, std::string* error) override {
        (void)table;
        (void)row;
        if (error != nullptr) {
            *error = reason_;
        }
        return false;
    }

    std::vector<SqlRow> QueryRows(const std::string& table,
                                  const std::string& key,
                                  const std::string& value,
                                  std::string* error) const override {
        (void)table;
        (void)key;
        (void)value;
        if (error != nullptr) {
            *error = reason_;
        }
        return {};
    }

    std::vector<SqlRow> QueryAllRows(const std::string& table,
                                     std::string* error) const override {
        (void)table;
        if (error != nullptr) {
            *error = reason_;
        }
        return {};
    }

    bool Ping(std::string* error) const override {
        if (error != nullptr) {
            *error = reason_;
        }
        return false;
    }

private:
    std::string reason_;
};

}  // namespace

std::shared_ptr<ISqlClient> StorageClientFactory::CreateSqlClient(
    const StorageConnectionConfig& config,
    std::string* error) {
    if (config.postgres.mode == StorageBackendMode::kInMemory) {
        return std::make_shared<InMemorySqlClient>();
    }

    auto external_client = std::make_shared<LibpqSqlClient>(config.postgres);
    std::string ping_error;
    if (external_client->Ping(&ping_error)) {
        return external_client;
    }
    const std::string reason = "external postgres unavailable: " + ping_error;
    if (error != nullptr) {
        *error = reason;
    }
    if (config.allow_inmemory_fallback) {
        return std::make_shared<InMemorySqlClient>();
    }
    return std::make_shared<UnavailableSqlClient>(reason);
}

}  // namespace tally_reports
