#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tally_reports {

using SqlRow = std::unordered_map<std::string, std::string>;

class ISqlClient {
public:
    virtual ~ISqlClient() = default;

    virtual bool InsertRow(const std::string& table, const SqlRow& row, std::string* error) = 0;

    virtual std::vector<SqlRow> QueryRows(const std::string& table,
                                          const std::string& key,
                                          const std::string& value,
                                          std::string* error) const = 0;

    virtual std::vector<SqlRow> QueryAllRows(const std::string& table,
                                             std::string* error) const = 0;
    virtual bool Ping(std::string* error) const = 0;
};

class InMemorySqlClient : public ISqlClient {
public:
    bool InsertRow(const std::string& table, const SqlRow& row, std::string* error) override;

    std::vector<SqlRow> QueryRows(const std::string& table,
                                  const std::string& key,
                                  const std::string& value,
                                  std::string* error) const override;

    std::vector<SqlRow> QueryAllRows(const std::string& table,
                                     std::string* error) const override;
    bool Ping(std::string* error) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<SqlRow>> tables_;
};

}  // namespace tally_reports
