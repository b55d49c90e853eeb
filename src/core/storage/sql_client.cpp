#include "tally_reports/core/sql_client.h"

namespace tally_reports {

bool InMemorySqlClient::InsertRow(const std::string& table,
                                  const SqlRow& row,
                                  std::string* error) {
    if (table.empty()) {
        if (error != nullptr) {
            *error = "empty table";
        }
        return false;
    }
    if (row.empty()) {
        if (error != nullptr) {
            *error = "empty row";
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tables_[table].push_back(row);
    return true;
}

std::vector<SqlRow> InMemorySqlClient::QueryRows(const std::string& table,
                                                 const std::string& key,
                                                 const std::string& value,
                                                 std::string* error) const {
    (void)error;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return {};
    }

    std::vector<SqlRow> out;
    out.reserve(table_it->second.size());
    for (const auto& row : table_it->second) {
        const auto it = row.find(key);
        if (it != row.end() && it->second == value) {
            out.push_back(row);
        }
    }
    return out;
}

std::vector<SqlRow> InMemorySqlClient::QueryAllRows(const std::string& table,
                                                    std::string* error) const {
    (void)error;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto table_it = tables_.find(table);
    if (table_it == tables_.end()) {
        return {};
    }
    return table_it->second;
}

bool InMemorySqlClient::Ping(std::string* error) const {
    (void)error;
    return true;
}

}  // namespace tally_reports
