#pragma once

#include <string>
#include <vector>

#include "tally_reports/core/sql_client.h"
#include "tally_reports/core/storage_connection_config.h"

namespace tally_reports {

// PostgreSQL client that resolves libpq at runtime, so the build carries no libpq link.
class LibpqSqlClient : public ISqlClient {
public:
    struct LibpqApi;

    explicit LibpqSqlClient(PostgresConnectionConfig config);

    bool InsertRow(const std::string& table, const SqlRow& row, std::string* error) override;

    std::vector<SqlRow> QueryRows(const std::string& table,
                                  const std::string& key,
                                  const std::string& value,
                                  std::string* error) const override;

    std::vector<SqlRow> QueryAllRows(const std::string& table,
                                     std::string* error) const override;

    bool Ping(std::string* error) const override;

private:
    static const LibpqApi& Api();
    bool ValidateSimpleIdentifier(const std::string& identifier,
                                  const std::string& field_name,
                                  std::string* error) const;
    bool ValidateQualifiedTableIdentifier(const std::string& table_identifier,
                                          std::string* quoted_identifier,
                                          std::string* error) const;
    static std::string QuoteIdentifier(const std::string& identifier);
    std::string BuildConnInfo() const;
    static std::string EscapeConnInfoValue(const std::string& value);
    static std::vector<SqlRow> ParseRows(const LibpqApi& api, void* result_ptr);
    static bool IsCommandOk(const LibpqApi& api, void* result_ptr);
    static bool IsTuplesOk(const LibpqApi& api, void* result_ptr);
    static std::string ResultStatusText(const LibpqApi& api, void* result_ptr);

    bool Connect(void** out_conn, std::string* error) const;
    bool ExecuteStatement(const std::string& sql,
                          const std::vector<std::string>& params,
                          bool expect_tuples,
                          std::vector<SqlRow>* out_rows,
                          std::string* error) const;

    PostgresConnectionConfig config_;
};

}  // namespace tally_reports
