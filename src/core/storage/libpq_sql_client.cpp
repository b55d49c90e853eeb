#include "tally_reports/core/libpq_sql_client.h"

#include <dlfcn.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace tally_reports {

extern "C" {
struct pg_conn;
struct pg_result;
}

using PGconn = pg_conn;
using PGresult = pg_result;
using Oid = unsigned int;

struct LibpqSqlClient::LibpqApi {
    using PQconnectdbFn = PGconn* (*)(const char* conninfo);
    using PQstatusFn = int (*)(const PGconn* conn);
    using PQerrorMessageFn = char* (*)(const PGconn* conn);
    using PQfinishFn = void (*)(PGconn* conn);
    using PQexecParamsFn = PGresult* (*)(PGconn* conn,
                                         const char* command,
                                         int n_params,
                                         const Oid* param_types,
                                         const char* const* param_values,
                                         const int* param_lengths,
                                         const int* param_formats,
                                         int result_format);
    using PQresultStatusFn = int (*)(const PGresult* result);
    using PQresStatusFn = const char* (*)(int status);
    using PQresultErrorMessageFn = char* (*)(const PGresult* result);
    using PQclearFn = void (*)(PGresult* result);
    using PQntuplesFn = int (*)(const PGresult* result);
    using PQnfieldsFn = int (*)(const PGresult* result);
    using PQfnameFn = char* (*)(const PGresult* result, int field_num);
    using PQgetvalueFn = char* (*)(const PGresult* result, int row_num, int field_num);
    using PQgetisnullFn = int (*)(const PGresult* result, int row_num, int field_num);

    bool available{false};
    std::string load_error;
    void* dl_handle{nullptr};

    PQconnectdbFn PQconnectdb{nullptr};
    PQstatusFn PQstatus{nullptr};
    PQerrorMessageFn PQerrorMessage{nullptr};
    PQfinishFn PQfinish{nullptr};
    PQexecParamsFn PQexecParams{nullptr};
    PQresultStatusFn PQresultStatus{nullptr};
    PQresStatusFn PQresStatus{nullptr};
    PQresultErrorMessageFn PQresultErrorMessage{nullptr};
    PQclearFn PQclear{nullptr};
    PQntuplesFn PQntuples{nullptr};
    PQnfieldsFn PQnfields{nullptr};
    PQfnameFn PQfname{nullptr};
    PQgetvalueFn PQgetvalue{nullptr};
    PQgetisnullFn PQgetisnull{nullptr};

    ~LibpqApi() {
        if (dl_handle != nullptr) {
            (void)::dlclose(dl_handle);
        }
    }
};

namespace {

constexpr int kConnectionOk = 0;

template <typename Fn>
bool LoadSymbol(void* handle, const char* name, Fn* out, std::string* error) {
    void* raw = ::dlsym(handle, name);
    if (raw == nullptr) {
        if (error != nullptr) {
            *error = std::string("failed to load symbol ") + name;
        }
        return false;
    }
    *out = reinterpret_cast<Fn>(raw);
    return true;
}

LibpqSqlClient::LibpqApi LoadLibpqApi() {
    LibpqSqlClient::LibpqApi api;
    const char* candidates[] = {"libpq.so.5", "libpq.so"};
    for (const char* lib_name : candidates) {
        api.dl_handle = ::dlopen(lib_name, RTLD_NOW | RTLD_LOCAL);
        if (api.dl_handle != nullptr) {
            break;
        }
    }
    if (api.dl_handle == nullptr) {
        const char* dl_error = ::dlerror();
        api.load_error = dl_error != nullptr ? dl_error : "unable to load libpq";
        return api;
    }

    std::string error;
    if (!LoadSymbol(api.dl_handle, "PQconnectdb", &api.PQconnectdb, &error) ||
        !LoadSymbol(api.dl_handle, "PQstatus", &api.PQstatus, &error) ||
        !LoadSymbol(api.dl_handle, "PQerrorMessage", &api.PQerrorMessage, &error) ||
        !LoadSymbol(api.dl_handle, "PQfinish", &api.PQfinish, &error) ||
        !LoadSymbol(api.dl_handle, "PQexecParams", &api.PQexecParams, &error) ||
        !LoadSymbol(api.dl_handle, "PQresultStatus", &api.PQresultStatus, &error) ||
        !LoadSymbol(api.dl_handle, "PQresStatus", &api.PQresStatus, &error) ||
        !LoadSymbol(api.dl_handle, "PQresultErrorMessage", &api.PQresultErrorMessage, &error) ||
        !LoadSymbol(api.dl_handle, "PQclear", &api.PQclear, &error) ||
        !LoadSymbol(api.dl_handle, "PQntuples", &api.PQntuples, &error) ||
        !LoadSymbol(api.dl_handle, "PQnfields", &api.PQnfields, &error) ||
        !LoadSymbol(api.dl_handle, "PQfname", &api.PQfname, &error) ||
        !LoadSymbol(api.dl_handle, "PQgetvalue", &api.PQgetvalue, &error) ||
        !LoadSymbol(api.dl_handle, "PQgetisnull", &api.PQgetisnull, &error)) {
        api.load_error = error;
        (void)::dlclose(api.dl_handle);
        api.dl_handle = nullptr;
        return api;
    }

    api.available = true;
    return api;
}

std::string ConnOrResultError(const LibpqSqlClient::LibpqApi& api,
                              const PGconn* conn,
                              const PGresult* result,
                              const std::string& fallback) {
    if (result != nullptr) {
        const char* result_error = api.PQresultErrorMessage(result);
        if (result_error != nullptr && *result_error != '\0') {
            return std::string(result_error);
        }
    }
    if (conn != nullptr) {
        const char* conn_error = api.PQerrorMessage(conn);
        if (conn_error != nullptr && *conn_error != '\0') {
            return std::string(conn_error);
        }
    }
    return fallback;
}

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

}  // namespace

LibpqSqlClient::LibpqSqlClient(PostgresConnectionConfig config) : config_(std::move(config)) {}

const LibpqSqlClient::LibpqApi& LibpqSqlClient::Api() {
    static const LibpqApi api = LoadLibpqApi();
    return api;
}

bool LibpqSqlClient::ValidateSimpleIdentifier(const std::string& identifier,
                                              const std::string& field_name,
                                              std::string* error) const {
    if (identifier.empty()) {
        SetError(error, "empty " + field_name + " identifier");
        return false;
    }
    const auto first = static_cast<unsigned char>(identifier.front());
    if (!(std::isalpha(first) || identifier.front() == '_')) {
        SetError(error, "invalid " + field_name + " identifier: " + identifier);
        return false;
    }
    const bool all_valid =
        std::all_of(identifier.begin(), identifier.end(), [](char ch) {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
        });
    if (!all_valid) {
        SetError(error, "invalid " + field_name + " identifier: " + identifier);
        return false;
    }
    return true;
}

std::string LibpqSqlClient::QuoteIdentifier(const std::string& identifier) {
    return "\"" + identifier + "\"";
}

bool LibpqSqlClient::ValidateQualifiedTableIdentifier(const std::string& table_identifier,
                                                      std::string* quoted_identifier,
                                                      std::string* error) const {
    if (quoted_identifier == nullptr) {
        SetError(error, "quoted_identifier is null");
        return false;
    }
    quoted_identifier->clear();

    const auto dot = table_identifier.find('.');
    if (dot == std::string::npos) {
        if (!ValidateSimpleIdentifier(table_identifier, "table", error)) {
            return false;
        }
        *quoted_identifier = QuoteIdentifier(table_identifier);
        return true;
    }
    if (table_identifier.find('.', dot + 1) != std::string::npos) {
        SetError(error, "invalid table identifier: " + table_identifier);
        return false;
    }
    const auto schema = table_identifier.substr(0, dot);
    const auto table = table_identifier.substr(dot + 1);
    if (!ValidateSimpleIdentifier(schema, "table", error) ||
        !ValidateSimpleIdentifier(table, "table", error)) {
        return false;
    }
    *quoted_identifier = QuoteIdentifier(schema) + "." + QuoteIdentifier(table);
    return true;
}

std::string LibpqSqlClient::EscapeConnInfoValue(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '\\' || ch == '\'') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

std::string LibpqSqlClient::BuildConnInfo() const {
    if (!config_.dsn.empty()) {
        return config_.dsn;
    }

    std::ostringstream conn_info;
    const auto append_field = [&conn_info](const std::string& key, const std::string& value) {
        if (!value.empty()) {
            conn_info << key << "='" << EscapeConnInfoValue(value) << "' ";
        }
    };
    append_field("host", config_.host);
    conn_info << "port='" << config_.port << "' ";
    append_field("dbname", config_.database);
    append_field("user", config_.user);
    append_field("password", config_.password);
    append_field("sslmode", config_.ssl_mode);
    append_field("application_name", "tally_reports");
    conn_info << "connect_timeout='" << std::max(1, config_.connect_timeout_ms / 1000) << "'";
    return conn_info.str();
}

bool LibpqSqlClient::Connect(void** out_conn, std::string* error) const {
    if (out_conn == nullptr) {
        SetError(error, "out_conn is null");
        return false;
    }
    *out_conn = nullptr;

    const auto& api = Api();
    if (!api.available) {
        SetError(error, "libpq unavailable: " + api.load_error);
        return false;
    }

    PGconn* conn = api.PQconnectdb(BuildConnInfo().c_str());
    if (conn == nullptr) {
        SetError(error, "PQconnectdb returned null");
        return false;
    }
    if (api.PQstatus(conn) != kConnectionOk) {
        SetError(error, ConnOrResultError(api, conn, nullptr, "PQconnectdb failed"));
        api.PQfinish(conn);
        return false;
    }
    *out_conn = conn;
    return true;
}

bool LibpqSqlClient::IsCommandOk(const LibpqApi& api, void* result_ptr) {
    return ResultStatusText(api, result_ptr) == "PGRES_COMMAND_OK";
}

bool LibpqSqlClient::IsTuplesOk(const LibpqApi& api, void* result_ptr) {
    const auto status = ResultStatusText(api, result_ptr);
    return status == "PGRES_TUPLES_OK" || status == "PGRES_SINGLE_TUPLE";
}

std::string LibpqSqlClient::ResultStatusText(const LibpqApi& api, void* result_ptr) {
    auto* result = static_cast<PGresult*>(result_ptr);
    if (result == nullptr) {
        return "PGRES_NULL";
    }
    const char* status_text = api.PQresStatus(api.PQresultStatus(result));
    if (status_text == nullptr || *status_text == '\0') {
        return "PGRES_UNKNOWN";
    }
    return std::string(status_text);
}

std::vector<SqlRow> LibpqSqlClient::ParseRows(const LibpqApi& api, void* result_ptr) {
    auto* result = static_cast<PGresult*>(result_ptr);
    if (result == nullptr) {
        return {};
    }

    const int rows = std::max(0, api.PQntuples(result));
    const int fields = std::max(0, api.PQnfields(result));
    std::vector<std::string> names;
    names.reserve(static_cast<std::size_t>(fields));
    for (int col = 0; col < fields; ++col) {
        const char* name = api.PQfname(result, col);
        names.emplace_back(name != nullptr ? name : "");
    }

    std::vector<SqlRow> out;
    out.reserve(static_cast<std::size_t>(rows));
    for (int row = 0; row < rows; ++row) {
        SqlRow item;
        for (int col = 0; col < fields; ++col) {
            const auto& name = names[static_cast<std::size_t>(col)];
            if (name.empty() || api.PQgetisnull(result, row, col) != 0) {
                // NULL columns are left out so adapters can tell them apart from ''.
                continue;
            }
            const char* value = api.PQgetvalue(result, row, col);
            item[name] = value != nullptr ? std::string(value) : "";
        }
        out.push_back(std::move(item));
    }
    return out;
}

bool LibpqSqlClient::ExecuteStatement(const std::string& sql,
                                      const std::vector<std::string>& params,
                                      bool expect_tuples,
                                      std::vector<SqlRow>* out_rows,
                                      std::string* error) const {
    void* conn_raw = nullptr;
    if (!Connect(&conn_raw, error)) {
        return false;
    }

    const auto& api = Api();
    auto* conn = static_cast<PGconn*>(conn_raw);
    std::unique_ptr<PGconn, LibpqApi::PQfinishFn> conn_guard(conn, api.PQfinish);

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }
    PGresult* result = api.PQexecParams(conn,
                                        sql.c_str(),
                                        static_cast<int>(values.size()),
                                        nullptr,
                                        values.empty() ? nullptr : values.data(),
                                        nullptr,
                                        nullptr,
                                        0);
    if (result == nullptr) {
        SetError(error, ConnOrResultError(api, conn, nullptr, "PQexecParams failed"));
        return false;
    }

    std::unique_ptr<PGresult, LibpqApi::PQclearFn> result_guard(result, api.PQclear);
    const bool ok = expect_tuples ? IsTuplesOk(api, result) : IsCommandOk(api, result);
    if (!ok) {
        SetError(error,
                 ConnOrResultError(api,
                                   conn,
                                   result,
                                   "unexpected result status: " + ResultStatusText(api, result)));
        return false;
    }

    if (expect_tuples && out_rows != nullptr) {
        *out_rows = ParseRows(api, result);
    }
    return true;
}

bool LibpqSqlClient::InsertRow(const std::string& table, const SqlRow& row, std::string* error) {
    if (row.empty()) {
        SetError(error, "empty row");
        return false;
    }
    std::string sql_table;
    if (!ValidateQualifiedTableIdentifier(table, &sql_table, error)) {
        return false;
    }

    std::vector<std::pair<std::string, std::string>> ordered(row.begin(), row.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });

    std::ostringstream columns;
    std::ostringstream placeholders;
    std::vector<std::string> params;
    params.reserve(ordered.size());
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        if (!ValidateSimpleIdentifier(ordered[i].first, "column", error)) {
            return false;
        }
        if (i > 0) {
            columns << ",";
            placeholders << ",";
        }
        columns << QuoteIdentifier(ordered[i].first);
        placeholders << "$" << (i + 1);
        params.push_back(ordered[i].second);
    }

    const std::string sql = "INSERT INTO " + sql_table + " (" + columns.str() + ") VALUES (" +
                            placeholders.str() + ")";
    return ExecuteStatement(sql, params, false, nullptr, error);
}

std::vector<SqlRow> LibpqSqlClient::QueryRows(const std::string& table,
                                              const std::string& key,
                                              const std::string& value,
                                              std::string* error) const {
    std::string sql_table;
    if (!ValidateQualifiedTableIdentifier(table, &sql_table, error) ||
        !ValidateSimpleIdentifier(key, "column", error)) {
        return {};
    }

    // alterid columns are integers in some export schemas; compare as text.
    std::vector<SqlRow> rows;
    const std::string sql = "SELECT * FROM " + sql_table + " WHERE " + QuoteIdentifier(key) +
                            "::text = $1";
    if (!ExecuteStatement(sql, {value}, true, &rows, error)) {
        return {};
    }
    return rows;
}

std::vector<SqlRow> LibpqSqlClient::QueryAllRows(const std::string& table,
                                                 std::string* error) const {
    std::string sql_table;
    if (!ValidateQualifiedTableIdentifier(table, &sql_table, error)) {
        return {};
    }

    std::vector<SqlRow> rows;
    if (!ExecuteStatement("SELECT * FROM " + sql_table, {}, true, &rows, error)) {
        return {};
    }
    return rows;
}

bool LibpqSqlClient::Ping(std::string* error) const {
    std::vector<SqlRow> rows;
    if (!ExecuteStatement("SELECT 1", {}, true, &rows, error)) {
        return false;
    }
    if (rows.empty()) {
        SetError(error, "SELECT 1 returned no rows");
        return false;
    }
    return true;
}

}  // namespace tally_reports
