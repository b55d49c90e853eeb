#include "tally_reports/core/fixture_loader.h"

#include <fstream>
#include <sstream>

#include "tally_reports/core/simple_json.h"

namespace tally_reports {
namespace {

bool InsertSection(const simple_json::Value& root,
                   const std::string& section,
                   const std::string& table,
                   ISqlClient* client,
                   std::string* error) {
    const auto* rows = root.Find(section);
    if (rows == nullptr || rows->IsNull()) {
        return true;
    }
    if (!rows->IsArray()) {
        if (error != nullptr) {
            *error = "fixture section is not an array: " + section;
        }
        return false;
    }
    std::size_t index = 0;
    for (const auto& item : rows->array_value) {
        if (!item.IsObject()) {
            if (error != nullptr) {
                *error = "fixture " + section + "[" + std::to_string(index) + "] is not an object";
            }
            return false;
        }
        SqlRow row;
        for (const auto& [key, value] : item.object_value) {
            if (value.IsNull() || value.IsObject() || value.IsArray()) {
                continue;
            }
            row[key] = value.ToString();
        }
        std::string insert_error;
        if (!client->InsertRow(table, row, &insert_error)) {
            if (error != nullptr) {
                *error = "fixture " + section + "[" + std::to_string(index) +
                         "] insert failed: " + insert_error;
            }
            return false;
        }
        ++index;
    }
    return true;
}

}  // namespace

bool FixtureLoader::LoadFromText(const std::string& text,
                                 const VoucherStoreTables& tables,
                                 ISqlClient* client,
                                 std::string* error) {
    if (client == nullptr) {
        if (error != nullptr) {
            *error = "null sql client";
        }
        return false;
    }
    simple_json::Value root;
    if (!simple_json::Parse(text, &root, error)) {
        return false;
    }
    if (!root.IsObject()) {
        if (error != nullptr) {
            *error = "fixture root must be an object";
        }
        return false;
    }
    if (!InsertSection(root, "companies", tables.Qualified(tables.companies), client, error) ||
        !InsertSection(root, "vouchers", tables.Qualified(tables.vouchers), client, error)) {
        return false;
    }
    if (tables.ledgers.empty()) {
        return true;
    }
    return InsertSection(root, "ledgers", tables.Qualified(tables.ledgers), client, error);
}

bool FixtureLoader::LoadFromFile(const std::string& path,
                                 const VoucherStoreTables& tables,
                                 ISqlClient* client,
                                 std::string* error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open fixture: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return LoadFromText(buffer.str(), tables, client, error);
}

}  // namespace tally_reports
