#include "tally_reports/core/voucher_store_client_adapter.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "tally_reports/core/fixed_decimal.h"

namespace tally_reports {
namespace {

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Returns the trimmed column value, or empty when the column is absent or NULL.
std::string Field(const SqlRow& row, const char* key) {
    if (const auto it = row.find(key); it != row.end()) {
        return Trim(it->second);
    }
    return "";
}

bool ParseBool(const std::string& raw) {
    const auto lowered = Lowercase(raw);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on" ||
           lowered == "t";
}

bool ParseInt(const std::string& raw, int* out) {
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(raw, &consumed);
        if (consumed != raw.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseAmount(const std::string& raw, Amount* out, std::string* reason) {
    std::string parse_error;
    if (!FixedDecimal::ParseScaled(raw, kAmountScale, FixedRoundingMode::kHalfUp, out,
                                   &parse_error)) {
        if (reason != nullptr) {
            *reason = parse_error;
        }
        return false;
    }
    return true;
}

bool ParseOptionalDate(const SqlRow& row,
                       const char* key,
                       std::optional<CalendarDate>* out,
                       std::string* reason) {
    const auto raw = Field(row, key);
    if (raw.empty()) {
        return true;
    }
    CalendarDate date;
    if (!CalendarDate::Parse(raw, &date)) {
        if (reason != nullptr) {
            *reason = std::string("invalid ") + key + ": " + raw;
        }
        return false;
    }
    *out = date;
    return true;
}

bool ParseOptionalInt(const SqlRow& row,
                      const char* key,
                      std::optional<int>* out,
                      std::string* reason) {
    const auto raw = Field(row, key);
    if (raw.empty()) {
        return true;
    }
    int value = 0;
    if (!ParseInt(raw, &value)) {
        if (reason != nullptr) {
            *reason = std::string("invalid ") + key + ": " + raw;
        }
        return false;
    }
    *out = value;
    return true;
}

bool MatchesCompany(const SqlRow& row, const CompanyRef& company) {
    return Field(row, "company_alterid") == Trim(company.alterid);
}

}  // namespace

std::string VoucherStoreTables::Qualified(const std::string& table) const {
    if (schema.empty()) {
        return table;
    }
    return schema + "." + table;
}

VoucherStoreClientAdapter::VoucherStoreClientAdapter(std::shared_ptr<ISqlClient> client,
                                                     StorageRetryPolicy retry_policy,
                                                     VoucherStoreTables tables)
    : client_(std::move(client)), retry_policy_(retry_policy), tables_(std::move(tables)) {}

LedgerNature VoucherStoreClientAdapter::ParseLedgerNature(const std::string& raw) {
    const auto value = Lowercase(Trim(raw));
    if (value.empty()) {
        return LedgerNature::kUnknown;
    }
    if (value == "debit" || value == "dr" || value == "assets" || value == "asset" ||
        value == "expenses" || value == "expense" || value.find("debtor") != std::string::npos) {
        return LedgerNature::kDebit;
    }
    if (value == "credit" || value == "cr" || value == "liabilities" || value == "liability" ||
        value == "income" || value.find("creditor") != std::string::npos) {
        return LedgerNature::kCredit;
    }
    return LedgerNature::kUnknown;
}

bool VoucherStoreClientAdapter::QueryWithRetry(const std::string& table,
                                               const std::string& key,
                                               const std::string& value,
                                               std::vector<SqlRow>* out,
                                               std::string* error) const {
    if (client_ == nullptr) {
        if (error != nullptr) {
            *error = "null sql client";
        }
        return false;
    }
    const int attempts = std::max(1, retry_policy_.max_attempts);
    int backoff_ms = std::max(0, retry_policy_.initial_backoff_ms);
    const int max_backoff_ms = std::max(backoff_ms, retry_policy_.max_backoff_ms);

    std::string last_error;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::string local_error;
        auto rows = client_->QueryRows(tables_.Qualified(table), key, value, &local_error);
        if (local_error.empty()) {
            *out = std::move(rows);
            return true;
        }
        last_error = local_error;
        if (attempt < attempts && backoff_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(max_backoff_ms, backoff_ms * 2);
        }
    }

    if (error != nullptr) {
        *error = "query " + table + " failed: " + last_error;
    }
    return false;
}

bool VoucherStoreClientAdapter::GetCompany(const CompanyRef& company,
                                           CompanyRecord* out,
                                           bool* found,
                                           std::string* error) const {
    if (out == nullptr || found == nullptr) {
        if (error != nullptr) {
            *error = "output pointer is null";
        }
        return false;
    }
    *found = false;
    std::vector<SqlRow> rows;
    if (!QueryWithRetry(tables_.companies, "guid", Trim(company.guid), &rows, error)) {
        return false;
    }
    for (const auto& row : rows) {
        if (Field(row, "alterid") != Trim(company.alterid)) {
            continue;
        }
        out->ref.guid = Trim(company.guid);
        out->ref.alterid = Trim(company.alterid);
        out->name = Field(row, "name");
        *found = true;
        return true;
    }
    return true;
}

bool VoucherStoreClientAdapter::LoadLedgerMasters(const CompanyRef& company,
                                                  std::vector<LedgerMaster>* out,
                                                  std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output ledgers pointer is null";
        }
        return false;
    }
    out->clear();
    if (tables_.ledgers.empty()) {
        return true;
    }
    std::vector<SqlRow> rows;
    if (!QueryWithRetry(tables_.ledgers, "company_guid", Trim(company.guid), &rows, error)) {
        return false;
    }
    for (const auto& row : rows) {
        if (!MatchesCompany(row, company)) {
            continue;
        }
        LedgerMaster master;
        master.name = Field(row, "name");
        if (master.name.empty()) {
            continue;
        }
        master.parent_group = Field(row, "parent");
        master.nature = ParseLedgerNature(Field(row, "nature"));
        if (master.nature == LedgerNature::kUnknown) {
            master.nature = ParseLedgerNature(master.parent_group);
        }
        std::string reason;
        if (const auto opening = Field(row, "opening_balance"); !opening.empty()) {
            if (!ParseAmount(opening, &master.opening_balance, &reason)) {
                if (error != nullptr) {
                    *error = "ledger " + master.name + " opening_balance: " + reason;
                }
                return false;
            }
        }
        if (!ParseOptionalDate(row, "opening_date", &master.opening_date, &reason) ||
            !ParseOptionalInt(row, "credit_period_days", &master.credit_period_days, &reason)) {
            if (error != nullptr) {
                *error = "ledger " + master.name + ": " + reason;
            }
            return false;
        }
        master.is_bill_wise = ParseBool(Field(row, "is_bill_wise"));
        out->push_back(std::move(master));
    }
    return true;
}

bool VoucherStoreClientAdapter::ParseLegRow(const SqlRow& row,
                                            std::int64_t fallback_row_id,
                                            LegRecord* out,
                                            std::string* reason) {
    LegRecord leg;
    const auto raw_date = Field(row, "vch_date");
    leg.voucher_number = Field(row, "vch_no");
    leg.voucher_id = Field(row, "vch_mst_id");
    if (leg.voucher_id.empty()) {
        leg.voucher_id = raw_date + "|" + leg.voucher_number;
    }
    leg.row_id = fallback_row_id;
    if (const auto id = Field(row, "id"); !id.empty()) {
        try {
            leg.row_id = std::stoll(id);
        } catch (const std::exception&) {
            leg.row_id = fallback_row_id;
        }
    }
    if (!CalendarDate::Parse(raw_date, &leg.date)) {
        *reason = "invalid vch_date: " + raw_date;
        return false;
    }
    leg.voucher_type = Field(row, "vch_type");
    leg.sort_key = leg.voucher_number;
    leg.ledger_name = Field(row, "led_name");
    if (leg.ledger_name.empty()) {
        *reason = "missing led_name";
        return false;
    }
    leg.party_name = Field(row, "vch_party_name");
    leg.narration = Field(row, "vch_narration");

    const auto dr_text = Field(row, "vch_dr_amt");
    const auto cr_text = Field(row, "vch_cr_amt");
    const auto led_amount_text = Field(row, "led_amount");
    if (!dr_text.empty() || !cr_text.empty()) {
        Amount debit = 0;
        Amount credit = 0;
        if ((!dr_text.empty() && !ParseAmount(dr_text, &debit, reason)) ||
            (!cr_text.empty() && !ParseAmount(cr_text, &credit, reason))) {
            return false;
        }
        leg.amount = debit - credit;
    } else if (!led_amount_text.empty()) {
        Amount amount = 0;
        if (!ParseAmount(led_amount_text, &amount, reason)) {
            return false;
        }
        const auto dr_cr = Lowercase(Field(row, "vch_dr_cr"));
        const Amount magnitude = amount < 0 ? -amount : amount;
        if (dr_cr == "dr" || dr_cr == "debit") {
            leg.amount = magnitude;
        } else if (dr_cr == "cr" || dr_cr == "credit") {
            leg.amount = -magnitude;
        } else {
            leg.amount = amount;
        }
    } else {
        *reason = "missing amount";
        return false;
    }

    leg.bill_reference = Field(row, "vch_led_bill_ref");
    leg.bill_type = Field(row, "vch_led_bill_type");
    if (!ParseOptionalDate(row, "vch_led_bill_date", &leg.bill_date, reason) ||
        !ParseOptionalDate(row, "vch_led_due_date", &leg.due_date, reason) ||
        !ParseOptionalInt(row, "vch_led_credit_period", &leg.credit_period_days, reason)) {
        return false;
    }

    leg.ledger_nature = ParseLedgerNature(Field(row, "vch_led_bs_grp_nature"));
    if (leg.ledger_nature == LedgerNature::kUnknown) {
        leg.ledger_nature = ParseLedgerNature(Field(row, "vch_led_nature"));
    }
    if (leg.ledger_nature == LedgerNature::kUnknown) {
        leg.ledger_nature = ParseLedgerNature(Field(row, "vch_led_primary_grp"));
    }
    *out = std::move(leg);
    return true;
}

bool VoucherStoreClientAdapter::LoadCompanyLegs(const CompanyRef& company,
                                                std::vector<LegRecord>* out,
                                                std::vector<MalformedRow>* malformed,
                                                std::string* error) const {
    if (out == nullptr || malformed == nullptr) {
        if (error != nullptr) {
            *error = "output legs pointer is null";
        }
        return false;
    }
    out->clear();
    malformed->clear();

    std::vector<SqlRow> rows;
    if (!QueryWithRetry(tables_.vouchers, "company_guid", Trim(company.guid), &rows, error)) {
        return false;
    }
    out->reserve(rows.size());
    std::int64_t ordinal = 0;
    for (const auto& row : rows) {
        ++ordinal;
        if (!MatchesCompany(row, company)) {
            continue;
        }
        LegRecord leg;
        std::string reason;
        if (!ParseLegRow(row, ordinal, &leg, &reason)) {
            auto voucher_id = Field(row, "vch_mst_id");
            if (voucher_id.empty()) {
                voucher_id = Field(row, "vch_date") + "|" + Field(row, "vch_no");
            }
            malformed->push_back(MalformedRow{voucher_id, reason});
            continue;
        }
        out->push_back(std::move(leg));
    }
    return true;
}

}  // namespace tally_reports
