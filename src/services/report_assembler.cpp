#include "tally_reports/services/report_assembler.h"

#include <sstream>
#include <utility>

#include "tally_reports/apps/cli_support.h"
#include "tally_reports/core/fixed_decimal.h"

namespace tally_reports {
namespace {

using tally_reports::apps::JsonEscape;

std::string Quoted(const std::string& text) { return "\"" + JsonEscape(text) + "\""; }

const char* Bool(bool value) { return value ? "true" : "false"; }

void WriteInconsistencies(const std::vector<Inconsistency>& items,
                          const std::string& indent,
                          std::ostringstream* json) {
    auto& out = *json;
    out << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        out << (i == 0 ? "\n" : ",\n") << indent << "  {"
            << "\"kind\": " << Quoted(InconsistencyKindName(item.kind))
            << ", \"ledger_name\": " << Quoted(item.ledger_name)
            << ", \"voucher_id\": " << Quoted(item.voucher_id)
            << ", \"bill_ref\": " << Quoted(item.bill_ref)
            << ", \"amount\": " << ReportAssembler::FormatAmount(item.amount)
            << ", \"detail\": " << Quoted(item.detail) << "}";
    }
    if (!items.empty()) {
        out << "\n" << indent;
    }
    out << "]";
}

void WriteStringList(const std::vector<std::string>& items, std::ostringstream* json) {
    auto& out = *json;
    out << "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << Quoted(items[i]);
    }
    out << "]";
}

}  // namespace

std::string ReportAssembler::FormatAmount(Amount amount) {
    return FixedDecimal::FormatScaled(amount, kAmountScale);
}

LedgerStatement ReportAssembler::AssembleLedgerStatement(const LoadedLedger& loaded,
                                                         const RunningBalanceResult& balances,
                                                         const CalendarDate& from_date,
                                                         const CalendarDate& to_date) {
    LedgerStatement statement;
    statement.company_name = loaded.company.name;
    statement.ledger_name = loaded.ledger_name;
    statement.from_date = from_date;
    statement.to_date = to_date;
    statement.opening_balance = loaded.opening_balance;
    statement.opening_balance_side =
        RunningBalanceCalculator::SideFor(loaded.opening_balance, loaded.nature);
    statement.total_debit = balances.total_debit;
    statement.total_credit = balances.total_credit;
    statement.closing_balance = balances.closing_balance;
    statement.closing_balance_side =
        RunningBalanceCalculator::SideFor(balances.closing_balance, loaded.nature);
    statement.net_movement = balances.total_debit - balances.total_credit;
    statement.total_transactions = static_cast<int>(balances.rows.size());
    statement.transactions = balances.rows;
    statement.inconsistencies = loaded.inconsistencies;
    return statement;
}

std::string ReportAssembler::LedgerStatementToJson(const LedgerStatement& statement) {
    std::ostringstream json;
    json << "{\n"
         << "  \"company_name\": " << Quoted(statement.company_name) << ",\n"
         << "  \"ledger_name\": " << Quoted(statement.ledger_name) << ",\n"
         << "  \"from_date\": " << Quoted(statement.from_date.ToIso()) << ",\n"
         << "  \"to_date\": " << Quoted(statement.to_date.ToIso()) << ",\n"
         << "  \"opening_balance\": " << FormatAmount(statement.opening_balance) << ",\n"
         << "  \"opening_balance_side\": "
         << Quoted(BalanceSideName(statement.opening_balance_side)) << ",\n"
         << "  \"total_debit\": " << FormatAmount(statement.total_debit) << ",\n"
         << "  \"total_credit\": " << FormatAmount(statement.total_credit) << ",\n"
         << "  \"closing_balance\": " << FormatAmount(statement.closing_balance) << ",\n"
         << "  \"closing_balance_side\": "
         << Quoted(BalanceSideName(statement.closing_balance_side)) << ",\n"
         << "  \"net_movement\": " << FormatAmount(statement.net_movement) << ",\n"
         << "  \"total_transactions\": " << statement.total_transactions << ",\n"
         << "  \"transactions\": [";

    for (std::size_t i = 0; i < statement.transactions.size(); ++i) {
        const auto& row = statement.transactions[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"date\": " << Quoted(row.date.ToIso())
             << ", \"voucher_id\": " << Quoted(row.voucher_id)
             << ", \"particulars\": " << Quoted(row.particulars)
             << ", \"voucher_type\": " << Quoted(row.voucher_type)
             << ", \"voucher_number\": " << Quoted(row.voucher_number)
             << ", \"narration\": " << Quoted(row.narration)
             << ", \"debit\": " << FormatAmount(row.debit)
             << ", \"credit\": " << FormatAmount(row.credit)
             << ", \"balance\": " << FormatAmount(row.balance)
             << ", \"balance_side\": " << Quoted(BalanceSideName(row.balance_side)) << "}";
    }
    if (!statement.transactions.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"inconsistencies\": ";
    WriteInconsistencies(statement.inconsistencies, "  ", &json);
    json << "\n}\n";
    return json.str();
}

std::string ReportAssembler::OutstandingReportToJson(const OutstandingReport& report) {
    std::ostringstream json;
    json << "{\n"
         << "  \"company_name\": " << Quoted(report.company_name) << ",\n"
         << "  \"report_type\": " << Quoted(OutstandingScopeName(report.report_type)) << ",\n"
         << "  \"as_on_date\": " << Quoted(report.as_on_date.ToIso()) << ",\n"
         << "  \"count\": " << report.count << ",\n"
         << "  \"total_outstanding_receivables\": "
         << FormatAmount(report.total_outstanding_receivables) << ",\n"
         << "  \"total_outstanding_payables\": "
         << FormatAmount(report.total_outstanding_payables) << ",\n"
         << "  \"ledger_count\": " << report.ledger_count << ",\n"
         << "  \"data\": [";

    for (std::size_t i = 0; i < report.data.size(); ++i) {
        const auto& row = report.data[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"ledger_name\": " << Quoted(row.ledger_name)
             << ", \"bill_ref\": " << Quoted(row.bill_ref)
             << ", \"bill_date\": " << Quoted(row.bill_date.ToIso())
             << ", \"bill_type\": " << Quoted(row.bill_type)
             << ", \"voucher_type\": " << Quoted(row.voucher_type)
             << ", \"voucher_no\": " << Quoted(row.voucher_no)
             << ", \"outstanding_amount\": " << FormatAmount(row.outstanding_amount)
             << ", \"balance\": " << FormatAmount(row.balance)
             << ", \"is_receivable\": " << Bool(row.is_receivable)
             << ", \"due_date\": " << Quoted(row.due_date.ToIso())
             << ", \"overdue_days\": " << row.overdue_days
             << ", \"ageing_bucket\": " << Quoted(AgeingBucketLabel(row.ageing_bucket)) << "}";
    }
    if (!report.data.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"ledgers\": [";
    for (std::size_t i = 0; i < report.ledgers.size(); ++i) {
        const auto& subtotal = report.ledgers[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"ledger_name\": " << Quoted(subtotal.ledger_name)
             << ", \"receivable_total\": " << FormatAmount(subtotal.receivable_total)
             << ", \"payable_total\": " << FormatAmount(subtotal.payable_total)
             << ", \"open_bill_count\": " << subtotal.open_bill_count
             << ", \"on_account_balance\": " << FormatAmount(subtotal.on_account_balance) << "}";
    }
    if (!report.ledgers.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"parties\": [";
    for (std::size_t i = 0; i < report.parties.size(); ++i) {
        const auto& party = report.parties[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"ledger_name\": " << Quoted(party.ledger_name)
             << ", \"total_debit\": " << FormatAmount(party.total_debit)
             << ", \"total_credit\": " << FormatAmount(party.total_credit)
             << ", \"balance\": " << FormatAmount(party.balance)
             << ", \"transaction_count\": " << party.transaction_count
             << ", \"first_transaction\": " << Quoted(party.first_transaction.ToIso())
             << ", \"last_transaction\": " << Quoted(party.last_transaction.ToIso()) << "}";
    }
    if (!report.parties.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"ageing\": [";
    for (std::size_t i = 0; i < report.ageing.size(); ++i) {
        const auto& bucket = report.ageing[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"bucket\": " << Quoted(AgeingBucketLabel(bucket.bucket))
             << ", \"receivables\": " << FormatAmount(bucket.receivables)
             << ", \"payables\": " << FormatAmount(bucket.payables)
             << ", \"bill_count\": " << bucket.bill_count << "}";
    }
    if (!report.ageing.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"on_account\": [";
    for (std::size_t i = 0; i < report.on_account.size(); ++i) {
        const auto& entry = report.on_account[i];
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"ledger_name\": " << Quoted(entry.ledger_name)
             << ", \"voucher_id\": " << Quoted(entry.voucher_id)
             << ", \"date\": " << Quoted(entry.date.ToIso())
             << ", \"amount\": " << FormatAmount(entry.amount)
             << ", \"bill_ref\": " << Quoted(entry.bill_ref) << "}";
    }
    if (!report.on_account.empty()) {
        json << "\n  ";
    }
    json << "],\n"
         << "  \"inconsistencies\": ";
    WriteInconsistencies(report.inconsistencies, "  ", &json);
    json << "\n}\n";
    return json.str();
}

std::string ReportAssembler::LedgerListToJson(const CompanyRecord& company,
                                              const std::vector<LedgerListEntry>& ledgers) {
    std::ostringstream json;
    json << "{\n"
         << "  \"company_name\": " << Quoted(company.name) << ",\n"
         << "  \"count\": " << ledgers.size() << ",\n"
         << "  \"ledgers\": [";
    for (std::size_t i = 0; i < ledgers.size(); ++i) {
        json << (i == 0 ? "\n" : ",\n") << "    {"
             << "\"ledger_name\": " << Quoted(ledgers[i].ledger_name)
             << ", \"leg_count\": " << ledgers[i].leg_count << "}";
    }
    if (!ledgers.empty()) {
        json << "\n  ";
    }
    json << "]\n}\n";
    return json.str();
}

std::string ReportAssembler::ErrorToJson(const ReportError& error) {
    std::ostringstream json;
    json << "{\n"
         << "  \"error\": " << Quoted(ReportErrorKindName(error.kind)) << ",\n"
         << "  \"message\": " << Quoted(error.message) << ",\n"
         << "  \"company\": " << Quoted(error.company) << ",\n"
         << "  \"ledger\": " << Quoted(error.ledger) << ",\n"
         << "  \"from_date\": " << Quoted(error.from_date) << ",\n"
         << "  \"to_date\": " << Quoted(error.to_date) << ",\n"
         << "  \"voucher_ids\": ";
    WriteStringList(error.voucher_ids, &json);
    json << ",\n"
         << "  \"bill_refs\": ";
    WriteStringList(error.bill_refs, &json);
    json << "\n}\n";
    return json.str();
}

}  // namespace tally_reports
