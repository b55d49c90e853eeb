#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tally_reports/core/simple_json.h"
#include "tally_reports/services/report_assembler.h"

namespace tally_reports {

namespace {

CalendarDate Day(const std::string& iso) {
    CalendarDate date;
    EXPECT_TRUE(CalendarDate::Parse(iso, &date));
    return date;
}

simple_json::Value ParseJson(const std::string& text) {
    simple_json::Value root;
    std::string error;
    EXPECT_TRUE(simple_json::Parse(text, &root, &error)) << error << "\n" << text;
    return root;
}

}  // namespace

TEST(ReportAssemblerTest, AssemblesStatementSidesFromNature) {
    LoadedLedger loaded;
    loaded.company.name = "Acme Books";
    loaded.ledger_name = "Capital";
    loaded.nature = LedgerNature::kCredit;
    loaded.opening_balance = 0;

    RunningBalanceResult balances;
    balances.total_debit = 1000;
    balances.total_credit = 4000;
    balances.closing_balance = -3000;
    balances.rows.resize(2);

    const auto statement =
        ReportAssembler::AssembleLedgerStatement(loaded, balances, Day("2024-04-01"),
                                                 Day("2025-03-31"));
    EXPECT_EQ(statement.company_name, "Acme Books");
    EXPECT_EQ(statement.opening_balance_side, BalanceSide::kCredit);
    EXPECT_EQ(statement.closing_balance_side, BalanceSide::kCredit);
    EXPECT_EQ(statement.net_movement, -3000);
    EXPECT_EQ(statement.total_transactions, 2);
    EXPECT_EQ(statement.to_date.ToIso(), "2025-03-31");
}

TEST(ReportAssemblerTest, LedgerStatementJsonCarriesDecimalAmounts) {
    LedgerStatement statement;
    statement.company_name = "Acme \"Books\"";
    statement.ledger_name = "Acme Traders";
    statement.from_date = Day("2024-04-01");
    statement.to_date = Day("2024-04-30");
    statement.opening_balance = -1250;
    statement.opening_balance_side = BalanceSide::kCredit;
    statement.total_debit = 100000;
    statement.closing_balance = 98750;
    statement.net_movement = 100000;
    statement.total_transactions = 1;
    LedgerStatementRow row;
    row.date = Day("2024-04-10");
    row.voucher_id = "S1";
    row.particulars = "Sales";
    row.narration = "line\nbreak";
    row.debit = 100000;
    row.balance = 98750;
    statement.transactions.push_back(row);

    const auto root = ParseJson(ReportAssembler::LedgerStatementToJson(statement));
    ASSERT_TRUE(root.IsObject());
    EXPECT_EQ(root.Find("company_name")->string_value, "Acme \"Books\"");
    EXPECT_EQ(root.Find("opening_balance")->number_text, "-12.50");
    EXPECT_EQ(root.Find("opening_balance_side")->string_value, "Cr");
    EXPECT_EQ(root.Find("from_date")->string_value, "2024-04-01");
    const auto* rows = root.Find("transactions");
    ASSERT_NE(rows, nullptr);
    ASSERT_EQ(rows->array_value.size(), 1U);
    EXPECT_EQ(rows->array_value[0].Find("debit")->number_text, "1000.00");
    EXPECT_EQ(rows->array_value[0].Find("credit")->number_text, "0.00");
    EXPECT_EQ(rows->array_value[0].Find("narration")->string_value, "line\nbreak");
    EXPECT_TRUE(root.Find("inconsistencies")->array_value.empty());
}

TEST(ReportAssemblerTest, OutstandingJsonListsEverySection) {
    OutstandingReport report;
    report.company_name = "Acme Books";
    report.as_on_date = Day("2024-04-30");
    report.count = 1;
    report.total_outstanding_receivables = 20000;
    report.ledger_count = 1;
    OutstandingRow row;
    row.ledger_name = "Acme Traders";
    row.bill_ref = "INV-2";
    row.bill_date = Day("2024-04-10");
    row.outstanding_amount = 20000;
    row.balance = 20000;
    row.is_receivable = true;
    row.due_date = Day("2024-04-10");
    row.overdue_days = 20;
    report.data.push_back(row);
    report.ageing.resize(4);
    report.ageing[3].bucket = AgeingBucket::kOver90;
    Inconsistency item;
    item.kind = InconsistencyKind::kUnknownBillReference;
    item.bill_ref = "INV-9";
    item.amount = -500;
    report.inconsistencies.push_back(item);

    const auto root = ParseJson(ReportAssembler::OutstandingReportToJson(report));
    EXPECT_EQ(root.Find("report_type")->string_value, "both");
    EXPECT_EQ(root.Find("total_outstanding_receivables")->number_text, "200.00");
    const auto& data = root.Find("data")->array_value;
    ASSERT_EQ(data.size(), 1U);
    EXPECT_TRUE(data[0].Find("is_receivable")->bool_value);
    EXPECT_EQ(data[0].Find("ageing_bucket")->string_value, "0-30");
    EXPECT_EQ(data[0].Find("overdue_days")->number_text, "20");
    EXPECT_EQ(root.Find("ageing")->array_value.size(), 4U);
    EXPECT_EQ(root.Find("ageing")->array_value[3].Find("bucket")->string_value, ">90");
    const auto& issues = root.Find("inconsistencies")->array_value;
    ASSERT_EQ(issues.size(), 1U);
    EXPECT_EQ(issues[0].Find("kind")->string_value, "unknown_bill_reference");
    EXPECT_EQ(issues[0].Find("amount")->number_text, "-5.00");
    EXPECT_TRUE(root.Find("on_account")->array_value.empty());
}

TEST(ReportAssemblerTest, LedgerListAndErrorJson) {
    CompanyRecord company;
    company.name = "Acme Books";
    const auto list = ParseJson(
        ReportAssembler::LedgerListToJson(company, {LedgerListEntry{"Cash", 3}}));
    EXPECT_EQ(list.Find("count")->number_text, "1");
    EXPECT_EQ(list.Find("ledgers")->array_value[0].Find("leg_count")->number_text, "3");

    ReportError error;
    error.kind = ReportErrorKind::kInvalidRange;
    error.message = "from_date is after to_date";
    error.ledger = "Cash";
    error.voucher_ids = {"V1"};
    const auto root = ParseJson(ReportAssembler::ErrorToJson(error));
    EXPECT_EQ(root.Find("error")->string_value, "invalid_range");
    EXPECT_EQ(root.Find("ledger")->string_value, "Cash");
    ASSERT_EQ(root.Find("voucher_ids")->array_value.size(), 1U);
    EXPECT_TRUE(root.Find("bill_refs")->array_value.empty());
}

TEST(ReportAssemblerTest, FormatsAmountsWithTwoPlaces) {
    EXPECT_EQ(ReportAssembler::FormatAmount(0), "0.00");
    EXPECT_EQ(ReportAssembler::FormatAmount(-7), "-0.07");
    EXPECT_EQ(ReportAssembler::FormatAmount(123456789), "1234567.89");
}

}  // namespace tally_reports
