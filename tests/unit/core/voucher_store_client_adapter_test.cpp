#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tally_reports/core/sql_client.h"
#include "tally_reports/core/voucher_store_client_adapter.h"

namespace tally_reports {

namespace {

class FlakySqlClient : public InMemorySqlClient {
public:
    explicit FlakySqlClient(int fail_times) : fail_times_(fail_times) {}

    std::vector<SqlRow> QueryRows(const std::string& table,
                                  const std::string& key,
                                  const std::string& value,
                                  std::string* error) const override {
        ++query_calls_;
        if (query_calls_ <= fail_times_) {
            if (error != nullptr) {
                *error = "connection reset";
            }
            return {};
        }
        return InMemorySqlClient::QueryRows(table, key, value, error);
    }

    int query_calls() const { return query_calls_; }

private:
    int fail_times_{0};
    mutable int query_calls_{0};
};

StorageRetryPolicy NoBackoff(int attempts) {
    StorageRetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_backoff_ms = 0;
    policy.max_backoff_ms = 0;
    return policy;
}

SqlRow VoucherRow(const std::string& id, const std::string& vch_no, const std::string& ledger) {
    return SqlRow{{"company_guid", "g1"}, {"company_alterid", "7"}, {"id", id},
                  {"vch_mst_id", "V" + vch_no}, {"vch_no", vch_no}, {"vch_date", "10-04-2024"},
                  {"vch_type", "Sales"}, {"led_name", ledger}};
}

}  // namespace

TEST(VoucherStoreClientAdapterTest, FindsCompanyByGuidAndAlterid) {
    auto client = std::make_shared<InMemorySqlClient>();
    std::string error;
    ASSERT_TRUE(client->InsertRow("tally.companies",
                                  SqlRow{{"guid", "g1"}, {"alterid", "6"}, {"name", "Old"}},
                                  &error));
    ASSERT_TRUE(client->InsertRow("tally.companies",
                                  SqlRow{{"guid", "g1"}, {"alterid", "7"}, {"name", "Acme"}},
                                  &error));
    VoucherStoreTables tables;
    tables.schema = "tally";
    VoucherStoreClientAdapter adapter(client, NoBackoff(1), tables);

    CompanyRecord company;
    bool found = false;
    ASSERT_TRUE(adapter.GetCompany(CompanyRef{" g1 ", "7"}, &company, &found, &error));
    EXPECT_TRUE(found);
    EXPECT_EQ(company.name, "Acme");
    EXPECT_EQ(company.ref.guid, "g1");

    ASSERT_TRUE(adapter.GetCompany(CompanyRef{"g1", "8"}, &company, &found, &error));
    EXPECT_FALSE(found);
}

TEST(VoucherStoreClientAdapterTest, DecodesDebitCreditColumnsAndBillFields) {
    auto client = std::make_shared<InMemorySqlClient>();
    std::string error;
    auto sale = VoucherRow("11", "1", "Acme Traders");
    sale["vch_dr_amt"] = "1,000.00";
    sale["vch_led_bill_ref"] = "INV-1";
    sale["vch_led_bill_type"] = "New Ref";
    sale["vch_led_credit_period"] = "30";
    sale["vch_led_bs_grp_nature"] = "Assets";
    ASSERT_TRUE(client->InsertRow("vouchers", sale, &error));

    auto income = VoucherRow("12", "1", "Sales Account");
    income["led_amount"] = "1000";
    income["vch_dr_cr"] = "Cr";
    income["vch_led_primary_grp"] = "Income";
    ASSERT_TRUE(client->InsertRow("vouchers", income, &error));

    auto other_company = VoucherRow("13", "2", "Cash");
    other_company["company_alterid"] = "9";
    other_company["vch_dr_amt"] = "5";
    ASSERT_TRUE(client->InsertRow("vouchers", other_company, &error));

    VoucherStoreClientAdapter adapter(client, NoBackoff(1), VoucherStoreTables{});
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    ASSERT_TRUE(adapter.LoadCompanyLegs(CompanyRef{"g1", "7"}, &legs, &malformed, &error));
    ASSERT_EQ(legs.size(), 2U);
    EXPECT_TRUE(malformed.empty());

    EXPECT_EQ(legs[0].voucher_id, "V1");
    EXPECT_EQ(legs[0].row_id, 11);
    EXPECT_EQ(legs[0].date.ToIso(), "2024-04-10");
    EXPECT_EQ(legs[0].amount, 100000);
    EXPECT_EQ(legs[0].bill_reference, "INV-1");
    ASSERT_TRUE(legs[0].credit_period_days.has_value());
    EXPECT_EQ(*legs[0].credit_period_days, 30);
    EXPECT_EQ(legs[0].ledger_nature, LedgerNature::kDebit);

    EXPECT_EQ(legs[1].amount, -100000);
    EXPECT_EQ(legs[1].ledger_nature, LedgerNature::kCredit);
}

TEST(VoucherStoreClientAdapterTest, ReportsUndecodableRowsAsMalformed) {
    auto client = std::make_shared<InMemorySqlClient>();
    std::string error;
    auto bad_date = VoucherRow("1", "1", "Cash");
    bad_date["vch_date"] = "31-02-2024";
    bad_date["vch_dr_amt"] = "10";
    ASSERT_TRUE(client->InsertRow("vouchers", bad_date, &error));
    auto no_amount = VoucherRow("2", "2", "Cash");
    ASSERT_TRUE(client->InsertRow("vouchers", no_amount, &error));
    auto bad_amount = VoucherRow("3", "3", "Cash");
    bad_amount["vch_cr_amt"] = "12x";
    ASSERT_TRUE(client->InsertRow("vouchers", bad_amount, &error));

    VoucherStoreClientAdapter adapter(client, NoBackoff(1), VoucherStoreTables{});
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    ASSERT_TRUE(adapter.LoadCompanyLegs(CompanyRef{"g1", "7"}, &legs, &malformed, &error));
    EXPECT_TRUE(legs.empty());
    ASSERT_EQ(malformed.size(), 3U);
    EXPECT_EQ(malformed[0].voucher_id, "V1");
    EXPECT_NE(malformed[0].reason.find("vch_date"), std::string::npos);
    EXPECT_EQ(malformed[1].reason, "missing amount");
    EXPECT_NE(malformed[2].reason.find("invalid decimal"), std::string::npos);
}

TEST(VoucherStoreClientAdapterTest, LoadsLedgerMastersWithNatureFromParentGroup) {
    auto client = std::make_shared<InMemorySqlClient>();
    std::string error;
    ASSERT_TRUE(client->InsertRow(
        "ledgers",
        SqlRow{{"company_guid", "g1"}, {"company_alterid", "7"}, {"name", "Acme Traders"},
               {"parent", "Sundry Debtors"}, {"opening_balance", "250.5"},
               {"opening_date", "2024-04-01"}, {"credit_period_days", "45"},
               {"is_bill_wise", "Yes"}},
        &error));
    ASSERT_TRUE(client->InsertRow("ledgers",
                                  SqlRow{{"company_guid", "g1"}, {"company_alterid", "7"},
                                         {"name", "Vendor"}, {"nature", "Liabilities"}},
                                  &error));

    VoucherStoreClientAdapter adapter(client, NoBackoff(1), VoucherStoreTables{});
    std::vector<LedgerMaster> masters;
    ASSERT_TRUE(adapter.LoadLedgerMasters(CompanyRef{"g1", "7"}, &masters, &error));
    ASSERT_EQ(masters.size(), 2U);
    EXPECT_EQ(masters[0].nature, LedgerNature::kDebit);
    EXPECT_EQ(masters[0].opening_balance, 25050);
    ASSERT_TRUE(masters[0].opening_date.has_value());
    EXPECT_EQ(masters[0].opening_date->ToIso(), "2024-04-01");
    ASSERT_TRUE(masters[0].credit_period_days.has_value());
    EXPECT_EQ(*masters[0].credit_period_days, 45);
    EXPECT_TRUE(masters[0].is_bill_wise);
    EXPECT_EQ(masters[1].nature, LedgerNature::kCredit);
    EXPECT_FALSE(masters[1].is_bill_wise);
}

TEST(VoucherStoreClientAdapterTest, SkipsMasterLookupWhenLedgerTableDisabled) {
    auto client = std::make_shared<FlakySqlClient>(100);
    VoucherStoreTables tables;
    tables.ledgers.clear();
    VoucherStoreClientAdapter adapter(client, NoBackoff(3), tables);

    std::vector<LedgerMaster> masters{LedgerMaster{}};
    std::string error;
    ASSERT_TRUE(adapter.LoadLedgerMasters(CompanyRef{"g1", "7"}, &masters, &error));
    EXPECT_TRUE(masters.empty());
    EXPECT_EQ(client->query_calls(), 0);
}

TEST(VoucherStoreClientAdapterTest, RetriesTransientQueryFailures) {
    auto client = std::make_shared<FlakySqlClient>(2);
    std::string error;
    auto row = VoucherRow("1", "1", "Cash");
    row["vch_dr_amt"] = "10";
    ASSERT_TRUE(client->InsertRow("vouchers", row, &error));

    VoucherStoreClientAdapter adapter(client, NoBackoff(3), VoucherStoreTables{});
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    ASSERT_TRUE(adapter.LoadCompanyLegs(CompanyRef{"g1", "7"}, &legs, &malformed, &error));
    EXPECT_EQ(legs.size(), 1U);
    EXPECT_EQ(client->query_calls(), 3);
}

TEST(VoucherStoreClientAdapterTest, GivesUpAfterMaxAttempts) {
    auto client = std::make_shared<FlakySqlClient>(5);
    VoucherStoreClientAdapter adapter(client, NoBackoff(2), VoucherStoreTables{});
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    std::string error;
    EXPECT_FALSE(adapter.LoadCompanyLegs(CompanyRef{"g1", "7"}, &legs, &malformed, &error));
    EXPECT_NE(error.find("query vouchers failed: connection reset"), std::string::npos);
    EXPECT_EQ(client->query_calls(), 2);
}

TEST(VoucherStoreClientAdapterTest, ParsesLedgerNatureAliases) {
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature("Dr"), LedgerNature::kDebit);
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature(" expenses "), LedgerNature::kDebit);
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature("Sundry Creditors"),
              LedgerNature::kCredit);
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature("income"), LedgerNature::kCredit);
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature("Capital Account"),
              LedgerNature::kUnknown);
    EXPECT_EQ(VoucherStoreClientAdapter::ParseLedgerNature(""), LedgerNature::kUnknown);
}

}  // namespace tally_reports
