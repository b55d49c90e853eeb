#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {

namespace {

CalendarDate Day(const std::string& iso) {
    CalendarDate date;
    EXPECT_TRUE(CalendarDate::Parse(iso, &date));
    return date;
}

LegRecord Leg(const std::string& voucher_id,
              std::int64_t row_id,
              const std::string& date,
              const std::string& vch_no,
              const std::string& ledger,
              Amount amount) {
    LegRecord leg;
    leg.voucher_id = voucher_id;
    leg.row_id = row_id;
    leg.date = Day(date);
    leg.voucher_number = vch_no;
    leg.sort_key = vch_no;
    leg.voucher_type = "Journal";
    leg.ledger_name = ledger;
    leg.amount = amount;
    return leg;
}

class FakeVoucherStore : public IVoucherStore {
public:
    bool GetCompany(const CompanyRef& company,
                    CompanyRecord* out,
                    bool* found,
                    std::string* error) const override {
        if (!company_error.empty()) {
            *error = company_error;
            return false;
        }
        *found = company.guid == "g1";
        out->ref = company;
        out->name = "Acme Books";
        return true;
    }
    bool LoadLedgerMasters(const CompanyRef& /*company*/,
                           std::vector<LedgerMaster>* out,
                           std::string* /*error*/) const override {
        *out = masters;
        return true;
    }
    bool LoadCompanyLegs(const CompanyRef& /*company*/,
                         std::vector<LegRecord>* out,
                         std::vector<MalformedRow>* malformed,
                         std::string* /*error*/) const override {
        *out = legs;
        *malformed = bad_rows;
        return true;
    }

    std::string company_error;
    std::vector<LedgerMaster> masters;
    std::vector<LegRecord> legs;
    std::vector<MalformedRow> bad_rows;
};

std::shared_ptr<FakeVoucherStore> SampleStore() {
    auto store = std::make_shared<FakeVoucherStore>();
    store->legs = {
        Leg("B", 4, "2024-04-02", "10", "Cash", -700),
        Leg("B", 3, "2024-04-02", "10", "Rent", 700),
        Leg("A", 1, "2024-04-02", "9", "Cash", 500),
        Leg("A", 2, "2024-04-02", "9", "Capital", -500),
        Leg("P", 5, "2024-03-15", "1", "Cash", 1000),
        Leg("P", 6, "2024-03-15", "1", "Capital", -1000),
        Leg("Z", 7, "2024-05-02", "2", "Cash", 50),
        Leg("Z", 8, "2024-05-02", "2", "Capital", -50),
    };
    return store;
}

LedgerLoadRequest April(const std::string& ledger) {
    LedgerLoadRequest request;
    request.company = CompanyRef{"g1", "7"};
    request.ledger_name = ledger;
    request.from_date = Day("2024-04-01");
    request.to_date = Day("2024-04-30");
    return request;
}

}  // namespace

TEST(TransactionLoaderTest, ComparesNumericSortKeysNumerically) {
    EXPECT_LT(TransactionLoader::CompareSortKeys("9", "10"), 0);
    EXPECT_EQ(TransactionLoader::CompareSortKeys("007", "7"), 0);
    EXPECT_GT(TransactionLoader::CompareSortKeys("100", "99"), 0);
    EXPECT_LT(TransactionLoader::CompareSortKeys("A-10", "A-9"), 0);
    EXPECT_EQ(TransactionLoader::NormalizeLedgerName("  Acme TRADERS \t"), "acme traders");
}

TEST(TransactionLoaderTest, OrdersVouchersByDateNumberAndRow) {
    TransactionLoader loader(SampleStore(), true);
    LoadedLedger loaded;
    ReportError error;
    ASSERT_TRUE(loader.LoadLedger(April("CASH"), &loaded, &error)) << error.ToString();
    EXPECT_EQ(loaded.company.name, "Acme Books");
    EXPECT_EQ(loaded.ledger_name, "Cash");
    EXPECT_EQ(loaded.opening_balance, 1000);
    ASSERT_EQ(loaded.vouchers.size(), 2U);
    EXPECT_EQ(loaded.vouchers[0].voucher_id, "A");
    EXPECT_EQ(loaded.vouchers[1].voucher_id, "B");
    ASSERT_EQ(loaded.vouchers[1].legs.size(), 2U);
    EXPECT_EQ(loaded.vouchers[1].legs[0].ledger_name, "Rent");
    EXPECT_TRUE(loaded.inconsistencies.empty());
}

TEST(TransactionLoaderTest, OpeningSkipsMovementBeforeMasterOpeningDate) {
    auto store = SampleStore();
    LedgerMaster cash;
    cash.name = "Cash";
    cash.nature = LedgerNature::kDebit;
    cash.opening_balance = 200;
    cash.opening_date = Day("2024-04-01");
    store->masters = {cash};
    TransactionLoader loader(store, true);

    LoadedLedger loaded;
    ReportError error;
    ASSERT_TRUE(loader.LoadLedger(April("cash"), &loaded, &error));
    EXPECT_EQ(loaded.opening_balance, 200);
    EXPECT_EQ(loaded.nature, LedgerNature::kDebit);
}

TEST(TransactionLoaderTest, MasterWithoutLegsLoadsEmptyLedger) {
    auto store = SampleStore();
    LedgerMaster suspense;
    suspense.name = "Suspense";
    suspense.opening_balance = -300;
    store->masters = {suspense};
    TransactionLoader loader(store, true);

    LoadedLedger loaded;
    ReportError error;
    ASSERT_TRUE(loader.LoadLedger(April("suspense"), &loaded, &error));
    EXPECT_EQ(loaded.ledger_name, "Suspense");
    EXPECT_EQ(loaded.opening_balance, -300);
    EXPECT_TRUE(loaded.vouchers.empty());
}

TEST(TransactionLoaderTest, FlagsUnbalancedVouchers) {
    auto store = SampleStore();
    store->legs.push_back(Leg("U", 9, "2024-04-05", "11", "Cash", 10));
    TransactionLoader loader(store, true);

    LoadedLedger loaded;
    ReportError error;
    ASSERT_TRUE(loader.LoadLedger(April("Cash"), &loaded, &error));
    ASSERT_EQ(loaded.inconsistencies.size(), 1U);
    EXPECT_EQ(loaded.inconsistencies[0].voucher_id, "U");
    EXPECT_EQ(loaded.inconsistencies[0].amount, 10);
    EXPECT_EQ(loaded.inconsistencies[0].detail, "legs sum to 0.10");
    EXPECT_EQ(loaded.inconsistencies[0].ledger_name, "Cash");

    TransactionLoader lenient(store, false);
    ASSERT_TRUE(lenient.LoadLedger(April("Cash"), &loaded, &error));
    EXPECT_TRUE(loaded.inconsistencies.empty());
}

TEST(TransactionLoaderTest, MapsStoreFailuresToReportErrors) {
    auto store = SampleStore();
    TransactionLoader loader(store, true);
    LoadedLedger loaded;

    ReportError not_found;
    auto request = April("Cash");
    request.company.guid = "g2";
    EXPECT_FALSE(loader.LoadLedger(request, &loaded, &not_found));
    EXPECT_EQ(not_found.kind, ReportErrorKind::kNotFound);
    EXPECT_EQ(not_found.company, "g2/7");

    ReportError missing_ledger;
    EXPECT_FALSE(loader.LoadLedger(April("Bank"), &loaded, &missing_ledger));
    EXPECT_EQ(missing_ledger.kind, ReportErrorKind::kNotFound);
    EXPECT_EQ(missing_ledger.ledger, "Bank");

    store->bad_rows = {MalformedRow{"Q", "invalid vch_date: 2024-02-30"}};
    ReportError malformed;
    EXPECT_FALSE(loader.LoadLedger(April("Cash"), &loaded, &malformed));
    EXPECT_EQ(malformed.kind, ReportErrorKind::kInconsistentData);
    EXPECT_EQ(malformed.message,
              "1 voucher row(s) could not be decoded: invalid vch_date: 2024-02-30");

    store->company_error = "query companies failed: timeout";
    ReportError storage;
    EXPECT_FALSE(loader.LoadLedger(April("Cash"), &loaded, &storage));
    EXPECT_EQ(storage.kind, ReportErrorKind::kStorage);
    EXPECT_EQ(storage.message, "query companies failed: timeout");

    TransactionLoader unconfigured(nullptr, true);
    ReportError no_store;
    EXPECT_FALSE(unconfigured.LoadLedger(April("Cash"), &loaded, &no_store));
    EXPECT_EQ(no_store.kind, ReportErrorKind::kStorage);
}

TEST(TransactionLoaderTest, CompanyLegsAreFilteredByAsOfDate) {
    TransactionLoader loader(SampleStore(), true);
    LoadedCompany company;
    ReportError error;
    ASSERT_TRUE(loader.LoadCompanyLegs(CompanyRef{"g1", "7"}, Day("2024-04-30"), &company,
                                       &error));
    ASSERT_TRUE(company.earliest_date.has_value());
    EXPECT_EQ(company.earliest_date->ToIso(), "2024-03-15");
    ASSERT_EQ(company.legs.size(), 6U);
    EXPECT_EQ(company.legs[0].voucher_id, "P");
    EXPECT_EQ(company.legs[2].voucher_id, "A");
    EXPECT_EQ(company.legs[4].row_id, 3);
    EXPECT_EQ(company.legs[5].row_id, 4);
}

}  // namespace tally_reports
