#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "tally_reports/services/ageing_classifier.h"

namespace tally_reports {

namespace {

CalendarDate Day(const std::string& iso) {
    CalendarDate date;
    EXPECT_TRUE(CalendarDate::Parse(iso, &date));
    return date;
}

OpenBill MakeOpenBill(const std::string& bill_date, Amount remaining) {
    OpenBill open;
    open.bill.ledger_name = "Acme Traders";
    open.bill.bill_ref = "INV-1";
    open.bill.bill_date = Day(bill_date);
    open.bill.bill_type = "New Ref";
    open.bill.voucher_type = "Sales";
    open.bill.voucher_number = "17";
    open.bill.original_amount = remaining;
    open.remaining = remaining;
    return open;
}

}  // namespace

TEST(AgeingClassifierTest, DueDatePrefersExplicitDateThenBillLedgerAndDefaultPeriods) {
    AgeingClassifier classifier(15);
    auto open = MakeOpenBill("2024-04-10", 100000);

    EXPECT_EQ(classifier.DueDate(open.bill, std::nullopt).ToIso(), "2024-04-25");
    EXPECT_EQ(classifier.DueDate(open.bill, 30).ToIso(), "2024-05-10");

    open.bill.credit_period_days = 5;
    EXPECT_EQ(classifier.DueDate(open.bill, 30).ToIso(), "2024-04-15");

    open.bill.due_date = Day("2024-06-01");
    EXPECT_EQ(classifier.DueDate(open.bill, 30).ToIso(), "2024-06-01");
}

TEST(AgeingClassifierTest, OverdueDaysNeverNegative) {
    EXPECT_EQ(AgeingClassifier::OverdueDays(Day("2024-05-01"), Day("2024-04-20")), 0);
    EXPECT_EQ(AgeingClassifier::OverdueDays(Day("2024-04-10"), Day("2024-05-01")), 21);
}

TEST(AgeingClassifierTest, BucketBoundariesAreInclusive) {
    EXPECT_EQ(AgeingClassifier::BucketFor(0), AgeingBucket::k0To30);
    EXPECT_EQ(AgeingClassifier::BucketFor(30), AgeingBucket::k0To30);
    EXPECT_EQ(AgeingClassifier::BucketFor(31), AgeingBucket::k31To60);
    EXPECT_EQ(AgeingClassifier::BucketFor(60), AgeingBucket::k31To60);
    EXPECT_EQ(AgeingClassifier::BucketFor(61), AgeingBucket::k61To90);
    EXPECT_EQ(AgeingClassifier::BucketFor(90), AgeingBucket::k61To90);
    EXPECT_EQ(AgeingClassifier::BucketFor(91), AgeingBucket::kOver90);
}

TEST(AgeingClassifierTest, ClassifiesReceivableBill) {
    AgeingClassifier classifier;
    const auto row = classifier.Classify(MakeOpenBill("2024-01-01", 20000), std::nullopt,
                                         Day("2024-04-30"));
    EXPECT_EQ(row.ledger_name, "Acme Traders");
    EXPECT_EQ(row.bill_ref, "INV-1");
    EXPECT_EQ(row.voucher_no, "17");
    EXPECT_TRUE(row.is_receivable);
    EXPECT_EQ(row.outstanding_amount, 20000);
    EXPECT_EQ(row.due_date.ToIso(), "2024-01-01");
    EXPECT_EQ(row.overdue_days, 120);
    EXPECT_EQ(row.ageing_bucket, AgeingBucket::kOver90);
}

TEST(AgeingClassifierTest, ClassifiesPayableBillWithPositiveAmount) {
    AgeingClassifier classifier;
    const auto row =
        classifier.Classify(MakeOpenBill("2024-04-20", -5000), 30, Day("2024-04-30"));
    EXPECT_FALSE(row.is_receivable);
    EXPECT_EQ(row.outstanding_amount, 5000);
    EXPECT_EQ(row.overdue_days, 0);
    EXPECT_EQ(row.ageing_bucket, AgeingBucket::k0To30);
}

}  // namespace tally_reports
