#include <string>

#include <gtest/gtest.h>

#include "tally_reports/core/report_error.h"

namespace tally_reports {

TEST(ReportErrorTest, FailWithFillsKindAndMessage) {
    ReportError error;
    EXPECT_TRUE(error.Ok());
    EXPECT_FALSE(FailWith(&error, ReportErrorKind::kNotFound, "ledger not found: Cash"));
    EXPECT_FALSE(error.Ok());
    EXPECT_EQ(error.kind, ReportErrorKind::kNotFound);
    EXPECT_EQ(error.message, "ledger not found: Cash");
    EXPECT_FALSE(FailWith(nullptr, ReportErrorKind::kStorage, "ignored"));
}

TEST(ReportErrorTest, ToStringCarriesContext) {
    ReportError error;
    error.kind = ReportErrorKind::kInconsistentData;
    error.message = "1 inconsistency(ies) found: over_allocation";
    error.company = "g1/7";
    error.ledger = "Acme Traders";
    error.voucher_ids = {"V1", "V2"};
    error.bill_refs = {"INV-1"};

    const auto text = error.ToString();
    EXPECT_EQ(text.rfind("inconsistent_data: 1 inconsistency(ies) found", 0), 0U);
    EXPECT_NE(text.find("company=g1/7"), std::string::npos);
    EXPECT_NE(text.find("ledger=Acme Traders"), std::string::npos);
    EXPECT_NE(text.find("vouchers=V1,V2"), std::string::npos);
    EXPECT_NE(text.find("bills=INV-1"), std::string::npos);
    EXPECT_EQ(text.find("from="), std::string::npos);
}

TEST(ReportErrorTest, KindNamesAreStable) {
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kNotFound), "not_found");
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kInvalidRange), "invalid_range");
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kInconsistentData), "inconsistent_data");
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kStorage), "storage");
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kCancelled), "cancelled");
    EXPECT_EQ(ReportErrorKindName(ReportErrorKind::kInvalidArgument), "invalid_argument");
}

}  // namespace tally_reports
