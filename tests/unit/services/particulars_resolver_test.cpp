#include <initializer_list>
#include <string>

#include <gtest/gtest.h>

#include "tally_reports/services/particulars_resolver.h"

namespace tally_reports {

namespace {

LegRecord Leg(const std::string& ledger, Amount amount) {
    LegRecord leg;
    leg.voucher_id = "V1";
    leg.ledger_name = ledger;
    leg.amount = amount;
    return leg;
}

Voucher MakeVoucher(const std::string& type, std::initializer_list<LegRecord> legs) {
    Voucher voucher;
    voucher.voucher_id = "V1";
    voucher.voucher_type = type;
    voucher.legs = legs;
    return voucher;
}

}  // namespace

TEST(ParticularsResolverTest, TwoLegVoucherNamesTheOtherLedger) {
    const auto voucher =
        MakeVoucher("Receipt", {Leg("Cash", 100000), Leg("Acme Traders", -100000)});
    EXPECT_EQ(ParticularsResolver::Resolve(voucher, "Acme Traders"), "Cash");
    EXPECT_EQ(ParticularsResolver::Resolve(voucher, " cash "), "Acme Traders");
}

TEST(ParticularsResolverTest, MultiLegVoucherListsDistinctCounterLedgersInLegOrder) {
    const auto voucher =
        MakeVoucher("Journal", {Leg("Acme Traders", 118000), Leg("Sales", -100000),
                                Leg("Output GST", -18000), Leg("sales", 0)});
    EXPECT_EQ(ParticularsResolver::Resolve(voucher, "Acme Traders"), "Sales, Output GST");
}

TEST(ParticularsResolverTest, SkipsZeroLegsAndDuplicateNames) {
    const auto voucher =
        MakeVoucher("Payment", {Leg("Bank", -500), Leg("Rent", 300), Leg("RENT", 200),
                                Leg("Round Off", 0)});
    EXPECT_EQ(ParticularsResolver::Resolve(voucher, "Bank"), "Rent");
}

TEST(ParticularsResolverTest, FallsBackToVoucherTypeThenOthers) {
    const auto self_only = MakeVoucher("Contra", {Leg("Cash", 500), Leg("Cash", -500)});
    EXPECT_EQ(ParticularsResolver::Resolve(self_only, "Cash"), "Contra");

    const auto untyped = MakeVoucher("", {Leg("Cash", 0)});
    EXPECT_EQ(ParticularsResolver::Resolve(untyped, "Cash"),
              std::string(ParticularsResolver::kFallbackParticulars));
}

}  // namespace tally_reports
