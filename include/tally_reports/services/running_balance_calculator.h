#pragma once

#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"

namespace tally_reports {

struct RunningBalanceResult {
    std::vector<LedgerStatementRow> rows;
    Amount total_debit{0};
    Amount total_credit{0};
    // Signed, debit positive.
    Amount closing_balance{0};
};

class RunningBalanceCalculator {
public:
    // `vouchers` must already be in statement order.
    static void Build(Amount opening_balance,
                      const std::vector<Voucher>& vouchers,
                      const std::string& reported_ledger,
                      LedgerNature nature,
                      RunningBalanceResult* out);

    // Zero takes the ledger's natural side; an unknown nature falls back to Dr.
    static BalanceSide SideFor(Amount signed_balance, LedgerNature nature);
    static Amount Magnitude(Amount signed_balance) {
        return signed_balance < 0 ? -signed_balance : signed_balance;
    }
};

}  // namespace tally_reports
