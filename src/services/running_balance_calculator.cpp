#include "tally_reports/services/running_balance_calculator.h"

#include <utility>

#include "tally_reports/services/particulars_resolver.h"
#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {

BalanceSide RunningBalanceCalculator::SideFor(Amount signed_balance, LedgerNature nature) {
    if (signed_balance > 0) {
        return BalanceSide::kDebit;
    }
    if (signed_balance < 0) {
        return BalanceSide::kCredit;
    }
    return nature == LedgerNature::kCredit ? BalanceSide::kCredit : BalanceSide::kDebit;
}

void RunningBalanceCalculator::Build(Amount opening_balance,
                                     const std::vector<Voucher>& vouchers,
                                     const std::string& reported_ledger,
                                     LedgerNature nature,
                                     RunningBalanceResult* out) {
    if (out == nullptr) {
        return;
    }
    const auto target = TransactionLoader::NormalizeLedgerName(reported_ledger);

    RunningBalanceResult result;
    result.rows.reserve(vouchers.size());
    Amount balance = opening_balance;
    for (const auto& voucher : vouchers) {
        Amount debit = 0;
        Amount credit = 0;
        std::string leg_narration;
        bool touches = false;
        for (const auto& leg : voucher.legs) {
            if (TransactionLoader::NormalizeLedgerName(leg.ledger_name) != target) {
                continue;
            }
            touches = true;
            if (leg.amount > 0) {
                debit += leg.amount;
            } else {
                credit -= leg.amount;
            }
            if (leg_narration.empty()) {
                leg_narration = leg.narration;
            }
        }
        if (!touches) {
            continue;
        }

        const Amount net = debit - credit;
        LedgerStatementRow row;
        row.date = voucher.date;
        row.voucher_id = voucher.voucher_id;
        row.particulars = ParticularsResolver::Resolve(voucher, reported_ledger);
        row.voucher_type = voucher.voucher_type;
        row.voucher_number = voucher.voucher_number;
        row.narration = voucher.narration.empty() ? leg_narration : voucher.narration;
        row.debit = net > 0 ? net : 0;
        row.credit = net < 0 ? -net : 0;
        balance += net;
        row.balance = Magnitude(balance);
        row.balance_side = SideFor(balance, nature);

        result.total_debit += row.debit;
        result.total_credit += row.credit;
        result.rows.push_back(std::move(row));
    }
    result.closing_balance = balance;
    *out = std::move(result);
}

}  // namespace tally_reports
