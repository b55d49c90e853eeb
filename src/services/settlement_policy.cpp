#include "tally_reports/services/settlement_policy.h"

#include <algorithm>

namespace tally_reports {

Amount AllocateToBill(OpenBill* bill, const LegRecord& leg, Amount amount) {
    if (bill == nullptr || amount == 0 || bill->remaining == 0) {
        return amount;
    }
    if ((bill->remaining > 0) == (amount > 0)) {
        return amount;
    }
    const Amount magnitude = amount < 0 ? -amount : amount;
    const Amount open = bill->remaining < 0 ? -bill->remaining : bill->remaining;
    const Amount applied = std::min(magnitude, open);

    bill->remaining += amount > 0 ? applied : -applied;
    BillAllocation allocation;
    allocation.bill_ref = bill->bill.bill_ref;
    allocation.voucher_id = leg.voucher_id;
    allocation.allocated_amount = applied;
    allocation.allocation_date = leg.date;
    allocation.remaining_after = bill->remaining < 0 ? -bill->remaining : bill->remaining;
    bill->allocations.push_back(allocation);

    const Amount left = magnitude - applied;
    return amount > 0 ? left : -left;
}

Amount FifoSettlementPolicy::Apply(const LegRecord& leg,
                                   Amount amount,
                                   const std::vector<OpenBill*>& fifo_bills) const {
    Amount left = amount;
    for (auto* bill : fifo_bills) {
        if (left == 0) {
            break;
        }
        left = AllocateToBill(bill, leg, left);
    }
    return left;
}

Amount OnAccountSettlementPolicy::Apply(const LegRecord& /*leg*/,
                                        Amount amount,
                                        const std::vector<OpenBill*>& /*fifo_bills*/) const {
    return amount;
}

std::unique_ptr<IUnreferencedSettlementPolicy> MakeSettlementPolicy(
    UnreferencedSettlementMode mode) {
    if (mode == UnreferencedSettlementMode::kOnAccount) {
        return std::make_unique<OnAccountSettlementPolicy>();
    }
    return std::make_unique<FifoSettlementPolicy>();
}

}  // namespace tally_reports
