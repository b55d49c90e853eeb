#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"
#include "tally_reports/core/report_config.h"

namespace tally_reports {

// Applies `amount` (signed, opposite to the bill's remaining balance) to `bill`, recording the
// allocation. Returns the part of `amount` the bill could not absorb, with the same sign.
Amount AllocateToBill(OpenBill* bill, const LegRecord& leg, Amount amount);

// Decides what an unreferenced settling leg does to a ledger's open bills.
class IUnreferencedSettlementPolicy {
public:
    virtual ~IUnreferencedSettlementPolicy() = default;

    virtual std::string Name() const = 0;
    // `fifo_bills` holds the ledger's bills in FIFO order. Returns the unapplied remainder,
    // which the caller books on account.
    virtual Amount Apply(const LegRecord& leg,
                         Amount amount,
                         const std::vector<OpenBill*>& fifo_bills) const = 0;
};

class FifoSettlementPolicy : public IUnreferencedSettlementPolicy {
public:
    std::string Name() const override { return "fifo"; }
    Amount Apply(const LegRecord& leg,
                 Amount amount,
                 const std::vector<OpenBill*>& fifo_bills) const override;
};

class OnAccountSettlementPolicy : public IUnreferencedSettlementPolicy {
public:
    std::string Name() const override { return "on_account"; }
    Amount Apply(const LegRecord& leg,
                 Amount amount,
                 const std::vector<OpenBill*>& fifo_bills) const override;
};

std::unique_ptr<IUnreferencedSettlementPolicy> MakeSettlementPolicy(
    UnreferencedSettlementMode mode);

}  // namespace tally_reports
