#pragma once

#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"
#include "tally_reports/services/settlement_policy.h"

namespace tally_reports {

enum class LegRole {
    kSkip,
    kOriginating,
    kReferenced,
    kUnreferenced,
};

struct LedgerAllocationResult {
    std::string ledger_name;
    // Every bill raised on the ledger, in FIFO order, settled ones included.
    std::vector<OpenBill> bills;
    std::vector<OnAccountEntry> on_account;
    std::vector<Inconsistency> inconsistencies;

    std::vector<OpenBill> OpenBills() const;
    Amount OnAccountBalance() const;
};

class BillAllocationEngine {
public:
    // A null policy means FIFO.
    explicit BillAllocationEngine(const IUnreferencedSettlementPolicy* policy);

    // Allocates one ledger's legs dated on or before `as_of`. Bills are raised from every
    // originating leg before any settlement is walked, so a settlement may precede its bill.
    // Each pass is linear in the number of legs apart from the FIFO scan of unreferenced
    // settlements.
    LedgerAllocationResult Allocate(const std::string& ledger_name,
                                    const std::vector<LegRecord>& legs,
                                    const CalendarDate& as_of) const;

    // `bill_exists` tells whether the leg's reference already names a bill on the ledger.
    static LegRole Classify(const LegRecord& leg, bool bill_exists);
    static std::string NormalizeBillRef(const std::string& ref);

private:
    const IUnreferencedSettlementPolicy* policy_{nullptr};
    FifoSettlementPolicy default_policy_;
};

}  // namespace tally_reports
