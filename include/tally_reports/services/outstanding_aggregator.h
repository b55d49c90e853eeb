#pragma once

#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"

namespace tally_reports {

struct LedgerOutstanding {
    std::string ledger_name;
    std::vector<OutstandingRow> rows;
    std::vector<OnAccountEntry> on_account;
};

class OutstandingAggregator {
public:
    // Fills data, ledgers, ageing, on_account and the grand totals of `report`. Ledger order
    // is kept; rows inside a ledger are ordered by bill date, and `balance` becomes the
    // ledger's running outstanding.
    static void Aggregate(const std::vector<LedgerOutstanding>& ledgers,
                          OutstandingScope scope,
                          OutstandingReport* report);

    // Party-wise movement over `legs`, zero balances dropped, largest balance first.
    static std::vector<PartySummary> SummarizeParties(const std::vector<LegRecord>& legs,
                                                      OutstandingScope scope);

    // Distinct ledger names with their leg counts, sorted by name.
    static std::vector<LedgerListEntry> ListLedgers(const std::vector<LegRecord>& legs,
                                                    const std::vector<LedgerMaster>& masters);

    static bool InScope(Amount signed_amount, OutstandingScope scope);
};

}  // namespace tally_reports
