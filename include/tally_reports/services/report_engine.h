#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"
#include "tally_reports/core/cancellation_token.h"
#include "tally_reports/core/report_config.h"
#include "tally_reports/core/report_error.h"
#include "tally_reports/core/structured_log.h"
#include "tally_reports/interfaces/voucher_store.h"
#include "tally_reports/services/settlement_policy.h"
#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {

struct LedgerStatementRequest {
    CompanyRef company;
    std::string ledger_name;
    CalendarDate from_date;
    CalendarDate to_date;
    // Unset uses the engine default.
    std::optional<InconsistencyPolicy> inconsistency_policy;
};

struct OutstandingRequest {
    CompanyRef company;
    CalendarDate as_on_date;
    OutstandingScope scope{OutstandingScope::kBoth};
    // Empty selects every ledger that carries bill references or is marked bill-wise.
    std::vector<std::string> ledger_names;
    std::optional<InconsistencyPolicy> inconsistency_policy;
};

struct LedgerList {
    CompanyRecord company;
    std::vector<LedgerListEntry> ledgers;
};

// Read-only report computations over an IVoucherStore. Safe to share across threads; each
// call runs to completion on the calling thread or fails with a ReportError.
class ReportEngine {
public:
    ReportEngine(std::shared_ptr<IVoucherStore> store,
                 EngineOptions options,
                 ReportRuntimeConfig runtime = {});

    bool BuildLedgerStatement(const LedgerStatementRequest& request,
                              const CancellationToken* cancel,
                              LedgerStatement* out,
                              ReportError* error) const;
    bool BuildOutstandingReport(const OutstandingRequest& request,
                                const CancellationToken* cancel,
                                OutstandingReport* out,
                                ReportError* error) const;
    bool ListLedgers(const CompanyRef& company,
                     const CancellationToken* cancel,
                     LedgerList* out,
                     ReportError* error) const;

    const EngineOptions& options() const { return options_; }

private:
    bool RunLedgerStatement(const LedgerStatementRequest& request,
                            const CancellationToken* cancel,
                            LedgerStatement* out,
                            ReportError* error) const;
    bool RunOutstandingReport(const OutstandingRequest& request,
                              const CancellationToken* cancel,
                              OutstandingReport* out,
                              ReportError* error) const;
    bool CheckCancelled(const CancellationToken* cancel,
                        const std::string& phase,
                        ReportError* error) const;
    bool EnforceInconsistencyPolicy(InconsistencyPolicy policy,
                                    const std::vector<Inconsistency>& inconsistencies,
                                    ReportError* error) const;
    void Finish(const std::string& report,
                const std::string& event,
                bool ok,
                double latency_ms,
                const LogFields& fields,
                const ReportError& error) const;

    TransactionLoader loader_;
    EngineOptions options_;
    ReportRuntimeConfig runtime_;
    std::unique_ptr<IUnreferencedSettlementPolicy> settlement_policy_;
};

}  // namespace tally_reports
