#pragma once

#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"
#include "tally_reports/core/report_error.h"
#include "tally_reports/services/running_balance_calculator.h"
#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {

// Maps engine results onto the response records and renders them as JSON. Amounts are raw
// decimals with two places, dates are ISO 8601.
class ReportAssembler {
public:
    static LedgerStatement AssembleLedgerStatement(const LoadedLedger& loaded,
                                                   const RunningBalanceResult& balances,
                                                   const CalendarDate& from_date,
                                                   const CalendarDate& to_date);

    static std::string LedgerStatementToJson(const LedgerStatement& statement);
    static std::string OutstandingReportToJson(const OutstandingReport& report);
    static std::string LedgerListToJson(const CompanyRecord& company,
                                        const std::vector<LedgerListEntry>& ledgers);
    static std::string ErrorToJson(const ReportError& error);

    static std::string FormatAmount(Amount amount);
};

}  // namespace tally_reports
