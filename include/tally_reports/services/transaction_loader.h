#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"
#include "tally_reports/core/report_error.h"
#include "tally_reports/interfaces/voucher_store.h"

namespace tally_reports {

struct LedgerLoadRequest {
    CompanyRef company;
    std::string ledger_name;
    CalendarDate from_date;
    CalendarDate to_date;
};

struct LoadedLedger {
    CompanyRecord company;
    std::string ledger_name;
    LedgerNature nature{LedgerNature::kUnknown};
    Amount opening_balance{0};
    // Vouchers touching the ledger inside the range, ordered, carrying all of their legs.
    std::vector<Voucher> vouchers;
    std::vector<Inconsistency> inconsistencies;
};

struct LoadedCompany {
    CompanyRecord company;
    std::vector<LedgerMaster> masters;
    // Ordered legs dated on or before the requested as-of date.
    std::vector<LegRecord> legs;
    // Earliest leg date across the whole company, before any as-of filtering.
    std::optional<CalendarDate> earliest_date;
};

class TransactionLoader {
public:
    TransactionLoader(std::shared_ptr<IVoucherStore> store, bool validate_voucher_balance);

    bool LoadLedger(const LedgerLoadRequest& request,
                    LoadedLedger* out,
                    ReportError* error) const;
    bool LoadCompanyLegs(const CompanyRef& company,
                         const std::optional<CalendarDate>& as_of,
                         LoadedCompany* out,
                         ReportError* error) const;

    // Trimmed, case-folded form used for every ledger name comparison.
    static std::string NormalizeLedgerName(const std::string& name);
    // Numeric keys compare numerically, anything else lexicographically.
    static int CompareSortKeys(const std::string& lhs, const std::string& rhs);
    static bool LegOrderLess(const LegRecord& lhs, const LegRecord& rhs);
    static bool VoucherOrderLess(const Voucher& lhs, const Voucher& rhs);
    static std::vector<Voucher> GroupIntoVouchers(const std::vector<LegRecord>& legs);
    static std::vector<Inconsistency> FindUnbalancedVouchers(const std::vector<Voucher>& vouchers);

private:
    std::shared_ptr<IVoucherStore> store_;
    bool validate_voucher_balance_{true};
};

}  // namespace tally_reports
