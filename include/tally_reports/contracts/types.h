#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tally_reports/common/calendar_date.h"

namespace tally_reports {

// Monetary amounts are hundredths of the company currency; debit is positive.
using Amount = std::int64_t;
constexpr int kAmountScale = 2;

enum class LedgerNature {
    kUnknown,
    kDebit,
    kCredit,
};

enum class BalanceSide {
    kDebit,
    kCredit,
};

enum class OutstandingScope {
    kReceivables,
    kPayables,
    kBoth,
};

enum class AgeingBucket {
    k0To30,
    k31To60,
    k61To90,
    kOver90,
};

enum class InconsistencyKind {
    kUnbalancedVoucher,
    kOverAllocation,
    kUnknownBillReference,
};

enum class InconsistencyPolicy {
    kFail,
    kReport,
};

struct CompanyRef {
    std::string guid;
    std::string alterid;
};

struct CompanyRecord {
    CompanyRef ref;
    std::string name;
};

struct LedgerMaster {
    std::string name;
    std::string parent_group;
    LedgerNature nature{LedgerNature::kUnknown};
    Amount opening_balance{0};
    std::optional<CalendarDate> opening_date;
    std::optional<int> credit_period_days;
    bool is_bill_wise{false};
};

struct LegRecord {
    std::string voucher_id;
    std::int64_t row_id{0};
    CalendarDate date;
    std::string voucher_type;
    std::string voucher_number;
    std::string sort_key;
    std::string ledger_name;
    std::string party_name;
    Amount amount{0};
    std::string bill_reference;
    std::string bill_type;
    std::optional<CalendarDate> bill_date;
    std::optional<CalendarDate> due_date;
    std::optional<int> credit_period_days;
    std::string narration;
    LedgerNature ledger_nature{LedgerNature::kUnknown};
};

// A storage row that could not be turned into a LegRecord.
struct MalformedRow {
    std::string voucher_id;
    std::string reason;
};

struct Voucher {
    std::string voucher_id;
    CalendarDate date;
    std::string voucher_type;
    std::string voucher_number;
    std::string sort_key;
    std::string narration;
    std::vector<LegRecord> legs;
};

struct Inconsistency {
    InconsistencyKind kind{InconsistencyKind::kUnbalancedVoucher};
    std::string ledger_name;
    std::string voucher_id;
    std::string bill_ref;
    Amount amount{0};
    std::string detail;
};

struct LedgerStatementRow {
    CalendarDate date;
    std::string voucher_id;
    std::string particulars;
    std::string voucher_type;
    std::string voucher_number;
    std::string narration;
    Amount debit{0};
    Amount credit{0};
    Amount balance{0};
    BalanceSide balance_side{BalanceSide::kDebit};
};

struct LedgerStatement {
    std::string company_name;
    std::string ledger_name;
    CalendarDate from_date;
    CalendarDate to_date;
    Amount opening_balance{0};
    BalanceSide opening_balance_side{BalanceSide::kDebit};
    Amount total_debit{0};
    Amount total_credit{0};
    Amount closing_balance{0};
    BalanceSide closing_balance_side{BalanceSide::kDebit};
    Amount net_movement{0};
    int total_transactions{0};
    std::vector<LedgerStatementRow> transactions;
    std::vector<Inconsistency> inconsistencies;
};

struct Bill {
    std::string ledger_name;
    std::string bill_ref;
    CalendarDate bill_date;
    std::string bill_type;
    Amount original_amount{0};
    std::optional<CalendarDate> due_date;
    std::optional<int> credit_period_days;
    std::string voucher_id;
    std::string voucher_type;
    std::string voucher_number;
    std::int64_t sequence{0};
};

struct BillAllocation {
    std::string bill_ref;
    std::string voucher_id;
    Amount allocated_amount{0};
    CalendarDate allocation_date;
    Amount remaining_after{0};
};

struct OnAccountEntry {
    std::string ledger_name;
    std::string voucher_id;
    CalendarDate date;
    Amount amount{0};
    std::string bill_ref;
};

struct OpenBill {
    Bill bill;
    Amount remaining{0};
    std::vector<BillAllocation> allocations;
};

struct OutstandingRow {
    std::string ledger_name;
    std::string bill_ref;
    CalendarDate bill_date;
    std::string bill_type;
    std::string voucher_type;
    std::string voucher_no;
    Amount outstanding_amount{0};
    Amount balance{0};
    bool is_receivable{false};
    CalendarDate due_date;
    std::int64_t overdue_days{0};
    AgeingBucket ageing_bucket{AgeingBucket::k0To30};
};

struct LedgerSubtotal {
    std::string ledger_name;
    Amount receivable_total{0};
    Amount payable_total{0};
    int open_bill_count{0};
    Amount on_account_balance{0};
};

struct PartySummary {
    std::string ledger_name;
    Amount total_debit{0};
    Amount total_credit{0};
    Amount balance{0};
    int transaction_count{0};
    CalendarDate first_transaction;
    CalendarDate last_transaction;
};

struct AgeingSummary {
    AgeingBucket bucket{AgeingBucket::k0To30};
    Amount receivables{0};
    Amount payables{0};
    int bill_count{0};
};

struct OutstandingReport {
    std::string company_name;
    OutstandingScope report_type{OutstandingScope::kBoth};
    CalendarDate as_on_date;
    int count{0};
    Amount total_outstanding_receivables{0};
    Amount total_outstanding_payables{0};
    int ledger_count{0};
    std::vector<OutstandingRow> data;
    std::vector<LedgerSubtotal> ledgers;
    std::vector<PartySummary> parties;
    std::vector<AgeingSummary> ageing;
    std::vector<OnAccountEntry> on_account;
    std::vector<Inconsistency> inconsistencies;
};

struct LedgerListEntry {
    std::string ledger_name;
    int leg_count{0};
};

inline std::string BalanceSideName(BalanceSide side) {
    return side == BalanceSide::kCredit ? "Cr" : "Dr";
}

inline std::string LedgerNatureName(LedgerNature nature) {
    switch (nature) {
        case LedgerNature::kDebit:
            return "debit";
        case LedgerNature::kCredit:
            return "credit";
        case LedgerNature::kUnknown:
        default:
            return "unknown";
    }
}

inline std::string OutstandingScopeName(OutstandingScope scope) {
    switch (scope) {
        case OutstandingScope::kReceivables:
            return "receivables";
        case OutstandingScope::kPayables:
            return "payables";
        case OutstandingScope::kBoth:
        default:
            return "both";
    }
}

inline bool ParseOutstandingScope(const std::string& raw, OutstandingScope* out) {
    if (out == nullptr) {
        return false;
    }
    if (raw == "receivables" || raw == "receivable") {
        *out = OutstandingScope::kReceivables;
        return true;
    }
    if (raw == "payables" || raw == "payable") {
        *out = OutstandingScope::kPayables;
        return true;
    }
    if (raw == "both" || raw.empty()) {
        *out = OutstandingScope::kBoth;
        return true;
    }
    return false;
}

inline std::string AgeingBucketLabel(AgeingBucket bucket) {
    switch (bucket) {
        case AgeingBucket::k0To30:
            return "0-30";
        case AgeingBucket::k31To60:
            return "31-60";
        case AgeingBucket::k61To90:
            return "61-90";
        case AgeingBucket::kOver90:
        default:
            return ">90";
    }
}

inline std::string InconsistencyKindName(InconsistencyKind kind) {
    switch (kind) {
        case InconsistencyKind::kUnbalancedVoucher:
            return "unbalanced_voucher";
        case InconsistencyKind::kOverAllocation:
            return "over_allocation";
        case InconsistencyKind::kUnknownBillReference:
        default:
            return "unknown_bill_reference";
    }
}

}  // namespace tally_reports
