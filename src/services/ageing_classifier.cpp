#include "tally_reports/services/ageing_classifier.h"

#include <algorithm>

namespace tally_reports {

AgeingClassifier::AgeingClassifier(int default_credit_period_days)
    : default_credit_period_days_(std::max(0, default_credit_period_days)) {}

CalendarDate AgeingClassifier::DueDate(const Bill& bill,
                                       const std::optional<int>& ledger_credit_period) const {
    if (bill.due_date.has_value()) {
        return *bill.due_date;
    }
    int period = default_credit_period_days_;
    if (bill.credit_period_days.has_value()) {
        period = *bill.credit_period_days;
    } else if (ledger_credit_period.has_value()) {
        period = *ledger_credit_period;
    }
    return bill.bill_date.AddDays(std::max(0, period));
}

std::int64_t AgeingClassifier::OverdueDays(const CalendarDate& due_date,
                                           const CalendarDate& as_on) {
    const auto days = CalendarDate::DaysBetween(due_date, as_on);
    return days > 0 ? days : 0;
}

AgeingBucket AgeingClassifier::BucketFor(std::int64_t overdue_days) {
    if (overdue_days <= 30) {
        return AgeingBucket::k0To30;
    }
    if (overdue_days <= 60) {
        return AgeingBucket::k31To60;
    }
    if (overdue_days <= 90) {
        return AgeingBucket::k61To90;
    }
    return AgeingBucket::kOver90;
}

OutstandingRow AgeingClassifier::Classify(const OpenBill& open,
                                          const std::optional<int>& ledger_credit_period,
                                          const CalendarDate& as_on) const {
    OutstandingRow row;
    row.ledger_name = open.bill.ledger_name;
    row.bill_ref = open.bill.bill_ref;
    row.bill_date = open.bill.bill_date;
    row.bill_type = open.bill.bill_type;
    row.voucher_type = open.bill.voucher_type;
    row.voucher_no = open.bill.voucher_number;
    row.is_receivable = open.remaining > 0;
    row.outstanding_amount = open.remaining < 0 ? -open.remaining : open.remaining;
    row.balance = open.remaining;
    row.due_date = DueDate(open.bill, ledger_credit_period);
    row.overdue_days = OverdueDays(row.due_date, as_on);
    row.ageing_bucket = BucketFor(row.overdue_days);
    return row;
}

}  // namespace tally_reports
