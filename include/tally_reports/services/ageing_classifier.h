#pragma once

#include <cstdint>
#include <optional>

#include "tally_reports/contracts/types.h"

namespace tally_reports {

class AgeingClassifier {
public:
    explicit AgeingClassifier(int default_credit_period_days = 0);

    // Explicit due date, else bill date plus the first credit period found on the bill, the
    // ledger, or the configured default.
    CalendarDate DueDate(const Bill& bill, const std::optional<int>& ledger_credit_period) const;
    OutstandingRow Classify(const OpenBill& open,
                            const std::optional<int>& ledger_credit_period,
                            const CalendarDate& as_on) const;

    static std::int64_t OverdueDays(const CalendarDate& due_date, const CalendarDate& as_on);
    static AgeingBucket BucketFor(std::int64_t overdue_days);

private:
    int default_credit_period_days_{0};
};

}  // namespace tally_reports
