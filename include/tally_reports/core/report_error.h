#pragma once

#include <string>
#include <vector>

namespace tally_reports {

enum class ReportErrorKind {
    kNone,
    kNotFound,
    kInvalidRange,
    kInconsistentData,
    kStorage,
    kCancelled,
    kInvalidArgument,
};

struct ReportError {
    ReportErrorKind kind{ReportErrorKind::kNone};
    std::string message;
    std::string company;
    std::string ledger;
    std::string from_date;
    std::string to_date;
    std::vector<std::string> voucher_ids;
    std::vector<std::string> bill_refs;

    bool Ok() const { return kind == ReportErrorKind::kNone; }
    std::string ToString() const;
};

std::string ReportErrorKindName(ReportErrorKind kind);

// Fills `error` (when non-null) and returns false so callers can `return FailWith(...)`.
bool FailWith(ReportError* error, ReportErrorKind kind, const std::string& message);

}  // namespace tally_reports
