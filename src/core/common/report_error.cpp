#include "tally_reports/core/report_error.h"

#include <sstream>

namespace tally_reports {
namespace {

void AppendList(std::ostringstream* oss, const char* key, const std::vector<std::string>& items) {
    if (items.empty()) {
        return;
    }
    (*oss) << " " << key << "=";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            (*oss) << ",";
        }
        (*oss) << items[i];
    }
}

}  // namespace

std::string ReportErrorKindName(ReportErrorKind kind) {
    switch (kind) {
        case ReportErrorKind::kNone:
            return "none";
        case ReportErrorKind::kNotFound:
            return "not_found";
        case ReportErrorKind::kInvalidRange:
            return "invalid_range";
        case ReportErrorKind::kInconsistentData:
            return "inconsistent_data";
        case ReportErrorKind::kStorage:
            return "storage";
        case ReportErrorKind::kCancelled:
            return "cancelled";
        case ReportErrorKind::kInvalidArgument:
            return "invalid_argument";
    }
    return "unknown";
}

std::string ReportError::ToString() const {
    std::ostringstream oss;
    oss << ReportErrorKindName(kind) << ": " << message;
    if (!company.empty()) {
        oss << " company=" << company;
    }
    if (!ledger.empty()) {
        oss << " ledger=" << ledger;
    }
    if (!from_date.empty()) {
        oss << " from=" << from_date;
    }
    if (!to_date.empty()) {
        oss << " to=" << to_date;
    }
    AppendList(&oss, "vouchers", voucher_ids);
    AppendList(&oss, "bills", bill_refs);
    return oss.str();
}

bool FailWith(ReportError* error, ReportErrorKind kind, const std::string& message) {
    if (error != nullptr) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

}  // namespace tally_reports
