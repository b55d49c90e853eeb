#pragma once

#include <string>

#include "tally_reports/contracts/types.h"

namespace tally_reports {

// Names the "other side" of a voucher as seen from one ledger.
class ParticularsResolver {
public:
    static constexpr const char* kFallbackParticulars = "Others";

    // `reported_ledger` is compared trimmed and case-insensitively.
    static std::string Resolve(const Voucher& voucher, const std::string& reported_ledger);
};

}  // namespace tally_reports
