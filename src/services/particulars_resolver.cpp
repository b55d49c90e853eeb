#include "tally_reports/services/particulars_resolver.h"

#include <unordered_set>
#include <vector>

#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {

std::string ParticularsResolver::Resolve(const Voucher& voucher,
                                         const std::string& reported_ledger) {
    const auto target = TransactionLoader::NormalizeLedgerName(reported_ledger);

    if (voucher.legs.size() == 2) {
        const auto& first = voucher.legs[0];
        const auto& second = voucher.legs[1];
        const bool first_is_target =
            TransactionLoader::NormalizeLedgerName(first.ledger_name) == target;
        const bool second_is_target =
            TransactionLoader::NormalizeLedgerName(second.ledger_name) == target;
        if (first_is_target != second_is_target) {
            return first_is_target ? second.ledger_name : first.ledger_name;
        }
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& leg : voucher.legs) {
        if (leg.amount == 0) {
            continue;
        }
        const auto normalized = TransactionLoader::NormalizeLedgerName(leg.ledger_name);
        if (normalized == target || !seen.insert(normalized).second) {
            continue;
        }
        names.push_back(leg.ledger_name);
    }

    if (names.empty()) {
        return voucher.voucher_type.empty() ? kFallbackParticulars : voucher.voucher_type;
    }
    std::string joined;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i != 0) {
            joined += ", ";
        }
        joined += names[i];
    }
    return joined;
}

}  // namespace tally_reports
