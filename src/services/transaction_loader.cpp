#include "tally_reports/services/transaction_loader.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "tally_reports/core/fixed_decimal.h"

namespace tally_reports {
namespace {

bool IsAllDigits(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string StripLeadingZeros(const std::string& value) {
    const auto pos = value.find_first_not_of('0');
    if (pos == std::string::npos) {
        return "0";
    }
    return value.substr(pos);
}

void FillCompanyContext(const CompanyRef& company, ReportError* error) {
    if (error != nullptr) {
        error->company = company.guid + "/" + company.alterid;
    }
}

bool FailMalformed(const CompanyRef& company,
                   const std::vector<MalformedRow>& malformed,
                   ReportError* error) {
    FailWith(error, ReportErrorKind::kInconsistentData,
             std::to_string(malformed.size()) + " voucher row(s) could not be decoded: " +
                 malformed.front().reason);
    FillCompanyContext(company, error);
    if (error != nullptr) {
        for (const auto& row : malformed) {
            error->voucher_ids.push_back(row.voucher_id);
        }
    }
    return false;
}

}  // namespace

TransactionLoader::TransactionLoader(std::shared_ptr<IVoucherStore> store,
                                     bool validate_voucher_balance)
    : store_(std::move(store)), validate_voucher_balance_(validate_voucher_balance) {}

std::string TransactionLoader::NormalizeLedgerName(const std::string& name) {
    const auto begin = name.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = name.find_last_not_of(" \t\r\n");
    std::string normalized = name.substr(begin, end - begin + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized;
}

int TransactionLoader::CompareSortKeys(const std::string& lhs, const std::string& rhs) {
    if (IsAllDigits(lhs) && IsAllDigits(rhs)) {
        const auto left = StripLeadingZeros(lhs);
        const auto right = StripLeadingZeros(rhs);
        if (left.size() != right.size()) {
            return left.size() < right.size() ? -1 : 1;
        }
        return left.compare(right) < 0 ? -1 : (left == right ? 0 : 1);
    }
    const int cmp = lhs.compare(rhs);
    return cmp < 0 ? -1 : (cmp == 0 ? 0 : 1);
}

bool TransactionLoader::LegOrderLess(const LegRecord& lhs, const LegRecord& rhs) {
    if (lhs.date != rhs.date) {
        return lhs.date < rhs.date;
    }
    if (const int cmp = CompareSortKeys(lhs.sort_key, rhs.sort_key); cmp != 0) {
        return cmp < 0;
    }
    if (lhs.voucher_id != rhs.voucher_id) {
        return lhs.voucher_id < rhs.voucher_id;
    }
    return lhs.row_id < rhs.row_id;
}

bool TransactionLoader::VoucherOrderLess(const Voucher& lhs, const Voucher& rhs) {
    if (lhs.date != rhs.date) {
        return lhs.date < rhs.date;
    }
    if (const int cmp = CompareSortKeys(lhs.sort_key, rhs.sort_key); cmp != 0) {
        return cmp < 0;
    }
    return lhs.voucher_id < rhs.voucher_id;
}

std::vector<Voucher> TransactionLoader::GroupIntoVouchers(const std::vector<LegRecord>& legs) {
    std::vector<Voucher> vouchers;
    std::unordered_map<std::string, std::size_t> index_by_id;
    for (const auto& leg : legs) {
        auto it = index_by_id.find(leg.voucher_id);
        if (it == index_by_id.end()) {
            Voucher voucher;
            voucher.voucher_id = leg.voucher_id;
            voucher.date = leg.date;
            voucher.voucher_type = leg.voucher_type;
            voucher.voucher_number = leg.voucher_number;
            voucher.sort_key = leg.sort_key;
            voucher.narration = leg.narration;
            it = index_by_id.emplace(leg.voucher_id, vouchers.size()).first;
            vouchers.push_back(std::move(voucher));
        }
        auto& voucher = vouchers[it->second];
        if (voucher.narration.empty()) {
            voucher.narration = leg.narration;
        }
        voucher.legs.push_back(leg);
    }
    for (auto& voucher : vouchers) {
        std::stable_sort(voucher.legs.begin(), voucher.legs.end(),
                         [](const LegRecord& lhs, const LegRecord& rhs) {
                             return lhs.row_id < rhs.row_id;
                         });
    }
    std::stable_sort(vouchers.begin(), vouchers.end(), VoucherOrderLess);
    return vouchers;
}

std::vector<Inconsistency> TransactionLoader::FindUnbalancedVouchers(
    const std::vector<Voucher>& vouchers) {
    std::vector<Inconsistency> found;
    for (const auto& voucher : vouchers) {
        Amount sum = 0;
        for (const auto& leg : voucher.legs) {
            sum += leg.amount;
        }
        if (sum == 0) {
            continue;
        }
        Inconsistency item;
        item.kind = InconsistencyKind::kUnbalancedVoucher;
        item.voucher_id = voucher.voucher_id;
        item.amount = sum;
        item.detail = "legs sum to " + FixedDecimal::FormatScaled(sum, kAmountScale);
        found.push_back(std::move(item));
    }
    return found;
}

bool TransactionLoader::LoadLedger(const LedgerLoadRequest& request,
                                   LoadedLedger* out,
                                   ReportError* error) const {
    if (out == nullptr) {
        return FailWith(error, ReportErrorKind::kInvalidArgument, "output ledger pointer is null");
    }
    const auto target = NormalizeLedgerName(request.ledger_name);
    if (target.empty()) {
        return FailWith(error, ReportErrorKind::kInvalidArgument, "ledger name is empty");
    }
    if (request.to_date < request.from_date) {
        FailWith(error, ReportErrorKind::kInvalidRange, "from_date is after to_date");
        if (error != nullptr) {
            error->ledger = request.ledger_name;
            error->from_date = request.from_date.ToIso();
            error->to_date = request.to_date.ToIso();
        }
        return false;
    }

    LoadedCompany company;
    if (!LoadCompanyLegs(request.company, std::nullopt, &company, error)) {
        return false;
    }

    LoadedLedger loaded;
    loaded.company = company.company;

    const LedgerMaster* master = nullptr;
    for (const auto& candidate : company.masters) {
        if (NormalizeLedgerName(candidate.name) == target) {
            master = &candidate;
            break;
        }
    }

    std::unordered_set<std::string> voucher_ids;
    bool seen_leg = false;
    Amount opening = master == nullptr ? 0 : master->opening_balance;
    for (const auto& leg : company.legs) {
        if (NormalizeLedgerName(leg.ledger_name) != target) {
            continue;
        }
        if (!seen_leg) {
            seen_leg = true;
            loaded.ledger_name = leg.ledger_name;
            loaded.nature = leg.ledger_nature;
        }
        if (leg.date < request.from_date) {
            if (master == nullptr || !master->opening_date.has_value() ||
                !(leg.date < *master->opening_date)) {
                opening += leg.amount;
            }
            continue;
        }
        if (request.to_date < leg.date) {
            continue;
        }
        voucher_ids.insert(leg.voucher_id);
    }

    if (master == nullptr && !seen_leg) {
        FailWith(error, ReportErrorKind::kNotFound, "ledger not found: " + request.ledger_name);
        FillCompanyContext(request.company, error);
        if (error != nullptr) {
            error->ledger = request.ledger_name;
        }
        return false;
    }
    if (master != nullptr) {
        loaded.ledger_name = master->name;
        if (master->nature != LedgerNature::kUnknown) {
            loaded.nature = master->nature;
        }
    }
    loaded.opening_balance = opening;

    std::vector<LegRecord> in_range;
    for (const auto& leg : company.legs) {
        if (voucher_ids.count(leg.voucher_id) != 0) {
            in_range.push_back(leg);
        }
    }
    loaded.vouchers = GroupIntoVouchers(in_range);
    if (validate_voucher_balance_) {
        loaded.inconsistencies = FindUnbalancedVouchers(loaded.vouchers);
        for (auto& item : loaded.inconsistencies) {
            item.ledger_name = loaded.ledger_name;
        }
    }
    *out = std::move(loaded);
    return true;
}

bool TransactionLoader::LoadCompanyLegs(const CompanyRef& company,
                                        const std::optional<CalendarDate>& as_of,
                                        LoadedCompany* out,
                                        ReportError* error) const {
    if (out == nullptr) {
        return FailWith(error, ReportErrorKind::kInvalidArgument, "output company pointer is null");
    }
    if (store_ == nullptr) {
        return FailWith(error, ReportErrorKind::kStorage, "voucher store is not configured");
    }

    LoadedCompany loaded;
    bool found = false;
    std::string store_error;
    if (!store_->GetCompany(company, &loaded.company, &found, &store_error)) {
        FailWith(error, ReportErrorKind::kStorage, store_error);
        FillCompanyContext(company, error);
        return false;
    }
    if (!found) {
        FailWith(error, ReportErrorKind::kNotFound,
                 "company not found: " + company.guid + "/" + company.alterid);
        FillCompanyContext(company, error);
        return false;
    }
    if (!store_->LoadLedgerMasters(company, &loaded.masters, &store_error)) {
        FailWith(error, ReportErrorKind::kStorage, store_error);
        FillCompanyContext(company, error);
        return false;
    }

    std::vector<LegRecord> legs;
    std::vector<MalformedRow> malformed;
    if (!store_->LoadCompanyLegs(company, &legs, &malformed, &store_error)) {
        FailWith(error, ReportErrorKind::kStorage, store_error);
        FillCompanyContext(company, error);
        return false;
    }
    if (!malformed.empty()) {
        return FailMalformed(company, malformed, error);
    }

    std::stable_sort(legs.begin(), legs.end(), LegOrderLess);
    if (!legs.empty()) {
        loaded.earliest_date = legs.front().date;
    }
    if (as_of.has_value()) {
        legs.erase(std::remove_if(legs.begin(), legs.end(),
                                  [&as_of](const LegRecord& leg) { return *as_of < leg.date; }),
                   legs.end());
    }
    loaded.legs = std::move(legs);
    *out = std::move(loaded);
    return true;
}

}  // namespace tally_reports
