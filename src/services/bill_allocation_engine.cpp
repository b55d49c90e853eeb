#include "tally_reports/services/bill_allocation_engine.h"

#include <algorithm>
#include <cctype>
#include <deque>
#include <unordered_map>
#include <utility>

#include "tally_reports/core/fixed_decimal.h"
#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {
namespace {

std::string NormalizeBillType(const std::string& raw) {
    std::string value = TransactionLoader::NormalizeLedgerName(raw);
    std::string collapsed;
    collapsed.reserve(value.size());
    bool last_space = false;
    for (const char ch : value) {
        const bool space = std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '_';
        if (space) {
            if (!last_space) {
                collapsed.push_back(' ');
            }
        } else {
            collapsed.push_back(ch);
        }
        last_space = space;
    }
    return collapsed;
}

bool FifoLess(const OpenBill* lhs, const OpenBill* rhs) {
    if (lhs->bill.bill_date != rhs->bill.bill_date) {
        return lhs->bill.bill_date < rhs->bill.bill_date;
    }
    return lhs->bill.sequence < rhs->bill.sequence;
}

OnAccountEntry MakeOnAccount(const std::string& ledger_name,
                             const LegRecord& leg,
                             Amount amount,
                             const std::string& bill_ref) {
    OnAccountEntry entry;
    entry.ledger_name = ledger_name;
    entry.voucher_id = leg.voucher_id;
    entry.date = leg.date;
    entry.amount = amount;
    entry.bill_ref = bill_ref;
    return entry;
}

}  // namespace

std::vector<OpenBill> LedgerAllocationResult::OpenBills() const {
    std::vector<OpenBill> open;
    for (const auto& bill : bills) {
        if (bill.remaining != 0) {
            open.push_back(bill);
        }
    }
    return open;
}

Amount LedgerAllocationResult::OnAccountBalance() const {
    Amount total = 0;
    for (const auto& entry : on_account) {
        total += entry.amount;
    }
    return total;
}

BillAllocationEngine::BillAllocationEngine(const IUnreferencedSettlementPolicy* policy)
    : policy_(policy) {}

std::string BillAllocationEngine::NormalizeBillRef(const std::string& ref) {
    return TransactionLoader::NormalizeLedgerName(ref);
}

LegRole BillAllocationEngine::Classify(const LegRecord& leg, bool bill_exists) {
    if (leg.amount == 0) {
        return LegRole::kSkip;
    }
    const auto type = NormalizeBillType(leg.bill_type);
    if (type == "on account" || NormalizeBillRef(leg.bill_reference).empty()) {
        return LegRole::kUnreferenced;
    }
    if (type == "agst ref") {
        return LegRole::kReferenced;
    }
    // New Ref, Advance and untyped references raise a bill the first time the name is seen.
    return bill_exists ? LegRole::kReferenced : LegRole::kOriginating;
}

LedgerAllocationResult BillAllocationEngine::Allocate(const std::string& ledger_name,
                                                      const std::vector<LegRecord>& legs,
                                                      const CalendarDate& as_of) const {
    const IUnreferencedSettlementPolicy* policy =
        policy_ != nullptr ? policy_ : &default_policy_;

    std::vector<LegRecord> ordered;
    ordered.reserve(legs.size());
    for (const auto& leg : legs) {
        if (!(as_of < leg.date)) {
            ordered.push_back(leg);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), TransactionLoader::LegOrderLess);

    LedgerAllocationResult result;
    result.ledger_name = ledger_name;
    std::deque<OpenBill> bills;
    std::vector<OpenBill*> fifo;
    std::unordered_map<std::string, OpenBill*> by_ref;
    std::int64_t sequence = 0;

    // Raise every bill first so settlements can reach bills that sort after them.
    std::vector<std::pair<const LegRecord*, LegRole>> settling;
    for (const auto& leg : ordered) {
        const auto ref_key = NormalizeBillRef(leg.bill_reference);
        const LegRole role = Classify(leg, by_ref.count(ref_key) != 0);
        if (role == LegRole::kSkip) {
            continue;
        }
        if (role != LegRole::kOriginating) {
            settling.emplace_back(&leg, role);
            continue;
        }
        OpenBill open;
        open.bill.ledger_name = ledger_name;
        open.bill.bill_ref = leg.bill_reference;
        open.bill.bill_date = leg.bill_date.value_or(leg.date);
        open.bill.bill_type = leg.bill_type.empty() ? "New Ref" : leg.bill_type;
        open.bill.original_amount = leg.amount;
        open.bill.due_date = leg.due_date;
        open.bill.credit_period_days = leg.credit_period_days;
        open.bill.voucher_id = leg.voucher_id;
        open.bill.voucher_type = leg.voucher_type;
        open.bill.voucher_number = leg.voucher_number;
        open.bill.sequence = ++sequence;
        open.remaining = leg.amount;
        bills.push_back(std::move(open));
        OpenBill* created = &bills.back();
        by_ref[ref_key] = created;
        fifo.insert(std::upper_bound(fifo.begin(), fifo.end(), created, FifoLess), created);
    }

    // Same-direction references add to their bill before any settlement is applied.
    std::vector<std::pair<const LegRecord*, LegRole>> settlements;
    settlements.reserve(settling.size());
    for (const auto& entry : settling) {
        if (entry.second == LegRole::kReferenced) {
            const auto found = by_ref.find(NormalizeBillRef(entry.first->bill_reference));
            if (found != by_ref.end() &&
                (found->second->bill.original_amount > 0) == (entry.first->amount > 0)) {
                found->second->bill.original_amount += entry.first->amount;
                found->second->remaining += entry.first->amount;
                continue;
            }
        }
        settlements.push_back(entry);
    }

    for (const auto& entry : settlements) {
        const LegRecord& leg = *entry.first;
        if (entry.second == LegRole::kUnreferenced) {
            const Amount left = policy->Apply(leg, leg.amount, fifo);
            if (left != 0) {
                result.on_account.push_back(
                    MakeOnAccount(ledger_name, leg, left, leg.bill_reference));
            }
            continue;
        }
        const auto found = by_ref.find(NormalizeBillRef(leg.bill_reference));
        if (found == by_ref.end()) {
            result.on_account.push_back(
                MakeOnAccount(ledger_name, leg, leg.amount, leg.bill_reference));
            Inconsistency item;
            item.kind = InconsistencyKind::kUnknownBillReference;
            item.ledger_name = ledger_name;
            item.voucher_id = leg.voucher_id;
            item.bill_ref = leg.bill_reference;
            item.amount = leg.amount;
            item.detail = "reference to a bill never raised on this ledger";
            result.inconsistencies.push_back(std::move(item));
            continue;
        }
        OpenBill* bill = found->second;
        const Amount excess = AllocateToBill(bill, leg, leg.amount);
        if (excess != 0) {
            result.on_account.push_back(
                MakeOnAccount(ledger_name, leg, excess, bill->bill.bill_ref));
            Inconsistency item;
            item.kind = InconsistencyKind::kOverAllocation;
            item.ledger_name = ledger_name;
            item.voucher_id = leg.voucher_id;
            item.bill_ref = bill->bill.bill_ref;
            item.amount = excess;
            item.detail = "settlement exceeds remaining bill amount by " +
                          FixedDecimal::FormatScaled(excess < 0 ? -excess : excess,
                                                     kAmountScale);
            result.inconsistencies.push_back(std::move(item));
        }
    }

    result.bills.reserve(fifo.size());
    for (const auto* bill : fifo) {
        result.bills.push_back(*bill);
    }
    return result;
}

}  // namespace tally_reports
