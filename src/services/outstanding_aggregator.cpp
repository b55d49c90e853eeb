#include "tally_reports/services/outstanding_aggregator.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "tally_reports/services/transaction_loader.h"

namespace tally_reports {
namespace {

constexpr AgeingBucket kBuckets[] = {
    AgeingBucket::k0To30,
    AgeingBucket::k31To60,
    AgeingBucket::k61To90,
    AgeingBucket::kOver90,
};

std::size_t BucketIndex(AgeingBucket bucket) {
    switch (bucket) {
        case AgeingBucket::k0To30:
            return 0;
        case AgeingBucket::k31To60:
            return 1;
        case AgeingBucket::k61To90:
            return 2;
        case AgeingBucket::kOver90:
        default:
            return 3;
    }
}

Amount Abs(Amount value) { return value < 0 ? -value : value; }

struct PartyAccumulator {
    PartySummary summary;
    std::unordered_set<std::string> vouchers;
    bool has_date{false};
};

}  // namespace

bool OutstandingAggregator::InScope(Amount signed_amount, OutstandingScope scope) {
    switch (scope) {
        case OutstandingScope::kReceivables:
            return signed_amount > 0;
        case OutstandingScope::kPayables:
            return signed_amount < 0;
        case OutstandingScope::kBoth:
        default:
            return signed_amount != 0;
    }
}

void OutstandingAggregator::Aggregate(const std::vector<LedgerOutstanding>& ledgers,
                                      OutstandingScope scope,
                                      OutstandingReport* report) {
    if (report == nullptr) {
        return;
    }
    report->report_type = scope;
    report->data.clear();
    report->ledgers.clear();
    report->on_account.clear();
    report->ageing.clear();
    for (const auto bucket : kBuckets) {
        AgeingSummary summary;
        summary.bucket = bucket;
        report->ageing.push_back(summary);
    }
    report->total_outstanding_receivables = 0;
    report->total_outstanding_payables = 0;
    report->ledger_count = 0;

    for (const auto& ledger : ledgers) {
        std::vector<OutstandingRow> rows;
        for (const auto& row : ledger.rows) {
            const Amount signed_amount =
                row.is_receivable ? row.outstanding_amount : -row.outstanding_amount;
            if (InScope(signed_amount, scope)) {
                rows.push_back(row);
            }
        }
        std::stable_sort(rows.begin(), rows.end(),
                         [](const OutstandingRow& lhs, const OutstandingRow& rhs) {
                             return lhs.bill_date < rhs.bill_date;
                         });

        LedgerSubtotal subtotal;
        subtotal.ledger_name = ledger.ledger_name;
        for (const auto& entry : ledger.on_account) {
            if (InScope(entry.amount, scope)) {
                subtotal.on_account_balance += entry.amount;
                report->on_account.push_back(entry);
            }
        }

        Amount running = 0;
        for (auto& row : rows) {
            auto& bucket = report->ageing[BucketIndex(row.ageing_bucket)];
            if (row.is_receivable) {
                running += row.outstanding_amount;
                subtotal.receivable_total += row.outstanding_amount;
                bucket.receivables += row.outstanding_amount;
            } else {
                running -= row.outstanding_amount;
                subtotal.payable_total += row.outstanding_amount;
                bucket.payables += row.outstanding_amount;
            }
            ++bucket.bill_count;
            row.balance = running;
            ++subtotal.open_bill_count;
        }

        report->total_outstanding_receivables += subtotal.receivable_total;
        report->total_outstanding_payables += subtotal.payable_total;
        if (!rows.empty()) {
            ++report->ledger_count;
        }
        if (!rows.empty() || subtotal.on_account_balance != 0) {
            report->ledgers.push_back(std::move(subtotal));
        }
        for (auto& row : rows) {
            report->data.push_back(std::move(row));
        }
    }
    report->count = static_cast<int>(report->data.size());
}

std::vector<PartySummary> OutstandingAggregator::SummarizeParties(
    const std::vector<LegRecord>& legs,
    OutstandingScope scope) {
    std::vector<PartyAccumulator> parties;
    std::unordered_map<std::string, std::size_t> index_by_name;
    for (const auto& leg : legs) {
        const auto key = TransactionLoader::NormalizeLedgerName(leg.ledger_name);
        auto it = index_by_name.find(key);
        if (it == index_by_name.end()) {
            PartyAccumulator fresh;
            fresh.summary.ledger_name = leg.ledger_name;
            it = index_by_name.emplace(key, parties.size()).first;
            parties.push_back(std::move(fresh));
        }
        auto& party = parties[it->second];
        if (leg.amount > 0) {
            party.summary.total_debit += leg.amount;
        } else {
            party.summary.total_credit -= leg.amount;
        }
        party.vouchers.insert(leg.voucher_id);
        if (!party.has_date || leg.date < party.summary.first_transaction) {
            party.summary.first_transaction = leg.date;
        }
        if (!party.has_date || party.summary.last_transaction < leg.date) {
            party.summary.last_transaction = leg.date;
        }
        party.has_date = true;
    }

    std::vector<PartySummary> out;
    for (auto& party : parties) {
        party.summary.balance = party.summary.total_debit - party.summary.total_credit;
        party.summary.transaction_count = static_cast<int>(party.vouchers.size());
        if (InScope(party.summary.balance, scope)) {
            out.push_back(std::move(party.summary));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const PartySummary& lhs, const PartySummary& rhs) {
        if (Abs(lhs.balance) != Abs(rhs.balance)) {
            return Abs(lhs.balance) > Abs(rhs.balance);
        }
        return lhs.ledger_name < rhs.ledger_name;
    });
    return out;
}

std::vector<LedgerListEntry> OutstandingAggregator::ListLedgers(
    const std::vector<LegRecord>& legs,
    const std::vector<LedgerMaster>& masters) {
    std::vector<std::pair<std::string, LedgerListEntry>> entries;
    std::unordered_map<std::string, std::size_t> index_by_name;
    const auto touch = [&](const std::string& name) -> LedgerListEntry* {
        const auto key = TransactionLoader::NormalizeLedgerName(name);
        if (key.empty()) {
            return nullptr;
        }
        auto it = index_by_name.find(key);
        if (it == index_by_name.end()) {
            LedgerListEntry entry;
            entry.ledger_name = name;
            it = index_by_name.emplace(key, entries.size()).first;
            entries.emplace_back(key, std::move(entry));
        }
        return &entries[it->second].second;
    };

    for (const auto& leg : legs) {
        if (auto* entry = touch(leg.ledger_name); entry != nullptr) {
            ++entry->leg_count;
        }
    }
    for (const auto& master : masters) {
        touch(master.name);
    }

    std::stable_sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first < rhs.first;
    });
    std::vector<LedgerListEntry> out;
    out.reserve(entries.size());
    for (auto& [key, entry] : entries) {
        out.push_back(std::move(entry));
    }
    return out;
}

}  // namespace tally_reports
