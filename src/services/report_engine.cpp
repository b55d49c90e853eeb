#include "tally_reports/services/report_engine.h"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "tally_reports/monitoring/metric_registry.h"
#include "tally_reports/services/ageing_classifier.h"
#include "tally_reports/services/bill_allocation_engine.h"
#include "tally_reports/services/outstanding_aggregator.h"
#include "tally_reports/services/report_assembler.h"
#include "tally_reports/services/running_balance_calculator.h"

namespace tally_reports {
namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

std::string CompanyLabel(const CompanyRef& company) {
    return company.guid + "/" + company.alterid;
}

bool IsFatal(const Inconsistency& item) {
    return item.kind == InconsistencyKind::kUnbalancedVoucher ||
           item.kind == InconsistencyKind::kOverAllocation;
}

struct LedgerGroup {
    std::string display_name;
    const LedgerMaster* master{nullptr};
    std::vector<LegRecord> legs;
    bool has_bill_reference{false};
};

}  // namespace

ReportEngine::ReportEngine(std::shared_ptr<IVoucherStore> store,
                           EngineOptions options,
                           ReportRuntimeConfig runtime)
    : loader_(std::move(store), options.validate_voucher_balance),
      options_(options),
      runtime_(std::move(runtime)),
      settlement_policy_(MakeSettlementPolicy(options.unreferenced_settlement)) {}

bool ReportEngine::CheckCancelled(const CancellationToken* cancel,
                                  const std::string& phase,
                                  ReportError* error) const {
    if (cancel == nullptr || !cancel->IsCancelled()) {
        return true;
    }
    return FailWith(error, ReportErrorKind::kCancelled, "request cancelled before " + phase);
}

bool ReportEngine::EnforceInconsistencyPolicy(InconsistencyPolicy policy,
                                              const std::vector<Inconsistency>& inconsistencies,
                                              ReportError* error) const {
    if (policy == InconsistencyPolicy::kReport) {
        return true;
    }
    std::vector<std::string> voucher_ids;
    std::vector<std::string> bill_refs;
    std::unordered_set<std::string> seen_vouchers;
    std::unordered_set<std::string> seen_bills;
    std::size_t fatal = 0;
    InconsistencyKind first_kind = InconsistencyKind::kUnbalancedVoucher;
    for (const auto& item : inconsistencies) {
        if (!IsFatal(item)) {
            continue;
        }
        if (fatal++ == 0) {
            first_kind = item.kind;
        }
        if (!item.voucher_id.empty() && seen_vouchers.insert(item.voucher_id).second) {
            voucher_ids.push_back(item.voucher_id);
        }
        if (!item.bill_ref.empty() && seen_bills.insert(item.bill_ref).second) {
            bill_refs.push_back(item.bill_ref);
        }
    }
    if (fatal == 0) {
        return true;
    }
    FailWith(error, ReportErrorKind::kInconsistentData,
             std::to_string(fatal) + " inconsistency(ies) found: " +
                 InconsistencyKindName(first_kind));
    if (error != nullptr) {
        error->voucher_ids = std::move(voucher_ids);
        error->bill_refs = std::move(bill_refs);
    }
    return false;
}

void ReportEngine::Finish(const std::string& report,
                          const std::string& event,
                          bool ok,
                          double latency_ms,
                          const LogFields& fields,
                          const ReportError& error) const {
    RecordReportRequest(report, ok ? "ok" : ReportErrorKindName(error.kind), latency_ms);
    LogFields log_fields = fields;
    log_fields.emplace_back("latency_ms", std::to_string(latency_ms));
    if (ok) {
        EmitStructuredLog(&runtime_, "report_engine", "info", event, log_fields);
        return;
    }
    log_fields.emplace_back("report", report);
    log_fields.emplace_back("error_kind", ReportErrorKindName(error.kind));
    log_fields.emplace_back("error", error.message);
    const std::string level = error.kind == ReportErrorKind::kStorage ? "error" : "warn";
    EmitStructuredLog(&runtime_, "report_engine", level, "report_failed", log_fields);
}

bool ReportEngine::BuildLedgerStatement(const LedgerStatementRequest& request,
                                        const CancellationToken* cancel,
                                        LedgerStatement* out,
                                        ReportError* error) const {
    const auto started = std::chrono::steady_clock::now();
    ReportError local_error;
    ReportError* sink = error != nullptr ? error : &local_error;
    const bool ok = RunLedgerStatement(request, cancel, out, sink);
    Finish("ledger_statement", "ledger_statement_built", ok, ElapsedMs(started),
           {{"company", CompanyLabel(request.company)},
            {"ledger", request.ledger_name},
            {"from", request.from_date.ToIso()},
            {"to", request.to_date.ToIso()},
            {"rows", ok && out != nullptr ? std::to_string(out->total_transactions) : "0"}},
           *sink);
    return ok;
}

bool ReportEngine::RunLedgerStatement(const LedgerStatementRequest& request,
                                      const CancellationToken* cancel,
                                      LedgerStatement* out,
                                      ReportError* error) const {
    if (out == nullptr) {
        return FailWith(error, ReportErrorKind::kInvalidArgument, "output statement is null");
    }
    if (!CheckCancelled(cancel, "load", error)) {
        return false;
    }

    LedgerLoadRequest load_request;
    load_request.company = request.company;
    load_request.ledger_name = request.ledger_name;
    load_request.from_date = request.from_date;
    load_request.to_date = request.to_date;
    LoadedLedger loaded;
    if (!loader_.LoadLedger(load_request, &loaded, error)) {
        return false;
    }
    if (!CheckCancelled(cancel, "running balance", error)) {
        return false;
    }

    const auto policy = request.inconsistency_policy.value_or(options_.inconsistency_policy);
    if (!EnforceInconsistencyPolicy(policy, loaded.inconsistencies, error)) {
        if (error != nullptr) {
            error->company = CompanyLabel(request.company);
            error->ledger = loaded.ledger_name;
            error->from_date = request.from_date.ToIso();
            error->to_date = request.to_date.ToIso();
        }
        return false;
    }

    RunningBalanceResult balances;
    RunningBalanceCalculator::Build(loaded.opening_balance, loaded.vouchers, loaded.ledger_name,
                                    loaded.nature, &balances);
    if (!CheckCancelled(cancel, "assembly", error)) {
        return false;
    }

    *out = ReportAssembler::AssembleLedgerStatement(loaded, balances, request.from_date,
                                                    request.to_date);
    return true;
}

bool ReportEngine::BuildOutstandingReport(const OutstandingRequest& request,
                                          const CancellationToken* cancel,
                                          OutstandingReport* out,
                                          ReportError* error) const {
    const auto started = std::chrono::steady_clock::now();
    ReportError local_error;
    ReportError* sink = error != nullptr ? error : &local_error;
    const bool ok = RunOutstandingReport(request, cancel, out, sink);
    Finish("outstanding", "outstanding_report_built", ok, ElapsedMs(started),
           {{"company", CompanyLabel(request.company)},
            {"as_on", request.as_on_date.ToIso()},
            {"report_type", OutstandingScopeName(request.scope)},
            {"rows", ok && out != nullptr ? std::to_string(out->count) : "0"}},
           *sink);
    return ok;
}

bool ReportEngine::RunOutstandingReport(const OutstandingRequest& request,
                                        const CancellationToken* cancel,
                                        OutstandingReport* out,
                                        ReportError* error) const {
    if (out == nullptr) {
        return FailWith(error, ReportErrorKind::kInvalidArgument, "output report is null");
    }
    if (!CheckCancelled(cancel, "load", error)) {
        return false;
    }

    LoadedCompany company;
    if (!loader_.LoadCompanyLegs(request.company, request.as_on_date, &company, error)) {
        return false;
    }
    if (company.earliest_date.has_value() && request.as_on_date < *company.earliest_date) {
        FailWith(error, ReportErrorKind::kInvalidRange,
                 "as_on_date precedes the first voucher (" + company.earliest_date->ToIso() + ")");
        if (error != nullptr) {
            error->company = CompanyLabel(request.company);
            error->to_date = request.as_on_date.ToIso();
        }
        return false;
    }
    if (!CheckCancelled(cancel, "bill allocation", error)) {
        return false;
    }

    std::unordered_map<std::string, const LedgerMaster*> masters;
    for (const auto& master : company.masters) {
        masters.emplace(TransactionLoader::NormalizeLedgerName(master.name), &master);
    }

    std::vector<LedgerGroup> groups;
    std::unordered_map<std::string, std::size_t> group_index;
    for (const auto& leg : company.legs) {
        const auto key = TransactionLoader::NormalizeLedgerName(leg.ledger_name);
        auto it = group_index.find(key);
        if (it == group_index.end()) {
            LedgerGroup group;
            group.display_name = leg.ledger_name;
            if (const auto master = masters.find(key); master != masters.end()) {
                group.master = master->second;
                group.display_name = master->second->name;
            }
            it = group_index.emplace(key, groups.size()).first;
            groups.push_back(std::move(group));
        }
        auto& group = groups[it->second];
        if (!leg.bill_reference.empty()) {
            group.has_bill_reference = true;
        }
        group.legs.push_back(leg);
    }

    std::unordered_set<std::string> requested;
    for (const auto& name : request.ledger_names) {
        const auto key = TransactionLoader::NormalizeLedgerName(name);
        if (key.empty()) {
            return FailWith(error, ReportErrorKind::kInvalidArgument, "ledger name is empty");
        }
        if (group_index.find(key) == group_index.end() && masters.find(key) == masters.end()) {
            FailWith(error, ReportErrorKind::kNotFound, "ledger not found: " + name);
            if (error != nullptr) {
                error->company = CompanyLabel(request.company);
                error->ledger = name;
            }
            return false;
        }
        requested.insert(key);
    }

    std::vector<const LedgerGroup*> selected;
    for (const auto& group : groups) {
        const auto key = TransactionLoader::NormalizeLedgerName(group.display_name);
        if (!requested.empty()) {
            if (requested.count(key) != 0) {
                selected.push_back(&group);
            }
            continue;
        }
        if (group.has_bill_reference || (group.master != nullptr && group.master->is_bill_wise)) {
            selected.push_back(&group);
        }
    }

    std::vector<Inconsistency> inconsistencies;
    if (options_.validate_voucher_balance) {
        inconsistencies = TransactionLoader::FindUnbalancedVouchers(
            TransactionLoader::GroupIntoVouchers(company.legs));
    }

    const BillAllocationEngine allocator(settlement_policy_.get());
    std::vector<LedgerAllocationResult> allocations;
    allocations.reserve(selected.size());
    for (const auto* group : selected) {
        auto result = allocator.Allocate(group->display_name, group->legs, request.as_on_date);
        inconsistencies.insert(inconsistencies.end(), result.inconsistencies.begin(),
                               result.inconsistencies.end());
        allocations.push_back(std::move(result));
    }
    if (!CheckCancelled(cancel, "ageing", error)) {
        return false;
    }

    const auto policy = request.inconsistency_policy.value_or(options_.inconsistency_policy);
    if (!EnforceInconsistencyPolicy(policy, inconsistencies, error)) {
        if (error != nullptr) {
            error->company = CompanyLabel(request.company);
            error->to_date = request.as_on_date.ToIso();
        }
        return false;
    }

    const AgeingClassifier classifier(options_.default_credit_period_days);
    std::vector<LedgerOutstanding> ledgers;
    ledgers.reserve(allocations.size());
    for (std::size_t i = 0; i < allocations.size(); ++i) {
        const auto* master = selected[i]->master;
        const std::optional<int> ledger_credit_period =
            master == nullptr ? std::nullopt : master->credit_period_days;
        LedgerOutstanding ledger;
        ledger.ledger_name = allocations[i].ledger_name;
        for (const auto& bill : allocations[i].bills) {
            if (bill.remaining == 0) {
                continue;
            }
            ledger.rows.push_back(
                classifier.Classify(bill, ledger_credit_period, request.as_on_date));
        }
        ledger.on_account = allocations[i].on_account;
        ledgers.push_back(std::move(ledger));
    }
    if (!CheckCancelled(cancel, "aggregation", error)) {
        return false;
    }

    OutstandingReport report;
    report.company_name = company.company.name;
    report.as_on_date = request.as_on_date;
    OutstandingAggregator::Aggregate(ledgers, request.scope, &report);

    std::vector<LegRecord> selected_legs;
    for (const auto* group : selected) {
        selected_legs.insert(selected_legs.end(), group->legs.begin(), group->legs.end());
    }
    report.parties = OutstandingAggregator::SummarizeParties(selected_legs, request.scope);
    report.inconsistencies = std::move(inconsistencies);
    if (!CheckCancelled(cancel, "assembly", error)) {
        return false;
    }

    *out = std::move(report);
    return true;
}

bool ReportEngine::ListLedgers(const CompanyRef& company,
                               const CancellationToken* cancel,
                               LedgerList* out,
                               ReportError* error) const {
    const auto started = std::chrono::steady_clock::now();
    ReportError local_error;
    ReportError* sink = error != nullptr ? error : &local_error;

    bool ok = false;
    LoadedCompany loaded;
    if (out == nullptr) {
        FailWith(sink, ReportErrorKind::kInvalidArgument, "output ledger list is null");
    } else if (CheckCancelled(cancel, "load", sink) &&
               loader_.LoadCompanyLegs(company, std::nullopt, &loaded, sink) &&
               CheckCancelled(cancel, "aggregation", sink)) {
        out->company = loaded.company;
        out->ledgers = OutstandingAggregator::ListLedgers(loaded.legs, loaded.masters);
        ok = true;
    }
    Finish("ledger_list", "ledger_list_built", ok, ElapsedMs(started),
           {{"company", CompanyLabel(company)},
            {"ledgers", ok ? std::to_string(out->ledgers.size()) : "0"}},
           *sink);
    return ok;
}

}  // namespace tally_reports
