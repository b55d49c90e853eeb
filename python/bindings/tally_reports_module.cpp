#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tally_reports/apps/report_cli_support.h"
#include "tally_reports/contracts/types.h"
#include "tally_reports/services/report_assembler.h"
#include "tally_reports/services/report_engine.h"

namespace py = pybind11;

namespace tally_reports {
namespace {

class ReportFailure : public std::runtime_error {
public:
    explicit ReportFailure(const ReportError& error) : std::runtime_error(error.ToString()) {}
};

py::object ToDecimal(Amount amount) {
    const auto decimal = py::module_::import("decimal").attr("Decimal");
    return decimal(ReportAssembler::FormatAmount(amount));
}

CalendarDate ParseDateOrThrow(const std::string& raw, const char* name) {
    CalendarDate date;
    if (!CalendarDate::Parse(raw, &date)) {
        throw py::value_error(std::string("invalid ") + name + ": " + raw);
    }
    return date;
}

std::optional<InconsistencyPolicy> ParsePolicyOrThrow(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    if (raw == "fail") {
        return InconsistencyPolicy::kFail;
    }
    if (raw == "report") {
        return InconsistencyPolicy::kReport;
    }
    throw py::value_error("invalid inconsistency_policy: " + raw);
}

py::list ToInconsistencyList(const std::vector<Inconsistency>& items) {
    py::list out;
    for (const auto& item : items) {
        py::dict entry;
        entry["kind"] = InconsistencyKindName(item.kind);
        entry["ledger_name"] = item.ledger_name;
        entry["voucher_id"] = item.voucher_id;
        entry["bill_ref"] = item.bill_ref;
        entry["amount"] = ToDecimal(item.amount);
        entry["detail"] = item.detail;
        out.append(entry);
    }
    return out;
}

py::dict ToStatementDict(const LedgerStatement& statement) {
    py::dict out;
    out["company_name"] = statement.company_name;
    out["ledger_name"] = statement.ledger_name;
    out["from_date"] = statement.from_date.ToIso();
    out["to_date"] = statement.to_date.ToIso();
    out["opening_balance"] = ToDecimal(statement.opening_balance);
    out["opening_balance_side"] = BalanceSideName(statement.opening_balance_side);
    out["total_debit"] = ToDecimal(statement.total_debit);
    out["total_credit"] = ToDecimal(statement.total_credit);
    out["closing_balance"] = ToDecimal(statement.closing_balance);
    out["closing_balance_side"] = BalanceSideName(statement.closing_balance_side);
    out["net_movement"] = ToDecimal(statement.net_movement);
    out["total_transactions"] = statement.total_transactions;
    py::list rows;
    for (const auto& row : statement.transactions) {
        py::dict item;
        item["date"] = row.date.ToIso();
        item["voucher_id"] = row.voucher_id;
        item["particulars"] = row.particulars;
        item["voucher_type"] = row.voucher_type;
        item["voucher_number"] = row.voucher_number;
        item["narration"] = row.narration;
        item["debit"] = ToDecimal(row.debit);
        item["credit"] = ToDecimal(row.credit);
        item["balance"] = ToDecimal(row.balance);
        item["balance_side"] = BalanceSideName(row.balance_side);
        rows.append(item);
    }
    out["transactions"] = rows;
    out["inconsistencies"] = ToInconsistencyList(statement.inconsistencies);
    return out;
}

py::dict ToOutstandingDict(const OutstandingReport& report) {
    py::dict out;
    out["company_name"] = report.company_name;
    out["report_type"] = OutstandingScopeName(report.report_type);
    out["as_on_date"] = report.as_on_date.ToIso();
    out["count"] = report.count;
    out["total_outstanding_receivables"] = ToDecimal(report.total_outstanding_receivables);
    out["total_outstanding_payables"] = ToDecimal(report.total_outstanding_payables);
    out["ledger_count"] = report.ledger_count;

    py::list data;
    for (const auto& row : report.data) {
        py::dict item;
        item["ledger_name"] = row.ledger_name;
        item["bill_ref"] = row.bill_ref;
        item["bill_date"] = row.bill_date.ToIso();
        item["bill_type"] = row.bill_type;
        item["voucher_type"] = row.voucher_type;
        item["voucher_no"] = row.voucher_no;
        item["outstanding_amount"] = ToDecimal(row.outstanding_amount);
        item["balance"] = ToDecimal(row.balance);
        item["is_receivable"] = row.is_receivable;
        item["due_date"] = row.due_date.ToIso();
        item["overdue_days"] = row.overdue_days;
        item["ageing_bucket"] = AgeingBucketLabel(row.ageing_bucket);
        data.append(item);
    }
    out["data"] = data;

    py::list ledgers;
    for (const auto& subtotal : report.ledgers) {
        py::dict item;
        item["ledger_name"] = subtotal.ledger_name;
        item["receivable_total"] = ToDecimal(subtotal.receivable_total);
        item["payable_total"] = ToDecimal(subtotal.payable_total);
        item["open_bill_count"] = subtotal.open_bill_count;
        item["on_account_balance"] = ToDecimal(subtotal.on_account_balance);
        ledgers.append(item);
    }
    out["ledgers"] = ledgers;

    py::list parties;
    for (const auto& party : report.parties) {
        py::dict item;
        item["ledger_name"] = party.ledger_name;
        item["total_debit"] = ToDecimal(party.total_debit);
        item["total_credit"] = ToDecimal(party.total_credit);
        item["balance"] = ToDecimal(party.balance);
        item["transaction_count"] = party.transaction_count;
        item["first_transaction"] = party.first_transaction.ToIso();
        item["last_transaction"] = party.last_transaction.ToIso();
        parties.append(item);
    }
    out["parties"] = parties;

    py::list ageing;
    for (const auto& bucket : report.ageing) {
        py::dict item;
        item["bucket"] = AgeingBucketLabel(bucket.bucket);
        item["receivables"] = ToDecimal(bucket.receivables);
        item["payables"] = ToDecimal(bucket.payables);
        item["bill_count"] = bucket.bill_count;
        ageing.append(item);
    }
    out["ageing"] = ageing;

    py::list on_account;
    for (const auto& entry : report.on_account) {
        py::dict item;
        item["ledger_name"] = entry.ledger_name;
        item["voucher_id"] = entry.voucher_id;
        item["date"] = entry.date.ToIso();
        item["amount"] = ToDecimal(entry.amount);
        item["bill_ref"] = entry.bill_ref;
        on_account.append(item);
    }
    out["on_account"] = on_account;
    out["inconsistencies"] = ToInconsistencyList(report.inconsistencies);
    return out;
}

class PyReportEngine {
public:
    PyReportEngine(const std::string& config_path, const std::string& fixture_path) {
        std::string error;
        if (!apps::BootstrapReportCli(config_path, fixture_path, &context_, &error)) {
            throw std::runtime_error("report engine bootstrap failed: " + error);
        }
        engine_ = std::make_unique<ReportEngine>(context_.store, context_.config.engine,
                                                 context_.config.runtime);
    }

    py::dict build_ledger_statement(const std::string& company_guid,
                                    const std::string& company_alterid,
                                    const std::string& ledger_name,
                                    const std::string& from_date,
                                    const std::string& to_date,
                                    const std::string& inconsistency_policy) const {
        LedgerStatementRequest request;
        request.company = CompanyRef{company_guid, company_alterid};
        request.ledger_name = ledger_name;
        request.from_date = ParseDateOrThrow(from_date, "from_date");
        request.to_date = ParseDateOrThrow(to_date, "to_date");
        request.inconsistency_policy = ParsePolicyOrThrow(inconsistency_policy);

        LedgerStatement statement;
        ReportError error;
        bool ok = false;
        {
            py::gil_scoped_release release;
            ok = engine_->BuildLedgerStatement(request, nullptr, &statement, &error);
        }
        if (!ok) {
            throw ReportFailure(error);
        }
        return ToStatementDict(statement);
    }

    py::dict build_outstanding_report(const std::string& company_guid,
                                      const std::string& company_alterid,
                                      const std::string& as_on_date,
                                      const std::string& report_type,
                                      const std::vector<std::string>& ledger_names,
                                      const std::string& inconsistency_policy) const {
        OutstandingRequest request;
        request.company = CompanyRef{company_guid, company_alterid};
        request.as_on_date = ParseDateOrThrow(as_on_date, "as_on_date");
        if (!ParseOutstandingScope(report_type, &request.scope)) {
            throw py::value_error("invalid report_type: " + report_type);
        }
        request.ledger_names = ledger_names;
        request.inconsistency_policy = ParsePolicyOrThrow(inconsistency_policy);

        OutstandingReport report;
        ReportError error;
        bool ok = false;
        {
            py::gil_scoped_release release;
            ok = engine_->BuildOutstandingReport(request, nullptr, &report, &error);
        }
        if (!ok) {
            throw ReportFailure(error);
        }
        return ToOutstandingDict(report);
    }

    py::list list_ledgers(const std::string& company_guid,
                          const std::string& company_alterid) const {
        LedgerList list;
        ReportError error;
        bool ok = false;
        {
            py::gil_scoped_release release;
            ok = engine_->ListLedgers(CompanyRef{company_guid, company_alterid}, nullptr, &list,
                                      &error);
        }
        if (!ok) {
            throw ReportFailure(error);
        }
        py::list out;
        for (const auto& entry : list.ledgers) {
            py::dict item;
            item["ledger_name"] = entry.ledger_name;
            item["leg_count"] = entry.leg_count;
            out.append(item);
        }
        return out;
    }

private:
    apps::ReportCliContext context_;
    std::unique_ptr<ReportEngine> engine_;
};

}  // namespace
}  // namespace tally_reports

PYBIND11_MODULE(tally_reports_py, m) {
    py::register_exception<tally_reports::ReportFailure>(m, "ReportError");

    py::class_<tally_reports::PyReportEngine>(m, "ReportEngine")
        .def(py::init<const std::string&, const std::string&>(), py::arg("config_path") = "",
             py::arg("fixture_path") = "")
        .def("build_ledger_statement", &tally_reports::PyReportEngine::build_ledger_statement,
             py::arg("company_guid"), py::arg("company_alterid"), py::arg("ledger_name"),
             py::arg("from_date"), py::arg("to_date"), py::arg("inconsistency_policy") = "")
        .def("build_outstanding_report", &tally_reports::PyReportEngine::build_outstanding_report,
             py::arg("company_guid"), py::arg("company_alterid"), py::arg("as_on_date"),
             py::arg("report_type") = "both",
             py::arg("ledger_names") = std::vector<std::string>{},
             py::arg("inconsistency_policy") = "")
        .def("list_ledgers", &tally_reports::PyReportEngine::list_ledgers,
             py::arg("company_guid"), py::arg("company_alterid"));
}
