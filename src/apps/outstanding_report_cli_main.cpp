#include <string>

#include "tally_reports/apps/cli_support.h"
#include "tally_reports/apps/report_cli_support.h"
#include "tally_reports/core/report_config.h"
#include "tally_reports/core/structured_log.h"
#include "tally_reports/services/report_assembler.h"
#include "tally_reports/services/report_engine.h"

int main(int argc, char** argv) {
    using namespace tally_reports;
    using namespace tally_reports::apps;

    const ReportRuntimeConfig bootstrap_runtime;
    const ArgMap args = ParseArgs(argc, argv);

    OutstandingRequest request;
    std::string error;
    if (!ParseCompanyArgs(args, &request.company, &error) ||
        !ParseDateArg(args, "as-on", &request.as_on_date, &error)) {
        EmitStructuredLog(&bootstrap_runtime, "outstanding_report_cli", "error",
                          "invalid_arguments", {{"error", error}});
        return 1;
    }
    const auto report_type = GetArg(args, "report-type", "both");
    if (!ParseOutstandingScope(report_type, &request.scope)) {
        EmitStructuredLog(&bootstrap_runtime, "outstanding_report_cli", "error",
                          "invalid_arguments", {{"error", "invalid --report-type: " + report_type}});
        return 1;
    }
    request.ledger_names = CollectRepeatedArg(argc, argv, "ledger");
    if (const auto policy = GetArg(args, "inconsistency-policy"); !policy.empty()) {
        if (policy == "fail") {
            request.inconsistency_policy = InconsistencyPolicy::kFail;
        } else if (policy == "report") {
            request.inconsistency_policy = InconsistencyPolicy::kReport;
        } else {
            EmitStructuredLog(&bootstrap_runtime, "outstanding_report_cli", "error",
                              "invalid_arguments",
                              {{"error", "invalid --inconsistency-policy: " + policy}});
            return 1;
        }
    }

    ReportCliContext context;
    if (!BootstrapReportCli(GetArg(args, "config"), GetArg(args, "fixture"), &context, &error)) {
        EmitStructuredLog(&bootstrap_runtime, "outstanding_report_cli", "error",
                          "bootstrap_failed",
                          {{"config_path", GetArg(args, "config")}, {"error", error}});
        return 1;
    }
    const auto& runtime = context.config.runtime;
    if (!context.storage_warning.empty()) {
        EmitStructuredLog(&runtime, "outstanding_report_cli", "warn", "storage_degraded",
                          {{"error", context.storage_warning}});
    }

    const ReportEngine engine(context.store, context.config.engine, runtime);
    OutstandingReport report;
    ReportError report_error;
    if (!engine.BuildOutstandingReport(request, nullptr, &report, &report_error)) {
        EmitStructuredLog(&runtime, "outstanding_report_cli", "error", "report_failed",
                          {{"error", report_error.ToString()}});
        if (!EmitCliOutput(args, ReportAssembler::ErrorToJson(report_error), &error)) {
            EmitStructuredLog(&runtime, "outstanding_report_cli", "error", "output_failed",
                              {{"error", error}});
        }
        return 2;
    }

    if (!EmitCliOutput(args, ReportAssembler::OutstandingReportToJson(report), &error)) {
        EmitStructuredLog(&runtime, "outstanding_report_cli", "error", "output_failed",
                          {{"error", error}});
        return 1;
    }
    return 0;
}
