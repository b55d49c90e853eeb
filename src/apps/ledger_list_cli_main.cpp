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

    CompanyRef company;
    std::string error;
    if (!ParseCompanyArgs(args, &company, &error)) {
        EmitStructuredLog(&bootstrap_runtime, "ledger_list_cli", "error", "invalid_arguments",
                          {{"error", error}});
        return 1;
    }

    ReportCliContext context;
    if (!BootstrapReportCli(GetArg(args, "config"), GetArg(args, "fixture"), &context, &error)) {
        EmitStructuredLog(&bootstrap_runtime, "ledger_list_cli", "error", "bootstrap_failed",
                          {{"config_path", GetArg(args, "config")}, {"error", error}});
        return 1;
    }
    const auto& runtime = context.config.runtime;

    const ReportEngine engine(context.store, context.config.engine, runtime);
    LedgerList list;
    ReportError report_error;
    if (!engine.ListLedgers(company, nullptr, &list, &report_error)) {
        EmitStructuredLog(&runtime, "ledger_list_cli", "error", "report_failed",
                          {{"error", report_error.ToString()}});
        if (!EmitCliOutput(args, ReportAssembler::ErrorToJson(report_error), &error)) {
            EmitStructuredLog(&runtime, "ledger_list_cli", "error", "output_failed",
                              {{"error", error}});
        }
        return 2;
    }

    if (!EmitCliOutput(args, ReportAssembler::LedgerListToJson(list.company, list.ledgers),
                       &error)) {
        EmitStructuredLog(&runtime, "ledger_list_cli", "error", "output_failed",
                          {{"error", error}});
        return 1;
    }
    return 0;
}
