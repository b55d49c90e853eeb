#pragma once

#include <memory>
#include <string>

#include "tally_reports/apps/cli_support.h"
#include "tally_reports/contracts/types.h"
#include "tally_reports/core/report_config.h"
#include "tally_reports/core/sql_client.h"
#include "tally_reports/interfaces/voucher_store.h"

namespace tally_reports::apps {

struct ReportCliContext {
    ReportFileConfig config;
    std::shared_ptr<ISqlClient> sql_client;
    std::shared_ptr<IVoucherStore> store;
    // Set when the external store could not be reached and a fallback client was returned.
    std::string storage_warning;
};

// Loads the optional YAML config and builds the voucher store: an in-memory client seeded
// from `fixture_path` when given, otherwise the client chosen by the TALLY_REPORTS_* env.
bool BootstrapReportCli(const std::string& config_path,
                        const std::string& fixture_path,
                        ReportCliContext* out,
                        std::string* error);

bool ParseCompanyArgs(const ArgMap& args, CompanyRef* out, std::string* error);
bool ParseDateArg(const ArgMap& args,
                  const std::string& key,
                  CalendarDate* out,
                  std::string* error);

// Writes `payload` to --output when given, else to stdout; then --metrics-output if set.
bool EmitCliOutput(const ArgMap& args, const std::string& payload, std::string* error);

}  // namespace tally_reports::apps
