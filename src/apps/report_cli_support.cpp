#include "tally_reports/apps/report_cli_support.h"

#include <iostream>
#include <utility>

#include "tally_reports/core/fixture_loader.h"
#include "tally_reports/core/storage_client_factory.h"
#include "tally_reports/core/storage_connection_config.h"
#include "tally_reports/core/voucher_store_client_adapter.h"
#include "tally_reports/monitoring/metric_registry.h"

namespace tally_reports::apps {

bool BootstrapReportCli(const std::string& config_path,
                        const std::string& fixture_path,
                        ReportCliContext* out,
                        std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "output context pointer is null";
        }
        return false;
    }

    ReportCliContext context;
    if (!config_path.empty() &&
        !ReportConfigLoader::LoadFromYaml(config_path, &context.config, error)) {
        return false;
    }

    if (!fixture_path.empty()) {
        auto memory = std::make_shared<InMemorySqlClient>();
        if (!FixtureLoader::LoadFromFile(fixture_path, context.config.tables, memory.get(),
                                         error)) {
            return false;
        }
        context.sql_client = memory;
    } else {
        const auto storage_config = StorageConnectionConfig::FromEnvironment();
        if (context.config.tables.schema.empty()) {
            context.config.tables.schema = storage_config.postgres.schema;
        }
        context.sql_client =
            StorageClientFactory::CreateSqlClient(storage_config, &context.storage_warning);
        if (context.sql_client == nullptr) {
            if (error != nullptr) {
                *error = context.storage_warning.empty() ? "unable to create sql client"
                                                         : context.storage_warning;
            }
            return false;
        }
    }

    context.store = std::make_shared<VoucherStoreClientAdapter>(
        context.sql_client, context.config.retry, context.config.tables);
    *out = std::move(context);
    return true;
}

bool ParseCompanyArgs(const ArgMap& args, CompanyRef* out, std::string* error) {
    if (out == nullptr) {
        return false;
    }
    out->guid = GetArg(args, "company-guid");
    out->alterid = GetArg(args, "company-alterid");
    if (out->guid.empty() || out->alterid.empty()) {
        if (error != nullptr) {
            *error = "--company-guid and --company-alterid are required";
        }
        return false;
    }
    return true;
}

bool ParseDateArg(const ArgMap& args,
                  const std::string& key,
                  CalendarDate* out,
                  std::string* error) {
    const auto raw = GetArg(args, key);
    if (raw.empty()) {
        if (error != nullptr) {
            *error = "--" + key + " is required";
        }
        return false;
    }
    if (!CalendarDate::Parse(raw, out)) {
        if (error != nullptr) {
            *error = "invalid date for --" + key + ": " + raw;
        }
        return false;
    }
    return true;
}

bool EmitCliOutput(const ArgMap& args, const std::string& payload, std::string* error) {
    const auto output = GetArg(args, "output");
    if (output.empty()) {
        std::cout << payload;
    } else if (!WriteTextFile(output, payload, error)) {
        return false;
    }
    const auto metrics_output = GetArg(args, "metrics-output");
    if (metrics_output.empty()) {
        return true;
    }
    return WriteTextFile(metrics_output, MetricRegistry::Instance().SerializeText(), error);
}

}  // namespace tally_reports::apps
