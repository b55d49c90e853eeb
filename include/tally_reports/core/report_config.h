#pragma once

#include <string>

#include "tally_reports/contracts/types.h"
#include "tally_reports/core/voucher_store_client_adapter.h"

namespace tally_reports {

enum class UnreferencedSettlementMode {
    kFifo,
    kOnAccount,
};

struct ReportRuntimeConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
};

struct EngineOptions {
    int default_credit_period_days{0};
    UnreferencedSettlementMode unreferenced_settlement{UnreferencedSettlementMode::kFifo};
    InconsistencyPolicy inconsistency_policy{InconsistencyPolicy::kFail};
    bool validate_voucher_balance{true};
};

struct ReportFileConfig {
    ReportRuntimeConfig runtime;
    EngineOptions engine;
    VoucherStoreTables tables;
    StorageRetryPolicy retry;
};

// Replaces ${NAME} with the environment value; unset variables expand to "".
std::string ResolveEnvVars(const std::string& value);

class ReportConfigLoader {
public:
    static bool LoadFromYaml(const std::string& path, ReportFileConfig* config, std::string* error);
};

}  // namespace tally_reports
