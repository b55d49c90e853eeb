#include "tally_reports/core/report_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace tally_reports {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool IsSectionHeader(const std::string& line) {
    return line == "report:" || line == "storage:" || line == "logging:";
}

std::unordered_map<std::string, std::string> LoadSimpleYaml(const std::string& path,
                                                            std::string* error) {
    std::unordered_map<std::string, std::string> kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || IsSectionHeader(line)) {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        if (!key.empty()) {
            kv[key] = ResolveEnvVars(Trim(line.substr(pos + 1)));
        }
    }
    return kv;
}

bool ParseBoolValue(const std::string& value, bool* out) {
    const auto normalized = Lowercase(Trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        *out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        *out = false;
        return true;
    }
    return false;
}

bool SetOptionalInt(const std::unordered_map<std::string, std::string>& kv,
                    const char* key,
                    int min_value,
                    int* target,
                    std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end() || it->second.empty()) {
        return true;
    }
    int parsed = 0;
    try {
        std::size_t consumed = 0;
        parsed = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
    } catch (const std::exception&) {
        if (error != nullptr) {
            *error = std::string("invalid integer for key: ") + key;
        }
        return false;
    }
    if (parsed < min_value) {
        if (error != nullptr) {
            *error = std::string("value out of range for key: ") + key;
        }
        return false;
    }
    *target = parsed;
    return true;
}

}  // namespace

std::string ResolveEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        const auto end = value.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);
        const auto name = value.substr(start + 2, end - start - 2);
        if (const char* env = std::getenv(name.c_str()); env != nullptr) {
            out += env;
        }
        pos = end + 1;
    }
    return out;
}

bool ReportConfigLoader::LoadFromYaml(const std::string& path,
                                      ReportFileConfig* config,
                                      std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    ReportFileConfig loaded;
    auto get_value = [&](const char* key) -> std::string {
        const auto it = kv.find(key);
        if (it == kv.end()) {
            return "";
        }
        return it->second;
    };

    if (const auto level = Lowercase(get_value("log_level")); !level.empty()) {
        if (level != "debug" && level != "info" && level != "warn" && level != "warning" &&
            level != "error") {
            if (error != nullptr) {
                *error = "invalid log_level: " + level;
            }
            return false;
        }
        loaded.runtime.log_level = level;
    }
    if (const auto sink = Lowercase(get_value("log_sink")); !sink.empty()) {
        if (sink != "stderr" && sink != "stdout") {
            if (error != nullptr) {
                *error = "invalid log_sink: " + sink;
            }
            return false;
        }
        loaded.runtime.log_sink = sink;
    }

    if (const auto policy = Lowercase(get_value("unreferenced_settlement_policy"));
        !policy.empty()) {
        if (policy == "fifo") {
            loaded.engine.unreferenced_settlement = UnreferencedSettlementMode::kFifo;
        } else if (policy == "on_account") {
            loaded.engine.unreferenced_settlement = UnreferencedSettlementMode::kOnAccount;
        } else {
            if (error != nullptr) {
                *error = "invalid unreferenced_settlement_policy: " + policy;
            }
            return false;
        }
    }
    if (const auto policy = Lowercase(get_value("inconsistency_policy")); !policy.empty()) {
        if (policy == "fail") {
            loaded.engine.inconsistency_policy = InconsistencyPolicy::kFail;
        } else if (policy == "report") {
            loaded.engine.inconsistency_policy = InconsistencyPolicy::kReport;
        } else {
            if (error != nullptr) {
                *error = "invalid inconsistency_policy: " + policy;
            }
            return false;
        }
    }
    if (const auto validate = get_value("validate_voucher_balance"); !validate.empty()) {
        if (!ParseBoolValue(validate, &loaded.engine.validate_voucher_balance)) {
            if (error != nullptr) {
                *error = "invalid bool value for validate_voucher_balance";
            }
            return false;
        }
    }
    if (!SetOptionalInt(kv,
                        "default_credit_period_days",
                        0,
                        &loaded.engine.default_credit_period_days,
                        error) ||
        !SetOptionalInt(kv, "store_max_attempts", 1, &loaded.retry.max_attempts, error) ||
        !SetOptionalInt(kv,
                        "store_initial_backoff_ms",
                        0,
                        &loaded.retry.initial_backoff_ms,
                        error) ||
        !SetOptionalInt(kv, "store_max_backoff_ms", 0, &loaded.retry.max_backoff_ms, error)) {
        return false;
    }

    loaded.tables.schema = get_value("schema");
    if (const auto table = get_value("vouchers_table"); !table.empty()) {
        loaded.tables.vouchers = table;
    }
    if (const auto table = get_value("companies_table"); !table.empty()) {
        loaded.tables.companies = table;
    }
    if (kv.find("ledgers_table") != kv.end()) {
        loaded.tables.ledgers = get_value("ledgers_table");
    }

    *config = std::move(loaded);
    return true;
}

}  // namespace tally_reports
