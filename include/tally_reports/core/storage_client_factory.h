#pragma once

#include <memory>
#include <string>

#include "tally_reports/core/sql_client.h"
#include "tally_reports/core/storage_connection_config.h"

namespace tally_reports {

class StorageClientFactory {
public:
    static std::shared_ptr<ISqlClient> CreateSqlClient(const StorageConnectionConfig& config,
                                                       std::string* error);
};

}  // namespace tally_reports
