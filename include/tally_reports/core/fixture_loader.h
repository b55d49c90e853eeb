#pragma once

#include <string>

#include "tally_reports/core/sql_client.h"
#include "tally_reports/core/voucher_store_client_adapter.h"

namespace tally_reports {

// Seeds a SQL client from a JSON export shaped as
// {"companies": [...], "ledgers": [...], "vouchers": [...]}, one object per row.
class FixtureLoader {
public:
    static bool LoadFromText(const std::string& text,
                             const VoucherStoreTables& tables,
                             ISqlClient* client,
                             std::string* error);
    static bool LoadFromFile(const std::string& path,
                             const VoucherStoreTables& tables,
                             ISqlClient* client,
                             std::string* error);
};

}  // namespace tally_reports
