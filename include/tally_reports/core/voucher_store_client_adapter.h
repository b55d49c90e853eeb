#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tally_reports/core/sql_client.h"
#include "tally_reports/core/storage_retry_policy.h"
#include "tally_reports/interfaces/voucher_store.h"

namespace tally_reports {

struct VoucherStoreTables {
    std::string schema;
    std::string companies{"companies"};
    std::string vouchers{"vouchers"};
    // Optional ledger master table; empty disables master lookups.
    std::string ledgers{"ledgers"};

    std::string Qualified(const std::string& table) const;
};

// Maps the Tally export schema (companies / vouchers / ledgers row maps) into typed records.
class VoucherStoreClientAdapter : public IVoucherStore {
public:
    VoucherStoreClientAdapter(std::shared_ptr<ISqlClient> client,
                              StorageRetryPolicy retry_policy,
                              VoucherStoreTables tables);

    bool GetCompany(const CompanyRef& company,
                    CompanyRecord* out,
                    bool* found,
                    std::string* error) const override;
    bool LoadLedgerMasters(const CompanyRef& company,
                           std::vector<LedgerMaster>* out,
                           std::string* error) const override;
    bool LoadCompanyLegs(const CompanyRef& company,
                         std::vector<LegRecord>* out,
                         std::vector<MalformedRow>* malformed,
                         std::string* error) const override;

    static LedgerNature ParseLedgerNature(const std::string& raw);

private:
    bool QueryWithRetry(const std::string& table,
                        const std::string& key,
                        const std::string& value,
                        std::vector<SqlRow>* out,
                        std::string* error) const;
    static bool ParseLegRow(const SqlRow& row,
                            std::int64_t fallback_row_id,
                            LegRecord* out,
                            std::string* reason);

    std::shared_ptr<ISqlClient> client_;
    StorageRetryPolicy retry_policy_;
    VoucherStoreTables tables_;
};

}  // namespace tally_reports
