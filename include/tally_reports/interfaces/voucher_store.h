#pragma once

#include <string>
#include <vector>

#include "tally_reports/contracts/types.h"

namespace tally_reports {

// Read-only view of a company's imported Tally data. Every call is one consistent read.
class IVoucherStore {
public:
    virtual ~IVoucherStore() = default;

    virtual bool GetCompany(const CompanyRef& company,
                            CompanyRecord* out,
                            bool* found,
                            std::string* error) const = 0;
    virtual bool LoadLedgerMasters(const CompanyRef& company,
                                   std::vector<LedgerMaster>* out,
                                   std::string* error) const = 0;
    // Rows that cannot be decoded go to `malformed` instead of failing the read.
    virtual bool LoadCompanyLegs(const CompanyRef& company,
                                 std::vector<LegRecord>* out,
                                 std::vector<MalformedRow>* malformed,
                                 std::string* error) const = 0;
};

}  // namespace tally_reports
