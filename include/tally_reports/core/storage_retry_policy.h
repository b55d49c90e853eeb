#pragma once

namespace tally_reports {

// Bounded retry for storage reads issued by store adapters; the report engine never retries.
struct StorageRetryPolicy {
    int max_attempts{3};
    int initial_backoff_ms{5};
    int max_backoff_ms{100};
};

}  // namespace tally_reports
