#pragma once

#include <atomic>

namespace tally_reports {

class CancellationToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace tally_reports
