#include <dspool/resilience/cancellation.h>

namespace dspool::resilience {

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }
    cv_.notify_all();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [&] { return cancelled_.load(std::memory_order_acquire); });
}

} // namespace dspool::resilience
