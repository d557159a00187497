#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dspool::resilience {

// One-shot cancellation flag shared between a waiting caller and whoever may
// want to abort the wait (signal handler thread, shutdown path, tests).
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Thread-safe, idempotent. Wakes every WaitFor().
    void Cancel();

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Thread-safe. Sleeps up to `d`; returns true if cancelled before or during the wait.
    bool WaitFor(std::chrono::milliseconds d);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mu_;
    std::condition_variable cv_;
};

} // namespace dspool::resilience
