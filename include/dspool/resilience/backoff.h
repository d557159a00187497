#pragma once

#include <chrono>
#include <random>

namespace dspool::resilience {

struct BackoffOptions {
    std::chrono::milliseconds base_delay{10};
    std::chrono::milliseconds max_delay{1000};
    double jitter_ratio = 0.2; // [0,1]
};

// Delay between full passes of a scan that found nothing usable.
class Backoff {
public:
    explicit Backoff(BackoffOptions opts);

    const BackoffOptions& options() const { return opts_; }

    // pass: 1.., returns the wait before running that pass (pass=1 returns 0)
    std::chrono::milliseconds DelayBeforePass(int pass, std::mt19937_64& rng) const;

private:
    BackoffOptions opts_;
};

} // namespace dspool::resilience
