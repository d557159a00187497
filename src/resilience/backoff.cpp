#include <dspool/resilience/backoff.h>

#include <algorithm>
#include <cmath>

namespace dspool::resilience {

Backoff::Backoff(BackoffOptions opts) : opts_(opts) {
    if (opts_.base_delay.count() < 1) {
        opts_.base_delay = std::chrono::milliseconds(1);
    }
    if (opts_.max_delay < opts_.base_delay) {
        opts_.max_delay = opts_.base_delay;
    }
    opts_.jitter_ratio = std::clamp(opts_.jitter_ratio, 0.0, 1.0);
}

std::chrono::milliseconds Backoff::DelayBeforePass(int pass, std::mt19937_64& rng) const {
    if (pass <= 1) {
        return std::chrono::milliseconds(0);
    }

    // base * 2^(pass-2), capped; the exponent is capped too so the double never overflows
    auto exp = std::min(pass - 2, 30);
    double factor = std::pow(2.0, static_cast<double>(exp));
    auto raw = static_cast<long long>(static_cast<double>(opts_.base_delay.count()) * factor);
    raw = std::min<long long>(raw, opts_.max_delay.count());

    std::uniform_real_distribution<double> dist(-opts_.jitter_ratio, opts_.jitter_ratio);
    auto jittered = static_cast<long long>(static_cast<double>(raw) * (1.0 + dist(rng)));
    jittered = std::clamp<long long>(jittered, 1, opts_.max_delay.count());

    return std::chrono::milliseconds(jittered);
}

} // namespace dspool::resilience
