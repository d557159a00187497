#include <dspool/pool/pool_cursor.h>

#include <dspool/core/log.h>
#include <dspool/core/metrics.h>

#include <algorithm>
#include <sstream>
#include <thread>
#include <utility>

namespace dspool::pool {
namespace {

dspool::Counter& ProbeFailures() {
    static dspool::Counter& c = dspool::DefaultMetrics().CounterMetric(
        "dspool_probe_failures_total", "Liveness probes that reported an endpoint as unusable");
    return c;
}

dspool::Counter& Exhaustions() {
    static dspool::Counter& c = dspool::DefaultMetrics().CounterMetric(
        "dspool_pool_exhausted_total", "Active scans that found no live endpoint with exhaust set");
    return c;
}

} // namespace

PoolCursor::PoolCursor(const CursorPolicy& policy, std::uint64_t serial, std::vector<Endpoint> snapshot,
    std::uint64_t generation, std::uint64_t seed)
    : policy_(policy),
      select_(Choose(policy.strategy, policy.active_only)),
      serial_(serial),
      snapshot_(std::move(snapshot)),
      generation_(generation),
      created_at_(std::chrono::system_clock::now()),
      rng_(seed),
      backoff_(policy.backoff) {
    RandomizeIndex();
}

PoolCursor::SelectFn PoolCursor::Choose(PoolStrategy strategy, bool active_only) {
    switch (strategy) {
        case PoolStrategy::first:
            return active_only ? &PoolCursor::SelectFirstActive : &PoolCursor::SelectFirst;
        case PoolStrategy::round_robin:
            return active_only ? &PoolCursor::SelectRoundRobinActive : &PoolCursor::SelectRoundRobin;
        case PoolStrategy::random:
            return active_only ? &PoolCursor::SelectRandomActive : &PoolCursor::SelectRandom;
    }
    // ServerPool::Create rejects unknown strategies before any cursor exists.
    return &PoolCursor::SelectFirst;
}

void PoolCursor::Refresh(std::vector<Endpoint> snapshot, std::uint64_t generation) {
    snapshot_ = std::move(snapshot);
    generation_ = generation;
    RandomizeIndex();
}

std::size_t PoolCursor::RandomIndex(std::size_t n) {
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng_);
}

void PoolCursor::RandomizeIndex() {
    if (snapshot_.empty()) {
        index_.reset();
        return;
    }
    index_ = RandomIndex(snapshot_.size());
}

dspool::Result<Endpoint> PoolCursor::Current() const {
    if (!index_) {
        return dspool::Status(dspool::StatusCode::empty_pool, "no servers in server pool");
    }
    return snapshot_[*index_];
}

dspool::Result<Endpoint> PoolCursor::SelectNext(const SelectOptions& opts) {
    if (snapshot_.empty()) {
        dspool::log::error("no servers in server pool (connection cursor #{})", serial_);
        return dspool::Status(dspool::StatusCode::empty_pool, "no servers in server pool");
    }

    Wait wait;
    wait.cancel = opts.cancel;
    if (opts.timeout.count() > 0) {
        wait.deadline = std::chrono::steady_clock::now() + opts.timeout;
    }

    auto r = (this->*select_)(wait);
    if (!r.ok()) {
        return r.status();
    }

    index_ = r.value();
    const auto& ep = snapshot_[*index_];
    dspool::log::debug("server returned from server pool: <{}> (index {})", ep.ToString(), *index_);
    return ep;
}

bool PoolCursor::Adopt(const Endpoint& endpoint) {
    auto it = std::find(snapshot_.begin(), snapshot_.end(), endpoint);
    if (it == snapshot_.end()) {
        return false;
    }
    index_ = static_cast<std::size_t>(it - snapshot_.begin());
    return true;
}

bool PoolCursor::Probe(std::size_t idx) const {
    if (snapshot_[idx].CheckAvailability()) {
        return true;
    }
    ProbeFailures().Inc();
    return false;
}

dspool::Result<std::size_t> PoolCursor::SelectFirst(const Wait&) {
    return std::size_t{0};
}

dspool::Result<std::size_t> PoolCursor::SelectFirstActive(const Wait& wait) {
    return ScanCircular(0, wait);
}

dspool::Result<std::size_t> PoolCursor::SelectRoundRobin(const Wait&) {
    return (*index_ + 1) % snapshot_.size();
}

dspool::Result<std::size_t> PoolCursor::SelectRoundRobinActive(const Wait& wait) {
    return ScanCircular(*index_ + 1, wait);
}

dspool::Result<std::size_t> PoolCursor::SelectRandom(const Wait&) {
    return RandomIndex(snapshot_.size());
}

dspool::Result<std::size_t> PoolCursor::SelectRandomActive(const Wait& wait) {
    const auto n = snapshot_.size();
    std::vector<std::size_t> pending;
    pending.reserve(n);

    for (int pass = 1;; ++pass) {
        pending.clear();
        for (std::size_t i = 0; i < n; ++i) {
            pending.push_back(i);
        }

        // sampling without replacement: each index is probed at most once per pass
        while (!pending.empty()) {
            auto pick = RandomIndex(pending.size());
            auto idx = pending[pick];
            pending[pick] = pending.back();
            pending.pop_back();

            if (Probe(idx)) {
                return idx;
            }
        }

        auto st = AfterEmptyPass(pass, wait, "no random active server in server pool");
        if (!st.ok()) {
            return st;
        }
    }
}

dspool::Result<std::size_t> PoolCursor::ScanCircular(std::size_t start, const Wait& wait) {
    const auto n = snapshot_.size();
    start %= n;

    for (int pass = 1;; ++pass) {
        for (std::size_t i = 0; i < n; ++i) {
            auto idx = (start + i) % n;
            if (Probe(idx)) {
                return idx;
            }
        }

        auto st = AfterEmptyPass(pass, wait, "no active server available in server pool");
        if (!st.ok()) {
            return st;
        }
    }
}

dspool::Status PoolCursor::AfterEmptyPass(int pass, const Wait& wait, const char* what) {
    if (policy_.exhaust_on_failure) {
        Exhaustions().Inc();
        dspool::log::error("{} ({} servers checked)", what, snapshot_.size());
        return dspool::Status(dspool::StatusCode::pool_exhausted, what);
    }

    if (pass == 1) {
        dspool::log::warn("{}, waiting for a server to become available", what);
    }

    auto delay = backoff_.DelayBeforePass(pass + 1, rng_);

    if (wait.deadline) {
        auto now = std::chrono::steady_clock::now();
        if (now >= *wait.deadline) {
            return dspool::Status(dspool::StatusCode::timeout, "timed out waiting for an active server");
        }
        auto left = std::chrono::ceil<std::chrono::milliseconds>(*wait.deadline - now);
        delay = std::min(delay, left);
    }

    if (wait.cancel != nullptr) {
        if (wait.cancel->WaitFor(delay)) {
            return dspool::Status(dspool::StatusCode::cancelled, "server selection cancelled");
        }
    } else {
        std::this_thread::sleep_for(delay);
    }

    if (wait.deadline && std::chrono::steady_clock::now() >= *wait.deadline) {
        return dspool::Status(dspool::StatusCode::timeout, "timed out waiting for an active server");
    }
    return dspool::Status::Ok();
}

std::string PoolCursor::ToString() const {
    std::ostringstream oss;
    oss << "servers:\n";
    if (snapshot_.empty()) {
        oss << "None\n";
    }
    for (const auto& ep : snapshot_) {
        oss << ep.ToString() << "\n";
    }
    oss << "Pool strategy: " << StrategyName(policy_.strategy);
    oss << " - Last used server: " << (index_ ? snapshot_[*index_].ToString() : std::string("None"));
    return oss.str();
}

} // namespace dspool::pool
