#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <dspool/core/status.h>
#include <dspool/pool/endpoint.h>
#include <dspool/pool/strategy.h>
#include <dspool/resilience/backoff.h>
#include <dspool/resilience/cancellation.h>

namespace dspool::pool {

struct CursorPolicy {
    PoolStrategy strategy = PoolStrategy::round_robin;
    bool active_only = true;
    bool exhaust_on_failure = false;
    resilience::BackoffOptions backoff;
};

// Bounds a selection that keeps waiting for a live endpoint
// (active_only && !exhaust_on_failure).
struct SelectOptions {
    std::chrono::milliseconds timeout{0}; // 0: no deadline
    resilience::CancellationToken* cancel = nullptr;
};

// Per-connection selection state: a private copy of the pool's endpoint list
// and the index of the last endpoint handed out.
//
// Not thread-safe. ServerPool copies a cursor out of its lock, runs
// SelectNext() on the copy, and commits the copy back.
class PoolCursor {
public:
    PoolCursor(const CursorPolicy& policy, std::uint64_t serial, std::vector<Endpoint> snapshot,
        std::uint64_t generation, std::uint64_t seed);

    // New snapshot, index re-randomized over [0, size).
    void Refresh(std::vector<Endpoint> snapshot, std::uint64_t generation);

    // empty_pool when the snapshot is empty
    dspool::Result<Endpoint> Current() const;

    // Blocks while probing and, with active_only && !exhaust_on_failure, until
    // an endpoint is live, `opts.timeout` elapses (timeout) or `opts.cancel`
    // fires (cancelled).
    dspool::Result<Endpoint> SelectNext(const SelectOptions& opts = {});

    // Points the cursor at the first snapshot entry equal to `endpoint`.
    bool Adopt(const Endpoint& endpoint);

    std::size_t size() const { return snapshot_.size(); }
    const std::vector<Endpoint>& snapshot() const { return snapshot_; }
    std::optional<std::size_t> index() const { return index_; }

    std::uint64_t serial() const { return serial_; }
    std::uint64_t generation() const { return generation_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }
    const CursorPolicy& policy() const { return policy_; }

    std::string ToString() const;

private:
    struct Wait {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        resilience::CancellationToken* cancel = nullptr;
    };

    using SelectFn = dspool::Result<std::size_t> (PoolCursor::*)(const Wait&);

    static SelectFn Choose(PoolStrategy strategy, bool active_only);

    dspool::Result<std::size_t> SelectFirst(const Wait& wait);
    dspool::Result<std::size_t> SelectFirstActive(const Wait& wait);
    dspool::Result<std::size_t> SelectRoundRobin(const Wait& wait);
    dspool::Result<std::size_t> SelectRoundRobinActive(const Wait& wait);
    dspool::Result<std::size_t> SelectRandom(const Wait& wait);
    dspool::Result<std::size_t> SelectRandomActive(const Wait& wait);

    dspool::Result<std::size_t> ScanCircular(std::size_t start, const Wait& wait);

    // Called after pass `pass` found nothing live. ok() means: run another pass.
    dspool::Status AfterEmptyPass(int pass, const Wait& wait, const char* what);

    bool Probe(std::size_t idx) const;
    std::size_t RandomIndex(std::size_t n);
    void RandomizeIndex();

    CursorPolicy policy_;
    SelectFn select_;
    std::uint64_t serial_;
    std::vector<Endpoint> snapshot_;
    std::optional<std::size_t> index_; // engaged iff snapshot_ is non-empty
    std::uint64_t generation_;
    std::chrono::system_clock::time_point created_at_;
    std::mt19937_64 rng_;
    resilience::Backoff backoff_;
};

} // namespace dspool::pool
