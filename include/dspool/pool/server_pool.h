#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <dspool/core/status.h>
#include <dspool/pool/endpoint.h>
#include <dspool/pool/liveness_probe.h>
#include <dspool/pool/pool_cursor.h>
#include <dspool/pool/strategy.h>
#include <dspool/resilience/backoff.h>

namespace dspool::pool {

// Opaque handle the caller picks for each of its connections.
using ConnectionId = std::uint64_t;

struct PoolOptions {
    PoolStrategy strategy = PoolStrategy::round_robin;
    bool active_only = true;
    bool exhaust_on_failure = false; // requires active_only

    resilience::BackoffOptions backoff;

    // Seeds every random choice of the pool and its cursors; random_device when unset.
    std::optional<std::uint64_t> seed;

    // Attached to endpoints added without a probe. When null, a
    // TcpLivenessProbe with `probe_timeout` is used.
    std::shared_ptr<ILivenessProbe> default_probe;
    std::chrono::milliseconds probe_timeout{1000};
};

// Shared registry of candidate servers plus one selection cursor per
// connection. Every public member is thread-safe. Liveness probes run without
// holding the registry lock, so a slow probe only stalls its own connection.
class ServerPool {
public:
    // unknown_strategy, invalid_policy, or the first invalid_endpoint among `endpoints`.
    // `endpoints` is added as a sequence (see AddAll).
    static dspool::Result<std::unique_ptr<ServerPool>> Create(PoolOptions options,
        std::vector<EndpointLike> endpoints = {});

    ServerPool(const ServerPool&) = delete;
    ServerPool& operator=(const ServerPool&) = delete;

    // A single endpoint is skipped when an equal one is already present.
    dspool::Status Add(Endpoint endpoint);
    dspool::Status AddAddress(std::string_view address);

    // Appends every element, duplicates included. Either all elements are
    // valid and appended, or nothing changes (invalid_endpoint).
    dspool::Status AddAll(std::vector<EndpointLike> endpoints);

    // Removes the first equal endpoint; not_found when absent.
    dspool::Status Remove(const Endpoint& endpoint);
    dspool::Status RemoveAddress(std::string_view address);

    // (Re)creates the connection's cursor; empty_pool when there are no servers.
    dspool::Status Initialize(ConnectionId connection);

    // Drops the connection's cursor; unregistered_connection when absent.
    dspool::Status Release(ConnectionId connection);

    // Next server for the connection according to the pool's strategy.
    dspool::Result<Endpoint> GetServer(ConnectionId connection, const SelectOptions& opts = {});

    // Server most recently returned to the connection (or its initial random pick).
    dspool::Result<Endpoint> GetCurrentServer(ConnectionId connection) const;

    std::size_t Length() const;
    std::size_t Connections() const;
    std::vector<Endpoint> Endpoints() const;

    PoolStrategy strategy() const { return options_.strategy; }
    bool active_only() const { return options_.active_only; }
    bool exhaust_on_failure() const { return options_.exhaust_on_failure; }

    // Server list, strategy and flags.
    std::string ToString() const;

    // The connection's snapshot and last used server.
    dspool::Result<std::string> Describe(ConnectionId connection) const;

private:
    explicit ServerPool(PoolOptions options);

    // Parses address forms, validates, attaches the default probe when missing.
    dspool::Result<Endpoint> Normalize(EndpointLike element) const;
    dspool::Result<Endpoint> Prepare(Endpoint endpoint) const;

    // Requires mu_. Bumps the generation and refreshes every cursor.
    void RefreshAllLocked();

    const PoolOptions options_;
    const CursorPolicy policy_;
    std::shared_ptr<ILivenessProbe> default_probe_;

    mutable std::mutex mu_;
    std::vector<Endpoint> endpoints_;
    std::unordered_map<ConnectionId, PoolCursor> cursors_;
    std::uint64_t generation_ = 0;
    std::uint64_t next_serial_ = 1;
    std::mt19937_64 seeder_;
};

} // namespace dspool::pool
