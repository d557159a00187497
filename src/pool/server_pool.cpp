#include <dspool/pool/server_pool.h>

#include <dspool/core/log.h>
#include <dspool/core/metrics.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace dspool::pool {
namespace {

dspool::Counter& Selections(PoolStrategy strategy) {
    dspool::MetricLabels labels;
    labels.kv["strategy"] = std::string(StrategyName(strategy));
    return dspool::DefaultMetrics().CounterMetric(
        "dspool_selections_total", "Servers handed out by server pools", std::move(labels));
}

dspool::Counter& Refreshes() {
    static dspool::Counter& c = dspool::DefaultMetrics().CounterMetric(
        "dspool_refreshes_total", "Connection cursors refreshed after a pool mutation");
    return c;
}

dspool::Gauge& PoolEndpoints() {
    static dspool::Gauge& g = dspool::DefaultMetrics().GaugeMetric(
        "dspool_pool_endpoints", "Servers in the most recently mutated pool");
    return g;
}

std::uint64_t InitialSeed(const std::optional<std::uint64_t>& seed) {
    if (seed) {
        return *seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

bool IsBudgetSpent(const dspool::Status& st) {
    return st.code() == dspool::StatusCode::timeout || st.code() == dspool::StatusCode::cancelled;
}

dspool::Status Unregistered(ConnectionId connection) {
    dspool::log::error("connection <{}> not in server pool state", connection);
    return dspool::Status(dspool::StatusCode::unregistered_connection,
        "connection " + std::to_string(connection) + " not in server pool state");
}

} // namespace

ServerPool::ServerPool(PoolOptions options)
    : options_(std::move(options)),
      policy_{options_.strategy, options_.active_only, options_.exhaust_on_failure, options_.backoff},
      default_probe_(options_.default_probe),
      seeder_(InitialSeed(options_.seed)) {
    if (!default_probe_) {
        default_probe_ = std::make_shared<TcpLivenessProbe>(options_.probe_timeout);
    }
}

dspool::Result<std::unique_ptr<ServerPool>> ServerPool::Create(PoolOptions options, std::vector<EndpointLike> endpoints) {
    if (!IsKnownStrategy(options.strategy)) {
        dspool::log::error("unknown pooling strategy <{}>", static_cast<int>(options.strategy));
        return dspool::Status(dspool::StatusCode::unknown_strategy, "unknown pooling strategy");
    }
    if (options.exhaust_on_failure && !options.active_only) {
        dspool::log::error("cannot instantiate pool with exhaust and not active");
        return dspool::Status(dspool::StatusCode::invalid_policy,
            "pools can be exhausted only when checking for active servers");
    }

    std::unique_ptr<ServerPool> pool(new ServerPool(std::move(options)));
    if (!endpoints.empty()) {
        auto st = pool->AddAll(std::move(endpoints));
        if (!st.ok()) {
            return st;
        }
    }

    dspool::log::info("instantiated server pool: {} servers, strategy={}, active={}, exhaust={}",
        pool->Length(), StrategyName(pool->strategy()), pool->active_only(), pool->exhaust_on_failure());
    return std::move(pool);
}

dspool::Result<Endpoint> ServerPool::Prepare(Endpoint endpoint) const {
    auto st = ValidateEndpoint(endpoint);
    if (!st.ok()) {
        return st;
    }
    if (!endpoint.probe) {
        endpoint.probe = default_probe_;
    }
    return endpoint;
}

dspool::Result<Endpoint> ServerPool::Normalize(EndpointLike element) const {
    if (auto* address = std::get_if<std::string>(&element)) {
        auto parsed = Endpoint::Parse(*address);
        if (!parsed.ok()) {
            return parsed.status();
        }
        return Prepare(std::move(parsed).value());
    }
    return Prepare(std::get<Endpoint>(std::move(element)));
}

void ServerPool::RefreshAllLocked() {
    ++generation_;
    for (auto& kv : cursors_) {
        kv.second.Refresh(endpoints_, generation_);
        Refreshes().Inc();
    }
    PoolEndpoints().Set(static_cast<double>(endpoints_.size()));
}

dspool::Status ServerPool::Add(Endpoint endpoint) {
    auto prepared = Prepare(std::move(endpoint));
    if (!prepared.ok()) {
        dspool::log::error("cannot add server to server pool: {}", prepared.status().message());
        return prepared.status();
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (std::find(endpoints_.begin(), endpoints_.end(), prepared.value()) != endpoints_.end()) {
        dspool::log::debug("server {} already in server pool", prepared.value().ToString());
        return dspool::Status::Ok();
    }
    endpoints_.push_back(std::move(prepared).value());
    dspool::log::debug("server {} added to server pool", endpoints_.back().ToString());
    RefreshAllLocked();
    return dspool::Status::Ok();
}

dspool::Status ServerPool::AddAddress(std::string_view address) {
    auto parsed = Endpoint::Parse(address);
    if (!parsed.ok()) {
        dspool::log::error("cannot add server to server pool: {}", parsed.status().message());
        return parsed.status();
    }
    return Add(std::move(parsed).value());
}

dspool::Status ServerPool::AddAll(std::vector<EndpointLike> endpoints) {
    std::vector<Endpoint> ready;
    ready.reserve(endpoints.size());
    for (auto& element : endpoints) {
        auto r = Normalize(std::move(element));
        if (!r.ok()) {
            dspool::log::error("element must be a server in server pool: {}", r.status().message());
            return r.status();
        }
        ready.push_back(std::move(r).value());
    }

    std::lock_guard<std::mutex> lk(mu_);
    for (auto& ep : ready) {
        endpoints_.push_back(std::move(ep));
    }
    dspool::log::debug("{} servers added to server pool", ready.size());
    RefreshAllLocked();
    return dspool::Status::Ok();
}

dspool::Status ServerPool::Remove(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find(endpoints_.begin(), endpoints_.end(), endpoint);
    if (it == endpoints_.end()) {
        dspool::log::error("server {} to be removed not in server pool", endpoint.ToString());
        return dspool::Status(dspool::StatusCode::not_found, "server not in server pool");
    }
    endpoints_.erase(it);
    dspool::log::debug("server {} removed from server pool", endpoint.ToString());
    RefreshAllLocked();
    return dspool::Status::Ok();
}

dspool::Status ServerPool::RemoveAddress(std::string_view address) {
    auto parsed = Endpoint::Parse(address);
    if (!parsed.ok()) {
        return parsed.status();
    }
    return Remove(parsed.value());
}

dspool::Status ServerPool::Initialize(ConnectionId connection) {
    std::lock_guard<std::mutex> lk(mu_);
    if (endpoints_.empty()) {
        dspool::log::error("cannot initialize connection <{}>: no servers in server pool", connection);
        return dspool::Status(dspool::StatusCode::empty_pool, "no servers in server pool");
    }

    auto seed = seeder_();
    cursors_.insert_or_assign(connection, PoolCursor(policy_, next_serial_++, endpoints_, generation_, seed));
    dspool::log::debug("connection <{}> registered in server pool", connection);
    return dspool::Status::Ok();
}

dspool::Status ServerPool::Release(ConnectionId connection) {
    std::lock_guard<std::mutex> lk(mu_);
    if (cursors_.erase(connection) == 0) {
        return Unregistered(connection);
    }
    dspool::log::debug("connection <{}> released from server pool", connection);
    return dspool::Status::Ok();
}

dspool::Result<Endpoint> ServerPool::GetServer(ConnectionId connection, const SelectOptions& opts) {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (opts.timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + opts.timeout;
    }

    for (;;) {
        SelectOptions attempt = opts;
        if (deadline) {
            auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return dspool::Status(dspool::StatusCode::timeout, "timed out waiting for an active server");
            }
            attempt.timeout = left;
        }

        std::optional<PoolCursor> work;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = cursors_.find(connection);
            if (it == cursors_.end()) {
                return Unregistered(connection);
            }
            work.emplace(it->second);
        }

        // Probing happens here, on the private copy, without the lock.
        auto r = work->SelectNext(attempt);

        std::lock_guard<std::mutex> lk(mu_);
        auto it = cursors_.find(connection);
        if (it == cursors_.end()) {
            return Unregistered(connection);
        }

        auto& cursor = it->second;
        if (cursor.serial() == work->serial() && cursor.generation() == work->generation()) {
            cursor = std::move(*work);
            if (r.ok()) {
                Selections(policy_.strategy).Inc();
            }
            return r;
        }

        // The pool changed (or the connection was re-initialized) while probing.
        if (!r.ok()) {
            if (IsBudgetSpent(r.status())) {
                return r;
            }
            continue;
        }
        if (cursor.Adopt(r.value())) {
            Selections(policy_.strategy).Inc();
            return r;
        }
        dspool::log::debug("server {} left the pool during selection, selecting again", r.value().ToString());
    }
}

dspool::Result<Endpoint> ServerPool::GetCurrentServer(ConnectionId connection) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cursors_.find(connection);
    if (it == cursors_.end()) {
        return Unregistered(connection);
    }
    return it->second.Current();
}

std::size_t ServerPool::Length() const {
    std::lock_guard<std::mutex> lk(mu_);
    return endpoints_.size();
}

std::size_t ServerPool::Connections() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cursors_.size();
}

std::vector<Endpoint> ServerPool::Endpoints() const {
    std::lock_guard<std::mutex> lk(mu_);
    return endpoints_;
}

std::string ServerPool::ToString() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;
    oss << "servers:\n";
    if (endpoints_.empty()) {
        oss << "None\n";
    }
    for (const auto& ep : endpoints_) {
        oss << ep.ToString() << "\n";
    }
    oss << "Pool strategy: " << StrategyName(options_.strategy);
    oss << " - active only: " << (options_.active_only ? "True" : "False");
    oss << " - exhaust pool: " << (options_.exhaust_on_failure ? "True" : "False");
    return oss.str();
}

dspool::Result<std::string> ServerPool::Describe(ConnectionId connection) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = cursors_.find(connection);
    if (it == cursors_.end()) {
        return Unregistered(connection);
    }
    return it->second.ToString();
}

} // namespace dspool::pool
