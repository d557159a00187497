#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace dspool::pool {

struct Endpoint;

class ILivenessProbe {
public:
    virtual ~ILivenessProbe() = default;

    // Thread-safe. May block on network I/O.
    virtual bool CheckAvailability(const Endpoint& endpoint) = 0;
};

// Opens (and immediately closes) a TCP connection to host:port.
class TcpLivenessProbe final : public ILivenessProbe {
public:
    explicit TcpLivenessProbe(std::chrono::milliseconds timeout);

    // Thread-safe: each call uses a local io_context.
    bool CheckAvailability(const Endpoint& endpoint) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

// Reports a fixed answer that can be flipped at runtime. Counts its checks.
class StaticLivenessProbe final : public ILivenessProbe {
public:
    explicit StaticLivenessProbe(bool alive) : alive_(alive) {}

    bool CheckAvailability(const Endpoint&) override {
        checks_.fetch_add(1, std::memory_order_relaxed);
        return alive_.load(std::memory_order_acquire);
    }

    void SetAlive(bool alive) { alive_.store(alive, std::memory_order_release); }
    bool alive() const { return alive_.load(std::memory_order_acquire); }

    std::uint64_t checks() const { return checks_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> alive_;
    std::atomic<std::uint64_t> checks_{0};
};

} // namespace dspool::pool
