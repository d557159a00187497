#include <dspool/config/config.h>
#include <dspool/core/log.h>
#include <dspool/core/metrics.h>
#include <dspool/pool/server_pool.h>
#include <dspool/resilience/cancellation.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

struct Options {
    std::string config_path;
    std::vector<std::string> servers;
    std::string strategy;
    std::string log_level;

    std::size_t connections = 4;
    std::size_t requests = 10;
    int timeout_ms = 5000;
};

void PrintUsage() {
    std::cout << "pool_probe options:\n"
              << "  --config <file.json>\n"
              << "  --server <ldap[s]://host[:port]>  (repeatable)\n"
              << "  --strategy <FIRST|ROUND_ROBIN|RANDOM>\n"
              << "  --connections <n>\n"
              << "  --requests <n per connection>\n"
              << "  --timeout-ms <ms>\n"
              << "  --log <trace|debug|info|warn|error>\n";
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << name << "\n";
                std::exit(2);
            }
            return argv[++i];
        };

        if (a == "--config") {
            opt.config_path = need("--config");
        } else if (a == "--server") {
            opt.servers.emplace_back(need("--server"));
        } else if (a == "--strategy") {
            opt.strategy = need("--strategy");
        } else if (a == "--connections") {
            opt.connections = static_cast<std::size_t>(std::atoi(need("--connections")));
        } else if (a == "--requests") {
            opt.requests = static_cast<std::size_t>(std::atoi(need("--requests")));
        } else if (a == "--timeout-ms") {
            opt.timeout_ms = std::atoi(need("--timeout-ms"));
        } else if (a == "--log") {
            opt.log_level = need("--log");
        } else if (a == "--help" || a == "-h") {
            PrintUsage();
            return 0;
        } else {
            std::cerr << "unknown option " << a << "\n";
            PrintUsage();
            return 2;
        }
    }

    dspool::config::PoolConfig pc;
    if (!opt.config_path.empty()) {
        auto loaded = dspool::config::LoadPoolConfigFile(opt.config_path);
        if (!loaded.ok()) {
            std::cerr << loaded.status().ToString() << "\n";
            return 1;
        }
        pc = std::move(loaded).value();
    }

    // command line wins over the config file
    if (!opt.log_level.empty()) {
        pc.log_level = opt.log_level;
    }
    dspool::log::Init(pc.log_level);

    if (!opt.strategy.empty()) {
        auto s = dspool::pool::ParseStrategy(opt.strategy);
        if (!s.ok()) {
            std::cerr << s.status().ToString() << "\n";
            return 2;
        }
        pc.options.strategy = s.value();
    }
    for (auto& s : opt.servers) {
        pc.servers.push_back(std::move(s));
    }
    if (opt.connections == 0) {
        opt.connections = 1;
    }

    std::vector<dspool::pool::EndpointLike> initial(pc.servers.begin(), pc.servers.end());
    auto created = dspool::pool::ServerPool::Create(pc.options, std::move(initial));
    if (!created.ok()) {
        std::cerr << created.status().ToString() << "\n";
        return 1;
    }
    auto pool = std::move(created).value();
    std::cout << pool->ToString() << "\n";

    dspool::resilience::CancellationToken cancel;

    // Ctrl+C / SIGTERM abort any selection still waiting for a live server.
    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            dspool::log::warn("signal received, cancelling selections");
            cancel.Cancel();
        }
    });
    std::thread signal_thread([&] { ioc.run(); });

    for (std::size_t c = 0; c < opt.connections; ++c) {
        auto st = pool->Initialize(c);
        if (!st.ok()) {
            std::cerr << st.ToString() << "\n";
            signals.cancel();
            signal_thread.join();
            return 1;
        }
    }

    std::atomic<std::size_t> ok{0};
    std::atomic<std::size_t> failed{0};

    std::vector<std::thread> workers;
    workers.reserve(opt.connections);
    for (std::size_t c = 0; c < opt.connections; ++c) {
        workers.emplace_back([&, c] {
            dspool::pool::SelectOptions sel;
            sel.timeout = std::chrono::milliseconds(opt.timeout_ms);
            sel.cancel = &cancel;

            for (std::size_t r = 0; r < opt.requests && !cancel.cancelled(); ++r) {
                auto server = pool->GetServer(c, sel);
                if (!server.ok()) {
                    failed.fetch_add(1, std::memory_order_relaxed);
                    dspool::log::error("connection {}: {}", c, server.status().ToString());
                    if (server.status().code() == dspool::StatusCode::cancelled) {
                        return;
                    }
                    continue;
                }
                ok.fetch_add(1, std::memory_order_relaxed);
                dspool::log::info("connection {} -> {}", c, server.value().ToString());
            }
        });
    }

    for (auto& t : workers) {
        t.join();
    }

    for (std::size_t c = 0; c < opt.connections; ++c) {
        auto described = pool->Describe(c);
        if (described.ok()) {
            std::cout << "connection " << c << ":\n" << described.value() << "\n";
        }
        auto st = pool->Release(c);
        if (!st.ok()) {
            dspool::log::warn("release connection {}: {}", c, st.ToString());
        }
    }

    signals.cancel();
    signal_thread.join();

    std::cout << "selections ok=" << ok.load() << " failed=" << failed.load() << "\n\n";
    std::cout << dspool::DefaultMetrics().ToPrometheusText();
    return failed.load() == 0 ? 0 : 1;
}
