#include <chtest.hpp>

#include <dspool/pool/liveness_probe.h>
#include <dspool/pool/pool_cursor.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using dspool::StatusCode;
using dspool::pool::CursorPolicy;
using dspool::pool::Endpoint;
using dspool::pool::PoolCursor;
using dspool::pool::PoolStrategy;
using dspool::pool::SelectOptions;
using dspool::pool::StaticLivenessProbe;

namespace {

std::vector<Endpoint> MakeEndpoints(const std::vector<std::shared_ptr<StaticLivenessProbe>>& probes) {
    std::vector<Endpoint> out;
    for (std::size_t i = 0; i < probes.size(); ++i) {
        out.push_back(Endpoint{"dc" + std::to_string(i), 389, false, probes[i]});
    }
    return out;
}

std::vector<std::shared_ptr<StaticLivenessProbe>> Probes(std::vector<bool> alive) {
    std::vector<std::shared_ptr<StaticLivenessProbe>> out;
    for (bool a : alive) {
        out.push_back(std::make_shared<StaticLivenessProbe>(a));
    }
    return out;
}

CursorPolicy Policy(PoolStrategy strategy, bool active, bool exhaust) {
    CursorPolicy p;
    p.strategy = strategy;
    p.active_only = active;
    p.exhaust_on_failure = exhaust;
    p.backoff.base_delay = std::chrono::milliseconds(1);
    p.backoff.max_delay = std::chrono::milliseconds(5);
    return p;
}

} // namespace

TEST_CASE("PoolCursor starts at a random valid index") {
    auto probes = Probes({true, true, true, true});
    std::set<std::size_t> seen;
    for (std::uint64_t seed = 0; seed < 64; ++seed) {
        PoolCursor c(Policy(PoolStrategy::round_robin, false, false), 1, MakeEndpoints(probes), 0, seed);
        REQUIRE(c.index().has_value());
        REQUIRE(*c.index() < 4);
        seen.insert(*c.index());
    }
    REQUIRE(seen.size() > 1);
}

TEST_CASE("PoolCursor round robin wraps around the snapshot") {
    auto probes = Probes({true, true, true});
    PoolCursor c(Policy(PoolStrategy::round_robin, false, false), 1, MakeEndpoints(probes), 0, 7);

    auto start = *c.index();
    for (std::size_t k = 1; k <= 7; ++k) {
        auto r = c.SelectNext();
        REQUIRE(r.ok());
        REQUIRE(*c.index() == (start + k) % 3);
        REQUIRE(r.value() == c.snapshot()[(start + k) % 3]);
    }
    // no liveness checks without active_only
    REQUIRE(probes[0]->checks() == 0);
}

TEST_CASE("PoolCursor first strategy ignores liveness unless active") {
    auto probes = Probes({false, true, true});
    PoolCursor plain(Policy(PoolStrategy::first, false, false), 1, MakeEndpoints(probes), 0, 1);
    for (int i = 0; i < 5; ++i) {
        auto r = plain.SelectNext();
        REQUIRE(r.ok());
        REQUIRE(r.value().host == "dc0");
    }

    PoolCursor active(Policy(PoolStrategy::first, true, true), 2, MakeEndpoints(probes), 0, 1);
    for (int i = 0; i < 5; ++i) {
        auto r = active.SelectNext();
        REQUIRE(r.ok());
        REQUIRE(r.value().host == "dc1");
    }
}

TEST_CASE("PoolCursor active round robin skips dead endpoints in cyclic order") {
    auto probes = Probes({true, false, true, false});
    PoolCursor c(Policy(PoolStrategy::round_robin, true, true), 1, MakeEndpoints(probes), 0, 3);

    std::vector<std::string> got;
    for (int i = 0; i < 6; ++i) {
        auto r = c.SelectNext();
        REQUIRE(r.ok());
        got.push_back(r.value().host);
    }
    for (std::size_t i = 1; i < got.size(); ++i) {
        REQUIRE(got[i] != got[i - 1]);
        REQUIRE((got[i] == "dc0" || got[i] == "dc2"));
    }
}

TEST_CASE("PoolCursor active random returns the only live endpoint") {
    auto probes = Probes({false, false, true, false, false});
    PoolCursor c(Policy(PoolStrategy::random, true, true), 1, MakeEndpoints(probes), 0, 11);

    for (int i = 0; i < 50; ++i) {
        auto r = c.SelectNext();
        REQUIRE(r.ok());
        REQUIRE(r.value().host == "dc2");
        REQUIRE(*c.index() == 2);
    }
}

TEST_CASE("PoolCursor random without filter covers the whole range") {
    auto probes = Probes({true, true, true});
    PoolCursor c(Policy(PoolStrategy::random, false, false), 1, MakeEndpoints(probes), 0, 5);

    std::set<std::size_t> seen;
    for (int i = 0; i < 300; ++i) {
        REQUIRE(c.SelectNext().ok());
        REQUIRE(*c.index() < 3);
        seen.insert(*c.index());
    }
    REQUIRE(seen.size() == 3);
}

TEST_CASE("PoolCursor exhausted scans probe each endpoint once per pass") {
    auto probes = Probes({false, false, false});

    for (auto strategy : {PoolStrategy::first, PoolStrategy::round_robin, PoolStrategy::random}) {
        for (auto& p : probes) {
            p->SetAlive(false);
        }
        auto before = probes[0]->checks() + probes[1]->checks() + probes[2]->checks();

        PoolCursor c(Policy(strategy, true, true), 1, MakeEndpoints(probes), 0, 9);
        auto r = c.SelectNext();
        REQUIRE(!r.ok());
        REQUIRE(r.status().code() == StatusCode::pool_exhausted);

        auto after = probes[0]->checks() + probes[1]->checks() + probes[2]->checks();
        REQUIRE(after - before == 3);
    }
}

TEST_CASE("PoolCursor keeps waiting until the deadline when exhaust is off") {
    auto probes = Probes({false, false, false});
    PoolCursor c(Policy(PoolStrategy::round_robin, true, false), 1, MakeEndpoints(probes), 0, 2);
    auto index_before = c.index();

    SelectOptions opts;
    opts.timeout = std::chrono::milliseconds(60);

    auto t0 = std::chrono::steady_clock::now();
    auto r = c.SelectNext(opts);
    auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == StatusCode::timeout);
    REQUIRE(elapsed >= std::chrono::milliseconds(60));
    // several full passes happened
    REQUIRE(probes[0]->checks() > 1);
    // a failed selection leaves the cursor where it was
    REQUIRE(c.index() == index_before);
}

TEST_CASE("PoolCursor wait ends once an endpoint comes back") {
    auto probes = Probes({false, false});
    PoolCursor c(Policy(PoolStrategy::first, true, false), 1, MakeEndpoints(probes), 0, 2);

    std::thread flipper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        probes[1]->SetAlive(true);
    });

    SelectOptions opts;
    opts.timeout = std::chrono::seconds(5);
    auto r = c.SelectNext(opts);
    flipper.join();

    REQUIRE(r.ok());
    REQUIRE(r.value().host == "dc1");
}

TEST_CASE("PoolCursor wait is cancellable") {
    auto probes = Probes({false});
    PoolCursor c(Policy(PoolStrategy::random, true, false), 1, MakeEndpoints(probes), 0, 2);

    dspool::resilience::CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.Cancel();
    });

    SelectOptions opts;
    opts.cancel = &token;
    auto r = c.SelectNext(opts);
    canceller.join();

    REQUIRE(!r.ok());
    REQUIRE(r.status().code() == StatusCode::cancelled);
}

TEST_CASE("PoolCursor refresh to an empty snapshot reports empty_pool") {
    auto probes = Probes({true, true});
    PoolCursor c(Policy(PoolStrategy::round_robin, false, false), 1, MakeEndpoints(probes), 0, 1);

    c.Refresh({}, 1);
    REQUIRE(!c.index().has_value());
    REQUIRE(c.generation() == 1);
    REQUIRE(c.Current().status().code() == StatusCode::empty_pool);
    REQUIRE(c.SelectNext().status().code() == StatusCode::empty_pool);

    c.Refresh(MakeEndpoints(probes), 2);
    REQUIRE(c.index().has_value());
    REQUIRE(c.SelectNext().ok());
}

TEST_CASE("PoolCursor adopt points at an equal endpoint") {
    auto probes = Probes({true, true, true});
    PoolCursor c(Policy(PoolStrategy::round_robin, false, false), 1, MakeEndpoints(probes), 0, 1);

    REQUIRE(c.Adopt(Endpoint{"DC2", 389, false, nullptr}));
    REQUIRE(*c.index() == 2);
    REQUIRE(c.Current().value().host == "dc2");
    REQUIRE(!c.Adopt(Endpoint{"dc9", 389, false, nullptr}));
    REQUIRE(*c.index() == 2);

    REQUIRE(c.created_at() <= std::chrono::system_clock::now());

    auto text = c.ToString();
    REQUIRE(text.find("Pool strategy: ROUND_ROBIN") != std::string::npos);
    REQUIRE(text.find("Last used server: ldap://dc2:389") != std::string::npos);
}
