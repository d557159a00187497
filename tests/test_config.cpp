#include <chtest.hpp>

#include <dspool/config/config.h>

#include <string>

using dspool::StatusCode;
using dspool::config::Config;
using dspool::config::LoadPoolConfig;
using dspool::pool::PoolStrategy;

TEST_CASE("Config reads typed keys") {
    auto r = Config::Parse(R"({"name":"pool","n":3,"on":true,"list":["a","b"],"one":"c"})");
    REQUIRE(r.ok());
    const auto& c = r.value();

    REQUIRE(c.Has("name"));
    REQUIRE(!c.Has("missing"));
    REQUIRE(c.GetString("name").value() == "pool");
    REQUIRE(c.GetInt("n").value() == 3);
    REQUIRE(c.GetBool("on").value());
    REQUIRE(c.GetStringList("list").value().size() == 2);
    REQUIRE(c.GetStringList("one").value().size() == 1);

    REQUIRE(c.GetInt("name").status().code() == StatusCode::invalid_argument);
    REQUIRE(c.GetString("missing").status().code() == StatusCode::not_found);
}

TEST_CASE("Config rejects invalid json and non-object roots") {
    REQUIRE(Config::Parse("{").status().code() == StatusCode::invalid_argument);
    REQUIRE(Config::Parse("[1,2]").status().code() == StatusCode::invalid_argument);
    REQUIRE(Config::LoadFile("/nonexistent/dspool.json").status().code() == StatusCode::not_found);
}

TEST_CASE("LoadPoolConfig fills pool options") {
    auto c = Config::Parse(R"({
        "servers": ["ldap://dc1", "ldaps://dc2:636"],
        "strategy": "first",
        "active": true,
        "exhaust": true,
        "probe_timeout_ms": 250,
        "backoff_base_ms": 5,
        "backoff_max_ms": 200,
        "seed": 42,
        "log_level": "debug"
    })");
    REQUIRE(c.ok());

    auto pc = LoadPoolConfig(c.value());
    REQUIRE(pc.ok());
    const auto& v = pc.value();
    REQUIRE(v.servers.size() == 2);
    REQUIRE(v.options.strategy == PoolStrategy::first);
    REQUIRE(v.options.active_only);
    REQUIRE(v.options.exhaust_on_failure);
    REQUIRE(v.options.probe_timeout.count() == 250);
    REQUIRE(v.options.backoff.base_delay.count() == 5);
    REQUIRE(v.options.backoff.max_delay.count() == 200);
    REQUIRE(v.options.seed.has_value());
    REQUIRE(*v.options.seed == 42);
    REQUIRE(v.log_level == "debug");
}

TEST_CASE("LoadPoolConfig keeps defaults for missing keys") {
    auto pc = LoadPoolConfig(Config::Parse("{}").value());
    REQUIRE(pc.ok());
    REQUIRE(pc.value().servers.empty());
    REQUIRE(pc.value().options.strategy == PoolStrategy::round_robin);
    REQUIRE(pc.value().options.active_only);
    REQUIRE(!pc.value().options.exhaust_on_failure);
    REQUIRE(pc.value().log_level == "info");
}

TEST_CASE("LoadPoolConfig reports bad values") {
    auto strategy = LoadPoolConfig(Config::Parse(R"({"strategy":"WEIGHTED"})").value());
    REQUIRE(strategy.status().code() == StatusCode::unknown_strategy);

    auto policy = LoadPoolConfig(Config::Parse(R"({"active":false,"exhaust":true})").value());
    REQUIRE(policy.status().code() == StatusCode::invalid_policy);

    auto timeout = LoadPoolConfig(Config::Parse(R"({"probe_timeout_ms":0})").value());
    REQUIRE(timeout.status().code() == StatusCode::invalid_argument);

    auto servers = LoadPoolConfig(Config::Parse(R"({"servers":[1,2]})").value());
    REQUIRE(servers.status().code() == StatusCode::invalid_argument);
    REQUIRE(servers.status().message().find("servers") != std::string::npos);
}
