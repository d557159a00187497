#include <chtest.hpp>

#include <dspool/core/metrics.h>
#include <dspool/pool/liveness_probe.h>
#include <dspool/pool/server_pool.h>

#include <memory>
#include <string>

TEST_CASE("MetricsRegistry renders prometheus text") {
    dspool::MetricsRegistry reg;

    dspool::MetricLabels a;
    a.kv["strategy"] = "FIRST";
    dspool::MetricLabels b;
    b.kv["strategy"] = "RANDOM";

    reg.CounterMetric("picks_total", "Picks", a).Inc(2);
    reg.CounterMetric("picks_total", "Picks", b).Inc();
    reg.CounterMetric("picks_total", "Picks", a).Inc();
    reg.GaugeMetric("size", "Size").Set(3);

    auto text = reg.ToPrometheusText();
    REQUIRE(text.find("# TYPE picks_total counter\n") != std::string::npos);
    REQUIRE(text.find("picks_total{strategy=\"FIRST\"} 3\n") != std::string::npos);
    REQUIRE(text.find("picks_total{strategy=\"RANDOM\"} 1\n") != std::string::npos);
    REQUIRE(text.find("# TYPE size gauge\n") != std::string::npos);
    REQUIRE(text.find("size 3\n") != std::string::npos);

    // one header per family
    REQUIRE(text.find("# HELP picks_total") == text.rfind("# HELP picks_total"));
}

TEST_CASE("MetricLabels escapes values") {
    dspool::MetricLabels l;
    l.kv["v"] = "a\"b\\c\nd";
    REQUIRE(l.ToPrometheusLabelText() == "{v=\"a\\\"b\\\\c\\nd\"}");
    REQUIRE(dspool::MetricLabels{}.ToPrometheusLabelText().empty());
}

TEST_CASE("ServerPool counts selections per strategy") {
    dspool::pool::PoolOptions opt;
    opt.strategy = dspool::pool::PoolStrategy::first;
    opt.active_only = false;
    opt.default_probe = std::make_shared<dspool::pool::StaticLivenessProbe>(true);

    dspool::MetricLabels labels;
    labels.kv["strategy"] = "FIRST";
    auto& selections = dspool::DefaultMetrics().CounterMetric(
        "dspool_selections_total", "Servers handed out by server pools", labels);
    auto before = selections.Value();

    auto pool = dspool::pool::ServerPool::Create(opt, {std::string("ldap://dc1")});
    REQUIRE(pool.ok());
    REQUIRE(pool.value()->Initialize(1).ok());
    for (int i = 0; i < 5; ++i) {
        REQUIRE(pool.value()->GetServer(1).ok());
    }

    REQUIRE(selections.Value() - before == 5);
    REQUIRE(dspool::DefaultMetrics().ToPrometheusText().find("dspool_pool_endpoints") != std::string::npos);
}
