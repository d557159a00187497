#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <dspool/core/status.h>
#include <dspool/pool/server_pool.h>

#include <chjson/chjson.hpp>

namespace dspool::config {

class Config {
public:
    static dspool::Result<Config> LoadFile(std::string path);
    static dspool::Result<Config> Parse(std::string text);

    bool Has(std::string_view key) const;

    dspool::Result<std::string> GetString(std::string_view key) const;
    dspool::Result<int> GetInt(std::string_view key) const;
    dspool::Result<bool> GetBool(std::string_view key) const;
    dspool::Result<std::vector<std::string>> GetStringList(std::string_view key) const;

private:
    chjson::document doc_;
};

// A pool definition file:
//
//   {
//     "servers": ["ldap://dc1.example.com", "ldaps://dc2.example.com:636"],
//     "strategy": "ROUND_ROBIN",
//     "active": true,
//     "exhaust": false,
//     "probe_timeout_ms": 1000,
//     "backoff_base_ms": 10,
//     "backoff_max_ms": 1000,
//     "seed": 42,
//     "log_level": "info"
//   }
//
// Every key is optional; missing keys keep the PoolOptions defaults.
struct PoolConfig {
    dspool::pool::PoolOptions options;
    std::vector<std::string> servers;
    std::string log_level = "info";
};

dspool::Result<PoolConfig> LoadPoolConfig(const Config& cfg);
dspool::Result<PoolConfig> LoadPoolConfigFile(std::string path);

} // namespace dspool::config
