#pragma once

#include <string_view>

#include <dspool/core/status.h>

namespace dspool::pool {

enum class PoolStrategy {
    first = 0,   // lowest index that qualifies
    round_robin, // next index after the connection's last one
    random,
};

bool IsKnownStrategy(PoolStrategy strategy);

// "FIRST", "ROUND_ROBIN", "RANDOM"
std::string_view StrategyName(PoolStrategy strategy);

// Case-insensitive; unknown names fail with unknown_strategy.
dspool::Result<PoolStrategy> ParseStrategy(std::string_view name);

} // namespace dspool::pool
