#include <dspool/pool/strategy.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace dspool::pool {

bool IsKnownStrategy(PoolStrategy strategy) {
    switch (strategy) {
        case PoolStrategy::first:
        case PoolStrategy::round_robin:
        case PoolStrategy::random:
            return true;
    }
    return false;
}

std::string_view StrategyName(PoolStrategy strategy) {
    switch (strategy) {
        case PoolStrategy::first: return "FIRST";
        case PoolStrategy::round_robin: return "ROUND_ROBIN";
        case PoolStrategy::random: return "RANDOM";
    }
    return "UNKNOWN";
}

dspool::Result<PoolStrategy> ParseStrategy(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "FIRST") return PoolStrategy::first;
    if (upper == "ROUND_ROBIN") return PoolStrategy::round_robin;
    if (upper == "RANDOM") return PoolStrategy::random;

    return dspool::Status(dspool::StatusCode::unknown_strategy, "unknown pooling strategy <" + std::string(name) + ">");
}

} // namespace dspool::pool
