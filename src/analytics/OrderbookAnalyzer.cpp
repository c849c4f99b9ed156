#include "analytics/OrderbookAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace zonerisk {
namespace analytics {

namespace {

bool hasUnitsArray(const nlohmann::json& orderbook_units) {
    return orderbook_units.is_array() && !orderbook_units.empty();
}

void collectSide(
    const nlohmann::json& orderbook_units,
    int depth,
    bool is_bid,
    double wall_multiplier,
    std::vector<OrderWall>& out
) {
    const char* price_key = is_bid ? "bid_price" : "ask_price";
    const char* size_key = is_bid ? "bid_size" : "ask_size";

    std::vector<OrderWall> levels;
    double total_notional = 0.0;
    for (int i = 0; i < depth; ++i) {
        OrderWall level;
        level.price = orderbook_units[i].value(price_key, 0.0);
        level.size = orderbook_units[i].value(size_key, 0.0);
        if (level.price <= 0.0 || level.size <= 0.0) {
            continue;
        }
        level.notional = level.price * level.size;
        level.is_bid = is_bid;
        total_notional += level.notional;
        levels.push_back(level);
    }

    if (levels.size() < 2 || total_notional <= 0.0) {
        return;
    }

    const double mean_notional = total_notional / static_cast<double>(levels.size());
    for (auto& level : levels) {
        level.multiplier = level.notional / mean_notional;
        if (level.multiplier >= wall_multiplier) {
            out.push_back(level);
        }
    }
}

}

std::vector<OrderWall> OrderbookAnalyzer::detectWalls(
    const nlohmann::json& orderbook_units,
    double wall_multiplier,
    int depth_limit
) {
    std::vector<OrderWall> walls;
    if (!hasUnitsArray(orderbook_units)) {
        return walls;
    }

    int depth = std::min(depth_limit, (int)orderbook_units.size());
    if (depth <= 0) {
        return walls;
    }

    collectSide(orderbook_units, depth, true, wall_multiplier, walls);
    collectSide(orderbook_units, depth, false, wall_multiplier, walls);
    return walls;
}

} // namespace analytics
} // namespace zonerisk
