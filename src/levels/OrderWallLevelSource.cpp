#include "levels/OrderWallLevelSource.h"

#include "analytics/OrderbookAnalyzer.h"
#include "common/Errors.h"

namespace zonerisk {
namespace levels {

LevelBatch OrderWallLevelSource::collect(const MarketSnapshot& snapshot) {
    const auto walls = analytics::OrderbookAnalyzer::detectWalls(
        snapshot.orderbook_units, config_.wall_multiplier, config_.wall_depth);
    if (walls.empty()) {
        throw MissingDataError(name(), "no order walls above " + std::to_string(config_.wall_multiplier) + "x");
    }

    LevelBatch batch;
    batch.source = name();
    batch.timeframe = "book";
    for (const auto& wall : walls) {
        batch.levels.push_back({wall.price, wall.is_bid ? "Order_Wall_Bid" : "Order_Wall_Ask",
                                config_.wall_weight, "book"});
    }
    return batch;
}

} // namespace levels
} // namespace zonerisk
