#pragma once

#include <vector>
#include <nlohmann/json.hpp>

namespace zonerisk {
namespace analytics {

struct OrderWall {
    double price;
    double size;
    double notional;
    double multiplier;  // notional / mean level notional on the same side
    bool is_bid;

    OrderWall()
        : price(0.0)
        , size(0.0)
        , notional(0.0)
        , multiplier(0.0)
        , is_bid(true)
    {}
};

class OrderbookAnalyzer {
public:
    // orderbook_units: [{bid_price, bid_size, ask_price, ask_size}, ...] best level first.
    // A level is a wall when its notional is >= wall_multiplier x the side's mean notional.
    static std::vector<OrderWall> detectWalls(
        const nlohmann::json& orderbook_units,
        double wall_multiplier,
        int depth_limit = 20
    );
};

} // namespace analytics
} // namespace zonerisk
