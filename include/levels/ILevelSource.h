#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace levels {

// Market data visible to the level sources for one evaluation cycle.
struct MarketSnapshot {
    std::string symbol;
    double current_price = 0.0;
    long long ts_ms = 0;
    std::map<std::string, std::vector<Candle>> candles;  // keyed by timeframe, oldest first
    nlohmann::json orderbook_units = nlohmann::json::array();

    const std::vector<Candle>* candlesFor(const std::string& timeframe) const {
        auto it = candles.find(timeframe);
        return (it != candles.end() && !it->second.empty()) ? &it->second : nullptr;
    }
};

struct LevelBatch {
    std::string source;
    std::string timeframe;
    std::vector<zones::RawLevel> levels;
    double atr = 0.0;   // 0 when the source has no ATR estimate
};

// Throws MissingDataError when it has nothing to contribute this cycle.
class ILevelSource {
public:
    virtual ~ILevelSource() = default;

    virtual std::string name() const = 0;
    virtual LevelBatch collect(const MarketSnapshot& snapshot) = 0;
};

} // namespace levels
} // namespace zonerisk
