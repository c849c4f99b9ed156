#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <vector>
#include <string>

namespace zonerisk {
namespace analytics {

enum class MarketCondition {
    NORMAL,
    EXTREME_BULLISH,    // large 1h rise with a confirmed bullish trend
    EXTREME_BEARISH,    // large 1h drop with a confirmed bearish trend
    EXTREME_VOLATILE    // large move or 5m range without a confirmed direction
};

inline const char* toString(MarketCondition condition) {
    switch (condition) {
        case MarketCondition::NORMAL: return "NORMAL";
        case MarketCondition::EXTREME_BULLISH: return "EXTREME_BULLISH";
        case MarketCondition::EXTREME_BEARISH: return "EXTREME_BEARISH";
        case MarketCondition::EXTREME_VOLATILE: return "EXTREME_VOLATILE";
    }
    return "NORMAL";
}

struct RegimeInputs {
    double price_change_1h = 0.0;   // fraction, 0.03 = +3%
    double volatility_5min = 0.0;   // fraction of price
    TrendDirection trend_direction = TrendDirection::NEUTRAL;
};

struct RegimeAnalysis {
    MarketCondition condition = MarketCondition::NORMAL;
    RegimeInputs inputs;
    bool is_extreme = false;
    std::string description;
};

// Stateless: identical inputs always give identical output, no hysteresis.
class MarketRegimeClassifier {
public:
    explicit MarketRegimeClassifier(const engine::RegimeConfig& config) : config_(config) {}

    MarketCondition classify(const RegimeInputs& inputs) const;
    RegimeAnalysis analyze(const RegimeInputs& inputs) const;

    // price_change_1h from the last two closed 1h candles, volatility_5min from the
    // last closed 5m candle range, trend from SMA(short) vs SMA(long) on 1h closes.
    RegimeInputs deriveInputs(const std::vector<Candle>& candles_5m,
                              const std::vector<Candle>& candles_1h) const;

private:
    const engine::RegimeConfig& config_;
};

} // namespace analytics
} // namespace zonerisk
