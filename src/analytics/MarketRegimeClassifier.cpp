#include "analytics/MarketRegimeClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include <cmath>

namespace zonerisk {
namespace analytics {

MarketCondition MarketRegimeClassifier::classify(const RegimeInputs& inputs) const {
    const double threshold = config_.price_change_threshold;
    const bool is_extreme = std::abs(inputs.price_change_1h) > threshold ||
                            inputs.volatility_5min > config_.volatility_threshold;
    if (!is_extreme) {
        return MarketCondition::NORMAL;
    }

    if (inputs.price_change_1h > threshold && inputs.trend_direction == TrendDirection::BULLISH) {
        return MarketCondition::EXTREME_BULLISH;
    }
    if (inputs.price_change_1h < -threshold && inputs.trend_direction == TrendDirection::BEARISH) {
        return MarketCondition::EXTREME_BEARISH;
    }
    return MarketCondition::EXTREME_VOLATILE;
}

RegimeAnalysis MarketRegimeClassifier::analyze(const RegimeInputs& inputs) const {
    RegimeAnalysis result;
    result.inputs = inputs;
    result.condition = classify(inputs);
    result.is_extreme = result.condition != MarketCondition::NORMAL;

    switch (result.condition) {
        case MarketCondition::NORMAL:
            result.description = "Normal conditions";
            break;
        case MarketCondition::EXTREME_BULLISH:
            result.description = "Extreme bullish move with confirmed uptrend";
            break;
        case MarketCondition::EXTREME_BEARISH:
            result.description = "Extreme bearish move with confirmed downtrend";
            break;
        case MarketCondition::EXTREME_VOLATILE:
            result.description = "Extreme move without confirmed direction";
            break;
    }
    return result;
}

RegimeInputs MarketRegimeClassifier::deriveInputs(
    const std::vector<Candle>& candles_5m,
    const std::vector<Candle>& candles_1h
) const {
    RegimeInputs inputs;

    if (candles_1h.size() >= 2) {
        const double prev_close = candles_1h[candles_1h.size() - 2].close;
        const double last_close = candles_1h.back().close;
        if (prev_close > 0.0) {
            inputs.price_change_1h = (last_close - prev_close) / prev_close;
        }
    }

    if (!candles_5m.empty()) {
        const Candle& last = candles_5m.back();
        if (last.close > 0.0) {
            inputs.volatility_5min = (last.high - last.low) / last.close;
        }
    }

    inputs.trend_direction = TechnicalIndicators::detectTrend(
        TechnicalIndicators::extractClosePrices(candles_1h),
        config_.trend_short_period,
        config_.trend_long_period
    );

    return inputs;
}

} // namespace analytics
} // namespace zonerisk
