#include "levels/IndicatorLevelSource.h"

#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"

namespace zonerisk {
namespace levels {

IndicatorLevelSource::IndicatorLevelSource(std::string timeframe, const engine::SourceConfig& config)
    : timeframe_(std::move(timeframe))
    , config_(config) {}

LevelBatch IndicatorLevelSource::collect(const MarketSnapshot& snapshot) {
    const auto* candles = snapshot.candlesFor(timeframe_);
    if (candles == nullptr) {
        throw MissingDataError(name(), "no " + timeframe_ + " candles");
    }

    using analytics::TechnicalIndicators;

    LevelBatch batch;
    batch.source = name();
    batch.timeframe = timeframe_;
    batch.atr = TechnicalIndicators::calculateATR(*candles, config_.atr_period);

    const auto closes = TechnicalIndicators::extractClosePrices(*candles);
    auto add = [&](double price, const char* tag, double weight) {
        if (price > 0.0) {
            batch.levels.push_back({price, tag, weight, timeframe_});
        }
    };

    add(TechnicalIndicators::calculateSMA(closes, 50), "SMA_50", config_.sma50_weight);
    add(TechnicalIndicators::calculateSMA(closes, 200), "SMA_200", config_.sma200_weight);

    const auto bands = TechnicalIndicators::calculateBollingerBands(
        closes, config_.bollinger_period, config_.bollinger_std_mult);
    if (bands.width > 0.0) {
        add(bands.upper, "BB_Upper", config_.bollinger_weight);
        add(bands.lower, "BB_Lower", config_.bollinger_weight);
    }

    if (batch.levels.empty()) {
        throw MissingDataError(name(), "not enough " + timeframe_ + " history for indicator levels");
    }
    return batch;
}

} // namespace levels
} // namespace zonerisk
