#include "levels/PivotLevelSource.h"

#include "common/Errors.h"

#include <algorithm>

namespace zonerisk {
namespace levels {

std::vector<zones::RawLevel> PivotLevelSource::pivotsFor(
    const Candle& bar,
    double weight,
    const std::string& timeframe
) {
    std::vector<zones::RawLevel> out;
    const double h = bar.high;
    const double l = bar.low;
    const double c = bar.close;
    if (h <= 0.0 || l <= 0.0 || c <= 0.0) {
        return out;
    }

    const double pp = (h + l + c) / 3.0;
    const std::pair<const char*, double> pivots[] = {
        {"Pivot_PP", pp},
        {"Pivot_R1", 2.0 * pp - l},
        {"Pivot_R2", pp + (h - l)},
        {"Pivot_R3", h + 2.0 * (pp - l)},
        {"Pivot_S1", 2.0 * pp - h},
        {"Pivot_S2", pp - (h - l)},
        {"Pivot_S3", l - 2.0 * (h - pp)},
    };

    for (const auto& [tag, price] : pivots) {
        if (price > 0.0) {
            out.push_back({price, tag, weight, timeframe});
        }
    }
    return out;
}

std::optional<Candle> PivotLevelSource::aggregateWeeklyBar(const std::vector<Candle>& daily_bars) {
    if (daily_bars.empty()) {
        return std::nullopt;
    }

    const size_t start = daily_bars.size() > 5 ? daily_bars.size() - 5 : 0;
    Candle weekly = daily_bars[start];
    weekly.volume = 0.0;
    for (size_t i = start; i < daily_bars.size(); ++i) {
        weekly.high = std::max(weekly.high, daily_bars[i].high);
        weekly.low = std::min(weekly.low, daily_bars[i].low);
        weekly.volume += daily_bars[i].volume;
    }
    weekly.close = daily_bars.back().close;
    weekly.timestamp = daily_bars.back().timestamp;

    if (weekly.high <= 0.0 || weekly.low <= 0.0 || weekly.close <= 0.0) {
        return std::nullopt;
    }
    return weekly;
}

LevelBatch PivotLevelSource::collect(const MarketSnapshot& snapshot) {
    const auto* daily = snapshot.candlesFor("1d");
    if (daily == nullptr) {
        throw MissingDataError(name(), "no 1d candles for pivots");
    }

    LevelBatch batch;
    batch.source = name();
    batch.timeframe = "1d";

    batch.levels = pivotsFor(daily->back(), config_.daily_pivot_weight, "1d");
    if (auto weekly = aggregateWeeklyBar(*daily)) {
        auto weekly_levels = pivotsFor(*weekly, config_.weekly_pivot_weight, "1w");
        batch.levels.insert(batch.levels.end(), weekly_levels.begin(), weekly_levels.end());
    }

    if (batch.levels.empty()) {
        throw MissingDataError(name(), "daily bar has no usable prices");
    }
    return batch;
}

} // namespace levels
} // namespace zonerisk
