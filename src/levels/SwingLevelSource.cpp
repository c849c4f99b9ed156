#include "levels/SwingLevelSource.h"

#include "common/Errors.h"

#include <algorithm>

namespace zonerisk {
namespace levels {

SwingLevelSource::SwingLevelSource(std::string timeframe, double base_weight,
                                   const engine::SourceConfig& config)
    : timeframe_(std::move(timeframe))
    , base_weight_(base_weight)
    , config_(config) {}

double SwingLevelSource::volumeWeightFactor(double bar_volume, const std::vector<double>& all_volumes) {
    if (all_volumes.empty() || bar_volume <= 0.0) {
        return 0.5;
    }

    const auto at_or_below = std::count_if(all_volumes.begin(), all_volumes.end(),
                                           [bar_volume](double v) { return v <= bar_volume; });
    const double rank = static_cast<double>(at_or_below) / static_cast<double>(all_volumes.size());

    if (rank >= 0.7) return 1.0;
    if (rank >= 0.3) return 0.5 + (rank - 0.3) * 1.25;
    return 0.3;
}

LevelBatch SwingLevelSource::collect(const MarketSnapshot& snapshot) {
    const auto* all_candles = snapshot.candlesFor(timeframe_);
    if (all_candles == nullptr) {
        throw MissingDataError(name(), "no " + timeframe_ + " candles");
    }

    const int left = config_.swing_left_bars;
    const int right = config_.swing_right_bars;
    const size_t max_age = static_cast<size_t>(std::max(1, config_.swing_max_age));

    const size_t start = all_candles->size() > max_age ? all_candles->size() - max_age : 0;
    const std::vector<Candle> bars(all_candles->begin() + start, all_candles->end());
    const int n = static_cast<int>(bars.size());
    if (n < left + 1 + right) {
        throw MissingDataError(name(), "not enough " + timeframe_ + " bars for swing detection");
    }

    std::vector<double> volumes;
    for (const auto& bar : bars) {
        if (bar.volume > 0.0) {
            volumes.push_back(bar.volume);
        }
    }

    LevelBatch batch;
    batch.source = name();
    batch.timeframe = timeframe_;

    for (int i = left; i < n - right; ++i) {
        const Candle& bar = bars[i];
        if (bar.high <= 0.0 || bar.low <= 0.0) {
            continue;
        }

        bool is_swing_high = true;
        bool is_swing_low = true;
        for (int j = i - left; j <= i + right; ++j) {
            if (j == i) continue;
            if (bars[j].high > bar.high) is_swing_high = false;
            if (bars[j].low < bar.low) is_swing_low = false;
        }
        if (!is_swing_high && !is_swing_low) {
            continue;
        }

        const int bars_ago = n - 1 - i;
        const double age_factor = std::max(0.5, 1.0 - (static_cast<double>(bars_ago) / max_age) * 0.5);
        const double weight = base_weight_ * age_factor * volumeWeightFactor(bar.volume, volumes);

        if (is_swing_high) {
            batch.levels.push_back({bar.high, "Swing_High", weight, timeframe_});
        }
        if (is_swing_low) {
            batch.levels.push_back({bar.low, "Swing_Low", weight, timeframe_});
        }
    }

    if (batch.levels.empty()) {
        throw MissingDataError(name(), "no " + timeframe_ + " swing points in window");
    }
    return batch;
}

} // namespace levels
} // namespace zonerisk
