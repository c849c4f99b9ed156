#include "common/Errors.h"
#include "levels/IndicatorLevelSource.h"
#include "levels/OrderWallLevelSource.h"
#include "levels/PivotLevelSource.h"
#include "levels/SwingLevelSource.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <set>

using namespace zonerisk;
using levels::MarketSnapshot;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

std::vector<Candle> waveCandles(int count, double base, double amplitude) {
    std::vector<Candle> out;
    for (int i = 0; i < count; ++i) {
        const double mid = base + amplitude * std::sin(i / 6.0) + i * 0.5;
        out.emplace_back(mid - 1.0, mid + 3.0, mid - 3.0, mid + 1.0, 100.0 + (i % 7) * 10.0, i * 14400000LL);
    }
    return out;
}

std::set<std::string> tagsOf(const levels::LevelBatch& batch) {
    std::set<std::string> tags;
    for (const auto& level : batch.levels) {
        tags.insert(level.source_tag);
    }
    return tags;
}

} // namespace

int main() {
    engine::SourceConfig config;

    // Floor-trader pivots
    {
        auto pivots = levels::PivotLevelSource::pivotsFor(Candle(95.0, 110.0, 90.0, 100.0, 1.0, 0), 1.0, "1d");
        assert(pivots.size() == 7);
        assert(pivots[0].source_tag == "Pivot_PP" && near(pivots[0].price, 100.0));
        assert(pivots[1].source_tag == "Pivot_R1" && near(pivots[1].price, 110.0));
        assert(pivots[2].source_tag == "Pivot_R2" && near(pivots[2].price, 120.0));
        assert(pivots[3].source_tag == "Pivot_R3" && near(pivots[3].price, 130.0));
        assert(pivots[4].source_tag == "Pivot_S1" && near(pivots[4].price, 90.0));
        assert(pivots[5].source_tag == "Pivot_S2" && near(pivots[5].price, 80.0));
        assert(pivots[6].source_tag == "Pivot_S3" && near(pivots[6].price, 70.0));
    }

    // Weekly bar from the last five dailies
    {
        std::vector<Candle> daily;
        for (int i = 0; i < 7; ++i) {
            daily.emplace_back(100.0 + i, 105.0 + i, 95.0 + i, 101.0 + i, 10.0, i);
        }
        daily[0].high = 500.0;  // outside the window
        auto weekly = levels::PivotLevelSource::aggregateWeeklyBar(daily);
        assert(weekly.has_value());
        assert(near(weekly->open, 102.0));
        assert(near(weekly->high, 111.0));
        assert(near(weekly->low, 97.0));
        assert(near(weekly->close, 107.0));
        assert(near(weekly->volume, 50.0));
        assert(!levels::PivotLevelSource::aggregateWeeklyBar({}).has_value());

        MarketSnapshot snapshot;
        snapshot.candles["1d"] = daily;
        levels::PivotLevelSource source(config);
        auto batch = source.collect(snapshot);
        size_t daily_levels = 0;
        size_t weekly_levels = 0;
        for (const auto& level : batch.levels) {
            if (level.timeframe == "1d") {
                ++daily_levels;
                assert(near(level.source_weight, config.daily_pivot_weight));
            } else if (level.timeframe == "1w") {
                ++weekly_levels;
                assert(near(level.source_weight, config.weekly_pivot_weight));
            }
        }
        assert(daily_levels == 7);
        assert(weekly_levels == 7);
    }

    // Missing input raises MissingDataError
    {
        MarketSnapshot empty;
        levels::PivotLevelSource pivots(config);
        levels::IndicatorLevelSource indicators("4h", config);
        levels::SwingLevelSource swings("4h", 1.5, config);
        levels::OrderWallLevelSource walls(config);
        levels::ILevelSource* sources[] = {&pivots, &indicators, &swings, &walls};
        for (auto* source : sources) {
            bool thrown = false;
            try {
                source->collect(empty);
            } catch (const MissingDataError& e) {
                thrown = true;
                assert(e.code() == ErrorCode::MISSING_DATA);
                assert(e.source() == source->name());
            }
            assert(thrown);
        }
    }

    // Indicator levels depend on available history
    {
        levels::IndicatorLevelSource source("4h", config);

        MarketSnapshot full;
        full.candles["4h"] = waveCandles(250, 70000.0, 800.0);
        auto batch = source.collect(full);
        auto tags = tagsOf(batch);
        assert(tags.count("SMA_50") && tags.count("SMA_200") && tags.count("BB_Upper") && tags.count("BB_Lower"));
        assert(batch.atr > 0.0);
        assert(batch.timeframe == "4h");
        for (const auto& level : batch.levels) {
            assert(level.timeframe == "4h");
            if (level.source_tag == "SMA_200") {
                assert(near(level.source_weight, config.sma200_weight));
            }
        }

        MarketSnapshot short_history;
        short_history.candles["4h"] = waveCandles(30, 70000.0, 800.0);
        auto partial = tagsOf(source.collect(short_history));
        assert(partial.count("BB_Upper") && !partial.count("SMA_50") && !partial.count("SMA_200"));

        MarketSnapshot too_short;
        too_short.candles["4h"] = waveCandles(10, 70000.0, 800.0);
        bool thrown = false;
        try {
            source.collect(too_short);
        } catch (const MissingDataError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Swing detection with age and volume weighting
    {
        const double highs[] = {101, 102, 103, 104, 105, 110, 105, 104, 103, 102, 101};
        std::vector<Candle> bars;
        for (int i = 0; i < 11; ++i) {
            bars.emplace_back(highs[i] - 1.0, highs[i], highs[i] - 2.0, highs[i] - 0.5, 100.0, i);
        }
        MarketSnapshot snapshot;
        snapshot.candles["1d"] = bars;
        levels::SwingLevelSource source("1d", 2.0, config);
        auto batch = source.collect(snapshot);
        assert(batch.levels.size() == 1);
        assert(batch.levels[0].source_tag == "Swing_High");
        assert(near(batch.levels[0].price, 110.0));
        // 5 bars ago of 100 max -> age 0.975; equal volumes rank at the top
        assert(near(batch.levels[0].source_weight, 2.0 * 0.975 * 1.0));
    }

    {
        std::vector<double> volumes = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
        assert(near(levels::SwingLevelSource::volumeWeightFactor(10.0, volumes), 1.0));
        assert(near(levels::SwingLevelSource::volumeWeightFactor(1.0, volumes), 0.3));
        assert(near(levels::SwingLevelSource::volumeWeightFactor(5.0, volumes), 0.75));
        assert(near(levels::SwingLevelSource::volumeWeightFactor(5.0, {}), 0.5));
    }

    // Order walls
    {
        MarketSnapshot snapshot;
        const double bid_sizes[] = {1.0, 1.0, 20.0, 1.0, 1.0};
        for (int i = 0; i < 5; ++i) {
            nlohmann::json unit = {
                {"bid_price", 100.0 - i}, {"bid_size", bid_sizes[i]},
                {"ask_price", 101.0 + i}, {"ask_size", 1.0},
            };
            snapshot.orderbook_units.push_back(unit);
        }
        levels::OrderWallLevelSource source(config);
        auto batch = source.collect(snapshot);
        assert(batch.levels.size() == 1);
        assert(batch.levels[0].source_tag == "Order_Wall_Bid");
        assert(near(batch.levels[0].price, 98.0));
        assert(batch.levels[0].timeframe == "book");
        assert(near(batch.levels[0].source_weight, config.wall_weight));
    }

    std::cout << "[TEST] LevelSources PASSED\n";
    return 0;
}
