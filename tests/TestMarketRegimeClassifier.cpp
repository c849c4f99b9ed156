#include "analytics/MarketRegimeClassifier.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace zonerisk;
using analytics::MarketCondition;
using analytics::MarketRegimeClassifier;
using analytics::RegimeInputs;

namespace {

RegimeInputs inputs(double change, double vol, TrendDirection trend) {
    RegimeInputs in;
    in.price_change_1h = change;
    in.volatility_5min = vol;
    in.trend_direction = trend;
    return in;
}

} // namespace

int main() {
    engine::RegimeConfig config;
    MarketRegimeClassifier classifier(config);

    assert(classifier.classify(inputs(0.01, 0.01, TrendDirection::NEUTRAL)) == MarketCondition::NORMAL);
    assert(classifier.classify(inputs(0.03, 0.03, TrendDirection::BULLISH)) == MarketCondition::NORMAL);
    assert(classifier.classify(inputs(0.04, 0.01, TrendDirection::BULLISH)) == MarketCondition::EXTREME_BULLISH);
    assert(classifier.classify(inputs(-0.04, 0.01, TrendDirection::BEARISH)) == MarketCondition::EXTREME_BEARISH);

    // Large move against the trend, or no confirmed trend
    assert(classifier.classify(inputs(0.04, 0.01, TrendDirection::BEARISH)) == MarketCondition::EXTREME_VOLATILE);
    assert(classifier.classify(inputs(-0.05, 0.01, TrendDirection::NEUTRAL)) == MarketCondition::EXTREME_VOLATILE);

    // Volatility alone is extreme but directionless
    assert(classifier.classify(inputs(0.0, 0.05, TrendDirection::BULLISH)) == MarketCondition::EXTREME_VOLATILE);
    assert(classifier.classify(inputs(0.02, 0.05, TrendDirection::BULLISH)) == MarketCondition::EXTREME_VOLATILE);

    // Same inputs, same answer, regardless of call history
    {
        const RegimeInputs borderline = inputs(0.0301, 0.0, TrendDirection::BULLISH);
        const RegimeInputs calm = inputs(0.0299, 0.0, TrendDirection::BULLISH);
        const MarketCondition first = classifier.classify(borderline);
        for (int i = 0; i < 100; ++i) {
            assert(classifier.classify(i % 2 ? calm : borderline) ==
                   (i % 2 ? MarketCondition::NORMAL : first));
        }
        assert(first == MarketCondition::EXTREME_BULLISH);
    }

    {
        auto analysis = classifier.analyze(inputs(-0.04, 0.01, TrendDirection::BEARISH));
        assert(analysis.condition == MarketCondition::EXTREME_BEARISH);
        assert(analysis.is_extreme);
        assert(!analysis.description.empty());
        assert(!classifier.analyze(inputs(0.0, 0.0, TrendDirection::NEUTRAL)).is_extreme);
    }

    // Inputs derived from candles
    {
        std::vector<Candle> hourly;
        for (int i = 0; i < 60; ++i) {
            const double close = 100.0 + 2.0 * i;
            hourly.emplace_back(close, close + 1.0, close - 1.0, close, 10.0, i * 3600000LL);
        }
        hourly.back().close = hourly[hourly.size() - 2].close * 1.04;

        std::vector<Candle> five_min;
        five_min.emplace_back(101.0, 105.0, 100.0, 102.0, 5.0, 0);

        auto derived = classifier.deriveInputs(five_min, hourly);
        assert(std::abs(derived.price_change_1h - 0.04) < 1e-9);
        assert(std::abs(derived.volatility_5min - 5.0 / 102.0) < 1e-9);
        assert(derived.trend_direction == TrendDirection::BULLISH);
        assert(classifier.classify(derived) == MarketCondition::EXTREME_BULLISH);

        auto empty = classifier.deriveInputs({}, {});
        assert(empty.price_change_1h == 0.0);
        assert(empty.trend_direction == TrendDirection::NEUTRAL);
        assert(classifier.classify(empty) == MarketCondition::NORMAL);
    }

    std::cout << "[TEST] MarketRegimeClassifier PASSED\n";
    return 0;
}
