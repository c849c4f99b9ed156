#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace zonerisk {
namespace analytics {

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 1 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateSMA(recent_prices, period);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    return result;
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(candles.size());

    // First TR needs the previous close, so it starts at index 1
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    // Wilder's smoothing to the latest bar
    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

TrendDirection TechnicalIndicators::detectTrend(
    const std::vector<double>& prices,
    int short_period,
    int long_period,
    double band_pct
) {
    double short_ma = calculateSMA(prices, short_period);
    double long_ma = calculateSMA(prices, long_period);
    if (short_ma <= 0.0 || long_ma <= 0.0) {
        return TrendDirection::NEUTRAL;
    }

    double diff_percent = ((short_ma - long_ma) / long_ma) * 100.0;

    if (diff_percent > band_pct) return TrendDirection::BULLISH;
    if (diff_percent < -band_pct) return TrendDirection::BEARISH;
    return TrendDirection::NEUTRAL;
}

std::vector<Candle> TechnicalIndicators::jsonToCandles(const nlohmann::json& json_candles) {
    std::vector<Candle> candles;
    if (!json_candles.is_array()) return candles;

    auto getDouble = [](const nlohmann::json& val) -> double {
        if (val.is_number()) {
            return val.get<double>();
        }
        if (val.is_string()) {
            try {
                return std::stod(val.get<std::string>());
            } catch (const std::exception&) {
                return 0.0;
            }
        }
        return 0.0;
    };

    for (const auto& jc : json_candles) {
        Candle c;
        if (jc.is_array() && jc.size() >= 6) {
            c.timestamp = static_cast<long long>(getDouble(jc[0]));
            c.open = getDouble(jc[1]);
            c.high = getDouble(jc[2]);
            c.low = getDouble(jc[3]);
            c.close = getDouble(jc[4]);
            c.volume = getDouble(jc[5]);
        } else if (jc.is_object()) {
            c.open = getDouble(jc.value("open", nlohmann::json(0.0)));
            c.high = getDouble(jc.value("high", nlohmann::json(0.0)));
            c.low = getDouble(jc.value("low", nlohmann::json(0.0)));
            c.close = getDouble(jc.value("close", nlohmann::json(0.0)));
            c.volume = getDouble(jc.value("volume", nlohmann::json(0.0)));
            c.timestamp = jc.value("timestamp", 0LL);
        } else {
            continue;
        }
        candles.push_back(c);
    }

    std::stable_sort(candles.begin(), candles.end(),
                     [](const Candle& a, const Candle& b) {
                         return a.timestamp < b.timestamp;
                     });

    return candles;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }
    return prices;
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.empty()) return 0.0;

    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / values.size());
}

} // namespace analytics
} // namespace zonerisk
