#pragma once

#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "common/Types.h"

namespace zonerisk {
namespace analytics {

// Indicator math feeding the level sources and the regime inputs.
// All functions read the most recent values at the back of the series.
class TechnicalIndicators {
public:
    struct BollingerBands {
        double upper;
        double middle;
        double lower;
        double width;

        BollingerBands() : upper(0), middle(0), lower(0), width(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // Wilder-smoothed ATR; 0 when fewer than period + 1 candles
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    static double calculateSMA(const std::vector<double>& prices, int period);

    // SMA(short) vs SMA(long); inside +-band_pct percent is NEUTRAL
    static TrendDirection detectTrend(const std::vector<double>& prices,
                                      int short_period = 20,
                                      int long_period = 50,
                                      double band_pct = 1.0);

    // Accepts both {open,high,low,close,volume,timestamp} rows and
    // [ts, open, high, low, close, volume] kline arrays. Sorted by timestamp.
    static std::vector<Candle> jsonToCandles(const nlohmann::json& json_candles);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace zonerisk
