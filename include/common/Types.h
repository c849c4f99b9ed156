#pragma once

#include <string>
#include <optional>

namespace zonerisk {

enum class TradeDirection { LONG, SHORT };
enum class TrendDirection { BULLISH, BEARISH, NEUTRAL };
enum class SignalConfidence { HIGH, MEDIUM, LOW };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Upstream decision agent output. Only direction and confidence are consumed.
struct TradeSignal {
    TradeDirection direction = TradeDirection::LONG;
    SignalConfidence confidence = SignalConfidence::MEDIUM;
};

inline const char* toString(TradeDirection d) {
    return d == TradeDirection::LONG ? "LONG" : "SHORT";
}

inline const char* toString(TrendDirection t) {
    switch (t) {
        case TrendDirection::BULLISH: return "BULLISH";
        case TrendDirection::BEARISH: return "BEARISH";
        case TrendDirection::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

inline const char* toString(SignalConfidence c) {
    switch (c) {
        case SignalConfidence::HIGH: return "HIGH";
        case SignalConfidence::MEDIUM: return "MEDIUM";
        case SignalConfidence::LOW: return "LOW";
    }
    return "MEDIUM";
}

std::optional<TradeDirection> parseTradeDirection(const std::string& value);
SignalConfidence parseSignalConfidence(const std::string& value);

long long nowMs();

} // namespace zonerisk
