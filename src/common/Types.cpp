#include "common/Types.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace zonerisk {

namespace {
std::string upperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

std::optional<TradeDirection> parseTradeDirection(const std::string& value) {
    const std::string v = upperCopy(value);
    // Legacy BUY/SELL spellings are still emitted by some signal producers.
    if (v == "LONG" || v == "BUY") return TradeDirection::LONG;
    if (v == "SHORT" || v == "SELL") return TradeDirection::SHORT;
    return std::nullopt;
}

SignalConfidence parseSignalConfidence(const std::string& value) {
    const std::string v = upperCopy(value);
    if (v == "HIGH") return SignalConfidence::HIGH;
    if (v == "LOW") return SignalConfidence::LOW;
    return SignalConfidence::MEDIUM;
}

long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace zonerisk
