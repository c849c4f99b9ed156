#pragma once

#include <deque>
#include <functional>
#include <map>
#include <set>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "zones/ZoneBook.h"

namespace zonerisk {
namespace zones {

struct RejectionInputs {
    double wick_ratio = 0.0;            // rejection wick / candle range
    double volume_ratio = 0.0;          // touch candle volume / recent average
    double bounce_atr = 0.0;            // max excursion away from the zone, in ATR
    double follow_through_atr = 0.0;    // close after N candles vs touch price, in ATR
};

struct RejectionScore {
    double wick = 0.0;
    double volume = 0.0;
    double bounce = 0.0;
    double follow_through = 0.0;
    double total = 0.0;
};

// Watches ticks for price entering a zone's touch band, then scores the
// rejection from the candles that close after it. Not thread-safe; the engine
// drives it from its tick context only.
class TouchTracker {
public:
    using TouchListener = std::function<void(int zone_id, const TouchRecord& touch)>;

    TouchTracker(const engine::EngineConfig& config, ZoneBook& book);

    void onPriceTick(double price, long long ts_ms);
    void onCandleClose(const Candle& candle);

    void setTouchListener(TouchListener listener) { listener_ = std::move(listener); }

    size_t pendingCount() const { return pending_.size(); }

    static RejectionScore scoreRejection(const RejectionInputs& inputs, const engine::TouchConfig& config);

private:
    struct PendingTouch {
        int zone_id = 0;
        double zone_center = 0.0;
        double touch_price = 0.0;
        long long ts_ms = 0;
        bool from_above = true;         // support test when price arrives from above
        double atr = 0.0;
        double volume_ratio = 0.0;
        std::vector<Candle> candles;    // touch candle first, then follow-through
    };

    void finalize(const PendingTouch& pending);
    double averageVolume() const;

    const engine::EngineConfig& config_;
    ZoneBook& book_;
    TouchListener listener_;

    std::map<int, PendingTouch> pending_;
    std::set<int> inside_band_;         // zones re-arm once price leaves the band
    std::deque<double> recent_volumes_;
    double last_price_ = 0.0;
};

} // namespace zones
} // namespace zonerisk
