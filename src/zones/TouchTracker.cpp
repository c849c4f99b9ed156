#include "zones/TouchTracker.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "common/Logger.h"

namespace zonerisk {
namespace zones {

TouchTracker::TouchTracker(const engine::EngineConfig& config, ZoneBook& book)
    : config_(config)
    , book_(book) {}

RejectionScore TouchTracker::scoreRejection(const RejectionInputs& inputs, const engine::TouchConfig& config) {
    RejectionScore score;
    score.wick = std::min(config.wick_cap, std::max(0.0, inputs.wick_ratio) * 4.0);
    score.volume = std::clamp((inputs.volume_ratio - 1.0) * 1.25, 0.0, config.volume_cap);
    score.bounce = std::min(config.bounce_cap, std::max(0.0, inputs.bounce_atr) * 2.5);
    score.follow_through = std::clamp(inputs.follow_through_atr * 2.0, 0.0, config.follow_through_cap);
    score.total = std::min(10.0, score.wick + score.volume + score.bounce + score.follow_through);
    return score;
}

void TouchTracker::onPriceTick(double price, long long ts_ms) {
    if (!(price > 0.0)) {
        return;
    }

    const double atr = book_.atr();
    const double band = atr * config_.touch.touch_band_atr_mult;
    const double previous = last_price_ > 0.0 ? last_price_ : price;
    last_price_ = price;
    if (!(band > 0.0)) {
        return;
    }

    std::set<int> live;
    for (const auto& anchor : book_.anchors()) {
        live.insert(anchor.id);
        const bool inside = std::abs(price - anchor.price_center) < band;
        if (!inside) {
            inside_band_.erase(anchor.id);
            continue;
        }
        if (inside_band_.count(anchor.id) > 0 || pending_.count(anchor.id) > 0) {
            continue;
        }

        inside_band_.insert(anchor.id);
        PendingTouch pending;
        pending.zone_id = anchor.id;
        pending.zone_center = anchor.price_center;
        pending.touch_price = price;
        pending.ts_ms = ts_ms;
        pending.from_above = previous >= anchor.price_center;
        pending.atr = atr;
        pending_[anchor.id] = pending;
        LOG_DEBUG("touch opened on zone #{} @ {:.2f} (price {:.2f}, from {})",
                  anchor.id, anchor.price_center, price, pending.from_above ? "above" : "below");
    }

    // Zones removed by reconciliation no longer hold a band slot.
    for (auto it = inside_band_.begin(); it != inside_band_.end();) {
        it = live.count(*it) > 0 ? std::next(it) : inside_band_.erase(it);
    }
}

double TouchTracker::averageVolume() const {
    if (recent_volumes_.empty()) {
        return 0.0;
    }
    return std::accumulate(recent_volumes_.begin(), recent_volumes_.end(), 0.0) /
           static_cast<double>(recent_volumes_.size());
}

void TouchTracker::onCandleClose(const Candle& candle) {
    const size_t needed = 1 + static_cast<size_t>(std::max(0, config_.touch.follow_through_candles));
    const double avg_volume = averageVolume();

    for (auto it = pending_.begin(); it != pending_.end();) {
        PendingTouch& pending = it->second;
        if (pending.candles.empty()) {
            pending.volume_ratio = avg_volume > 0.0 ? candle.volume / avg_volume : 1.0;
        }
        pending.candles.push_back(candle);

        if (pending.candles.size() >= needed) {
            finalize(pending);
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    recent_volumes_.push_back(candle.volume);
    const size_t lookback = static_cast<size_t>(std::max(1, config_.touch.volume_lookback));
    while (recent_volumes_.size() > lookback) {
        recent_volumes_.pop_front();
    }
}

void TouchTracker::finalize(const PendingTouch& pending) {
    const Candle& touch = pending.candles.front();
    const double range = touch.high - touch.low;
    const double atr = pending.atr > 0.0 ? pending.atr : book_.atr();

    RejectionInputs inputs;
    inputs.volume_ratio = pending.volume_ratio;

    if (pending.from_above) {
        const double lower_wick = std::min(touch.open, touch.close) - touch.low;
        inputs.wick_ratio = range > 0.0 ? lower_wick / range : 0.0;

        double max_high = 0.0;
        for (const auto& c : pending.candles) {
            max_high = std::max(max_high, c.high);
        }
        if (atr > 0.0) {
            inputs.bounce_atr = (max_high - pending.zone_center) / atr;
            inputs.follow_through_atr = (pending.candles.back().close - pending.touch_price) / atr;
        }
    } else {
        const double upper_wick = touch.high - std::max(touch.open, touch.close);
        inputs.wick_ratio = range > 0.0 ? upper_wick / range : 0.0;

        double min_low = pending.candles.front().low;
        for (const auto& c : pending.candles) {
            min_low = std::min(min_low, c.low);
        }
        if (atr > 0.0) {
            inputs.bounce_atr = (pending.zone_center - min_low) / atr;
            inputs.follow_through_atr = (pending.touch_price - pending.candles.back().close) / atr;
        }
    }

    const RejectionScore score = scoreRejection(inputs, config_.touch);

    TouchRecord record;
    record.timestamp = pending.ts_ms;
    record.touch_price = pending.touch_price;
    record.rejection_strength = score.total;
    record.volume_ratio = pending.volume_ratio;

    if (!book_.appendTouch(pending.zone_id, record)) {
        LOG_DEBUG("zone #{} gone before its touch finalized, dropping", pending.zone_id);
        return;
    }

    LOG_INFO("touch recorded on zone #{} @ {:.2f}: strength {:.2f} (wick {:.2f}, vol {:.2f}, bounce {:.2f}, ft {:.2f})",
             pending.zone_id, pending.zone_center, score.total,
             score.wick, score.volume, score.bounce, score.follow_through);

    if (listener_) {
        listener_(pending.zone_id, record);
    }
}

} // namespace zones
} // namespace zonerisk
