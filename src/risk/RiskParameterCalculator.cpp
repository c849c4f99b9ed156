#include "risk/RiskParameterCalculator.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace zonerisk {
namespace risk {

namespace {

// Zones on the requested side of entry, nearest first; equal distance prefers the stronger zone.
std::vector<ScoredZone> sideOfEntry(const std::vector<ScoredZone>& zones, double entry, bool above) {
    std::vector<ScoredZone> out;
    for (const auto& z : zones) {
        const double c = z.zone.price_center;
        if ((above && c > entry) || (!above && c < entry)) {
            out.push_back(z);
        }
    }
    std::stable_sort(out.begin(), out.end(), [entry](const ScoredZone& a, const ScoredZone& b) {
        const double da = std::abs(a.zone.price_center - entry);
        const double db = std::abs(b.zone.price_center - entry);
        if (da != db) {
            return da < db;
        }
        return a.zone.strength_score > b.zone.strength_score;
    });
    return out;
}

std::string describeZone(const zones::Zone& zone, zones::StrengthTier strength) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << "zone #" << zone.id << " @ " << zone.price_center
       << " (" << zones::toString(zone.tier) << ", " << zones::toString(strength)
       << ", score " << zone.strength_score << ")";
    return ss.str();
}

} // namespace

RegimeAlignment RiskParameterCalculator::alignmentFor(analytics::MarketCondition condition,
                                                      TradeDirection direction) {
    switch (condition) {
        case analytics::MarketCondition::NORMAL:
            return RegimeAlignment::NORMAL;
        case analytics::MarketCondition::EXTREME_VOLATILE:
            return RegimeAlignment::VOLATILE;
        case analytics::MarketCondition::EXTREME_BULLISH:
            return direction == TradeDirection::LONG ? RegimeAlignment::TREND_ALIGNED
                                                     : RegimeAlignment::COUNTER_TREND;
        case analytics::MarketCondition::EXTREME_BEARISH:
            return direction == TradeDirection::SHORT ? RegimeAlignment::TREND_ALIGNED
                                                      : RegimeAlignment::COUNTER_TREND;
    }
    return RegimeAlignment::NORMAL;
}

size_t RiskParameterCalculator::selectTargetIndex(const std::vector<ScoredZone>& targets,
                                                  RegimeAlignment alignment) {
    if (alignment != RegimeAlignment::TREND_ALIGNED || targets.size() < 2) {
        return 0;
    }
    for (size_t i = 1; i < targets.size(); ++i) {
        if (targets[i].strength == zones::StrengthTier::STRONG ||
            targets[i].strength == zones::StrengthTier::MEDIUM) {
            return i;
        }
    }
    return 1;
}

double RiskParameterCalculator::confidenceMultiplier(SignalConfidence confidence) const {
    switch (confidence) {
        case SignalConfidence::HIGH: return config_.high_confidence_mult;
        case SignalConfidence::MEDIUM: return config_.medium_confidence_mult;
        case SignalConfidence::LOW: return config_.low_confidence_mult;
    }
    return config_.medium_confidence_mult;
}

RiskDecision RiskParameterCalculator::calculate(const RiskRequest& request) const {
    RiskDecision decision;
    RiskParameters& p = decision.params;
    RiskAdjustments& adj = decision.adjustments;

    const double entry = request.entry_price;
    if (!(entry > 0.0) || !std::isfinite(entry)) {
        decision.error.emplace("INVALID_ENTRY_PRICE", 0.0, 0.0);
        decision.rationale = "rejected: entry price must be positive";
        return decision;
    }

    const bool is_long = request.direction == TradeDirection::LONG;
    const double sign = is_long ? 1.0 : -1.0;

    adj.alignment = alignmentFor(request.condition, request.direction);
    switch (adj.alignment) {
        case RegimeAlignment::TREND_ALIGNED:
            adj.tp_multiplier = config_.trend_aligned_tp_mult;
            adj.sl_multiplier = config_.trend_aligned_sl_mult;
            adj.regime_position_multiplier = config_.trend_aligned_position_mult;
            adj.required_rr = config_.min_rr_trend_aligned;
            break;
        case RegimeAlignment::COUNTER_TREND:
            adj.tp_multiplier = config_.counter_trend_tp_mult;
            adj.sl_multiplier = config_.counter_trend_sl_mult;
            adj.regime_position_multiplier = config_.counter_trend_position_mult;
            adj.required_rr = config_.min_rr_normal;
            break;
        case RegimeAlignment::VOLATILE:
            adj.regime_position_multiplier = config_.volatile_position_mult;
            adj.required_rr = config_.min_rr_normal;
            break;
        case RegimeAlignment::NORMAL:
            adj.required_rr = config_.min_rr_normal;
            break;
    }

    const auto targets = sideOfEntry(is_long ? request.resistances : request.supports, entry, is_long);
    const auto stops = sideOfEntry(is_long ? request.supports : request.resistances, entry, !is_long);

    // ===== Take profit =====
    double tp_distance = 0.0;
    if (targets.empty()) {
        p.tp_type = LevelType::FALLBACK_PCT;
        tp_distance = entry * config_.fallback_tp_pct * adj.tp_multiplier;
        p.tp_price = entry * (1.0 + sign * config_.fallback_tp_pct * adj.tp_multiplier);
    } else {
        const ScoredZone& target = targets[selectTargetIndex(targets, adj.alignment)];
        p.tp_type = LevelType::SR_LEVEL;
        p.reference_zone = target.zone;
        const double zone_price = target.zone.price_center * (1.0 - sign * config_.tp_buffer_pct);
        const double raw = sign * (zone_price - entry);
        p.tp_price = zone_price;
        tp_distance = raw;
        if (adj.tp_multiplier < 1.0) {
            tp_distance = raw * adj.tp_multiplier;
            p.tp_price = entry + sign * tp_distance;
        } else if (adj.tp_multiplier > 1.0) {
            // The selected zone caps the extension.
            adj.tp_capped_by_zone = true;
        }
    }

    // ===== Stop loss =====
    double sl_distance = 0.0;
    if (stops.empty()) {
        p.sl_type = LevelType::FALLBACK_PCT;
        sl_distance = entry * config_.fallback_sl_pct * adj.sl_multiplier;
        p.sl_price = entry * (1.0 - sign * config_.fallback_sl_pct * adj.sl_multiplier);
    } else {
        const ScoredZone& stop = stops.front();
        p.sl_type = LevelType::SR_LEVEL;
        p.stop_zone = stop.zone;
        const double zone_price = stop.zone.price_center * (1.0 - sign * config_.sl_buffer_pct);
        p.sl_price = zone_price;
        sl_distance = sign * (entry - zone_price);
        if (adj.sl_multiplier != 1.0) {
            sl_distance *= adj.sl_multiplier;
            p.sl_price = entry - sign * sl_distance;
        }
    }

    // ===== Hard bounds =====
    const double sl_pct = sl_distance / entry;
    const double clamped_sl_pct = std::clamp(sl_pct, config_.min_sl_pct, config_.max_sl_pct);
    if (clamped_sl_pct != sl_pct) {
        adj.sl_clamped = true;
        sl_distance = clamped_sl_pct * entry;
        p.sl_price = entry - sign * sl_distance;
    }

    const double tp_pct = tp_distance / entry;
    const double clamped_tp_pct = std::clamp(tp_pct, config_.min_tp_pct, config_.max_tp_pct);
    if (clamped_tp_pct != tp_pct) {
        adj.tp_clamped = true;
        tp_distance = clamped_tp_pct * entry;
        p.tp_price = entry + sign * tp_distance;
    }

    adj.confidence_multiplier = confidenceMultiplier(request.confidence);
    double position = adj.confidence_multiplier * adj.regime_position_multiplier;
    position = std::clamp(position, config_.min_position_mult, config_.max_position_mult);
    if (adj.alignment == RegimeAlignment::COUNTER_TREND) {
        position = std::min(position, config_.counter_trend_position_cap);
    }
    p.position_multiplier = position;

    p.sl_distance_pct = sl_distance / entry;
    p.tp_distance_pct = tp_distance / entry;
    p.risk_reward = sl_distance > 0.0 ? tp_distance / sl_distance : 0.0;

    if (p.risk_reward + 1e-12 < adj.required_rr) {
        decision.error.emplace("RR_BELOW_MINIMUM", p.risk_reward, adj.required_rr);
    }

    // ===== Rationale =====
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    ss << toString(request.direction) << " @ " << entry
       << " | regime " << analytics::toString(request.condition)
       << " (" << toString(adj.alignment) << ")";
    ss << " | TP " << p.tp_price << " [" << toString(p.tp_type) << "]";
    if (p.reference_zone) {
        ss << " via " << describeZone(*p.reference_zone, targets[selectTargetIndex(targets, adj.alignment)].strength);
    }
    ss << " | SL " << p.sl_price << " [" << toString(p.sl_type) << "]";
    if (p.stop_zone) {
        ss << " via " << describeZone(*p.stop_zone, stops.front().strength);
    }
    ss << " | mult tp x" << adj.tp_multiplier << (adj.tp_capped_by_zone ? " (zone-capped)" : "")
       << " sl x" << adj.sl_multiplier
       << " pos x" << adj.regime_position_multiplier << " conf x" << adj.confidence_multiplier;
    if (adj.sl_clamped) ss << " | SL clamped";
    if (adj.tp_clamped) ss << " | TP clamped";
    ss << " | position " << p.position_multiplier
       << " | R:R " << p.risk_reward << " (min " << adj.required_rr << ")";
    if (decision.error) {
        ss << " | REJECTED " << decision.error->reasonCode();
    }
    decision.rationale = ss.str();

    return decision;
}

} // namespace risk
} // namespace zonerisk
