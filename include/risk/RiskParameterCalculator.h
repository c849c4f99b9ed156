#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/MarketRegimeClassifier.h"
#include "common/Errors.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace risk {

enum class LevelType { SR_LEVEL, FALLBACK_PCT };

inline const char* toString(LevelType type) {
    return type == LevelType::SR_LEVEL ? "SR_LEVEL" : "FALLBACK_PCT";
}

// How the regime relates to the signal direction.
enum class RegimeAlignment { NORMAL, TREND_ALIGNED, COUNTER_TREND, VOLATILE };

inline const char* toString(RegimeAlignment alignment) {
    switch (alignment) {
        case RegimeAlignment::NORMAL: return "NORMAL";
        case RegimeAlignment::TREND_ALIGNED: return "TREND_ALIGNED";
        case RegimeAlignment::COUNTER_TREND: return "COUNTER_TREND";
        case RegimeAlignment::VOLATILE: return "VOLATILE";
    }
    return "NORMAL";
}

struct ScoredZone {
    zones::Zone zone;
    zones::StrengthTier strength = zones::StrengthTier::WEAK;
};

struct RiskRequest {
    TradeDirection direction = TradeDirection::LONG;
    double entry_price = 0.0;
    analytics::MarketCondition condition = analytics::MarketCondition::NORMAL;
    SignalConfidence confidence = SignalConfidence::HIGH;
    std::vector<ScoredZone> resistances;    // above entry
    std::vector<ScoredZone> supports;       // below entry
};

struct RiskParameters {
    double sl_price = 0.0;
    double tp_price = 0.0;
    LevelType sl_type = LevelType::FALLBACK_PCT;
    LevelType tp_type = LevelType::FALLBACK_PCT;
    double position_multiplier = 1.0;
    std::optional<zones::Zone> reference_zone;  // take-profit zone
    std::optional<zones::Zone> stop_zone;

    double sl_distance_pct = 0.0;
    double tp_distance_pct = 0.0;
    double risk_reward = 0.0;
};

struct RiskAdjustments {
    RegimeAlignment alignment = RegimeAlignment::NORMAL;
    double tp_multiplier = 1.0;
    double sl_multiplier = 1.0;
    double regime_position_multiplier = 1.0;
    double confidence_multiplier = 1.0;
    bool sl_clamped = false;
    bool tp_clamped = false;
    bool tp_capped_by_zone = false;
    double required_rr = 1.0;
};

struct RiskDecision {
    RiskParameters params;
    RiskAdjustments adjustments;
    std::optional<InvalidRiskBoundsError> error;
    std::string rationale;

    bool accepted() const { return !error.has_value(); }
};

// Pure and deterministic. A shortfall against the regime minimum R:R is reported
// in the decision, never widened here.
class RiskParameterCalculator {
public:
    explicit RiskParameterCalculator(const engine::RiskConfig& config) : config_(config) {}

    RiskDecision calculate(const RiskRequest& request) const;

    static RegimeAlignment alignmentFor(analytics::MarketCondition condition, TradeDirection direction);

    // Index into distance-sorted targets for the take-profit zone.
    static size_t selectTargetIndex(const std::vector<ScoredZone>& targets, RegimeAlignment alignment);

    double confidenceMultiplier(SignalConfidence confidence) const;

private:
    const engine::RiskConfig& config_;
};

} // namespace risk
} // namespace zonerisk
