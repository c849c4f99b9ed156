#include "zones/StrengthScorer.h"

#include <algorithm>

#include "common/Errors.h"
#include "common/Logger.h"

namespace zonerisk {
namespace zones {

StrengthScorer::StrengthScorer(const engine::ScoringConfig& config)
    : config_(config) {}

double StrengthScorer::touchCountFactor(size_t touches) {
    if (touches <= 1) return 0.8;
    if (touches <= 3) return 1.0;
    if (touches <= 5) return 0.9;
    return 0.7;     // heavily tested levels tend to give way
}

double StrengthScorer::confluenceBonus(int confluence_count) {
    if (confluence_count >= 4) return 1.5;
    if (confluence_count == 3) return 1.0;
    if (confluence_count == 2) return 0.5;
    return 0.0;
}

double StrengthScorer::timeframeComponent(ZoneTier tier) const {
    switch (tier) {
        case ZoneTier::MAJOR: return config_.major_weight;
        case ZoneTier::INTERMEDIATE: return config_.intermediate_weight;
        case ZoneTier::MINOR: return config_.minor_weight;
    }
    return config_.minor_weight;
}

StrengthTier StrengthScorer::tierFor(double score) const {
    if (score >= config_.strong_threshold) return StrengthTier::STRONG;
    if (score >= config_.medium_threshold) return StrengthTier::MEDIUM;
    return StrengthTier::WEAK;
}

void StrengthScorer::requireConfidentHistory(const Zone& zone) const {
    const int touches = static_cast<int>(zone.touches.size());
    if (touches < config_.min_touches_for_confidence) {
        throw InsufficientHistoryError(zone.id, touches, config_.min_touches_for_confidence);
    }
}

ScoreBreakdown StrengthScorer::score(const Zone& zone) const {
    ScoreBreakdown out;

    out.base = std::min(config_.base_weight_cap, std::max(0.0, zone.totalSourceWeight()));

    if (zone.touches.empty()) {
        out.avg_rejection = config_.neutral_rejection;
    } else {
        double sum = 0.0;
        for (const auto& touch : zone.touches) {
            sum += std::clamp(touch.rejection_strength, 0.0, 10.0);
        }
        out.avg_rejection = sum / static_cast<double>(zone.touches.size());
    }
    out.touch_count_factor = touchCountFactor(zone.touches.size());
    out.touch_quality = (out.avg_rejection / 10.0) * config_.touch_quality_cap * out.touch_count_factor;

    out.timeframe = timeframeComponent(zone.tier);
    out.confluence = confluenceBonus(zone.confluence_count);

    out.total = std::clamp(out.base + out.touch_quality + out.timeframe + out.confluence, 0.0, 10.0);
    out.tier = tierFor(out.total);

    try {
        requireConfidentHistory(zone);
    } catch (const InsufficientHistoryError& e) {
        out.low_confidence = true;
        LOG_DEBUG("zone #{} scored with low confidence: {}", zone.id, e.what());
    }

    return out;
}

void StrengthScorer::scoreAll(std::vector<Zone>& zones) const {
    for (auto& zone : zones) {
        zone.strength_score = score(zone).total;
    }
}

} // namespace zones
} // namespace zonerisk
