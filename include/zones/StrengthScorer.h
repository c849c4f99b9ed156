#pragma once

#include <vector>

#include "engine/EngineConfig.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace zones {

struct ScoreBreakdown {
    double base = 0.0;              // summed source weight, capped
    double touch_quality = 0.0;
    double timeframe = 0.0;
    double confluence = 0.0;
    double total = 0.0;             // [0, 10]

    double avg_rejection = 0.0;
    double touch_count_factor = 0.0;
    bool low_confidence = false;    // too few touches to trust the touch component
    StrengthTier tier = StrengthTier::WEAK;
};

class StrengthScorer {
public:
    explicit StrengthScorer(const engine::ScoringConfig& config);

    ScoreBreakdown score(const Zone& zone) const;
    StrengthTier tierFor(double score) const;

    // Writes strength_score on every zone.
    void scoreAll(std::vector<Zone>& zones) const;

    // Throws InsufficientHistoryError when the zone's touch history is too short.
    void requireConfidentHistory(const Zone& zone) const;

    static double touchCountFactor(size_t touches);
    static double confluenceBonus(int confluence_count);
    double timeframeComponent(ZoneTier tier) const;

private:
    const engine::ScoringConfig& config_;
};

} // namespace zones
} // namespace zonerisk
