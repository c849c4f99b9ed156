#include "common/Errors.h"
#include "zones/StrengthScorer.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace zonerisk;
using zones::StrengthScorer;
using zones::StrengthTier;
using zones::Zone;
using zones::ZoneTier;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

Zone makeZone(double weight, size_t touches, double strength, ZoneTier tier, int confluence) {
    Zone zone;
    zone.id = 7;
    zone.price_center = 76000.0;
    zone.member_levels.push_back({76000.0, "SMA_200", weight, "1d"});
    zone.tier = tier;
    zone.confluence_count = confluence;
    for (size_t i = 0; i < touches; ++i) {
        zone.touches.push_back({static_cast<long long>(i), 76000.0, strength, 1.0});
    }
    return zone;
}

} // namespace

int main() {
    engine::ScoringConfig config;
    StrengthScorer scorer(config);

    // Touch-count factor peaks at 2-3 touches
    assert(near(StrengthScorer::touchCountFactor(0), 0.8));
    assert(near(StrengthScorer::touchCountFactor(1), 0.8));
    assert(near(StrengthScorer::touchCountFactor(2), 1.0));
    assert(near(StrengthScorer::touchCountFactor(3), 1.0));
    assert(near(StrengthScorer::touchCountFactor(4), 0.9));
    assert(near(StrengthScorer::touchCountFactor(5), 0.9));
    assert(near(StrengthScorer::touchCountFactor(6), 0.7));

    assert(near(StrengthScorer::confluenceBonus(1), 0.0));
    assert(near(StrengthScorer::confluenceBonus(2), 0.5));
    assert(near(StrengthScorer::confluenceBonus(3), 1.0));
    assert(near(StrengthScorer::confluenceBonus(4), 1.5));
    assert(near(StrengthScorer::confluenceBonus(9), 1.5));

    // Strong multi-timeframe zone with two clean rejections
    {
        auto s = scorer.score(makeZone(5.0, 2, 10.0, ZoneTier::MAJOR, 4));
        assert(near(s.base, 3.0));
        assert(near(s.touch_quality, 3.0));
        assert(near(s.timeframe, 2.0));
        assert(near(s.confluence, 1.5));
        assert(near(s.total, 9.5));
        assert(s.tier == StrengthTier::STRONG);
        assert(!s.low_confidence);
    }

    // No touches: neutral rejection, discounted, flagged low confidence
    {
        auto s = scorer.score(makeZone(1.0, 0, 0.0, ZoneTier::INTERMEDIATE, 1));
        assert(near(s.avg_rejection, config.neutral_rejection));
        assert(near(s.touch_quality, 1.2));
        assert(near(s.total, 1.0 + 1.2 + 1.5));
        assert(s.tier == StrengthTier::WEAK);
        assert(s.low_confidence);
    }

    // Over-tested level loses touch quality
    {
        auto fresh = scorer.score(makeZone(1.0, 3, 8.0, ZoneTier::MINOR, 1));
        auto worn = scorer.score(makeZone(1.0, 8, 8.0, ZoneTier::MINOR, 1));
        assert(worn.touch_quality < fresh.touch_quality);
    }

    // Always within [0, 10]
    {
        const double weights[] = {0.0, 0.5, 2.0, 50.0};
        const size_t touch_counts[] = {0, 1, 3, 5, 12};
        const double strengths[] = {0.0, 4.0, 10.0, 25.0};
        const ZoneTier tiers[] = {ZoneTier::MAJOR, ZoneTier::INTERMEDIATE, ZoneTier::MINOR};
        const int confluences[] = {0, 1, 2, 3, 4, 7};
        for (double w : weights) {
            for (size_t n : touch_counts) {
                for (double st : strengths) {
                    for (ZoneTier t : tiers) {
                        for (int c : confluences) {
                            auto s = scorer.score(makeZone(w, n, st, t, c));
                            assert(s.total >= 0.0 && s.total <= 10.0);
                        }
                    }
                }
            }
        }
    }

    // Tier thresholds
    assert(scorer.tierFor(7.5) == StrengthTier::STRONG);
    assert(scorer.tierFor(7.49) == StrengthTier::MEDIUM);
    assert(scorer.tierFor(5.0) == StrengthTier::MEDIUM);
    assert(scorer.tierFor(4.99) == StrengthTier::WEAK);

    // Strict history check reports the shortfall
    {
        bool thrown = false;
        try {
            scorer.requireConfidentHistory(makeZone(1.0, 1, 5.0, ZoneTier::MINOR, 1));
        } catch (const InsufficientHistoryError& e) {
            thrown = true;
            assert(e.code() == ErrorCode::INSUFFICIENT_HISTORY);
            assert(e.zoneId() == 7);
            assert(e.touches() == 1);
            assert(e.required() == config.min_touches_for_confidence);
        }
        assert(thrown);
        scorer.requireConfidentHistory(makeZone(1.0, 2, 5.0, ZoneTier::MINOR, 1));
    }

    // scoreAll writes the score back
    {
        std::vector<Zone> zones = {makeZone(5.0, 2, 10.0, ZoneTier::MAJOR, 4)};
        scorer.scoreAll(zones);
        assert(near(zones[0].strength_score, 9.5));
    }

    std::cout << "[TEST] StrengthScorer PASSED\n";
    return 0;
}
