#pragma once

#include <deque>
#include <string>
#include <vector>

namespace zonerisk {
namespace zones {

enum class ZoneTier { MAJOR, INTERMEDIATE, MINOR };
enum class StrengthTier { STRONG, MEDIUM, WEAK };

inline const char* toString(ZoneTier tier) {
    switch (tier) {
        case ZoneTier::MAJOR: return "MAJOR";
        case ZoneTier::INTERMEDIATE: return "INTERMEDIATE";
        case ZoneTier::MINOR: return "MINOR";
    }
    return "MINOR";
}

inline ZoneTier zoneTierFromString(const std::string& value) {
    if (value == "MAJOR") return ZoneTier::MAJOR;
    if (value == "INTERMEDIATE") return ZoneTier::INTERMEDIATE;
    return ZoneTier::MINOR;
}

inline const char* toString(StrengthTier tier) {
    switch (tier) {
        case StrengthTier::STRONG: return "STRONG";
        case StrengthTier::MEDIUM: return "MEDIUM";
        case StrengthTier::WEAK: return "WEAK";
    }
    return "WEAK";
}

// Lower rank = higher timeframe class
inline int tierRank(ZoneTier tier) {
    switch (tier) {
        case ZoneTier::MAJOR: return 0;
        case ZoneTier::INTERMEDIATE: return 1;
        case ZoneTier::MINOR: return 2;
    }
    return 2;
}

struct RawLevel {
    double price = 0.0;
    std::string source_tag;     // e.g. SMA_200, BB_Upper, Pivot_R1, Swing_High, Order_Wall
    double source_weight = 0.0;
    std::string timeframe;      // e.g. 1w, 1d, 4h, 1h, 15m, book
};

struct TouchRecord {
    long long timestamp = 0;    // ms since epoch
    double touch_price = 0.0;
    double rejection_strength = 0.0;  // [0, 10]
    double volume_ratio = 0.0;
};

struct Zone {
    int id = 0;
    double price_center = 0.0;
    double merge_radius = 0.0;
    std::vector<RawLevel> member_levels;
    ZoneTier tier = ZoneTier::MINOR;
    double strength_score = 0.0;
    int confluence_count = 0;
    std::deque<TouchRecord> touches;    // oldest first, bounded by the history window
    int missed_cycles = 0;              // consecutive cycles without a matching cluster
    std::string dominant_timeframe;     // timeframe of the highest-tier member

    double totalSourceWeight() const {
        double sum = 0.0;
        for (const auto& level : member_levels) {
            sum += level.source_weight;
        }
        return sum;
    }
};

} // namespace zones
} // namespace zonerisk
