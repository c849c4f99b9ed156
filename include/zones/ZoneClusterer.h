#pragma once

#include <vector>

#include "engine/EngineConfig.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace zones {

struct ReconcileResult {
    std::vector<Zone> zones;    // ascending by price_center
    int matched = 0;
    int created = 0;
    int expired = 0;
    int merged = 0;
};

class ZoneClusterer {
public:
    explicit ZoneClusterer(const engine::EngineConfig& config);

    double mergeRadius(double atr) const { return atr * config_.clustering.merge_radius_atr_mult; }

    // Sorted single pass: a level joins the current cluster when it is within the
    // merge radius of the cluster's running weighted center. Result ids are 0.
    std::vector<Zone> cluster(std::vector<RawLevel> levels, double atr) const;

    // Carries identity and touch history from previous zones onto this cycle's
    // clusters (nearest center within the merge radius, one-to-one). Unmatched
    // previous zones age by one cycle and expire past the grace period.
    ReconcileResult reconcile(const std::vector<Zone>& previous,
                              std::vector<Zone> clusters,
                              double atr,
                              int& next_id) const;

private:
    Zone makeZone(const std::vector<RawLevel>& members, double center, double merge_radius) const;
    // Recomputes the tier and confluence fields from member_levels.
    void describeMembers(Zone& zone) const;
    void mergeInto(Zone& survivor, const Zone& absorbed) const;

    const engine::EngineConfig& config_;
};

} // namespace zones
} // namespace zonerisk
