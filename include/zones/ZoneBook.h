#pragma once

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

#include "engine/EngineConfig.h"
#include "zones/ZoneClusterer.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace zones {

struct ZoneSnapshot {
    uint64_t version = 0;
    double atr = 0.0;
    std::vector<Zone> zones;
};

struct ZoneAnchor {
    int id = 0;
    double price_center = 0.0;
};

// Owns the zone set for one symbol. Every mutation bumps the version so an
// evaluation can tell whether its snapshot is still current.
class ZoneBook {
public:
    explicit ZoneBook(const engine::EngineConfig& config);

    ZoneSnapshot snapshot() const;
    uint64_t version() const;
    double atr() const;
    size_t size() const;

    // Lightweight view for per-tick band checks.
    std::vector<ZoneAnchor> anchors() const;

    ReconcileResult applyClusters(std::vector<Zone> clusters, double atr);

    // Appends to the zone's bounded history, evicting the oldest. False if the zone is gone.
    bool appendTouch(int zone_id, const TouchRecord& touch);

    // Replaces the book with zones restored from storage. Touch histories longer
    // than the retention window keep only their newest records.
    void restore(std::vector<Zone> zones, double atr = 0.0);

private:
    const engine::EngineConfig& config_;
    ZoneClusterer clusterer_;

    mutable std::mutex mutex_;
    std::vector<Zone> zones_;
    uint64_t version_ = 0;
    int next_id_ = 1;
    double atr_ = 0.0;
};

} // namespace zones
} // namespace zonerisk
