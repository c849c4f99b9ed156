#include "zones/ZoneBook.h"

#include <algorithm>

namespace zonerisk {
namespace zones {

ZoneBook::ZoneBook(const engine::EngineConfig& config)
    : config_(config)
    , clusterer_(config) {}

ZoneSnapshot ZoneBook::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ZoneSnapshot snap;
    snap.version = version_;
    snap.atr = atr_;
    snap.zones = zones_;
    return snap;
}

uint64_t ZoneBook::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

double ZoneBook::atr() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return atr_;
}

size_t ZoneBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zones_.size();
}

std::vector<ZoneAnchor> ZoneBook::anchors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ZoneAnchor> out;
    out.reserve(zones_.size());
    for (const auto& zone : zones_) {
        out.push_back({zone.id, zone.price_center});
    }
    return out;
}

ReconcileResult ZoneBook::applyClusters(std::vector<Zone> clusters, double atr) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReconcileResult result = clusterer_.reconcile(zones_, std::move(clusters), atr, next_id_);
    zones_ = result.zones;
    atr_ = atr;
    ++version_;
    return result;
}

bool ZoneBook::appendTouch(int zone_id, const TouchRecord& touch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(zones_.begin(), zones_.end(),
                           [zone_id](const Zone& z) { return z.id == zone_id; });
    if (it == zones_.end()) {
        return false;
    }

    it->touches.push_back(touch);
    const size_t window = static_cast<size_t>(std::max(1, config_.touch.history_window));
    while (it->touches.size() > window) {
        it->touches.pop_front();
    }
    ++version_;
    return true;
}

void ZoneBook::restore(std::vector<Zone> zones, double atr) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::sort(zones.begin(), zones.end(),
              [](const Zone& a, const Zone& b) { return a.price_center < b.price_center; });
    const size_t window = static_cast<size_t>(std::max(1, config_.touch.history_window));
    int max_id = 0;
    for (auto& zone : zones) {
        max_id = std::max(max_id, zone.id);
        while (zone.touches.size() > window) {
            zone.touches.pop_front();
        }
    }
    zones_ = std::move(zones);
    next_id_ = std::max(next_id_, max_id + 1);
    atr_ = atr;
    ++version_;
}

} // namespace zones
} // namespace zonerisk
