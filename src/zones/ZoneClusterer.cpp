#include "zones/ZoneClusterer.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>

#include "common/Logger.h"

namespace zonerisk {
namespace zones {

ZoneClusterer::ZoneClusterer(const engine::EngineConfig& config)
    : config_(config) {}

Zone ZoneClusterer::makeZone(const std::vector<RawLevel>& members, double center, double merge_radius) const {
    Zone zone;
    zone.price_center = center;
    zone.merge_radius = merge_radius;
    zone.member_levels = members;
    describeMembers(zone);
    return zone;
}

void ZoneClusterer::describeMembers(Zone& zone) const {
    std::set<std::string> timeframes;
    int best_rank = tierRank(ZoneTier::MINOR) + 1;
    double best_weight = -1.0;
    for (const auto& level : zone.member_levels) {
        timeframes.insert(level.timeframe);
        const ZoneTier tier = config_.tierForTimeframe(level.timeframe);
        const int rank = tierRank(tier);
        if (rank < best_rank || (rank == best_rank && level.source_weight > best_weight)) {
            best_rank = rank;
            best_weight = level.source_weight;
            zone.tier = tier;
            zone.dominant_timeframe = level.timeframe;
        }
    }
    zone.confluence_count = static_cast<int>(timeframes.size());
}

std::vector<Zone> ZoneClusterer::cluster(std::vector<RawLevel> levels, double atr) const {
    std::vector<Zone> out;
    levels.erase(std::remove_if(levels.begin(), levels.end(),
                                [](const RawLevel& l) { return !(l.price > 0.0) || !std::isfinite(l.price); }),
                 levels.end());
    if (levels.empty()) {
        return out;
    }

    std::stable_sort(levels.begin(), levels.end(),
                     [](const RawLevel& a, const RawLevel& b) { return a.price < b.price; });

    const double radius = mergeRadius(atr);

    std::vector<RawLevel> members;
    double sum_w = 0.0;
    double sum_wp = 0.0;
    double sum_p = 0.0;

    auto center = [&]() {
        return sum_w > 0.0 ? sum_wp / sum_w : sum_p / static_cast<double>(members.size());
    };
    auto emit = [&]() {
        out.push_back(makeZone(members, center(), radius));
        members.clear();
        sum_w = sum_wp = sum_p = 0.0;
    };

    for (const auto& level : levels) {
        if (!members.empty() && std::abs(level.price - center()) > radius) {
            emit();
        }
        const double w = std::max(0.0, level.source_weight);
        members.push_back(level);
        sum_w += w;
        sum_wp += w * level.price;
        sum_p += level.price;
    }
    emit();

    return out;
}

void ZoneClusterer::mergeInto(Zone& survivor, const Zone& absorbed) const {
    std::vector<TouchRecord> combined(survivor.touches.begin(), survivor.touches.end());
    combined.insert(combined.end(), absorbed.touches.begin(), absorbed.touches.end());
    std::stable_sort(combined.begin(), combined.end(),
                     [](const TouchRecord& a, const TouchRecord& b) { return a.timestamp < b.timestamp; });

    const size_t window = static_cast<size_t>(std::max(1, config_.touch.history_window));
    if (combined.size() > window) {
        combined.erase(combined.begin(), combined.end() - static_cast<std::ptrdiff_t>(window));
    }
    survivor.touches.assign(combined.begin(), combined.end());
    survivor.member_levels.insert(survivor.member_levels.end(),
                                  absorbed.member_levels.begin(), absorbed.member_levels.end());
    describeMembers(survivor);
}

ReconcileResult ZoneClusterer::reconcile(const std::vector<Zone>& previous,
                                         std::vector<Zone> clusters,
                                         double atr,
                                         int& next_id) const {
    ReconcileResult result;
    const double radius = mergeRadius(atr);

    // Candidate pairs within the radius, nearest first.
    std::vector<std::tuple<double, size_t, size_t>> pairs;
    for (size_t c = 0; c < clusters.size(); ++c) {
        for (size_t p = 0; p < previous.size(); ++p) {
            const double dist = std::abs(clusters[c].price_center - previous[p].price_center);
            if (dist <= radius) {
                pairs.emplace_back(dist, c, p);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());

    std::vector<int> cluster_match(clusters.size(), -1);
    std::vector<bool> previous_used(previous.size(), false);
    for (const auto& [dist, c, p] : pairs) {
        if (cluster_match[c] >= 0 || previous_used[p]) {
            continue;
        }
        cluster_match[c] = static_cast<int>(p);
        previous_used[p] = true;
    }

    for (size_t c = 0; c < clusters.size(); ++c) {
        Zone zone = std::move(clusters[c]);
        zone.merge_radius = radius;
        zone.missed_cycles = 0;
        if (cluster_match[c] >= 0) {
            const Zone& prior = previous[static_cast<size_t>(cluster_match[c])];
            zone.id = prior.id;
            zone.touches = prior.touches;
            zone.strength_score = prior.strength_score;
            ++result.matched;
        } else {
            zone.id = next_id++;
            zone.touches.clear();
            ++result.created;
        }
        result.zones.push_back(std::move(zone));
    }

    for (size_t p = 0; p < previous.size(); ++p) {
        if (previous_used[p]) {
            continue;
        }
        Zone stale = previous[p];
        stale.missed_cycles += 1;
        if (stale.missed_cycles > config_.clustering.grace_cycles) {
            LOG_DEBUG("zone #{} @ {:.2f} expired after {} missed cycles",
                      stale.id, stale.price_center, stale.missed_cycles);
            ++result.expired;
            continue;
        }
        stale.merge_radius = radius;
        result.zones.push_back(std::move(stale));
    }

    std::sort(result.zones.begin(), result.zones.end(),
              [](const Zone& a, const Zone& b) { return a.price_center < b.price_center; });

    // Carried-over zones may now sit inside another zone's radius.
    bool changed = true;
    while (changed && result.zones.size() > 1) {
        changed = false;
        for (size_t i = 0; i + 1 < result.zones.size(); ++i) {
            Zone& lower = result.zones[i];
            Zone& upper = result.zones[i + 1];
            if (upper.price_center - lower.price_center >= radius) {
                continue;
            }
            // Fresh zone survives; between two of the same freshness the older id does.
            const bool keep_lower = (lower.missed_cycles < upper.missed_cycles) ||
                                    (lower.missed_cycles == upper.missed_cycles && lower.id < upper.id);
            if (keep_lower) {
                mergeInto(lower, upper);
                result.zones.erase(result.zones.begin() + static_cast<std::ptrdiff_t>(i) + 1);
            } else {
                mergeInto(upper, lower);
                result.zones.erase(result.zones.begin() + static_cast<std::ptrdiff_t>(i));
            }
            ++result.merged;
            changed = true;
            break;
        }
        if (changed) {
            std::sort(result.zones.begin(), result.zones.end(),
                      [](const Zone& a, const Zone& b) { return a.price_center < b.price_center; });
        }
    }

    return result;
}

} // namespace zones
} // namespace zonerisk
