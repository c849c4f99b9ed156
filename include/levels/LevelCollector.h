#pragma once

#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "engine/EngineConfig.h"
#include "levels/ILevelSource.h"

namespace zonerisk {
namespace levels {

struct CollectedLevels {
    std::vector<zones::RawLevel> levels;
    std::map<std::string, double> atr_by_timeframe;
    std::vector<std::string> missing_sources;   // empty, failed or timed out this cycle
};

// Runs every registered source on a worker pool. A source that throws or misses
// its deadline contributes zero levels; the cycle never waits past the timeout.
// A source whose previous task is still running is not posted again.
class LevelCollector {
public:
    explicit LevelCollector(const engine::SourceConfig& config);
    ~LevelCollector();

    LevelCollector(const LevelCollector&) = delete;
    LevelCollector& operator=(const LevelCollector&) = delete;

    void addSource(std::shared_ptr<ILevelSource> source);
    size_t sourceCount() const { return sources_.size(); }

    CollectedLevels collect(const MarketSnapshot& snapshot);

    // Indicator, pivot, swing and order-wall sources as configured.
    static std::unique_ptr<LevelCollector> createDefault(const engine::SourceConfig& config);

private:
    const engine::SourceConfig& config_;
    std::vector<std::shared_ptr<ILevelSource>> sources_;
    std::vector<std::future<LevelBatch>> in_flight_;   // parallel to sources_
    boost::asio::thread_pool pool_;
};

} // namespace levels
} // namespace zonerisk
