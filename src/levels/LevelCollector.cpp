#include "levels/LevelCollector.h"

#include <chrono>
#include <future>

#include <boost/asio/post.hpp>

#include "common/Errors.h"
#include "common/Logger.h"
#include "levels/IndicatorLevelSource.h"
#include "levels/OrderWallLevelSource.h"
#include "levels/PivotLevelSource.h"
#include "levels/SwingLevelSource.h"

namespace zonerisk {
namespace levels {

LevelCollector::LevelCollector(const engine::SourceConfig& config)
    : config_(config)
    , pool_(static_cast<std::size_t>(config.worker_threads)) {}

LevelCollector::~LevelCollector() {
    // Timed-out sources may still be running; they own copies of their inputs.
    pool_.join();
}

void LevelCollector::addSource(std::shared_ptr<ILevelSource> source) {
    if (source) {
        sources_.push_back(std::move(source));
        in_flight_.emplace_back();
    }
}

CollectedLevels LevelCollector::collect(const MarketSnapshot& snapshot) {
    CollectedLevels out;
    if (sources_.empty()) {
        return out;
    }

    auto shared_snapshot = std::make_shared<const MarketSnapshot>(snapshot);

    std::vector<bool> posted(sources_.size(), false);
    for (size_t i = 0; i < sources_.size(); ++i) {
        auto& pending = in_flight_[i];
        if (pending.valid() &&
            pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            LOG_WARN("level source {} still running from an earlier cycle, skipped",
                     sources_[i]->name());
            out.missing_sources.push_back(sources_[i]->name());
            continue;
        }

        auto source = sources_[i];
        auto task = std::make_shared<std::packaged_task<LevelBatch()>>(
            [source, shared_snapshot]() { return source->collect(*shared_snapshot); });
        pending = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        posted[i] = true;
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(config_.timeout_ms);

    for (size_t i = 0; i < sources_.size(); ++i) {
        if (!posted[i]) {
            continue;
        }
        const std::string source_name = sources_[i]->name();

        if (in_flight_[i].wait_until(deadline) != std::future_status::ready) {
            LOG_WARN("level source {} timed out after {} ms, contributing no levels",
                     source_name, config_.timeout_ms);
            out.missing_sources.push_back(source_name);
            continue;
        }

        try {
            LevelBatch batch = in_flight_[i].get();
            if (batch.atr > 0.0 && !batch.timeframe.empty()) {
                out.atr_by_timeframe[batch.timeframe] = batch.atr;
            }
            LOG_DEBUG("level source {} -> {} levels", source_name, batch.levels.size());
            out.levels.insert(out.levels.end(), batch.levels.begin(), batch.levels.end());
        } catch (const MissingDataError& e) {
            LOG_DEBUG("level source {} missing data: {}", source_name, e.what());
            out.missing_sources.push_back(source_name);
        } catch (const std::exception& e) {
            LOG_WARN("level source {} failed: {}", source_name, e.what());
            out.missing_sources.push_back(source_name);
        }
    }

    return out;
}

std::unique_ptr<LevelCollector> LevelCollector::createDefault(const engine::SourceConfig& config) {
    auto collector = std::make_unique<LevelCollector>(config);

    for (const auto& tf : config.indicator_timeframes) {
        collector->addSource(std::make_shared<IndicatorLevelSource>(tf, config));
    }
    collector->addSource(std::make_shared<PivotLevelSource>(config));
    for (const auto& tf : config.swing_timeframes) {
        auto it = config.swing_base_weights.find(tf);
        const double base_weight = (it != config.swing_base_weights.end()) ? it->second : 1.0;
        collector->addSource(std::make_shared<SwingLevelSource>(tf, base_weight, config));
    }
    collector->addSource(std::make_shared<OrderWallLevelSource>(config));

    return collector;
}

} // namespace levels
} // namespace zonerisk
