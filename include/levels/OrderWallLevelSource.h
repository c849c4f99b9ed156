#pragma once

#include "engine/EngineConfig.h"
#include "levels/ILevelSource.h"

namespace zonerisk {
namespace levels {

// Large resting order-book levels (timeframe "book").
class OrderWallLevelSource : public ILevelSource {
public:
    explicit OrderWallLevelSource(const engine::SourceConfig& config) : config_(config) {}

    std::string name() const override { return "order_walls"; }
    LevelBatch collect(const MarketSnapshot& snapshot) override;

private:
    const engine::SourceConfig& config_;
};

} // namespace levels
} // namespace zonerisk
