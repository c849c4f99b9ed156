#pragma once

#include "engine/EngineConfig.h"
#include "levels/ILevelSource.h"

namespace zonerisk {
namespace levels {

// SMA50, SMA200 and Bollinger upper/lower for one timeframe, plus that timeframe's ATR.
class IndicatorLevelSource : public ILevelSource {
public:
    IndicatorLevelSource(std::string timeframe, const engine::SourceConfig& config);

    std::string name() const override { return "indicators_" + timeframe_; }
    LevelBatch collect(const MarketSnapshot& snapshot) override;

private:
    std::string timeframe_;
    const engine::SourceConfig& config_;
};

} // namespace levels
} // namespace zonerisk
