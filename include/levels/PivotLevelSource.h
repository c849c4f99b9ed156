#pragma once

#include <optional>
#include <vector>

#include "engine/EngineConfig.h"
#include "levels/ILevelSource.h"

namespace zonerisk {
namespace levels {

// Floor-trader pivots (PP, R1-R3, S1-S3) projected from the last completed daily bar
// (timeframe 1d) and from a weekly bar built out of the last five daily bars (1w).
class PivotLevelSource : public ILevelSource {
public:
    explicit PivotLevelSource(const engine::SourceConfig& config) : config_(config) {}

    std::string name() const override { return "pivots"; }
    LevelBatch collect(const MarketSnapshot& snapshot) override;

    static std::vector<zones::RawLevel> pivotsFor(const Candle& bar, double weight,
                                                  const std::string& timeframe);
    static std::optional<Candle> aggregateWeeklyBar(const std::vector<Candle>& daily_bars);

private:
    const engine::SourceConfig& config_;
};

} // namespace levels
} // namespace zonerisk
