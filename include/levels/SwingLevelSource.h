#pragma once

#include <vector>

#include "engine/EngineConfig.h"
#include "levels/ILevelSource.h"

namespace zonerisk {
namespace levels {

// Williams fractal swing highs/lows for one timeframe.
// weight = base_weight x age factor (>= 0.5) x volume percentile factor (0.3 .. 1.0)
class SwingLevelSource : public ILevelSource {
public:
    SwingLevelSource(std::string timeframe, double base_weight, const engine::SourceConfig& config);

    std::string name() const override { return "swings_" + timeframe_; }
    LevelBatch collect(const MarketSnapshot& snapshot) override;

    static double volumeWeightFactor(double bar_volume, const std::vector<double>& all_volumes);

private:
    std::string timeframe_;
    double base_weight_;
    const engine::SourceConfig& config_;
};

} // namespace levels
} // namespace zonerisk
