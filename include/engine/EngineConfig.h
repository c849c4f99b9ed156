#pragma once

#include <map>
#include <string>
#include <vector>

#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace engine {

struct ClusteringConfig {
    double merge_radius_atr_mult = 0.5;     // merge_radius = ATR x k
    int grace_cycles = 3;                   // unmatched zones survive this many cycles
    std::map<std::string, zones::ZoneTier> timeframe_tiers = {
        {"1w", zones::ZoneTier::MAJOR},
        {"1d", zones::ZoneTier::MAJOR},
        {"4h", zones::ZoneTier::INTERMEDIATE},
        {"1h", zones::ZoneTier::INTERMEDIATE},
    };
};

struct TouchConfig {
    double touch_band_atr_mult = 0.3;
    int history_window = 20;
    int follow_through_candles = 3;
    int volume_lookback = 20;

    // Sub-score caps (sum = 10)
    double wick_cap = 3.0;
    double volume_cap = 2.5;
    double bounce_cap = 2.5;
    double follow_through_cap = 2.0;
};

struct ScoringConfig {
    double base_weight_cap = 3.0;
    double touch_quality_cap = 3.0;
    double neutral_rejection = 5.0;         // used when a zone has no touches yet

    double major_weight = 2.0;
    double intermediate_weight = 1.5;
    double minor_weight = 1.0;

    double strong_threshold = 7.5;
    double medium_threshold = 5.0;

    int min_touches_for_confidence = 2;
};

struct RegimeConfig {
    double price_change_threshold = 0.03;
    double volatility_threshold = 0.03;
    int trend_short_period = 20;
    int trend_long_period = 50;
};

struct RiskConfig {
    double fallback_tp_pct = 0.03;
    double fallback_sl_pct = 0.02;
    double tp_buffer_pct = 0.001;           // toward entry
    double sl_buffer_pct = 0.002;           // away from entry

    double trend_aligned_tp_mult = 2.5;
    double trend_aligned_sl_mult = 1.0;
    double trend_aligned_position_mult = 1.0;
    double counter_trend_tp_mult = 0.7;
    double counter_trend_sl_mult = 0.75;
    double counter_trend_position_mult = 0.5;
    double volatile_position_mult = 0.5;

    double min_sl_pct = 0.005;
    double max_sl_pct = 0.05;
    double min_tp_pct = 0.005;
    double max_tp_pct = 0.10;
    double min_position_mult = 0.1;
    double max_position_mult = 1.0;
    double counter_trend_position_cap = 0.5;

    double min_rr_normal = 1.0;
    double min_rr_trend_aligned = 1.5;

    double high_confidence_mult = 1.0;
    double medium_confidence_mult = 0.75;
    double low_confidence_mult = 0.5;
};

struct SourceConfig {
    std::vector<std::string> indicator_timeframes = {"1d", "4h", "1h"};
    std::vector<std::string> swing_timeframes = {"1d", "4h", "15m"};
    std::map<std::string, double> swing_base_weights = {
        {"1d", 2.0}, {"4h", 1.5}, {"15m", 0.8},
    };

    double sma50_weight = 0.8;
    double sma200_weight = 1.5;
    double bollinger_weight = 1.0;
    int bollinger_period = 20;
    double bollinger_std_mult = 2.0;

    double daily_pivot_weight = 1.0;
    double weekly_pivot_weight = 1.2;

    double wall_weight = 2.0;
    double wall_multiplier = 3.0;
    int wall_depth = 20;

    int swing_left_bars = 5;
    int swing_right_bars = 5;
    int swing_max_age = 100;

    int timeout_ms = 2000;
    int worker_threads = 4;

    std::string atr_timeframe = "4h";
    int atr_period = 14;
};

struct PersistenceConfig {
    std::string state_path = "state/touch_history.json";
    std::string journal_path = "state/decisions.jsonl";
    int flush_interval_seconds = 60;
    int retry_delay_ms = 500;
    double price_bucket_size = 10.0;
};

struct EvaluationConfig {
    int max_attempts = 3;   // re-runs after a stale snapshot
};

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

// Built once at startup and handed to every component by const reference.
struct EngineConfig {
    std::string symbol = "BTCUSDT";

    ClusteringConfig clustering;
    TouchConfig touch;
    ScoringConfig scoring;
    RegimeConfig regime;
    RiskConfig risk;
    SourceConfig sources;
    PersistenceConfig persistence;
    EvaluationConfig evaluation;
    LoggingConfig logging;

    zones::ZoneTier tierForTimeframe(const std::string& timeframe) const {
        auto it = clustering.timeframe_tiers.find(timeframe);
        return it != clustering.timeframe_tiers.end() ? it->second : zones::ZoneTier::MINOR;
    }
};

} // namespace engine
} // namespace zonerisk
