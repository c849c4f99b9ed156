#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace zonerisk {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

template <typename T>
void clampMin(T& value, T min_value, const char* field) {
    if (value < min_value) {
        std::cerr << "Config: " << field << "=" << value << " is invalid, using " << min_value << std::endl;
        value = min_value;
    }
}
}

engine::EngineConfig Config::load(const std::string& path) {
    engine::EngineConfig config;

    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);
    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults: " << config_path << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        } else {
            try {
                nlohmann::json j;
                file >> j;
                config = fromJson(j);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "Config parse error, using defaults: " << e.what() << std::endl;
                config = engine::EngineConfig();
            }
        }
    }

    const std::string state_dir = readEnvVar("ZONERISK_STATE_DIR");
    if (!state_dir.empty()) {
        const std::filesystem::path dir(state_dir);
        config.persistence.state_path =
            (dir / std::filesystem::path(config.persistence.state_path).filename()).string();
        config.persistence.journal_path =
            (dir / std::filesystem::path(config.persistence.journal_path).filename()).string();
    }

    const std::string log_level = readEnvVar("ZONERISK_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    validate(config);
    std::cout << "Config loaded: symbol=" << config.symbol
              << ", merge_radius_atr_mult=" << config.clustering.merge_radius_atr_mult << std::endl;
    return config;
}

engine::EngineConfig Config::fromJson(const nlohmann::json& j) {
    engine::EngineConfig config;
    config.symbol = j.value("symbol", config.symbol);

    if (j.contains("clustering")) {
        auto& c = j["clustering"];
        config.clustering.merge_radius_atr_mult = c.value("merge_radius_atr_mult", config.clustering.merge_radius_atr_mult);
        config.clustering.grace_cycles = c.value("grace_cycles", config.clustering.grace_cycles);
        if (c.contains("timeframe_tiers")) {
            config.clustering.timeframe_tiers.clear();
            for (auto it = c["timeframe_tiers"].begin(); it != c["timeframe_tiers"].end(); ++it) {
                config.clustering.timeframe_tiers[it.key()] = zones::zoneTierFromString(it.value().get<std::string>());
            }
        }
    }

    if (j.contains("touch")) {
        auto& t = j["touch"];
        config.touch.touch_band_atr_mult = t.value("touch_band_atr_mult", config.touch.touch_band_atr_mult);
        config.touch.history_window = t.value("history_window", config.touch.history_window);
        config.touch.follow_through_candles = t.value("follow_through_candles", config.touch.follow_through_candles);
        config.touch.volume_lookback = t.value("volume_lookback", config.touch.volume_lookback);
        config.touch.wick_cap = t.value("wick_cap", config.touch.wick_cap);
        config.touch.volume_cap = t.value("volume_cap", config.touch.volume_cap);
        config.touch.bounce_cap = t.value("bounce_cap", config.touch.bounce_cap);
        config.touch.follow_through_cap = t.value("follow_through_cap", config.touch.follow_through_cap);
    }

    if (j.contains("scoring")) {
        auto& s = j["scoring"];
        config.scoring.base_weight_cap = s.value("base_weight_cap", config.scoring.base_weight_cap);
        config.scoring.touch_quality_cap = s.value("touch_quality_cap", config.scoring.touch_quality_cap);
        config.scoring.neutral_rejection = s.value("neutral_rejection", config.scoring.neutral_rejection);
        config.scoring.major_weight = s.value("major_weight", config.scoring.major_weight);
        config.scoring.intermediate_weight = s.value("intermediate_weight", config.scoring.intermediate_weight);
        config.scoring.minor_weight = s.value("minor_weight", config.scoring.minor_weight);
        config.scoring.strong_threshold = s.value("strong_threshold", config.scoring.strong_threshold);
        config.scoring.medium_threshold = s.value("medium_threshold", config.scoring.medium_threshold);
        config.scoring.min_touches_for_confidence = s.value("min_touches_for_confidence", config.scoring.min_touches_for_confidence);
    }

    if (j.contains("regime")) {
        auto& r = j["regime"];
        config.regime.price_change_threshold = r.value("price_change_threshold", config.regime.price_change_threshold);
        config.regime.volatility_threshold = r.value("volatility_threshold", config.regime.volatility_threshold);
        config.regime.trend_short_period = r.value("trend_short_period", config.regime.trend_short_period);
        config.regime.trend_long_period = r.value("trend_long_period", config.regime.trend_long_period);
    }

    if (j.contains("risk")) {
        auto& r = j["risk"];
        auto& rc = config.risk;
        rc.fallback_tp_pct = r.value("fallback_tp_pct", rc.fallback_tp_pct);
        rc.fallback_sl_pct = r.value("fallback_sl_pct", rc.fallback_sl_pct);
        rc.tp_buffer_pct = r.value("tp_buffer_pct", rc.tp_buffer_pct);
        rc.sl_buffer_pct = r.value("sl_buffer_pct", rc.sl_buffer_pct);
        rc.trend_aligned_tp_mult = r.value("trend_aligned_tp_mult", rc.trend_aligned_tp_mult);
        rc.trend_aligned_sl_mult = r.value("trend_aligned_sl_mult", rc.trend_aligned_sl_mult);
        rc.trend_aligned_position_mult = r.value("trend_aligned_position_mult", rc.trend_aligned_position_mult);
        rc.counter_trend_tp_mult = r.value("counter_trend_tp_mult", rc.counter_trend_tp_mult);
        rc.counter_trend_sl_mult = r.value("counter_trend_sl_mult", rc.counter_trend_sl_mult);
        rc.counter_trend_position_mult = r.value("counter_trend_position_mult", rc.counter_trend_position_mult);
        rc.volatile_position_mult = r.value("volatile_position_mult", rc.volatile_position_mult);
        rc.min_sl_pct = r.value("min_sl_pct", rc.min_sl_pct);
        rc.max_sl_pct = r.value("max_sl_pct", rc.max_sl_pct);
        rc.min_tp_pct = r.value("min_tp_pct", rc.min_tp_pct);
        rc.max_tp_pct = r.value("max_tp_pct", rc.max_tp_pct);
        rc.min_position_mult = r.value("min_position_mult", rc.min_position_mult);
        rc.max_position_mult = r.value("max_position_mult", rc.max_position_mult);
        rc.counter_trend_position_cap = r.value("counter_trend_position_cap", rc.counter_trend_position_cap);
        rc.min_rr_normal = r.value("min_rr_normal", rc.min_rr_normal);
        rc.min_rr_trend_aligned = r.value("min_rr_trend_aligned", rc.min_rr_trend_aligned);
        rc.high_confidence_mult = r.value("high_confidence_mult", rc.high_confidence_mult);
        rc.medium_confidence_mult = r.value("medium_confidence_mult", rc.medium_confidence_mult);
        rc.low_confidence_mult = r.value("low_confidence_mult", rc.low_confidence_mult);
    }

    if (j.contains("sources")) {
        auto& s = j["sources"];
        auto& sc = config.sources;
        if (s.contains("indicator_timeframes")) {
            sc.indicator_timeframes = s["indicator_timeframes"].get<std::vector<std::string>>();
        }
        if (s.contains("swing_timeframes")) {
            sc.swing_timeframes = s["swing_timeframes"].get<std::vector<std::string>>();
        }
        if (s.contains("swing_base_weights")) {
            sc.swing_base_weights = s["swing_base_weights"].get<std::map<std::string, double>>();
        }
        sc.sma50_weight = s.value("sma50_weight", sc.sma50_weight);
        sc.sma200_weight = s.value("sma200_weight", sc.sma200_weight);
        sc.bollinger_weight = s.value("bollinger_weight", sc.bollinger_weight);
        sc.bollinger_period = s.value("bollinger_period", sc.bollinger_period);
        sc.bollinger_std_mult = s.value("bollinger_std_mult", sc.bollinger_std_mult);
        sc.daily_pivot_weight = s.value("daily_pivot_weight", sc.daily_pivot_weight);
        sc.weekly_pivot_weight = s.value("weekly_pivot_weight", sc.weekly_pivot_weight);
        sc.wall_weight = s.value("wall_weight", sc.wall_weight);
        sc.wall_multiplier = s.value("wall_multiplier", sc.wall_multiplier);
        sc.wall_depth = s.value("wall_depth", sc.wall_depth);
        sc.swing_left_bars = s.value("swing_left_bars", sc.swing_left_bars);
        sc.swing_right_bars = s.value("swing_right_bars", sc.swing_right_bars);
        sc.swing_max_age = s.value("swing_max_age", sc.swing_max_age);
        sc.timeout_ms = s.value("timeout_ms", sc.timeout_ms);
        sc.worker_threads = s.value("worker_threads", sc.worker_threads);
        sc.atr_timeframe = s.value("atr_timeframe", sc.atr_timeframe);
        sc.atr_period = s.value("atr_period", sc.atr_period);
    }

    if (j.contains("persistence")) {
        auto& p = j["persistence"];
        config.persistence.state_path = p.value("state_path", config.persistence.state_path);
        config.persistence.journal_path = p.value("journal_path", config.persistence.journal_path);
        config.persistence.flush_interval_seconds = p.value("flush_interval_seconds", config.persistence.flush_interval_seconds);
        config.persistence.retry_delay_ms = p.value("retry_delay_ms", config.persistence.retry_delay_ms);
        config.persistence.price_bucket_size = p.value("price_bucket_size", config.persistence.price_bucket_size);
    }

    if (j.contains("evaluation")) {
        config.evaluation.max_attempts = j["evaluation"].value("max_attempts", config.evaluation.max_attempts);
    }

    if (j.contains("logging")) {
        config.logging.level = j["logging"].value("level", config.logging.level);
        config.logging.dir = j["logging"].value("dir", config.logging.dir);
    }

    return config;
}

void Config::validate(engine::EngineConfig& config) {
    clampMin(config.clustering.merge_radius_atr_mult, 1e-6, "clustering.merge_radius_atr_mult");
    clampMin(config.clustering.grace_cycles, 0, "clustering.grace_cycles");
    clampMin(config.touch.touch_band_atr_mult, 1e-6, "touch.touch_band_atr_mult");
    clampMin(config.touch.history_window, 1, "touch.history_window");
    clampMin(config.touch.follow_through_candles, 0, "touch.follow_through_candles");
    clampMin(config.touch.volume_lookback, 1, "touch.volume_lookback");
    clampMin(config.scoring.min_touches_for_confidence, 0, "scoring.min_touches_for_confidence");
    clampMin(config.sources.timeout_ms, 1, "sources.timeout_ms");
    clampMin(config.sources.worker_threads, 1, "sources.worker_threads");
    clampMin(config.sources.atr_period, 1, "sources.atr_period");
    clampMin(config.persistence.flush_interval_seconds, 1, "persistence.flush_interval_seconds");
    clampMin(config.persistence.retry_delay_ms, 1, "persistence.retry_delay_ms");
    clampMin(config.persistence.price_bucket_size, 1e-9, "persistence.price_bucket_size");
    clampMin(config.evaluation.max_attempts, 1, "evaluation.max_attempts");

    auto& r = config.risk;
    clampMin(r.min_sl_pct, 1e-6, "risk.min_sl_pct");
    clampMin(r.max_sl_pct, r.min_sl_pct, "risk.max_sl_pct");
    clampMin(r.min_tp_pct, 1e-6, "risk.min_tp_pct");
    clampMin(r.max_tp_pct, r.min_tp_pct, "risk.max_tp_pct");
    clampMin(r.min_position_mult, 0.0, "risk.min_position_mult");
    clampMin(r.max_position_mult, r.min_position_mult, "risk.max_position_mult");
    clampMin(r.counter_trend_position_cap, r.min_position_mult, "risk.counter_trend_position_cap");
}

} // namespace zonerisk
