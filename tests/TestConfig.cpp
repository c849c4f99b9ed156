#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

// Simple manual test runner
int main() {
    using namespace zonerisk;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Defaults
    {
        engine::EngineConfig defaults;
        assert(defaults.symbol == "BTCUSDT");
        assert(std::abs(defaults.clustering.merge_radius_atr_mult - 0.5) < 1e-12);
        assert(std::abs(defaults.risk.fallback_tp_pct - 0.03) < 1e-12);
        assert(std::abs(defaults.risk.fallback_sl_pct - 0.02) < 1e-12);
        assert(defaults.tierForTimeframe("1w") == zones::ZoneTier::MAJOR);
        assert(defaults.tierForTimeframe("4h") == zones::ZoneTier::INTERMEDIATE);
        assert(defaults.tierForTimeframe("book") == zones::ZoneTier::MINOR);
    }

    // 2. Partial JSON keeps defaults for missing keys
    {
        nlohmann::json j = {
            {"symbol", "ETHUSDT"},
            {"clustering", {{"merge_radius_atr_mult", 0.8}, {"timeframe_tiers", {{"1d", "MAJOR"}, {"15m", "MINOR"}}}}},
            {"risk", {{"fallback_tp_pct", 0.04}}},
            {"sources", {{"indicator_timeframes", {"4h"}}, {"timeout_ms", 500}}},
            {"evaluation", {{"max_attempts", 5}}},
        };
        auto config = Config::fromJson(j);
        assert(config.symbol == "ETHUSDT");
        assert(std::abs(config.clustering.merge_radius_atr_mult - 0.8) < 1e-12);
        assert(config.clustering.timeframe_tiers.size() == 2);
        assert(config.tierForTimeframe("4h") == zones::ZoneTier::MINOR);
        assert(std::abs(config.risk.fallback_tp_pct - 0.04) < 1e-12);
        assert(std::abs(config.risk.fallback_sl_pct - 0.02) < 1e-12);
        assert(config.sources.indicator_timeframes.size() == 1);
        assert(config.sources.timeout_ms == 500);
        assert(config.sources.swing_timeframes.size() == 3);
        assert(config.evaluation.max_attempts == 5);
        assert(config.touch.history_window == 20);
    }

    // 3. Invalid values are clamped
    {
        engine::EngineConfig config;
        config.clustering.merge_radius_atr_mult = -1.0;
        config.touch.history_window = 0;
        config.sources.worker_threads = 0;
        config.evaluation.max_attempts = 0;
        config.risk.max_sl_pct = 0.001;
        Config::validate(config);
        assert(config.clustering.merge_radius_atr_mult > 0.0);
        assert(config.touch.history_window == 1);
        assert(config.sources.worker_threads == 1);
        assert(config.evaluation.max_attempts == 1);
        assert(config.risk.max_sl_pct >= config.risk.min_sl_pct);
    }

    // 4. File load with environment overrides
    {
        const std::filesystem::path dir = std::filesystem::absolute("test_config");
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        const auto path = dir / "config.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"symbol": "SOLUSDT", "logging": {"level": "warn"},
                      "persistence": {"state_path": "state/touch_history.json"}})";
        }

        setenv("ZONERISK_STATE_DIR", "/tmp/zonerisk_state", 1);
        setenv("ZONERISK_LOG_LEVEL", "debug", 1);
        auto config = Config::load(path.string());
        unsetenv("ZONERISK_STATE_DIR");
        unsetenv("ZONERISK_LOG_LEVEL");

        assert(config.symbol == "SOLUSDT");
        assert(config.logging.level == "debug");
        assert(config.persistence.state_path == "/tmp/zonerisk_state/touch_history.json");
        assert(config.persistence.journal_path == "/tmp/zonerisk_state/decisions.jsonl");

        // Malformed file falls back to defaults
        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ not json";
        }
        auto fallback = Config::load(path.string());
        assert(fallback.symbol == "BTCUSDT");

        // Missing file too
        auto missing = Config::load((dir / "absent.json").string());
        assert(missing.symbol == "BTCUSDT");

        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] Config PASSED" << std::endl;
    return 0;
}
