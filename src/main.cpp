#include "analytics/TechnicalIndicators.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "engine/ZoneEngine.h"
#include "levels/LevelCollector.h"
#include "state/DecisionJournalJsonl.h"
#include "state/TouchHistoryStore.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace zonerisk;

namespace {

void printUsage() {
    std::cout << "Usage: zonerisk --market <market.json> --signal LONG|SHORT [options]\n"
              << "  --config <path>        engine config (default config/config.json)\n"
              << "  --confidence <level>   HIGH|MEDIUM|LOW (default MEDIUM)\n"
              << "  --entry <price>        entry price (default: market current_price)\n"
              << "  --json                 print the decision as JSON\n";
}

// {"symbol", "current_price", "ts_ms", "candles": {"1d": [...], ...}, "orderbook_units": [...],
//  "replay": {"ticks": [{"price", "ts_ms"}], "candles": [...]}}
bool loadMarket(const std::string& path, levels::MarketSnapshot& snapshot, nlohmann::json& replay) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Market file not found: " << path << "\n";
        return false;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Market file is not valid JSON: " << e.what() << "\n";
        return false;
    }

    snapshot.symbol = j.value("symbol", snapshot.symbol);
    snapshot.current_price = j.value("current_price", 0.0);
    snapshot.ts_ms = j.value("ts_ms", nowMs());
    snapshot.orderbook_units = j.value("orderbook_units", nlohmann::json::array());

    if (j.contains("candles") && j["candles"].is_object()) {
        for (const auto& [timeframe, rows] : j["candles"].items()) {
            snapshot.candles[timeframe] = analytics::TechnicalIndicators::jsonToCandles(rows);
        }
    }
    if (snapshot.current_price <= 0.0) {
        for (const char* tf : {"5m", "15m", "1h", "4h", "1d"}) {
            if (const auto* candles = snapshot.candlesFor(tf)) {
                snapshot.current_price = candles->back().close;
                break;
            }
        }
    }

    replay = j.value("replay", nlohmann::json::object());
    return true;
}

nlohmann::json outcomeToJson(const engine::DecisionOutcome& outcome) {
    nlohmann::json j;
    j["outcome"] = engine::toString(outcome.status);
    j["reason_code"] = outcome.reason_code;
    j["regime"] = analytics::toString(outcome.regime.condition);
    j["attempts"] = outcome.attempts;
    if (outcome.params) {
        const auto& p = *outcome.params;
        j["sl_price"] = p.sl_price;
        j["tp_price"] = p.tp_price;
        j["sl_type"] = risk::toString(p.sl_type);
        j["tp_type"] = risk::toString(p.tp_type);
        j["position_multiplier"] = p.position_multiplier;
        j["risk_reward"] = p.risk_reward;
        if (p.reference_zone) {
            j["reference_zone"] = {
                {"id", p.reference_zone->id},
                {"price_center", p.reference_zone->price_center},
                {"tier", zones::toString(p.reference_zone->tier)},
            };
        }
    }
    j["rationale"] = outcome.rationale;
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string market_path;
    std::string signal_text;
    std::string confidence_text = "MEDIUM";
    double entry_price = 0.0;
    bool json_mode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        }
        if (arg == "--json") {
            json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage();
            return 2;
        }
        if (arg == "--config") {
            config_path = argv[++i];
        } else if (arg == "--market") {
            market_path = argv[++i];
        } else if (arg == "--signal") {
            signal_text = argv[++i];
        } else if (arg == "--confidence") {
            confidence_text = argv[++i];
        } else if (arg == "--entry") {
            try {
                entry_price = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --entry value: " << argv[i] << "\n";
                return 2;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    const auto direction = parseTradeDirection(signal_text);
    if (market_path.empty() || !direction) {
        printUsage();
        return 2;
    }

    try {
        const engine::EngineConfig config = Config::load(config_path);
        Logger::getInstance().initialize(
            utils::PathUtils::resolveRelativePath(config.logging.dir).string(), config.logging.level);

        levels::MarketSnapshot snapshot;
        snapshot.symbol = config.symbol;
        nlohmann::json replay;
        if (!loadMarket(market_path, snapshot, replay)) {
            return 2;
        }

        auto store = std::make_shared<state::TouchHistoryStore>(config.persistence);
        store->open(utils::PathUtils::resolveRelativePath(config.persistence.state_path));
        auto journal = std::make_shared<state::DecisionJournalJsonl>(
            utils::PathUtils::resolveRelativePath(config.persistence.journal_path));

        engine::ZoneEngine engine(config, levels::LevelCollector::createDefault(config.sources), store, journal);
        engine.start();

        const engine::CycleReport cycle = engine.runCycle(snapshot);
        if (!cycle.applied) {
            LOG_WARN("cycle produced no zone update, evaluating against restored zones");
        }

        if (replay.contains("ticks") && replay["ticks"].is_array()) {
            for (const auto& tick : replay["ticks"]) {
                engine.onPriceTick(tick.value("price", 0.0), tick.value("ts_ms", 0LL));
            }
        }
        if (replay.contains("candles")) {
            for (const auto& candle : analytics::TechnicalIndicators::jsonToCandles(replay["candles"])) {
                engine.onCandleClose(candle);
            }
        }
        engine.drainTicks();

        engine::EvaluationRequest request;
        request.signal.direction = *direction;
        request.signal.confidence = parseSignalConfidence(confidence_text);
        request.entry_price = entry_price > 0.0 ? entry_price : snapshot.current_price;
        request.regime_inputs = engine.regimeInputsFrom(snapshot);

        const engine::DecisionOutcome outcome = engine.evaluate(request);

        if (json_mode) {
            nlohmann::json out = outcomeToJson(outcome);
            out["symbol"] = config.symbol;
            out["entry_price"] = request.entry_price;
            std::cout << out.dump(2) << "\n";
        } else {
            std::cout << engine.zoneReport(request.entry_price).toText();
            std::cout << engine::toString(outcome.status);
            if (!outcome.reason_code.empty()) {
                std::cout << " (" << outcome.reason_code << ")";
            }
            std::cout << "\n" << outcome.rationale << "\n";
        }

        engine.stop();
        store->close();
        return outcome.status == engine::DecisionStatus::ACCEPTED ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 3;
    }
}
