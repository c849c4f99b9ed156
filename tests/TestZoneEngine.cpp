#include "engine/ZoneEngine.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>

using namespace zonerisk;
using engine::DecisionStatus;
using engine::EvaluationRequest;
using engine::ZoneEngine;
using levels::LevelBatch;
using levels::MarketSnapshot;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) <= eps;
}

// Deterministic levels: support at 74600 (4h), resistance at 76000 and 78000 (1d).
class StaticLevels : public levels::ILevelSource {
public:
    explicit StaticLevels(double atr) : atr_(atr) {}

    std::string name() const override { return "static"; }

    LevelBatch collect(const MarketSnapshot&) override {
        LevelBatch batch;
        batch.source = name();
        batch.timeframe = "4h";
        batch.atr = atr_;
        batch.levels = {
            {74600.0, "Swing_Low", 1.5, "4h"},
            {74620.0, "SMA_50", 0.8, "4h"},
            {76000.0, "Pivot_R1", 1.0, "1d"},
            {78000.0, "SMA_200", 1.5, "1d"},
        };
        return batch;
    }

private:
    double atr_;
};

std::unique_ptr<levels::LevelCollector> collectorWith(const engine::SourceConfig& config, double atr) {
    auto collector = std::make_unique<levels::LevelCollector>(config);
    collector->addSource(std::make_shared<StaticLevels>(atr));
    return collector;
}

EvaluationRequest request(TradeDirection direction, double entry) {
    EvaluationRequest req;
    req.signal.direction = direction;
    req.signal.confidence = SignalConfidence::HIGH;
    req.entry_price = entry;
    return req;
}

const zones::Zone* zoneNear(const zones::ZoneSnapshot& snap, double price) {
    for (const auto& zone : snap.zones) {
        if (std::abs(zone.price_center - price) < 100.0) {
            return &zone;
        }
    }
    return nullptr;
}

} // namespace

int main() {
    const std::filesystem::path dir("test_engine");
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    engine::EngineConfig config;
    config.symbol = "BTCUSDT";
    config.persistence.retry_delay_ms = 20;
    config.touch.follow_through_candles = 3;

    MarketSnapshot market;
    market.symbol = config.symbol;
    market.current_price = 75000.0;

    // No ATR from any source: zones stay untouched
    {
        ZoneEngine engine(config, collectorWith(config.sources, 0.0));
        engine.start();
        auto report = engine.runCycle(market);
        assert(!report.applied);
        assert(report.level_count == 4);
        assert(engine.book().size() == 0);
        engine.stop();
    }

    auto store = std::make_shared<state::TouchHistoryStore>(config.persistence);
    store->open(dir / "touch_history.json");
    auto journal = std::make_shared<state::DecisionJournalJsonl>(dir / "decisions.jsonl");

    {
        ZoneEngine engine(config, collectorWith(config.sources, 600.0), store, journal);
        engine.start();

        auto report = engine.runCycle(market);
        assert(report.applied);
        assert(report.atr_timeframe == "4h");
        assert(near(report.atr, 600.0));
        assert(report.zone_count == 3);   // 74600 and 74620 share a zone
        assert(report.created == 3);

        // Same levels next cycle: identities survive
        auto again = engine.runCycle(market);
        assert(again.matched == 3 && again.created == 0 && again.expired == 0);

        // LONG: target below the 76000 resistance, stop under the support zone
        auto accepted = engine.evaluate(request(TradeDirection::LONG, 75000.0));
        assert(accepted.status == DecisionStatus::ACCEPTED);
        assert(accepted.params.has_value());
        assert(near(accepted.params->tp_price, 75924.0));
        assert(accepted.params->sl_type == risk::LevelType::SR_LEVEL);
        assert(accepted.params->sl_price < 74600.0);
        assert(accepted.reason_code.empty());
        assert(accepted.attempts == 1);
        assert(accepted.regime.condition == analytics::MarketCondition::NORMAL);

        // SHORT: stop above 76000, target barely below entry
        auto rejected = engine.evaluate(request(TradeDirection::SHORT, 75000.0));
        assert(rejected.status == DecisionStatus::REJECTED);
        assert(rejected.reason_code == "RR_BELOW_MINIMUM");
        assert(rejected.error.has_value());
        assert(rejected.params.has_value());

        // A book that changes under every attempt ends STALE
        engine.setSnapshotObserver([&engine, &market](std::uint64_t) { engine.runCycle(market); });
        auto stale = engine.evaluate(request(TradeDirection::LONG, 75000.0));
        assert(stale.status == DecisionStatus::STALE);
        assert(stale.reason_code == "STALE_SNAPSHOT");
        assert(stale.attempts == config.evaluation.max_attempts);
        assert(!stale.params.has_value());

        // One change, then quiet: the retry succeeds
        int changes = 0;
        engine.setSnapshotObserver([&engine, &market, &changes](std::uint64_t) {
            if (changes++ == 0) {
                engine.runCycle(market);
            }
        });
        auto retried = engine.evaluate(request(TradeDirection::LONG, 75000.0));
        assert(retried.status == DecisionStatus::ACCEPTED);
        assert(retried.attempts == 2);
        assert(retried.snapshot_version == engine.book().version());
        engine.setSnapshotObserver(nullptr);

        // Price dips into the support band and rejects upward
        const std::uint64_t before_touch = engine.book().version();
        engine.onPriceTick(75000.0, 1000);
        engine.onPriceTick(74650.0, 2000);
        engine.onCandleClose(Candle(74900.0, 74950.0, 74550.0, 74850.0, 100.0, 2000));
        engine.onCandleClose(Candle(74850.0, 75100.0, 74800.0, 75050.0, 100.0, 3000));
        engine.onCandleClose(Candle(75050.0, 75300.0, 75000.0, 75250.0, 100.0, 4000));
        engine.onCandleClose(Candle(75250.0, 75400.0, 75200.0, 75350.0, 100.0, 5000));
        engine.drainTicks();

        assert(engine.book().version() > before_touch);
        const auto snap = engine.book().snapshot();
        const zones::Zone* support = zoneNear(snap, 74610.0);
        assert(support != nullptr);
        assert(support->touches.size() == 1);
        assert(support->touches[0].timestamp == 2000);
        assert(support->touches[0].rejection_strength > 0.0);
        assert(zoneNear(snap, 76000.0)->touches.empty());

        auto report_view = engine.zoneReport(75000.0);
        assert(report_view.supports.size() == 1);
        assert(report_view.resistances.size() == 2);
        assert(near(report_view.resistances[0].zone.price_center, 76000.0));
        assert(report_view.resistances[0].distance_pct > 0.0);
        assert(!report_view.toText().empty());

        assert(engine.regimeInputsFrom(market).trend_direction == TrendDirection::NEUTRAL);

        engine.stop();
    }

    // Four decisions journaled in order
    {
        const auto events = journal->readFrom(1);
        assert(events.size() == 4);
        assert(events[0].outcome == "ACCEPTED");
        assert(events[1].outcome == "REJECTED" && events[1].reason_code == "RR_BELOW_MINIMUM");
        assert(events[2].outcome == "STALE");
        assert(events[3].payload.value("attempts", 0) == 2);
    }

    // Touch history survives a restart
    store->close();
    {
        auto reopened = std::make_shared<state::TouchHistoryStore>(config.persistence);
        reopened->open(dir / "touch_history.json");

        ZoneEngine engine(config, collectorWith(config.sources, 600.0), reopened);
        engine.start();
        assert(engine.book().size() == 3);
        const auto snap = engine.book().snapshot();
        const zones::Zone* support = zoneNear(snap, 74610.0);
        assert(support != nullptr);
        assert(support->touches.size() == 1);

        // Next cycle matches restored zones instead of creating new ones
        auto report = engine.runCycle(market);
        assert(report.matched == 3 && report.created == 0);
        assert(zoneNear(engine.book().snapshot(), 74610.0)->touches.size() == 1);

        engine.stop();
        reopened->close();
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] ZoneEngine PASSED\n";
    return 0;
}
