#include "engine/ZoneEngine.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "common/Logger.h"

namespace zonerisk {
namespace engine {

ZoneEngine::ZoneEngine(const EngineConfig& config,
                       std::unique_ptr<levels::LevelCollector> collector,
                       std::shared_ptr<state::TouchHistoryStore> store,
                       std::shared_ptr<state::DecisionJournalJsonl> journal)
    : config_(config)
    , collector_(std::move(collector))
    , store_(std::move(store))
    , journal_(std::move(journal))
    , clusterer_(config)
    , book_(config)
    , tracker_(config, book_)
    , scorer_(config.scoring)
    , classifier_(config.regime)
    , calculator_(config.risk) {
    tracker_.setTouchListener([this](int, const zones::TouchRecord&) { persist(); });
}

ZoneEngine::~ZoneEngine() {
    stop();
}

void ZoneEngine::start() {
    if (store_ && store_->isOpen()) {
        auto restored = store_->loadZones(config_.symbol);
        if (!restored.empty()) {
            size_t touches = 0;
            for (const auto& zone : restored) {
                touches += zone.touches.size();
            }
            LOG_INFO("[{}] restored {} zones with {} touches", config_.symbol, restored.size(), touches);
            book_.restore(std::move(restored));
        }
    }
    dispatcher_.start();
}

void ZoneEngine::stop() {
    if (!dispatcher_.isRunning()) {
        return;
    }
    dispatcher_.stop();
    persist();
    if (store_ && store_->isOpen() && !store_->flush()) {
        LOG_WARN("[{}] final touch history flush failed", config_.symbol);
    }
}

CycleReport ZoneEngine::runCycle(const levels::MarketSnapshot& snapshot) {
    CycleReport report;

    levels::CollectedLevels collected;
    if (collector_) {
        collected = collector_->collect(snapshot);
    }
    report.level_count = collected.levels.size();
    report.missing_sources = collected.missing_sources;

    auto atr_it = collected.atr_by_timeframe.find(config_.sources.atr_timeframe);
    if (atr_it == collected.atr_by_timeframe.end() && !collected.atr_by_timeframe.empty()) {
        atr_it = collected.atr_by_timeframe.begin();
    }
    if (atr_it == collected.atr_by_timeframe.end() || !(atr_it->second > 0.0)) {
        LOG_WARN("[{}] no ATR this cycle ({} levels, {} sources missing), zones left unchanged",
                 config_.symbol, report.level_count, report.missing_sources.size());
        return report;
    }
    report.atr_timeframe = atr_it->first;
    report.atr = atr_it->second;

    auto clusters = clusterer_.cluster(collected.levels, report.atr);
    const double atr = report.atr;
    const zones::ReconcileResult result = dispatcher_.runSync([this, &clusters, atr]() {
        return book_.applyClusters(std::move(clusters), atr);
    });

    report.applied = true;
    report.matched = result.matched;
    report.created = result.created;
    report.expired = result.expired;
    report.merged = result.merged;
    report.zone_count = result.zones.size();

    LOG_INFO("[{}] cycle: {} levels -> {} zones (matched {}, new {}, expired {}, merged {}), ATR({}) {:.2f}",
             config_.symbol, report.level_count, report.zone_count, report.matched, report.created,
             report.expired, report.merged, report.atr_timeframe, report.atr);
    for (const auto& source : report.missing_sources) {
        LOG_DEBUG("[{}] source {} contributed no levels", config_.symbol, source);
    }

    persist();
    return report;
}

void ZoneEngine::onPriceTick(double price, long long ts_ms) {
    dispatcher_.post([this, price, ts_ms]() { tracker_.onPriceTick(price, ts_ms); });
}

void ZoneEngine::onCandleClose(const Candle& candle) {
    dispatcher_.post([this, candle]() { tracker_.onCandleClose(candle); });
}

void ZoneEngine::drainTicks() {
    dispatcher_.runSync([]() {});
}

analytics::RegimeInputs ZoneEngine::regimeInputsFrom(const levels::MarketSnapshot& snapshot) const {
    static const std::vector<Candle> kEmpty;
    const auto* candles_5m = snapshot.candlesFor("5m");
    const auto* candles_1h = snapshot.candlesFor("1h");
    return classifier_.deriveInputs(candles_5m ? *candles_5m : kEmpty,
                                    candles_1h ? *candles_1h : kEmpty);
}

void ZoneEngine::noteRegime(const analytics::RegimeAnalysis& analysis) {
    std::lock_guard<std::mutex> lock(regime_mutex_);
    if (last_condition_ && *last_condition_ != analysis.condition) {
        LOG_INFO("[{}] regime {} -> {} (1h {:.2f}%, 5m vol {:.2f}%, trend {})",
                 config_.symbol, analytics::toString(*last_condition_), analytics::toString(analysis.condition),
                 analysis.inputs.price_change_1h * 100.0, analysis.inputs.volatility_5min * 100.0,
                 toString(analysis.inputs.trend_direction));
    }
    last_condition_ = analysis.condition;
}

DecisionOutcome ZoneEngine::evaluate(const EvaluationRequest& request) {
    const int max_attempts = std::max(1, config_.evaluation.max_attempts);
    const analytics::RegimeAnalysis regime = classifier_.analyze(request.regime_inputs);
    noteRegime(regime);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        zones::ZoneSnapshot snap = book_.snapshot();
        if (snapshot_observer_) {
            snapshot_observer_(snap.version);
        }
        scorer_.scoreAll(snap.zones);

        risk::RiskRequest risk_request;
        risk_request.direction = request.signal.direction;
        risk_request.entry_price = request.entry_price;
        risk_request.condition = regime.condition;
        risk_request.confidence = request.signal.confidence;
        for (const auto& zone : snap.zones) {
            risk::ScoredZone scored{zone, scorer_.tierFor(zone.strength_score)};
            if (zone.price_center > request.entry_price) {
                risk_request.resistances.push_back(std::move(scored));
            } else if (zone.price_center < request.entry_price) {
                risk_request.supports.push_back(std::move(scored));
            }
        }

        risk::RiskDecision decision = calculator_.calculate(risk_request);

        if (book_.version() != snap.version) {
            LOG_DEBUG("[{}] zone snapshot v{} changed during evaluation, discarding (attempt {}/{})",
                      config_.symbol, snap.version, attempt, max_attempts);
            continue;
        }

        DecisionOutcome outcome;
        outcome.status = decision.accepted() ? DecisionStatus::ACCEPTED : DecisionStatus::REJECTED;
        outcome.params = decision.params;
        outcome.error = decision.error;
        outcome.reason_code = decision.error ? decision.error->reasonCode() : std::string();
        outcome.regime = regime;
        outcome.rationale = decision.rationale;
        outcome.snapshot_version = snap.version;
        outcome.attempts = attempt;
        record(outcome, request);
        return outcome;
    }

    DecisionOutcome stale;
    stale.status = DecisionStatus::STALE;
    stale.reason_code = "STALE_SNAPSHOT";
    stale.regime = regime;
    stale.rationale = "zone state kept changing during evaluation";
    stale.snapshot_version = book_.version();
    stale.attempts = max_attempts;
    record(stale, request);
    return stale;
}

void ZoneEngine::record(const DecisionOutcome& outcome, const EvaluationRequest& request) {
    const char* direction = toString(request.signal.direction);
    const double sl = outcome.params ? outcome.params->sl_price : 0.0;
    const double tp = outcome.params ? outcome.params->tp_price : 0.0;
    const double position = outcome.params ? outcome.params->position_multiplier : 0.0;

    switch (outcome.status) {
        case DecisionStatus::ACCEPTED:
            LOG_INFO("[{}] {} accepted: {}", config_.symbol, direction, outcome.rationale);
            break;
        case DecisionStatus::REJECTED:
            LOG_WARN("[{}] {} rejected ({}): {}", config_.symbol, direction,
                     outcome.error ? outcome.error->what() : outcome.reason_code.c_str(), outcome.rationale);
            break;
        case DecisionStatus::STALE:
            LOG_WARN("[{}] {} discarded after {} stale snapshots", config_.symbol, direction, outcome.attempts);
            break;
    }

    Logger::getInstance().logDecision(config_.symbol, direction, toString(outcome.status),
                                      sl, tp, position, outcome.reason_code);

    if (!journal_) {
        return;
    }

    state::DecisionEvent event;
    event.ts_ms = nowMs();
    event.symbol = config_.symbol;
    event.outcome = toString(outcome.status);
    event.reason_code = outcome.reason_code;
    event.payload["direction"] = direction;
    event.payload["confidence"] = toString(request.signal.confidence);
    event.payload["entry_price"] = request.entry_price;
    event.payload["regime"] = analytics::toString(outcome.regime.condition);
    event.payload["snapshot_version"] = outcome.snapshot_version;
    event.payload["attempts"] = outcome.attempts;
    if (outcome.params) {
        const auto& p = *outcome.params;
        event.payload["sl_price"] = p.sl_price;
        event.payload["tp_price"] = p.tp_price;
        event.payload["sl_type"] = risk::toString(p.sl_type);
        event.payload["tp_type"] = risk::toString(p.tp_type);
        event.payload["position_multiplier"] = p.position_multiplier;
        event.payload["risk_reward"] = p.risk_reward;
        if (p.reference_zone) {
            event.payload["reference_zone_id"] = p.reference_zone->id;
        }
    }
    if (outcome.error) {
        event.payload["required_rr"] = outcome.error->requiredMin();
    }
    event.payload["rationale"] = outcome.rationale;

    if (!journal_->append(event)) {
        LOG_WARN("[{}] decision not journaled", config_.symbol);
    }
}

void ZoneEngine::persist() {
    if (!store_ || !store_->isOpen()) {
        return;
    }
    store_->scheduleWrite(config_.symbol, book_.snapshot().zones);
}

ZoneReport ZoneEngine::zoneReport(double current_price) const {
    ZoneReport report;
    report.current_price = current_price;
    if (!(current_price > 0.0)) {
        return report;
    }

    const zones::ZoneSnapshot snap = book_.snapshot();
    for (const auto& zone : snap.zones) {
        ZoneView view;
        view.zone = zone;
        view.score = scorer_.score(zone);
        view.zone.strength_score = view.score.total;
        view.distance_pct = (zone.price_center - current_price) / current_price;
        if (zone.price_center < current_price) {
            report.supports.push_back(std::move(view));
        } else if (zone.price_center > current_price) {
            report.resistances.push_back(std::move(view));
        }
    }

    auto nearest = [](const ZoneView& a, const ZoneView& b) {
        return std::abs(a.distance_pct) < std::abs(b.distance_pct);
    };
    std::sort(report.supports.begin(), report.supports.end(), nearest);
    std::sort(report.resistances.begin(), report.resistances.end(), nearest);
    return report;
}

std::string ZoneReport::toText(size_t per_side) const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);

    auto write_side = [&](const char* label, const std::vector<ZoneView>& side) {
        ss << label << ":\n";
        if (side.empty()) {
            ss << "  (none)\n";
            return;
        }
        for (size_t i = 0; i < side.size() && i < per_side; ++i) {
            const ZoneView& v = side[i];
            ss << "  #" << v.zone.id << " " << v.zone.price_center
               << " (" << (v.distance_pct >= 0.0 ? "+" : "") << v.distance_pct * 100.0 << "%)"
               << " strength " << v.score.total << " " << zones::toString(v.score.tier)
               << ", " << zones::toString(v.zone.tier)
               << ", " << v.zone.touches.size() << " touches"
               << (v.score.low_confidence ? " [low confidence]" : "")
               << ", sources:";
            for (const auto& level : v.zone.member_levels) {
                ss << " " << level.source_tag << "/" << level.timeframe;
            }
            ss << "\n";
        }
    };

    ss << "price " << current_price << "\n";
    write_side("resistance", resistances);
    write_side("support", supports);
    return ss.str();
}

} // namespace engine
} // namespace zonerisk
