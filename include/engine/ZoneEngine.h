#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "analytics/MarketRegimeClassifier.h"
#include "common/Errors.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/TickDispatcher.h"
#include "levels/LevelCollector.h"
#include "risk/RiskParameterCalculator.h"
#include "state/DecisionJournalJsonl.h"
#include "state/TouchHistoryStore.h"
#include "zones/StrengthScorer.h"
#include "zones/TouchTracker.h"
#include "zones/ZoneBook.h"

namespace zonerisk {
namespace engine {

enum class DecisionStatus { ACCEPTED, REJECTED, STALE };

inline const char* toString(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::ACCEPTED: return "ACCEPTED";
        case DecisionStatus::REJECTED: return "REJECTED";
        case DecisionStatus::STALE: return "STALE";
    }
    return "REJECTED";
}

struct EvaluationRequest {
    TradeSignal signal;
    double entry_price = 0.0;
    analytics::RegimeInputs regime_inputs;
};

struct DecisionOutcome {
    DecisionStatus status = DecisionStatus::REJECTED;
    std::optional<risk::RiskParameters> params;     // absent when STALE
    std::string reason_code;                        // empty when ACCEPTED
    std::optional<InvalidRiskBoundsError> error;
    analytics::RegimeAnalysis regime;
    std::string rationale;
    std::uint64_t snapshot_version = 0;
    int attempts = 0;
};

struct CycleReport {
    bool applied = false;                   // false when no ATR was available
    size_t level_count = 0;
    std::vector<std::string> missing_sources;
    double atr = 0.0;
    std::string atr_timeframe;
    int matched = 0;
    int created = 0;
    int expired = 0;
    int merged = 0;
    size_t zone_count = 0;
};

struct ZoneView {
    zones::Zone zone;
    zones::ScoreBreakdown score;
    double distance_pct = 0.0;      // signed, (center - price) / price
};

struct ZoneReport {
    double current_price = 0.0;
    std::vector<ZoneView> supports;     // nearest first
    std::vector<ZoneView> resistances;  // nearest first

    std::string toText(size_t per_side = 3) const;
};

// Owns the zone pipeline for one symbol. Cycle and evaluation calls come from the
// caller's thread; ticks and candles go through the tick context, which is the
// only writer of zone state.
class ZoneEngine {
public:
    ZoneEngine(const EngineConfig& config,
               std::unique_ptr<levels::LevelCollector> collector,
               std::shared_ptr<state::TouchHistoryStore> store = nullptr,
               std::shared_ptr<state::DecisionJournalJsonl> journal = nullptr);
    ~ZoneEngine();

    ZoneEngine(const ZoneEngine&) = delete;
    ZoneEngine& operator=(const ZoneEngine&) = delete;

    // Restores persisted zones (when the store is open) and starts the tick context.
    void start();
    void stop();

    CycleReport runCycle(const levels::MarketSnapshot& snapshot);

    void onPriceTick(double price, long long ts_ms);
    void onCandleClose(const Candle& candle);

    // Waits until every tick and candle posted so far has been handled.
    void drainTicks();

    DecisionOutcome evaluate(const EvaluationRequest& request);

    analytics::RegimeInputs regimeInputsFrom(const levels::MarketSnapshot& snapshot) const;
    ZoneReport zoneReport(double current_price) const;

    const zones::ZoneBook& book() const { return book_; }

    // Called after each evaluation attempt takes its snapshot.
    void setSnapshotObserver(std::function<void(std::uint64_t version)> observer) {
        snapshot_observer_ = std::move(observer);
    }

private:
    void persist();
    void noteRegime(const analytics::RegimeAnalysis& analysis);
    void record(const DecisionOutcome& outcome, const EvaluationRequest& request);

    const EngineConfig& config_;
    std::unique_ptr<levels::LevelCollector> collector_;
    std::shared_ptr<state::TouchHistoryStore> store_;
    std::shared_ptr<state::DecisionJournalJsonl> journal_;

    zones::ZoneClusterer clusterer_;
    zones::ZoneBook book_;
    zones::TouchTracker tracker_;
    zones::StrengthScorer scorer_;
    analytics::MarketRegimeClassifier classifier_;
    risk::RiskParameterCalculator calculator_;
    TickDispatcher dispatcher_;

    std::function<void(std::uint64_t)> snapshot_observer_;

    std::mutex regime_mutex_;
    std::optional<analytics::MarketCondition> last_condition_;
};

} // namespace engine
} // namespace zonerisk
