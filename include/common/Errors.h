#pragma once

#include <stdexcept>
#include <string>

namespace zonerisk {

enum class ErrorCode {
    MISSING_DATA,
    INSUFFICIENT_HISTORY,
    INVALID_RISK_BOUNDS,
    PERSISTENCE
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::MISSING_DATA: return "MISSING_DATA";
        case ErrorCode::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
        case ErrorCode::INVALID_RISK_BOUNDS: return "INVALID_RISK_BOUNDS";
        case ErrorCode::PERSISTENCE: return "PERSISTENCE";
    }
    return "UNKNOWN";
}

class ZoneEngineError : public std::runtime_error {
public:
    ZoneEngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// A level source produced nothing (or timed out) for the current cycle.
class MissingDataError : public ZoneEngineError {
public:
    MissingDataError(std::string source, const std::string& message)
        : ZoneEngineError(ErrorCode::MISSING_DATA, message)
        , source_(std::move(source)) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

class InsufficientHistoryError : public ZoneEngineError {
public:
    InsufficientHistoryError(int zone_id, int touches, int required)
        : ZoneEngineError(ErrorCode::INSUFFICIENT_HISTORY,
                          "zone " + std::to_string(zone_id) + " has " + std::to_string(touches) +
                          " touches, " + std::to_string(required) + " required")
        , zone_id_(zone_id), touches_(touches), required_(required) {}

    int zoneId() const { return zone_id_; }
    int touches() const { return touches_; }
    int required() const { return required_; }

private:
    int zone_id_;
    int touches_;
    int required_;
};

// Carried by value inside a risk decision; the trade decision is rejected,
// the process keeps running.
class InvalidRiskBoundsError : public ZoneEngineError {
public:
    InvalidRiskBoundsError(std::string reason_code, double risk_reward, double required_min)
        : ZoneEngineError(ErrorCode::INVALID_RISK_BOUNDS,
                          reason_code + ": R:R " + std::to_string(risk_reward) +
                          " < " + std::to_string(required_min))
        , reason_code_(std::move(reason_code))
        , risk_reward_(risk_reward)
        , required_min_(required_min) {}

    const std::string& reasonCode() const { return reason_code_; }
    double riskReward() const { return risk_reward_; }
    double requiredMin() const { return required_min_; }

private:
    std::string reason_code_;
    double risk_reward_;
    double required_min_;
};

class PersistenceError : public ZoneEngineError {
public:
    explicit PersistenceError(const std::string& message)
        : ZoneEngineError(ErrorCode::PERSISTENCE, message) {}
};

} // namespace zonerisk
