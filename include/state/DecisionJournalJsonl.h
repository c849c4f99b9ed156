#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace zonerisk {
namespace state {

struct DecisionEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    std::string symbol;
    std::string outcome;        // ACCEPTED | REJECTED | STALE
    std::string reason_code;
    nlohmann::json payload = nlohmann::json::object();
};

// Append-only JSONL log of trade decisions. Sequence numbers continue across restarts.
class DecisionJournalJsonl {
public:
    explicit DecisionJournalJsonl(std::filesystem::path file_path);

    bool append(const DecisionEvent& event);
    std::vector<DecisionEvent> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace state
} // namespace zonerisk
