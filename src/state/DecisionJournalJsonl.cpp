#include "state/DecisionJournalJsonl.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "common/Logger.h"

namespace zonerisk {
namespace state {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

DecisionJournalJsonl::DecisionJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t skipped = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            if (!line.is_object()) {
                ++skipped;
                continue;
            }
            last_seq_ = std::max(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            ++skipped;
        }
    }
    if (skipped > 0) {
        LOG_WARN("decision journal {}: skipped {} malformed lines", file_path_.string(), skipped);
    }
}

bool DecisionJournalJsonl::append(const DecisionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("decision journal {} not writable", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["symbol"] = event.symbol;
    line["outcome"] = event.outcome;
    line["reason_code"] = event.reason_code;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    last_seq_ = next_seq;
    return true;
}

std::vector<DecisionEvent> DecisionJournalJsonl::readFrom(std::uint64_t seq_inclusive) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DecisionEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        DecisionEvent event;
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            if (!line.is_object()) {
                continue;
            }
            event.seq = parseSeq(line);
            if (event.seq < seq_inclusive) {
                continue;
            }
            event.ts_ms = line.value("ts_ms", 0LL);
            event.symbol = line.value("symbol", std::string());
            event.outcome = line.value("outcome", std::string());
            event.reason_code = line.value("reason_code", std::string());
            event.payload = line.value("payload", nlohmann::json::object());
        } catch (const nlohmann::json::exception&) {
            continue;
        }
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t DecisionJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace state
} // namespace zonerisk
