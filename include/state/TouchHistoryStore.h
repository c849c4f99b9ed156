#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/EngineConfig.h"
#include "zones/ZoneTypes.h"

namespace zonerisk {
namespace state {

struct ZoneKey {
    std::string symbol;
    std::string timeframe;
    long long price_bucket = 0;
};

// File-backed zone identity and touch history, keyed by (symbol, timeframe, price bucket).
// Writes happen on a background thread; scheduleWrite() never blocks on I/O.
class TouchHistoryStore {
public:
    static constexpr int kSchemaVersion = 1;

    explicit TouchHistoryStore(const engine::PersistenceConfig& config);
    ~TouchHistoryStore();

    TouchHistoryStore(const TouchHistoryStore&) = delete;
    TouchHistoryStore& operator=(const TouchHistoryStore&) = delete;

    // Loads whatever the file holds and starts the writer. A corrupt file is
    // logged and treated as empty.
    void open(const std::filesystem::path& path);

    // Blocks until everything scheduled so far is on disk. False if the last attempt failed.
    bool flush();

    // Flushes, then stops the writer.
    void close();

    bool isOpen() const;

    std::vector<zones::Zone> loadZones(const std::string& symbol) const;

    // Replaces the symbol's state; the writer coalesces back-to-back calls.
    void scheduleWrite(const std::string& symbol, std::vector<zones::Zone> zones);

    std::uint64_t writeCount() const;
    std::uint64_t failureCount() const;

    ZoneKey keyFor(const std::string& symbol, const zones::Zone& zone) const;

    nlohmann::json toJson(const std::map<std::string, std::vector<zones::Zone>>& by_symbol) const;
    static std::map<std::string, std::vector<zones::Zone>> fromJson(const nlohmann::json& doc);

private:
    void writerLoop();
    void writeDocument(const nlohmann::json& doc) const;   // throws PersistenceError

    const engine::PersistenceConfig& config_;
    std::filesystem::path file_path_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread writer_;
    bool running_ = false;

    std::map<std::string, std::vector<zones::Zone>> by_symbol_;
    std::uint64_t scheduled_gen_ = 0;
    std::uint64_t written_gen_ = 0;
    std::uint64_t write_count_ = 0;
    std::uint64_t failure_count_ = 0;
};

} // namespace state
} // namespace zonerisk
