#include "state/TouchHistoryStore.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <system_error>

#include "common/Errors.h"
#include "common/Logger.h"
#include "common/Types.h"

namespace zonerisk {
namespace state {

namespace {

nlohmann::json touchToJson(const zones::TouchRecord& touch) {
    return {
        {"ts_ms", touch.timestamp},
        {"touch_price", touch.touch_price},
        {"rejection_strength", touch.rejection_strength},
        {"volume_ratio", touch.volume_ratio},
    };
}

zones::TouchRecord touchFromJson(const nlohmann::json& j) {
    zones::TouchRecord touch;
    touch.timestamp = j.value("ts_ms", 0LL);
    touch.touch_price = j.value("touch_price", 0.0);
    touch.rejection_strength = j.value("rejection_strength", 0.0);
    touch.volume_ratio = j.value("volume_ratio", 0.0);
    return touch;
}

} // namespace

TouchHistoryStore::TouchHistoryStore(const engine::PersistenceConfig& config)
    : config_(config) {}

TouchHistoryStore::~TouchHistoryStore() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("touch history store shutdown failed: {}", e.what());
    }
}

void TouchHistoryStore::open(const std::filesystem::path& path) {
    close();

    std::map<std::string, std::vector<zones::Zone>> loaded;
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (in.is_open()) {
            try {
                nlohmann::json raw;
                in >> raw;
                loaded = fromJson(raw);
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("touch history {} unreadable, starting empty: {}", path.string(), e.what());
                loaded.clear();
            }
        }
    }

    size_t zone_count = 0;
    size_t touch_count = 0;
    for (const auto& [symbol, zones] : loaded) {
        zone_count += zones.size();
        for (const auto& zone : zones) {
            touch_count += zone.touches.size();
        }
    }
    LOG_INFO("touch history loaded from {}: {} symbols, {} zones, {} touches",
             path.string(), loaded.size(), zone_count, touch_count);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = path;
        by_symbol_ = std::move(loaded);
        scheduled_gen_ = 0;
        written_gen_ = 0;
        running_ = true;
    }
    writer_ = std::thread(&TouchHistoryStore::writerLoop, this);
}

bool TouchHistoryStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::vector<zones::Zone> TouchHistoryStore::loadZones(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_symbol_.find(symbol);
    return it != by_symbol_.end() ? it->second : std::vector<zones::Zone>{};
}

void TouchHistoryStore::scheduleWrite(const std::string& symbol, std::vector<zones::Zone> zones) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        by_symbol_[symbol] = std::move(zones);
        ++scheduled_gen_;
    }
    cv_.notify_all();
}

bool TouchHistoryStore::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) {
        return written_gen_ >= scheduled_gen_;
    }

    const std::uint64_t target = scheduled_gen_;
    const std::uint64_t failures_before = failure_count_;
    cv_.notify_all();
    cv_.wait(lock, [&]() {
        return written_gen_ >= target || !running_ || failure_count_ > failures_before;
    });
    return written_gen_ >= target;
}

void TouchHistoryStore::close() {
    if (!writer_.joinable()) {
        return;
    }
    if (!flush()) {
        LOG_ERROR("touch history not fully persisted before close ({} failed writes)", failureCount());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    writer_.join();
}

std::uint64_t TouchHistoryStore::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

std::uint64_t TouchHistoryStore::failureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_count_;
}

void TouchHistoryStore::writerLoop() {
    const auto interval = std::chrono::seconds(std::max(1, config_.flush_interval_seconds));
    const auto retry_delay = std::chrono::milliseconds(std::max(1, config_.retry_delay_ms));

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const bool woke = cv_.wait_for(lock, interval, [&]() {
            return !running_ || scheduled_gen_ > written_gen_;
        });
        if (!running_) {
            break;
        }
        // Periodic rewrite when idle, as long as there is something to write.
        if (!woke && by_symbol_.empty()) {
            continue;
        }

        const std::uint64_t target = scheduled_gen_;
        const nlohmann::json doc = toJson(by_symbol_);
        lock.unlock();

        bool ok = true;
        try {
            writeDocument(doc);
        } catch (const PersistenceError& e) {
            ok = false;
            LOG_WARN("touch history write failed, retrying in {} ms: {}", retry_delay.count(), e.what());
        }

        lock.lock();
        if (ok) {
            written_gen_ = std::max(written_gen_, target);
            ++write_count_;
        } else {
            ++failure_count_;
        }
        cv_.notify_all();

        if (!ok) {
            cv_.wait_for(lock, retry_delay, [&]() { return !running_; });
        }
    }
}

void TouchHistoryStore::writeDocument(const nlohmann::json& doc) const {
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            throw PersistenceError("cannot create " + file_path_.parent_path().string() + ": " + ec.message());
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw PersistenceError("cannot open " + tmp_path.string());
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            throw PersistenceError("short write to " + tmp_path.string());
        }
    }

    // rename() replaces the old file atomically; a crash leaves either version intact.
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        throw PersistenceError("rename " + tmp_path.string() + " failed: " + ec.message());
    }
}

ZoneKey TouchHistoryStore::keyFor(const std::string& symbol, const zones::Zone& zone) const {
    ZoneKey key;
    key.symbol = symbol;
    key.timeframe = zone.dominant_timeframe;
    const double bucket_size = config_.price_bucket_size > 0.0 ? config_.price_bucket_size : 1.0;
    key.price_bucket = static_cast<long long>(std::floor(zone.price_center / bucket_size));
    return key;
}

nlohmann::json TouchHistoryStore::toJson(const std::map<std::string, std::vector<zones::Zone>>& by_symbol) const {
    nlohmann::json doc;
    doc["schema_version"] = kSchemaVersion;
    doc["saved_at_ms"] = nowMs();
    doc["zones"] = nlohmann::json::array();

    for (const auto& [symbol, zones] : by_symbol) {
        for (const auto& zone : zones) {
            const ZoneKey key = keyFor(symbol, zone);

            nlohmann::json members = nlohmann::json::array();
            for (const auto& level : zone.member_levels) {
                members.push_back({
                    {"price", level.price},
                    {"source", level.source_tag},
                    {"weight", level.source_weight},
                    {"timeframe", level.timeframe},
                });
            }
            nlohmann::json touches = nlohmann::json::array();
            for (const auto& touch : zone.touches) {
                touches.push_back(touchToJson(touch));
            }

            doc["zones"].push_back({
                {"key", {{"symbol", key.symbol}, {"timeframe", key.timeframe}, {"bucket", key.price_bucket}}},
                {"id", zone.id},
                {"price_center", zone.price_center},
                {"merge_radius", zone.merge_radius},
                {"tier", zones::toString(zone.tier)},
                {"confluence_count", zone.confluence_count},
                {"missed_cycles", zone.missed_cycles},
                {"members", members},
                {"touches", touches},
            });
        }
    }
    return doc;
}

std::map<std::string, std::vector<zones::Zone>> TouchHistoryStore::fromJson(const nlohmann::json& doc) {
    std::map<std::string, std::vector<zones::Zone>> out;
    if (!doc.is_object() || !doc.contains("zones") || !doc["zones"].is_array()) {
        return out;
    }

    for (const auto& row : doc["zones"]) {
        const auto key = row.value("key", nlohmann::json::object());
        const std::string symbol = key.value("symbol", std::string());
        if (symbol.empty()) {
            continue;
        }

        zones::Zone zone;
        zone.id = row.value("id", 0);
        zone.price_center = row.value("price_center", 0.0);
        zone.merge_radius = row.value("merge_radius", 0.0);
        zone.tier = zones::zoneTierFromString(row.value("tier", std::string("MINOR")));
        zone.confluence_count = row.value("confluence_count", 0);
        zone.missed_cycles = row.value("missed_cycles", 0);
        zone.dominant_timeframe = key.value("timeframe", std::string());

        if (row.contains("members") && row["members"].is_array()) {
            for (const auto& m : row["members"]) {
                zone.member_levels.push_back({
                    m.value("price", 0.0),
                    m.value("source", std::string()),
                    m.value("weight", 0.0),
                    m.value("timeframe", std::string()),
                });
            }
        }
        if (row.contains("touches") && row["touches"].is_array()) {
            for (const auto& t : row["touches"]) {
                zone.touches.push_back(touchFromJson(t));
            }
        }

        if (zone.price_center > 0.0) {
            out[symbol].push_back(std::move(zone));
        }
    }
    return out;
}

} // namespace state
} // namespace zonerisk
