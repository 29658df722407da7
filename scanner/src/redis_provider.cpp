#include "redis_provider.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
constexpr int64_t kReconnectIntervalMs = 1000;
}

RedisProvider::RedisProvider(std::shared_ptr<RedisBus> bus, const std::string& stream, long long batch)
    : bus_(std::move(bus))
    , stream_(stream)
    , batch_(batch)
    , last_id_(fmt::format("{}-0", util::current_timestamp_ms()))
    , connected_(bus_->ping())
{
    spdlog::info("Redis provider reading {} from id {} (connected={})", stream_, last_id_, connected_.load());
}

std::vector<Tick> RedisProvider::poll(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

    std::vector<std::pair<std::string, std::string>> entries;
    try {
        entries = bus_->read_stream(stream_, last_id_, batch_, remaining);
        connected_ = true;
    } catch (const std::exception& e) {
        connected_ = false;
        last_ping_ms_ = util::current_timestamp_ms();
        throw ProviderUnavailableError(fmt::format("XREAD {} failed: {}", stream_, e.what()));
    }

    std::vector<Tick> ticks;
    ticks.reserve(entries.size());
    for (const auto& [id, data] : entries) {
        last_id_ = id;
        try {
            Tick tick = JsonCodec::parse_tick_text(data);
            if (wanted(tick.symbol)) {
                ticks.push_back(std::move(tick));
            }
        } catch (const InvalidTickError& e) {
            malformed_++;
            spdlog::warn("Dropping stream entry {}: {}", id, e.what());
        }
    }
    return ticks;
}

void RedisProvider::subscribe(const std::vector<std::string>& symbols) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribed_.insert(symbols.begin(), symbols.end());
    spdlog::debug("Redis provider subscribed to {} symbols", subscribed_.size());
}

void RedisProvider::unsubscribe(const std::vector<std::string>& symbols) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : symbols) {
        subscribed_.erase(s);
    }
}

bool RedisProvider::is_connected() const {
    if (connected_) return true;

    int64_t now = util::current_timestamp_ms();
    if (now - last_ping_ms_ >= kReconnectIntervalMs) {
        last_ping_ms_ = now;
        connected_ = bus_->ping();
        if (connected_) {
            spdlog::info("Redis provider reconnected");
        }
    }
    return connected_;
}

bool RedisProvider::wanted(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribed_.empty() || subscribed_.count(symbol) > 0;
}
