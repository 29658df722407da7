#pragma once

#include "provider.hpp"
#include "redis_bus.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

// Reads tick JSON from a Redis stream with XREAD, resuming after the last
// id it saw. Starts at the current time, so history is not replayed.
class RedisProvider : public Provider {
public:
    RedisProvider(std::shared_ptr<RedisBus> bus, const std::string& stream, long long batch = 1000);

    std::vector<Tick> poll(std::chrono::steady_clock::time_point deadline) override;
    void subscribe(const std::vector<std::string>& symbols) override;
    void unsubscribe(const std::vector<std::string>& symbols) override;

    // Pings again, at most once per second, after a failed round-trip
    bool is_connected() const override;
    std::string name() const override { return "redis"; }

    uint64_t malformed_messages() const override { return malformed_.load(); }

private:
    bool wanted(const std::string& symbol) const;

    std::shared_ptr<RedisBus> bus_;
    std::string stream_;
    long long batch_;
    std::string last_id_;

    mutable std::atomic<bool> connected_;
    mutable std::atomic<int64_t> last_ping_ms_{0};
    std::atomic<uint64_t> malformed_{0};

    mutable std::mutex mutex_;
    std::set<std::string> subscribed_;
};
