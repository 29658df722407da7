#pragma once

#include "../src/errors.hpp"
#include "../src/provider.hpp"
#include <deque>
#include <mutex>
#include <set>

inline Tick make_tick(const std::string& symbol, int64_t ts_ms, double price,
                      double volume = 1000.0, uint64_t seq = 0) {
    Tick t;
    t.symbol = symbol;
    t.ts_ms = ts_ms;
    t.price = price;
    t.volume = volume;
    t.seq = seq;
    return t;
}

// Hands out everything queued on the first poll of each cycle.
class FakeProvider : public Provider {
public:
    void push(const Tick& tick) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(tick);
    }

    std::vector<Tick> poll(std::chrono::steady_clock::time_point) override {
        std::lock_guard<std::mutex> lock(mutex_);
        polls++;
        if (fail_polls) {
            throw ProviderUnavailableError("feed down");
        }
        std::vector<Tick> out(queue_.begin(), queue_.end());
        queue_.clear();
        return out;
    }

    void subscribe(const std::vector<std::string>& symbols) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribed.insert(symbols.begin(), symbols.end());
    }

    void unsubscribe(const std::vector<std::string>& symbols) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& s : symbols) subscribed.erase(s);
    }

    bool is_connected() const override { return connected; }
    std::string name() const override { return "fake"; }

    bool connected = true;
    bool fail_polls = false;
    int polls = 0;
    std::set<std::string> subscribed;

private:
    std::mutex mutex_;
    std::deque<Tick> queue_;
};
