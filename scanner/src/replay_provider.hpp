#pragma once

#include "provider.hpp"
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Replays a recorded JSON-lines tick file, `batch_size` ticks per poll.
// Lines that do not parse are skipped and counted.
class ReplayProvider : public Provider {
public:
    ReplayProvider(const std::string& path, size_t batch_size);
    ReplayProvider(std::vector<Tick> ticks, size_t batch_size);

    std::vector<Tick> poll(std::chrono::steady_clock::time_point deadline) override;
    void subscribe(const std::vector<std::string>& symbols) override;
    void unsubscribe(const std::vector<std::string>& symbols) override;
    bool is_connected() const override { return true; }
    std::string name() const override { return "replay"; }
    uint64_t malformed_messages() const override { return skipped_lines_; }

    size_t remaining() const;
    size_t skipped_lines() const { return skipped_lines_; }

private:
    bool wanted(const std::string& symbol) const;

    size_t batch_size_;
    size_t skipped_lines_ = 0;

    mutable std::mutex mutex_;
    std::deque<Tick> pending_;
    std::set<std::string> subscribed_;  // empty = every symbol
};
