#include "replay_provider.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>

ReplayProvider::ReplayProvider(const std::string& path, size_t batch_size)
    : batch_size_(batch_size == 0 ? 1 : batch_size)
{
    std::ifstream in(path);
    if (!in) {
        throw ProviderUnavailableError(fmt::format("cannot open replay file {}", path));
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (util::trim(line).empty()) continue;
        try {
            pending_.push_back(JsonCodec::parse_tick_text(line));
        } catch (const InvalidTickError& e) {
            skipped_lines_++;
            spdlog::warn("Replay {}:{} skipped: {}", path, line_no, e.what());
        }
    }
    spdlog::info("Replay loaded {} ticks from {} ({} lines skipped)",
                 pending_.size(), path, skipped_lines_);
}

ReplayProvider::ReplayProvider(std::vector<Tick> ticks, size_t batch_size)
    : batch_size_(batch_size == 0 ? 1 : batch_size)
    , pending_(std::make_move_iterator(ticks.begin()), std::make_move_iterator(ticks.end()))
{
}

std::vector<Tick> ReplayProvider::poll(std::chrono::steady_clock::time_point deadline) {
    std::vector<Tick> batch;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_.empty() && batch.size() < batch_size_) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        Tick tick = std::move(pending_.front());
        pending_.pop_front();
        if (wanted(tick.symbol)) {
            batch.push_back(std::move(tick));
        }
    }
    return batch;
}

void ReplayProvider::subscribe(const std::vector<std::string>& symbols) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribed_.insert(symbols.begin(), symbols.end());
}

void ReplayProvider::unsubscribe(const std::vector<std::string>& symbols) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& s : symbols) {
        subscribed_.erase(s);
    }
}

size_t ReplayProvider::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool ReplayProvider::wanted(const std::string& symbol) const {
    return subscribed_.empty() || subscribed_.count(symbol) > 0;
}
