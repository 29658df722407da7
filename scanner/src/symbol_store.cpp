#include "symbol_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>

double SymbolState::last_price() const {
    if (prices.empty()) return 0.0;
    return prices.back().price;
}

double SymbolState::pct_change() const {
    if (prices.empty() || reference_price <= 0.0) return 0.0;
    return ((prices.back().price - reference_price) / reference_price) * 100.0;
}

const CatalystTag* SymbolState::newest_catalyst() const {
    const CatalystTag* newest = nullptr;
    for (const auto& tag : catalysts) {
        if (!newest || tag.ts_ms >= newest->ts_ms) {
            newest = &tag;
        }
    }
    return newest;
}

SymbolStateStore::SymbolStateStore(const ScannerConfig& config)
    : price_window_(config.price_window)
    , volume_window_(config.volume_window)
    , catalyst_retention_ms_(config.pillars.catalyst.retention_ms)
    , catalyst_max_tags_(config.pillars.catalyst.max_tags)
{}

void SymbolStateStore::ingest(const Tick& tick) {
    if (tick.symbol.empty()) {
        throw InvalidTickError(TickRejectReason::InvalidSymbol, "tick without symbol");
    }
    if (!std::isfinite(tick.price) || tick.price <= 0.0) {
        throw InvalidTickError(TickRejectReason::InvalidPrice,
                               fmt::format("{}: non-positive price {}", tick.symbol, tick.price));
    }
    if (!std::isfinite(tick.volume) || tick.volume < 0.0) {
        throw InvalidTickError(TickRejectReason::InvalidVolume,
                               fmt::format("{}: negative volume {}", tick.symbol, tick.volume));
    }

    auto entry = find_or_create(tick.symbol);

    std::lock_guard<std::mutex> lock(entry->mutex);
    validate(tick, entry->state);
    if (entry->state.tick_count == 0) {
        // Reference first so the tick's own fields win
        std::lock_guard<std::mutex> ref_lock(reference_mutex_);
        auto it = reference_.find(tick.symbol);
        if (it != reference_.end()) {
            apply_reference(it->second, entry->state, tick.ts_ms);
        }
    }
    apply(tick, entry->state);
    entry->snapshot.reset();
}

void SymbolStateStore::merge_reference(const std::string& symbol, const ReferenceData& data) {
    {
        std::lock_guard<std::mutex> lock(reference_mutex_);
        auto& ref = reference_[symbol];
        if (data.float_shares && *data.float_shares > 0) ref.float_shares = data.float_shares;
        if (data.baseline_volume && *data.baseline_volume > 0.0) ref.baseline_volume = data.baseline_volume;
        ref.catalysts.insert(ref.catalysts.end(), data.catalysts.begin(), data.catalysts.end());
    }

    auto entry = find_entry(symbol);
    if (!entry) return;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->state.tick_count == 0) return;
    apply_reference(data, entry->state, entry->state.last_ts_ms);
    entry->state.version++;
    entry->snapshot.reset();
}

bool SymbolStateStore::has_reference(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(reference_mutex_);
    return reference_.count(symbol) > 0;
}

void SymbolStateStore::apply_reference(const ReferenceData& data, SymbolState& state, int64_t now_ms) const {
    if (data.float_shares && *data.float_shares > 0) {
        state.float_shares = data.float_shares;
    }
    if (data.baseline_volume && *data.baseline_volume > 0.0) {
        state.baseline_volume = data.baseline_volume;
    }
    for (const auto& tag : data.catalysts) {
        add_catalyst(tag, state, now_ms);
    }
    prune_catalysts(state, now_ms);
}

void SymbolStateStore::add_catalyst(CatalystTag tag, SymbolState& state, int64_t now_ms) const {
    // Tags stamped ahead of the symbol clock would never age out
    if (tag.ts_ms == 0 || tag.ts_ms > now_ms) tag.ts_ms = now_ms;
    std::transform(tag.category.begin(), tag.category.end(), tag.category.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    state.catalysts.push_back(std::move(tag));
    if (state.catalysts.size() > catalyst_max_tags_) {
        state.catalysts.erase(state.catalysts.begin(),
                              state.catalysts.end() - static_cast<std::ptrdiff_t>(catalyst_max_tags_));
    }
}

void SymbolStateStore::prune_catalysts(SymbolState& state, int64_t now_ms) const {
    if (state.catalysts.empty()) return;
    int64_t cutoff_ms = now_ms - catalyst_retention_ms_;
    state.catalysts.erase(
        std::remove_if(state.catalysts.begin(), state.catalysts.end(),
                       [cutoff_ms](const CatalystTag& t) { return t.ts_ms < cutoff_ms; }),
        state.catalysts.end());
}

void SymbolStateStore::validate(const Tick& tick, const SymbolState& state) const {
    if (state.tick_count == 0) return;

    if (tick.seq != 0 && tick.seq <= state.last_seq) {
        throw InvalidTickError(TickRejectReason::Duplicate,
                               fmt::format("{}: seq {} already applied (last {})",
                                           tick.symbol, tick.seq, state.last_seq));
    }
    if (tick.ts_ms < state.last_ts_ms) {
        throw InvalidTickError(TickRejectReason::OutOfOrder,
                               fmt::format("{}: ts {} older than last {}",
                                           tick.symbol, tick.ts_ms, state.last_ts_ms));
    }
}

void SymbolStateStore::apply(const Tick& tick, SymbolState& state) const {
    state.prices.push_back(PricePoint{tick.ts_ms, tick.price});
    while (state.prices.size() > price_window_) {
        state.prices.pop_front();
    }

    state.volumes.push_back(VolumePoint{tick.ts_ms, tick.volume});
    while (state.volumes.size() > volume_window_) {
        state.volumes.pop_front();
    }

    if (tick.float_shares && *tick.float_shares > 0) {
        state.float_shares = tick.float_shares;
    }

    if (tick.catalyst) {
        add_catalyst(*tick.catalyst, state, tick.ts_ms);
    }
    prune_catalysts(state, tick.ts_ms);

    if (state.tick_count == 0) {
        state.reference_price = tick.price;
    }
    state.last_ts_ms = tick.ts_ms;
    if (tick.seq != 0) {
        state.last_seq = tick.seq;
    }
    state.tick_count++;
    state.version++;
}

std::shared_ptr<const SymbolState> SymbolStateStore::snapshot(const std::string& symbol) const {
    auto entry = find_entry(symbol);
    if (!entry) return nullptr;

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->snapshot) {
        auto copy = std::make_shared<SymbolState>(entry->state);

        // Retention runs on the symbol's own clock so a snapshot depends only on its version
        int64_t cutoff_ms = copy->last_ts_ms - catalyst_retention_ms_;
        copy->catalysts.erase(
            std::remove_if(copy->catalysts.begin(), copy->catalysts.end(),
                           [cutoff_ms](const CatalystTag& tag) { return tag.ts_ms < cutoff_ms; }),
            copy->catalysts.end());

        entry->snapshot = std::move(copy);
    }
    return entry->snapshot;
}

std::vector<std::string> SymbolStateStore::active_symbols() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> symbols;
    symbols.reserve(entries_.size());
    for (const auto& [sym, _] : entries_) {
        symbols.push_back(sym);
    }
    return symbols;
}

uint64_t SymbolStateStore::version(const std::string& symbol) const {
    auto entry = find_entry(symbol);
    if (!entry) return 0;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state.version;
}

uint64_t SymbolStateStore::tick_count(const std::string& symbol) const {
    auto entry = find_entry(symbol);
    if (!entry) return 0;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->state.tick_count;
}

bool SymbolStateStore::remove(const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(symbol) > 0;
}

size_t SymbolStateStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<SymbolStateStore::Entry> SymbolStateStore::find_entry(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<SymbolStateStore::Entry> SymbolStateStore::find_or_create(const std::string& symbol) {
    if (auto entry = find_entry(symbol)) {
        return entry;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = entries_[symbol];
    if (!slot) {
        slot = std::make_shared<Entry>();
        slot->state.symbol = symbol;
    }
    return slot;
}
