#pragma once

#include "scanner_config.hpp"
#include "types.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

struct PricePoint {
    int64_t ts_ms;
    double price;
};

struct VolumePoint {
    int64_t ts_ms;
    double volume;
};

struct SymbolState {
    std::string symbol;
    std::deque<PricePoint> prices;    // oldest first, bounded by price_window
    std::deque<VolumePoint> volumes;  // oldest first, bounded by volume_window
    std::optional<int64_t> float_shares;
    std::optional<double> baseline_volume;  // per-tick volume expected from history
    std::vector<CatalystTag> catalysts;

    uint64_t version = 0;
    uint64_t tick_count = 0;
    uint64_t last_seq = 0;
    int64_t last_ts_ms = 0;
    double reference_price = 0.0;     // first accepted price

    double last_price() const;
    double pct_change() const;
    const CatalystTag* newest_catalyst() const;
};

// Slow-moving per-symbol data that does not arrive on the tick feed:
// fundamentals, a historical volume baseline and news.
struct ReferenceData {
    std::optional<int64_t> float_shares;
    std::optional<double> baseline_volume;
    std::vector<CatalystTag> catalysts;
};

// Owns all per-symbol state. Writers serialize per symbol; readers get an
// immutable snapshot that stays valid while ingestion continues.
class SymbolStateStore {
public:
    explicit SymbolStateStore(const ScannerConfig& config);

    // Throws InvalidTickError; a rejected tick leaves state untouched.
    void ingest(const Tick& tick);

    // nullptr for unknown symbols. Catalyst tags past retention are filtered.
    std::shared_ptr<const SymbolState> snapshot(const std::string& symbol) const;

    // Kept for the life of the store. Applied now to a symbol that has state
    // (bumping its version) and again whenever the symbol is first seen.
    void merge_reference(const std::string& symbol, const ReferenceData& data);
    bool has_reference(const std::string& symbol) const;

    std::vector<std::string> active_symbols() const;
    uint64_t version(const std::string& symbol) const;
    uint64_t tick_count(const std::string& symbol) const;
    bool remove(const std::string& symbol);
    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        SymbolState state;
        std::shared_ptr<const SymbolState> snapshot;  // reset on every write
    };

    std::shared_ptr<Entry> find_entry(const std::string& symbol) const;
    std::shared_ptr<Entry> find_or_create(const std::string& symbol);
    void validate(const Tick& tick, const SymbolState& state) const;
    void apply(const Tick& tick, SymbolState& state) const;
    void apply_reference(const ReferenceData& data, SymbolState& state, int64_t now_ms) const;
    void add_catalyst(CatalystTag tag, SymbolState& state, int64_t now_ms) const;
    void prune_catalysts(SymbolState& state, int64_t now_ms) const;

    size_t price_window_;
    size_t volume_window_;
    int64_t catalyst_retention_ms_;
    size_t catalyst_max_tags_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;

    mutable std::mutex reference_mutex_;
    std::map<std::string, ReferenceData> reference_;
};
