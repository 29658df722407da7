#pragma once

#include "aggregator.hpp"
#include "pillars.hpp"
#include "provider.hpp"
#include "scanner_config.hpp"
#include "score_cache.hpp"
#include "symbol_store.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct SchedulerStats {
    uint64_t cycles_run = 0;
    uint64_t cycles_degraded = 0;
    uint64_t cycles_skipped = 0;
    uint64_t last_cycle_id = 0;
};

// Drives Idle -> Ingesting -> Evaluating -> Aggregating -> Emitted.
// run_cycle() is called from a single driver thread; set_universe() and
// add_sink() may be called from others.
class ScanScheduler {
public:
    using EvaluateFn = std::function<PillarScore(PillarId, const SymbolState&)>;
    using Sink = std::function<void(const ScanResult&)>;

    // Throws ConfigError on an invalid config. `evaluate` defaults to
    // PillarEvaluator over config.pillars.
    ScanScheduler(const ScannerConfig& config, Provider& provider, EvaluateFn evaluate = nullptr);
    ~ScanScheduler();

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    ScanResult run_cycle();

    // Fixed cadence until `shutdown_requested`; a slot that comes due while a
    // cycle is still running is skipped, never overlapped.
    void run(const std::atomic<bool>& shutdown_requested);

    void add_sink(Sink sink);

    // Empty universe accepts every symbol the provider delivers
    void set_universe(const std::vector<std::string>& symbols);
    std::vector<std::string> universe() const;

    // Fundamentals, volume baselines and news loaded outside the tick feed
    void merge_reference(const std::map<std::string, ReferenceData>& reference);

    CyclePhase phase() const { return phase_.load(); }
    SchedulerStats stats() const;

    const SymbolStateStore& store() const { return store_; }

private:
    struct EvaluationBatch;

    void ingest(ScanResult& result, std::chrono::steady_clock::time_point deadline);
    std::shared_ptr<EvaluationBatch> dispatch(
        const std::vector<std::shared_ptr<const SymbolState>>& snapshots);
    void wait_for(EvaluationBatch& batch, std::chrono::steady_clock::time_point deadline);
    void aggregate(ScanResult& result,
                   const std::vector<std::shared_ptr<const SymbolState>>& snapshots,
                   EvaluationBatch& batch);
    void emit(const ScanResult& result);
    bool in_universe(const std::string& symbol) const;
    static void mark_degraded(ScanResult& result, const std::string& reason);

    ScannerConfig config_;
    Provider& provider_;
    EvaluateFn evaluate_;

    SymbolStateStore store_;
    ScoreCache cache_;
    Aggregator aggregator_;

    std::atomic<CyclePhase> phase_{CyclePhase::Idle};
    std::atomic<uint64_t> next_cycle_id_{1};

    mutable std::mutex universe_mutex_;
    std::set<std::string> universe_;

    mutable std::mutex sinks_mutex_;
    std::vector<Sink> sinks_;

    mutable std::mutex stats_mutex_;
    SchedulerStats stats_;

    // Declared last: joined before the store and cache it writes to go away
    std::unique_ptr<WorkerPool> pool_;
};
