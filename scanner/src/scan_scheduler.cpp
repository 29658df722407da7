#include "scan_scheduler.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <condition_variable>
#include <optional>
#include <thread>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using Clock = std::chrono::steady_clock;

struct ScanScheduler::EvaluationBatch {
    std::mutex mutex;
    std::condition_variable cv;
    size_t remaining = 0;
    std::vector<std::optional<PillarSet>> results;
    std::vector<bool> failed;
    std::atomic<bool> cancelled{false};
};

namespace {

const ScannerConfig& validated(const ScannerConfig& config) {
    config.validate();
    return config;
}

}

ScanScheduler::ScanScheduler(const ScannerConfig& config, Provider& provider, EvaluateFn evaluate)
    : config_(validated(config))
    , provider_(provider)
    , evaluate_(std::move(evaluate))
    , store_(config_)
    , cache_(config_.cache_capacity, config_.cache_shards)
    , aggregator_(config_)
    , pool_(std::make_unique<WorkerPool>(config_.worker_threads))
{
    if (!evaluate_) {
        PillarEvaluator evaluator(config_.pillars);
        evaluate_ = [evaluator](PillarId id, const SymbolState& state) {
            return evaluator.evaluate(id, state);
        };
    }
    spdlog::info("Scan scheduler ready: provider={}, interval={}ms, deadline={}ms, workers={}",
                 provider_.name(), config_.cycle_interval_ms, config_.cycle_deadline_ms,
                 config_.worker_threads);
}

ScanScheduler::~ScanScheduler() {
    pool_.reset();
}

ScanResult ScanScheduler::run_cycle() {
    auto cycle_start = Clock::now();
    auto ingest_deadline = cycle_start + std::chrono::milliseconds(config_.ingest_budget_ms);
    auto cycle_deadline = cycle_start + std::chrono::milliseconds(config_.cycle_deadline_ms);
    CacheStats cache_before = cache_.stats();

    ScanResult result;
    result.cycle_id = next_cycle_id_++;
    result.started_at_ms = util::current_timestamp_ms();

    // 1. Ingest
    phase_ = CyclePhase::Ingesting;
    ingest(result, ingest_deadline);

    // 2. Snapshot every active symbol, then fan out
    phase_ = CyclePhase::Evaluating;
    std::vector<std::shared_ptr<const SymbolState>> snapshots;
    for (const auto& symbol : store_.active_symbols()) {
        auto snap = store_.snapshot(symbol);
        if (snap) {
            snapshots.push_back(std::move(snap));
        }
    }

    auto batch = dispatch(snapshots);
    try {
        wait_for(*batch, cycle_deadline);
    } catch (const DeadlineExceededError& e) {
        spdlog::warn("Cycle {}: {}", result.cycle_id, e.what());
        mark_degraded(result, "deadline_exceeded");
    }

    // 3. Aggregate whatever completed
    phase_ = CyclePhase::Aggregating;
    aggregate(result, snapshots, *batch);

    if (Clock::now() > cycle_deadline) {
        mark_degraded(result, "deadline_exceeded");
    }

    // 4. Emit
    CacheStats cache_after = cache_.stats();
    result.cache_hits = cache_after.hits - cache_before.hits;
    result.cache_misses = cache_after.misses - cache_before.misses;
    result.duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - cycle_start).count();
    phase_ = CyclePhase::Emitted;

    if (result.degraded()) {
        spdlog::warn("Cycle {} degraded ({}): {} ranked, skipped [{}], failed [{}]",
                     result.cycle_id, util::join(result.degraded_reasons, ","),
                     result.entries.size(), util::join(result.skipped_symbols, ","),
                     util::join(result.failed_symbols, ","));
    } else {
        spdlog::debug("Cycle {} ok: {} ranked, {} ticks ({} rejected), cache {}/{} hit/miss, {}us",
                      result.cycle_id, result.entries.size(), result.ticks_ingested,
                      result.ticks_rejected, result.cache_hits, result.cache_misses,
                      result.duration_us);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.cycles_run++;
        if (result.degraded()) stats_.cycles_degraded++;
        stats_.last_cycle_id = result.cycle_id;
    }

    emit(result);
    phase_ = CyclePhase::Idle;
    return result;
}

void ScanScheduler::ingest(ScanResult& result, Clock::time_point deadline) {
    if (!provider_.is_connected()) {
        spdlog::warn("Provider {} not connected, scanning stale state", provider_.name());
        mark_degraded(result, "provider_unavailable");
        return;
    }

    try {
        while (Clock::now() < deadline) {
            auto ticks = provider_.poll(deadline);
            if (ticks.empty()) break;

            for (const auto& tick : ticks) {
                if (!in_universe(tick.symbol)) continue;
                try {
                    store_.ingest(tick);
                    result.ticks_ingested++;
                } catch (const InvalidTickError& e) {
                    result.ticks_rejected++;
                    spdlog::warn("Rejected tick ({}): {}", to_string(e.reason()), e.what());
                }
            }
        }
    } catch (const ProviderUnavailableError& e) {
        spdlog::warn("Provider unavailable: {}", e.what());
        mark_degraded(result, "provider_unavailable");
    } catch (const std::exception& e) {
        spdlog::error("Provider poll failed: {}", e.what());
        mark_degraded(result, "provider_unavailable");
    }
}

std::shared_ptr<ScanScheduler::EvaluationBatch> ScanScheduler::dispatch(
    const std::vector<std::shared_ptr<const SymbolState>>& snapshots) {
    auto batch = std::make_shared<EvaluationBatch>();
    batch->remaining = snapshots.size();
    batch->results.resize(snapshots.size());
    batch->failed.resize(snapshots.size(), false);

    for (size_t i = 0; i < snapshots.size(); i++) {
        auto snap = snapshots[i];
        pool_->submit([this, batch, snap, i]() {
            PillarSet set;
            bool complete = true;
            bool failed = false;
            try {
                for (auto id : kAllPillars) {
                    if (batch->cancelled.load()) {
                        complete = false;
                        break;
                    }
                    set[pillar_index(id)] = cache_.get_or_compute(
                        snap->symbol, id, snap->version,
                        [this, id, &snap]() { return evaluate_(id, *snap); });
                }
            } catch (const std::exception& e) {
                spdlog::error("Evaluation failed for {}: {}", snap->symbol, e.what());
                complete = false;
                failed = true;
            }

            std::lock_guard<std::mutex> lock(batch->mutex);
            if (!batch->cancelled.load()) {
                if (complete) batch->results[i] = std::move(set);
                batch->failed[i] = failed;
            }
            batch->remaining--;
            batch->cv.notify_all();
        });
    }
    return batch;
}

void ScanScheduler::wait_for(EvaluationBatch& batch, Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(batch.mutex);
    bool done = batch.cv.wait_until(lock, deadline, [&batch] { return batch.remaining == 0; });
    if (!done) {
        // Workers check this between pillars; results written after this
        // point are discarded
        batch.cancelled = true;
        throw DeadlineExceededError(fmt::format("evaluation exceeded {}ms deadline, {} symbols pending",
                                                config_.cycle_deadline_ms, batch.remaining));
    }
}

void ScanScheduler::aggregate(ScanResult& result,
                              const std::vector<std::shared_ptr<const SymbolState>>& snapshots,
                              EvaluationBatch& batch) {
    std::vector<std::optional<PillarSet>> results;
    std::vector<bool> failed;
    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        results = std::move(batch.results);
        failed = batch.failed;
    }

    for (size_t i = 0; i < snapshots.size(); i++) {
        const auto& snap = *snapshots[i];
        if (!results[i]) {
            if (failed[i]) {
                result.failed_symbols.push_back(snap.symbol);
            } else {
                result.skipped_symbols.push_back(snap.symbol);
            }
            continue;
        }

        const PillarSet& set = *results[i];
        std::vector<PillarScore> scores(set.begin(), set.end());
        try {
            CompositeScore entry = aggregator_.aggregate(snap.symbol, scores, snap.version);

            entry.last_price = snap.last_price();
            entry.pct_change = snap.pct_change();
            const auto& volume = entry.pillars[pillar_index(PillarId::Volume)];
            entry.relative_volume = volume.insufficient_data ? 0.0 : volume.value;
            entry.float_shares = snap.float_shares;
            if (const CatalystTag* tag = snap.newest_catalyst()) {
                entry.catalyst = tag->headline;
            }
            result.entries.push_back(std::move(entry));
        } catch (const IncompleteScoreSetError& e) {
            spdlog::error("Aggregation failed: {}", e.what());
            result.failed_symbols.push_back(snap.symbol);
        }
    }

    Aggregator::rank(result.entries);
}

void ScanScheduler::emit(const ScanResult& result) {
    std::vector<Sink> sinks;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        try {
            sink(result);
        } catch (const std::exception& e) {
            spdlog::error("Result sink failed for cycle {}: {}", result.cycle_id, e.what());
        }
    }
}

void ScanScheduler::run(const std::atomic<bool>& shutdown_requested) {
    const auto interval = std::chrono::milliseconds(config_.cycle_interval_ms);
    auto next_due = Clock::now();

    spdlog::info("Scan loop started");
    while (!shutdown_requested) {
        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Scan cycle failed: {}", e.what());
            phase_ = CyclePhase::Idle;
        }

        next_due += interval;
        auto now = Clock::now();
        if (now >= next_due) {
            auto missed = (now - next_due) / interval + 1;
            next_due += interval * missed;
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.cycles_skipped += static_cast<uint64_t>(missed);
            }
            spdlog::warn("Cycle overran its slot, skipping {} cycle(s)", missed);
        }

        // Sleep in short slices so shutdown stays responsive
        while (!shutdown_requested && Clock::now() < next_due) {
            auto remaining = next_due - Clock::now();
            std::this_thread::sleep_for(std::min<Clock::duration>(remaining, std::chrono::milliseconds(50)));
        }
    }
    spdlog::info("Scan loop stopped");
}

void ScanScheduler::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void ScanScheduler::set_universe(const std::vector<std::string>& symbols) {
    std::set<std::string> next(symbols.begin(), symbols.end());
    std::vector<std::string> added;
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(universe_mutex_);
        for (const auto& s : next) {
            if (!universe_.count(s)) added.push_back(s);
        }
        if (universe_.empty() && !next.empty()) {
            // Open universe: everything ingested so far is a member
            for (const auto& s : store_.active_symbols()) {
                if (!next.count(s)) dropped.push_back(s);
            }
        } else {
            for (const auto& s : universe_) {
                if (!next.count(s)) dropped.push_back(s);
            }
        }
        universe_ = std::move(next);
    }

    if (!added.empty()) {
        provider_.subscribe(added);
    }
    if (!dropped.empty()) {
        provider_.unsubscribe(dropped);
        for (const auto& s : dropped) {
            store_.remove(s);
            cache_.invalidate(s);
        }
    }
    spdlog::info("Universe updated: {} symbols (+{} -{})", symbols.size(), added.size(), dropped.size());
}

void ScanScheduler::merge_reference(const std::map<std::string, ReferenceData>& reference) {
    size_t catalysts = 0;
    for (const auto& [symbol, data] : reference) {
        store_.merge_reference(symbol, data);
        catalysts += data.catalysts.size();
    }
    spdlog::info("Reference data merged for {} symbols ({} catalysts)", reference.size(), catalysts);
}

std::vector<std::string> ScanScheduler::universe() const {
    std::lock_guard<std::mutex> lock(universe_mutex_);
    return std::vector<std::string>(universe_.begin(), universe_.end());
}

bool ScanScheduler::in_universe(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(universe_mutex_);
    return universe_.empty() || universe_.count(symbol) > 0;
}

SchedulerStats ScanScheduler::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ScanScheduler::mark_degraded(ScanResult& result, const std::string& reason) {
    result.status = CycleStatus::Degraded;
    if (std::find(result.degraded_reasons.begin(), result.degraded_reasons.end(), reason)
        == result.degraded_reasons.end()) {
        result.degraded_reasons.push_back(reason);
    }
}
