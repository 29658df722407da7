#include "config.hpp"
#include "health.hpp"
#include "json_codec.hpp"
#include "pg_store.hpp"
#include "provider_factory.hpp"
#include "redis_bus.hpp"
#include "reference_loader.hpp"
#include "scan_scheduler.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <signal.h>
#include <algorithm>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pillarscan", console_sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::string format_float(const std::optional<int64_t>& shares) {
    if (!shares) return "-";
    return fmt::format("{:.1f}M", static_cast<double>(*shares) / 1e6);
}

void log_result(const ScanResult& result, int top_n) {
    spdlog::info("Cycle {} {}: {} symbols ranked in {:.1f}ms ({} ticks, {} rejected)",
                 result.cycle_id, to_string(result.status), result.entries.size(),
                 result.duration_us / 1000.0, result.ticks_ingested, result.ticks_rejected);
    if (result.entries.empty() || top_n == 0) return;

    spdlog::info("{:>4} {:<8} {:>7} {:>9} {:>8} {:>6} {:>8}  {}",
                 "rank", "symbol", "score", "price", "change", "rvol", "float", "catalyst");
    size_t shown = std::min(result.entries.size(), static_cast<size_t>(top_n));
    for (size_t i = 0; i < shown; i++) {
        const auto& e = result.entries[i];
        spdlog::info("{:>4} {:<8} {:>7.2f} {:>9.2f} {:>7.1f}% {:>6.1f} {:>8}  {}{}",
                     e.rank, e.symbol, e.composite, e.last_price, e.pct_change,
                     e.relative_volume, format_float(e.float_shares),
                     e.passed_all ? "* " : "", e.catalyst.substr(0, 40));
    }
}

int main() {
    try {
        // Load configuration
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        // Initialize components
        std::shared_ptr<RedisBus> redis;
        if (config.provider == "redis") {
            redis = std::make_shared<RedisBus>(config.redis_url);
            if (!redis->ping()) {
                spdlog::warn("Redis not reachable yet, provider will retry");
            }
        }

        std::shared_ptr<PostgresStore> pgstore;
        if (!config.pg_dsn.empty()) {
            pgstore = std::make_shared<PostgresStore>(config.pg_dsn);
            pgstore->init_schema();
        }

        auto provider = make_provider(config, redis);
        ScanScheduler scheduler(config.scanner, *provider);
        scheduler.set_universe(config.universe);
        if (!config.reference_file.empty()) {
            auto reference = ReferenceLoader::load_file(config.reference_file);
            scheduler.merge_reference(reference.symbols);
        }

        HealthCheck health(*provider, redis, pgstore);

        // Result sinks, in order: log, Redis, Postgres, HTTP latest
        int top_n = config.top_n_log;
        scheduler.add_sink([top_n](const ScanResult& result) {
            log_result(result, top_n);
        });
        if (redis) {
            std::string stream = config.stream_scans;
            scheduler.add_sink([redis, stream](const ScanResult& result) {
                redis->publish(stream, JsonCodec::to_json(result));
            });
        }
        if (pgstore) {
            scheduler.add_sink([pgstore](const ScanResult& result) {
                pgstore->record_scan(result);
            });
        }
        scheduler.add_sink([&health, &scheduler](const ScanResult& result) {
            health.record(result, scheduler.stats());
        });

        // Setup HTTP server
        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto status = health.get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status.value("ok", false) ? 200 : 503;
        });

        http_server.Get("/scan/latest", [&health](const httplib::Request&, httplib::Response& res) {
            auto latest = health.latest_scan();
            if (!latest) {
                res.status = 404;
                res.set_content(R"({"error":"no scan completed yet"})", "application/json");
                return;
            }
            res.set_content(*latest, "application/json");
        });

        // Start HTTP server in background thread
        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        // Register signal handlers
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        // Main scan loop
        spdlog::info("Entering scan loop");
        health.set_loop_status("running");
        scheduler.run(shutdown_requested);

        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        auto stats = scheduler.stats();
        spdlog::info("Shutdown complete: {} cycles ({} degraded, {} skipped)",
                     stats.cycles_run, stats.cycles_degraded, stats.cycles_skipped);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
