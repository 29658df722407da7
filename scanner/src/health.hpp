#pragma once
#include "pg_store.hpp"
#include "provider.hpp"
#include "redis_bus.hpp"
#include "scan_scheduler.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Backs GET /health and GET /scan/latest. redis and pg may be null when the
// service runs without them.
class HealthCheck {
public:
    HealthCheck(const Provider& provider,
                std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg);

    void record(const ScanResult& result, const SchedulerStats& stats);
    void set_loop_status(const std::string& status);

    nlohmann::json get_status();
    bool is_healthy(const nlohmann::json& status) const;

    // Serialized latest ScanResult, empty before the first cycle
    std::optional<std::string> latest_scan() const;

private:
    const Provider& provider_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;

    mutable std::mutex mutex_;
    std::string loop_status_;
    std::optional<std::string> latest_json_;
    nlohmann::json last_cycle_;
    SchedulerStats stats_;
};
