#include "health.hpp"
#include "json_codec.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const Provider& provider,
                         std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg)
    : provider_(provider), redis_(redis), pg_(pg), loop_status_("starting") {}

void HealthCheck::record(const ScanResult& result, const SchedulerStats& stats) {
    auto body = JsonCodec::to_json(result).dump();

    std::lock_guard<std::mutex> lock(mutex_);
    latest_json_ = std::move(body);
    stats_ = stats;
    last_cycle_ = {
        {"cycle_id", result.cycle_id},
        {"status", to_string(result.status)},
        {"duration_us", result.duration_us},
        {"entries", result.entries.size()},
        {"ts", util::current_iso8601()}
    };
}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

nlohmann::json HealthCheck::get_status() {
    bool provider_ok = provider_.is_connected();
    nlohmann::json redis_status = redis_ ? nlohmann::json(redis_->ping()) : nlohmann::json("disabled");
    nlohmann::json pg_status = pg_ ? nlohmann::json(pg_->ping()) : nlohmann::json("disabled");

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json status = {
        {"provider", provider_.name()},
        {"provider_connected", provider_ok},
        {"provider_malformed", provider_.malformed_messages()},
        {"redis", redis_status},
        {"postgres", pg_status},
        {"loop", loop_status_},
        {"cycles", {
            {"run", stats_.cycles_run},
            {"degraded", stats_.cycles_degraded},
            {"skipped", stats_.cycles_skipped}
        }},
        {"last_cycle", last_cycle_.is_null() ? nlohmann::json(nullptr) : last_cycle_}
    };
    status["ok"] = is_healthy(status);
    return status;
}

bool HealthCheck::is_healthy(const nlohmann::json& status) const {
    // A disabled dependency is reported as a string and does not count
    auto dep_ok = [](const nlohmann::json& v) { return !v.is_boolean() || v.get<bool>(); };
    return status.value("provider_connected", false)
        && dep_ok(status["redis"])
        && dep_ok(status["postgres"])
        && status.value("loop", "") == "running";
}

std::optional<std::string> HealthCheck::latest_scan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_json_;
}
