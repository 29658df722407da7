#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace {

template <typename T>
void read_field(const nlohmann::json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void read_enabled(const nlohmann::json& obj, bool& enabled) {
    read_field(obj, "enabled", enabled);
}

}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

size_t Config::get_env_size(const char* name, size_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        long long parsed = std::stoll(val);
        if (parsed < 0) {
            spdlog::warn("Negative value for {}, using default {}", name, default_val);
            return default_val;
        }
        return static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.config_file = get_env("SCANNER_CONFIG_FILE");
    if (!cfg.config_file.empty()) {
        cfg.load_file(cfg.config_file);
    }

    cfg.provider = get_env("PROVIDER", "redis");
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_ticks = get_env("STREAM_TICKS", "pillarscan.ticks");
    cfg.stream_scans = get_env("STREAM_SCANS", "pillarscan.scans");
    cfg.replay_file = get_env("REPLAY_FILE");
    cfg.replay_batch = get_env_int("REPLAY_BATCH", 500);

    cfg.pg_dsn = get_env("PG_DSN");

    // Engine settings default to whatever the file set
    auto& sc = cfg.scanner;
    sc.cycle_interval_ms = get_env_int("CYCLE_INTERVAL_MS", sc.cycle_interval_ms);
    sc.cycle_deadline_ms = get_env_int("CYCLE_DEADLINE_MS", sc.cycle_deadline_ms);
    sc.ingest_budget_ms = get_env_int("INGEST_BUDGET_MS", sc.ingest_budget_ms);
    sc.worker_threads = get_env_size("WORKER_THREADS", sc.worker_threads);
    sc.cache_capacity = get_env_size("CACHE_CAPACITY", sc.cache_capacity);
    sc.price_window = get_env_size("PRICE_WINDOW", sc.price_window);
    sc.volume_window = get_env_size("VOLUME_WINDOW", sc.volume_window);
    sc.pillars.price.min = get_env_double("PRICE_MIN", sc.pillars.price.min);
    sc.pillars.price.max = get_env_double("PRICE_MAX", sc.pillars.price.max);
    sc.pillars.momentum.min_pct_move = get_env_double("MOMENTUM_MIN_PCT", sc.pillars.momentum.min_pct_move);
    sc.pillars.volume.min_rvol = get_env_double("VOLUME_MIN_RVOL", sc.pillars.volume.min_rvol);

    std::string universe = get_env("UNIVERSE");
    if (!universe.empty()) {
        cfg.universe.clear();
        for (const auto& s : util::split_list(universe)) {
            cfg.universe.push_back(util::to_upper(s));
        }
    }
    cfg.reference_file = get_env("REFERENCE_FILE", cfg.reference_file);
    cfg.top_n_log = get_env_int("TOP_N_LOG", 10);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "pillarscan");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("cannot open config file {}", path));
    }
    try {
        apply_json(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(fmt::format("invalid config file {}: {}", path, e.what()));
    }
    spdlog::info("Loaded scanner config from {}", path);
}

void Config::apply_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("config document must be a JSON object");
    }
    try {
        overlay(doc);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(fmt::format("invalid config value: {}", e.what()));
    }
}

void Config::overlay(const nlohmann::json& doc) {
    if (doc.contains("universe")) {
        universe.clear();
        for (const auto& s : doc.at("universe")) {
            universe.push_back(util::to_upper(s.get<std::string>()));
        }
    }

    read_field(doc, "reference_file", reference_file);

    auto& sc = scanner;
    if (doc.contains("windows")) {
        const auto& w = doc.at("windows");
        read_field(w, "price", sc.price_window);
        read_field(w, "volume", sc.volume_window);
    }
    if (doc.contains("cycle")) {
        const auto& c = doc.at("cycle");
        read_field(c, "interval_ms", sc.cycle_interval_ms);
        read_field(c, "deadline_ms", sc.cycle_deadline_ms);
        read_field(c, "ingest_budget_ms", sc.ingest_budget_ms);
    }
    if (doc.contains("cache")) {
        const auto& c = doc.at("cache");
        read_field(c, "capacity", sc.cache_capacity);
        read_field(c, "shards", sc.cache_shards);
    }
    read_field(doc, "worker_threads", sc.worker_threads);

    if (doc.contains("weights")) {
        const auto& w = doc.at("weights");
        for (auto id : kAllPillars) {
            double weight = sc.weights.get(id);
            read_field(w, pillar_name(id), weight);
            sc.weights.set(id, weight);
        }
    }

    if (!doc.contains("pillars")) return;
    const auto& p = doc.at("pillars");

    if (p.contains("price")) {
        const auto& j = p.at("price");
        auto& b = sc.pillars.price;
        read_enabled(j, b.enabled);
        read_field(j, "min", b.min);
        read_field(j, "max", b.max);
        read_field(j, "min_points", b.min_points);
    }
    if (p.contains("momentum")) {
        const auto& j = p.at("momentum");
        auto& b = sc.pillars.momentum;
        read_enabled(j, b.enabled);
        read_field(j, "lookback", b.lookback);
        read_field(j, "full_scale_pct", b.full_scale_pct);
        read_field(j, "min_pct_move", b.min_pct_move);
    }
    if (p.contains("volume")) {
        const auto& j = p.at("volume");
        auto& b = sc.pillars.volume;
        read_enabled(j, b.enabled);
        read_field(j, "recent_ticks", b.recent_ticks);
        read_field(j, "min_baseline_points", b.min_baseline_points);
        read_field(j, "target_rvol", b.target_rvol);
        read_field(j, "min_rvol", b.min_rvol);
    }
    if (p.contains("catalyst")) {
        const auto& j = p.at("catalyst");
        auto& b = sc.pillars.catalyst;
        read_enabled(j, b.enabled);
        read_field(j, "retention_ms", b.retention_ms);
        read_field(j, "fresh_ms", b.fresh_ms);
        read_field(j, "require_news", b.require_news);
        read_field(j, "max_tags", b.max_tags);
        read_field(j, "allowed", b.allowed);
        read_field(j, "excluded", b.excluded);
    }
    if (p.contains("float")) {
        const auto& j = p.at("float");
        auto& b = sc.pillars.float_size;
        read_enabled(j, b.enabled);
        read_field(j, "small_max", b.small_max);
        read_field(j, "max_shares", b.max_shares);
        read_field(j, "large_max", b.large_max);
    }
}

void Config::validate() const {
    if (provider != "redis" && provider != "replay") {
        throw ConfigError(fmt::format("PROVIDER must be redis or replay, got '{}'", provider));
    }
    if (provider == "replay" && replay_file.empty()) {
        throw ConfigError("REPLAY_FILE is required for the replay provider");
    }
    if (replay_batch <= 0) {
        throw ConfigError("REPLAY_BATCH must be positive");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw ConfigError(fmt::format("LISTEN_PORT out of range: {}", listen_port));
    }
    if (top_n_log < 0) {
        throw ConfigError("TOP_N_LOG must not be negative");
    }
    scanner.validate();

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Provider: {} ({})", provider, provider == "redis" ? stream_ticks : replay_file);
    spdlog::info("  Universe: {}", universe.empty() ? std::string("<all>") : util::join(universe, ","));
    spdlog::info("  Cycle: interval={}ms, deadline={}ms, ingest={}ms",
                 scanner.cycle_interval_ms, scanner.cycle_deadline_ms, scanner.ingest_budget_ms);
    spdlog::info("  Weights: price={} momentum={} volume={} catalyst={} float={}",
                 scanner.weights.price, scanner.weights.momentum, scanner.weights.volume,
                 scanner.weights.catalyst, scanner.weights.float_size);
    spdlog::info("  Reference data: {}", reference_file.empty() ? std::string("none") : reference_file);
    spdlog::info("  Postgres history: {}", pg_dsn.empty() ? "disabled" : "enabled");
}
