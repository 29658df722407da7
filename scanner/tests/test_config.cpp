#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

struct EnvGuard {
    std::vector<std::string> names;

    void set(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        names.push_back(name);
    }

    ~EnvGuard() {
        for (const auto& n : names) unsetenv(n.c_str());
    }
};

}

TEST_CASE("Config from environment", "[config]") {
    EnvGuard env;

    SECTION("Defaults") {
        Config cfg = Config::from_env();
        REQUIRE(cfg.provider == "redis");
        REQUIRE(cfg.scanner.cycle_interval_ms == 1000);
        REQUIRE(cfg.scanner.cycle_deadline_ms == 500);
        REQUIRE(cfg.scanner.cache_capacity == 4096);
        REQUIRE(cfg.universe.empty());
        REQUIRE(cfg.top_n_log == 10);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Overrides and universe list") {
        env.set("PROVIDER", "replay");
        env.set("REPLAY_FILE", "/tmp/ticks.jsonl");
        env.set("CYCLE_DEADLINE_MS", "250");
        env.set("WORKER_THREADS", "2");
        env.set("PRICE_MAX", "15.5");
        env.set("UNIVERSE", " abcd, EFGH ,,ijkl ");
        env.set("REFERENCE_FILE", "/tmp/reference.json");

        Config cfg = Config::from_env();
        REQUIRE(cfg.provider == "replay");
        REQUIRE(cfg.scanner.cycle_deadline_ms == 250);
        REQUIRE(cfg.scanner.worker_threads == 2);
        REQUIRE(cfg.scanner.pillars.price.max == 15.5);
        REQUIRE(cfg.universe == std::vector<std::string>{"ABCD", "EFGH", "IJKL"});
        REQUIRE(cfg.reference_file == "/tmp/reference.json");
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Unparsable numbers fall back to defaults") {
        env.set("CYCLE_INTERVAL_MS", "soon");
        env.set("CACHE_CAPACITY", "-5");
        Config cfg = Config::from_env();
        REQUIRE(cfg.scanner.cycle_interval_ms == 1000);
        REQUIRE(cfg.scanner.cache_capacity == 4096);
    }
}

TEST_CASE("Config validation", "[config]") {
    Config cfg;

    SECTION("Unknown provider") {
        cfg.provider = "ibkr";
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }

    SECTION("Replay needs a file") {
        cfg.provider = "replay";
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }

    SECTION("Engine settings are checked too") {
        cfg.scanner.cycle_deadline_ms = 50;
        cfg.scanner.ingest_budget_ms = 80;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
    }
}

TEST_CASE("Config JSON overlay", "[config]") {
    Config cfg;

    SECTION("Bands, weights and universe") {
        auto doc = nlohmann::json::parse(R"({
            "universe": ["amc", "gme"],
            "weights": {"momentum": 2.0, "float": 0.5},
            "windows": {"price": 128},
            "cycle": {"deadline_ms": 300},
            "pillars": {
                "price": {"min": 1.0, "max": 10.0},
                "volume": {"enabled": false},
                "catalyst": {"allowed": ["fda"], "require_news": false}
            }
        })");
        cfg.apply_json(doc);

        REQUIRE(cfg.universe == std::vector<std::string>{"AMC", "GME"});
        REQUIRE(cfg.scanner.weights.momentum == 2.0);
        REQUIRE(cfg.scanner.weights.float_size == 0.5);
        REQUIRE(cfg.scanner.weights.price == 1.0);
        REQUIRE(cfg.scanner.price_window == 128);
        REQUIRE(cfg.scanner.volume_window == 256);
        REQUIRE(cfg.scanner.cycle_deadline_ms == 300);
        REQUIRE(cfg.scanner.pillars.price.max == 10.0);
        REQUIRE_FALSE(cfg.scanner.pillars.volume.enabled);
        REQUIRE(cfg.scanner.pillars.catalyst.allowed == std::vector<std::string>{"fda"});
        REQUIRE_FALSE(cfg.scanner.pillars.catalyst.require_news);
    }

    SECTION("Mistyped value") {
        auto doc = nlohmann::json::parse(R"({"weights": {"price": "heavy"}})");
        REQUIRE_THROWS_AS(cfg.apply_json(doc), ConfigError);
    }

    SECTION("File overlay and environment precedence") {
        auto path = std::filesystem::temp_directory_path() / "pillarscan_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"cycle": {"interval_ms": 2000, "deadline_ms": 700}})";
        }

        EnvGuard env;
        env.set("SCANNER_CONFIG_FILE", path.string());
        env.set("CYCLE_DEADLINE_MS", "600");

        Config loaded = Config::from_env();
        REQUIRE(loaded.scanner.cycle_interval_ms == 2000);
        REQUIRE(loaded.scanner.cycle_deadline_ms == 600);

        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(cfg.load_file("/nonexistent/pillarscan.json"), ConfigError);
    }
}
