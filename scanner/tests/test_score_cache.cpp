#include <catch2/catch_test_macros.hpp>
#include "../src/score_cache.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

PillarScore score_for(const std::string& symbol, PillarId pillar, uint64_t version, double value) {
    PillarScore s;
    s.symbol = symbol;
    s.pillar = pillar;
    s.version = version;
    s.score = value;
    return s;
}

}

TEST_CASE("Score cache memoizes by version", "[score_cache]") {
    ScoreCache cache(64, 4);
    int calls = 0;
    auto compute = [&](uint64_t version, double value) {
        return [&calls, version, value]() {
            calls++;
            return score_for("ABCD", PillarId::Momentum, version, value);
        };
    };

    SECTION("Hit does not recompute") {
        auto a = cache.get_or_compute("ABCD", PillarId::Momentum, 3, compute(3, 61.0));
        auto b = cache.get_or_compute("ABCD", PillarId::Momentum, 3, compute(3, 99.0));
        REQUIRE(calls == 1);
        REQUIRE(a == b);
        REQUIRE(b.score == 61.0);
        REQUIRE(cache.stats().hits == 1);
        REQUIRE(cache.stats().misses == 1);
    }

    SECTION("Advanced version is a miss and replaces the slot") {
        cache.get_or_compute("ABCD", PillarId::Momentum, 3, compute(3, 61.0));
        auto fresh = cache.get_or_compute("ABCD", PillarId::Momentum, 4, compute(4, 70.0));
        REQUIRE(calls == 2);
        REQUIRE(fresh.score == 70.0);
        REQUIRE_FALSE(cache.contains("ABCD", PillarId::Momentum, 3));
        REQUIRE(cache.contains("ABCD", PillarId::Momentum, 4));
        REQUIRE(cache.size() == 1);
    }

    SECTION("Older version never overwrites a newer entry") {
        cache.get_or_compute("ABCD", PillarId::Momentum, 5, compute(5, 80.0));
        cache.get_or_compute("ABCD", PillarId::Momentum, 4, compute(4, 10.0));
        REQUIRE(cache.contains("ABCD", PillarId::Momentum, 5));
        auto again = cache.get_or_compute("ABCD", PillarId::Momentum, 5, compute(5, 0.0));
        REQUIRE(again.score == 80.0);
    }

    SECTION("Pillars of one symbol are cached independently") {
        cache.get_or_compute("ABCD", PillarId::Momentum, 1, compute(1, 55.0));
        cache.get_or_compute("ABCD", PillarId::Price, 1, [&]() {
            calls++;
            return score_for("ABCD", PillarId::Price, 1, 75.0);
        });
        REQUIRE(calls == 2);
        REQUIRE(cache.size() == 2);
    }

    SECTION("Throwing compute stores nothing") {
        REQUIRE_THROWS_AS(cache.get_or_compute("ABCD", PillarId::Momentum, 1, []() -> PillarScore {
            throw std::runtime_error("boom");
        }), std::runtime_error);
        REQUIRE(cache.size() == 0);
    }

    SECTION("Invalidate drops all pillars of a symbol") {
        for (auto id : kAllPillars) {
            cache.get_or_compute("ABCD", id, 1, [&]() { return score_for("ABCD", id, 1, 1.0); });
        }
        cache.get_or_compute("WXYZ", PillarId::Float, 1, [&]() { return score_for("WXYZ", PillarId::Float, 1, 1.0); });
        REQUIRE(cache.size() == 6);
        cache.invalidate("ABCD");
        REQUIRE(cache.size() == 1);
    }
}

TEST_CASE("Score cache evicts least recently used", "[score_cache]") {
    // One shard so capacity is exact
    ScoreCache cache(5, 1);
    auto fill = [&](const std::string& symbol) {
        cache.get_or_compute(symbol, PillarId::Price, 1, [&]() {
            return score_for(symbol, PillarId::Price, 1, 50.0);
        });
    };

    for (const char* s : {"A", "B", "C", "D", "E"}) fill(s);
    REQUIRE(cache.size() == 5);

    // Touch A so B becomes the oldest
    fill("A");
    fill("F");

    REQUIRE(cache.size() == 5);
    REQUIRE(cache.contains("A", PillarId::Price, 1));
    REQUIRE_FALSE(cache.contains("B", PillarId::Price, 1));
    REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("Score cache never grows past its capacity", "[score_cache]") {
    auto fill = [](ScoreCache& cache, int symbols) {
        for (int i = 0; i < symbols; i++) {
            std::string symbol = "S" + std::to_string(i);
            cache.get_or_compute(symbol, PillarId::Volume, 1, [&]() {
                return score_for(symbol, PillarId::Volume, 1, 10.0);
            });
        }
    };

    SECTION("Small capacity collapses the shards") {
        ScoreCache cache(5, 16);
        REQUIRE(cache.capacity() == 5);
        REQUIRE(cache.shard_count() == 1);
        fill(cache, 40);
        REQUIRE(cache.size() <= 5);
        REQUIRE(cache.stats().evictions == 35);
    }

    SECTION("Capacity that does not divide evenly") {
        ScoreCache cache(23, 4);
        REQUIRE(cache.shard_count() == 4);
        fill(cache, 200);
        REQUIRE(cache.size() <= 23);
    }
}

TEST_CASE("Score cache under concurrent readers", "[score_cache]") {
    ScoreCache cache(1024, 8);
    std::atomic<int> calls{0};
    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; i++) {
                std::string symbol = "S" + std::to_string(i % 20);
                auto s = cache.get_or_compute(symbol, PillarId::Volume, 1, [&]() {
                    calls++;
                    return score_for(symbol, PillarId::Volume, 1, 42.0);
                });
                if (s.symbol != symbol || s.score != 42.0) mismatches++;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(mismatches.load() == 0);
    REQUIRE(cache.size() == 20);
    auto stats = cache.stats();
    REQUIRE(stats.hits + stats.misses == 1600);
    REQUIRE(calls.load() >= 20);
}
