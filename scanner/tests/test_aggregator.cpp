#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/aggregator.hpp"
#include "../src/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using Catch::Approx;

namespace {

std::vector<PillarScore> full_set(const std::string& symbol, uint64_t version,
                                  std::array<double, kPillarCount> values,
                                  bool passed = true) {
    std::vector<PillarScore> scores;
    for (auto id : kAllPillars) {
        PillarScore s;
        s.symbol = symbol;
        s.pillar = id;
        s.version = version;
        s.score = values[pillar_index(id)];
        s.passed = passed;
        scores.push_back(s);
    }
    return scores;
}

}

TEST_CASE("Aggregator combines five fresh scores", "[aggregator]") {
    ScannerConfig config;
    Aggregator aggregator(config);

    SECTION("Equal weights average the pillars") {
        auto c = aggregator.aggregate("ABCD", full_set("ABCD", 4, {100, 80, 60, 40, 20}), 4);
        REQUIRE(c.composite == Approx(60.0));
        REQUIRE(c.version == 4);
        REQUIRE(c.passed_all);
        REQUIRE(c.passed_pillars.size() == 5);
        REQUIRE(c.failed_pillars.empty());
    }

    SECTION("Input order does not matter") {
        auto scores = full_set("ABCD", 4, {100, 80, 60, 40, 20});
        std::reverse(scores.begin(), scores.end());
        auto c = aggregator.aggregate("ABCD", scores, 4);
        REQUIRE(c.composite == Approx(60.0));
        REQUIRE(c.pillars[pillar_index(PillarId::Price)].score == 100.0);
    }

    SECTION("Failed pillars are listed") {
        auto scores = full_set("ABCD", 1, {50, 50, 50, 50, 50});
        scores[pillar_index(PillarId::Float)].passed = false;
        auto c = aggregator.aggregate("ABCD", scores, 1);
        REQUIRE_FALSE(c.passed_all);
        REQUIRE(c.failed_pillars == std::vector<std::string>{"float"});
    }
}

TEST_CASE("Aggregator rejects incomplete or stale sets", "[aggregator]") {
    ScannerConfig config;
    Aggregator aggregator(config);

    SECTION("Fewer than five scores") {
        auto scores = full_set("ABCD", 2, {1, 2, 3, 4, 5});
        scores.pop_back();
        REQUIRE_THROWS_AS(aggregator.aggregate("ABCD", scores, 2), IncompleteScoreSetError);
    }

    SECTION("Duplicated pillar") {
        auto scores = full_set("ABCD", 2, {1, 2, 3, 4, 5});
        scores[4] = scores[0];
        REQUIRE_THROWS_AS(aggregator.aggregate("ABCD", scores, 2), IncompleteScoreSetError);
    }

    SECTION("Stale score") {
        auto scores = full_set("ABCD", 2, {1, 2, 3, 4, 5});
        scores[pillar_index(PillarId::Volume)].version = 1;
        REQUIRE_THROWS_AS(aggregator.aggregate("ABCD", scores, 2), IncompleteScoreSetError);
    }

    SECTION("Score for another symbol") {
        auto scores = full_set("ABCD", 2, {1, 2, 3, 4, 5});
        scores[0].symbol = "WXYZ";
        REQUIRE_THROWS_AS(aggregator.aggregate("ABCD", scores, 2), IncompleteScoreSetError);
    }
}

TEST_CASE("Aggregator weighting", "[aggregator]") {
    ScannerConfig config;

    SECTION("Custom weights") {
        config.weights.momentum = 3.0;
        Aggregator aggregator(config);
        auto c = aggregator.aggregate("ABCD", full_set("ABCD", 1, {0, 100, 0, 0, 0}), 1);
        REQUIRE(c.composite == Approx(300.0 / 7.0));
    }

    SECTION("Disabled pillar carries no weight and is not listed") {
        config.pillars.float_size.enabled = false;
        Aggregator aggregator(config);
        auto c = aggregator.aggregate("ABCD", full_set("ABCD", 1, {80, 80, 80, 80, 0}), 1);
        REQUIRE(c.composite == Approx(80.0));
        REQUIRE(c.passed_pillars.size() == 4);
    }

    SECTION("All-zero weights are a configuration error") {
        config.weights = PillarWeights{0, 0, 0, 0, 0};
        REQUIRE_THROWS_AS(Aggregator(config), ConfigError);
    }

    SECTION("Weights summing past the double range are a configuration error") {
        config.weights = PillarWeights{1e308, 1e308, 1e308, 1e308, 1e308};
        REQUIRE_THROWS_AS(Aggregator(config), ConfigError);
    }

    SECTION("Very large weights still give a finite composite") {
        config.weights = PillarWeights{1e307, 1e307, 1e307, 1e307, 1e307};
        Aggregator aggregator(config);
        auto c = aggregator.aggregate("ABCD", full_set("ABCD", 1, {100, 100, 100, 100, 100}), 1);
        REQUIRE(std::isfinite(c.composite));
        REQUIRE(c.composite == Approx(100.0));
    }
}

TEST_CASE("Ranking is total and deterministic", "[aggregator]") {
    auto entry = [](const std::string& symbol, double composite) {
        CompositeScore c;
        c.symbol = symbol;
        c.composite = composite;
        return c;
    };

    std::vector<CompositeScore> entries = {
        entry("MMMM", 55.0), entry("BBBB", 70.0), entry("AAAA", 55.0), entry("ZZZZ", 90.0)
    };
    Aggregator::rank(entries);

    REQUIRE(entries[0].symbol == "ZZZZ");
    REQUIRE(entries[1].symbol == "BBBB");
    REQUIRE(entries[2].symbol == "AAAA");
    REQUIRE(entries[3].symbol == "MMMM");
    for (size_t i = 0; i < entries.size(); i++) {
        REQUIRE(entries[i].rank == static_cast<int>(i + 1));
    }

    REQUIRE(Aggregator::ranks_before(entry("AAAA", 55.0), entry("MMMM", 55.0)));
    REQUIRE_FALSE(Aggregator::ranks_before(entry("MMMM", 55.0), entry("AAAA", 55.0)));

    SECTION("NaN composites sort last by symbol") {
        double nan = std::numeric_limits<double>::quiet_NaN();
        std::vector<CompositeScore> mixed = {
            entry("NNNN", nan), entry("BBBB", 10.0), entry("CCCC", nan), entry("AAAA", 0.0)
        };
        Aggregator::rank(mixed);

        REQUIRE(mixed[0].symbol == "BBBB");
        REQUIRE(mixed[1].symbol == "AAAA");
        REQUIRE(mixed[2].symbol == "CCCC");
        REQUIRE(mixed[3].symbol == "NNNN");
        REQUIRE_FALSE(Aggregator::ranks_before(entry("NNNN", nan), entry("AAAA", 0.0)));
        REQUIRE(Aggregator::ranks_before(entry("AAAA", 0.0), entry("NNNN", nan)));
    }
}
