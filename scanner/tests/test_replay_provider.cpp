#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/replay_provider.hpp"
#include <filesystem>
#include <fstream>

namespace {

Tick tick(const std::string& symbol, int64_t ts, double price) {
    Tick t;
    t.symbol = symbol;
    t.ts_ms = ts;
    t.price = price;
    return t;
}

std::chrono::steady_clock::time_point soon() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(1);
}

}

TEST_CASE("Replay provider batches ticks", "[replay_provider]") {
    ReplayProvider provider({tick("A", 1, 1.0), tick("B", 2, 2.0), tick("A", 3, 3.0),
                             tick("C", 4, 4.0), tick("A", 5, 5.0)}, 2);
    REQUIRE(provider.is_connected());

    SECTION("Batch size bounds each poll") {
        REQUIRE(provider.poll(soon()).size() == 2);
        REQUIRE(provider.poll(soon()).size() == 2);
        REQUIRE(provider.poll(soon()).size() == 1);
        REQUIRE(provider.poll(soon()).empty());
        REQUIRE(provider.remaining() == 0);
    }

    SECTION("Expired deadline returns nothing") {
        auto past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
        REQUIRE(provider.poll(past).empty());
        REQUIRE(provider.remaining() == 5);
    }

    SECTION("Subscriptions filter symbols") {
        provider.subscribe({"A", "C"});
        provider.unsubscribe({"C"});
        std::vector<Tick> all;
        for (int i = 0; i < 3; i++) {
            auto batch = provider.poll(soon());
            all.insert(all.end(), batch.begin(), batch.end());
        }
        REQUIRE(all.size() == 3);
        for (const auto& t : all) {
            REQUIRE(t.symbol == "A");
        }
    }
}

TEST_CASE("Replay provider reads JSON lines", "[replay_provider]") {
    auto path = std::filesystem::temp_directory_path() / "pillarscan_replay_test.jsonl";
    {
        std::ofstream out(path);
        out << R"({"symbol":"abcd","ts_ms":1000,"price":5.0,"volume":100})" << "\n";
        out << "\n";
        out << "garbage line\n";
        out << R"({"symbol":"ABCD","ts_ms":2000,"price":5.2,"volume":300})" << "\n";
    }

    ReplayProvider provider(path.string(), 100);
    REQUIRE(provider.remaining() == 2);
    REQUIRE(provider.skipped_lines() == 1);
    REQUIRE(provider.malformed_messages() == 1);

    auto ticks = provider.poll(soon());
    REQUIRE(ticks.size() == 2);
    REQUIRE(ticks[0].symbol == "ABCD");
    REQUIRE(ticks[1].price == 5.2);

    std::filesystem::remove(path);
}

TEST_CASE("Replay provider with a missing file", "[replay_provider]") {
    REQUIRE_THROWS_AS(ReplayProvider("/nonexistent/ticks.jsonl", 10), ProviderUnavailableError);
}
