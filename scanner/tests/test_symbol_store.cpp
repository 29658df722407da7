#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/symbol_store.hpp"
#include "fake_provider.hpp"

TEST_CASE("Symbol state ingestion", "[symbol_store]") {
    ScannerConfig config;
    config.price_window = 4;
    config.volume_window = 4;
    SymbolStateStore store(config);

    SECTION("Version counts accepted ticks") {
        for (int i = 1; i <= 10; i++) {
            store.ingest(make_tick("ABCD", 1000 + i, 5.0 + i * 0.1));
            REQUIRE(store.version("ABCD") == static_cast<uint64_t>(i));
        }
        REQUIRE(store.tick_count("ABCD") == 10);
    }

    SECTION("Windows keep only the newest points") {
        for (int i = 1; i <= 6; i++) {
            store.ingest(make_tick("ABCD", 1000 + i, static_cast<double>(i)));
        }
        auto snap = store.snapshot("ABCD");
        REQUIRE(snap->prices.size() == 4);
        REQUIRE(snap->prices.front().price == 3.0);
        REQUIRE(snap->last_price() == 6.0);
        REQUIRE(snap->volumes.size() == 4);
        REQUIRE(snap->reference_price == 1.0);
    }

    SECTION("Equal timestamps are accepted") {
        store.ingest(make_tick("ABCD", 1000, 5.0));
        store.ingest(make_tick("ABCD", 1000, 5.1));
        REQUIRE(store.version("ABCD") == 2);
    }

    SECTION("Unknown symbol has no snapshot") {
        REQUIRE(store.snapshot("NOPE") == nullptr);
        REQUIRE(store.version("NOPE") == 0);
    }
}

TEST_CASE("Invalid ticks leave state untouched", "[symbol_store]") {
    ScannerConfig config;
    SymbolStateStore store(config);
    store.ingest(make_tick("ABCD", 2000, 5.0, 100.0, 7));

    auto expect_reject = [&](const Tick& tick, TickRejectReason reason) {
        bool thrown = false;
        try {
            store.ingest(tick);
        } catch (const InvalidTickError& e) {
            thrown = true;
            REQUIRE(e.reason() == reason);
        }
        REQUIRE(thrown);
        REQUIRE(store.version("ABCD") == 1);
    };

    SECTION("Out of order") {
        expect_reject(make_tick("ABCD", 1999, 5.0), TickRejectReason::OutOfOrder);
    }

    SECTION("Replayed sequence number") {
        expect_reject(make_tick("ABCD", 2001, 5.0, 100.0, 7), TickRejectReason::Duplicate);
        expect_reject(make_tick("ABCD", 2001, 5.0, 100.0, 3), TickRejectReason::Duplicate);
    }

    SECTION("Bad price and volume") {
        expect_reject(make_tick("ABCD", 2001, 0.0), TickRejectReason::InvalidPrice);
        expect_reject(make_tick("ABCD", 2001, -1.0), TickRejectReason::InvalidPrice);
        expect_reject(make_tick("ABCD", 2001, 5.0, -10.0), TickRejectReason::InvalidVolume);
    }

    SECTION("Empty symbol") {
        REQUIRE_THROWS_AS(store.ingest(make_tick("", 2001, 5.0)), InvalidTickError);
        REQUIRE(store.size() == 1);
    }

    SECTION("Next valid tick still applies") {
        REQUIRE_THROWS_AS(store.ingest(make_tick("ABCD", 1500, 5.0)), InvalidTickError);
        store.ingest(make_tick("ABCD", 2500, 5.5, 100.0, 8));
        REQUIRE(store.version("ABCD") == 2);
    }
}

TEST_CASE("Snapshots are immutable and catalyst retention follows the symbol clock", "[symbol_store]") {
    ScannerConfig config;
    config.pillars.catalyst.retention_ms = 10000;
    SymbolStateStore store(config);

    Tick t = make_tick("ABCD", 1000, 5.0);
    t.catalyst = CatalystTag{"FDA", "Phase 3 approval", 0};
    t.float_shares = 8000000;
    store.ingest(t);

    auto first = store.snapshot("ABCD");
    REQUIRE(first->catalysts.size() == 1);
    REQUIRE(first->catalysts[0].category == "fda");
    REQUIRE(first->catalysts[0].ts_ms == 1000);
    REQUIRE(*first->float_shares == 8000000);

    SECTION("Snapshot is reused until the next write") {
        REQUIRE(store.snapshot("ABCD") == first);
        store.ingest(make_tick("ABCD", 2000, 5.1));
        auto second = store.snapshot("ABCD");
        REQUIRE(second != first);
        REQUIRE(first->version == 1);
        REQUIRE(second->version == 2);
    }

    SECTION("Tags past retention drop out") {
        store.ingest(make_tick("ABCD", 11000, 5.1));
        REQUIRE(store.snapshot("ABCD")->catalysts.size() == 1);
        store.ingest(make_tick("ABCD", 11001, 5.2));
        REQUIRE(store.snapshot("ABCD")->catalysts.empty());
    }

    SECTION("Tag stamped in the future is pulled back to the tick time") {
        Tick u = make_tick("ABCD", 2000, 5.1);
        u.catalyst = CatalystTag{"earnings", "Beat and raise", 999999999};
        store.ingest(u);
        auto snap = store.snapshot("ABCD");
        REQUIRE(snap->newest_catalyst()->ts_ms == 2000);

        store.ingest(make_tick("ABCD", 12001, 5.2));
        REQUIRE(store.snapshot("ABCD")->catalysts.empty());
    }

    SECTION("Zero float update is ignored") {
        Tick u = make_tick("ABCD", 2000, 5.1);
        u.float_shares = 0;
        store.ingest(u);
        REQUIRE(*store.snapshot("ABCD")->float_shares == 8000000);
    }

    SECTION("Remove forgets the symbol") {
        REQUIRE(store.remove("ABCD"));
        REQUIRE(store.active_symbols().empty());
        REQUIRE(first->symbol == "ABCD");
    }
}

TEST_CASE("Reference data merges into symbol state", "[symbol_store]") {
    ScannerConfig config;
    config.pillars.catalyst.retention_ms = 10000;
    SymbolStateStore store(config);

    ReferenceData ref;
    ref.float_shares = 6000000;
    ref.baseline_volume = 250.0;
    ref.catalysts.push_back(CatalystTag{"Earnings", "Record quarter", 0});

    SECTION("Held until the symbol is first seen") {
        store.merge_reference("ABCD", ref);
        REQUIRE(store.has_reference("ABCD"));
        REQUIRE(store.snapshot("ABCD") == nullptr);
        REQUIRE(store.size() == 0);

        store.ingest(make_tick("ABCD", 5000, 4.0));
        auto snap = store.snapshot("ABCD");
        REQUIRE(snap->version == 1);
        REQUIRE(*snap->float_shares == 6000000);
        REQUIRE(*snap->baseline_volume == 250.0);
        REQUIRE(snap->catalysts.size() == 1);
        REQUIRE(snap->catalysts[0].category == "earnings");
        REQUIRE(snap->catalysts[0].ts_ms == 5000);
    }

    SECTION("Applied at once to a live symbol") {
        store.ingest(make_tick("ABCD", 5000, 4.0));
        auto before = store.snapshot("ABCD");
        REQUIRE_FALSE(before->float_shares);

        store.merge_reference("ABCD", ref);
        auto after = store.snapshot("ABCD");
        REQUIRE(after->version == 2);
        REQUIRE(*after->float_shares == 6000000);
        REQUIRE(after->catalysts.size() == 1);
        REQUIRE_FALSE(before->float_shares);
    }

    SECTION("Survives removal of the symbol") {
        store.merge_reference("ABCD", ref);
        store.ingest(make_tick("ABCD", 5000, 4.0));
        REQUIRE(store.remove("ABCD"));

        store.ingest(make_tick("ABCD", 9000, 4.2));
        REQUIRE(*store.snapshot("ABCD")->float_shares == 6000000);
    }

    SECTION("Float from a tick overrides the reference value") {
        store.merge_reference("ABCD", ref);
        Tick t = make_tick("ABCD", 5000, 4.0);
        t.float_shares = 7000000;
        store.ingest(t);
        store.ingest(make_tick("ABCD", 6000, 4.1));
        REQUIRE(*store.snapshot("ABCD")->float_shares == 7000000);
    }
}
