#include "pg_store.hpp"
#include "json_codec.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS scan_cycles (
                id BIGSERIAL PRIMARY KEY,
                cycle_id BIGINT NOT NULL,
                started_at TIMESTAMPTZ NOT NULL,
                duration_us BIGINT NOT NULL,
                status TEXT NOT NULL CHECK (status IN ('ok','degraded')),
                degraded_reasons TEXT,
                skipped_symbols TEXT,
                failed_symbols TEXT,
                ticks_ingested INT,
                ticks_rejected INT,
                cache_hits BIGINT,
                cache_misses BIGINT
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS scan_entries (
                scan_id BIGINT NOT NULL REFERENCES scan_cycles(id) ON DELETE CASCADE,
                rank INT NOT NULL,
                symbol TEXT NOT NULL,
                composite NUMERIC NOT NULL,
                passed_all BOOLEAN NOT NULL,
                last_price NUMERIC,
                pct_change NUMERIC,
                relative_volume NUMERIC,
                float_shares BIGINT,
                catalyst TEXT,
                pillars JSONB,
                PRIMARY KEY (scan_id, rank)
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_scan_entries_symbol ON scan_entries(symbol)");

        txn.commit();
        spdlog::info("Database schema initialized");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

void PostgresStore::record_scan(const ScanResult& result) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto inserted = txn.exec_params(
            "INSERT INTO scan_cycles "
            "(cycle_id, started_at, duration_us, status, degraded_reasons, skipped_symbols, "
            "failed_symbols, ticks_ingested, ticks_rejected, cache_hits, cache_misses) "
            "VALUES ($1, to_timestamp($2 / 1000.0), $3, $4, $5, $6, $7, $8, $9, $10, $11) "
            "RETURNING id",
            static_cast<int64_t>(result.cycle_id),
            result.started_at_ms,
            result.duration_us,
            std::string(to_string(result.status)),
            util::join(result.degraded_reasons, ","),
            util::join(result.skipped_symbols, ","),
            util::join(result.failed_symbols, ","),
            static_cast<int>(result.ticks_ingested),
            static_cast<int>(result.ticks_rejected),
            static_cast<int64_t>(result.cache_hits),
            static_cast<int64_t>(result.cache_misses)
        );
        auto scan_id = inserted[0][0].as<int64_t>();

        for (const auto& entry : result.entries) {
            auto pillars = JsonCodec::to_json(entry)["pillars"].dump();
            txn.exec_params(
                "INSERT INTO scan_entries "
                "(scan_id, rank, symbol, composite, passed_all, last_price, pct_change, "
                "relative_volume, float_shares, catalyst, pillars) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb)",
                scan_id,
                entry.rank,
                entry.symbol,
                entry.composite,
                entry.passed_all,
                entry.last_price,
                entry.pct_change,
                entry.relative_volume,
                entry.float_shares,
                entry.catalyst,
                pillars
            );
        }

        txn.commit();
        spdlog::debug("Recorded cycle {} ({} entries) as scan {}",
                      result.cycle_id, result.entries.size(), scan_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to record cycle {}: {}", result.cycle_id, e.what());
    }
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
