#include "json_codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>

Tick JsonCodec::parse_tick(const nlohmann::json& msg) {
    if (!msg.is_object()) {
        throw InvalidTickError(TickRejectReason::Malformed, "tick message is not an object");
    }

    Tick tick;
    try {
        tick.symbol = util::to_upper(msg.at("symbol").get<std::string>());
        tick.ts_ms = msg.at("ts_ms").get<int64_t>();
        tick.price = msg.at("price").get<double>();
        tick.volume = msg.value("volume", 0.0);
        tick.seq = msg.value("seq", uint64_t{0});

        if (msg.contains("float_shares") && !msg["float_shares"].is_null()) {
            tick.float_shares = msg["float_shares"].get<int64_t>();
        }

        if (msg.contains("catalyst") && !msg["catalyst"].is_null()) {
            const auto& c = msg["catalyst"];
            CatalystTag tag;
            tag.category = c.at("category").get<std::string>();
            tag.headline = c.value("headline", "");
            tag.ts_ms = c.value("ts_ms", int64_t{0});
            tick.catalyst = tag;
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidTickError(TickRejectReason::Malformed,
                               fmt::format("malformed tick: {}", e.what()));
    }
    return tick;
}

Tick JsonCodec::parse_tick_text(const std::string& text) {
    nlohmann::json msg = nlohmann::json::parse(text, nullptr, false);
    if (msg.is_discarded()) {
        throw InvalidTickError(TickRejectReason::Malformed, "tick is not valid JSON");
    }
    return parse_tick(msg);
}

nlohmann::json JsonCodec::to_json(const Tick& tick) {
    nlohmann::json j = {
        {"symbol", tick.symbol},
        {"ts_ms", tick.ts_ms},
        {"price", tick.price},
        {"volume", tick.volume},
        {"seq", tick.seq}
    };
    if (tick.float_shares) {
        j["float_shares"] = *tick.float_shares;
    }
    if (tick.catalyst) {
        j["catalyst"] = {
            {"category", tick.catalyst->category},
            {"headline", tick.catalyst->headline},
            {"ts_ms", tick.catalyst->ts_ms}
        };
    }
    return j;
}

nlohmann::json JsonCodec::to_json(const PillarScore& score) {
    return {
        {"pillar", pillar_name(score.pillar)},
        {"version", score.version},
        {"score", score.score},
        {"value", score.value},
        {"passed", score.passed},
        {"insufficient_data", score.insufficient_data},
        {"reason", score.reason}
    };
}

nlohmann::json JsonCodec::to_json(const CompositeScore& entry) {
    nlohmann::json pillars = nlohmann::json::object();
    for (const auto& score : entry.pillars) {
        pillars[pillar_name(score.pillar)] = to_json(score);
    }

    nlohmann::json j = {
        {"rank", entry.rank},
        {"symbol", entry.symbol},
        {"version", entry.version},
        {"composite", entry.composite},
        {"passed_all", entry.passed_all},
        {"passed_pillars", entry.passed_pillars},
        {"failed_pillars", entry.failed_pillars},
        {"last_price", entry.last_price},
        {"pct_change", entry.pct_change},
        {"relative_volume", entry.relative_volume},
        {"catalyst", entry.catalyst},
        {"pillars", pillars}
    };
    j["float_shares"] = entry.float_shares ? nlohmann::json(*entry.float_shares) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json JsonCodec::to_json(const ScanResult& result) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : result.entries) {
        entries.push_back(to_json(entry));
    }

    return {
        {"cycle_id", result.cycle_id},
        {"started_at_ms", result.started_at_ms},
        {"duration_us", result.duration_us},
        {"status", to_string(result.status)},
        {"degraded_reasons", result.degraded_reasons},
        {"skipped_symbols", result.skipped_symbols},
        {"failed_symbols", result.failed_symbols},
        {"ticks_ingested", result.ticks_ingested},
        {"ticks_rejected", result.ticks_rejected},
        {"cache_hits", result.cache_hits},
        {"cache_misses", result.cache_misses},
        {"entries", entries}
    };
}
