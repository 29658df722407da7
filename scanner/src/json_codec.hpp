#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Wire shape of a tick message:
//   {"symbol":"ABCD","ts_ms":1700000000000,"price":4.12,"volume":1500,
//    "seq":42,"float_shares":8500000,
//    "catalyst":{"category":"fda","headline":"...","ts_ms":...}}
// seq, float_shares and catalyst are optional.
class JsonCodec {
public:
    // Throws InvalidTickError(Malformed) on missing or mistyped fields.
    // The symbol is upper-cased.
    static Tick parse_tick(const nlohmann::json& msg);
    static Tick parse_tick_text(const std::string& text);

    static nlohmann::json to_json(const Tick& tick);
    static nlohmann::json to_json(const PillarScore& score);
    static nlohmann::json to_json(const CompositeScore& entry);
    static nlohmann::json to_json(const ScanResult& result);
};
