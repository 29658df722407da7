#pragma once

#include "symbol_store.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

struct ReferenceSet {
    std::map<std::string, ReferenceData> symbols;
    size_t skipped_rows = 0;
};

// Reference file shape:
//   {"fundamentals":[{"symbol":"ABCD","float_shares":8500000,"baseline_volume":1200}],
//    "catalysts":[{"symbol":"ABCD","category":"fda","headline":"...","ts_ms":...}]}
// Both arrays are optional. baseline_volume is the historical mean volume per tick.
class ReferenceLoader {
public:
    // Throws ConfigError when the file cannot be read or is not an object.
    // Rows that do not decode are skipped and counted.
    static ReferenceSet load_file(const std::string& path);
    static ReferenceSet parse(const nlohmann::json& doc);

private:
    static void read_fundamentals(const nlohmann::json& rows, ReferenceSet& out);
    static void read_catalysts(const nlohmann::json& rows, ReferenceSet& out);
};
