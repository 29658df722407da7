#include "reference_loader.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>

ReferenceSet ReferenceLoader::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("cannot open reference file {}", path));
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError(fmt::format("reference file {} is not valid JSON", path));
    }

    ReferenceSet set = parse(doc);
    spdlog::info("Loaded reference data for {} symbols from {} ({} rows skipped)",
                 set.symbols.size(), path, set.skipped_rows);
    return set;
}

ReferenceSet ReferenceLoader::parse(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("reference document must be a JSON object");
    }

    ReferenceSet set;
    if (doc.contains("fundamentals")) {
        read_fundamentals(doc.at("fundamentals"), set);
    }
    if (doc.contains("catalysts")) {
        read_catalysts(doc.at("catalysts"), set);
    }
    return set;
}

void ReferenceLoader::read_fundamentals(const nlohmann::json& rows, ReferenceSet& out) {
    if (!rows.is_array()) {
        throw ConfigError("reference 'fundamentals' must be an array");
    }
    for (const auto& row : rows) {
        try {
            std::string symbol = util::to_upper(row.at("symbol").get<std::string>());
            if (symbol.empty()) {
                throw ConfigError("empty symbol");
            }

            std::optional<int64_t> float_shares;
            if (row.contains("float_shares") && !row["float_shares"].is_null()) {
                float_shares = row["float_shares"].get<int64_t>();
            }
            std::optional<double> baseline;
            if (row.contains("baseline_volume") && !row["baseline_volume"].is_null()) {
                baseline = row["baseline_volume"].get<double>();
            }

            auto& data = out.symbols[symbol];
            if (float_shares && *float_shares > 0) data.float_shares = float_shares;
            if (baseline && *baseline > 0.0) data.baseline_volume = baseline;
        } catch (const std::exception& e) {
            out.skipped_rows++;
            spdlog::warn("Skipping fundamentals row {}: {}", row.dump(), e.what());
        }
    }
}

void ReferenceLoader::read_catalysts(const nlohmann::json& rows, ReferenceSet& out) {
    if (!rows.is_array()) {
        throw ConfigError("reference 'catalysts' must be an array");
    }
    for (const auto& row : rows) {
        try {
            std::string symbol = util::to_upper(row.at("symbol").get<std::string>());
            if (symbol.empty()) {
                throw ConfigError("empty symbol");
            }

            CatalystTag tag;
            tag.category = row.at("category").get<std::string>();
            tag.headline = row.value("headline", "");
            tag.ts_ms = row.value("ts_ms", int64_t{0});
            out.symbols[symbol].catalysts.push_back(std::move(tag));
        } catch (const std::exception& e) {
            out.skipped_rows++;
            spdlog::warn("Skipping catalyst row {}: {}", row.dump(), e.what());
        }
    }
}
