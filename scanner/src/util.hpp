#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();

    // Splits on `sep`, trims whitespace, drops empty items
    std::vector<std::string> split_list(const std::string& text, char sep = ',');
    std::string trim(const std::string& text);
    std::string to_upper(std::string text);

    std::string join(const std::vector<std::string>& items, const std::string& sep);

    // Hides the password of a libpq URI or key/value DSN for logging
    std::string redact_dsn(const std::string& dsn);
}
