#pragma once
#include "types.hpp"
#include <string>
#include <pqxx/pqxx>

// Scan history: one scan_cycles row per emitted cycle, one scan_entries row
// per ranked symbol.
class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);
    void init_schema();
    void record_scan(const ScanResult& result);
    bool ping();

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
