#pragma once

#include "scanner_config.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct Config {
    // Provider
    std::string provider = "redis";  // or "replay"
    std::string redis_url;
    std::string stream_ticks;
    std::string stream_scans;
    std::string replay_file;
    int replay_batch = 500;

    // Postgres (optional, scan history)
    std::string pg_dsn;

    // Scan engine
    ScannerConfig scanner;
    std::vector<std::string> universe;
    std::string reference_file;  // fundamentals and news, optional
    int top_n_log = 10;

    // HTTP
    std::string listen_addr;
    int listen_port = 8090;

    // Service
    std::string service_name;
    std::string log_level;
    std::string config_file;

    // Env wins over the JSON file named by SCANNER_CONFIG_FILE, which wins
    // over built-in defaults. Throws ConfigError on an unreadable file.
    static Config from_env();

    // Overlays pillar bands, weights, windows and universe from a document
    void apply_json(const nlohmann::json& doc);
    void load_file(const std::string& path);

    void validate() const;

private:
    void overlay(const nlohmann::json& doc);

    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static size_t get_env_size(const char* name, size_t default_val);
    static double get_env_double(const char* name, double default_val);
};
