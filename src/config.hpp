#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace parley {

struct SessionConfig {
    uint32_t timeout_seconds = 1800;
    uint32_t sweep_interval_seconds = 60;
    uint32_t idle_after_seconds = 300;   // snapshot reports "idle" past this
};

struct MemoryConfig {
    uint32_t capacity = 1000;            // active items per session
    uint32_t retrieve_limit = 5;
};

struct HistoryConfig {
    std::string data_dir;                // empty = ~/.parley/data
    uint32_t archive_search_days = 7;
    bool flush_every_turn = true;
};

struct Config {
    SessionConfig session;
    MemoryConfig memory;
    HistoryConfig history;

    // Load from ~/.parley/config.json + env vars
    static Config load();

    // Parse a config document. Missing or wrong-typed fields keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved data directory (history.data_dir or ~/.parley/data)
    std::string data_dir() const;
};

} // namespace parley
