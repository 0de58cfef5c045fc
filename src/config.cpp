#include "config.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace parley {

nlohmann::json Config::defaults_json() {
    return {
        {"session", {
            {"timeout_seconds", 1800},
            {"sweep_interval_seconds", 60},
            {"idle_after_seconds", 300}
        }},
        {"memory", {
            {"capacity", 1000},
            {"retrieve_limit", 5}
        }},
        {"history", {
            {"data_dir", ""},
            {"archive_search_days", 7},
            {"flush_every_turn", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Out-of-range values keep the default
static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return;
    uint64_t v = obj[key].get<uint64_t>();
    if (v > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << v << "\n";
        return;
    }
    out = static_cast<uint32_t>(v);
}

static bool parse_u32_env(const char* v, uint32_t& out) {
    // strtoull accepts a sign and wraps negatives
    if (*v < '0' || *v > '9') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(v, &end, 10);
    if (end == v || *end != '\0' || errno == ERANGE) return false;
    if (n > std::numeric_limits<uint32_t>::max()) return false;
    out = static_cast<uint32_t>(n);
    return true;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read_u32(s, "timeout_seconds", cfg.session.timeout_seconds);
        read_u32(s, "sweep_interval_seconds", cfg.session.sweep_interval_seconds);
        read_u32(s, "idle_after_seconds", cfg.session.idle_after_seconds);
    }

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        read_u32(m, "capacity", cfg.memory.capacity);
        read_u32(m, "retrieve_limit", cfg.memory.retrieve_limit);
    }

    if (j.contains("history") && j["history"].is_object()) {
        auto& h = j["history"];
        if (h.contains("data_dir") && h["data_dir"].is_string())
            cfg.history.data_dir = h["data_dir"].get<std::string>();
        read_u32(h, "archive_search_days", cfg.history.archive_search_days);
        if (h.contains("flush_every_turn") && h["flush_every_turn"].is_boolean())
            cfg.history.flush_every_turn = h["flush_every_turn"].get<bool>();
    }

    // A zero interval would spin the sweep thread
    if (cfg.session.sweep_interval_seconds == 0) cfg.session.sweep_interval_seconds = 1;

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.parley/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("PARLEY_DATA_DIR"))
        cfg.history.data_dir = v;
    if (const char* v = std::getenv("PARLEY_SESSION_TIMEOUT")) {
        if (!parse_u32_env(v, cfg.session.timeout_seconds)) {
            std::cerr << "[config] Ignoring invalid PARLEY_SESSION_TIMEOUT: " << v << "\n";
        }
    }

    return cfg;
}

std::string Config::data_dir() const {
    if (!history.data_dir.empty()) return expand_home(history.data_dir);
    return expand_home("~/.parley/data");
}

} // namespace parley
