#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace parley;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.session.timeout_seconds == 1800);
    REQUIRE(cfg.session.sweep_interval_seconds == 60);
    REQUIRE(cfg.session.idle_after_seconds == 300);
    REQUIRE(cfg.memory.capacity == 1000);
    REQUIRE(cfg.memory.retrieve_limit == 5);
    REQUIRE(cfg.history.data_dir.empty());
    REQUIRE(cfg.history.archive_search_days == 7);
    REQUIRE(cfg.history.flush_every_turn);
}

TEST_CASE("Config::data_dir: explicit dir wins over default", "[config]") {
    Config cfg;
    REQUIRE(cfg.data_dir().find("/.parley/data") != std::string::npos);

    cfg.history.data_dir = "/var/lib/parley";
    REQUIRE(cfg.data_dir() == "/var/lib/parley");
}

// ── Config::from_json ────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "session": { "timeout_seconds": 120, "sweep_interval_seconds": 5, "idle_after_seconds": 30 },
        "memory": { "capacity": 50, "retrieve_limit": 3 },
        "history": { "data_dir": "/srv/chat", "archive_search_days": 2, "flush_every_turn": false }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.session.timeout_seconds == 120);
    REQUIRE(cfg.session.sweep_interval_seconds == 5);
    REQUIRE(cfg.session.idle_after_seconds == 30);
    REQUIRE(cfg.memory.capacity == 50);
    REQUIRE(cfg.memory.retrieve_limit == 3);
    REQUIRE(cfg.history.data_dir == "/srv/chat");
    REQUIRE(cfg.history.archive_search_days == 2);
    REQUIRE_FALSE(cfg.history.flush_every_turn);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "session": { "timeout_seconds": "soon", "idle_after_seconds": -4 },
        "memory": "big",
        "history": { "flush_every_turn": "yes" }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.session.timeout_seconds == 1800);
    REQUIRE(cfg.session.idle_after_seconds == 300);
    REQUIRE(cfg.memory.capacity == 1000);
    REQUIRE(cfg.history.flush_every_turn);
}

TEST_CASE("Config::from_json: values beyond 32 bits keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "session": { "timeout_seconds": 4294967296 },
        "memory": { "capacity": 4294967296, "retrieve_limit": 4294967295 }
    })");

    Config cfg = Config::from_json(j);
    REQUIRE(cfg.session.timeout_seconds == 1800);
    REQUIRE(cfg.memory.capacity == 1000);
    REQUIRE(cfg.memory.retrieve_limit == 4294967295u);
}

TEST_CASE("Config::from_json: zero sweep interval is raised", "[config]") {
    auto j = nlohmann::json::parse(R"({"session": {"sweep_interval_seconds": 0}})");
    REQUIRE(Config::from_json(j).session.sweep_interval_seconds == 1);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "parley_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("PARLEY_DATA_DIR");
        unsetenv("PARLEY_SESSION_TIMEOUT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("PARLEY_DATA_DIR");
        unsetenv("PARLEY_SESSION_TIMEOUT");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.parley/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.parley");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f),
                           std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "session": { "timeout_seconds": 600 },
        "memory": { "capacity": 200 },
        "history": { "data_dir": "/data/parley" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.session.timeout_seconds == 600);
    REQUIRE(cfg.memory.capacity == 200);
    REQUIRE(cfg.data_dir() == "/data/parley");
    // Untouched keys keep defaults
    REQUIRE(cfg.memory.retrieve_limit == 5);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"session": {"timeout_seconds": 600}, "history": {"data_dir": "/from/file"}})");
    setenv("PARLEY_SESSION_TIMEOUT", "90", 1);
    setenv("PARLEY_DATA_DIR", "/from/env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.session.timeout_seconds == 90);
    REQUIRE(cfg.data_dir() == "/from/env");
}

TEST_CASE("Config::load: invalid timeout env var is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("PARLEY_SESSION_TIMEOUT", "ten minutes", 1);
    REQUIRE(Config::load().session.timeout_seconds == 1800);

    setenv("PARLEY_SESSION_TIMEOUT", "4294967296", 1);
    REQUIRE(Config::load().session.timeout_seconds == 1800);

    setenv("PARLEY_SESSION_TIMEOUT", "-1", 1);
    REQUIRE(Config::load().session.timeout_seconds == 1800);
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.session.timeout_seconds == 1800);
    REQUIRE(cfg.memory.capacity == 1000);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["session"]["timeout_seconds"] == 1800);
    REQUIRE(j["memory"]["capacity"] == 1000);
    REQUIRE(j["history"]["archive_search_days"] == 7);
    REQUIRE(j["history"]["flush_every_turn"] == true);
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"memory": {"capacity": 42}})");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.capacity == 42);

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["memory"]["capacity"] == 42);
    REQUIRE(j["memory"]["retrieve_limit"] == 5);
    REQUIRE(j.contains("session"));
    REQUIRE(j.contains("history"));
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["session"]["timeout_seconds"] = 900;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.session.timeout_seconds == 900);
    REQUIRE(g.read_config() == before);
}
