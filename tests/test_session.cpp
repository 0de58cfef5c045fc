#include <catch2/catch_test_macros.hpp>
#include "session.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace parley;

static SessionConfig make_test_config() {
    SessionConfig cfg;
    cfg.timeout_seconds = 100;
    cfg.idle_after_seconds = 10;
    return cfg;
}

// ── get_or_create / get ──────────────────────────────────────────

TEST_CASE("SessionRegistry: get_or_create creates once", "[session]") {
    SessionRegistry reg(make_test_config());

    Session s1 = reg.get_or_create("s1", 1000);
    REQUIRE(s1.id == "s1");
    REQUIRE(s1.created_at == 1000);
    REQUIRE(s1.last_active_at == 1000);
    REQUIRE(s1.token_count_estimate == 0);
    REQUIRE_FALSE(s1.active_persona_id.has_value());

    Session again = reg.get_or_create("s1", 1050);
    REQUIRE(again.created_at == 1000);
    REQUIRE(again.last_active_at == 1050);
    REQUIRE(reg.active_count() == 1);
}

TEST_CASE("SessionRegistry: last_active_at never precedes created_at", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);

    Session s = reg.get_or_create("s1", 900);
    REQUIRE(s.last_active_at >= s.created_at);
    REQUIRE(s.last_active_at == 1000);
}

TEST_CASE("SessionRegistry: get on unknown id is absent", "[session]") {
    SessionRegistry reg(make_test_config());
    REQUIRE_FALSE(reg.get("missing", 1000).has_value());
    REQUIRE(reg.active_count() == 0);
}

TEST_CASE("SessionRegistry: get refreshes activity", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);

    auto s = reg.get("s1", 1080);
    REQUIRE(s.has_value());
    REQUIRE(s->last_active_at == 1080);

    // Touched within the window, so it survives a sweep at 1150
    REQUIRE(reg.sweep(1150).empty());
    REQUIRE(reg.get("s1", 1150).has_value());
}

TEST_CASE("SessionRegistry: status reflects idle time", "[session]") {
    SessionRegistry reg(make_test_config());
    Session fresh = reg.get_or_create("s1", 1000);
    REQUIRE(fresh.status == SessionStatus::Active);
    REQUIRE(status_to_string(fresh.status) == "active");

    auto within = reg.snapshot_sessions(1010);
    REQUIRE(within.size() == 1);
    REQUIRE(within[0].status == SessionStatus::Active);

    auto later = reg.snapshot_sessions(1011);
    REQUIRE(later[0].status == SessionStatus::Idle);
    REQUIRE(status_to_string(later[0].status) == "idle");

    // Snapshots are not activity
    REQUIRE(later[0].last_active_at == 1000);
    REQUIRE(reg.sweep(1101) == std::vector<std::string>{"s1"});
}

// ── Mutation ─────────────────────────────────────────────────────

TEST_CASE("SessionRegistry: add_tokens accumulates", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);

    REQUIRE(reg.add_tokens("s1", 10));
    REQUIRE(reg.add_tokens("s1", 5));
    REQUIRE(reg.get("s1", 1000)->token_count_estimate == 15);
    REQUIRE_FALSE(reg.add_tokens("missing", 5));
}

TEST_CASE("SessionRegistry: set_persona sets and clears", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);

    REQUIRE(reg.set_persona("s1", std::string("tutor")));
    REQUIRE(reg.get("s1", 1000)->active_persona_id == std::string("tutor"));

    REQUIRE(reg.set_persona("s1", std::nullopt));
    REQUIRE_FALSE(reg.get("s1", 1000)->active_persona_id.has_value());
    REQUIRE_FALSE(reg.set_persona("missing", std::string("tutor")));
}

TEST_CASE("SessionRegistry: end removes immediately", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);

    REQUIRE(reg.end("s1"));
    REQUIRE_FALSE(reg.get("s1", 1000).has_value());
    REQUIRE_FALSE(reg.end("s1"));
    REQUIRE(reg.active_count() == 0);
}

// ── Sweep ────────────────────────────────────────────────────────

TEST_CASE("SessionRegistry: sweep expires sessions idle beyond timeout", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("old", 1000);
    reg.get_or_create("recent", 1050);

    // Exactly at the timeout is not yet expired
    REQUIRE(reg.sweep(1100).empty());

    auto removed = reg.sweep(1101);
    REQUIRE(removed == std::vector<std::string>{"old"});
    REQUIRE_FALSE(reg.get("old", 1101).has_value());
    REQUIRE(reg.active_count() == 1);
}

TEST_CASE("SessionRegistry: expired id is recreated fresh", "[session]") {
    SessionRegistry reg(make_test_config());
    reg.get_or_create("s1", 1000);
    reg.add_tokens("s1", 50);
    reg.sweep(2000);

    Session s = reg.get_or_create("s1", 2000);
    REQUIRE(s.created_at == 2000);
    REQUIRE(s.token_count_estimate == 0);
}

// ── Events ───────────────────────────────────────────────────────

TEST_CASE("SessionRegistry: publishes lifecycle events", "[session]") {
    SessionRegistry reg(make_test_config());
    EventBus bus;
    reg.set_event_bus(&bus);

    std::vector<std::string> created;
    std::vector<std::string> ended;
    std::vector<std::pair<std::string, uint64_t>> expired;

    subscribe<SessionCreatedEvent>(bus, [&](const SessionCreatedEvent& ev) {
        created.push_back(ev.session_id);
    });
    subscribe<SessionEndedEvent>(bus, [&](const SessionEndedEvent& ev) {
        ended.push_back(ev.session_id);
    });
    subscribe<SessionExpiredEvent>(bus, [&](const SessionExpiredEvent& ev) {
        expired.emplace_back(ev.session_id, ev.last_active_at);
    });

    reg.get_or_create("a", 1000);
    reg.get_or_create("a", 1001);
    reg.get_or_create("b", 1000);
    reg.end("b");
    reg.sweep(5000);

    REQUIRE(created == std::vector<std::string>{"a", "b"});
    REQUIRE(ended == std::vector<std::string>{"b"});
    REQUIRE(expired.size() == 1);
    REQUIRE(expired[0].first == "a");
    REQUIRE(expired[0].second == 1001);
}

TEST_CASE("SessionRegistry: expiry handler may call back into registry", "[session]") {
    SessionRegistry reg(make_test_config());
    EventBus bus;
    reg.set_event_bus(&bus);

    bool gone = false;
    subscribe<SessionExpiredEvent>(bus, [&](const SessionExpiredEvent& ev) {
        gone = !reg.get(ev.session_id, 5000).has_value();
        reg.get_or_create("replacement", 5000);
    });

    reg.get_or_create("a", 1000);
    reg.sweep(5000);
    REQUIRE(gone);
    REQUIRE(reg.list_sessions() == std::vector<std::string>{"replacement"});
}

// ── Concurrency ──────────────────────────────────────────────────

TEST_CASE("SessionRegistry: concurrent get_or_create yields one session", "[session]") {
    SessionRegistry reg(make_test_config());
    EventBus bus;
    reg.set_event_bus(&bus);

    std::atomic<int> created{0};
    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) { created++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&reg]() {
            for (int i = 0; i < 200; ++i) {
                reg.get_or_create("shared", 1000);
                reg.add_tokens("shared", 1);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(created.load() == 1);
    REQUIRE(reg.active_count() == 1);
    REQUIRE(reg.get("shared", 1000)->token_count_estimate == 1600);
}

TEST_CASE("SessionRegistry: sweep runs alongside turns", "[session]") {
    SessionRegistry reg(make_test_config());
    for (int i = 0; i < 50; ++i) reg.get_or_create("idle" + std::to_string(i), 1000);

    std::thread turns([&reg]() {
        for (int i = 0; i < 500; ++i) {
            reg.get_or_create("busy" + std::to_string(i % 10), 2000);
        }
    });
    std::thread sweeper([&reg]() {
        for (int i = 0; i < 20; ++i) reg.sweep(2000);
    });
    turns.join();
    sweeper.join();

    auto ids = reg.list_sessions();
    REQUIRE(ids.size() == 10);
    REQUIRE(std::all_of(ids.begin(), ids.end(),
                        [](const std::string& id) { return id.rfind("busy", 0) == 0; }));
}
