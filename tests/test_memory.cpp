#include <catch2/catch_test_macros.hpp>
#include "memory.hpp"
#include "config.hpp"

using namespace parley;

// ── Type conversions ─────────────────────────────────────────

TEST_CASE("memory_type_to_string returns correct strings", "[memory]") {
    REQUIRE(memory_type_to_string(MemoryType::Preference) == "preference");
    REQUIRE(memory_type_to_string(MemoryType::Fact) == "fact");
    REQUIRE(memory_type_to_string(MemoryType::Relationship) == "relationship");
    REQUIRE(memory_type_to_string(MemoryType::Event) == "event");
}

TEST_CASE("memory_type_from_string defaults to Event for unknown", "[memory]") {
    REQUIRE(memory_type_from_string("fact") == MemoryType::Fact);
    REQUIRE(memory_type_from_string("relationship") == MemoryType::Relationship);
    REQUIRE(memory_type_from_string("invalid") == MemoryType::Event);
    REQUIRE(memory_type_from_string("") == MemoryType::Event);
}

TEST_CASE("clamp_importance keeps values within 1..10", "[memory]") {
    REQUIRE(clamp_importance(-3) == 1);
    REQUIRE(clamp_importance(0) == 1);
    REQUIRE(clamp_importance(7) == 7);
    REQUIRE(clamp_importance(11) == 10);
}

// ── Summary / enrich ─────────────────────────────────────────

TEST_CASE("build_memory_summary: one bullet per item", "[memory]") {
    MemoryItem a;
    a.content = "我喜欢打篮球";
    MemoryItem b;
    b.content = "I am a nurse";

    REQUIRE(build_memory_summary({a, b}) == "- 我喜欢打篮球\n- I am a nurse\n");
    REQUIRE(build_memory_summary({}).empty());
}

TEST_CASE("memory_enrich returns original message when nothing retrieved", "[memory]") {
    RetrievalResult empty;
    REQUIRE(empty.empty());
    REQUIRE(memory_enrich(empty, "hello") == "hello");
}

TEST_CASE("memory_enrich wraps the summary in a context block", "[memory]") {
    RetrievalResult result;
    MemoryItem item;
    item.content = "User prefers tea";
    result.items.push_back(item);
    result.summary_text = build_memory_summary(result.items);

    REQUIRE(memory_enrich(result, "What should I drink?") ==
            "[Memory context]\n- User prefers tea\n[/Memory context]\n\nWhat should I drink?");
}

// ── Factory ──────────────────────────────────────────────────

TEST_CASE("create_memory: heuristic backend with configured limits", "[memory]") {
    Config cfg;
    cfg.memory.retrieve_limit = 2;
    auto mem = create_memory(cfg);

    REQUIRE(mem != nullptr);
    REQUIRE(mem->backend_name() == "heuristic");

    mem->update("s1", "I like green tea. I like black coffee. I like fresh juice.");
    REQUIRE(mem->stats("s1").active == 3);
    REQUIRE(mem->retrieve("s1", "drinks").items.size() == 2);
}
