#pragma once
#include "../memory.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace parley {

// Rule-based extraction and scoring used by HeuristicMemoryStore.
// Lengths are counted in code points; case folding is ASCII-only.

constexpr size_t kMinSentenceLength = 10;    // exclusive
constexpr size_t kMinCandidateLength = 5;    // exclusive
constexpr size_t kMaxCandidateLength = 200;  // exclusive
constexpr size_t kLongContentLength = 50;    // exclusive, earns +1 importance
constexpr size_t kMaxKeywords = 5;
constexpr int kBaseImportance = 5;

// Remove <think>...</think> blocks. An unterminated block runs to the end.
std::string strip_reasoning(const std::string& text);

// Split on 。！？.!? and trim each piece. Empty pieces are dropped.
std::vector<std::string> split_sentences(const std::string& text);

// True if the sentence carries a self-reference, preference or emphasis marker.
bool has_extraction_marker(const std::string& sentence);

// Sentences of a turn that qualify as memory candidates, in text order.
std::vector<std::string> extract_candidates(const std::string& text);

// preference, then fact, then relationship, else event
MemoryType classify_memory(const std::string& content);

// Base 5; +2 explicit emphasis, +1 self-reference, +1 long. Clamped to [1, 10].
int score_importance(const std::string& content);

// Up to five distinct tokens longer than one code point, first-seen order.
std::vector<std::string> extract_keywords(const std::string& content);

// Relevance of an item to a query at time `now` (epoch seconds).
int relevance_score(const MemoryItem& item, const std::string& query, uint64_t now);

} // namespace parley
