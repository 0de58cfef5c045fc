#include "extractor.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cctype>

namespace parley {

namespace {

const std::vector<std::string> kExtractionMarkers = {
    "我是", "我叫", "我的名字", "我喜欢", "我不喜欢", "我需要", "我想要",
    "重要", "记住", "提醒", "偏好", "习惯", "经常", "总是", "从不",
    "i am", "i'm", "my name is", "i like", "i don't like", "i dislike",
    "i need", "i want", "important", "remember", "remind", "prefer",
    "habit", "usually", "always", "never"
};

const std::vector<std::string> kPreferenceMarkers = {
    "喜欢", "不喜欢", "偏好", "习惯", "like", "prefer", "habit", "hate"
};

const std::vector<std::string> kFactMarkers = {
    "我是", "我叫", "我的", "i am", "i'm", "my "
};

const std::vector<std::string> kRelationshipMarkers = {
    "朋友", "家人", "同事", "friend", "family", "colleague"
};

const std::vector<std::string> kImportantMarkers = {
    "重要", "记住", "important", "remember"
};

const std::vector<std::string> kSelfWords = { "i", "i'm", "my", "me" };

constexpr uint64_t kSecondsPerDay = 86400;

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const std::string& n) {
        return haystack.find(n) != std::string::npos;
    });
}

bool is_terminator(uint32_t cp) {
    return cp == '.' || cp == '!' || cp == '?' ||
           cp == 0x3002 /* 。 */ || cp == 0xFF01 /* ！ */ || cp == 0xFF1F /* ？ */;
}

// Punctuation and symbol blocks dropped from keywords
bool is_wide_punctuation(uint32_t cp) {
    return (cp >= 0x00A0 && cp <= 0x00BF) || cp == 0x00D7 || cp == 0x00F7 ||
           (cp >= 0x2000 && cp <= 0x206F) ||
           (cp >= 0x3000 && cp <= 0x303F) ||
           (cp >= 0xFE30 && cp <= 0xFE6F) ||
           (cp >= 0xFF00 && cp <= 0xFF0F) ||
           (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) ||
           (cp >= 0xFF5B && cp <= 0xFF65) ||
           cp == 0xFFFD;
}

bool has_self_word(const std::string& lower) {
    std::string word;
    auto check = [&word]() {
        return std::find(kSelfWords.begin(), kSelfWords.end(), word) != kSelfWords.end();
    };
    for (char c : lower) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '\'') {
            word += c;
        } else {
            if (!word.empty() && check()) return true;
            word.clear();
        }
    }
    return !word.empty() && check();
}

} // namespace

std::string strip_reasoning(const std::string& text) {
    static const std::string open_tag = "<think>";
    static const std::string close_tag = "</think>";

    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(open_tag, pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        size_t close = text.find(close_tag, open + open_tag.size());
        if (close == std::string::npos) break;
        pos = close + close_tag.size();
    }

    // Stray closing tags carry no content of their own
    size_t stray;
    while ((stray = out.find(close_tag)) != std::string::npos) {
        out.erase(stray, close_tag.size());
    }
    return out;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;
    for (uint32_t cp : utf8_decode(text)) {
        if (is_terminator(cp)) {
            std::string s = trim(current);
            if (!s.empty()) sentences.push_back(std::move(s));
            current.clear();
        } else {
            utf8_append(current, cp);
        }
    }
    std::string s = trim(current);
    if (!s.empty()) sentences.push_back(std::move(s));
    return sentences;
}

bool has_extraction_marker(const std::string& sentence) {
    return contains_any(to_lower(sentence), kExtractionMarkers);
}

std::vector<std::string> extract_candidates(const std::string& text) {
    std::vector<std::string> candidates;
    if (trim(text).empty()) return candidates;

    for (auto& sentence : split_sentences(text)) {
        size_t len = utf8_length(sentence);
        if (len <= kMinSentenceLength || !has_extraction_marker(sentence)) continue;
        if (len <= kMinCandidateLength || len >= kMaxCandidateLength) continue;
        candidates.push_back(std::move(sentence));
    }
    return candidates;
}

MemoryType classify_memory(const std::string& content) {
    std::string lower = to_lower(content);
    if (contains_any(lower, kPreferenceMarkers))   return MemoryType::Preference;
    if (contains_any(lower, kFactMarkers))         return MemoryType::Fact;
    if (contains_any(lower, kRelationshipMarkers)) return MemoryType::Relationship;
    return MemoryType::Event;
}

int score_importance(const std::string& content) {
    std::string lower = to_lower(content);
    int score = kBaseImportance;
    if (contains_any(lower, kImportantMarkers)) score += 2;
    if (lower.find("我") != std::string::npos || has_self_word(lower)) score += 1;
    if (utf8_length(content) > kLongContentLength) score += 1;
    return clamp_importance(score);
}

std::vector<std::string> extract_keywords(const std::string& content) {
    // Drop punctuation, then split on whitespace
    std::string cleaned;
    for (uint32_t cp : utf8_decode(content)) {
        if (cp < 0x80) {
            if (std::isalnum(static_cast<int>(cp)) || cp == '_' ||
                std::isspace(static_cast<int>(cp))) {
                cleaned += static_cast<char>(cp);
            }
        } else if (!is_wide_punctuation(cp)) {
            utf8_append(cleaned, cp);
        }
    }

    std::vector<std::string> keywords;
    std::string token;
    auto flush = [&]() {
        if (utf8_length(token) > 1 &&
            std::find(keywords.begin(), keywords.end(), token) == keywords.end()) {
            keywords.push_back(token);
        }
        token.clear();
    };
    for (char c : cleaned) {
        if (keywords.size() >= kMaxKeywords) break;
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            token += c;
        }
    }
    if (keywords.size() < kMaxKeywords) flush();
    return keywords;
}

int relevance_score(const MemoryItem& item, const std::string& query, uint64_t now) {
    std::string content = to_lower(item.content);
    std::string q = to_lower(query);

    int score = 0;
    if (content.find(q) != std::string::npos) score += 10;

    for (const auto& keyword : item.keywords) {
        if (q.find(to_lower(keyword)) != std::string::npos) score += 5;
    }

    score += item.importance;
    score += static_cast<int>(std::min<uint32_t>(item.access_count, 5));

    uint64_t days = now > item.created_at ? (now - item.created_at) / kSecondsPerDay : 0;
    if (days < 10) score += static_cast<int>(10 - days);

    return score;
}

} // namespace parley
