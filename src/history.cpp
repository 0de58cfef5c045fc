#include "history.hpp"
#include "history_json.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <iostream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace parley {

namespace {

constexpr size_t kFileLockStripes = 64;
constexpr uint64_t kSecondsPerDay = 86400;
const char* const kLiveSuffix = "_history.json";

struct ArchiveName {
    std::string stem;
    std::string stamp;      // YYYYMMDD_HHMMSS
    unsigned long seq = 0;  // collision suffix, 0 when absent
};

bool all_digits(const std::string& s, size_t expected_len) {
    if (s.empty() || (expected_len != 0 && s.size() != expected_len)) return false;
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// "YYYYMMDD_HHMMSS" or "YYYYMMDD_HHMMSS_N"
bool parse_stamp_tail(const std::string& tail, ArchiveName& out) {
    auto parts = split(tail, '_');
    if (parts.size() != 2 && parts.size() != 3) return false;
    if (!all_digits(parts[0], 8) || !all_digits(parts[1], 6)) return false;
    out.stamp = parts[0] + "_" + parts[1];
    out.seq = 0;
    if (parts.size() == 3) {
        if (!all_digits(parts[2], 0) || parts[2].size() > 6) return false;
        out.seq = std::stoul(parts[2]);
    }
    return true;
}

bool strip_json_ext(const std::string& filename, std::string& base) {
    static const std::string ext = ".json";
    if (filename.size() <= ext.size() ||
        filename.compare(filename.size() - ext.size(), ext.size(), ext) != 0) {
        return false;
    }
    base = filename.substr(0, filename.size() - ext.size());
    return true;
}

// Archive file name belonging to a known stem
std::optional<ArchiveName> match_archive_name(const std::string& filename,
                                              const std::string& stem) {
    std::string base;
    if (!strip_json_ext(filename, base)) return std::nullopt;
    if (base.size() <= stem.size() + 1 || base.compare(0, stem.size(), stem) != 0 ||
        base[stem.size()] != '_') {
        return std::nullopt;
    }
    ArchiveName name;
    if (!parse_stamp_tail(base.substr(stem.size() + 1), name)) return std::nullopt;
    name.stem = stem;
    return name;
}

// Archive file name with an unknown stem. Prefers the form without a suffix.
std::optional<ArchiveName> parse_archive_name(const std::string& filename) {
    std::string base;
    if (!strip_json_ext(filename, base)) return std::nullopt;

    // Try stem_DATE_TIME, then stem_DATE_TIME_N
    for (int underscores = 2; underscores <= 3; ++underscores) {
        size_t cut = std::string::npos;
        size_t pos = base.size();
        int found = 0;
        while (found < underscores) {
            if (pos == 0) break;
            cut = base.rfind('_', pos - 1);
            if (cut == std::string::npos || cut == 0) break;
            pos = cut;
            ++found;
        }
        if (found != underscores) continue;

        ArchiveName name;
        if (!parse_stamp_tail(base.substr(cut + 1), name)) continue;
        name.stem = base.substr(0, cut);
        return name;
    }
    return std::nullopt;
}

bool newer(const ArchiveName& a, const ArchiveName& b) {
    if (a.stamp != b.stamp) return a.stamp > b.stamp;
    return a.seq > b.seq;
}

bool read_transcript(const std::string& path, uint64_t now, std::vector<ChatMessage>& out) {
    std::string text;
    if (!read_file(path, text)) return false;
    return messages_from_json_text(text, now, out);
}

} // namespace

std::string encode_session_id(const std::string& session_id) {
    static const char* const kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(session_id.size());
    for (size_t i = 0; i < session_id.size(); ++i) {
        unsigned char uc = static_cast<unsigned char>(session_id[i]);
        bool escape = uc == '%' || uc == '/' || uc == '\\' || uc < 0x20 || uc == 0x7F ||
                      (i == 0 && uc == '.');
        if (!escape) {
            out += session_id[i];
            continue;
        }
        out += '%';
        out += kHex[uc >> 4];
        out += kHex[uc & 0x0F];
    }
    return out;
}

std::string decode_session_id(const std::string& encoded) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += encoded[i];
    }
    return out;
}

HistoryStore::HistoryStore(std::string data_dir, uint32_t archive_search_days)
    : data_dir_(std::move(data_dir)),
      archive_search_days_(archive_search_days),
      file_locks_(kFileLockStripes)
{}

std::mutex& HistoryStore::file_lock(const std::string& session_id) {
    // Keyed like the file names so every writer of one file shares a stripe
    std::string name = encode_session_id(session_id);
    return file_locks_[std::hash<std::string>{}(name) % file_locks_.size()];
}

std::string HistoryStore::live_path(const std::string& session_id) const {
    return (fs::path(data_dir_) / "sessions" /
            (encode_session_id(session_id) + kLiveSuffix)).string();
}

std::string HistoryStore::archive_dir(uint64_t when) const {
    return (fs::path(data_dir_) / "conversations" /
            format_local_time(when, "%Y") / format_local_time(when, "%m") /
            format_local_time(when, "%d")).string();
}

// ── Buffer ──────────────────────────────────────────────────────

void HistoryStore::start_conversation(const std::string& session_id) {
    buffers_.put(session_id, {});
}

void HistoryStore::add_message(const std::string& session_id, ChatMessage msg) {
    if (msg.timestamp == 0) msg.timestamp = epoch_seconds();
    buffers_.upsert(session_id, [&msg](std::vector<ChatMessage>& buf, bool) {
        buf.push_back(std::move(msg));
    });
}

size_t HistoryStore::resume_conversation(const std::string& session_id) {
    size_t existing = 0;
    if (buffers_.visit(session_id, [&existing](const std::vector<ChatMessage>& buf) {
            existing = buf.size();
        })) {
        return existing;
    }

    // Disk read happens outside the shard lock
    auto persisted = load_persisted(session_id, epoch_seconds());
    return buffers_.upsert(session_id,
        [&persisted](std::vector<ChatMessage>& buf, bool created) {
            if (created) buf = std::move(persisted);
            return buf.size();
        });
}

bool HistoryStore::has_history(const std::string& session_id) const {
    if (buffers_.contains(session_id)) return true;
    std::error_code ec;
    return fs::exists(live_path(session_id), ec);
}

size_t HistoryStore::active_conversation_count() const {
    return buffers_.size();
}

// ── Writes ──────────────────────────────────────────────────────

bool HistoryStore::write_live(const std::string& session_id,
                              const std::vector<ChatMessage>& messages) {
    std::string path = live_path(session_id);
    if (!atomic_write_file(path, messages_to_json_text(messages))) {
        std::cerr << "[history] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

std::optional<std::string> HistoryStore::write_archive(const std::string& session_id,
                                                       const std::vector<ChatMessage>& messages,
                                                       uint64_t now) {
    fs::path dir = archive_dir(now);
    std::string base = encode_session_id(session_id) + "_" +
                       format_local_time(now, "%Y%m%d_%H%M%S");

    // Never overwrite an earlier archive from the same second
    fs::path path = dir / (base + ".json");
    std::error_code ec;
    for (unsigned n = 1; fs::exists(path, ec); ++n) {
        path = dir / (base + "_" + std::to_string(n) + ".json");
    }

    if (!atomic_write_file(path.string(), messages_to_json_text(messages))) {
        std::cerr << "[history] Failed to write archive " << path.string() << "\n";
        return std::nullopt;
    }
    return path.string();
}

void HistoryStore::report_archive(const std::string& session_id, const std::string& path,
                                  size_t count) {
    std::cerr << "[history] Archived " << count << " messages for session "
              << session_id << " to " << path << "\n";
    if (event_bus_) {
        HistoryArchivedEvent ev;
        ev.session_id = session_id;
        ev.path = path;
        ev.message_count = count;
        event_bus_->publish(ev);
    }
}

bool HistoryStore::add_message_and_save(const std::string& session_id, ChatMessage msg) {
    uint64_t now = epoch_seconds();
    if (msg.timestamp == 0) msg.timestamp = now;

    std::lock_guard<std::mutex> lock(file_lock(session_id));
    auto messages = load_persisted(session_id, now);
    messages.push_back(std::move(msg));
    return write_live(session_id, messages);
}

std::optional<std::string> HistoryStore::save_history(const std::string& session_id,
                                                      const std::vector<ChatMessage>& messages,
                                                      StorageStrategy strategy) {
    if (strategy == StorageStrategy::ByDate) {
        return archive_history(session_id, messages, epoch_seconds());
    }
    std::lock_guard<std::mutex> lock(file_lock(session_id));
    if (!write_live(session_id, messages)) return std::nullopt;
    return live_path(session_id);
}

std::optional<std::string> HistoryStore::archive_history(const std::string& session_id,
                                                         const std::vector<ChatMessage>& messages,
                                                         uint64_t now) {
    std::optional<std::string> path;
    {
        std::lock_guard<std::mutex> lock(file_lock(session_id));
        path = write_archive(session_id, messages, now);
    }
    if (path) report_archive(session_id, *path, messages.size());
    return path;
}

bool HistoryStore::flush(const std::string& session_id) {
    // Copy under the file lock so concurrent flushes land in buffer order
    std::lock_guard<std::mutex> lock(file_lock(session_id));
    auto buffered = buffers_.get(session_id);
    if (!buffered) return false;
    return write_live(session_id, *buffered);
}

std::optional<std::string> HistoryStore::end_conversation(const std::string& session_id) {
    return end_conversation(session_id, epoch_seconds());
}

std::optional<std::string> HistoryStore::end_conversation(const std::string& session_id,
                                                          uint64_t now) {
    std::optional<std::string> archived;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(file_lock(session_id));
        auto buffered = buffers_.take(session_id);
        if (!buffered || buffered->empty()) {
            std::cerr << "[history] No buffered messages to archive for session "
                      << session_id << "\n";
            return std::nullopt;
        }
        count = buffered->size();

        // Each write is attempted even if the other fails
        if (!write_live(session_id, *buffered)) {
            std::cerr << "[history] Live transcript for session " << session_id
                      << " is stale, archiving anyway\n";
        }
        archived = write_archive(session_id, *buffered, now);
    }
    if (archived) report_archive(session_id, *archived, count);
    return archived;
}

bool HistoryStore::delete_history(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(file_lock(session_id));
    buffers_.erase(session_id);

    std::string path = live_path(session_id);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[history] Failed to delete " << path << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

// ── Reads ───────────────────────────────────────────────────────

std::optional<std::vector<ChatMessage>> HistoryStore::read_live(const std::string& session_id,
                                                                uint64_t now) const {
    std::string path = live_path(session_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    std::vector<ChatMessage> messages;
    if (!read_transcript(path, now, messages)) {
        std::cerr << "[history] Ignoring corrupt transcript " << path << "\n";
        return std::nullopt;
    }
    return messages;
}

std::optional<std::vector<ChatMessage>> HistoryStore::read_archive(const std::string& session_id,
                                                                   uint64_t now) const {
    std::string stem = encode_session_id(session_id);

    for (uint64_t day = 0; day <= archive_search_days_; ++day) {
        uint64_t offset = day * kSecondsPerDay;
        if (offset > now) break;
        std::string dir = archive_dir(now - offset);

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        std::vector<std::pair<ArchiveName, std::string>> matches;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            auto name = match_archive_name(it->path().filename().string(), stem);
            if (name) matches.emplace_back(std::move(*name), it->path().string());
        }
        std::sort(matches.begin(), matches.end(),
                  [](const auto& a, const auto& b) { return newer(a.first, b.first); });

        for (const auto& match : matches) {
            std::vector<ChatMessage> messages;
            if (read_transcript(match.second, now, messages)) return messages;
            std::cerr << "[history] Ignoring corrupt transcript " << match.second << "\n";
        }
    }
    return std::nullopt;
}

std::vector<ChatMessage> HistoryStore::load_persisted(const std::string& session_id,
                                                      uint64_t now) const {
    if (auto live = read_live(session_id, now)) return std::move(*live);
    if (auto archived = read_archive(session_id, now)) return std::move(*archived);
    return {};
}

std::vector<ChatMessage> HistoryStore::load_history(const std::string& session_id) {
    return load_history(session_id, epoch_seconds());
}

std::vector<ChatMessage> HistoryStore::load_history(const std::string& session_id,
                                                    uint64_t now) {
    if (auto buffered = buffers_.get(session_id)) return std::move(*buffered);
    return load_persisted(session_id, now);
}

std::vector<ChatMessage> HistoryStore::recent_messages(const std::string& session_id,
                                                       size_t limit) {
    auto messages = load_history(session_id);
    if (messages.size() > limit) {
        messages.erase(messages.begin(),
                       messages.begin() + static_cast<std::ptrdiff_t>(messages.size() - limit));
    }
    return messages;
}

HistoryStats HistoryStore::statistics() const {
    HistoryStats stats;
    uint64_t now = epoch_seconds();
    std::string suffix = kLiveSuffix;

    // Buffered sessions are counted from memory, not from their live file
    std::set<std::string> buffered_files;
    buffers_.for_each([&](const std::string& id, const std::vector<ChatMessage>& buf) {
        stats.active_conversations++;
        stats.total_messages += buf.size();
        buffered_files.insert(encode_session_id(id) + kLiveSuffix);
    });

    fs::path dir = fs::path(data_dir_) / "sessions";
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::string name = it->path().filename().string();
            if (name.size() <= suffix.size() ||
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }
            std::error_code size_ec;
            auto size = fs::file_size(it->path(), size_ec);
            if (!size_ec) stats.total_file_size += size;
            stats.total_sessions++;

            if (buffered_files.count(name)) continue;
            std::vector<ChatMessage> messages;
            if (read_transcript(it->path().string(), now, messages)) {
                stats.total_messages += messages.size();
            }
        }
    }
    return stats;
}

std::vector<ConversationRecord> HistoryStore::conversations_by_date(uint64_t day) const {
    std::vector<std::pair<ArchiveName, ConversationRecord>> found;
    uint64_t now = epoch_seconds();

    std::string dir = archive_dir(day);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return {};

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto name = parse_archive_name(it->path().filename().string());
        if (!name) continue;

        ConversationRecord record;
        record.session_id = decode_session_id(name->stem);
        record.path = it->path().string();
        if (!read_transcript(record.path, now, record.messages)) {
            std::cerr << "[history] Ignoring corrupt transcript " << record.path << "\n";
            continue;
        }
        found.emplace_back(std::move(*name), std::move(record));
    }

    // Oldest first
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return newer(b.first, a.first);
    });

    std::vector<ConversationRecord> out;
    out.reserve(found.size());
    for (auto& entry : found) out.push_back(std::move(entry.second));
    return out;
}

} // namespace parley
