#include "auditlog/EntryStore.hpp"
#include "auditlog/Checksum.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace auditlog {

namespace {

constexpr uint32_t kMaxRecordBytes = 16 * 1024 * 1024;

void writeU32(std::ostream& out, uint32_t value) {
    char bytes[4];
    for (int i = 0; i < 4; ++i) {
        bytes[i] = static_cast<char>((value >> (8 * i)) & 0xFFu);
    }
    out.write(bytes, sizeof(bytes));
}

bool readU32(std::istream& in, uint32_t& value) {
    unsigned char bytes[4];
    if (!in.read(reinterpret_cast<char*>(bytes), sizeof(bytes))) return false;
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(bytes[i]) << (8 * i);
    }
    return true;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool matches(const LogEntry& e, const EntryQuery& q, const std::string& needle) {
    if (q.category && e.category != *q.category) return false;
    if (q.targetType && (!e.target || e.target->type != *q.targetType)) return false;
    if (q.targetId && (!e.target || e.target->id != *q.targetId)) return false;
    if (q.actorTag && e.actorTag != *q.actorTag) return false;
    if (q.actorId && (!e.actor || e.actor->id != *q.actorId)) return false;
    if (q.since && e.timestamp < *q.since) return false;
    if (q.until && e.timestamp > *q.until) return false;
    if (needle.empty()) return true;
    if (lower(e.action).find(needle) != std::string::npos) return true;
    return e.actor && lower(e.actor->display).find(needle) != std::string::npos;
}

} // namespace

EntryStore::EntryStore(const std::string& dataDir) : dataDir_(dataDir) {
    if (dataDir_.empty()) return;

    std::filesystem::create_directories(dataDir_);
    logPath_ = (std::filesystem::path(dataDir_) / "action_log.log").string();
    if (!load()) {
        // Later appends must not land behind the damaged tail.
        std::cerr << "EntryStore: replay stopped early; kept " << entries_.size()
                  << " entries, truncating log to " << validBytes_ << " bytes\n";
        std::filesystem::resize_file(logPath_, validBytes_);
    }
    stream_.open(logPath_, std::ios::binary | std::ios::app);
    if (!stream_) {
        throw std::runtime_error("EntryStore: failed to open " + logPath_);
    }
}

EntryStore::~EntryStore() {
    close();
}

bool EntryStore::load() {
    std::ifstream in(logPath_, std::ios::binary);
    validBytes_ = 0;
    if (!in) return true; // nothing to load is not an error

    while (true) {
        uint32_t len = 0;
        if (!readU32(in, len)) break;
        if (len == 0 || len > kMaxRecordBytes) {
            std::cerr << "EntryStore: suspicious record length " << len << "\n";
            return false;
        }

        std::string payload(len, '\0');
        if (!in.read(payload.data(), len)) {
            std::cerr << "EntryStore: truncated record at end of log\n";
            return false;
        }

        uint32_t storedCrc = 0;
        if (!readU32(in, storedCrc)) {
            std::cerr << "EntryStore: truncated checksum at end of log\n";
            return false;
        }
        if (crc32(payload) != storedCrc) {
            std::cerr << "EntryStore: checksum mismatch; stopping replay\n";
            return false;
        }

        validBytes_ += sizeof(uint32_t) + len + sizeof(uint32_t);

        auto rec = json::parse(payload, nullptr, false);
        if (rec.is_discarded()) {
            std::cerr << "EntryStore: invalid JSON record; skipping\n";
            continue;
        }
        try {
            LogEntry entry = entryFromJson(rec);
            nextId_ = std::max(nextId_, entry.id + 1);
            entries_.push_back(std::move(entry));
        } catch (const std::exception& e) {
            std::cerr << "EntryStore: undecodable record (" << e.what() << "); skipping\n";
        }
    }

    std::sort(entries_.begin(), entries_.end(), [](const LogEntry& a, const LogEntry& b) { return a.id < b.id; });
    if (std::filesystem::file_size(logPath_) != validBytes_) {
        std::cerr << "EntryStore: trailing partial record in log\n";
        return false;
    }
    return true;
}

void EntryStore::appendRecord(const LogEntry& entry) {
    if (!stream_.is_open() || !stream_.good()) {
        throw std::runtime_error("EntryStore: stream not good for " + logPath_);
    }

    std::string payload = toJson(entry).dump(-1, ' ', false, json::error_handler_t::replace);
    if (payload.size() > kMaxRecordBytes) {
        throw std::runtime_error("EntryStore: record exceeds size limit");
    }

    writeU32(stream_, static_cast<uint32_t>(payload.size()));
    stream_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    writeU32(stream_, crc32(payload));
    stream_.flush();
    if (!stream_) {
        throw std::runtime_error("EntryStore: write failed for " + logPath_);
    }
}

EntryHandle EntryStore::create(const EntryDraft& draft) {
    if (draft.action.empty()) {
        throw std::invalid_argument("EntryStore: action must not be empty");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (closed_) {
        throw std::runtime_error("EntryStore: store is closed");
    }

    LogEntry entry;
    entry.id = nextId_;
    entry.actor = draft.actor;
    entry.actorTag = draft.actor ? draft.actor->tag : draft.actorTag;
    entry.action = truncateUtf8(draft.action, kMaxActionLength);
    entry.category = draft.category;
    entry.target = draft.target;
    entry.details = draft.details;
    if (entry.details.userAgent) {
        entry.details.userAgent = truncateUtf8(*entry.details.userAgent, kMaxUserAgentLength);
    }
    entry.metadata = draft.metadata.is_object() ? draft.metadata : json::object();
    entry.timestamp = now();

    if (persistent()) {
        appendRecord(entry);
    }
    ++nextId_;
    entries_.push_back(entry);
    return EntryHandle{entry.id, entry.timestamp};
}

std::optional<LogEntry> EntryStore::get(EntryId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::lower_bound(entries_.begin(), entries_.end(), id,
                               [](const LogEntry& e, EntryId v) { return e.id < v; });
    if (it == entries_.end() || it->id != id) return std::nullopt;
    return *it;
}

std::size_t EntryStore::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

QueryResult EntryStore::query(const EntryQuery& q) const {
    const std::string needle = lower(q.search);
    auto newer = [](const LogEntry* a, const LogEntry* b) {
        if (a->timestamp != b->timestamp) return a->timestamp > b->timestamp;
        return a->id > b->id;
    };

    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<const LogEntry*> hits;
    for (const auto& e : entries_) {
        if (matches(e, q, needle)) hits.push_back(&e);
    }
    switch (q.sort) {
        case EntrySort::NewestFirst:
            std::sort(hits.begin(), hits.end(), newer);
            break;
        case EntrySort::OldestFirst:
            std::sort(hits.begin(), hits.end(), [&](const LogEntry* a, const LogEntry* b) { return newer(b, a); });
            break;
        case EntrySort::ActorTagAsc:
        case EntrySort::ActorTagDesc: {
            const bool ascending = q.sort == EntrySort::ActorTagAsc;
            std::sort(hits.begin(), hits.end(), [&](const LogEntry* a, const LogEntry* b) {
                if (a->actorTag != b->actorTag) {
                    return ascending ? a->actorTag.bytes < b->actorTag.bytes
                                     : b->actorTag.bytes < a->actorTag.bytes;
                }
                return newer(a, b);
            });
            break;
        }
    }

    QueryResult result;
    result.total = hits.size();
    size_t start = std::min(q.offset, hits.size());
    size_t end = q.limit == 0 || q.limit >= hits.size() - start ? hits.size() : start + q.limit;
    result.entries.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        result.entries.push_back(*hits[i]);
    }
    return result;
}

std::vector<std::string> EntryStore::targetTypes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::set<std::string> types;
    for (const auto& e : entries_) {
        if (e.target) types.insert(e.target->type);
    }
    return std::vector<std::string>(types.begin(), types.end());
}

void EntryStore::close() {
    std::lock_guard<std::mutex> lk(mutex_);
    closed_ = true;
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

bool EntryStore::isOpen() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return !closed_;
}

} // namespace auditlog
