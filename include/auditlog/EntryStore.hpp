#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "auditlog/LogEntry.hpp"

namespace auditlog {

enum class EntrySort {
    NewestFirst,   // timestamp descending, higher id first on ties
    OldestFirst,
    ActorTagAsc,   // ties newest first
    ActorTagDesc
};

struct EntryQuery {
    std::optional<ActionCategory> category;
    std::optional<std::string> targetType;
    std::optional<EntityId> targetId;
    std::optional<Uuid> actorTag;
    std::optional<EntityId> actorId;
    std::optional<Timestamp> since;  // inclusive
    std::optional<Timestamp> until;  // inclusive
    std::string search;              // case-insensitive, over action and actor display
    EntrySort sort = EntrySort::NewestFirst;
    size_t offset = 0;
    size_t limit = 0;                // 0 = no limit
};

struct QueryResult {
    size_t total = 0;                // matches before offset/limit
    std::vector<LogEntry> entries;
};

// Write-once store for log entries.
//
// On disk: <dataDir>/action_log.log, one record per entry:
//   [u32 length][JSON payload][u32 crc32(payload)]
// An empty dataDir keeps entries in memory only.
class EntryStore {
public:
    explicit EntryStore(const std::string& dataDir = "");
    ~EntryStore();

    EntryStore(const EntryStore&) = delete;
    EntryStore& operator=(const EntryStore&) = delete;

    // Assigns id and timestamp and appends the entry.
    // Throws std::runtime_error when the store is closed or the write fails.
    EntryHandle create(const EntryDraft& draft);

    std::optional<LogEntry> get(EntryId id) const;
    std::size_t count() const;

    // Ordered by query.sort, then paged by offset/limit.
    QueryResult query(const EntryQuery& query) const;

    // Distinct target type tags present in the store, sorted.
    std::vector<std::string> targetTypes() const;

    void close();
    bool isOpen() const;
    bool persistent() const { return !logPath_.empty(); }
    const std::string& path() const { return logPath_; }

private:
    std::string dataDir_;
    std::string logPath_;
    std::ofstream stream_;
    bool closed_ = false;
    EntryId nextId_ = 1;
    std::uintmax_t validBytes_ = 0;
    std::vector<LogEntry> entries_;  // ascending id
    mutable std::mutex mutex_;

    // Replays the file; returns false when a checksum or length check fails.
    bool load();
    void appendRecord(const LogEntry& entry);
};

} // namespace auditlog
