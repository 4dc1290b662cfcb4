#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "auditlog/EntityEvents.hpp"
#include "auditlog/Recorder.hpp"

namespace auditlog {

// Turns entity events into CREATE/UPDATE/DELETE entries.
//
// The actor comes from the entity itself, else from the context; with
// neither the mutation is not logged. Updates are logged only when a
// tracked field differs from the snapshot taken on the Saving event.
// Snapshots left behind by writes that never completed are evicted
// oldest first once more than snapshotLimit are pending.
class EntityObserver {
public:
    static constexpr std::size_t kDefaultSnapshotLimit = 4096;

    EntityObserver(Recorder& recorder, EntityEventBus& bus,
                   std::size_t snapshotLimit = kDefaultSnapshotLimit);
    ~EntityObserver();

    EntityObserver(const EntityObserver&) = delete;
    EntityObserver& operator=(const EntityObserver&) = delete;

    void deny(const std::string& typeTag);
    bool isDenied(const std::string& typeTag) const;

    // Snapshots taken but not yet consumed by an update.
    std::size_t pendingSnapshots() const;

private:
    void onEvent(const EntityEvent& event, const RecordingContext& context);
    void onCreated(const EntityEvent& event, const RecordingContext& context, std::shared_ptr<const Actor> actor);
    void onUpdated(const EntityEvent& event, const RecordingContext& context, std::shared_ptr<const Actor> actor);
    void onDeleted(const EntityEvent& event, const RecordingContext& context, std::shared_ptr<const Actor> actor);

    using SnapshotKey = std::pair<std::string, EntityId>;

    struct Snapshot {
        Metadata fields;
        std::uint64_t sequence = 0;
    };

    // All three expect mutex_ held.
    void storeSnapshot(const SnapshotKey& key, const Metadata& fields);
    std::optional<Metadata> takeSnapshot(const SnapshotKey& key);
    void dropSnapshot(const SnapshotKey& key);

    Recorder& recorder_;
    EntityEventBus& bus_;
    EntityEventBus::SubscriptionId subscription_;
    std::set<std::string> denied_;
    std::size_t snapshotLimit_;
    std::uint64_t nextSequence_ = 0;
    std::map<SnapshotKey, Snapshot> snapshots_;
    std::map<std::uint64_t, SnapshotKey> snapshotOrder_;  // insertion order, for eviction
    mutable std::mutex mutex_;
};

} // namespace auditlog
