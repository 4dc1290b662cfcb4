#include "auditlog/EntityObserver.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace auditlog {

namespace {

// Never observed: the log itself and bookkeeping types, or every entry
// would produce another entry.
const std::array<const char*, 5> kDefaultDenied = {
    "LogEntry", "ContentType", "Session", "Migration", "Permission"
};

// Fields kept on delete so the entry still says what was removed.
const std::array<const char*, 7> kNameLikeFields = {
    "name", "title", "first_name", "last_name", "full_name", "username", "display_name"
};

std::optional<TargetRef> targetOf(const EntityEvent& event) {
    if (!event.id) return std::nullopt;
    return TargetRef{event.typeTag, *event.id};
}

} // namespace

EntityObserver::EntityObserver(Recorder& recorder, EntityEventBus& bus, std::size_t snapshotLimit)
    : recorder_(recorder), bus_(bus), snapshotLimit_(std::max<std::size_t>(snapshotLimit, 1)) {
    for (const char* tag : kDefaultDenied) denied_.insert(tag);
    subscription_ = bus_.subscribe([this](const EntityEvent& event, const RecordingContext& context) {
        onEvent(event, context);
    });
}

EntityObserver::~EntityObserver() {
    bus_.unsubscribe(subscription_);
}

void EntityObserver::deny(const std::string& typeTag) {
    std::lock_guard<std::mutex> lk(mutex_);
    denied_.insert(typeTag);
}

bool EntityObserver::isDenied(const std::string& typeTag) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return denied_.count(typeTag) > 0;
}

std::size_t EntityObserver::pendingSnapshots() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshots_.size();
}

void EntityObserver::storeSnapshot(const SnapshotKey& key, const Metadata& fields) {
    dropSnapshot(key);
    auto sequence = nextSequence_++;
    snapshots_[key] = Snapshot{fields, sequence};
    snapshotOrder_[sequence] = key;

    while (snapshots_.size() > snapshotLimit_) {
        auto oldest = snapshotOrder_.begin();
        std::cerr << "EntityObserver: evicting stale snapshot for " << oldest->second.first
                  << " #" << oldest->second.second << "\n";
        snapshots_.erase(oldest->second);
        snapshotOrder_.erase(oldest);
    }
}

std::optional<Metadata> EntityObserver::takeSnapshot(const SnapshotKey& key) {
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) return std::nullopt;
    Metadata fields = std::move(it->second.fields);
    snapshotOrder_.erase(it->second.sequence);
    snapshots_.erase(it);
    return fields;
}

void EntityObserver::dropSnapshot(const SnapshotKey& key) {
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) return;
    snapshotOrder_.erase(it->second.sequence);
    snapshots_.erase(it);
}

void EntityObserver::onEvent(const EntityEvent& event, const RecordingContext& context) {
    if (isDenied(event.typeTag)) return;

    if (event.kind == EntityEventKind::Saving) {
        if (event.id) {
            std::lock_guard<std::mutex> lk(mutex_);
            storeSnapshot(SnapshotKey(event.typeTag, *event.id), event.fields);
        }
        return;
    }

    // An id assigned before insert still gets a Saving snapshot.
    if (event.kind == EntityEventKind::Created && event.id) {
        std::lock_guard<std::mutex> lk(mutex_);
        dropSnapshot(SnapshotKey(event.typeTag, *event.id));
    }

    std::shared_ptr<const Actor> actor = event.actor ? event.actor : context.actor;

    switch (event.kind) {
        case EntityEventKind::Created:
            if (actor) onCreated(event, context, std::move(actor));
            break;
        case EntityEventKind::Updated:
            onUpdated(event, context, std::move(actor));
            break;
        case EntityEventKind::Deleted:
            onDeleted(event, context, std::move(actor));
            break;
        case EntityEventKind::Saving:
            break;
    }
}

void EntityObserver::onCreated(const EntityEvent& event, const RecordingContext& context,
                               std::shared_ptr<const Actor> actor) {
    Metadata metadata;
    if (!event.fields.empty()) {
        metadata["new_values"] = MetaValue(event.fields);
    }
    recorder_.recordAsync(context, std::move(actor), "Created " + event.typeTag,
                          ActionCategory::Create, targetOf(event), std::move(metadata));
}

void EntityObserver::onUpdated(const EntityEvent& event, const RecordingContext& context,
                               std::shared_ptr<const Actor> actor) {
    if (!event.id) return;

    std::optional<Metadata> snapshot;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        snapshot = takeSnapshot(SnapshotKey(event.typeTag, *event.id));
    }
    if (!snapshot || !actor) return;
    const Metadata& before = *snapshot;

    MetaValue::List changed;
    Metadata oldValues;
    Metadata newValues;
    for (const auto& kv : event.fields) {
        auto prev = before.find(kv.first);
        if (prev != before.end() && prev->second == kv.second) continue;
        changed.push_back(kv.first);
        oldValues[kv.first] = prev != before.end() ? prev->second : MetaValue();
        newValues[kv.first] = kv.second;
    }
    if (changed.empty()) return;

    Metadata metadata;
    metadata["fields_changed"] = MetaValue(std::move(changed));
    metadata["old_values"] = MetaValue(std::move(oldValues));
    metadata["new_values"] = MetaValue(std::move(newValues));
    recorder_.recordAsync(context, std::move(actor), "Updated " + event.typeTag,
                          ActionCategory::Update, targetOf(event), std::move(metadata));
}

void EntityObserver::onDeleted(const EntityEvent& event, const RecordingContext& context,
                               std::shared_ptr<const Actor> actor) {
    if (event.id) {
        std::lock_guard<std::mutex> lk(mutex_);
        dropSnapshot(SnapshotKey(event.typeTag, *event.id));
    }
    if (!actor) return;

    Metadata metadata;
    for (const char* field : kNameLikeFields) {
        auto it = event.fields.find(field);
        if (it != event.fields.end() && !it->second.isNull()) {
            metadata[field] = it->second;
        }
    }
    metadata["display"] = event.display;
    recorder_.recordAsync(context, std::move(actor), "Deleted " + event.typeTag,
                          ActionCategory::Delete, targetOf(event), std::move(metadata));
}

} // namespace auditlog
