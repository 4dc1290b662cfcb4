#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "auditlog/Capabilities.hpp"
#include "auditlog/Transaction.hpp"

namespace auditlog {

enum class EntityEventKind { Saving, Created, Updated, Deleted };

const char* entityEventName(EntityEventKind kind);

// Minimal payload a persistence layer publishes for an entity mutation.
struct EntityEvent {
    EntityEventKind kind = EntityEventKind::Created;
    std::string typeTag;
    std::optional<EntityId> id;
    std::string display;
    std::shared_ptr<const Actor> actor;  // per-instance actor, if the entity carries one
    Metadata fields;                     // tracked field values at publish time
};

// Builds the payload from whatever capabilities E implements.
template <typename E>
EntityEvent makeEntityEvent(EntityEventKind kind, const E& entity) {
    static_assert(std::is_base_of<Identifiable, E>::value, "entity events need an Identifiable");

    EntityEvent event;
    event.kind = kind;
    event.typeTag = entity.typeTag();
    event.id = entity.identity();
    event.display = entity.display();
    if constexpr (std::is_base_of<HasActorContext, E>::value) {
        event.actor = entity.currentActor();
    }
    if constexpr (std::is_base_of<TracksFields, E>::value) {
        for (const auto& field : entity.trackedFields()) {
            event.fields[field] = entity.fieldValue(field);
        }
    }
    return event;
}

class EntityEventBus {
public:
    using Handler = std::function<void(const EntityEvent&, const RecordingContext&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);

    // Delivers to every subscriber; a failing subscriber never reaches the publisher.
    void publish(const EntityEvent& event, const RecordingContext& context) const;

    template <typename E>
    void publish(EntityEventKind kind, const E& entity, const RecordingContext& context) const {
        EntityEvent event;
        try {
            event = makeEntityEvent(kind, entity);
        } catch (const std::exception& e) {
            std::cerr << "EntityEventBus: could not build " << entityEventName(kind) << " event: " << e.what() << "\n";
            return;
        }
        publish(event, context);
    }

    std::size_t subscriberCount() const;

private:
    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<Handler> handler;
    };

    SubscriptionId nextId_ = 1;
    std::vector<Subscription> subscribers_;
    mutable std::mutex mutex_;
};

} // namespace auditlog
