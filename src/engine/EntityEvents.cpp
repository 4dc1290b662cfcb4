#include "auditlog/EntityEvents.hpp"

#include <algorithm>

namespace auditlog {

const char* entityEventName(EntityEventKind kind) {
    switch (kind) {
        case EntityEventKind::Saving: return "saving";
        case EntityEventKind::Created: return "created";
        case EntityEventKind::Updated: return "updated";
        case EntityEventKind::Deleted: return "deleted";
    }
    return "unknown";
}

EntityEventBus::SubscriptionId EntityEventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    SubscriptionId id = nextId_++;
    subscribers_.push_back({id, std::make_shared<Handler>(std::move(handler))});
    return id;
}

void EntityEventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [id](const Subscription& s) { return s.id == id; }),
                       subscribers_.end());
}

void EntityEventBus::publish(const EntityEvent& event, const RecordingContext& context) const {
    // Copy the handlers so a subscriber may (un)subscribe while being called.
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        handlers.reserve(subscribers_.size());
        for (const auto& s : subscribers_) handlers.push_back(s.handler);
    }

    for (const auto& handler : handlers) {
        try {
            (*handler)(event, context);
        } catch (const std::exception& e) {
            std::cerr << "EntityEventBus: subscriber failed on " << entityEventName(event.kind)
                      << " " << event.typeTag << ": " << e.what() << "\n";
        }
    }
}

std::size_t EntityEventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return subscribers_.size();
}

} // namespace auditlog
