#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "auditlog/MetaValue.hpp"
#include "auditlog/Uuid.hpp"

namespace auditlog {

using EntityId = uint64_t;

// Anything a log entry can point at. identity() is empty until persisted.
class Identifiable {
public:
    virtual ~Identifiable() = default;
    virtual std::optional<EntityId> identity() const = 0;
    virtual std::string typeTag() const = 0;
    // Human readable form; "<Type> #<id>" unless overridden.
    virtual std::string display() const;
};

// The principal an action is attributed to.
class Actor {
public:
    virtual ~Actor() = default;
    virtual std::optional<EntityId> identity() const = 0;
    virtual Uuid stableTag() const = 0;
    virtual std::string displayName() const { return stableTag().str(); }
};

// Entities that can carry the actor responsible for their pending mutation.
class HasActorContext {
public:
    virtual ~HasActorContext() = default;
    virtual std::shared_ptr<const Actor> currentActor() const = 0;
};

// Entities whose field changes are diffed on update.
class TracksFields {
public:
    virtual ~TracksFields() = default;
    virtual std::vector<std::string> trackedFields() const = 0;
    virtual MetaValue fieldValue(const std::string& field) const = 0;
};

} // namespace auditlog
