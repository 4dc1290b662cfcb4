#include "auditlog/Recorder.hpp"
#include "auditlog/MetadataCodec.hpp"

#include <iostream>

namespace auditlog {

const char* dispatchModeName(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::Inline: return "inline";
        case DispatchMode::Deferred: return "deferred";
        case DispatchMode::Queued: return "queued";
        case DispatchMode::Dropped: return "dropped";
    }
    return "dropped";
}

Recorder::Recorder(EntryStore& store, WorkerPool& pool) : store_(store), pool_(pool) {}

std::optional<EntryHandle> Recorder::record(const std::shared_ptr<const Actor>& actor,
                                            const std::string& action,
                                            ActionCategory category,
                                            const std::optional<TargetRef>& target,
                                            const Metadata& metadata,
                                            const RequestDetails& details) {
    try {
        EntryDraft draft;
        if (actor) {
            // An actor without identity has nothing for the entry to point at yet.
            auto id = actor->identity();
            if (!id) return std::nullopt;
            draft.actor = ActorRef{*id, actor->stableTag(), actor->displayName()};
            draft.actorTag = draft.actor->tag;
        } else {
            draft.actorTag = Uuid::nil();
        }

        draft.action = action;
        draft.category = category;
        draft.target = target;
        draft.details = details;
        draft.metadata = MetadataCodec::encode(metadata, action).json;

        EntryHandle handle = store_.create(draft);
        ++recorded_;
        return handle;
    } catch (const std::exception& e) {
        ++failed_;
        std::cerr << "Recorder: failed to record '" << action << "': " << e.what() << "\n";
    } catch (...) {
        ++failed_;
        std::cerr << "Recorder: failed to record '" << action << "': unknown error\n";
    }
    return std::nullopt;
}

DispatchMode Recorder::recordAsync(const RecordingContext& context,
                                   std::shared_ptr<const Actor> actor,
                                   std::string action,
                                   ActionCategory category,
                                   std::optional<TargetRef> target,
                                   Metadata metadata,
                                   RequestDetails details) {
    if (testMode()) {
        record(actor, action, category, target, metadata, details);
        return DispatchMode::Inline;
    }

    auto task = [this, actor = std::move(actor), action = std::move(action), category,
                 target = std::move(target), metadata = std::move(metadata),
                 details = std::move(details)]() {
        record(actor, action, category, target, metadata, details);
    };

    try {
        if (context.transaction && context.transaction->isOpen()) {
            std::weak_ptr<void> alive = lifetime_;
            context.transaction->onCommit([alive, task = std::move(task)]() {
                if (alive.expired()) {
                    std::cerr << "Recorder: transaction committed after recorder shutdown; dropping entry\n";
                    return;
                }
                task();
            });
            return DispatchMode::Deferred;
        }
        if (pool_.trySubmit(std::move(task))) {
            return DispatchMode::Queued;
        }
        std::cerr << "Recorder: worker queue full or stopped; dropping entry\n";
    } catch (const std::exception& e) {
        std::cerr << "Recorder: could not dispatch entry: " << e.what() << "\n";
    }
    ++dropped_;
    return DispatchMode::Dropped;
}

std::optional<EntryHandle> Recorder::recordSystem(const std::string& action,
                                                  ActionCategory category,
                                                  const std::optional<TargetRef>& target,
                                                  const Metadata& metadata) {
    Metadata tagged = metadata;
    tagged["system"] = true;
    return record(nullptr, action, category, target, tagged);
}

void Recorder::flush() {
    pool_.waitIdle();
}

} // namespace auditlog
