#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "auditlog/EntryStore.hpp"
#include "auditlog/LogEntry.hpp"
#include "auditlog/MetaValue.hpp"
#include "auditlog/Transaction.hpp"
#include "auditlog/WorkerPool.hpp"

namespace auditlog {

// How recordAsync() executed a call.
enum class DispatchMode {
    Inline,    // test mode: recorded before returning
    Deferred,  // registered to run after the enclosing transaction commits
    Queued,    // handed to the worker pool
    Dropped    // worker queue full or stopped; nothing recorded
};

const char* dispatchModeName(DispatchMode mode);

// The only call surface domain code needs. Auditing is best effort:
// nothing here throws into the caller's operation.
class Recorder {
public:
    Recorder(EntryStore& store, WorkerPool& pool);

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Synchronous write. Returns nothing when the actor has not been persisted
    // or when anything fails (the failure goes to the diagnostic stream).
    std::optional<EntryHandle> record(const std::shared_ptr<const Actor>& actor,
                                      const std::string& action,
                                      ActionCategory category,
                                      const std::optional<TargetRef>& target = std::nullopt,
                                      const Metadata& metadata = {},
                                      const RequestDetails& details = {});

    // Non-blocking write; see DispatchMode for the strategies.
    //
    // A Deferred entry is written by whichever thread commits the
    // transaction. The recorder and its store should outlive every scope it
    // was handed; a commit after the recorder is destroyed drops the entry
    // with a diagnostic. Destruction racing a concurrent commit is not
    // covered.
    DispatchMode recordAsync(const RecordingContext& context,
                             std::shared_ptr<const Actor> actor,
                             std::string action,
                             ActionCategory category,
                             std::optional<TargetRef> target = std::nullopt,
                             Metadata metadata = {},
                             RequestDetails details = {});

    // record() with no actor and {"system": true} merged into the metadata.
    std::optional<EntryHandle> recordSystem(const std::string& action,
                                            ActionCategory category,
                                            const std::optional<TargetRef>& target = std::nullopt,
                                            const Metadata& metadata = {});

    void setTestMode(bool enabled) { testMode_.store(enabled); }
    bool testMode() const { return testMode_.load(); }

    // Wait for every queued write to finish.
    void flush();

    std::size_t recorded() const { return recorded_.load(); }
    std::size_t failed() const { return failed_.load(); }
    std::size_t dropped() const { return dropped_.load(); }

    EntryStore& store() { return store_; }

private:
    EntryStore& store_;
    WorkerPool& pool_;
    std::atomic<bool> testMode_{false};
    std::atomic<std::size_t> recorded_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};
    // Deferred callbacks hold a weak reference; expired means the recorder is gone.
    std::shared_ptr<void> lifetime_ = std::make_shared<char>(0);
};

} // namespace auditlog
