//AuditEngine.hpp
#pragma once

#include <string>
#include "auditlog/Config.hpp"
#include "auditlog/EntityEvents.hpp"
#include "auditlog/EntityObserver.hpp"
#include "auditlog/EntryStore.hpp"
#include "auditlog/Recorder.hpp"
#include "auditlog/RequestInterceptor.hpp"
#include "auditlog/WorkerPool.hpp"

namespace auditlog {

// Owns the store, the worker pool, the recorder and both producers.
class AuditEngine {
public:
    explicit AuditEngine(const EngineConfig& config = EngineConfig::fromEnvironment());
    ~AuditEngine();

    AuditEngine(const AuditEngine&) = delete;
    AuditEngine& operator=(const AuditEngine&) = delete;

    Recorder& recorder() { return recorder_; }
    EntryStore& store() { return store_; }
    const EntryStore& store() const { return store_; }
    EntityEventBus& events() { return bus_; }
    EntityObserver& observer() { return observer_; }
    RequestInterceptor& interceptor() { return interceptor_; }

    const EngineConfig& config() const { return config_; }

    // Drain queued writes and close the store. Safe to call twice.
    void shutdown();

private:
    EngineConfig config_;
    EntryStore store_;
    WorkerPool pool_;
    Recorder recorder_;
    EntityEventBus bus_;
    EntityObserver observer_;
    RequestInterceptor interceptor_;
};

} // namespace auditlog
