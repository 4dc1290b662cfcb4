//AuditEngine.cpp
#include "AuditEngine.hpp"

#include <iostream>

namespace auditlog {

AuditEngine::AuditEngine(const EngineConfig& config)
    : config_(config),
      store_(config.dataDir),
      pool_(config.workers, config.queueCapacity),
      recorder_(store_, pool_),
      observer_(recorder_, bus_),
      interceptor_(recorder_) {
    recorder_.setTestMode(config_.testMode);
    std::cerr << "AuditEngine: dataDir=" << (config_.dataDir.empty() ? "(memory)" : config_.dataDir)
              << " workers=" << pool_.workerCount()
              << " queueCapacity=" << pool_.capacity()
              << " testMode=" << (config_.testMode ? "on" : "off")
              << " entries=" << store_.count() << "\n";
}

AuditEngine::~AuditEngine() {
    shutdown();
}

void AuditEngine::shutdown() {
    // Queued tasks call into the recorder and the store; finish them first.
    pool_.stop();
    store_.close();
}

} // namespace auditlog
