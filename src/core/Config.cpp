#include "auditlog/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace auditlog {

namespace {

void ignored(const char* name, const char* value) {
    std::cerr << "Config: ignoring invalid " << name << "=" << value << "\n";
}

bool flagValue(const std::string& v) {
    return !(v.empty() || v == "0" || v == "false" || v == "off");
}

} // namespace

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig cfg;
    if (const char* envDir = std::getenv("AUDITLOG_DATA_DIR")) {
        cfg.dataDir = envDir;
    }
    if (const char* envWorkers = std::getenv("AUDITLOG_WORKERS")) {
        try { cfg.workers = std::max<size_t>(1, static_cast<size_t>(std::stoull(envWorkers))); }
        catch (const std::exception&) { ignored("AUDITLOG_WORKERS", envWorkers); }
    }
    if (const char* envCap = std::getenv("AUDITLOG_QUEUE_CAPACITY")) {
        try { cfg.queueCapacity = std::max<size_t>(1, static_cast<size_t>(std::stoull(envCap))); }
        catch (const std::exception&) { ignored("AUDITLOG_QUEUE_CAPACITY", envCap); }
    }
    if (const char* envTest = std::getenv("AUDITLOG_TEST_MODE")) {
        cfg.testMode = flagValue(envTest);
    }
    return cfg;
}

ServerConfig ServerConfig::fromEnvironment() {
    ServerConfig cfg;
    if (const char* envHost = std::getenv("AUDITLOG_HOST")) {
        cfg.host = envHost;
    }
    if (const char* envPort = std::getenv("AUDITLOG_PORT")) {
        try { cfg.port = std::clamp(std::stoi(envPort), 1, 65535); }
        catch (const std::exception&) { ignored("AUDITLOG_PORT", envPort); }
    }
    if (const char* envActors = std::getenv("AUDITLOG_ACTORS")) {
        cfg.actorsFile = envActors;
    }
    return cfg;
}

} // namespace auditlog
