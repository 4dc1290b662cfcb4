#pragma once

#include <cstddef>
#include <string>

namespace auditlog {

struct EngineConfig {
    std::string dataDir = "data";
    std::size_t workers = 2;
    std::size_t queueCapacity = 1024;
    bool testMode = false;

    // Defaults overridden by AUDITLOG_DATA_DIR, AUDITLOG_WORKERS,
    // AUDITLOG_QUEUE_CAPACITY and AUDITLOG_TEST_MODE.
    static EngineConfig fromEnvironment();
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string actorsFile;   // JSON list of API actors and their tokens

    // AUDITLOG_HOST, AUDITLOG_PORT, AUDITLOG_ACTORS
    static ServerConfig fromEnvironment();
};

} // namespace auditlog
