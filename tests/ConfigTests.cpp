#include "TestSupport.hpp"

#include <cstdlib>

using namespace testsupport;

int main() {
    unsetenv("AUDITLOG_DATA_DIR");
    unsetenv("AUDITLOG_WORKERS");
    unsetenv("AUDITLOG_QUEUE_CAPACITY");
    unsetenv("AUDITLOG_TEST_MODE");
    unsetenv("AUDITLOG_HOST");
    unsetenv("AUDITLOG_PORT");
    unsetenv("AUDITLOG_ACTORS");

    auto defaults = EngineConfig::fromEnvironment();
    expect(defaults.dataDir == "data", "default data dir");
    expect(defaults.workers == 2 && defaults.queueCapacity == 1024, "default pool sizes");
    expect(!defaults.testMode, "test mode off by default");

    auto server = ServerConfig::fromEnvironment();
    expect(server.host == "0.0.0.0" && server.port == 8080, "default listen address");
    expect(server.actorsFile.empty(), "no actor file by default");

    setenv("AUDITLOG_DATA_DIR", "/tmp/auditlog", 1);
    setenv("AUDITLOG_WORKERS", "4", 1);
    setenv("AUDITLOG_QUEUE_CAPACITY", "lots", 1);
    setenv("AUDITLOG_TEST_MODE", "1", 1);
    setenv("AUDITLOG_PORT", "9090", 1);
    setenv("AUDITLOG_ACTORS", "actors.json", 1);

    auto cfg = EngineConfig::fromEnvironment();
    expect(cfg.dataDir == "/tmp/auditlog", "data dir from environment");
    expect(cfg.workers == 4, "workers from environment");
    expect(cfg.queueCapacity == 1024, "invalid capacity keeps default");
    expect(cfg.testMode, "test mode from environment");

    setenv("AUDITLOG_TEST_MODE", "off", 1);
    setenv("AUDITLOG_WORKERS", "0", 1);
    auto off = EngineConfig::fromEnvironment();
    expect(!off.testMode, "off disables test mode");
    expect(off.workers == 1, "at least one worker");

    auto srv = ServerConfig::fromEnvironment();
    expect(srv.port == 9090 && srv.actorsFile == "actors.json", "server settings from environment");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
