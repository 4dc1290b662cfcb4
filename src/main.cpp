#include "AuditHttpServer.hpp"
#include <iostream>

int main() {
    try {
        auto serverConfig = auditlog::ServerConfig::fromEnvironment();
        std::vector<ApiCredential> credentials;
        if (!serverConfig.actorsFile.empty()) {
            credentials = loadApiCredentials(serverConfig.actorsFile);
        } else {
            std::cerr << "auditlogd: AUDITLOG_ACTORS not set; every request is anonymous\n";
        }

        auditlog::AuditEngine engine;
        engine.recorder().recordSystem("Audit service started", auditlog::ActionCategory::System);

        AuditHttpServer app(serverConfig.host, serverConfig.port, engine,
                            AuditHttpServer::bearerAuthenticator(std::move(credentials)));
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
