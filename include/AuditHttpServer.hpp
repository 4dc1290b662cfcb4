#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "httplib.h"
#include "AuditEngine.hpp"
#include <nlohmann/json.hpp>

// Principal known to the HTTP service through a bearer token.
class ApiActor : public auditlog::Actor {
public:
    ApiActor(auditlog::EntityId id, auditlog::Uuid tag, std::string name, bool admin)
        : id_(id), tag_(tag), name_(std::move(name)), admin_(admin) {}

    std::optional<auditlog::EntityId> identity() const override { return id_; }
    auditlog::Uuid stableTag() const override { return tag_; }
    std::string displayName() const override { return name_; }
    bool isAdministrator() const { return admin_; }

private:
    auditlog::EntityId id_;
    auditlog::Uuid tag_;
    std::string name_;
    bool admin_;
};

struct ApiCredential {
    std::string token;
    std::shared_ptr<const ApiActor> actor;
};

// Reads [{"id": 1, "tag": "<uuid>", "name": "...", "token": "...", "admin": true}, ...].
// Throws std::runtime_error when the file is missing or malformed.
std::vector<ApiCredential> loadApiCredentials(const std::string& path);

class AuditHttpServer {
public:
    using Authenticator = std::function<std::shared_ptr<const ApiActor>(const httplib::Request&)>;

    AuditHttpServer(std::string host, int port, auditlog::AuditEngine& engine,
                    Authenticator authenticate, const auditlog::TargetResolver* resolver = nullptr);
    void run();
    void stop();

    // "Authorization: Bearer <token>" against a fixed credential list.
    static Authenticator bearerAuthenticator(std::vector<ApiCredential> credentials);

    static auditlog::RequestInfo describeExchange(const httplib::Request& req,
                                                  const httplib::Response& res,
                                                  std::shared_ptr<const auditlog::Actor> actor);

    // Maps query parameters onto a store query; throws std::invalid_argument on bad input.
    static auditlog::EntryQuery parseQuery(const httplib::Request& req);

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    auditlog::AuditEngine& engine_;
    Authenticator authenticate_;
    const auditlog::TargetResolver* resolver_;
};
