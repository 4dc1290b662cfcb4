#include "AuditHttpServer.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
using namespace auditlog;

std::vector<ApiCredential> loadApiCredentials(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open actor file " + path);

    auto doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        throw std::runtime_error("actor file " + path + " must hold a JSON array");
    }

    std::vector<ApiCredential> out;
    for (const auto& item : doc) {
        auto tag = Uuid::parse(item.value("tag", ""));
        auto token = item.value("token", "");
        if (!tag || token.empty() || !item.contains("id")) {
            throw std::runtime_error("actor file " + path + " has an entry without id, tag or token");
        }
        auto actor = std::make_shared<const ApiActor>(item.at("id").get<EntityId>(), *tag,
                                                      item.value("name", tag->str()),
                                                      item.value("admin", false));
        out.push_back({token, actor});
    }
    return out;
}

AuditHttpServer::Authenticator AuditHttpServer::bearerAuthenticator(std::vector<ApiCredential> credentials) {
    return [credentials = std::move(credentials)](const httplib::Request& req) -> std::shared_ptr<const ApiActor> {
        const std::string prefix = "Bearer ";
        auto header = req.get_header_value("Authorization");
        if (header.compare(0, prefix.size(), prefix) != 0) return nullptr;
        auto token = header.substr(prefix.size());
        for (const auto& c : credentials) {
            if (c.token == token) return c.actor;
        }
        return nullptr;
    };
}

RequestInfo AuditHttpServer::describeExchange(const httplib::Request& req,
                                              const httplib::Response& res,
                                              std::shared_ptr<const Actor> actor) {
    RequestInfo info;
    info.method = req.method;
    info.path = req.path;
    info.status = res.status;
    info.remoteAddr = req.remote_addr;
    info.forwardedFor = req.get_header_value("X-Forwarded-For");
    info.userAgent = req.get_header_value("User-Agent");
    info.contentType = req.get_header_value("Content-Type");
    info.body = req.body;
    info.queryParams.insert(req.params.begin(), req.params.end());
    info.actor = std::move(actor);
    return info;
}

EntryQuery AuditHttpServer::parseQuery(const httplib::Request& req) {
    auto parseBounded = [](const std::string& val, size_t def, size_t min, size_t max) -> size_t {
        if (val.empty()) return def;
        try {
            auto v = static_cast<size_t>(std::stoull(val));
            return std::min(std::max(v, min), max);
        }
        catch (const std::exception&) { return def; }
    };

    EntryQuery q;
    auto category = req.get_param_value("category");
    if (!category.empty()) {
        q.category = parseCategory(category);
        if (!q.category) throw std::invalid_argument("unknown category '" + category + "'");
    }
    auto targetType = req.get_param_value("target_type");
    if (!targetType.empty()) q.targetType = targetType;
    auto targetId = req.get_param_value("target_id");
    if (!targetId.empty()) {
        try { q.targetId = static_cast<EntityId>(std::stoull(targetId)); }
        catch (const std::exception&) { throw std::invalid_argument("invalid target_id"); }
    }
    auto actorTag = req.get_param_value("actor_tag");
    if (!actorTag.empty()) {
        q.actorTag = Uuid::parse(actorTag);
        if (!q.actorTag) throw std::invalid_argument("invalid actor_tag");
    }
    auto since = req.get_param_value("since");
    if (!since.empty()) {
        q.since = parseTimestamp(since);
        if (!q.since) throw std::invalid_argument("invalid since timestamp");
    }
    auto until = req.get_param_value("until");
    if (!until.empty()) {
        q.until = parseTimestamp(until);
        if (!q.until) throw std::invalid_argument("invalid until timestamp");
    }
    q.search = req.get_param_value("search");
    auto order = req.get_param_value("order");
    if (order == "asc") q.sort = EntrySort::OldestFirst;
    else if (!order.empty() && order != "desc") throw std::invalid_argument("invalid order '" + order + "'");
    auto ordering = req.get_param_value("ordering");
    if (ordering == "timestamp") q.sort = EntrySort::OldestFirst;
    else if (ordering == "-timestamp") q.sort = EntrySort::NewestFirst;
    else if (ordering == "actor_tag") q.sort = EntrySort::ActorTagAsc;
    else if (ordering == "-actor_tag") q.sort = EntrySort::ActorTagDesc;
    else if (!ordering.empty()) throw std::invalid_argument("invalid ordering '" + ordering + "'");
    q.offset = parseBounded(req.get_param_value("offset"), 0, 0, 1'000'000);
    q.limit = parseBounded(req.get_param_value("size"), 50, 1, 500);
    return q;
}

AuditHttpServer::AuditHttpServer(std::string host, int port, AuditEngine& engine,
                                 Authenticator authenticate, const TargetResolver* resolver)
    : host_(std::move(host)), port_(port), engine_(engine),
      authenticate_(std::move(authenticate)), resolver_(resolver) {
    engine_.interceptor().addSkippedPrefix("/v1/health");
    setupRoutes();
}

void AuditHttpServer::run() {
    std::cout << "auditlog HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

void AuditHttpServer::stop() {
    server_.stop();
}

void AuditHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // Only administrators read the log. Writes the error response and returns false otherwise.
    auto authorize = [this, err](const httplib::Request& req, httplib::Response& res) {
        auto actor = authenticate_ ? authenticate_(req) : nullptr;
        if (!actor) {
            res.status = 401;
            res.set_content(err(401, "Authentication required").dump(), "application/json");
            return false;
        }
        if (!actor->isAdministrator()) {
            res.status = 403;
            res.set_content(err(403, "Administrator access required").dump(), "application/json");
            return false;
        }
        return true;
    };

    // One entry per finished exchange; the response is already final here.
    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        std::shared_ptr<const Actor> actor;
        try {
            if (authenticate_) actor = authenticate_(req);
        } catch (const std::exception& e) {
            std::cerr << "AuditHttpServer: authentication failed while logging: " << e.what() << "\n";
            return;
        }
        engine_.interceptor().observe(describeExchange(req, res, actor));
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok](const httplib::Request&, httplib::Response& res) {
        json data = {
            {"entries", engine_.store().count()},
            {"recorded", engine_.recorder().recorded()},
            {"failed", engine_.recorder().failed()},
            {"dropped", engine_.recorder().dropped()}
        };
        res.set_content(ok(data).dump(), "application/json");
    });

    // --- CATEGORY OPTIONS ---
    server_.Get("/v1/action-logs/category-options", [ok, authorize](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;
        json options = json::array();
        for (auto c : kAllCategories) {
            options.push_back({{"value", categoryName(c)}, {"label", categoryLabel(c)}});
        }
        res.set_content(ok(options).dump(), "application/json");
    });

    // --- MODEL OPTIONS ---
    server_.Get("/v1/action-logs/model-options", [this, ok, authorize](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;
        json options = json::array();
        for (const auto& type : engine_.store().targetTypes()) {
            options.push_back({{"value", type}, {"label", type}});
        }
        res.set_content(ok(options).dump(), "application/json");
    });

    // --- LIST ---
    server_.Get("/v1/action-logs", [this, ok, err, authorize](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;
        EntryQuery q;
        try {
            q = parseQuery(req);
        } catch (const std::invalid_argument& e) {
            res.status = 400;
            res.set_content(err(400, e.what()).dump(), "application/json");
            return;
        }

        auto result = engine_.store().query(q);
        json hits = json::array();
        for (const auto& entry : result.entries) {
            hits.push_back(presentEntry(entry, resolver_));
        }
        json data = {
            {"total", result.total},
            {"offset", q.offset},
            {"size", q.limit},
            {"results", hits}
        };
        res.set_content(ok(data).dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    });

    // --- GET ONE ---
    server_.Get(R"(/v1/action-logs/(\d+))", [this, ok, err, authorize](const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;
        EntryId id = 0;
        try {
            id = static_cast<EntryId>(std::stoull(req.matches[1]));
        } catch (const std::exception&) {
            res.status = 400;
            res.set_content(err(400, "Invalid entry id").dump(), "application/json");
            return;
        }
        auto entry = engine_.store().get(id);
        if (!entry) {
            res.status = 404;
            res.set_content(err(404, "Entry not found").dump(), "application/json");
            return;
        }
        res.set_content(ok(presentEntry(*entry, resolver_)).dump(-1, ' ', false, json::error_handler_t::replace),
                        "application/json");
    });
}
