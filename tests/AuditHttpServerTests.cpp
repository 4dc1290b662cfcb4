#include "TestSupport.hpp"
#include "AuditHttpServer.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace testsupport;
using json = nlohmann::json;

static const char* kActorsFile = "testdata_actors.json";

static void writeActors() {
    std::ofstream out(kActorsFile);
    out << R"([
        {"id": 1, "tag": "6f1c8a52-3b7e-4d7a-9c1e-2f4b5a6d7e80", "name": "Head", "token": "admin-token", "admin": true},
        {"id": 2, "tag": "0b9d2c41-8e3f-4a6b-b7c5-1d2e3f4a5b6c", "name": "Clerk", "token": "clerk-token"}
    ])";
}

int main() {
    writeActors();
    auto credentials = loadApiCredentials(kActorsFile);
    expect(credentials.size() == 2, "two credentials loaded");
    expect(credentials[0].actor->isAdministrator(), "first actor is admin");
    expect(!credentials[1].actor->isAdministrator(), "admin defaults to false");
    expect(credentials[1].actor->displayName() == "Clerk", "actor name loaded");

    bool threw = false;
    try {
        loadApiCredentials("does_not_exist.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "missing actor file should throw");

    // Bearer tokens
    {
        auto auth = AuditHttpServer::bearerAuthenticator(credentials);
        httplib::Request req;
        expect(auth(req) == nullptr, "no header is anonymous");
        req.headers.emplace("Authorization", "Bearer clerk-token");
        auto actor = auth(req);
        expect(actor && actor->identity() == EntityId{2}, "token maps to actor");

        httplib::Request wrong;
        wrong.headers.emplace("Authorization", "Bearer nope");
        expect(auth(wrong) == nullptr, "unknown token is anonymous");
    }

    // Query parameters
    {
        httplib::Request req;
        req.params.emplace("category", "VIEW");
        req.params.emplace("target_type", "Student");
        req.params.emplace("target_id", "42");
        req.params.emplace("since", "2024-01-01");
        req.params.emplace("search", "report");
        req.params.emplace("order", "asc");
        req.params.emplace("size", "9999");
        auto q = AuditHttpServer::parseQuery(req);
        expect(q.category == ActionCategory::View, "category parsed");
        expect(q.targetType == std::string("Student") && q.targetId == EntityId{42}, "target parsed");
        expect(q.since.has_value() && !q.until, "since parsed");
        expect(q.search == "report" && q.sort == EntrySort::OldestFirst, "search and order parsed");
        expect(q.limit == 500 && q.offset == 0, "size clamped");

        httplib::Request defaults;
        auto d = AuditHttpServer::parseQuery(defaults);
        expect(d.limit == 50 && d.sort == EntrySort::NewestFirst && !d.category, "defaults");

        httplib::Request byTag;
        byTag.params.emplace("ordering", "-actor_tag");
        expect(AuditHttpServer::parseQuery(byTag).sort == EntrySort::ActorTagDesc, "actor tag ordering");
        httplib::Request byTime;
        byTime.params.emplace("ordering", "timestamp");
        expect(AuditHttpServer::parseQuery(byTime).sort == EntrySort::OldestFirst, "timestamp ordering");

        for (const auto& param : {std::make_pair("ordering", "name"), std::make_pair("order", "sideways")}) {
            httplib::Request unknown;
            unknown.params.emplace(param.first, param.second);
            bool refused = false;
            try {
                AuditHttpServer::parseQuery(unknown);
            } catch (const std::invalid_argument&) {
                refused = true;
            }
            expect(refused, std::string("unknown ") + param.first + " rejected");
        }

        httplib::Request bad;
        bad.params.emplace("actor_tag", "not-a-uuid");
        bool rejected = false;
        try {
            AuditHttpServer::parseQuery(bad);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        expect(rejected, "invalid actor tag rejected");
    }

    // Exchange description
    {
        httplib::Request req;
        req.method = "PATCH";
        req.path = "/api/students/3";
        req.remote_addr = "10.1.1.1";
        req.body = "{}";
        req.headers.emplace("X-Forwarded-For", "198.51.100.7");
        req.headers.emplace("User-Agent", "tests");
        req.headers.emplace("Content-Type", "application/json");
        req.params.emplace("dry_run", "1");
        httplib::Response res;
        res.status = 204;
        auto info = AuditHttpServer::describeExchange(req, res, credentials[0].actor);
        expect(info.method == "PATCH" && info.path == "/api/students/3", "method and path");
        expect(info.status == 204, "status");
        expect(RequestInterceptor::clientIp(info) == "198.51.100.7", "forwarded address");
        expect(info.userAgent == "tests" && info.contentType == "application/json", "headers");
        expect(info.queryParams.count("dry_run") == 1, "query params");
        expect(info.actor == credentials[0].actor, "actor");
    }

    // Live server
    {
        AuditEngine engine(memoryConfig());
        auto head = credentials[0].actor;
        engine.recorder().record(head, "Created Student", ActionCategory::Create, TargetRef{"Student", 42});
        engine.recorder().record(head, "Created Timetable", ActionCategory::Create, TargetRef{"Timetable", 7});

        const int port = 18089;
        AuditHttpServer server("127.0.0.1", port, engine, AuditHttpServer::bearerAuthenticator(credentials));
        std::thread serverThread([&server] {
            try {
                server.run();
            } catch (const std::exception& e) {
                std::cerr << "server failed: " << e.what() << std::endl;
            }
        });

        httplib::Client cli("127.0.0.1", port);
        bool up = false;
        for (int i = 0; i < 100 && !up; ++i) {
            auto res = cli.Get("/v1/health");
            up = res && res->status == 200;
            if (!up) std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        expect(up, "server should answer health checks");

        const httplib::Headers adminAuth = {{"Authorization", "Bearer admin-token"}};
        const httplib::Headers clerkAuth = {{"Authorization", "Bearer clerk-token"}};

        auto anon = cli.Get("/v1/action-logs");
        expect(anon && anon->status == 401, "anonymous caller rejected");
        auto clerk = cli.Get("/v1/action-logs", clerkAuth);
        expect(clerk && clerk->status == 403, "non-admin rejected");

        auto list = cli.Get("/v1/action-logs", adminAuth);
        expect(list && list->status == 200, "admin can list");
        auto body = json::parse(list->body);
        expect(body["status"] == "ok", "ok envelope");
        expect(body["data"]["total"] == 2, "both seeded entries listed");
        expect(body["data"]["results"][0]["action"] == "Created Timetable", "newest first");
        expect(body["data"]["results"][0]["affected_model"] == "Timetable", "affected model presented");
        expect(body["data"]["results"][0]["affected_object"] == kUnavailableTarget, "no resolver means unavailable");

        auto one = cli.Get("/v1/action-logs/1", adminAuth);
        expect(one && one->status == 200, "single entry");
        expect(json::parse(one->body)["data"]["category_display"] == "Create", "category label presented");

        auto missing = cli.Get("/v1/action-logs/999", adminAuth);
        expect(missing && missing->status == 404, "missing entry is 404");

        auto byActor = cli.Get("/v1/action-logs?category=CREATE&search=head&ordering=actor_tag", adminAuth);
        expect(byActor && byActor->status == 200, "search and ordering accepted");
        expect(json::parse(byActor->body)["data"]["total"] == 2, "search matches the actor name");

        auto bogus = cli.Get("/v1/action-logs?category=BOGUS", adminAuth);
        expect(bogus && bogus->status == 400, "unknown category is 400");

        auto categories = cli.Get("/v1/action-logs/category-options", adminAuth);
        expect(categories && json::parse(categories->body)["data"].size() == kAllCategories.size(), "category options");

        auto models = cli.Get("/v1/action-logs/model-options", adminAuth);
        auto modelData = json::parse(models->body)["data"];
        expect(modelData.size() == 2 && modelData[0]["value"] == "Student", "model options");

        engine.recorder().flush();
        EntryQuery views;
        views.category = ActionCategory::View;
        views.search = "/v1/action-logs";
        expect(engine.store().query(views).total == 5, "successful admin requests are logged");

        EntryQuery health;
        health.search = "/v1/health";
        expect(engine.store().query(health).total == 0, "health checks are not logged");

        server.stop();
        serverThread.join();
    }

    std::filesystem::remove(kActorsFile);
    std::cout << "All tests passed." << std::endl;
    return 0;
}
