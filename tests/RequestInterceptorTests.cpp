#include "TestSupport.hpp"

using namespace testsupport;

static RequestInfo request(const std::string& method, const std::string& path, std::shared_ptr<const Actor> actor) {
    RequestInfo info;
    info.method = method;
    info.path = path;
    info.status = 200;
    info.remoteAddr = "127.0.0.1";
    info.actor = std::move(actor);
    return info;
}

int main() {
    auto admin = std::make_shared<StaffActor>(1, "admin");

    // Method to category
    expect(RequestInterceptor::categoryFor("GET") == ActionCategory::View, "GET is VIEW");
    expect(RequestInterceptor::categoryFor("POST") == ActionCategory::Create, "POST is CREATE");
    expect(RequestInterceptor::categoryFor("PUT") == ActionCategory::Update, "PUT is UPDATE");
    expect(RequestInterceptor::categoryFor("PATCH") == ActionCategory::Update, "PATCH is UPDATE");
    expect(RequestInterceptor::categoryFor("DELETE") == ActionCategory::Delete, "DELETE is DELETE");
    expect(RequestInterceptor::categoryFor("OPTIONS") == ActionCategory::Other, "other methods are OTHER");

    // Client address
    {
        auto info = request("GET", "/", admin);
        expect(RequestInterceptor::clientIp(info) == "127.0.0.1", "remote address without proxy");
        info.forwardedFor = " 203.0.113.9 , 10.0.0.1";
        expect(RequestInterceptor::clientIp(info) == "203.0.113.9", "first forwarded address wins");
    }

    // A logged request
    {
        AuditEngine engine(memoryConfig());
        auto& interceptor = engine.interceptor();

        auto info = request("GET", "/api/documents/17/", admin);
        info.userAgent = "curl/8.0";
        info.queryParams = {{"page", "2"}, {"tag", "a"}, {"tag", "b"}};
        auto mode = interceptor.observe(info);
        expect(mode && *mode == DispatchMode::Queued, "request entry should be queued");
        engine.recorder().flush();

        expect(engine.store().count() == 1, "one entry per request");
        auto entry = engine.store().get(1);
        expect(entry->action == "GET /api/documents/17/", "action is method and path");
        expect(entry->category == ActionCategory::View, "GET logged as VIEW");
        expect(!entry->target, "request entries have no target");
        expect(entry->details.ipAddress == std::string("127.0.0.1"), "ip stored");
        expect(entry->details.userAgent == std::string("curl/8.0"), "user agent stored");

        const auto& md = entry->metadata;
        expect(md["method"] == "GET" && md["path"] == "/api/documents/17/", "method and path in metadata");
        expect(md["status_code"] == 200, "status code in metadata");
        expect(md["query_params"]["tag"] == nlohmann::json::array({"a", "b"}), "repeated params kept as list");
        expect(md["query_params"]["page"] == nlohmann::json::array({"2"}), "single param is a one-item list");
        expect(md["data"].is_null(), "GET carries no body data");
        expect(md["document_id"] == 17, "document id extracted from path");
        expect(!md.contains("student_id"), "no student id on a document path");
    }

    // Bodies are recorded with secrets redacted
    {
        AuditEngine engine(memoryConfig());
        auto info = request("POST", "/api/students/9/password", admin);
        info.status = 201;
        info.contentType = "application/json; charset=utf-8";
        info.body = R"({"name":"Ada","password":"hunter2","profile":{"api_token":"x","age":12}})";
        engine.interceptor().observe(info);
        engine.recorder().flush();

        auto entry = engine.store().get(1);
        expect(entry->category == ActionCategory::Create, "POST logged as CREATE");
        const auto& data = entry->metadata["data"];
        expect(data["name"] == "Ada", "plain body field kept");
        expect(data["password"] == "[redacted]", "password redacted");
        expect(data["profile"]["api_token"] == "[redacted]", "nested token redacted");
        expect(data["profile"]["age"] == 12, "nested plain field kept");
        expect(entry->metadata["student_id"] == 9, "student id extracted");
    }

    // Custom extractors
    {
        AuditEngine engine(memoryConfig());
        engine.interceptor().addExtractor(R"((?:^|/)rooms/(\d+)(?:/|$))", "room_id");
        engine.interceptor().observe(request("DELETE", "/api/rooms/4", admin));
        engine.recorder().flush();
        expect(engine.store().get(1)->metadata["room_id"] == 4, "custom extractor applied");
    }

    // Skipped requests
    {
        AuditEngine engine(memoryConfig());
        auto& interceptor = engine.interceptor();

        expect(!interceptor.observe(request("GET", "/api/documents/", nullptr)), "anonymous request skipped");

        auto failed = request("POST", "/api/documents/", admin);
        failed.status = 400;
        expect(!interceptor.observe(failed), "client error skipped");
        failed.status = 403;
        expect(!interceptor.observe(failed), "forbidden skipped");
        failed.status = 500;
        expect(!interceptor.observe(failed), "server error skipped");

        auto redirect = request("GET", "/api/login", admin);
        redirect.status = 302;
        expect(interceptor.observe(redirect).has_value(), "redirect still logged");

        expect(!interceptor.observe(request("GET", "/admin/users/", admin)), "admin pages skipped");
        expect(!interceptor.observe(request("GET", "/static/app.js", admin)), "static files skipped");

        interceptor.addSkippedPrefix("/v1/health");
        expect(!interceptor.observe(request("GET", "/v1/health", admin)), "extra prefix skipped");

        engine.recorder().flush();
        expect(engine.store().count() == 1, "only the redirect was logged");
    }

    // Nothing is logged while the recorder is in test mode
    {
        AuditEngine engine(memoryConfig(true));
        expect(!engine.interceptor().observe(request("GET", "/api/documents/", admin)), "test mode skips requests");
        expect(engine.store().count() == 0, "no entry in test mode");
    }

    // Malformed bodies are not an error
    {
        AuditEngine engine(memoryConfig());
        auto info = request("PUT", "/api/timetables/3", admin);
        info.contentType = "application/json";
        info.body = "{not json";
        auto mode = engine.interceptor().observe(info);
        engine.recorder().flush();
        expect(mode.has_value(), "malformed body still logged");
        auto entry = engine.store().get(1);
        expect(entry->metadata["data"].is_null(), "malformed body recorded as null");
        expect(entry->metadata["timetable_id"] == 3, "timetable id extracted");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
