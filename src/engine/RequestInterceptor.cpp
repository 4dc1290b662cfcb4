#include "auditlog/RequestInterceptor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace auditlog {

namespace {

bool sensitiveKey(std::string key) {
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key.find("password") != std::string::npos ||
           key.find("token") != std::string::npos ||
           key.find("secret") != std::string::npos;
}

MetaValue fromJson(const json& j) {
    switch (j.type()) {
        case json::value_t::null: return MetaValue();
        case json::value_t::boolean: return MetaValue(j.get<bool>());
        case json::value_t::number_integer: return MetaValue(j.get<int64_t>());
        case json::value_t::number_unsigned: return MetaValue(j.get<uint64_t>());
        case json::value_t::number_float: return MetaValue(j.get<double>());
        case json::value_t::string: return MetaValue(j.get<std::string>());
        case json::value_t::array: {
            MetaValue::List items;
            for (const auto& item : j) items.push_back(fromJson(item));
            return MetaValue(std::move(items));
        }
        case json::value_t::object: {
            MetaValue::Map fields;
            for (auto it = j.begin(); it != j.end(); ++it) {
                fields[it.key()] = sensitiveKey(it.key()) ? MetaValue("[redacted]") : fromJson(it.value());
            }
            return MetaValue(std::move(fields));
        }
        default:
            return MetaValue();
    }
}

} // namespace

RequestInterceptor::RequestInterceptor(Recorder& recorder) : recorder_(recorder) {
    skippedPrefixes_ = {"/admin/", "/static/"};
    addExtractor(R"((?:^|/)documents/(\d+)(?:/|$))", "document_id");
    addExtractor(R"((?:^|/)timetables/(\d+)(?:/|$))", "timetable_id");
    addExtractor(R"((?:^|/)students/(\d+)(?:/|$))", "student_id");
}

void RequestInterceptor::addExtractor(const std::string& pattern, const std::string& metadataKey) {
    extractors_.push_back({std::regex(pattern), metadataKey});
}

void RequestInterceptor::addSkippedPrefix(const std::string& prefix) {
    skippedPrefixes_.push_back(prefix);
}

ActionCategory RequestInterceptor::categoryFor(const std::string& method) {
    if (method == "GET") return ActionCategory::View;
    if (method == "POST") return ActionCategory::Create;
    if (method == "PUT" || method == "PATCH") return ActionCategory::Update;
    if (method == "DELETE") return ActionCategory::Delete;
    return ActionCategory::Other;
}

std::string RequestInterceptor::clientIp(const RequestInfo& request) {
    if (!request.forwardedFor.empty()) {
        std::string first = request.forwardedFor.substr(0, request.forwardedFor.find(','));
        auto begin = first.find_first_not_of(" \t");
        auto end = first.find_last_not_of(" \t");
        if (begin != std::string::npos) return first.substr(begin, end - begin + 1);
    }
    return request.remoteAddr;
}

bool RequestInterceptor::skipped(const RequestInfo& request) const {
    if (recorder_.testMode()) return true;
    if (!request.actor) return true;
    if (request.status < 200 || request.status >= 400) return true;
    for (const auto& prefix : skippedPrefixes_) {
        if (request.path.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

Metadata RequestInterceptor::buildMetadata(const RequestInfo& request) const {
    Metadata metadata;
    metadata["method"] = request.method;
    metadata["path"] = request.path;
    metadata["status_code"] = request.status;

    MetaValue::Map params;
    for (const auto& kv : request.queryParams) {
        MetaValue::List values = params[kv.first].asList();
        values.push_back(kv.second);
        params[kv.first] = MetaValue(std::move(values));
    }
    metadata["query_params"] = MetaValue(std::move(params));

    MetaValue data;
    if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        if (request.contentType.find("application/json") != std::string::npos && !request.body.empty()) {
            auto parsed = json::parse(request.body, nullptr, false);
            if (!parsed.is_discarded()) data = fromJson(parsed);
        }
    }
    metadata["data"] = data;

    for (const auto& extractor : extractors_) {
        std::smatch m;
        if (std::regex_search(request.path, m, extractor.pattern) && m.size() > 1) {
            try {
                metadata[extractor.metadataKey] = static_cast<uint64_t>(std::stoull(m[1].str()));
            } catch (const std::exception&) {
                metadata[extractor.metadataKey] = m[1].str();
            }
        }
    }
    return metadata;
}

std::optional<DispatchMode> RequestInterceptor::observe(const RequestInfo& request) noexcept {
    try {
        if (skipped(request)) return std::nullopt;

        RequestDetails details;
        std::string ip = clientIp(request);
        if (!ip.empty()) details.ipAddress = ip;
        if (!request.userAgent.empty()) details.userAgent = request.userAgent;

        RecordingContext context{request.actor, nullptr};
        return recorder_.recordAsync(context, request.actor, request.method + " " + request.path,
                                     categoryFor(request.method), std::nullopt,
                                     buildMetadata(request), details);
    } catch (const std::exception& e) {
        std::cerr << "RequestInterceptor: failed to log " << request.method << " " << request.path
                  << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << "RequestInterceptor: failed to log request: unknown error\n";
    }
    return std::nullopt;
}

} // namespace auditlog
