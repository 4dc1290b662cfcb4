#pragma once

#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "auditlog/Recorder.hpp"

namespace auditlog {

// Framework-neutral view of a finished HTTP exchange.
struct RequestInfo {
    std::string method;
    std::string path;
    int status = 200;
    std::string remoteAddr;
    std::string forwardedFor;     // X-Forwarded-For
    std::string userAgent;
    std::string contentType;
    std::string body;
    std::multimap<std::string, std::string> queryParams;
    std::shared_ptr<const Actor> actor;   // null for anonymous callers
};

// Recognises a path shape and lifts an identifier out of it.
struct PathExtractor {
    std::regex pattern;           // first capture group is the identifier
    std::string metadataKey;
};

// Produces one entry per authenticated, successful request.
class RequestInterceptor {
public:
    explicit RequestInterceptor(Recorder& recorder);

    // Empty when the request was skipped. Never throws.
    std::optional<DispatchMode> observe(const RequestInfo& request) noexcept;

    void addExtractor(const std::string& pattern, const std::string& metadataKey);
    void addSkippedPrefix(const std::string& prefix);

    static ActionCategory categoryFor(const std::string& method);
    static std::string clientIp(const RequestInfo& request);

private:
    bool skipped(const RequestInfo& request) const;
    Metadata buildMetadata(const RequestInfo& request) const;

    Recorder& recorder_;
    std::vector<PathExtractor> extractors_;
    std::vector<std::string> skippedPrefixes_;
};

} // namespace auditlog
