#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "auditlog/Capabilities.hpp"
#include "auditlog/Time.hpp"
#include "auditlog/Uuid.hpp"

namespace auditlog {

enum class ActionCategory {
    Create,
    Update,
    Delete,
    View,
    Login,
    Logout,
    Upload,
    Download,
    Share,
    System,
    Other
};

constexpr std::array<ActionCategory, 11> kAllCategories = {
    ActionCategory::Create, ActionCategory::Update, ActionCategory::Delete,
    ActionCategory::View, ActionCategory::Login, ActionCategory::Logout,
    ActionCategory::Upload, ActionCategory::Download, ActionCategory::Share,
    ActionCategory::System, ActionCategory::Other
};

// "CREATE"
const char* categoryName(ActionCategory category);
// "Create"
const char* categoryLabel(ActionCategory category);
std::optional<ActionCategory> parseCategory(std::string_view name);

constexpr size_t kMaxActionLength = 255;
constexpr size_t kMaxUserAgentLength = 500;

using EntryId = uint64_t;

struct ActorRef {
    EntityId id = 0;
    Uuid tag;
    std::string display;
};

// Weak (type, id) pointer at the entity an action was performed on.
struct TargetRef {
    std::string type;
    EntityId id = 0;

    // Empty when the entity has not been persisted yet.
    static std::optional<TargetRef> of(const Identifiable& entity);
};

// Request-scoped details stored beside the metadata.
struct RequestDetails {
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
};

// Everything the caller decides about an entry; the store adds id and timestamp.
struct EntryDraft {
    std::optional<ActorRef> actor;
    Uuid actorTag;
    std::string action;
    ActionCategory category = ActionCategory::Other;
    std::optional<TargetRef> target;
    RequestDetails details;
    nlohmann::json metadata = nlohmann::json::object();
};

struct LogEntry {
    EntryId id = 0;
    std::optional<ActorRef> actor;
    Uuid actorTag;
    std::string action;
    ActionCategory category = ActionCategory::Other;
    std::optional<TargetRef> target;
    RequestDetails details;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp timestamp{};
};

struct EntryHandle {
    EntryId id = 0;
    Timestamp timestamp{};
};

// Truncate to at most maxBytes without splitting a UTF-8 sequence.
std::string truncateUtf8(const std::string& text, size_t maxBytes);

// Finds the live object behind a target; empty once it has been deleted.
class TargetResolver {
public:
    virtual ~TargetResolver() = default;
    virtual std::optional<std::string> resolve(const TargetRef& target) const = 0;
};

constexpr const char* kUnavailableTarget = "object no longer available";

// Persisted form.
nlohmann::json toJson(const LogEntry& entry);

// Persisted form plus category_display, affected_model and affected_object.
nlohmann::json presentEntry(const LogEntry& entry, const TargetResolver* resolver);

// Throws std::runtime_error on a malformed record.
LogEntry entryFromJson(const nlohmann::json& j);

} // namespace auditlog
