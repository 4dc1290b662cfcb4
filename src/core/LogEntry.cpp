#include "auditlog/LogEntry.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace auditlog {

const char* categoryName(ActionCategory category) {
    switch (category) {
        case ActionCategory::Create: return "CREATE";
        case ActionCategory::Update: return "UPDATE";
        case ActionCategory::Delete: return "DELETE";
        case ActionCategory::View: return "VIEW";
        case ActionCategory::Login: return "LOGIN";
        case ActionCategory::Logout: return "LOGOUT";
        case ActionCategory::Upload: return "UPLOAD";
        case ActionCategory::Download: return "DOWNLOAD";
        case ActionCategory::Share: return "SHARE";
        case ActionCategory::System: return "SYSTEM";
        case ActionCategory::Other: return "OTHER";
    }
    return "OTHER";
}

const char* categoryLabel(ActionCategory category) {
    switch (category) {
        case ActionCategory::Create: return "Create";
        case ActionCategory::Update: return "Update";
        case ActionCategory::Delete: return "Delete";
        case ActionCategory::View: return "View";
        case ActionCategory::Login: return "Login";
        case ActionCategory::Logout: return "Logout";
        case ActionCategory::Upload: return "Upload";
        case ActionCategory::Download: return "Download";
        case ActionCategory::Share: return "Share";
        case ActionCategory::System: return "System";
        case ActionCategory::Other: return "Other";
    }
    return "Other";
}

std::optional<ActionCategory> parseCategory(std::string_view name) {
    for (auto c : kAllCategories) {
        if (name == categoryName(c)) return c;
    }
    return std::nullopt;
}

std::optional<TargetRef> TargetRef::of(const Identifiable& entity) {
    auto id = entity.identity();
    if (!id) return std::nullopt;
    return TargetRef{entity.typeTag(), *id};
}

std::string truncateUtf8(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t cut = maxBytes;
    // back up over continuation bytes so the lead byte is dropped too
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return text.substr(0, cut);
}

json toJson(const LogEntry& entry) {
    json j = {
        {"id", entry.id},
        {"actor_tag", entry.actorTag.str()},
        {"action", entry.action},
        {"category", categoryName(entry.category)},
        {"metadata", entry.metadata},
        {"timestamp", formatTimestamp(entry.timestamp)}
    };
    if (entry.actor) {
        j["actor"] = {
            {"id", entry.actor->id},
            {"tag", entry.actor->tag.str()},
            {"display", entry.actor->display}
        };
    } else {
        j["actor"] = nullptr;
    }
    if (entry.target) {
        j["target_type"] = entry.target->type;
        j["target_id"] = entry.target->id;
    } else {
        j["target_type"] = nullptr;
        j["target_id"] = nullptr;
    }
    j["ip_address"] = entry.details.ipAddress ? json(*entry.details.ipAddress) : json(nullptr);
    j["user_agent"] = entry.details.userAgent ? json(*entry.details.userAgent) : json(nullptr);
    return j;
}

json presentEntry(const LogEntry& entry, const TargetResolver* resolver) {
    json j = toJson(entry);
    j["category_display"] = categoryLabel(entry.category);
    if (entry.target) {
        j["affected_model"] = entry.target->type;
        std::optional<std::string> live;
        if (resolver) live = resolver->resolve(*entry.target);
        j["affected_object"] = live ? *live : std::string(kUnavailableTarget);
    } else {
        j["affected_model"] = nullptr;
        j["affected_object"] = nullptr;
    }
    return j;
}

LogEntry entryFromJson(const json& j) {
    if (!j.is_object()) throw std::runtime_error("entry record is not an object");

    LogEntry e;
    e.id = j.at("id").get<EntryId>();

    auto tag = Uuid::parse(j.at("actor_tag").get<std::string>());
    if (!tag) throw std::runtime_error("entry record has an invalid actor_tag");
    e.actorTag = *tag;

    e.action = j.at("action").get<std::string>();

    auto category = parseCategory(j.at("category").get<std::string>());
    if (!category) throw std::runtime_error("entry record has an unknown category");
    e.category = *category;

    const auto& actor = j.value("actor", json());
    if (actor.is_object()) {
        auto actorTag = Uuid::parse(actor.value("tag", ""));
        e.actor = ActorRef{actor.value("id", EntityId{0}), actorTag.value_or(e.actorTag), actor.value("display", "")};
    }

    const auto& targetType = j.value("target_type", json());
    const auto& targetId = j.value("target_id", json());
    if (targetType.is_string() && targetId.is_number_unsigned()) {
        e.target = TargetRef{targetType.get<std::string>(), targetId.get<EntityId>()};
    } else if (!targetType.is_null() || !targetId.is_null()) {
        throw std::runtime_error("entry record has a partial target");
    }

    const auto& ip = j.value("ip_address", json());
    if (ip.is_string()) e.details.ipAddress = ip.get<std::string>();
    const auto& ua = j.value("user_agent", json());
    if (ua.is_string()) e.details.userAgent = ua.get<std::string>();

    e.metadata = j.value("metadata", json::object());
    if (!e.metadata.is_object()) throw std::runtime_error("entry record metadata is not an object");

    auto ts = parseTimestamp(j.at("timestamp").get<std::string>());
    if (!ts) throw std::runtime_error("entry record has an invalid timestamp");
    e.timestamp = *ts;
    return e;
}

} // namespace auditlog
