#include "auditlog/MetadataCodec.hpp"
#include "auditlog/Capabilities.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace auditlog {

namespace {

// dump() rejects invalid UTF-8; anything that fails here cannot be stored.
void ensureSerializable(const json& j) {
    (void)j.dump();
}

// Text with invalid UTF-8 sequences replaced by U+FFFD.
json sanitizedText(const std::string& text) {
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace));
}

std::string describeReal(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

json MetadataCodec::encodeValue(const MetaValue& value) {
    switch (value.kind()) {
        case MetaValue::Kind::Null:
            return nullptr;
        case MetaValue::Kind::Bool:
            return value.asBool();
        case MetaValue::Kind::Integer:
            return value.asInteger();
        case MetaValue::Kind::Real:
            return value.asReal();
        case MetaValue::Kind::Text:
            return value.asText();
        case MetaValue::Kind::Decimal:
            return value.asDecimal().toDouble();
        case MetaValue::Kind::Date:
            return formatDate(value.asDate());
        case MetaValue::Kind::DateTime:
            return formatTimestamp(value.asDateTime());
        case MetaValue::Kind::Entity: {
            const auto& entity = value.asEntity();
            auto id = entity->identity();
            return json{
                {"type", entity->typeTag()},
                {"id", id ? json(*id) : json(nullptr)},
                {"display", entity->display()}
            };
        }
        case MetaValue::Kind::Opaque:
            return value.asOpaque()->toJson();
        case MetaValue::Kind::List: {
            json arr = json::array();
            for (const auto& item : value.asList()) {
                arr.push_back(encodeValue(item));
            }
            return arr;
        }
        case MetaValue::Kind::Map: {
            json obj = json::object();
            for (const auto& kv : value.asMap()) {
                obj[kv.first] = encodeValue(kv.second);
            }
            return obj;
        }
    }
    throw std::logic_error("unknown metadata kind");
}

std::string MetadataCodec::describe(const MetaValue& value) {
    switch (value.kind()) {
        case MetaValue::Kind::Null: return "None";
        case MetaValue::Kind::Bool: return value.asBool() ? "True" : "False";
        case MetaValue::Kind::Integer: return std::to_string(value.asInteger());
        case MetaValue::Kind::Real: return describeReal(value.asReal());
        case MetaValue::Kind::Text: return value.asText();
        case MetaValue::Kind::Decimal: return value.asDecimal().str();
        case MetaValue::Kind::Date: return formatDate(value.asDate());
        case MetaValue::Kind::DateTime: return formatTimestamp(value.asDateTime());
        case MetaValue::Kind::Entity: return value.asEntity()->display();
        case MetaValue::Kind::Opaque: return value.asOpaque()->describe();
        case MetaValue::Kind::List: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : value.asList()) {
                if (!first) out += ", ";
                first = false;
                out += describe(item);
            }
            return out + "]";
        }
        case MetaValue::Kind::Map: {
            std::string out = "{";
            bool first = true;
            for (const auto& kv : value.asMap()) {
                if (!first) out += ", ";
                first = false;
                out += kv.first + ": " + describe(kv.second);
            }
            return out + "}";
        }
    }
    return std::string();
}

EncodedMetadata MetadataCodec::encode(const Metadata& metadata, const std::string& action) noexcept {
    EncodedMetadata out;

    try {
        json obj = json::object();
        for (const auto& kv : metadata) {
            obj[kv.first] = encodeValue(kv.second);
        }
        ensureSerializable(obj);
        out.json = std::move(obj);
        out.tier = CodecTier::Structural;
        return out;
    } catch (const std::exception& e) {
        std::cerr << "MetadataCodec: structural encoding failed (" << e.what() << "); flattening\n";
    } catch (...) {
        std::cerr << "MetadataCodec: structural encoding failed; flattening\n";
    }

    try {
        json obj = json::object();
        for (const auto& kv : metadata) {
            json item;
            try {
                item = encodeValue(kv.second);
                ensureSerializable(item);
            } catch (...) {
                item = sanitizedText(describe(kv.second));
            }
            obj[kv.first] = std::move(item);
        }
        ensureSerializable(obj);
        out.json = std::move(obj);
        out.tier = CodecTier::Flattened;
        return out;
    } catch (const std::exception& e) {
        std::cerr << "MetadataCodec: flattened encoding failed (" << e.what() << "); using fallback\n";
    } catch (...) {
        std::cerr << "MetadataCodec: flattened encoding failed; using fallback\n";
    }

    out.json = json{
        {"error", "metadata serialization failed"},
        {"original_action", action}
    };
    out.tier = CodecTier::Fallback;
    return out;
}

} // namespace auditlog
