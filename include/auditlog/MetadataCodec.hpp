#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "auditlog/MetaValue.hpp"

namespace auditlog {

enum class CodecTier { Structural = 1, Flattened = 2, Fallback = 3 };

struct EncodedMetadata {
    nlohmann::json json = nlohmann::json::object();
    CodecTier tier = CodecTier::Structural;
};

// Converts caller metadata into a JSON object that is always safe to store.
//
//  Tier 1: recursive conversion (decimal -> number, date -> ISO-8601 text,
//          entity -> {type, id, display}).
//  Tier 2: per top-level key, tier 1 on the item or its str() form.
//  Tier 3: {"error": "metadata serialization failed", "original_action": action}.
//
// encode() never throws.
class MetadataCodec {
public:
    static EncodedMetadata encode(const Metadata& metadata, const std::string& action) noexcept;

    // Tier 1 for a single value; throws when the value cannot be represented.
    static nlohmann::json encodeValue(const MetaValue& value);

    // str()-equivalent text for a value; throws only if an opaque value does.
    static std::string describe(const MetaValue& value);
};

} // namespace auditlog
