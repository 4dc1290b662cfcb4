#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "auditlog/Time.hpp"

namespace auditlog {

class Identifiable;

// Fixed-precision number: unscaled * 10^-scale ("9.99" is {999, 2}).
struct Decimal {
    int64_t unscaled = 0;
    uint32_t scale = 0;

    double toDouble() const;
    std::string str() const;
    bool operator==(const Decimal& o) const { return unscaled == o.unscaled && scale == o.scale; }
};

// Application object that knows its own JSON form. Either call may throw.
class OpaqueValue {
public:
    virtual ~OpaqueValue() = default;
    virtual nlohmann::json toJson() const = 0;
    // str()-equivalent text used when toJson() fails.
    virtual std::string describe() const = 0;
};

// Caller-supplied metadata value tree; converted to JSON by MetadataCodec.
class MetaValue {
public:
    enum class Kind { Null, Bool, Integer, Real, Text, Decimal, Date, DateTime, Entity, Opaque, List, Map };

    using List = std::vector<MetaValue>;
    using Map = std::map<std::string, MetaValue>;

    MetaValue() = default;
    MetaValue(std::nullptr_t) {}
    MetaValue(bool v) : kind_(Kind::Bool), bool_(v) {}
    MetaValue(int v) : kind_(Kind::Integer), int_(v) {}
    MetaValue(unsigned v) : kind_(Kind::Integer), int_(v) {}
    MetaValue(long v) : kind_(Kind::Integer), int_(v) {}
    MetaValue(unsigned long v) : kind_(Kind::Integer), int_(static_cast<int64_t>(v)) {}
    MetaValue(long long v) : kind_(Kind::Integer), int_(v) {}
    MetaValue(unsigned long long v) : kind_(Kind::Integer), int_(static_cast<int64_t>(v)) {}
    MetaValue(double v) : kind_(Kind::Real), real_(v) {}
    MetaValue(const char* v) : kind_(Kind::Text), text_(v) {}
    MetaValue(std::string v) : kind_(Kind::Text), text_(std::move(v)) {}
    MetaValue(Decimal v) : kind_(Kind::Decimal), decimal_(v) {}
    MetaValue(CalendarDate v) : kind_(Kind::Date), date_(v) {}
    MetaValue(Timestamp v) : kind_(Kind::DateTime), time_(v) {}
    MetaValue(std::shared_ptr<const Identifiable> entity);
    MetaValue(std::shared_ptr<const OpaqueValue> opaque);
    MetaValue(List items);
    MetaValue(Map fields);

    Kind kind() const { return kind_; }
    bool isNull() const { return kind_ == Kind::Null; }

    bool asBool() const { return bool_; }
    int64_t asInteger() const { return int_; }
    double asReal() const { return real_; }
    const std::string& asText() const { return text_; }
    const Decimal& asDecimal() const { return decimal_; }
    const CalendarDate& asDate() const { return date_; }
    Timestamp asDateTime() const { return time_; }
    const std::shared_ptr<const Identifiable>& asEntity() const { return entity_; }
    const std::shared_ptr<const OpaqueValue>& asOpaque() const { return opaque_; }
    const List& asList() const;
    const Map& asMap() const;

    // Structural equality. Entity and opaque values compare by identity.
    bool operator==(const MetaValue& other) const;
    bool operator!=(const MetaValue& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    int64_t int_ = 0;
    double real_ = 0.0;
    std::string text_;
    Decimal decimal_;
    CalendarDate date_;
    Timestamp time_{};
    std::shared_ptr<const Identifiable> entity_;
    std::shared_ptr<const OpaqueValue> opaque_;
    std::shared_ptr<const List> list_;
    std::shared_ptr<const Map> map_;
};

using Metadata = MetaValue::Map;

} // namespace auditlog
