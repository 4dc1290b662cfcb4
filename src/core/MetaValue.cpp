#include "auditlog/MetaValue.hpp"
#include "auditlog/Capabilities.hpp"

#include <cmath>
#include <cstdlib>

namespace auditlog {

double Decimal::toDouble() const {
    // Parse the printed form so 9.99 comes back as the nearest double to 9.99.
    return std::strtod(str().c_str(), nullptr);
}

std::string Decimal::str() const {
    bool negative = unscaled < 0;
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(unscaled + 1)) + 1 : static_cast<uint64_t>(unscaled);
    std::string digits = std::to_string(magnitude);
    if (scale > 0) {
        if (digits.size() <= scale) {
            digits.insert(0, scale - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - scale, 1, '.');
    }
    return negative ? "-" + digits : digits;
}

MetaValue::MetaValue(std::shared_ptr<const Identifiable> entity)
    : kind_(entity ? Kind::Entity : Kind::Null), entity_(std::move(entity)) {}

MetaValue::MetaValue(std::shared_ptr<const OpaqueValue> opaque)
    : kind_(opaque ? Kind::Opaque : Kind::Null), opaque_(std::move(opaque)) {}

MetaValue::MetaValue(List items)
    : kind_(Kind::List), list_(std::make_shared<const List>(std::move(items))) {}

MetaValue::MetaValue(Map fields)
    : kind_(Kind::Map), map_(std::make_shared<const Map>(std::move(fields))) {}

const MetaValue::List& MetaValue::asList() const {
    static const List empty;
    return list_ ? *list_ : empty;
}

const MetaValue::Map& MetaValue::asMap() const {
    static const Map empty;
    return map_ ? *map_ : empty;
}

bool MetaValue::operator==(const MetaValue& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::Null: return true;
        case Kind::Bool: return bool_ == other.bool_;
        case Kind::Integer: return int_ == other.int_;
        case Kind::Real: return real_ == other.real_ || (std::isnan(real_) && std::isnan(other.real_));
        case Kind::Text: return text_ == other.text_;
        case Kind::Decimal: return decimal_ == other.decimal_;
        case Kind::Date: return date_ == other.date_;
        case Kind::DateTime: return time_ == other.time_;
        case Kind::Entity: return entity_ == other.entity_;
        case Kind::Opaque: return opaque_ == other.opaque_;
        case Kind::List: return asList() == other.asList();
        case Kind::Map: return asMap() == other.asMap();
    }
    return false;
}

std::string Identifiable::display() const {
    auto id = identity();
    return typeTag() + (id ? " #" + std::to_string(*id) : std::string(" (unsaved)"));
}

} // namespace auditlog
