/**
 * @file Value.cpp
 * @brief Variant classification for Value
 */

#include "jsonops/Value.hpp"
#include "jsonops/Errors.hpp"

namespace jsonops {

Kind kind_of(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
            return Kind::Null;
        case Value::value_t::boolean:
            return Kind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return Kind::Number;
        case Value::value_t::string:
            return Kind::String;
        case Value::value_t::array:
            return Kind::Array;
        case Value::value_t::object:
            return Kind::Object;
        case Value::value_t::binary:
        case Value::value_t::discarded:
            break;
    }
    throw UnsupportedValue(val.type_name());
}

const char* kind_name(Kind kind) noexcept {
    switch (kind) {
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Number:  return "number";
        case Kind::String:  return "string";
        case Kind::Array:   return "array";
        case Kind::Object:  return "object";
    }
    return "unknown";
}

std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return val.type_name();
}

bool structurally_equal(const Value& a, const Value& b) {
    const Kind ka = kind_of(a);
    if (ka != kind_of(b)) {
        return false;
    }

    switch (ka) {
        case Kind::Null:
            return true;
        case Kind::Boolean:
        case Kind::Number:
        case Kind::String:
            return a == b;
        case Kind::Array: {
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!structurally_equal(a[i], b[i])) return false;
            }
            return true;
        }
        case Kind::Object: {
            if (a.size() != b.size()) return false;
            for (auto it = a.begin(); it != a.end(); ++it) {
                auto other = b.find(it.key());
                if (other == b.end() || !structurally_equal(it.value(), *other)) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

} // namespace jsonops
