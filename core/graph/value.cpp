#include "graph/value.hpp"

#include <algorithm>

namespace grafdiff {

ValueKind kindOf(const Value& value) {
    switch (value.type()) {
        case Value::value_t::boolean:
            return ValueKind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return ValueKind::Number;
        case Value::value_t::string:
        case Value::value_t::binary:
            return ValueKind::String;
        case Value::value_t::array:
            return ValueKind::Array;
        case Value::value_t::object:
            return ValueKind::Object;
        case Value::value_t::null:
        case Value::value_t::discarded:
        default:
            return ValueKind::Null;
    }
}

const char* kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number:  return "number";
        case ValueKind::String:  return "string";
        case ValueKind::Array:   return "array";
        case ValueKind::Object:  return "object";
    }
    return "null";
}

std::string joinPath(const PropertyPath& path, char separator) {
    std::string out;
    for (size_t i = 0; i < path.size(); i++) {
        if (i > 0) out += separator;
        out += path[i];
    }
    return out;
}

bool pathContains(const PropertyPath& path, const std::string& segment) {
    return std::find(path.begin(), path.end(), segment) != path.end();
}

} // namespace grafdiff
