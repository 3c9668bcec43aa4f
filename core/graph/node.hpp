#pragma once

#include "graph/value.hpp"

#include <string>

namespace grafdiff {

/// A code entity in a structural graph snapshot.
/// `data` is an arbitrary JSON object produced by the analyzer.
struct Node {
    std::string id;
    std::string type;
    Value data = Value::object();

    Node() = default;
    Node(std::string id, std::string type, Value data = Value::object())
        : id(std::move(id)), type(std::move(type)), data(std::move(data)) {}

    void setData(const std::string& key, Value value) {
        data[key] = std::move(value);
    }

    bool hasData(const std::string& key) const {
        return data.is_object() && data.contains(key);
    }

    bool operator==(const Node& other) const {
        return id == other.id && type == other.type && data == other.data;
    }
    bool operator!=(const Node& other) const { return !(*this == other); }
};

void to_json(Value& j, const Node& node);
void from_json(const Value& j, Node& node);

} // namespace grafdiff
