#pragma once

#include "graph/value.hpp"

#include <string>

namespace grafdiff {

/// A directed relation between two nodes, referenced by node id.
struct Edge {
    std::string id;
    std::string source;
    std::string target;
    std::string type;
    Value data = Value::object();

    Edge() = default;
    Edge(std::string id, std::string source, std::string target,
         std::string type, Value data = Value::object())
        : id(std::move(id)), source(std::move(source)), target(std::move(target)),
          type(std::move(type)), data(std::move(data)) {}

    bool operator==(const Edge& other) const {
        return id == other.id && source == other.source && target == other.target &&
               type == other.type && data == other.data;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }
};

void to_json(Value& j, const Edge& edge);
void from_json(const Value& j, Edge& edge);

} // namespace grafdiff
