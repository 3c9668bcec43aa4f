#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "common/errors.hpp"

namespace grafdiff {

namespace {

std::string requireString(const Value& j, const char* key, const char* what) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ValidationError(std::string(what) + " requires string field '" + key + "'");
    }
    return it->get<std::string>();
}

std::string optionalString(const Value& j, const char* key, const char* what) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw ValidationError(std::string(what) + " field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

Value optionalData(const Value& j, const char* what) {
    auto it = j.find("data");
    if (it == j.end() || it->is_null()) return Value::object();
    if (!it->is_object()) {
        throw ValidationError(std::string(what) + " field 'data' must be an object");
    }
    return *it;
}

} // namespace

void to_json(Value& j, const Node& node) {
    j = Value{{"id", node.id}, {"type", node.type}, {"data", node.data}};
}

void from_json(const Value& j, Node& node) {
    if (!j.is_object()) throw ValidationError("node must be a JSON object");
    node.id = requireString(j, "id", "node");
    node.type = optionalString(j, "type", "node");
    node.data = optionalData(j, "node");
}

void to_json(Value& j, const Edge& edge) {
    j = Value{{"id", edge.id},
              {"source", edge.source},
              {"target", edge.target},
              {"type", edge.type},
              {"data", edge.data}};
}

void from_json(const Value& j, Edge& edge) {
    if (!j.is_object()) throw ValidationError("edge must be a JSON object");
    edge.id = requireString(j, "id", "edge");
    edge.source = requireString(j, "source", "edge");
    edge.target = requireString(j, "target", "edge");
    edge.type = optionalString(j, "type", "edge");
    edge.data = optionalData(j, "edge");
}

} // namespace grafdiff
