#include "diff/change.hpp"

namespace grafdiff {

namespace {

template <typename E>
const std::string& entityIdOf(const Addition<E>& a) { return a.after.id; }
template <typename E>
const std::string& entityIdOf(const Removal<E>& r) { return r.before.id; }
template <typename E>
const std::string& entityIdOf(const Modification<E>& m) { return m.before.id; }

template <typename E>
const Modification<E>* modificationOf(const ChangeDetail& detail) {
    return std::get_if<Modification<E>>(&detail);
}

template <typename E>
const E* beforeOf(const ChangeDetail& detail) {
    if (auto* r = std::get_if<Removal<E>>(&detail)) return &r->before;
    if (auto* m = std::get_if<Modification<E>>(&detail)) return &m->before;
    return nullptr;
}

template <typename E>
const E* afterOf(const ChangeDetail& detail) {
    if (auto* a = std::get_if<Addition<E>>(&detail)) return &a->after;
    if (auto* m = std::get_if<Modification<E>>(&detail)) return &m->after;
    return nullptr;
}

} // namespace

const char* toString(ChangeType type) {
    switch (type) {
        case ChangeType::NodeAdded:    return "node_added";
        case ChangeType::NodeRemoved:  return "node_removed";
        case ChangeType::NodeModified: return "node_modified";
        case ChangeType::EdgeAdded:    return "edge_added";
        case ChangeType::EdgeRemoved:  return "edge_removed";
        case ChangeType::EdgeModified: return "edge_modified";
    }
    return "unknown";
}

const char* toString(EntityKind kind) {
    return kind == EntityKind::Node ? "node" : "edge";
}

const char* toString(ChangeCategory category) {
    switch (category) {
        case ChangeCategory::Structural: return "structural";
        case ChangeCategory::Data:       return "data";
        case ChangeCategory::Metadata:   return "metadata";
        case ChangeCategory::Behavioral: return "behavioral";
    }
    return "unknown";
}

const char* toString(ChangeImpact impact) {
    switch (impact) {
        case ChangeImpact::Breaking:    return "breaking";
        case ChangeImpact::Compatible:  return "compatible";
        case ChangeImpact::Enhancement: return "enhancement";
        case ChangeImpact::Cosmetic:    return "cosmetic";
    }
    return "unknown";
}

// ─── Change accessors ──────────────────────────────────────────

EntityKind Change::entity() const {
    switch (type()) {
        case ChangeType::NodeAdded:
        case ChangeType::NodeRemoved:
        case ChangeType::NodeModified:
            return EntityKind::Node;
        default:
            return EntityKind::Edge;
    }
}

const std::string& Change::entityId() const {
    return std::visit([](const auto& d) -> const std::string& { return entityIdOf(d); },
                      detail);
}

bool Change::isModification() const {
    return type() == ChangeType::NodeModified || type() == ChangeType::EdgeModified;
}

const PropertyPath* Change::path() const {
    if (auto* m = modificationOf<Node>(detail)) return &m->path;
    if (auto* m = modificationOf<Edge>(detail)) return &m->path;
    return nullptr;
}

const Value* Change::oldValue() const {
    const OptionalValue* v = nullptr;
    if (auto* m = modificationOf<Node>(detail)) v = &m->old_value;
    if (auto* m = modificationOf<Edge>(detail)) v = &m->old_value;
    return v && v->has_value() ? &**v : nullptr;
}

const Value* Change::newValue() const {
    const OptionalValue* v = nullptr;
    if (auto* m = modificationOf<Node>(detail)) v = &m->new_value;
    if (auto* m = modificationOf<Edge>(detail)) v = &m->new_value;
    return v && v->has_value() ? &**v : nullptr;
}

const Node* Change::beforeNode() const { return beforeOf<Node>(detail); }
const Node* Change::afterNode() const { return afterOf<Node>(detail); }
const Edge* Change::beforeEdge() const { return beforeOf<Edge>(detail); }
const Edge* Change::afterEdge() const { return afterOf<Edge>(detail); }

std::optional<GraphEntity> Change::before() const {
    if (const Node* n = beforeNode()) return GraphEntity{*n};
    if (const Edge* e = beforeEdge()) return GraphEntity{*e};
    return std::nullopt;
}

std::optional<GraphEntity> Change::after() const {
    if (const Node* n = afterNode()) return GraphEntity{*n};
    if (const Edge* e = afterEdge()) return GraphEntity{*e};
    return std::nullopt;
}

bool Change::pathIncludes(const std::string& segment) const {
    const PropertyPath* p = path();
    return p && pathContains(*p, segment);
}

// ─── JSON ──────────────────────────────────────────────────────

void to_json(Value& j, const Migration& migration) {
    j = Value{{"type", migration.type}, {"description", migration.description}};
    if (migration.code) j["code"] = *migration.code;
    if (migration.instructions) j["instructions"] = *migration.instructions;
}

void to_json(Value& j, const SemanticChange& semantic) {
    j = Value{{"category", semantic.category},
              {"impact", semantic.impact},
              {"description", semantic.description},
              {"affectedRelations", semantic.affected_relations}};
    if (!semantic.migrations.empty()) j["migrations"] = semantic.migrations;
}

void to_json(Value& j, const Change& change) {
    j = Value{{"id", change.id},
              {"type", change.type()},
              {"entity", change.entity()},
              {"entityId", change.entityId()},
              {"semantic", change.semantic}};

    auto entityJson = [](const GraphEntity& e) {
        return std::visit([](const auto& v) { return Value(v); }, e);
    };
    if (auto b = change.before()) j["before"] = entityJson(*b);
    if (auto a = change.after()) j["after"] = entityJson(*a);
    if (const PropertyPath* p = change.path()) j["path"] = *p;
    if (const Value* v = change.oldValue()) j["oldValue"] = *v;
    if (const Value* v = change.newValue()) j["newValue"] = *v;
}

} // namespace grafdiff
