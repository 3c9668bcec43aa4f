#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "graph/value.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grafdiff {

// Enumerator order of ChangeType matches the ChangeDetail alternatives.
enum class ChangeType {
    NodeAdded,
    NodeRemoved,
    NodeModified,
    EdgeAdded,
    EdgeRemoved,
    EdgeModified,
};

enum class EntityKind { Node, Edge };

enum class ChangeCategory { Structural, Data, Metadata, Behavioral };

enum class ChangeImpact { Breaking, Compatible, Enhancement, Cosmetic };

enum class MigrationType { Automatic, Manual, DataTransform };

NLOHMANN_JSON_SERIALIZE_ENUM(ChangeType, {
    {ChangeType::NodeAdded, "node_added"},
    {ChangeType::NodeRemoved, "node_removed"},
    {ChangeType::NodeModified, "node_modified"},
    {ChangeType::EdgeAdded, "edge_added"},
    {ChangeType::EdgeRemoved, "edge_removed"},
    {ChangeType::EdgeModified, "edge_modified"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EntityKind, {
    {EntityKind::Node, "node"},
    {EntityKind::Edge, "edge"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ChangeCategory, {
    {ChangeCategory::Structural, "structural"},
    {ChangeCategory::Data, "data"},
    {ChangeCategory::Metadata, "metadata"},
    {ChangeCategory::Behavioral, "behavioral"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ChangeImpact, {
    {ChangeImpact::Breaking, "breaking"},
    {ChangeImpact::Compatible, "compatible"},
    {ChangeImpact::Enhancement, "enhancement"},
    {ChangeImpact::Cosmetic, "cosmetic"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(MigrationType, {
    {MigrationType::Automatic, "automatic"},
    {MigrationType::Manual, "manual"},
    {MigrationType::DataTransform, "data_transform"},
})

const char* toString(ChangeType type);
const char* toString(EntityKind kind);
const char* toString(ChangeCategory category);
const char* toString(ChangeImpact impact);

/// Advisory follow-up for a breaking change. Never executed by the library.
struct Migration {
    MigrationType type = MigrationType::Manual;
    std::string description;
    std::optional<std::string> code;
    std::optional<std::string> instructions;
};

struct SemanticChange {
    ChangeCategory category = ChangeCategory::Data;
    ChangeImpact impact = ChangeImpact::Compatible;
    std::string description;
    std::vector<std::string> affected_relations;
    std::vector<Migration> migrations;
};

// ─── Change payloads ───────────────────────────────────────────

template <typename Entity>
struct Addition {
    Entity after;
};

template <typename Entity>
struct Removal {
    Entity before;
};

template <typename Entity>
struct Modification {
    Entity before;
    Entity after;
    PropertyPath path;
    OptionalValue old_value;
    OptionalValue new_value;
};

using NodeAdded = Addition<Node>;
using NodeRemoved = Removal<Node>;
using NodeModified = Modification<Node>;
using EdgeAdded = Addition<Edge>;
using EdgeRemoved = Removal<Edge>;
using EdgeModified = Modification<Edge>;

using ChangeDetail = std::variant<NodeAdded, NodeRemoved, NodeModified,
                                  EdgeAdded, EdgeRemoved, EdgeModified>;

/// Resolution payload: the entity a strategy would keep.
using GraphEntity = std::variant<Node, Edge>;

// ─── Change ────────────────────────────────────────────────────
// A single detected difference between two snapshots.

struct Change {
    std::string id;
    ChangeDetail detail;
    SemanticChange semantic;

    ChangeType type() const { return static_cast<ChangeType>(detail.index()); }
    EntityKind entity() const;
    const std::string& entityId() const;
    bool isModification() const;

    /// Modification-only fields; nullptr for additions and removals,
    /// and for an absent old/new side.
    const PropertyPath* path() const;
    const Value* oldValue() const;
    const Value* newValue() const;

    const Node* beforeNode() const;
    const Node* afterNode() const;
    const Edge* beforeEdge() const;
    const Edge* afterEdge() const;

    std::optional<GraphEntity> before() const;
    std::optional<GraphEntity> after() const;

    /// True if the modification path contains the given segment.
    bool pathIncludes(const std::string& segment) const;
};

void to_json(Value& j, const Migration& migration);
void to_json(Value& j, const SemanticChange& semantic);
void to_json(Value& j, const Change& change);

} // namespace grafdiff
