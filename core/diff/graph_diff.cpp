#include "diff/graph_diff.hpp"

namespace grafdiff {

std::string describeChange(const Change& change) {
    const std::string& id = change.entityId();
    auto detail = [&change]() {
        const PropertyPath* p = change.path();
        return (p && !p->empty()) ? joinPath(*p, '.') : std::string("properties");
    };

    switch (change.type()) {
        case ChangeType::NodeAdded:    return "Added node: " + id;
        case ChangeType::NodeRemoved:  return "Removed node: " + id;
        case ChangeType::NodeModified: return "Modified node: " + id + " (" + detail() + ")";
        case ChangeType::EdgeAdded:    return "Added edge: " + id;
        case ChangeType::EdgeRemoved:  return "Removed edge: " + id;
        case ChangeType::EdgeModified: return "Modified edge: " + id + " (" + detail() + ")";
    }
    return "Changed: " + id;
}

std::vector<DiffHighlight> buildHighlights(const GraphDiff& diff) {
    std::vector<DiffHighlight> highlights;
    highlights.reserve(diff.changes.size());
    for (const auto& change : diff.changes) {
        DiffHighlight h;
        h.entity_id = change.entityId();
        h.entity_type = change.entity();
        h.change_type = change.type();
        h.impact = change.semantic.impact;
        h.description = describeChange(change);
        highlights.push_back(std::move(h));
    }
    return highlights;
}

void to_json(Value& j, const DiffHighlight& h) {
    j = Value{{"entityId", h.entity_id},
              {"entityType", h.entity_type},
              {"changeType", h.change_type},
              {"impact", h.impact},
              {"description", h.description}};
}

void to_json(Value& j, const GraphDiff& diff) {
    j = Value{{"id", diff.id},
              {"sourceVersion", diff.source_version},
              {"targetVersion", diff.target_version},
              {"timestamp", toEpochMillis(diff.timestamp)},
              {"changes", diff.changes},
              {"statistics", diff.statistics},
              {"conflicts", diff.conflicts}};
}

} // namespace grafdiff
