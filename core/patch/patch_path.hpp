#pragma once

#include "diff/change.hpp"
#include "graph/value.hpp"

#include <string>

namespace grafdiff {

/// A parsed patch path: "/{nodes|edges}/{id}[/{property}...]".
/// Segments use JSON-pointer escaping ("~0" for '~', "~1" for '/').
struct PatchPath {
    EntityKind kind = EntityKind::Node;
    std::string id;
    PropertyPath property;

    bool isEntity() const { return property.empty(); }
};

std::string escapeSegment(const std::string& segment);
std::string unescapeSegment(const std::string& segment);

std::string formatPatchPath(EntityKind kind, const std::string& id,
                            const PropertyPath& property = {});

/// Throws ValidationError for anything that does not address a node or edge.
PatchPath parsePatchPath(const std::string& path);

} // namespace grafdiff
