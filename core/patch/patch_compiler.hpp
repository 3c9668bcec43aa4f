#pragma once

#include "common/id_generator.hpp"
#include "diff/graph_diff.hpp"
#include "patch/patch.hpp"

#include <string>
#include <vector>

namespace grafdiff {

/// Turns a diff into a GraphPatch. Operations follow the change order
/// exactly:
///   *_added    → add     /{nodes|edges}/{id}            value = after
///   *_removed  → remove  /{nodes|edges}/{id}
///   *_modified → replace /{nodes|edges}/{id}/{path...}  value = new value
///                remove  /{nodes|edges}/{id}/{path...}  when the key was deleted
/// A modification without a path cannot be addressed; its change id is
/// listed in GraphPatch::skipped_changes.
class PatchCompiler {
public:
    PatchCompiler(IdGenerator& ids, std::string author)
        : ids_(ids), author_(std::move(author)) {}

    GraphPatch compile(const GraphDiff& diff) const;

    static std::vector<PatchOperation> compileChanges(const std::vector<Change>& changes,
                                                      std::vector<std::string>* skipped);

private:
    IdGenerator& ids_;
    std::string author_;
};

} // namespace grafdiff
