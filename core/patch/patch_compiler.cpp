#include "patch/patch_compiler.hpp"
#include "patch/patch_path.hpp"
#include "common/logging.hpp"

namespace grafdiff {

std::vector<PatchOperation> PatchCompiler::compileChanges(const std::vector<Change>& changes,
                                                          std::vector<std::string>* skipped) {
    std::vector<PatchOperation> operations;
    operations.reserve(changes.size());

    for (const auto& change : changes) {
        const EntityKind kind = change.entity();
        PatchOperation op;

        switch (change.type()) {
            case ChangeType::NodeAdded:
                op.op = PatchOp::Add;
                op.path = formatPatchPath(kind, change.entityId());
                op.value = Value(*change.afterNode());
                break;
            case ChangeType::EdgeAdded:
                op.op = PatchOp::Add;
                op.path = formatPatchPath(kind, change.entityId());
                op.value = Value(*change.afterEdge());
                break;
            case ChangeType::NodeRemoved:
            case ChangeType::EdgeRemoved:
                op.op = PatchOp::Remove;
                op.path = formatPatchPath(kind, change.entityId());
                break;
            case ChangeType::NodeModified:
            case ChangeType::EdgeModified: {
                const PropertyPath* path = change.path();
                if (!path || path->empty()) {
                    logger()->debug("change {} on {} has no property path; not patchable",
                                    change.id, change.entityId());
                    if (skipped) skipped->push_back(change.id);
                    continue;
                }
                op.path = formatPatchPath(kind, change.entityId(), *path);
                if (const Value* v = change.newValue()) {
                    op.op = PatchOp::Replace;
                    op.value = *v;
                } else {
                    op.op = PatchOp::Remove;
                }
                break;
            }
        }
        operations.push_back(std::move(op));
    }

    return operations;
}

GraphPatch PatchCompiler::compile(const GraphDiff& diff) const {
    GraphPatch patch;
    patch.id = ids_.next("patch");
    patch.source_version = diff.source_version;
    patch.target_version = diff.target_version;
    patch.operations = compileChanges(diff.changes, &patch.skipped_changes);
    patch.checksum = computeChecksum(patch.operations);
    patch.metadata.created_at = Clock::now();
    patch.metadata.created_by = author_;
    patch.metadata.description =
        "Patch from " + diff.source_version + " to " + diff.target_version;
    return patch;
}

} // namespace grafdiff
