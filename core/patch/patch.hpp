#pragma once

#include "common/clock.hpp"
#include "graph/value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grafdiff {

enum class PatchOp { Add, Remove, Replace, Move, Copy, Test };

NLOHMANN_JSON_SERIALIZE_ENUM(PatchOp, {
    {PatchOp::Add, "add"},
    {PatchOp::Remove, "remove"},
    {PatchOp::Replace, "replace"},
    {PatchOp::Move, "move"},
    {PatchOp::Copy, "copy"},
    {PatchOp::Test, "test"},
})

const char* toString(PatchOp op);

/// One primitive edit. `path` (and `from`) are JSON-pointer style:
/// "/nodes/<id>", "/edges/<id>/data/<key>/...".
struct PatchOperation {
    PatchOp op = PatchOp::Add;
    std::string path;
    OptionalValue value;
    std::optional<std::string> from;

    bool operator==(const PatchOperation& other) const {
        return op == other.op && path == other.path && value == other.value &&
               from == other.from;
    }
};

struct PatchMetadata {
    Timestamp created_at;
    std::string created_by;
    std::string description;
};

/// Ordered, checksummed list of operations taking one snapshot toward
/// another. Operation order is significant; the checksum covers it.
struct GraphPatch {
    std::string id;
    std::string source_version;
    std::string target_version;
    std::vector<PatchOperation> operations;
    std::string checksum;
    PatchMetadata metadata;

    /// Ids of changes that produced no operation. Not covered by the checksum.
    std::vector<std::string> skipped_changes;
};

/// SHA-256 (lowercase hex) of the CBOR encoding of `operations`.
std::string computeChecksum(const std::vector<PatchOperation>& operations);

bool verifyChecksum(const GraphPatch& patch);

void to_json(Value& j, const PatchOperation& op);
void from_json(const Value& j, PatchOperation& op);
void to_json(Value& j, const GraphPatch& patch);
void from_json(const Value& j, GraphPatch& patch);

} // namespace grafdiff
