#include "patch/patch.hpp"
#include "common/errors.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace grafdiff {

const char* toString(PatchOp op) {
    switch (op) {
        case PatchOp::Add:     return "add";
        case PatchOp::Remove:  return "remove";
        case PatchOp::Replace: return "replace";
        case PatchOp::Move:    return "move";
        case PatchOp::Copy:    return "copy";
        case PatchOp::Test:    return "test";
    }
    return "unknown";
}

std::string computeChecksum(const std::vector<PatchOperation>& operations) {
    // CBOR keeps the sorted key order and takes strings as raw bytes.
    const std::vector<std::uint8_t> canonical = Value::to_cbor(Value(operations));

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(), hash);

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        hex << std::setw(2) << static_cast<int>(byte);
    }
    return hex.str();
}

bool verifyChecksum(const GraphPatch& patch) {
    return computeChecksum(patch.operations) == patch.checksum;
}

// ─── JSON ──────────────────────────────────────────────────────

void to_json(Value& j, const PatchOperation& op) {
    j = Value{{"op", op.op}, {"path", op.path}};
    if (op.value) j["value"] = *op.value;
    if (op.from) j["from"] = *op.from;
}

void from_json(const Value& j, PatchOperation& op) {
    if (!j.is_object()) throw ValidationError("patch operation must be a JSON object");

    auto op_it = j.find("op");
    if (op_it == j.end() || !op_it->is_string()) {
        throw ValidationError("patch operation requires string field 'op'");
    }
    const std::string name = op_it->get<std::string>();
    bool known = false;
    for (PatchOp candidate : {PatchOp::Add, PatchOp::Remove, PatchOp::Replace,
                              PatchOp::Move, PatchOp::Copy, PatchOp::Test}) {
        if (name == toString(candidate)) {
            op.op = candidate;
            known = true;
        }
    }
    if (!known) throw ValidationError("unknown patch op '" + name + "'");

    auto path_it = j.find("path");
    if (path_it == j.end() || !path_it->is_string()) {
        throw ValidationError("patch operation requires string field 'path'");
    }
    op.path = path_it->get<std::string>();

    op.value.reset();
    if (auto it = j.find("value"); it != j.end()) op.value = *it;

    op.from.reset();
    if (auto it = j.find("from"); it != j.end()) {
        if (!it->is_string()) throw ValidationError("patch field 'from' must be a string");
        op.from = it->get<std::string>();
    }
}

void to_json(Value& j, const GraphPatch& patch) {
    j = Value{{"id", patch.id},
              {"sourceVersion", patch.source_version},
              {"targetVersion", patch.target_version},
              {"operations", patch.operations},
              {"checksum", patch.checksum},
              {"metadata",
               {{"createdAt", toEpochMillis(patch.metadata.created_at)},
                {"createdBy", patch.metadata.created_by},
                {"description", patch.metadata.description}}}};
    if (!patch.skipped_changes.empty()) j["skippedChanges"] = patch.skipped_changes;
}

void from_json(const Value& j, GraphPatch& patch) {
    if (!j.is_object()) throw ValidationError("patch must be a JSON object");
    try {
        patch.id = j.value("id", std::string());
        patch.source_version = j.value("sourceVersion", std::string());
        patch.target_version = j.value("targetVersion", std::string());
        patch.checksum = j.value("checksum", std::string());
        patch.operations = j.at("operations").get<std::vector<PatchOperation>>();
        patch.skipped_changes =
            j.value("skippedChanges", std::vector<std::string>());

        patch.metadata = PatchMetadata{};
        if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
            patch.metadata.created_at = fromEpochMillis(it->value("createdAt", int64_t{0}));
            patch.metadata.created_by = it->value("createdBy", std::string());
            patch.metadata.description = it->value("description", std::string());
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed patch document: ") + e.what());
    }
}

} // namespace grafdiff
