#include "patch/patch_applier.hpp"
#include "patch/patch_path.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <cctype>

namespace grafdiff {

namespace {

const char* kindLabel(EntityKind kind) { return kind == EntityKind::Node ? "node" : "edge"; }

// ─── Entity documents ──────────────────────────────────────────

bool entityExists(const GraphSnapshot& g, EntityKind kind, const std::string& id) {
    return kind == EntityKind::Node ? g.hasNode(id) : g.hasEdge(id);
}

Value loadEntity(const GraphSnapshot& g, EntityKind kind, const std::string& id) {
    if (kind == EntityKind::Node) {
        if (const Node* n = g.getNode(id)) return Value(*n);
    } else {
        if (const Edge* e = g.getEdge(id)) return Value(*e);
    }
    throw NotFoundError(std::string(kindLabel(kind)) + " not found: " + id);
}

void storeEntity(GraphSnapshot& g, EntityKind kind, const Value& doc) {
    if (kind == EntityKind::Node) {
        g.replaceNode(doc.get<Node>());
    } else {
        g.replaceEdge(doc.get<Edge>());
    }
}

void insertEntity(GraphSnapshot& g, EntityKind kind, const Value& doc) {
    if (kind == EntityKind::Node) {
        g.addNode(doc.get<Node>());
    } else {
        g.addEdge(doc.get<Edge>());
    }
}

/// Entity document for an add: the id comes from the path when the value
/// omits it, and must agree with the path otherwise.
Value entityDocument(const Value& value, const PatchPath& target) {
    if (!value.is_object()) {
        throw ValidationError(std::string(kindLabel(target.kind)) + " value must be an object");
    }
    Value doc = value;
    auto it = doc.find("id");
    if (it == doc.end()) {
        doc["id"] = target.id;
    } else if (!it->is_string() || it->get<std::string>() != target.id) {
        throw ValidationError("value id does not match path id '" + target.id + "'");
    }
    return doc;
}

// ─── Nested values ─────────────────────────────────────────────

size_t parseIndex(const std::string& segment, size_t limit) {
    bool digits = !segment.empty() && (segment == "0" || segment[0] != '0');
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
    }
    if (!digits) throw ValidationError("invalid array index '" + segment + "'");
    if (segment.size() > 9) throw NotFoundError("array index out of range: " + segment);
    size_t index = std::stoul(segment);
    if (index >= limit) throw NotFoundError("array index out of range: " + segment);
    return index;
}

template <typename Json>
Json& getNested(Json& root, const PropertyPath& path) {
    Json* current = &root;
    for (const auto& segment : path) {
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) {
                throw NotFoundError("no value at '" + joinPath(path, '/') + "'");
            }
            current = &*it;
        } else if (current->is_array()) {
            current = &(*current)[parseIndex(segment, current->size())];
        } else {
            throw NotFoundError("no value at '" + joinPath(path, '/') + "'");
        }
    }
    return *current;
}

void setNested(Value& root, const PropertyPath& path, const Value& value) {
    Value* current = &root;
    for (size_t i = 0; i + 1 < path.size(); i++) {
        const std::string& segment = path[i];
        if (current->is_null()) *current = Value::object();
        if (current->is_object()) {
            if (!current->contains(segment)) (*current)[segment] = Value::object();
            current = &(*current)[segment];
        } else if (current->is_array()) {
            current = &(*current)[parseIndex(segment, current->size())];
        } else {
            throw ValidationError("cannot descend into scalar at '" + segment + "'");
        }
    }

    const std::string& last = path.back();
    if (current->is_null()) *current = Value::object();
    if (current->is_object()) {
        (*current)[last] = value;
    } else if (current->is_array()) {
        if (last == "-" || last == std::to_string(current->size())) {
            current->push_back(value);
        } else {
            (*current)[parseIndex(last, current->size())] = value;
        }
    } else {
        throw ValidationError("cannot set '" + last + "' on a scalar value");
    }
}

void removeNested(Value& root, const PropertyPath& path) {
    PropertyPath parent_path(path.begin(), path.end() - 1);
    Value& parent = getNested(root, parent_path);
    const std::string& last = path.back();
    if (parent.is_object()) {
        if (parent.erase(last) == 0) {
            throw NotFoundError("no value at '" + joinPath(path, '/') + "'");
        }
    } else if (parent.is_array()) {
        parent.erase(parseIndex(last, parent.size()));
    } else {
        throw NotFoundError("no value at '" + joinPath(path, '/') + "'");
    }
}

// ─── Entity properties ─────────────────────────────────────────

void checkWritable(EntityKind kind, const PropertyPath& property, bool removing) {
    const std::string& head = property.front();
    if (head == "data") {
        if (removing && property.size() == 1) {
            throw ValidationError("entity data cannot be removed, only its members");
        }
        return;
    }

    const bool edge_field = kind == EntityKind::Edge &&
                            (head == "source" || head == "target" || head == "connection");
    if (head != "type" && !edge_field) {
        throw ValidationError(std::string("unknown ") + kindLabel(kind) + " property '" +
                              head + "'");
    }
    if (property.size() != 1) {
        throw ValidationError("property '" + head + "' has no sub-properties");
    }
    if (removing) {
        throw ValidationError("property '" + head + "' cannot be removed");
    }
}

Value readProperty(const Value& doc, EntityKind kind, const PropertyPath& property) {
    if (kind == EntityKind::Edge && property.size() == 1 && property[0] == "connection") {
        return Value{{"source", doc.at("source")}, {"target", doc.at("target")}};
    }
    return getNested(doc, property);
}

void writeProperty(Value& doc, EntityKind kind, const PropertyPath& property,
                   const Value& value) {
    checkWritable(kind, property, false);
    const std::string& head = property.front();

    if (head == "connection") {
        if (!value.is_object() || !value.contains("source") || !value.contains("target") ||
            !value["source"].is_string() || !value["target"].is_string()) {
            throw ValidationError("connection value must be {source, target} strings");
        }
        doc["source"] = value["source"];
        doc["target"] = value["target"];
        return;
    }
    if (head == "data" && property.size() == 1 && !value.is_object()) {
        throw ValidationError("data value must be an object");
    }
    if (head != "data" && !value.is_string()) {
        throw ValidationError("property '" + head + "' must be a string");
    }
    setNested(doc, property, value);
}

const Value& requireValue(const PatchOperation& op) {
    if (!op.value) {
        throw ValidationError(std::string("'") + toString(op.op) + "' requires a value");
    }
    return *op.value;
}

// ─── Operations ────────────────────────────────────────────────

void applyAdd(GraphSnapshot& g, const PatchPath& target, const PatchOperation& op) {
    const Value& value = requireValue(op);
    if (target.isEntity()) {
        if (entityExists(g, target.kind, target.id)) {
            throw ValidationError(std::string(kindLabel(target.kind)) + " already exists: " +
                                  target.id);
        }
        insertEntity(g, target.kind, entityDocument(value, target));
        return;
    }
    Value doc = loadEntity(g, target.kind, target.id);
    writeProperty(doc, target.kind, target.property, value);
    storeEntity(g, target.kind, doc);
}

void applyRemove(GraphSnapshot& g, const PatchPath& target) {
    if (target.isEntity()) {
        const bool removed = target.kind == EntityKind::Node ? g.removeNode(target.id)
                                                             : g.removeEdge(target.id);
        if (!removed) {
            throw NotFoundError(std::string(kindLabel(target.kind)) + " not found: " + target.id);
        }
        return;
    }
    Value doc = loadEntity(g, target.kind, target.id);
    checkWritable(target.kind, target.property, true);
    removeNested(doc, target.property);
    storeEntity(g, target.kind, doc);
}

void applyReplace(GraphSnapshot& g, const PatchPath& target, const PatchOperation& op) {
    const Value& value = requireValue(op);
    Value doc = loadEntity(g, target.kind, target.id);
    if (target.isEntity()) {
        storeEntity(g, target.kind, entityDocument(value, target));
        return;
    }
    writeProperty(doc, target.kind, target.property, value);
    storeEntity(g, target.kind, doc);
}

void applyTest(const GraphSnapshot& g, const PatchPath& target, const PatchOperation& op) {
    const Value& expected = requireValue(op);
    Value doc = loadEntity(g, target.kind, target.id);
    const Value actual = target.isEntity() ? doc : readProperty(doc, target.kind, target.property);
    if (actual != expected) {
        throw ValidationError("test failed at '" + op.path + "'");
    }
}

void applyCopyOrMove(GraphSnapshot& g, const PatchPath& target, const PatchOperation& op) {
    if (!op.from) {
        throw ValidationError(std::string("'") + toString(op.op) + "' requires 'from'");
    }
    const PatchPath source = parsePatchPath(*op.from);
    const bool move = op.op == PatchOp::Move;

    if (source.isEntity() != target.isEntity() || source.kind != target.kind) {
        throw ValidationError("'from' and 'path' must address the same kind of location");
    }

    if (target.isEntity()) {
        Value doc = loadEntity(g, source.kind, source.id);
        if (source.id == target.id) return;
        if (entityExists(g, target.kind, target.id)) {
            throw ValidationError(std::string(kindLabel(target.kind)) + " already exists: " +
                                  target.id);
        }
        doc["id"] = target.id;
        if (move) applyRemove(g, source);
        insertEntity(g, target.kind, doc);
        return;
    }

    Value from_doc = loadEntity(g, source.kind, source.id);
    const Value value = readProperty(from_doc, source.kind, source.property);
    if (move) {
        checkWritable(source.kind, source.property, true);
        removeNested(from_doc, source.property);
        storeEntity(g, source.kind, from_doc);
    }
    Value to_doc = loadEntity(g, target.kind, target.id);
    writeProperty(to_doc, target.kind, target.property, value);
    storeEntity(g, target.kind, to_doc);
}

std::string describe(size_t index, const PatchOperation& op) {
    return "operation " + std::to_string(index) + " (" + toString(op.op) + " " + op.path + ")";
}

} // namespace

void PatchApplier::applyOperation(GraphSnapshot& working, const PatchOperation& op) {
    const PatchPath target = parsePatchPath(op.path);
    switch (op.op) {
        case PatchOp::Add:     applyAdd(working, target, op); break;
        case PatchOp::Remove:  applyRemove(working, target); break;
        case PatchOp::Replace: applyReplace(working, target, op); break;
        case PatchOp::Test:    applyTest(working, target, op); break;
        case PatchOp::Move:
        case PatchOp::Copy:    applyCopyOrMove(working, target, op); break;
    }
}

PatchResult PatchApplier::applyPartial(const GraphSnapshot& base, const GraphPatch& patch) const {
    if (verify_checksum_ && !verifyChecksum(patch)) {
        throw IntegrityError("checksum mismatch for patch " + patch.id +
                             "; refusing to apply");
    }

    PatchResult result;
    result.graph = base;

    for (size_t i = 0; i < patch.operations.size(); i++) {
        const PatchOperation& op = patch.operations[i];
        try {
            applyOperation(result.graph, op);
        } catch (const NotFoundError& e) {
            result.failure = PatchFailure{i, PatchFailure::Kind::NotFound,
                                          describe(i, op) + ": " + e.what()};
        } catch (const ValidationError& e) {
            result.failure = PatchFailure{i, PatchFailure::Kind::Validation,
                                          describe(i, op) + ": " + e.what()};
        }
        if (result.failure) {
            logger()->error("patch {} stopped at {}", patch.id, result.failure->message);
            break;
        }
        result.applied++;
    }
    return result;
}

GraphSnapshot PatchApplier::apply(const GraphSnapshot& base, const GraphPatch& patch) const {
    PatchResult result = applyPartial(base, patch);
    if (result.failure) {
        if (result.failure->kind == PatchFailure::Kind::NotFound) {
            throw NotFoundError(result.failure->message);
        }
        throw PatchOperationError(result.failure->operation_index, result.failure->message);
    }
    return std::move(result.graph);
}

} // namespace grafdiff
