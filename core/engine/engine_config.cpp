#include "engine/engine_config.hpp"
#include "common/errors.hpp"

namespace grafdiff {

EngineConfig EngineConfig::fromJson(const Value& j) {
    if (!j.is_object()) throw ValidationError("engine config must be a JSON object");

    EngineConfig config;

    if (auto it = j.find("patchAuthor"); it != j.end()) {
        if (!it->is_string()) throw ValidationError("'patchAuthor' must be a string");
        config.patch_author = it->get<std::string>();
    }

    if (auto it = j.find("replaceDefaultTransitions"); it != j.end()) {
        if (!it->is_boolean()) {
            throw ValidationError("'replaceDefaultTransitions' must be a boolean");
        }
        if (it->get<bool>()) config.type_transitions.clear();
    }

    if (auto it = j.find("forbiddenTypeTransitions"); it != j.end()) {
        if (!it->is_array()) throw ValidationError("'forbiddenTypeTransitions' must be an array");
        for (const auto& entry : *it) {
            if (!entry.is_object() || !entry.contains("from") || !entry.contains("to") ||
                !entry["from"].is_string() || !entry["to"].is_string()) {
                throw ValidationError("type transition entries need string 'from' and 'to'");
            }
            config.type_transitions.forbid(entry["from"].get<std::string>(),
                                           entry["to"].get<std::string>());
        }
    }

    return config;
}

} // namespace grafdiff
