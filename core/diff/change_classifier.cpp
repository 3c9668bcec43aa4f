#include "diff/change_classifier.hpp"
#include "common/logging.hpp"

#include <exception>

namespace grafdiff {

ChangeImpact ChangeClassifier::dataImpact(const OptionalValue& old_value,
                                          const OptionalValue& new_value) {
    if (!old_value) return ChangeImpact::Enhancement;
    if (!new_value) return ChangeImpact::Breaking;
    if (kindOf(*old_value) != kindOf(*new_value)) return ChangeImpact::Breaking;
    return ChangeImpact::Compatible;
}

std::vector<Migration> ChangeClassifier::generateMigrations(const Change& change) {
    std::vector<Migration> migrations;

    switch (change.type()) {
        case ChangeType::NodeRemoved: {
            Migration m;
            m.type = MigrationType::Manual;
            m.description = "Manually handle removal of node " + change.entityId();
            m.instructions = "Review and update all references to node " +
                             change.entityId() + " before removal";
            migrations.push_back(std::move(m));
            break;
        }
        case ChangeType::EdgeRemoved: {
            Migration m;
            m.type = MigrationType::Automatic;
            m.description = "Update references to removed edge " + change.entityId();
            m.code = "// Remove edge references\n// Update graph structure";
            migrations.push_back(std::move(m));
            break;
        }
        case ChangeType::NodeModified:
        case ChangeType::EdgeModified: {
            if (!change.pathIncludes("type")) break;
            const Value* old_type = change.oldValue();
            const Value* new_type = change.newValue();
            auto render = [](const Value* v) {
                if (!v) return std::string("undefined");
                return v->is_string() ? v->get<std::string>() : v->dump();
            };
            const char* target = change.entity() == EntityKind::Node ? "node" : "edge";
            Migration m;
            m.type = MigrationType::DataTransform;
            m.description = std::string("Transform ") + target + " data for type change";
            m.code = std::string("// Transform ") + target + " data\n" + target +
                     ".data = transformData(" + target + ".data, '" + render(old_type) +
                     "', '" + render(new_type) + "');";
            migrations.push_back(std::move(m));
            break;
        }
        default:
            break;
    }

    return migrations;
}

void ChangeClassifier::addRule(ClassificationRule rule) {
    rules_.push_back(std::move(rule));
}

void ChangeClassifier::classify(std::vector<Change>& changes,
                                const GraphSnapshot& source, const GraphSnapshot& target,
                                const DiffOptions& options) const {
    if (options.semantic_diff) {
        const bool connectivity_dropped = target.connectivity() < source.connectivity();

        for (Change& change : changes) {
            if (change.entity() == EntityKind::Edge) {
                change.semantic.impact =
                    (change.type() == ChangeType::EdgeRemoved && connectivity_dropped)
                        ? ChangeImpact::Breaking
                        : ChangeImpact::Compatible;
            }
            if (change.pathIncludes("type") || change.pathIncludes("behavior")) {
                change.semantic.category = ChangeCategory::Behavioral;
                change.semantic.impact = ChangeImpact::Breaking;
            }
        }
    }

    if (!rules_.empty()) {
        for (Change& change : changes) applyRules(change);
    }

    if (options.semantic_diff) {
        for (Change& change : changes) {
            if (change.semantic.impact == ChangeImpact::Breaking) {
                change.semantic.migrations = generateMigrations(change);
            }
        }
    }
}

void ChangeClassifier::applyRules(Change& change) const {
    for (const auto& rule : rules_) {
        bool matched = false;
        try {
            matched = rule.predicate && rule.predicate(change);
        } catch (const std::exception& e) {
            rule_failures_++;
            logger()->warn("classification rule '{}' failed on change {}: {}; rule skipped",
                           rule.name, change.id, e.what());
            continue;
        }
        if (!matched) continue;
        if (rule.category) change.semantic.category = *rule.category;
        if (rule.impact) change.semantic.impact = *rule.impact;
    }
}

} // namespace grafdiff
