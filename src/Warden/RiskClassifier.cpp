// =================================================================
// src/Warden/RiskClassifier.cpp
// =================================================================
// Implementation for risk tier classification.

#include "Warden/RiskClassifier.hpp"

namespace Warden {

namespace {

const char* DEFAULT_REASON = "Unknown path - defaulting to inform-and-allow";

} // namespace

nlohmann::json Classification::toJson() const {
    nlohmann::json result;
    result["tier"] = getTierRank(tier);
    result["label"] = label;
    result["reason"] = reason;
    result["file_path"] = file_path;
    if (is_default) {
        result["matched_pattern"] = nullptr;
    } else {
        result["matched_pattern"] = matched_pattern;
    }
    return result;
}

RiskClassifier::RiskClassifier()
    : m_rules(std::make_shared<const RuleTable>(RuleTable::getDefaultRuleTable())) {
}

RiskClassifier::RiskClassifier(RuleTable rules)
    : m_rules(std::make_shared<const RuleTable>(std::move(rules))) {
}

Classification RiskClassifier::classify(const std::string& path) const {
    Classification result;
    result.file_path = path;

    for (const auto& rule_set : m_rules->getRuleSets()) {
        const PathPattern* match = rule_set.patterns.findMatch(path);
        if (match != nullptr) {
            result.tier = rule_set.tier;
            result.label = getTierLabel(rule_set.tier);
            result.reason = rule_set.reason;
            result.matched_pattern = match->getPattern();
            return result;
        }
    }

    result.tier = Tier::INFORM;
    result.label = getTierLabel(Tier::INFORM);
    result.reason = DEFAULT_REASON;
    result.is_default = true;
    return result;
}

Classification RiskClassifier::classifyStrictest(const std::vector<std::string>& paths) const {
    if (paths.empty()) {
        Classification result;
        result.label = getTierLabel(Tier::INFORM);
        result.reason = DEFAULT_REASON;
        result.is_default = true;
        return result;
    }

    Classification strictest = classify(paths.front());
    for (size_t i = 1; i < paths.size(); i++) {
        Classification current = classify(paths[i]);
        if (getTierRank(current.tier) < getTierRank(strictest.tier)) {
            strictest = current;
        }
    }
    return strictest;
}

} // namespace Warden
