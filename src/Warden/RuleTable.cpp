// =================================================================
// src/Warden/RuleTable.cpp
// =================================================================
// Implementation for loading and serializing the tier rule table.

#include "Warden/RuleTable.hpp"
#include "Warden/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

namespace Warden {

namespace {

RuleTable parseRuleTable(const YAML::Node& root, const std::string& source) {
    if (!root || !root["tiers"] || !root["tiers"].IsSequence()) {
        throw std::runtime_error("Rule table '" + source + "' has no 'tiers' sequence");
    }

    RuleTable table;
    for (const auto& entry : root["tiers"]) {
        if (!entry["tier"]) {
            throw std::runtime_error("Rule entry without 'tier' in " + source);
        }

        std::string tier_text = entry["tier"].as<std::string>();
        auto tier = parseTier(tier_text);
        if (!tier) {
            throw std::runtime_error("Unknown tier '" + tier_text + "' in " + source);
        }

        std::string reason;
        if (entry["reason"]) {
            reason = entry["reason"].as<std::string>();
        }

        std::vector<std::string> patterns;
        if (entry["patterns"]) {
            for (const auto& pattern : entry["patterns"]) {
                patterns.push_back(pattern.as<std::string>());
            }
        }

        try {
            table.addRuleSet(*tier, reason, patterns);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string(e.what()) + " in " + source);
        }
    }

    return table;
}

} // namespace

void RuleTable::addRuleSet(Tier tier, const std::string& reason,
                           const std::vector<std::string>& patterns) {
    TierRuleSet rule_set(tier, reason.empty() ? getTierDefaultReason(tier) : reason);
    for (const auto& pattern : patterns) {
        rule_set.patterns.addPattern(pattern);
    }

    // Insert after every rule-set of equal or higher scrutiny
    auto position = std::upper_bound(
        m_rule_sets.begin(), m_rule_sets.end(), getTierRank(tier),
        [](int rank, const TierRuleSet& existing) {
            return rank < getTierRank(existing.tier);
        });
    m_rule_sets.insert(position, std::move(rule_set));
}

size_t RuleTable::getPatternCount() const {
    size_t count = 0;
    for (const auto& rule_set : m_rule_sets) {
        count += rule_set.patterns.size();
    }
    return count;
}

RuleTable RuleTable::loadFromFile(const std::string& file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load rule table '" + file_path + "': " + e.what());
    }

    RuleTable table;
    try {
        table = parseRuleTable(root, file_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Malformed rule table '" + file_path + "': " + e.what());
    }

    Logger::getInstance().info("RuleTable", "Loaded rule table", file_path + ", " +
        std::to_string(table.getPatternCount()) + " patterns");
    return table;
}

RuleTable RuleTable::loadFromString(const std::string& yaml_text) {
    try {
        return parseRuleTable(YAML::Load(yaml_text), "<string>");
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Malformed rule table: ") + e.what());
    }
}

RuleTable RuleTable::getDefaultRuleTable() {
    RuleTable table;

    table.addRuleSet(Tier::GOVERN, "", {
        R"([/\\]core[/\\])",
        R"([/\\]archive[/\\])",
        R"([/\\]governance[/\\](?!commits[/\\]))",
        R"([/\\]source_ring[/\\])",
        R"([/\\]SAFE[/\\](?!docs[/\\]|README))"
    });

    table.addRuleSet(Tier::INFORM, "", {
        R"([/\\]artifacts[/\\])",
        R"([/\\]ui[/\\])",
        R"([/\\]cli[/\\])",
        R"([/\\]docs[/\\])",
        R"([/\\]bridge_ring[/\\])",
        R"([/\\]governance[/\\]commits[/\\])"
    });

    table.addRuleSet(Tier::ALLOW, "", {
        R"([/\\]tests[/\\])",
        R"([/\\]scratch[/\\])",
        R"([/\\]sandbox[/\\])",
        // Development checkouts
        R"([/\\]GitHub[/\\])"
    });

    table.addRuleSet(Tier::FREE, "", {
        R"([/\\]Desktop[/\\])",
        R"([/\\]Documents[/\\](?!GitHub))",
        R"([/\\]\.claude[/\\]hooks[/\\])",
        R"([/\\]\.claude[/\\]skills[/\\])",
        R"([/\\]\.claude[/\\]rules[/\\])",
        R"([/\\]\.claude[/\\]agents[/\\])",
        R"([/\\]\.claude[/\\](?!projects[/\\]))",
        R"([/\\]AppData[/\\])",
        R"([/\\]tmp[/\\])"
    });

    return table;
}

std::string RuleTable::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "tiers" << YAML::Value << YAML::BeginSeq;

    for (const auto& rule_set : m_rule_sets) {
        out << YAML::BeginMap;
        out << YAML::Key << "tier" << YAML::Value << getTierLabel(rule_set.tier);
        out << YAML::Key << "reason" << YAML::Value << rule_set.reason;
        out << YAML::Key << "patterns" << YAML::Value << YAML::BeginSeq;
        for (const auto& pattern : rule_set.patterns.getPatterns()) {
            out << YAML::SingleQuoted << pattern.getPattern();
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }

    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

} // namespace Warden
