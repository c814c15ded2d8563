// =================================================================
// include/Warden/RuleTable.hpp
// =================================================================
// Declarative, externally loaded table of tier rules.

#pragma once

#include "Warden/Tier.hpp"
#include "Warden/PathPattern.hpp"
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief All patterns assigning paths to one tier
 */
struct TierRuleSet {
    Tier tier;                    ///< Tier assigned on match
    std::string reason;           ///< Reason reported on match
    PathPatternSet patterns;      ///< Ordered matchers

    TierRuleSet(Tier t, const std::string& r) : tier(t), reason(r) {}
};

/**
 * @brief Ordered rule table, GOVERN rule-sets first and FREE last
 *
 * Rule-sets are kept sorted by tier rank whatever order they are added or
 * loaded in, so a higher-scrutiny rule always outranks a lower one.
 *
 * File format (YAML):
 * @code
 * tiers:
 *   - tier: GOVERN
 *     reason: "Core production code"
 *     patterns:
 *       - '[/\\]core[/\\]'
 *       - 'glob:*.pem'
 * @endcode
 */
class RuleTable {
public:
    RuleTable() = default;

    /**
     * @brief Add a rule-set for a tier
     * @param tier Tier assigned by the patterns
     * @param reason Reason reported on match (tier default when empty)
     * @param patterns Pattern strings in evaluation order
     * @throws std::invalid_argument if any pattern does not compile
     */
    void addRuleSet(Tier tier, const std::string& reason,
                    const std::vector<std::string>& patterns);

    const std::vector<TierRuleSet>& getRuleSets() const { return m_rule_sets; }

    /**
     * @brief Total number of patterns across all rule-sets
     */
    size_t getPatternCount() const;

    /**
     * @brief Load a rule table from a YAML file
     * @throws std::runtime_error on unreadable or malformed files
     */
    static RuleTable loadFromFile(const std::string& file_path);

    /**
     * @brief Load a rule table from YAML text
     * @throws std::runtime_error on malformed input
     */
    static RuleTable loadFromString(const std::string& yaml_text);

    /**
     * @brief Built-in rule table used when no rules file is configured
     */
    static RuleTable getDefaultRuleTable();

    /**
     * @brief Serialize the table back to the YAML file format
     */
    std::string toYaml() const;

private:
    std::vector<TierRuleSet> m_rule_sets;
};

} // namespace Warden
