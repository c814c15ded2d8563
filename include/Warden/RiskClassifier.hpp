// =================================================================
// include/Warden/RiskClassifier.hpp
// =================================================================
// Pure path -> tier classification against an ordered rule table.

#pragma once

#include "Warden/Tier.hpp"
#include "Warden/RuleTable.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Result of classifying one path
 */
struct Classification {
    Tier tier = Tier::INFORM;         ///< Assigned tier
    std::string label;                ///< Tier label
    std::string reason;               ///< Why the tier was assigned
    std::string file_path;            ///< Path as classified
    std::string matched_pattern;      ///< Pattern that matched (empty when defaulted)
    bool is_default = false;          ///< True when no rule matched

    /**
     * @brief JSON form consumed by write-guard hooks
     *
     * {"tier": 1, "label": "GOVERN", "reason": "...", "file_path": "...",
     *  "matched_pattern": "..." | null}
     */
    nlohmann::json toJson() const;
};

/**
 * @brief Classifies file paths into risk tiers
 *
 * Evaluates the rule table GOVERN first through FREE last and returns on the
 * first matching pattern. Paths matching no rule default to INFORM. The
 * classifier holds an immutable rule table and no other state, so a single
 * instance may be shared freely across threads.
 */
class RiskClassifier {
public:
    /**
     * @brief Construct with the built-in default rule table
     */
    RiskClassifier();

    /**
     * @brief Construct with an explicit rule table
     * @param rules Ordered rule table
     */
    explicit RiskClassifier(RuleTable rules);

    /**
     * @brief Classify a single path
     * @param path File path, absolute or relative
     * @return Classification, never throws
     */
    Classification classify(const std::string& path) const;

    /**
     * @brief Classify several paths and return the strictest result
     * @param paths Paths to classify
     * @return Classification with the lowest tier rank, INFORM default for an empty list
     */
    Classification classifyStrictest(const std::vector<std::string>& paths) const;

    const RuleTable& getRuleTable() const { return *m_rules; }

private:
    std::shared_ptr<const RuleTable> m_rules;
};

} // namespace Warden
