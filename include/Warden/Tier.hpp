// =================================================================
// include/Warden/Tier.hpp
// =================================================================
// Risk tiers controlling how much oversight a change requires.

#pragma once

#include <string>
#include <optional>

namespace Warden {

/**
 * @brief Risk tier of a file path, ordered from most to least scrutiny
 */
enum class Tier {
    GOVERN = 1,  ///< Mandatory approval before commit
    INFORM = 2,  ///< Log and allow
    ALLOW = 3,   ///< Proceed freely
    FREE = 4     ///< Proceed immediately, not governed
};

/**
 * @brief Default policy attached to each tier
 */
enum class TierPolicy {
    MANDATORY_APPROVAL,
    LOG_AND_ALLOW,
    ALLOW,
    IMMEDIATE
};

/**
 * @brief Numeric rank of a tier (1 = highest scrutiny)
 */
int getTierRank(Tier tier);

/**
 * @brief Human-readable label ("GOVERN", "INFORM", ...)
 */
std::string getTierLabel(Tier tier);

/**
 * @brief Default policy of a tier
 */
TierPolicy getTierPolicy(Tier tier);

std::string getTierPolicyName(TierPolicy policy);

/**
 * @brief Default reason reported when a tier rule matches
 */
std::string getTierDefaultReason(Tier tier);

/**
 * @brief Parse a tier from its label or rank ("GOVERN", "t1", "1")
 * @return The tier, or std::nullopt if the text names no tier
 */
std::optional<Tier> parseTier(const std::string& text);

/**
 * @brief Tier from rank, std::nullopt if out of range
 */
std::optional<Tier> tierFromRank(int rank);

/**
 * @brief Whether changes at this tier go through the proposal pipeline
 */
bool requiresProposal(Tier tier);

/**
 * @brief Whether this tier needs a quorum review before commit
 */
bool requiresReview(Tier tier);

/**
 * @brief Return the tier with higher scrutiny (lower rank)
 */
Tier strictestTier(Tier a, Tier b);

} // namespace Warden
