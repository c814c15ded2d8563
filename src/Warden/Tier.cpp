// =================================================================
// src/Warden/Tier.cpp
// =================================================================

#include "Warden/Tier.hpp"
#include <algorithm>
#include <cctype>

namespace Warden {

int getTierRank(Tier tier) {
    return static_cast<int>(tier);
}

std::string getTierLabel(Tier tier) {
    switch (tier) {
        case Tier::GOVERN: return "GOVERN";
        case Tier::INFORM: return "INFORM";
        case Tier::ALLOW: return "ALLOW";
        case Tier::FREE: return "FREE";
        default: return "UNKNOWN";
    }
}

TierPolicy getTierPolicy(Tier tier) {
    switch (tier) {
        case Tier::GOVERN: return TierPolicy::MANDATORY_APPROVAL;
        case Tier::INFORM: return TierPolicy::LOG_AND_ALLOW;
        case Tier::ALLOW: return TierPolicy::ALLOW;
        case Tier::FREE: return TierPolicy::IMMEDIATE;
    }
    return TierPolicy::MANDATORY_APPROVAL;
}

std::string getTierPolicyName(TierPolicy policy) {
    switch (policy) {
        case TierPolicy::MANDATORY_APPROVAL: return "mandatory_approval";
        case TierPolicy::LOG_AND_ALLOW: return "log_and_allow";
        case TierPolicy::ALLOW: return "allow";
        case TierPolicy::IMMEDIATE: return "immediate";
        default: return "unknown";
    }
}

std::string getTierDefaultReason(Tier tier) {
    switch (tier) {
        case Tier::GOVERN: return "Full dual commit required - core production code";
        case Tier::INFORM: return "Log and allow - low-risk production area";
        case Tier::ALLOW: return "Proceed freely - development repository";
        case Tier::FREE: return "Proceed immediately - personal or tool configuration";
        default: return "";
    }
}

std::optional<Tier> tierFromRank(int rank) {
    if (rank < 1 || rank > 4) {
        return std::nullopt;
    }
    return static_cast<Tier>(rank);
}

std::optional<Tier> parseTier(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GOVERN" || upper == "T1" || upper == "1") return Tier::GOVERN;
    if (upper == "INFORM" || upper == "T2" || upper == "2") return Tier::INFORM;
    if (upper == "ALLOW" || upper == "T3" || upper == "3") return Tier::ALLOW;
    if (upper == "FREE" || upper == "T4" || upper == "4") return Tier::FREE;
    return std::nullopt;
}

bool requiresProposal(Tier tier) {
    return tier != Tier::FREE;
}

bool requiresReview(Tier tier) {
    return getTierPolicy(tier) == TierPolicy::MANDATORY_APPROVAL;
}

Tier strictestTier(Tier a, Tier b) {
    return getTierRank(a) <= getTierRank(b) ? a : b;
}

} // namespace Warden
