// =================================================================
// include/Warden/GovernanceGate.hpp
// =================================================================
// Entry point for agents: classifies changes, creates proposals and
// moves them through review.

#pragma once

#include "Warden/Proposal.hpp"
#include "Warden/ProposalStore.hpp"
#include "Warden/ReviewGraph.hpp"
#include "Warden/RiskClassifier.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief New content for one file
 */
struct FileChange {
    std::string path;                       ///< Path relative to the repository root
    std::optional<std::string> original;    ///< Current content, std::nullopt for a new file
    std::string modified;                   ///< Proposed content
};

/**
 * @brief A change an agent wants to make
 *
 * Either changes (diffed here) or pre-made diffs (from a proposal
 * document), or both.
 */
struct ProposalDraft {
    std::string repo_root;
    ProposalMetadata metadata;
    std::vector<FileChange> changes;
    std::vector<FileDiff> diffs;
};

enum class SubmitStatus {
    CREATED,        ///< Proposal stored
    NOT_REQUIRED,   ///< Every file is FREE tier, proceed without a proposal
    DIFF_EMPTY,     ///< Nothing changed, do not propose
    INVALID         ///< Draft is missing required data
};

std::string getSubmitStatusName(SubmitStatus status);

struct SubmitResult {
    SubmitStatus status = SubmitStatus::INVALID;
    std::string proposal_id;
    Tier tier = Tier::INFORM;
    ProposalState state = ProposalState::PENDING;
    std::string review_id;
    std::vector<Classification> classifications;
    std::string message;
};

enum class GateStatus {
    SUCCESS,
    PROPOSAL_NOT_FOUND,
    INVALID_TRANSITION,
    REVIEW_REQUIRED         ///< GOVERN proposal without a quorated review
};

std::string getGateStatusName(GateStatus status);

struct GateResult {
    GateStatus status = GateStatus::SUCCESS;
    std::string message;
    ProposalState state = ProposalState::PENDING;

    bool success() const { return status == GateStatus::SUCCESS; }
};

struct GovernanceOptions {
    bool auto_promote = true;               ///< Promote INFORM and ALLOW proposals on creation
    std::vector<std::string> reviewers;     ///< Reviewer set for GOVERN proposals
    std::string node_name = "local";        ///< Node name used when requesting reviews
};

/**
 * @brief Governs how proposals enter and leave the Pending state
 */
class GovernanceGate {
public:
    GovernanceGate(std::shared_ptr<const RiskClassifier> classifier,
                   std::shared_ptr<ProposalStore> store,
                   std::shared_ptr<ReviewGraph> reviews,
                   const GovernanceOptions& options = GovernanceOptions());

    /**
     * @brief Classify and store a draft
     *
     * The proposal's tier is the strictest tier over its files. GOVERN
     * proposals request a review, INFORM and ALLOW proposals are promoted
     * when auto promotion is on.
     */
    SubmitResult submit(const ProposalDraft& draft);

    /**
     * @brief Promote a Pending proposal to Committed
     *
     * GOVERN proposals need a quorated review.
     */
    GateResult approve(const std::string& proposal_id);

    /**
     * @brief Move a Pending proposal to Rejected
     * @param reason Recorded in the audit trail
     */
    GateResult reject(const std::string& proposal_id, const std::string& reason);

    /**
     * @brief Delete a Pending proposal
     */
    GateResult cancel(const std::string& proposal_id);

    /**
     * @brief Settle Pending proposals whose review is decided
     * @return Number of proposals moved
     */
    size_t promoteReviewed();

    /**
     * @brief Classify a repository-relative path
     */
    Classification classifyPath(const std::string& repo_root, const std::string& path) const;

private:
    std::shared_ptr<const RiskClassifier> m_classifier;
    std::shared_ptr<ProposalStore> m_store;
    std::shared_ptr<ReviewGraph> m_reviews;
    GovernanceOptions m_options;
};

} // namespace Warden
