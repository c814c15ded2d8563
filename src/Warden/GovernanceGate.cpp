// =================================================================
// src/Warden/GovernanceGate.cpp
// =================================================================
// Implementation for proposal submission and review promotion.

#include "Warden/GovernanceGate.hpp"
#include "Warden/DiffGenerator.hpp"
#include "Warden/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace Warden {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::string getSubmitStatusName(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::CREATED: return "Created";
        case SubmitStatus::NOT_REQUIRED: return "NotRequired";
        case SubmitStatus::DIFF_EMPTY: return "DiffEmpty";
        case SubmitStatus::INVALID: return "Invalid";
        default: return "Unknown";
    }
}

std::string getGateStatusName(GateStatus status) {
    switch (status) {
        case GateStatus::SUCCESS: return "Success";
        case GateStatus::PROPOSAL_NOT_FOUND: return "ProposalNotFound";
        case GateStatus::INVALID_TRANSITION: return "InvalidTransition";
        case GateStatus::REVIEW_REQUIRED: return "ReviewRequired";
        default: return "Unknown";
    }
}

GovernanceGate::GovernanceGate(std::shared_ptr<const RiskClassifier> classifier,
                               std::shared_ptr<ProposalStore> store,
                               std::shared_ptr<ReviewGraph> reviews,
                               const GovernanceOptions& options)
: m_classifier(std::move(classifier)), m_store(std::move(store)),
  m_reviews(std::move(reviews)), m_options(options) {
    if (!m_classifier || !m_store || !m_reviews) {
        throw std::invalid_argument("GovernanceGate requires a classifier, a store and a review graph");
    }
}

Classification GovernanceGate::classifyPath(const std::string& repo_root, const std::string& path) const {
    std::filesystem::path full = std::filesystem::path(repo_root) / path;
    Classification classification = m_classifier->classify(full.generic_string());
    Logger::getInstance().logClassification(classification);
    return classification;
}

SubmitResult GovernanceGate::submit(const ProposalDraft& draft) {
    SubmitResult result;

    if (draft.repo_root.empty()) {
        result.message = "no repository root given";
        return result;
    }
    if (draft.changes.empty() && draft.diffs.empty()) {
        result.message = "draft contains no changes";
        return result;
    }

    std::vector<std::string> paths;
    for (const auto& change : draft.changes) {
        paths.push_back(change.path);
    }
    for (const auto& file_diff : draft.diffs) {
        paths.push_back(file_diff.path);
    }

    Tier tier = Tier::FREE;
    for (const auto& path : paths) {
        Classification classification = classifyPath(draft.repo_root, path);
        tier = strictestTier(tier, classification.tier);
        result.classifications.push_back(std::move(classification));
    }
    result.tier = tier;

    if (!requiresProposal(tier)) {
        result.status = SubmitStatus::NOT_REQUIRED;
        result.message = "all files are " + getTierLabel(Tier::FREE) + " tier, no proposal needed";
        return result;
    }

    Proposal proposal;
    proposal.repo_root = draft.repo_root;
    proposal.metadata = draft.metadata;
    proposal.tier = tier;

    for (const auto& change : draft.changes) {
        std::string diff = DiffGenerator::makeDiff(change.original, change.modified, change.path);
        if (!diff.empty()) {
            proposal.diffs.push_back({change.path, diff});
        }
    }
    for (const auto& file_diff : draft.diffs) {
        if (!isBlank(file_diff.diff)) {
            proposal.diffs.push_back(file_diff);
        }
    }

    if (proposal.diffs.empty()) {
        result.status = SubmitStatus::DIFF_EMPTY;
        result.message = "no change - do not propose";
        return result;
    }

    result.proposal_id = m_store->create(proposal);
    result.status = SubmitStatus::CREATED;
    result.state = ProposalState::PENDING;

    Logger::getInstance().info("GovernanceGate", "Proposal submitted: " + result.proposal_id,
                               "Tier: " + getTierLabel(tier) + ", Files: " + std::to_string(proposal.diffs.size()));

    if (requiresReview(tier)) {
        if (m_options.reviewers.empty()) {
            result.message = "no reviewers configured, proposal cannot be committed";
            LOG_WARNING("GovernanceGate", "No reviewers configured for " + result.proposal_id);
            return result;
        }
        result.review_id = m_reviews->requestReview(m_options.node_name, result.proposal_id, m_options.reviewers);
        if (!m_store->attachReview(result.proposal_id, result.review_id)) {
            LOG_ERROR("GovernanceGate", "Could not attach " + result.review_id + " to " + result.proposal_id);
        }
        result.message = "awaiting review " + result.review_id;
        return result;
    }

    if (m_options.auto_promote) {
        if (m_store->transition(result.proposal_id, ProposalState::PENDING, ProposalState::COMMITTED,
                                "auto-promoted at tier " + getTierLabel(tier))) {
            result.state = ProposalState::COMMITTED;
            result.message = "committed for application";
        }
    } else {
        result.message = "awaiting approval";
    }

    return result;
}

GateResult GovernanceGate::approve(const std::string& proposal_id) {
    GateResult result;

    auto proposal = m_store->get(proposal_id);
    if (!proposal) {
        result.status = GateStatus::PROPOSAL_NOT_FOUND;
        result.message = "no such proposal: " + proposal_id;
        return result;
    }
    result.state = proposal->state;

    if (proposal->state != ProposalState::PENDING) {
        result.status = GateStatus::INVALID_TRANSITION;
        result.message = "proposal is " + getProposalStateName(proposal->state) + ", not Pending";
        return result;
    }

    if (requiresReview(proposal->tier)) {
        if (proposal->review_id.empty()) {
            result.status = GateStatus::REVIEW_REQUIRED;
            result.message = getTierLabel(proposal->tier) + " proposal has no review attached";
            return result;
        }
        if (!m_reviews->isQuorated(proposal->review_id)) {
            result.status = GateStatus::REVIEW_REQUIRED;
            result.message = "review " + proposal->review_id + " has not reached quorum";
            return result;
        }
    }

    if (!m_store->transition(proposal_id, ProposalState::PENDING, ProposalState::COMMITTED,
                             proposal->review_id.empty() ? "approved" : "approved by review " + proposal->review_id)) {
        auto current = m_store->get(proposal_id);
        result.status = GateStatus::INVALID_TRANSITION;
        result.state = current ? current->state : proposal->state;
        result.message = "proposal changed state concurrently";
        return result;
    }

    result.state = ProposalState::COMMITTED;
    result.message = "committed for application";
    return result;
}

GateResult GovernanceGate::reject(const std::string& proposal_id, const std::string& reason) {
    GateResult result;

    auto proposal = m_store->get(proposal_id);
    if (!proposal) {
        result.status = GateStatus::PROPOSAL_NOT_FOUND;
        result.message = "no such proposal: " + proposal_id;
        return result;
    }

    if (!m_store->transition(proposal_id, ProposalState::PENDING, ProposalState::REJECTED,
                             reason.empty() ? "rejected" : reason)) {
        auto current = m_store->get(proposal_id);
        result.status = GateStatus::INVALID_TRANSITION;
        result.state = current ? current->state : proposal->state;
        result.message = "proposal is " + getProposalStateName(result.state) + ", not Pending";
        return result;
    }

    result.state = ProposalState::REJECTED;
    result.message = "rejected";
    return result;
}

GateResult GovernanceGate::cancel(const std::string& proposal_id) {
    GateResult result;

    auto proposal = m_store->get(proposal_id);
    if (!proposal) {
        result.status = GateStatus::PROPOSAL_NOT_FOUND;
        result.message = "no such proposal: " + proposal_id;
        return result;
    }
    result.state = proposal->state;

    if (!m_store->remove(proposal_id)) {
        result.status = GateStatus::INVALID_TRANSITION;
        result.message = "only Pending proposals can be cancelled";
        return result;
    }

    result.message = "cancelled";
    return result;
}

size_t GovernanceGate::promoteReviewed() {
    size_t moved = 0;

    for (const auto& proposal : m_store->list(ProposalState::PENDING)) {
        if (proposal.review_id.empty()) {
            continue;
        }

        if (m_reviews->isQuorated(proposal.review_id)) {
            if (m_store->transition(proposal.id, ProposalState::PENDING, ProposalState::COMMITTED,
                                    "quorum reached on " + proposal.review_id)) {
                moved++;
            }
        } else if (m_reviews->isRejected(proposal.review_id)) {
            if (m_store->transition(proposal.id, ProposalState::PENDING, ProposalState::REJECTED,
                                    "review " + proposal.review_id + " rejected")) {
                moved++;
            }
        }
    }

    return moved;
}

} // namespace Warden
