// =================================================================
// src/Warden/PatchApplier.cpp
// =================================================================
// Implementation for the patch application and commit engine.

#include "Warden/PatchApplier.hpp"
#include "Warden/LockFile.hpp"
#include "Warden/Logger.hpp"
#include "Warden/UnifiedPatch.hpp"
#include <functional>
#include <sstream>
#include <stdexcept>

namespace Warden {

namespace {

bool isSafeRelativePath(const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return false;
    }
    std::istringstream parts(path);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace

std::string getPatchStatusName(PatchStatus status) {
    switch (status) {
        case PatchStatus::SUCCESS: return "Success";
        case PatchStatus::PROPOSAL_NOT_FOUND: return "ProposalNotFound";
        case PatchStatus::INVALID_TRANSITION: return "InvalidTransition";
        case PatchStatus::VALIDATION_FAILED: return "PatchValidationFailed";
        case PatchStatus::APPLY_FAILED: return "PatchApplyFailed";
        case PatchStatus::COMMIT_FAILED: return "CommitFailed";
        case PatchStatus::RETRY_BUDGET_EXHAUSTED: return "RetryBudgetExhausted";
        default: return "Unknown";
    }
}

std::string getPatchStageName(PatchStage stage) {
    switch (stage) {
        case PatchStage::NONE: return "none";
        case PatchStage::VALIDATION: return "validation";
        case PatchStage::APPLY: return "apply";
        case PatchStage::COMMIT: return "commit";
        default: return "unknown";
    }
}

PatchApplier::PatchApplier(std::shared_ptr<ProposalStore> store, std::shared_ptr<VcsBackend> backend,
                           const PatchApplierOptions& options)
: m_store(std::move(store)), m_backend(std::move(backend)), m_options(options) {
    if (!m_store || !m_backend) {
        throw std::invalid_argument("PatchApplier requires a store and a VCS backend");
    }
    if (m_options.max_attempts < 1) {
        m_options.max_attempts = 1;
    }
}

std::mutex& PatchApplier::getRepositoryMutex(const std::string& repo_root) {
    std::lock_guard<std::mutex> guard(m_repo_mutexes_guard);
    auto& slot = m_repo_mutexes[repo_root];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::string PatchApplier::getRepositoryLockPath(const std::string& repo_root) const {
    std::ostringstream path;
    path << m_options.lock_dir << "/repo_" << std::hex << std::hash<std::string>{}(repo_root) << ".lock";
    return path.str();
}

std::string PatchApplier::buildCommitMessage(const Proposal& proposal) const {
    std::ostringstream message;

    std::string summary = proposal.metadata.summary;
    if (summary.empty()) {
        summary = "Apply proposal " + proposal.id;
    }

    message << summary << "\n\n";
    message << "Proposed by: " << (proposal.metadata.proposer.empty() ? "unknown" : proposal.metadata.proposer) << "\n";
    message << "Proposal ID: " << proposal.id << "\n";
    if (!proposal.metadata.change_type.empty()) {
        message << "Change type: " << proposal.metadata.change_type << "\n";
    }
    message << "Tier: " << getTierLabel(proposal.tier) << "\n";
    message << "\nCo-Authored-By: " << m_options.co_author << "\n";

    return message.str();
}

PatchResult PatchApplier::check(const Proposal& proposal, const std::string& patch) {
    PatchResult result;
    result.proposal_id = proposal.id;
    result.final_state = proposal.state;
    result.stage = PatchStage::VALIDATION;
    result.status = PatchStatus::VALIDATION_FAILED;

    PatchParseResult parsed = UnifiedPatch::parse(patch);
    if (!parsed.success) {
        result.diagnostic = "malformed patch: " + parsed.error;
        return result;
    }

    for (const auto& path : UnifiedPatch::affectedPaths(parsed.files)) {
        if (!isSafeRelativePath(path)) {
            result.diagnostic = "patch touches a path outside the repository: " + path;
            return result;
        }
    }

    VcsResult validation;
    try {
        validation = m_backend->validatePatch(proposal.repo_root, patch);
    } catch (const std::exception& e) {
        result.diagnostic = std::string("validation error: ") + e.what();
        return result;
    }

    if (!validation.success) {
        result.diagnostic = validation.output.empty() ? "patch does not apply" : validation.output;
        return result;
    }

    result.status = PatchStatus::SUCCESS;
    result.stage = PatchStage::NONE;
    return result;
}

void PatchApplier::recordFailure(PatchResult& result) {
    std::string detail = getPatchStageName(result.stage) + ": " + result.diagnostic;
    std::string committed = getProposalStateName(ProposalState::COMMITTED);

    auto attempts = m_store->recordAttempt(result.proposal_id,
        AuditEntry::make("apply", committed, committed, false, detail));
    result.final_state = ProposalState::COMMITTED;

    if (!attempts || *attempts < m_options.max_attempts) {
        return;
    }

    std::string reason = "retry budget exhausted after " + std::to_string(*attempts) + " attempt(s)";
    if (m_store->transition(result.proposal_id, ProposalState::COMMITTED, ProposalState::FAILED, reason)) {
        result.status = PatchStatus::RETRY_BUDGET_EXHAUSTED;
        result.final_state = ProposalState::FAILED;
        result.diagnostic += " (" + reason + ")";
    }
}

PatchResult PatchApplier::attempt(const Proposal& proposal) {
    if (!proposal.hasDiffContent()) {
        // Nothing can ever apply, so the proposal fails on its first attempt
        PatchResult result;
        result.proposal_id = proposal.id;
        result.status = PatchStatus::VALIDATION_FAILED;
        result.stage = PatchStage::VALIDATION;
        result.diagnostic = "proposal has no diff content";
        result.final_state = ProposalState::COMMITTED;

        std::string committed = getProposalStateName(ProposalState::COMMITTED);
        m_store->recordAttempt(proposal.id, AuditEntry::make("apply", committed, committed, false,
                                                             "validation: " + result.diagnostic));
        if (m_store->transition(proposal.id, ProposalState::COMMITTED, ProposalState::FAILED,
                                "unrecoverable: no diff content")) {
            result.status = PatchStatus::RETRY_BUDGET_EXHAUSTED;
            result.final_state = ProposalState::FAILED;
        }
        return result;
    }

    std::string patch = proposal.combinedPatch();

    PatchResult result = check(proposal, patch);
    if (!result.success()) {
        recordFailure(result);
        return result;
    }

    std::vector<std::string> paths = UnifiedPatch::affectedPaths(UnifiedPatch::parse(patch).files);

    result.stage = PatchStage::APPLY;
    result.status = PatchStatus::APPLY_FAILED;
    VcsResult applied;
    try {
        applied = m_backend->applyPatch(proposal.repo_root, patch);
    } catch (const std::exception& e) {
        applied.success = false;
        applied.output = std::string("apply error: ") + e.what();
    }
    if (!applied.success) {
        result.diagnostic = applied.output.empty() ? "patch application failed" : applied.output;
        recordFailure(result);
        return result;
    }

    result.stage = PatchStage::COMMIT;
    result.status = PatchStatus::COMMIT_FAILED;
    VcsResult committed;
    try {
        committed = m_backend->commit(proposal.repo_root, paths, buildCommitMessage(proposal));
    } catch (const std::exception& e) {
        committed.success = false;
        committed.output = std::string("commit error: ") + e.what();
    }
    if (!committed.success) {
        result.diagnostic = committed.output.empty() ? "commit failed" : committed.output;
        Logger::getInstance().critical("PatchApplier",
            "Working tree of " + proposal.repo_root + " holds uncommitted changes from " + proposal.id,
            result.diagnostic);
        recordFailure(result);
        return result;
    }

    result.commit_id = committed.commit_id;
    if (!m_store->transition(proposal.id, ProposalState::COMMITTED, ProposalState::APPLIED,
                             "commit " + committed.commit_id)) {
        result.status = PatchStatus::INVALID_TRANSITION;
        result.diagnostic = "proposal changed state while being applied; commit " + committed.commit_id + " exists";
        auto current = m_store->get(proposal.id);
        result.final_state = current ? current->state : ProposalState::COMMITTED;
        return result;
    }

    result.status = PatchStatus::SUCCESS;
    result.stage = PatchStage::NONE;
    result.final_state = ProposalState::APPLIED;
    return result;
}

PatchResult PatchApplier::apply(const std::string& proposal_id) {
    PatchResult result;
    result.proposal_id = proposal_id;

    auto proposal = m_store->get(proposal_id);
    if (!proposal) {
        result.status = PatchStatus::PROPOSAL_NOT_FOUND;
        result.diagnostic = "no such proposal";
        Logger::getInstance().logPatchResult(result);
        return result;
    }

    if (proposal->state != ProposalState::COMMITTED) {
        result.status = PatchStatus::INVALID_TRANSITION;
        result.final_state = proposal->state;
        result.diagnostic = "proposal is " + getProposalStateName(proposal->state) + ", not Committed";
        Logger::getInstance().logPatchResult(result);
        return result;
    }

    std::lock_guard<std::mutex> repo_guard(getRepositoryMutex(proposal->repo_root));

    std::unique_ptr<LockFile> repo_lock;
    if (!m_options.lock_dir.empty()) {
        repo_lock = std::make_unique<LockFile>(getRepositoryLockPath(proposal->repo_root), m_options.lock_timeout);
        if (!repo_lock->acquire()) {
            result.status = PatchStatus::VALIDATION_FAILED;
            result.stage = PatchStage::VALIDATION;
            result.final_state = proposal->state;
            result.diagnostic = "repository is locked by another apply: " + proposal->repo_root;
            Logger::getInstance().logPatchResult(result);
            return result;
        }
    }

    // Another applier may have won while we waited for the lock
    proposal = m_store->get(proposal_id);
    if (!proposal || proposal->state != ProposalState::COMMITTED) {
        result.status = proposal ? PatchStatus::INVALID_TRANSITION : PatchStatus::PROPOSAL_NOT_FOUND;
        result.final_state = proposal ? proposal->state : ProposalState::COMMITTED;
        result.diagnostic = proposal ? "proposal is " + getProposalStateName(proposal->state) + ", not Committed"
                                     : "no such proposal";
        Logger::getInstance().logPatchResult(result);
        return result;
    }

    result = attempt(*proposal);
    Logger::getInstance().logPatchResult(result);
    return result;
}

PatchResult PatchApplier::validate(const std::string& proposal_id) {
    PatchResult result;
    result.proposal_id = proposal_id;
    result.dry_run = true;

    auto proposal = m_store->get(proposal_id);
    if (!proposal) {
        result.status = PatchStatus::PROPOSAL_NOT_FOUND;
        result.diagnostic = "no such proposal";
        return result;
    }

    if (proposal->state != ProposalState::COMMITTED) {
        result.status = PatchStatus::INVALID_TRANSITION;
        result.final_state = proposal->state;
        result.diagnostic = "proposal is " + getProposalStateName(proposal->state) + ", not Committed";
        return result;
    }

    if (!proposal->hasDiffContent()) {
        result.status = PatchStatus::VALIDATION_FAILED;
        result.stage = PatchStage::VALIDATION;
        result.final_state = proposal->state;
        result.diagnostic = "proposal has no diff content";
        return result;
    }

    result = check(*proposal, proposal->combinedPatch());
    result.dry_run = true;
    Logger::getInstance().debug("PatchApplier", "Dry run for " + proposal_id,
                                getPatchStatusName(result.status));
    return result;
}

BatchResult PatchApplier::applyAll() {
    BatchResult batch;
    auto committed = m_store->list(ProposalState::COMMITTED);

    Logger::getInstance().info("PatchApplier", "Applying committed proposals",
                               "Count: " + std::to_string(committed.size()));

    for (const auto& proposal : committed) {
        PatchResult result = apply(proposal.id);
        if (result.success()) {
            batch.applied++;
        } else {
            batch.failed++;
        }
        batch.results.push_back(std::move(result));
    }

    return batch;
}

BatchResult PatchApplier::validateAll() {
    BatchResult batch;
    for (const auto& proposal : m_store->list(ProposalState::COMMITTED)) {
        PatchResult result = validate(proposal.id);
        if (result.success()) {
            batch.applied++;
        } else {
            batch.failed++;
        }
        batch.results.push_back(std::move(result));
    }
    return batch;
}

} // namespace Warden
