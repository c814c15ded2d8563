// =================================================================
// include/Warden/PatchApplier.hpp
// =================================================================
// Validates, applies and commits the diffs of Committed proposals.

#pragma once

#include "Warden/Proposal.hpp"
#include "Warden/ProposalStore.hpp"
#include "Warden/VcsBackend.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Outcome classification of one apply attempt
 */
enum class PatchStatus {
    SUCCESS,
    PROPOSAL_NOT_FOUND,
    INVALID_TRANSITION,        ///< Proposal not in Committed state
    VALIDATION_FAILED,         ///< Dry run rejected the patch, nothing mutated
    APPLY_FAILED,              ///< Working tree application failed
    COMMIT_FAILED,             ///< Patch applied but the commit failed
    RETRY_BUDGET_EXHAUSTED     ///< Attempt failed and the proposal moved to Failed
};

/**
 * @brief Pipeline stage at which an attempt stopped
 */
enum class PatchStage {
    NONE,
    VALIDATION,
    APPLY,
    COMMIT
};

std::string getPatchStatusName(PatchStatus status);
std::string getPatchStageName(PatchStage stage);

struct PatchResult {
    std::string proposal_id;
    PatchStatus status = PatchStatus::SUCCESS;
    PatchStage stage = PatchStage::NONE;          ///< Failing stage, NONE on success
    std::string commit_id;                        ///< Resulting commit on success
    std::string diagnostic;                       ///< Failure details
    ProposalState final_state = ProposalState::COMMITTED;
    bool dry_run = false;

    bool success() const { return status == PatchStatus::SUCCESS; }
};

/**
 * @brief Totals of a batch run
 */
struct BatchResult {
    size_t applied = 0;
    size_t failed = 0;
    std::vector<PatchResult> results;
};

struct PatchApplierOptions {
    int max_attempts = 3;                                          ///< Retry budget per proposal
    std::string co_author = "Warden Governance <warden@localhost>"; ///< Commit trailer identity
    std::string lock_dir;                                          ///< Directory for repository locks, empty to skip
    std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(30000);
};

/**
 * @brief Applies Committed proposals to their repositories
 *
 * An attempt runs a local structural check, then the backend's dry run,
 * then the real apply and one commit. A proposal reaches Applied only after
 * the commit succeeded. Failures leave it Committed for retry until the
 * retry budget is spent, after which it moves to Failed. Partially applied
 * working-tree changes are not reverted. Attempts on the same repository
 * are serialized.
 */
class PatchApplier {
public:
    PatchApplier(std::shared_ptr<ProposalStore> store, std::shared_ptr<VcsBackend> backend,
                 const PatchApplierOptions& options = PatchApplierOptions());

    /**
     * @brief Apply one proposal
     * @param proposal_id Proposal id
     * @return Result with commit id on success, stage and diagnostic on failure
     */
    PatchResult apply(const std::string& proposal_id);

    /**
     * @brief Run only the checks, never mutating the tree or the store
     */
    PatchResult validate(const std::string& proposal_id);

    /**
     * @brief Apply every Committed proposal, oldest first
     *
     * Continues past failures. Applied and Failed proposals are never
     * touched.
     */
    BatchResult applyAll();

    /**
     * @brief Validate every Committed proposal, oldest first
     */
    BatchResult validateAll();

    /**
     * @brief Commit message for a proposal
     */
    std::string buildCommitMessage(const Proposal& proposal) const;

private:
    /**
     * @brief Structural and backend checks shared by apply() and validate()
     */
    PatchResult check(const Proposal& proposal, const std::string& patch);

    PatchResult attempt(const Proposal& proposal);

    /**
     * @brief Record a failed attempt and spend the retry budget
     */
    void recordFailure(PatchResult& result);

    std::mutex& getRepositoryMutex(const std::string& repo_root);
    std::string getRepositoryLockPath(const std::string& repo_root) const;

    std::shared_ptr<ProposalStore> m_store;
    std::shared_ptr<VcsBackend> m_backend;
    PatchApplierOptions m_options;

    std::mutex m_repo_mutexes_guard;
    std::map<std::string, std::unique_ptr<std::mutex>> m_repo_mutexes;
};

} // namespace Warden
