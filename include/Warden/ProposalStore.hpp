// =================================================================
// include/Warden/ProposalStore.hpp
// =================================================================
// Durable record of proposals and their lifecycle state.

#pragma once

#include "Warden/Proposal.hpp"
#include "Warden/SysInteraction.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Storage interface for proposals
 *
 * transition() is a compare-and-set: it succeeds only if the record is
 * currently in the expected state and the edge is legal, so of two callers
 * racing on the same edge exactly one wins. Every transition attempt, won or
 * lost, is appended to the record's audit trail.
 */
class ProposalStore {
public:
    virtual ~ProposalStore() = default;

    /**
     * @brief Persist a new proposal in PENDING state
     *
     * Assigns id, sequence and creation time (when empty).
     * @return Assigned proposal id
     */
    virtual std::string create(Proposal proposal) = 0;

    virtual std::optional<Proposal> get(const std::string& id) const = 0;

    /**
     * @brief List proposals oldest first
     * @param state Only return proposals in this state
     */
    virtual std::vector<Proposal> list(std::optional<ProposalState> state = std::nullopt) const = 0;

    /**
     * @brief Atomically move a proposal from one state to another
     * @param id Proposal id
     * @param from Expected current state
     * @param to Target state
     * @param detail Text recorded in the audit entry
     * @return True if this caller performed the transition
     */
    virtual bool transition(const std::string& id, ProposalState from, ProposalState to,
                            const std::string& detail = "") = 0;

    /**
     * @brief Record a failed apply attempt
     * @return Attempt count after recording, std::nullopt if the proposal does not exist
     */
    virtual std::optional<int> recordAttempt(const std::string& id, const AuditEntry& entry) = 0;

    virtual bool appendAudit(const std::string& id, const AuditEntry& entry) = 0;

    /**
     * @brief Link a quorum review to the proposal
     */
    virtual bool attachReview(const std::string& id, const std::string& review_id) = 0;

    /**
     * @brief Delete a PENDING proposal (cancellation)
     * @return False if missing or not PENDING
     */
    virtual bool remove(const std::string& id) = 0;

    virtual std::string getName() const = 0;

protected:
    /**
     * @brief Apply a transition to a loaded record and audit the attempt
     */
    static bool applyTransition(Proposal& proposal, ProposalState from, ProposalState to,
                                const std::string& detail);

    static std::string getTransitionAction(ProposalState to);
};

/**
 * @brief In-memory store for tests and embedding
 */
class MemoryProposalStore : public ProposalStore {
public:
    MemoryProposalStore() = default;

    std::string create(Proposal proposal) override;
    std::optional<Proposal> get(const std::string& id) const override;
    std::vector<Proposal> list(std::optional<ProposalState> state = std::nullopt) const override;
    bool transition(const std::string& id, ProposalState from, ProposalState to,
                    const std::string& detail = "") override;
    std::optional<int> recordAttempt(const std::string& id, const AuditEntry& entry) override;
    bool appendAudit(const std::string& id, const AuditEntry& entry) override;
    bool attachReview(const std::string& id, const std::string& review_id) override;
    bool remove(const std::string& id) override;
    std::string getName() const override { return "memory"; }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, Proposal> m_proposals;
    uint64_t m_next_sequence = 1;
};

/**
 * @brief Directory-backed store, one JSON document per proposal
 *
 * Layout: <dir>/<id>.json records, <dir>/<id>.lock per-record locks,
 * <dir>/.sequence counter guarded by <dir>/.store.lock. Records are written
 * to a temporary file and renamed into place. Safe across threads (in-process
 * mutex) and across processes (lock files).
 */
class FileProposalStore : public ProposalStore {
public:
    /**
     * @brief Open or create a store directory
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit FileProposalStore(const std::string& store_dir);

    std::string create(Proposal proposal) override;
    std::optional<Proposal> get(const std::string& id) const override;
    std::vector<Proposal> list(std::optional<ProposalState> state = std::nullopt) const override;
    bool transition(const std::string& id, ProposalState from, ProposalState to,
                    const std::string& detail = "") override;
    std::optional<int> recordAttempt(const std::string& id, const AuditEntry& entry) override;
    bool appendAudit(const std::string& id, const AuditEntry& entry) override;
    bool attachReview(const std::string& id, const std::string& review_id) override;
    bool remove(const std::string& id) override;
    std::string getName() const override { return "file"; }

    const std::string& getDirectory() const { return m_dir; }

private:
    std::string recordPath(const std::string& id) const;
    std::string lockPath(const std::string& id) const;
    std::optional<Proposal> load(const std::string& id) const;
    void save(const Proposal& proposal);

    /**
     * @brief Load, mutate and save a record under its lock
     * @param id Proposal id
     * @param mutation Callback returning its result and whether to save
     * @return std::nullopt if the record does not exist, otherwise the callback's result
     */
    std::optional<bool> modify(const std::string& id,
                               const std::function<bool(Proposal&, bool&)>& mutation);

    static bool isValidId(const std::string& id);

    std::string m_dir;
    mutable std::mutex m_mutex;
    mutable SysInteraction m_sys;
};

} // namespace Warden
