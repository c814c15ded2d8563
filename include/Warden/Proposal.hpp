// =================================================================
// include/Warden/Proposal.hpp
// =================================================================
// Proposal record, lifecycle states and audit trail.

#pragma once

#include "Warden/Tier.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Lifecycle state of a proposal
 *
 * PENDING -> COMMITTED -> APPLIED, COMMITTED -> FAILED, PENDING -> REJECTED.
 * APPLIED, FAILED and REJECTED are terminal.
 */
enum class ProposalState {
    PENDING,
    COMMITTED,
    APPLIED,
    FAILED,
    REJECTED
};

/**
 * @brief Display name ("Pending", "Committed", ...)
 */
std::string getProposalStateName(ProposalState state);

/**
 * @brief Externally visible state tag ("pending", "commit", "applied", "failed", "reject")
 */
std::string getProposalStateTag(ProposalState state);

/**
 * @brief Parse a state from its name or tag, case-insensitive
 */
std::optional<ProposalState> parseProposalState(const std::string& text);

bool isTerminalState(ProposalState state);

/**
 * @brief Whether the state machine has an edge from -> to
 */
bool isLegalTransition(ProposalState from, ProposalState to);

struct ProposalMetadata {
    std::string proposer;       ///< Agent or person proposing the change
    std::string summary;        ///< One-line summary
    std::string change_type;    ///< Free-form change type ("fix", "feature", ...)
    std::string created_at;     ///< ISO-8601 UTC timestamp
};

/**
 * @brief Unified diff for one file
 */
struct FileDiff {
    std::string path;
    std::string diff;
};

/**
 * @brief One recorded transition attempt or lifecycle event
 */
struct AuditEntry {
    std::string timestamp;
    std::string action;         ///< "create", "promote", "apply", "reject", ...
    std::string from_state;
    std::string to_state;
    bool success = false;
    std::string detail;

    /**
     * @brief Build an entry stamped with the current time
     */
    static AuditEntry make(const std::string& action, const std::string& from_state,
                           const std::string& to_state, bool success,
                           const std::string& detail = "");
};

/**
 * @brief A change proposal and its lifecycle record
 *
 * Diff content is fixed at creation; only state, attempts, the review link
 * and the audit trail change afterwards.
 */
struct Proposal {
    std::string id;
    uint64_t sequence = 0;                ///< Creation order, assigned by the store
    std::string repo_root;                ///< Repository the diffs apply to
    std::vector<FileDiff> diffs;          ///< One entry per file, in order
    ProposalMetadata metadata;
    ProposalState state = ProposalState::PENDING;
    Tier tier = Tier::INFORM;             ///< Strictest tier over all files
    std::string review_id;                ///< Quorum review, GOVERN only
    int attempts = 0;                     ///< Failed apply attempts
    std::vector<AuditEntry> audit;

    /**
     * @brief All file diffs concatenated into one patch
     */
    std::string combinedPatch() const;

    /**
     * @brief Id with its state tag appended ("<id>.pending")
     */
    std::string taggedId() const;

    std::vector<std::string> paths() const;

    /**
     * @brief True when at least one diff has non-whitespace content
     */
    bool hasDiffContent() const;
};

/**
 * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string currentTimestamp();

/**
 * @brief Build a creation-ordered proposal id
 * @param proposer Proposer name, reduced to [A-Za-z0-9_-]
 * @param sequence Store sequence number
 * @return "<proposer>_<YYYY-MM-DD_HH-MM-SS>_<sequence>"
 */
std::string generateProposalId(const std::string& proposer, uint64_t sequence);

/**
 * @brief Strip a trailing state tag from an id ("x.pending" -> "x")
 */
std::string stripStateTag(const std::string& tagged_id);

void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);
void to_json(nlohmann::json& j, const Proposal& proposal);
void from_json(const nlohmann::json& j, Proposal& proposal);

} // namespace Warden
