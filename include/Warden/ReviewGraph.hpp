// =================================================================
// include/Warden/ReviewGraph.hpp
// =================================================================
// Quorum review gate for GOVERN-tier proposals.

#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief A single reviewer's answer
 */
enum class ReviewDecision {
    APPROVE,
    REJECT
};

/**
 * @brief Overall state of a review
 */
enum class ReviewStatus {
    PENDING,
    APPROVED,
    REJECTED
};

std::string getReviewStatusName(ReviewStatus status);
std::string getReviewDecisionName(ReviewDecision decision);

/**
 * @brief Required approvals for a reviewer group of the given size
 *
 * std::nullopt means no quorum is defined for that size.
 */
using QuorumFunction = std::function<std::optional<size_t>(size_t group_size)>;

/**
 * @brief Quorum function backed by an explicit table
 *
 * Group sizes missing from the table have no quorum.
 */
QuorumFunction makeQuorumTable(const std::map<size_t, size_t>& table);

/**
 * @brief 1 reviewer -> 1 approval, 3 reviewers -> 2 approvals
 */
std::map<size_t, size_t> getDefaultQuorumTable();

struct ReviewRecord {
    std::string review_id;
    std::string requesting_node;                    ///< Node asking for review
    std::string action;                             ///< Action under review (proposal id)
    std::vector<std::string> reviewers;             ///< Reviewer set fixed at request time
    std::map<std::string, ReviewDecision> votes;    ///< Answers received so far
    ReviewStatus status = ReviewStatus::PENDING;
    std::string created_at;

    size_t countVotes(ReviewDecision decision) const;
};

void to_json(nlohmann::json& j, const ReviewRecord& record);
void from_json(const nlohmann::json& j, ReviewRecord& record);

struct ReviewAnswerResult {
    bool success = false;
    std::string error;
    ReviewStatus status = ReviewStatus::PENDING;
};

/**
 * @brief Tracks reviews and decides quorum
 *
 * Each review carries an explicit reviewer set. A review is APPROVED once
 * approvals reach the quorum for the set's size, and REJECTED once the
 * remaining reviewers can no longer reach it. When a state file is given,
 * every operation re-reads and rewrites it under a lock file so that several
 * processes share the same reviews.
 */
class ReviewGraph {
public:
    /**
     * @brief Construct a review graph
     * @param quorum Quorum function
     * @param state_file JSON persistence file, empty for memory only
     */
    explicit ReviewGraph(QuorumFunction quorum, const std::string& state_file = "");

    /**
     * @brief Open a review
     * @param requesting_node Node requesting the review
     * @param action Action under review
     * @param reviewers Reviewer identities, duplicates removed
     * @return New review id
     * @throws std::invalid_argument if the reviewer set is empty
     */
    std::string requestReview(const std::string& requesting_node, const std::string& action,
                              const std::vector<std::string>& reviewers);

    /**
     * @brief Record one reviewer's answer
     *
     * Refused for unknown reviews, reviewers outside the set, repeated
     * answers and reviews that are already decided.
     */
    ReviewAnswerResult answerReview(const std::string& review_id, const std::string& reviewer,
                                    ReviewDecision decision);

    /**
     * @brief Whether the review reached quorum
     */
    bool isQuorated(const std::string& review_id) const;

    bool isRejected(const std::string& review_id) const;

    std::optional<ReviewRecord> getReview(const std::string& review_id) const;

    std::vector<ReviewRecord> listReviews() const;

    /**
     * @brief Required approvals for a group size, per the quorum function
     */
    std::optional<size_t> getRequiredApprovals(size_t group_size) const;

private:
    struct State {
        uint64_t next_id = 1;
        std::map<std::string, ReviewRecord> reviews;
    };

    ReviewStatus evaluate(const ReviewRecord& record) const;
    State loadState() const;
    void saveState(const State& state) const;

    /**
     * @brief Run a read-modify-write cycle on the shared state
     */
    void withState(const std::function<void(State&)>& operation);

    QuorumFunction m_quorum;
    std::string m_state_file;
    mutable std::mutex m_mutex;
    State m_memory_state;
};

} // namespace Warden
