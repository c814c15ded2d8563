// =================================================================
// src/Warden/ReviewGraph.cpp
// =================================================================
// Implementation for quorum reviews.

#include "Warden/ReviewGraph.hpp"
#include "Warden/LockFile.hpp"
#include "Warden/Logger.hpp"
#include "Warden/Proposal.hpp"
#include "Warden/SysInteraction.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Warden {

std::string getReviewStatusName(ReviewStatus status) {
    switch (status) {
        case ReviewStatus::PENDING: return "pending";
        case ReviewStatus::APPROVED: return "approved";
        case ReviewStatus::REJECTED: return "rejected";
        default: return "unknown";
    }
}

std::string getReviewDecisionName(ReviewDecision decision) {
    return decision == ReviewDecision::APPROVE ? "approve" : "reject";
}

QuorumFunction makeQuorumTable(const std::map<size_t, size_t>& table) {
    return [table](size_t group_size) -> std::optional<size_t> {
        auto it = table.find(group_size);
        if (it == table.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::map<size_t, size_t> getDefaultQuorumTable() {
    return {{1, 1}, {3, 2}};
}

size_t ReviewRecord::countVotes(ReviewDecision decision) const {
    return static_cast<size_t>(std::count_if(votes.begin(), votes.end(),
        [decision](const auto& vote) { return vote.second == decision; }));
}

void to_json(nlohmann::json& j, const ReviewRecord& record) {
    nlohmann::json votes = nlohmann::json::object();
    for (const auto& [reviewer, decision] : record.votes) {
        votes[reviewer] = getReviewDecisionName(decision);
    }

    j = nlohmann::json{
        {"review_id", record.review_id},
        {"requesting_node", record.requesting_node},
        {"action", record.action},
        {"reviewers", record.reviewers},
        {"votes", votes},
        {"status", getReviewStatusName(record.status)},
        {"created_at", record.created_at}
    };
}

void from_json(const nlohmann::json& j, ReviewRecord& record) {
    record.review_id = j.at("review_id").get<std::string>();
    record.requesting_node = j.value("requesting_node", "");
    record.action = j.value("action", "");
    record.reviewers = j.value("reviewers", std::vector<std::string>{});
    record.created_at = j.value("created_at", "");

    record.votes.clear();
    if (j.contains("votes")) {
        for (const auto& [reviewer, decision] : j.at("votes").items()) {
            record.votes[reviewer] = decision.get<std::string>() == "approve"
                ? ReviewDecision::APPROVE : ReviewDecision::REJECT;
        }
    }

    std::string status = j.value("status", "pending");
    if (status == "approved") {
        record.status = ReviewStatus::APPROVED;
    } else if (status == "rejected") {
        record.status = ReviewStatus::REJECTED;
    } else {
        record.status = ReviewStatus::PENDING;
    }
}

ReviewGraph::ReviewGraph(QuorumFunction quorum, const std::string& state_file)
: m_quorum(std::move(quorum)), m_state_file(state_file) {
    if (!m_quorum) {
        throw std::invalid_argument("ReviewGraph requires a quorum function");
    }
}

std::optional<size_t> ReviewGraph::getRequiredApprovals(size_t group_size) const {
    return m_quorum(group_size);
}

ReviewStatus ReviewGraph::evaluate(const ReviewRecord& record) const {
    auto required = m_quorum(record.reviewers.size());
    if (!required) {
        return ReviewStatus::PENDING;
    }

    size_t approvals = record.countVotes(ReviewDecision::APPROVE);
    size_t rejections = record.countVotes(ReviewDecision::REJECT);

    if (approvals >= *required) {
        return ReviewStatus::APPROVED;
    }
    if (record.reviewers.size() - rejections < *required) {
        return ReviewStatus::REJECTED;
    }
    return ReviewStatus::PENDING;
}

ReviewGraph::State ReviewGraph::loadState() const {
    if (m_state_file.empty()) {
        return m_memory_state;
    }

    SysInteraction sys;
    State state;
    if (!sys.fileExists(m_state_file)) {
        return state;
    }

    try {
        nlohmann::json document = nlohmann::json::parse(sys.readFile(m_state_file));
        state.next_id = document.value("next_id", static_cast<uint64_t>(1));
        for (const auto& item : document.value("reviews", nlohmann::json::array())) {
            ReviewRecord record = item.get<ReviewRecord>();
            state.reviews[record.review_id] = record;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt review file " + m_state_file + ": " + e.what());
    }
    return state;
}

void ReviewGraph::saveState(const State& state) const {
    nlohmann::json reviews = nlohmann::json::array();
    for (const auto& entry : state.reviews) {
        reviews.push_back(entry.second);
    }
    nlohmann::json document = {{"next_id", state.next_id}, {"reviews", reviews}};

    SysInteraction sys;
    if (!sys.writeFileAtomic(m_state_file, document.dump(2) + "\n")) {
        throw std::runtime_error("Cannot write review file " + m_state_file);
    }
}

void ReviewGraph::withState(const std::function<void(State&)>& operation) {
    std::lock_guard<std::mutex> guard(m_mutex);

    if (m_state_file.empty()) {
        operation(m_memory_state);
        return;
    }

    LockFile lock(m_state_file + ".lock");
    if (!lock.acquire()) {
        throw std::runtime_error("Timed out locking review file " + m_state_file);
    }

    State state = loadState();
    operation(state);
    saveState(state);
}

std::string ReviewGraph::requestReview(const std::string& requesting_node, const std::string& action,
                                       const std::vector<std::string>& reviewers) {
    ReviewRecord record;
    for (const auto& reviewer : reviewers) {
        if (!reviewer.empty() &&
            std::find(record.reviewers.begin(), record.reviewers.end(), reviewer) == record.reviewers.end()) {
            record.reviewers.push_back(reviewer);
        }
    }
    if (record.reviewers.empty()) {
        throw std::invalid_argument("A review needs at least one reviewer");
    }

    if (!m_quorum(record.reviewers.size())) {
        Logger::getInstance().warning("ReviewGraph", "No quorum defined for reviewer group",
                                      "Size: " + std::to_string(record.reviewers.size()) +
                                      ", Action: " + action);
    }

    record.requesting_node = requesting_node;
    record.action = action;
    record.created_at = currentTimestamp();

    withState([&](State& state) {
        std::ostringstream id;
        id << "review_" << std::setfill('0') << std::setw(6) << state.next_id++;
        record.review_id = id.str();
        state.reviews[record.review_id] = record;
    });

    Logger::getInstance().info("ReviewGraph", "Review requested: " + record.review_id,
                               "Action: " + action + ", Reviewers: " + std::to_string(record.reviewers.size()));
    return record.review_id;
}

ReviewAnswerResult ReviewGraph::answerReview(const std::string& review_id, const std::string& reviewer,
                                             ReviewDecision decision) {
    ReviewAnswerResult result;

    withState([&](State& state) {
        auto it = state.reviews.find(review_id);
        if (it == state.reviews.end()) {
            result.error = "review not found: " + review_id;
            return;
        }

        ReviewRecord& record = it->second;
        result.status = record.status;

        if (record.status != ReviewStatus::PENDING) {
            result.error = "review already " + getReviewStatusName(record.status);
            return;
        }
        if (std::find(record.reviewers.begin(), record.reviewers.end(), reviewer) == record.reviewers.end()) {
            result.error = "'" + reviewer + "' is not a reviewer of " + review_id;
            return;
        }
        if (record.votes.count(reviewer) > 0) {
            result.error = "'" + reviewer + "' has already answered " + review_id;
            return;
        }

        record.votes[reviewer] = decision;
        record.status = evaluate(record);
        result.status = record.status;
        result.success = true;
    });

    if (result.success) {
        Logger::getInstance().info("ReviewGraph", "Answer recorded for " + review_id,
                                   "Reviewer: " + reviewer + ", Decision: " + getReviewDecisionName(decision) +
                                   ", Status: " + getReviewStatusName(result.status));
    } else {
        LOG_WARNING("ReviewGraph", "Answer refused: " + result.error);
    }
    return result;
}

std::optional<ReviewRecord> ReviewGraph::getReview(const std::string& review_id) const {
    std::lock_guard<std::mutex> guard(m_mutex);
    State state = loadState();
    auto it = state.reviews.find(review_id);
    if (it == state.reviews.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ReviewGraph::isQuorated(const std::string& review_id) const {
    auto record = getReview(review_id);
    return record && evaluate(*record) == ReviewStatus::APPROVED;
}

bool ReviewGraph::isRejected(const std::string& review_id) const {
    auto record = getReview(review_id);
    return record && evaluate(*record) == ReviewStatus::REJECTED;
}

std::vector<ReviewRecord> ReviewGraph::listReviews() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    std::vector<ReviewRecord> result;
    for (const auto& entry : loadState().reviews) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace Warden
