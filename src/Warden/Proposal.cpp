// =================================================================
// src/Warden/Proposal.cpp
// =================================================================
// Implementation for proposal records and lifecycle rules.

#include "Warden/Proposal.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Warden {

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string formatUtc(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, format);
    return oss.str();
}

const ProposalState ALL_STATES[] = {
    ProposalState::PENDING, ProposalState::COMMITTED, ProposalState::APPLIED,
    ProposalState::FAILED, ProposalState::REJECTED
};

} // namespace

std::string getProposalStateName(ProposalState state) {
    switch (state) {
        case ProposalState::PENDING: return "Pending";
        case ProposalState::COMMITTED: return "Committed";
        case ProposalState::APPLIED: return "Applied";
        case ProposalState::FAILED: return "Failed";
        case ProposalState::REJECTED: return "Rejected";
        default: return "Unknown";
    }
}

std::string getProposalStateTag(ProposalState state) {
    switch (state) {
        case ProposalState::PENDING: return "pending";
        case ProposalState::COMMITTED: return "commit";
        case ProposalState::APPLIED: return "applied";
        case ProposalState::FAILED: return "failed";
        case ProposalState::REJECTED: return "reject";
        default: return "unknown";
    }
}

std::optional<ProposalState> parseProposalState(const std::string& text) {
    std::string lower = toLower(text);
    for (ProposalState state : ALL_STATES) {
        if (lower == toLower(getProposalStateName(state)) || lower == getProposalStateTag(state)) {
            return state;
        }
    }
    return std::nullopt;
}

bool isTerminalState(ProposalState state) {
    return state == ProposalState::APPLIED ||
           state == ProposalState::FAILED ||
           state == ProposalState::REJECTED;
}

bool isLegalTransition(ProposalState from, ProposalState to) {
    switch (from) {
        case ProposalState::PENDING:
            return to == ProposalState::COMMITTED || to == ProposalState::REJECTED;
        case ProposalState::COMMITTED:
            return to == ProposalState::APPLIED || to == ProposalState::FAILED;
        default:
            return false;
    }
}

AuditEntry AuditEntry::make(const std::string& action, const std::string& from_state,
                            const std::string& to_state, bool success,
                            const std::string& detail) {
    AuditEntry entry;
    entry.timestamp = currentTimestamp();
    entry.action = action;
    entry.from_state = from_state;
    entry.to_state = to_state;
    entry.success = success;
    entry.detail = detail;
    return entry;
}

std::string Proposal::combinedPatch() const {
    std::string patch;
    for (const auto& file_diff : diffs) {
        if (file_diff.diff.empty()) {
            continue;
        }
        patch += file_diff.diff;
        if (patch.back() != '\n') {
            patch += '\n';
        }
    }
    return patch;
}

std::string Proposal::taggedId() const {
    return id + "." + getProposalStateTag(state);
}

std::vector<std::string> Proposal::paths() const {
    std::vector<std::string> result;
    for (const auto& file_diff : diffs) {
        result.push_back(file_diff.path);
    }
    return result;
}

bool Proposal::hasDiffContent() const {
    for (const auto& file_diff : diffs) {
        bool blank = std::all_of(file_diff.diff.begin(), file_diff.diff.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
        if (!blank) {
            return true;
        }
    }
    return false;
}

std::string currentTimestamp() {
    return formatUtc("%Y-%m-%dT%H:%M:%SZ");
}

std::string generateProposalId(const std::string& proposer, uint64_t sequence) {
    std::string name;
    for (unsigned char c : proposer) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            name += static_cast<char>(c);
        } else if (!name.empty() && name.back() != '-') {
            name += '-';
        }
    }
    if (name.empty()) {
        name = "anonymous";
    }

    std::ostringstream id;
    id << name << "_" << formatUtc("%Y-%m-%d_%H-%M-%S") << "_"
       << std::setfill('0') << std::setw(6) << sequence;
    return id.str();
}

std::string stripStateTag(const std::string& tagged_id) {
    size_t dot = tagged_id.rfind('.');
    if (dot == std::string::npos) {
        return tagged_id;
    }
    std::string tag = tagged_id.substr(dot + 1);
    for (ProposalState state : ALL_STATES) {
        if (tag == getProposalStateTag(state)) {
            return tagged_id.substr(0, dot);
        }
    }
    return tagged_id;
}

void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
        {"timestamp", entry.timestamp},
        {"action", entry.action},
        {"from", entry.from_state},
        {"to", entry.to_state},
        {"success", entry.success},
        {"detail", entry.detail}
    };
}

void from_json(const nlohmann::json& j, AuditEntry& entry) {
    entry.timestamp = j.value("timestamp", "");
    entry.action = j.value("action", "");
    entry.from_state = j.value("from", "");
    entry.to_state = j.value("to", "");
    entry.success = j.value("success", false);
    entry.detail = j.value("detail", "");
}

void to_json(nlohmann::json& j, const Proposal& proposal) {
    nlohmann::json diffs = nlohmann::json::array();
    for (const auto& file_diff : proposal.diffs) {
        diffs.push_back({{"path", file_diff.path}, {"diff", file_diff.diff}});
    }

    j = nlohmann::json{
        {"id", proposal.id},
        {"sequence", proposal.sequence},
        {"repo_root", proposal.repo_root},
        {"state", getProposalStateName(proposal.state)},
        {"tier", getTierLabel(proposal.tier)},
        {"review_id", proposal.review_id},
        {"attempts", proposal.attempts},
        {"metadata", {
            {"proposer", proposal.metadata.proposer},
            {"summary", proposal.metadata.summary},
            {"change_type", proposal.metadata.change_type},
            {"created_at", proposal.metadata.created_at}
        }},
        {"diffs", diffs},
        {"audit", proposal.audit}
    };
}

void from_json(const nlohmann::json& j, Proposal& proposal) {
    proposal.id = j.at("id").get<std::string>();
    proposal.sequence = j.value("sequence", static_cast<uint64_t>(0));
    proposal.repo_root = j.value("repo_root", "");

    auto state = parseProposalState(j.at("state").get<std::string>());
    if (!state) {
        throw std::runtime_error("Unknown proposal state in record " + proposal.id);
    }
    proposal.state = *state;

    auto tier = parseTier(j.value("tier", "INFORM"));
    proposal.tier = tier.value_or(Tier::INFORM);
    proposal.review_id = j.value("review_id", "");
    proposal.attempts = j.value("attempts", 0);

    if (j.contains("metadata")) {
        const auto& metadata = j.at("metadata");
        proposal.metadata.proposer = metadata.value("proposer", "");
        proposal.metadata.summary = metadata.value("summary", "");
        proposal.metadata.change_type = metadata.value("change_type", "");
        proposal.metadata.created_at = metadata.value("created_at", "");
    }

    proposal.diffs.clear();
    if (j.contains("diffs")) {
        for (const auto& item : j.at("diffs")) {
            proposal.diffs.push_back({item.value("path", ""), item.value("diff", "")});
        }
    }

    proposal.audit.clear();
    if (j.contains("audit")) {
        proposal.audit = j.at("audit").get<std::vector<AuditEntry>>();
    }
}

} // namespace Warden
