// =================================================================
// src/Warden/ProposalStore.cpp
// =================================================================
// Implementation for the in-memory and directory-backed proposal stores.

#include "Warden/ProposalStore.hpp"
#include "Warden/LockFile.hpp"
#include "Warden/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace Warden {

namespace {

void sortBySequence(std::vector<Proposal>& proposals) {
    std::sort(proposals.begin(), proposals.end(),
              [](const Proposal& a, const Proposal& b) { return a.sequence < b.sequence; });
}

void prepareNew(Proposal& proposal, uint64_t sequence) {
    proposal.sequence = sequence;
    proposal.id = generateProposalId(proposal.metadata.proposer, sequence);
    proposal.state = ProposalState::PENDING;
    proposal.attempts = 0;
    if (proposal.metadata.created_at.empty()) {
        proposal.metadata.created_at = currentTimestamp();
    }
    proposal.audit.clear();
    proposal.audit.push_back(AuditEntry::make("create", "", getProposalStateName(ProposalState::PENDING), true,
                                              std::to_string(proposal.diffs.size()) + " file(s)"));
}

} // namespace

// ---------------------------------------------------------------- ProposalStore

std::string ProposalStore::getTransitionAction(ProposalState to) {
    switch (to) {
        case ProposalState::COMMITTED: return "promote";
        case ProposalState::APPLIED: return "apply";
        case ProposalState::FAILED: return "fail";
        case ProposalState::REJECTED: return "reject";
        default: return "transition";
    }
}

bool ProposalStore::applyTransition(Proposal& proposal, ProposalState from, ProposalState to,
                                    const std::string& detail) {
    std::string outcome = detail;
    bool success = false;

    if (!isLegalTransition(from, to)) {
        outcome = "illegal transition";
    } else if (proposal.state != from) {
        outcome = "state is " + getProposalStateName(proposal.state);
    } else {
        proposal.state = to;
        success = true;
    }

    proposal.audit.push_back(AuditEntry::make(getTransitionAction(to), getProposalStateName(from),
                                              getProposalStateName(to), success, outcome));
    Logger::getInstance().logTransition(proposal.id, getProposalStateName(from),
                                        getProposalStateName(to), success);
    return success;
}

// ---------------------------------------------------------- MemoryProposalStore

std::string MemoryProposalStore::create(Proposal proposal) {
    std::lock_guard<std::mutex> lock(m_mutex);
    prepareNew(proposal, m_next_sequence++);
    std::string id = proposal.id;
    m_proposals[id] = std::move(proposal);
    return id;
}

std::optional<Proposal> MemoryProposalStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Proposal> MemoryProposalStore::list(std::optional<ProposalState> state) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : m_proposals) {
        if (!state || proposal.state == *state) {
            result.push_back(proposal);
        }
    }
    sortBySequence(result);
    return result;
}

bool MemoryProposalStore::transition(const std::string& id, ProposalState from, ProposalState to,
                                     const std::string& detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end()) {
        return false;
    }
    return applyTransition(it->second, from, to, detail);
}

std::optional<int> MemoryProposalStore::recordAttempt(const std::string& id, const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end()) {
        return std::nullopt;
    }
    it->second.attempts++;
    it->second.audit.push_back(entry);
    return it->second.attempts;
}

bool MemoryProposalStore::appendAudit(const std::string& id, const AuditEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end()) {
        return false;
    }
    it->second.audit.push_back(entry);
    return true;
}

bool MemoryProposalStore::attachReview(const std::string& id, const std::string& review_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end()) {
        return false;
    }
    it->second.review_id = review_id;
    return true;
}

bool MemoryProposalStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_proposals.find(id);
    if (it == m_proposals.end() || it->second.state != ProposalState::PENDING) {
        return false;
    }
    m_proposals.erase(it);
    return true;
}

// ------------------------------------------------------------ FileProposalStore

FileProposalStore::FileProposalStore(const std::string& store_dir)
: m_dir(store_dir) {
    if (!m_sys.directoryExists(m_dir) && !m_sys.createDirectory(m_dir)) {
        throw std::runtime_error("Cannot create proposal store directory: " + m_dir);
    }
}

bool FileProposalStore::isValidId(const std::string& id) {
    if (id.empty() || id.find("..") != std::string::npos) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string FileProposalStore::recordPath(const std::string& id) const {
    return m_dir + "/" + id + ".json";
}

std::string FileProposalStore::lockPath(const std::string& id) const {
    return m_dir + "/" + id + ".lock";
}

std::optional<Proposal> FileProposalStore::load(const std::string& id) const {
    if (!isValidId(id)) {
        return std::nullopt;
    }

    std::string path = recordPath(id);
    if (!m_sys.fileExists(path)) {
        return std::nullopt;
    }

    try {
        nlohmann::json record = nlohmann::json::parse(m_sys.readFile(path));
        return record.get<Proposal>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt proposal record " + path + ": " + e.what());
    }
}

void FileProposalStore::save(const Proposal& proposal) {
    nlohmann::json record = proposal;
    if (!m_sys.writeFileAtomic(recordPath(proposal.id), record.dump(2) + "\n")) {
        throw std::runtime_error("Cannot write proposal record " + recordPath(proposal.id));
    }
}

std::optional<bool> FileProposalStore::modify(const std::string& id,
                                              const std::function<bool(Proposal&, bool&)>& mutation) {
    if (!isValidId(id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> guard(m_mutex);
    LockFile lock(lockPath(id));
    if (!lock.acquire()) {
        throw std::runtime_error("Timed out locking proposal " + id);
    }

    auto proposal = load(id);
    if (!proposal) {
        return std::nullopt;
    }

    bool changed = true;
    bool result = mutation(*proposal, changed);
    if (changed) {
        save(*proposal);
    }
    return result;
}

std::string FileProposalStore::create(Proposal proposal) {
    std::lock_guard<std::mutex> guard(m_mutex);
    LockFile store_lock(m_dir + "/.store.lock");
    if (!store_lock.acquire()) {
        throw std::runtime_error("Timed out locking proposal store " + m_dir);
    }

    std::string sequence_path = m_dir + "/.sequence";
    uint64_t last = 0;
    if (m_sys.fileExists(sequence_path)) {
        try {
            last = std::stoull(m_sys.readFile(sequence_path));
        } catch (const std::logic_error& e) {
            throw std::runtime_error("Corrupt sequence file " + sequence_path + ": " + e.what());
        }
    }

    prepareNew(proposal, last + 1);
    if (!m_sys.writeFileAtomic(sequence_path, std::to_string(last + 1) + "\n")) {
        throw std::runtime_error("Cannot write sequence file " + sequence_path);
    }
    save(proposal);

    LOG_INFO("ProposalStore", "Created proposal " + proposal.taggedId());
    return proposal.id;
}

std::optional<Proposal> FileProposalStore::get(const std::string& id) const {
    return load(id);
}

std::vector<Proposal> FileProposalStore::list(std::optional<ProposalState> state) const {
    std::vector<Proposal> result;

    for (const auto& entry : std::filesystem::directory_iterator(m_dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        auto proposal = load(entry.path().stem().string());
        if (proposal && (!state || proposal->state == *state)) {
            result.push_back(std::move(*proposal));
        }
    }

    sortBySequence(result);
    return result;
}

bool FileProposalStore::transition(const std::string& id, ProposalState from, ProposalState to,
                                   const std::string& detail) {
    auto result = modify(id, [&](Proposal& proposal, bool&) {
        return applyTransition(proposal, from, to, detail);
    });
    return result.value_or(false);
}

std::optional<int> FileProposalStore::recordAttempt(const std::string& id, const AuditEntry& entry) {
    int attempts = 0;
    auto result = modify(id, [&](Proposal& proposal, bool&) {
        proposal.attempts++;
        proposal.audit.push_back(entry);
        attempts = proposal.attempts;
        return true;
    });
    if (!result) {
        return std::nullopt;
    }
    return attempts;
}

bool FileProposalStore::appendAudit(const std::string& id, const AuditEntry& entry) {
    auto result = modify(id, [&](Proposal& proposal, bool&) {
        proposal.audit.push_back(entry);
        return true;
    });
    return result.value_or(false);
}

bool FileProposalStore::attachReview(const std::string& id, const std::string& review_id) {
    auto result = modify(id, [&](Proposal& proposal, bool&) {
        proposal.review_id = review_id;
        return true;
    });
    return result.value_or(false);
}

bool FileProposalStore::remove(const std::string& id) {
    auto result = modify(id, [&](Proposal& proposal, bool& changed) {
        changed = false;
        if (proposal.state != ProposalState::PENDING) {
            return false;
        }
        if (!m_sys.removeFile(recordPath(proposal.id))) {
            throw std::runtime_error("Cannot delete proposal record " + recordPath(proposal.id));
        }
        LOG_INFO("ProposalStore", "Cancelled proposal " + proposal.id);
        return true;
    });
    return result.value_or(false);
}

} // namespace Warden
