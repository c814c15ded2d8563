// =================================================================
// src/Warden/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Warden/Core.hpp"
#include "Warden/ConfigParser.hpp"
#include "Warden/SysInteraction.hpp"
#include "Warden/RiskClassifier.hpp"
#include "Warden/RuleTable.hpp"
#include "Warden/DiffGenerator.hpp"
#include "Warden/ProposalStore.hpp"
#include "Warden/ProposalDocument.hpp"
#include "Warden/ReviewGraph.hpp"
#include "Warden/GovernanceGate.hpp"
#include "Warden/PatchApplier.hpp"
#include "Warden/VcsBackend.hpp"
#include "Warden/Logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <chrono>

namespace Warden {

namespace {

std::string absoluteRoot(const std::string& path) {
    std::string root = std::filesystem::absolute(path).lexically_normal().string();
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    return root;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_config(std::make_unique<ConfigParser>(commands.config_path)),
      m_sys(std::make_unique<SysInteraction>())
{
    m_settings.loadFromConfig(*m_config);
    m_settings.applyCommandOverrides(m_commands);

    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(Logger::parseLevel(m_settings.log_level));
    logger.setFileLogging(m_settings.log_to_file && m_commands.active_command != "init");
    logger.initialize(m_settings.log_dir);
}

Core::~Core() = default;

int Core::run() {
    auto start = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command,
                                          m_commands.proposal_id.empty() ? m_commands.path : m_commands.proposal_id);

    int exit_code = 1;
    if (m_commands.active_command == "init") {
        exit_code = handleInit();
    } else if (m_commands.active_command == "classify") {
        exit_code = handleClassify();
    } else if (m_commands.active_command == "make-diff") {
        exit_code = handleMakeDiff();
    } else {
        if (!m_settings.validate()) {
            std::cerr << "Error: invalid configuration in " << m_commands.config_path << std::endl;
            return 1;
        }
        buildPipeline();

        if (m_commands.active_command == "propose") {
            exit_code = handlePropose();
        } else if (m_commands.active_command == "list") {
            exit_code = handleList();
        } else if (m_commands.active_command == "show") {
            exit_code = handleShow();
        } else if (m_commands.active_command == "approve") {
            exit_code = handleApprove();
        } else if (m_commands.active_command == "reject") {
            exit_code = handleReject();
        } else if (m_commands.active_command == "cancel") {
            exit_code = handleCancel();
        } else if (m_commands.active_command == "apply-commits") {
            exit_code = handleApplyCommits();
        } else if (m_commands.active_command == "review") {
            exit_code = handleReview();
        } else {
            std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, static_cast<long>(elapsed));
    return exit_code;
}

std::shared_ptr<RiskClassifier> Core::loadClassifier() {
    if (!m_settings.rules_file.empty() && m_sys->fileExists(m_settings.rules_file)) {
        return std::make_shared<RiskClassifier>(RuleTable::loadFromFile(m_settings.rules_file));
    }
    LOG_DEBUG("Core", "No rules file at " + m_settings.rules_file + ", using built-in rule table");
    return std::make_shared<RiskClassifier>();
}

void Core::buildPipeline() {
    m_classifier = loadClassifier();
    m_store = std::make_shared<FileProposalStore>(m_settings.store_dir);

    std::string review_dir = std::filesystem::path(m_settings.review_file).parent_path().string();
    if (!review_dir.empty() && !m_sys->directoryExists(review_dir) && !m_sys->createDirectory(review_dir)) {
        throw std::runtime_error("Cannot create directory for " + m_settings.review_file);
    }
    m_reviews = std::make_shared<ReviewGraph>(makeQuorumTable(m_settings.quorum), m_settings.review_file);

    GovernanceOptions gate_options;
    gate_options.auto_promote = m_settings.auto_promote;
    gate_options.reviewers = m_settings.reviewers;
    gate_options.node_name = m_settings.node_name;
    m_gate = std::make_unique<GovernanceGate>(m_classifier, m_store, m_reviews, gate_options);

    PatchApplierOptions apply_options;
    apply_options.max_attempts = m_settings.max_attempts;
    apply_options.co_author = m_settings.co_author;
    apply_options.lock_dir = m_settings.lock_dir;
    if (!apply_options.lock_dir.empty() && !m_sys->directoryExists(apply_options.lock_dir) &&
        !m_sys->createDirectory(apply_options.lock_dir)) {
        throw std::runtime_error("Cannot create lock directory " + apply_options.lock_dir);
    }
    auto backend = std::make_shared<GitBackend>(std::chrono::seconds(m_settings.command_timeout_seconds));
    m_applier = std::make_unique<PatchApplier>(m_store, backend, apply_options);
}

std::string Core::readProposedContent() {
    if (!m_commands.new_file_path.empty()) {
        return m_sys->readFile(m_commands.new_file_path);
    }
    if (m_commands.use_stdin) {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    throw std::runtime_error("either --new-file or --stdin is required");
}

int Core::handleInit() {
    std::cout << "Initializing Warden configuration..." << std::endl;

    std::string config_file = m_commands.config_path;
    std::string config_dir = std::filesystem::path(config_file).parent_path().string();
    if (config_dir.empty()) {
        config_dir = ".";
    }

    if (!m_sys->directoryExists(config_dir)) {
        if (!m_sys->createDirectory(config_dir)) {
            std::cerr << "Error: Failed to create configuration directory '" << config_dir << "'." << std::endl;
            return 1;
        }
        std::cout << "Created configuration directory: " << config_dir << std::endl;
    }

    struct InitFile {
        std::string path;
        std::string content;
    };
    const InitFile files[] = {
        {config_file, WardenConfig::getDefaultConfigText()},
        {m_settings.rules_file, RuleTable::getDefaultRuleTable().toYaml()}
    };

    for (const auto& file : files) {
        if (m_sys->fileExists(file.path) && !m_commands.force) {
            std::cout << "File '" << file.path << "' already exists. Skipping." << std::endl;
            continue;
        }
        std::string parent = std::filesystem::path(file.path).parent_path().string();
        if (!parent.empty() && !m_sys->directoryExists(parent) && !m_sys->createDirectory(parent)) {
            std::cerr << "Error: Failed to create directory '" << parent << "'." << std::endl;
            return 1;
        }
        if (!m_sys->writeFile(file.path, file.content)) {
            std::cerr << "Error: Failed to write '" << file.path << "'." << std::endl;
            return 1;
        }
        std::cout << "Created " << file.path << std::endl;
    }
    return 0;
}

int Core::handleClassify() {
    auto classifier = loadClassifier();
    // Relative paths are taken from the repository root, like proposal targets
    std::filesystem::path target = std::filesystem::path(absoluteRoot(m_settings.repo_root)) / m_commands.path;
    Classification classification = classifier->classify(target.generic_string());
    Logger::getInstance().logClassification(classification);

    std::cout << classification.toJson().dump(2) << std::endl;
    return getTierRank(classification.tier);
}

int Core::handleMakeDiff() {
    std::string root = absoluteRoot(m_settings.repo_root);
    std::string target = (std::filesystem::path(root) / m_commands.file_path).string();

    std::optional<std::string> original;
    if (m_sys->fileExists(target)) {
        original = m_sys->readFile(target);
    }

    std::string diff = DiffGenerator::makeDiff(original, readProposedContent(), m_commands.file_path);
    if (diff.empty()) {
        std::cerr << "No change - do not propose." << std::endl;
        return 0;
    }

    std::cout << diff;
    return 0;
}

int Core::handlePropose() {
    ProposalDraft draft;
    draft.repo_root = absoluteRoot(m_settings.repo_root);

    if (!m_commands.document_path.empty()) {
        DocumentParseResult document = ProposalDocument::parse(m_sys->readFile(m_commands.document_path));
        if (!document.success) {
            std::cerr << "Error: " << m_commands.document_path << ": " << document.error << std::endl;
            return 1;
        }
        draft.metadata = document.metadata;
        draft.diffs = document.diffs;
    } else if (!m_commands.file_path.empty()) {
        FileChange change;
        change.path = m_commands.file_path;
        std::string target = (std::filesystem::path(draft.repo_root) / change.path).string();
        if (m_sys->fileExists(target)) {
            change.original = m_sys->readFile(target);
        }
        change.modified = readProposedContent();
        draft.changes.push_back(change);
    } else {
        std::cerr << "Error: propose needs --document or --file." << std::endl;
        return 1;
    }

    if (!m_commands.proposer.empty()) draft.metadata.proposer = m_commands.proposer;
    if (!m_commands.summary.empty()) draft.metadata.summary = m_commands.summary;
    if (!m_commands.change_type.empty()) draft.metadata.change_type = m_commands.change_type;

    SubmitResult result = m_gate->submit(draft);

    switch (result.status) {
        case SubmitStatus::CREATED: {
            auto proposal = m_store->get(result.proposal_id);
            std::cout << (proposal ? proposal->taggedId() : result.proposal_id) << std::endl;
            std::cerr << "Tier " << getTierLabel(result.tier) << ": " << result.message << std::endl;
            return 0;
        }
        case SubmitStatus::NOT_REQUIRED:
        case SubmitStatus::DIFF_EMPTY:
            std::cerr << result.message << std::endl;
            return 0;
        default:
            std::cerr << "Error: " << result.message << std::endl;
            return 1;
    }
}

int Core::handleList() {
    std::optional<ProposalState> filter;
    if (!m_commands.state_filter.empty()) {
        filter = parseProposalState(m_commands.state_filter);
        if (!filter) {
            std::cerr << "Error: unknown state '" << m_commands.state_filter << "'." << std::endl;
            return 1;
        }
    }

    auto proposals = m_store->list(filter);

    if (m_commands.json_output) {
        nlohmann::json records = nlohmann::json::array();
        for (const auto& proposal : proposals) {
            records.push_back(proposal);
        }
        std::cout << records.dump(2) << std::endl;
        return 0;
    }

    for (const auto& proposal : proposals) {
        std::cout << proposal.taggedId() << "\t" << getTierLabel(proposal.tier) << "\t"
                  << proposal.metadata.summary << std::endl;
    }
    return 0;
}

int Core::handleShow() {
    auto proposal = m_store->get(stripStateTag(m_commands.proposal_id));
    if (!proposal) {
        std::cerr << "Error: ProposalNotFound: " << m_commands.proposal_id << std::endl;
        return 1;
    }

    std::cout << ProposalDocument::render(*proposal);
    std::cout << "\n## Audit trail\n\n";
    for (const auto& entry : proposal->audit) {
        std::cout << "- " << entry.timestamp << " " << entry.action << " "
                  << (entry.from_state.empty() ? "-" : entry.from_state) << " -> " << entry.to_state
                  << (entry.success ? " ok" : " refused");
        if (!entry.detail.empty()) {
            std::cout << " (" << entry.detail << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\nAttempts: " << proposal->attempts << std::endl;
    return 0;
}

int Core::handleApprove() {
    GateResult result = m_gate->approve(stripStateTag(m_commands.proposal_id));
    if (!result.success()) {
        std::cerr << "Error: " << getGateStatusName(result.status) << ": " << result.message << std::endl;
        return 1;
    }
    std::cout << stripStateTag(m_commands.proposal_id) << "." << getProposalStateTag(result.state) << std::endl;
    return 0;
}

int Core::handleReject() {
    GateResult result = m_gate->reject(stripStateTag(m_commands.proposal_id), m_commands.reason);
    if (!result.success()) {
        std::cerr << "Error: " << getGateStatusName(result.status) << ": " << result.message << std::endl;
        return 1;
    }
    std::cout << stripStateTag(m_commands.proposal_id) << "." << getProposalStateTag(result.state) << std::endl;
    return 0;
}

int Core::handleCancel() {
    GateResult result = m_gate->cancel(stripStateTag(m_commands.proposal_id));
    if (!result.success()) {
        std::cerr << "Error: " << getGateStatusName(result.status) << ": " << result.message << std::endl;
        return 1;
    }
    std::cout << "Cancelled " << stripStateTag(m_commands.proposal_id) << std::endl;
    return 0;
}

void Core::printPatchResult(const PatchResult& result) {
    if (result.success()) {
        if (result.dry_run) {
            std::cout << "[OK] " << result.proposal_id << " validates cleanly" << std::endl;
        } else {
            std::cout << "[OK] " << result.proposal_id << " -> " << result.commit_id << std::endl;
        }
        return;
    }

    std::cout << "[FAIL] " << result.proposal_id << ": " << getPatchStatusName(result.status);
    if (result.stage != PatchStage::NONE) {
        std::cout << " at " << getPatchStageName(result.stage);
    }
    std::cout << " (now " << getProposalStateName(result.final_state) << ")" << std::endl;
    if (!result.diagnostic.empty()) {
        std::cout << "       " << result.diagnostic << std::endl;
    }
}

int Core::handleApplyCommits() {
    if (!m_commands.proposal_id.empty()) {
        std::string id = stripStateTag(m_commands.proposal_id);
        PatchResult result = m_commands.dry_run ? m_applier->validate(id) : m_applier->apply(id);
        printPatchResult(result);
        return result.success() ? 0 : 1;
    }

    BatchResult batch = m_commands.dry_run ? m_applier->validateAll() : m_applier->applyAll();
    if (batch.results.empty()) {
        std::cout << "No committed proposals to apply." << std::endl;
        return 0;
    }

    for (const auto& result : batch.results) {
        printPatchResult(result);
    }
    std::cout << "\n" << (m_commands.dry_run ? "Valid: " : "Applied: ") << batch.applied
              << ", Failed: " << batch.failed << std::endl;
    return batch.failed == 0 ? 0 : 1;
}

int Core::handleReview() {
    if (m_commands.review_subcommand == "answer") {
        if (!m_commands.approve && !m_commands.reject) {
            std::cerr << "Error: one of --approve or --reject is required." << std::endl;
            return 1;
        }
        ReviewDecision decision = m_commands.approve ? ReviewDecision::APPROVE : ReviewDecision::REJECT;
        ReviewAnswerResult answer = m_reviews->answerReview(m_commands.review_id, m_commands.reviewer, decision);
        if (!answer.success) {
            std::cerr << "Error: " << answer.error << std::endl;
            return 1;
        }

        size_t moved = m_gate->promoteReviewed();
        std::cout << m_commands.review_id << ": " << getReviewStatusName(answer.status) << std::endl;
        if (moved > 0) {
            std::cout << "Settled " << moved << " proposal(s)" << std::endl;
        }
        return 0;
    }

    auto record = m_reviews->getReview(m_commands.review_id);
    if (!record) {
        std::cerr << "Error: review not found: " << m_commands.review_id << std::endl;
        return 1;
    }

    nlohmann::json output = *record;
    auto required = m_reviews->getRequiredApprovals(record->reviewers.size());
    output["required_approvals"] = required ? nlohmann::json(*required) : nlohmann::json(nullptr);
    std::cout << output.dump(2) << std::endl;
    return 0;
}

} // namespace Warden
