// =================================================================
// src/Warden/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Warden/CliParser.hpp"

namespace Warden {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Warden: governed commit pipeline for agent-proposed changes.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Configuration file (default: .warden/config.yml)");
    m_app->add_option("-r,--repo", m_commands.repo_root, "Repository root, overrides the configuration");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Show debug logging on stderr");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                for (auto* nested : subcommand->get_subcommands()) {
                    if (nested->parsed()) {
                        m_commands.review_subcommand = nested->get_name();
                    }
                }
                break;
            }
        }
    });

    // Define all commands
    setupInitCommand(*m_app);
    setupClassifyCommand(*m_app);
    setupMakeDiffCommand(*m_app);
    setupProposeCommand(*m_app);
    setupListCommand(*m_app);
    setupShowCommand(*m_app);
    setupApproveCommand(*m_app);
    setupRejectCommand(*m_app);
    setupCancelCommand(*m_app);
    setupApplyCommitsCommand(*m_app);
    setupReviewCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes the default configuration and rule table to .warden/.");
    sub->add_flag("--force", m_commands.force, "Overwrite existing files");
}

void CliParser::setupClassifyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("classify", "Prints the risk tier of a path as JSON; exit code is the tier rank.");
    sub->add_option("path", m_commands.path, "The path to classify, relative to the repository root unless absolute.")->required();
}

void CliParser::setupMakeDiffCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("make-diff", "Prints a unified diff between a file and its proposed content.");
    sub->add_option("-f,--file", m_commands.file_path, "Target file, relative to the repository root.")->required();
    auto* new_file = sub->add_option("-n,--new-file", m_commands.new_file_path, "File holding the proposed content.")
        ->check(CLI::ExistingFile);
    auto* stdin_flag = sub->add_flag("--stdin", m_commands.use_stdin, "Read the proposed content from stdin.");
    new_file->excludes(stdin_flag);
}

void CliParser::setupProposeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("propose", "Submits a change as a governed proposal.");
    auto* document = sub->add_option("-d,--document", m_commands.document_path,
                                     "Proposal document with ```diff blocks.")->check(CLI::ExistingFile);
    auto* file = sub->add_option("-f,--file", m_commands.file_path, "Target file, relative to the repository root.");
    auto* new_file = sub->add_option("-n,--new-file", m_commands.new_file_path, "File holding the proposed content.")
        ->check(CLI::ExistingFile);
    auto* stdin_flag = sub->add_flag("--stdin", m_commands.use_stdin, "Read the proposed content from stdin.");
    document->excludes(file);
    new_file->excludes(stdin_flag);
    new_file->needs(file);
    stdin_flag->needs(file);

    sub->add_option("--proposer", m_commands.proposer, "Proposer name.");
    sub->add_option("--summary", m_commands.summary, "One-line summary.");
    sub->add_option("--type", m_commands.change_type, "Change type (fix, feature, ...).");
}

void CliParser::setupListCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("list", "Lists proposals, oldest first.");
    sub->add_option("-s,--state", m_commands.state_filter, "Only list proposals in this state (pending, commit, applied, failed, reject).");
    sub->add_flag("--json", m_commands.json_output, "Print JSON records.");
}

void CliParser::setupShowCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("show", "Shows a proposal and its audit trail.");
    sub->add_option("id", m_commands.proposal_id, "Proposal id (state tag optional).")->required();
}

void CliParser::setupApproveCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("approve", "Promotes a Pending proposal to Committed.");
    sub->add_option("id", m_commands.proposal_id, "Proposal id (state tag optional).")->required();
}

void CliParser::setupRejectCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("reject", "Rejects a Pending proposal.");
    sub->add_option("id", m_commands.proposal_id, "Proposal id (state tag optional).")->required();
    sub->add_option("--reason", m_commands.reason, "Reason recorded in the audit trail.")->required();
}

void CliParser::setupCancelCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("cancel", "Deletes a Pending proposal.");
    sub->add_option("id", m_commands.proposal_id, "Proposal id (state tag optional).")->required();
}

void CliParser::setupApplyCommitsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("apply-commits", "Applies Committed proposals; exit code 0 only if all succeed.");
    sub->add_option("id", m_commands.proposal_id, "Apply only this proposal.");
    sub->add_flag("--dry-run", m_commands.dry_run, "Validate without applying.");
}

void CliParser::setupReviewCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("review", "Answers and inspects quorum reviews.");
    sub->require_subcommand(1);

    auto* answer = sub->add_subcommand("answer", "Records a reviewer's decision.");
    answer->add_option("review-id", m_commands.review_id, "Review id.")->required();
    answer->add_option("--reviewer", m_commands.reviewer, "Reviewer identity.")->required();
    auto* approve = answer->add_flag("--approve", m_commands.approve, "Approve the action.");
    auto* reject = answer->add_flag("--reject", m_commands.reject, "Reject the action.");
    approve->excludes(reject);

    auto* status = sub->add_subcommand("status", "Shows the state of a review.");
    status->add_option("review-id", m_commands.review_id, "Review id.")->required();
}

} // namespace Warden
