// =================================================================
// include/Warden/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Warden {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command;     // Name of the subcommand triggered
    std::string review_subcommand;  // answer, status

    // Global options
    std::string config_path = ".warden/config.yml";
    std::string repo_root;          // Overrides repo_root from the config
    bool verbose = false;

    // Options for 'init'
    bool force = false;

    // Options for 'classify'
    std::string path;

    // Options for 'make-diff' and 'propose'
    std::string file_path;
    std::string new_file_path;
    bool use_stdin = false;
    std::string document_path;
    std::string proposer;
    std::string summary;
    std::string change_type;

    // Options for 'apply-commits', 'show', 'approve', 'reject', 'cancel'
    std::string proposal_id;
    bool dry_run = false;
    std::string reason;

    // Options for 'list'
    std::string state_filter;
    bool json_output = false;

    // Options for 'review'
    std::string review_id;
    std::string reviewer;
    bool approve = false;
    bool reject = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInitCommand(CLI::App& app);
    void setupClassifyCommand(CLI::App& app);
    void setupMakeDiffCommand(CLI::App& app);
    void setupProposeCommand(CLI::App& app);
    void setupListCommand(CLI::App& app);
    void setupShowCommand(CLI::App& app);
    void setupApproveCommand(CLI::App& app);
    void setupRejectCommand(CLI::App& app);
    void setupCancelCommand(CLI::App& app);
    void setupApplyCommitsCommand(CLI::App& app);
    void setupReviewCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Warden
