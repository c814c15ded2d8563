// =================================================================
// include/Warden/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Warden/CliParser.hpp"
#include "Warden/WardenConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Warden {
    class ConfigParser;
    class SysInteraction;
    class RiskClassifier;
    class ProposalStore;
    class ReviewGraph;
    class GovernanceGate;
    class PatchApplier;
    struct PatchResult;
}

namespace Warden {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleInit();
    int handleClassify();
    int handleMakeDiff();
    int handlePropose();
    int handleList();
    int handleShow();
    int handleApprove();
    int handleReject();
    int handleCancel();
    int handleApplyCommits();
    int handleReview();

    /**
     * @brief Build classifier, store, review graph, gate and applier
     */
    void buildPipeline();

    std::shared_ptr<RiskClassifier> loadClassifier();

    /**
     * @brief Read proposed content from --new-file or stdin
     */
    std::string readProposedContent();

    void printPatchResult(const PatchResult& result);

    const Commands& m_commands;
    WardenConfig m_settings;
    std::unique_ptr<ConfigParser> m_config;
    std::unique_ptr<SysInteraction> m_sys;

    std::shared_ptr<RiskClassifier> m_classifier;
    std::shared_ptr<ProposalStore> m_store;
    std::shared_ptr<ReviewGraph> m_reviews;
    std::unique_ptr<GovernanceGate> m_gate;
    std::unique_ptr<PatchApplier> m_applier;
};

} // namespace Warden
