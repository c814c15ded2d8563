// =================================================================
// include/Warden/WardenConfig.hpp
// =================================================================
// Typed configuration for the governance pipeline.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Configuration settings read from .warden/config.yml
 */
struct WardenConfig {
    // Locations
    std::string repo_root = ".";
    std::string store_dir = ".warden/proposals";
    std::string review_file = ".warden/reviews.json";
    std::string rules_file = ".warden/rules.yml";

    // Logging
    std::string log_dir = ".warden/logs";
    std::string log_level = "warning";     // Console level
    bool log_to_file = true;

    // Patch application
    int max_attempts = 3;
    int command_timeout_seconds = 60;
    std::string co_author = "Warden Governance <warden@localhost>";
    std::string lock_dir = ".warden/locks";

    // Governance
    bool auto_promote = true;
    std::string node_name = "local";
    std::vector<std::string> reviewers = {"operator"};
    std::map<size_t, size_t> quorum;       // Reviewer group size -> required approvals

    WardenConfig();

    /**
     * @brief Load configuration from ConfigParser
     * @param config ConfigParser instance
     */
    void loadFromConfig(const class ConfigParser& config);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const struct Commands& commands);

    /**
     * @brief Validate configuration settings
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Text written by `warden init`
     */
    static std::string getDefaultConfigText();
};

} // namespace Warden
