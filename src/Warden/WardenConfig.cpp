// =================================================================
// src/Warden/WardenConfig.cpp
// =================================================================
// Implementation for pipeline configuration management.

#include "Warden/WardenConfig.hpp"
#include "Warden/ConfigParser.hpp"
#include "Warden/CliParser.hpp"
#include "Warden/Logger.hpp"
#include "Warden/ReviewGraph.hpp"
#include <stdexcept>

namespace Warden {

namespace {

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void loadString(const ConfigParser& config, const std::string& key, std::string& target) {
    std::string value = config.getStringValue(key);
    if (!value.empty()) {
        target = value;
    }
}

void loadInt(const ConfigParser& config, const std::string& key, int& target) {
    std::string value = config.getStringValue(key);
    if (value.empty()) {
        return;
    }
    try {
        target = std::stoi(value);
    } catch (const std::logic_error&) {
        LOG_WARNING("Config", "Invalid " + key + " value '" + value + "', using default");
    }
}

void loadBool(const ConfigParser& config, const std::string& key, bool& target) {
    std::string value = config.getStringValue(key);
    if (!value.empty()) {
        target = parseBool(value);
    }
}

} // namespace

WardenConfig::WardenConfig()
: quorum(getDefaultQuorumTable()) {
}

void WardenConfig::loadFromConfig(const ConfigParser& config) {
    loadString(config, "repo_root", repo_root);
    loadString(config, "store_dir", store_dir);
    loadString(config, "review_file", review_file);
    loadString(config, "rules_file", rules_file);

    loadString(config, "logging.dir", log_dir);
    loadString(config, "logging.level", log_level);
    loadBool(config, "logging.file", log_to_file);

    loadInt(config, "apply.max_attempts", max_attempts);
    loadInt(config, "apply.command_timeout_seconds", command_timeout_seconds);
    loadString(config, "apply.co_author", co_author);
    loadString(config, "apply.lock_dir", lock_dir);

    loadBool(config, "governance.auto_promote", auto_promote);
    loadString(config, "governance.node_name", node_name);
    if (config.hasKey("governance.reviewers")) {
        reviewers = config.getListValue("governance.reviewers");
    }

    auto quorum_section = config.getSection("governance.quorum");
    if (!quorum_section.empty()) {
        quorum.clear();
        for (const auto& [size, required] : quorum_section) {
            try {
                quorum[std::stoul(size)] = std::stoul(required);
            } catch (const std::logic_error&) {
                LOG_WARNING("Config", "Ignoring invalid quorum entry " + size + ": " + required);
            }
        }
    }
}

void WardenConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.repo_root.empty()) {
        repo_root = commands.repo_root;
    }
    if (commands.verbose) {
        log_level = "debug";
    }
}

bool WardenConfig::validate() const {
    bool valid = true;

    if (repo_root.empty()) {
        LOG_ERROR("Config", "repo_root cannot be empty");
        valid = false;
    }

    if (store_dir.empty()) {
        LOG_ERROR("Config", "store_dir cannot be empty");
        valid = false;
    }

    if (max_attempts < 1) {
        LOG_ERROR("Config", "apply.max_attempts must be at least 1");
        valid = false;
    }

    if (command_timeout_seconds < 1) {
        LOG_ERROR("Config", "apply.command_timeout_seconds must be at least 1");
        valid = false;
    }

    for (const auto& [size, required] : quorum) {
        if (size == 0 || required == 0 || required > size) {
            LOG_ERROR("Config", "governance.quorum entry " + std::to_string(size) + ": " +
                      std::to_string(required) + " is not satisfiable");
            valid = false;
        }
    }

    if (!reviewers.empty() && quorum.count(reviewers.size()) == 0) {
        Logger::getInstance().warning("Config", "No quorum defined for the configured reviewer group",
                                      "Size: " + std::to_string(reviewers.size()));
    }

    return valid;
}

std::string WardenConfig::getDefaultConfigText() {
    return R"(# Warden Configuration v1.0
# Repository the proposals apply to
repo_root: .

# Proposal records, review state and rule table
store_dir: .warden/proposals
review_file: .warden/reviews.json
rules_file: .warden/rules.yml

logging:
  dir: .warden/logs
  level: warning        # Console level: debug, info, warning, error, critical
  file: true

# Patch application
apply:
  max_attempts: 3                 # Failed attempts before a proposal moves to Failed
  command_timeout_seconds: 60     # Deadline for every git invocation
  co_author: 'Warden Governance <warden@localhost>'
  lock_dir: .warden/locks

# Review of GOVERN-tier proposals
governance:
  auto_promote: true              # Commit INFORM and ALLOW proposals without approval
  node_name: local
  reviewers:
    - operator
  quorum:                         # Reviewer group size: required approvals
    1: 1
    3: 2
)";
}

} // namespace Warden
