// =================================================================
// include/Warden/VcsBackend.hpp
// =================================================================
// Capability interface to the version-control system, plus the git
// implementation.

#pragma once

#include "Warden/SysInteraction.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Warden {

/**
 * @brief Outcome of one version-control operation
 */
struct VcsResult {
    bool success = false;
    bool timed_out = false;
    std::string output;       ///< Tool output, used as the diagnostic on failure
    std::string commit_id;    ///< Set by commit() on success
};

/**
 * @brief Operations the patch applier needs from a repository
 *
 * Implementations must not mutate the working tree in validatePatch().
 */
class VcsBackend {
public:
    virtual ~VcsBackend() = default;

    /**
     * @brief Dry-run check that a patch applies cleanly
     */
    virtual VcsResult validatePatch(const std::string& repo_root, const std::string& patch) = 0;

    /**
     * @brief Apply a patch to the working tree
     */
    virtual VcsResult applyPatch(const std::string& repo_root, const std::string& patch) = 0;

    /**
     * @brief Stage the given paths and create one commit of exactly those paths
     *
     * Other changes already staged in the index are left staged and uncommitted.
     * @param repo_root Repository root
     * @param paths Paths relative to the root
     * @param message Full commit message
     */
    virtual VcsResult commit(const std::string& repo_root, const std::vector<std::string>& paths,
                             const std::string& message) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Git backend driven through the git command line
 *
 * validate: git apply --check, apply: git apply, commit: git add -A -- paths,
 * git commit --only -- paths, git rev-parse HEAD. Paths are literal
 * pathspecs. Every command runs under the timeout.
 */
class GitBackend : public VcsBackend {
public:
    explicit GitBackend(std::chrono::seconds timeout = std::chrono::seconds(60),
                        const std::string& git_executable = "git");

    VcsResult validatePatch(const std::string& repo_root, const std::string& patch) override;
    VcsResult applyPatch(const std::string& repo_root, const std::string& patch) override;
    VcsResult commit(const std::string& repo_root, const std::vector<std::string>& paths,
                     const std::string& message) override;
    std::string getName() const override { return "git"; }

private:
    VcsResult runGit(const std::string& repo_root, const std::vector<std::string>& args);

    /**
     * @brief Write the patch to a temporary file and run git apply with extra flags
     */
    VcsResult runApply(const std::string& repo_root, const std::string& patch,
                       const std::vector<std::string>& extra_args);

    std::chrono::seconds m_timeout;
    std::string m_git;
    SysInteraction m_sys;
};

} // namespace Warden
