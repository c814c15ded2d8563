// =================================================================
// src/Warden/VcsBackend.cpp
// =================================================================
// Implementation for the git version-control backend.

#include "Warden/VcsBackend.hpp"
#include "Warden/Logger.hpp"
#include <atomic>
#include <filesystem>
#include <unistd.h>

namespace Warden {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

std::string temporaryPatchPath() {
    static std::atomic<unsigned> counter{0};
    std::filesystem::path dir = std::filesystem::temp_directory_path();
    std::string name = "warden_" + std::to_string(getpid()) + "_" + std::to_string(counter++) + ".patch";
    return (dir / name).string();
}

} // namespace

GitBackend::GitBackend(std::chrono::seconds timeout, const std::string& git_executable)
: m_timeout(timeout), m_git(git_executable) {
}

VcsResult GitBackend::runGit(const std::string& repo_root, const std::vector<std::string>& args) {
    // Proposal paths are file names, never glob or magic pathspecs
    std::vector<std::string> full_args = {"-C", repo_root, "--literal-pathspecs"};
    full_args.insert(full_args.end(), args.begin(), args.end());

    VcsResult result;
    CommandResult command = m_sys.runCommand(m_git, full_args, "", m_timeout);
    result.output = command.output;
    result.timed_out = command.timed_out;
    result.success = !command.timed_out && command.exit_code == 0;

    if (command.timed_out) {
        result.output = "git " + (args.empty() ? std::string() : args.front()) +
                        " timed out after " + std::to_string(m_timeout.count()) + "s";
    }
    if (!result.success) {
        Logger::getInstance().debug("GitBackend", "git command failed",
                                    "Args: " + (args.empty() ? std::string() : args.front()) +
                                    ", Exit: " + std::to_string(command.exit_code));
    }
    return result;
}

VcsResult GitBackend::runApply(const std::string& repo_root, const std::string& patch,
                               const std::vector<std::string>& extra_args) {
    std::string patch_file = temporaryPatchPath();
    if (!m_sys.writeFile(patch_file, patch)) {
        VcsResult result;
        result.output = "Cannot write temporary patch file " + patch_file;
        return result;
    }

    std::vector<std::string> args = {"apply"};
    args.insert(args.end(), extra_args.begin(), extra_args.end());
    args.push_back(patch_file);

    VcsResult result = runGit(repo_root, args);
    if (!m_sys.removeFile(patch_file)) {
        LOG_WARNING("GitBackend", "Could not remove temporary patch file " + patch_file);
    }
    return result;
}

VcsResult GitBackend::validatePatch(const std::string& repo_root, const std::string& patch) {
    return runApply(repo_root, patch, {"--check"});
}

VcsResult GitBackend::applyPatch(const std::string& repo_root, const std::string& patch) {
    return runApply(repo_root, patch, {});
}

VcsResult GitBackend::commit(const std::string& repo_root, const std::vector<std::string>& paths,
                             const std::string& message) {
    std::vector<std::string> add_args = {"add", "-A", "--"};
    add_args.insert(add_args.end(), paths.begin(), paths.end());

    VcsResult add = runGit(repo_root, add_args);
    if (!add.success) {
        add.output = "git add failed: " + add.output;
        return add;
    }

    // --only keeps anything else already in the index out of this commit
    std::vector<std::string> commit_args = {"commit", "--only", "-m", message, "--"};
    commit_args.insert(commit_args.end(), paths.begin(), paths.end());

    VcsResult commit = runGit(repo_root, commit_args);
    if (!commit.success) {
        commit.output = "git commit failed: " + commit.output;
        return commit;
    }

    VcsResult head = runGit(repo_root, {"rev-parse", "HEAD"});
    if (!head.success) {
        head.output = "git rev-parse failed: " + head.output;
        return head;
    }

    commit.commit_id = trim(head.output);
    return commit;
}

} // namespace Warden
