// =================================================================
// tests/FakeVcsBackend.hpp
// =================================================================
// Deterministic in-memory VCS backend with failure injection.

#pragma once

#include "Warden/VcsBackend.hpp"
#include "Warden/UnifiedPatch.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class FakeVcsBackend : public Warden::VcsBackend {
public:
    struct Commit {
        std::string id;
        std::string message;
        std::vector<std::string> paths;
    };

    // Working tree, keyed by repository-relative path
    std::map<std::string, std::string> files;
    std::vector<Commit> commits;

    bool fail_validation = false;
    bool time_out_validation = false;
    bool fail_apply = false;
    bool fail_commit = false;
    bool throw_on_commit = false;

    int validate_calls = 0;
    int apply_calls = 0;
    int commit_calls = 0;

    Warden::VcsResult validatePatch(const std::string& repo_root, const std::string& patch) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        validate_calls++;
        Warden::VcsResult result;
        if (time_out_validation) {
            result.timed_out = true;
            result.output = "validation timed out";
            return result;
        }
        if (fail_validation) {
            result.output = "error: patch failed: injected validation failure";
            return result;
        }
        std::map<std::string, std::string> scratch = files;
        return simulate(patch, scratch);
    }

    Warden::VcsResult applyPatch(const std::string& repo_root, const std::string& patch) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        apply_calls++;
        Warden::VcsResult result;
        if (fail_apply) {
            result.output = "error: injected apply failure";
            return result;
        }
        std::map<std::string, std::string> scratch = files;
        result = simulate(patch, scratch);
        if (result.success) {
            files = scratch;
        }
        return result;
    }

    Warden::VcsResult commit(const std::string& repo_root, const std::vector<std::string>& paths,
                             const std::string& message) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        commit_calls++;
        if (throw_on_commit) {
            throw std::runtime_error("injected commit exception");
        }
        Warden::VcsResult result;
        if (fail_commit) {
            result.output = "error: injected commit failure";
            return result;
        }
        Commit commit;
        commit.id = "fake" + std::to_string(commits.size() + 1);
        commit.message = message;
        commit.paths = paths;
        commits.push_back(commit);

        result.success = true;
        result.commit_id = commit.id;
        return result;
    }

    std::string getName() const override { return "fake"; }

private:
    static Warden::VcsResult simulate(const std::string& patch, std::map<std::string, std::string>& tree) {
        Warden::VcsResult result;
        Warden::PatchParseResult parsed = Warden::UnifiedPatch::parse(patch);
        if (!parsed.success) {
            result.output = "error: corrupt patch: " + parsed.error;
            return result;
        }

        for (const auto& file : parsed.files) {
            std::optional<std::string> original;
            if (file.old_path) {
                auto it = tree.find(*file.old_path);
                if (it != tree.end()) {
                    original = it->second;
                }
            }

            Warden::FileApplyResult applied = Warden::UnifiedPatch::applyFilePatch(original, file);
            if (!applied.success) {
                result.output = "error: patch failed: " + applied.error;
                return result;
            }

            if (file.old_path) {
                tree.erase(*file.old_path);
            }
            if (applied.content) {
                tree[file.targetPath()] = *applied.content;
            }
        }

        result.success = true;
        return result;
    }

    std::mutex m_mutex;
};
