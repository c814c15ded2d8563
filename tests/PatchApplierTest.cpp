// =================================================================
// tests/PatchApplierTest.cpp
// =================================================================
// Unit tests for PatchApplier against an in-memory VCS backend.

#include "Warden/PatchApplier.hpp"
#include "Warden/ProposalStore.hpp"
#include "Warden/DiffGenerator.hpp"
#include "Warden/Logger.hpp"
#include "FakeVcsBackend.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <memory>
#include <thread>
#include <atomic>
#include <vector>

class PatchApplierTest {
private:
    std::string test_dir;
    std::shared_ptr<Warden::MemoryProposalStore> store;
    std::shared_ptr<FakeVcsBackend> backend;

    void reset() {
        store = std::make_shared<Warden::MemoryProposalStore>();
        backend = std::make_shared<FakeVcsBackend>();
        backend->files["docs/a.md"] = "alpha\nbeta\n";
        backend->files["docs/b.md"] = "one\ntwo\n";
    }

    std::string createCommitted(const std::string& path, const std::optional<std::string>& original,
                                const std::string& modified, const std::string& summary = "Update docs") {
        Warden::Proposal proposal;
        proposal.repo_root = "/repo";
        proposal.tier = Warden::Tier::INFORM;
        proposal.metadata.proposer = "kart";
        proposal.metadata.summary = summary;
        proposal.metadata.change_type = "docs";
        proposal.diffs.push_back({path, Warden::DiffGenerator::makeDiff(original, modified, path)});

        std::string id = store->create(proposal);
        bool promoted = store->transition(id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED);
        assert(promoted);
        return id;
    }

    std::unique_ptr<Warden::PatchApplier> createApplier(int max_attempts = 3) {
        Warden::PatchApplierOptions options;
        options.max_attempts = max_attempts;
        return std::make_unique<Warden::PatchApplier>(store, backend, options);
    }

public:
    PatchApplierTest() : test_dir("test_patch_applier") {
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    ~PatchApplierTest() {
        std::filesystem::remove_all(test_dir);
    }

    void testSuccessfulApply() {
        std::cout << "Testing successful apply..." << std::endl;
        reset();

        std::string id = createCommitted("docs/a.md", std::string("alpha\nbeta\n"), "alpha\nBETA\n",
                                         "Capitalize beta");
        auto applier = createApplier();
        auto result = applier->apply(id);

        assert(result.success());
        assert(result.stage == Warden::PatchStage::NONE);
        assert(result.commit_id == "fake1");
        assert(result.final_state == Warden::ProposalState::APPLIED);
        assert(result.diagnostic.empty());

        assert(backend->files["docs/a.md"] == "alpha\nBETA\n");
        assert(backend->commits.size() == 1);
        assert(backend->commits[0].paths == std::vector<std::string>{"docs/a.md"});

        const std::string& message = backend->commits[0].message;
        assert(message.rfind("Capitalize beta\n\n", 0) == 0);
        assert(message.find("Proposed by: kart\n") != std::string::npos);
        assert(message.find("Proposal ID: " + id + "\n") != std::string::npos);
        assert(message.find("Change type: docs\n") != std::string::npos);
        assert(message.find("Tier: INFORM\n") != std::string::npos);
        assert(message.find("\nCo-Authored-By: Warden Governance <warden@localhost>\n") != std::string::npos);

        auto proposal = store->get(id);
        assert(proposal->state == Warden::ProposalState::APPLIED);
        assert(proposal->audit.back().action == "apply");
        assert(proposal->audit.back().detail == "commit fake1");

        std::cout << "✓ Successful apply test passed" << std::endl;
    }

    void testNewFileAndDefaultMessage() {
        std::cout << "Testing new file with default commit message..." << std::endl;
        reset();

        std::string id = createCommitted("docs/new.md", std::nullopt, "fresh\n", "");
        auto applier = createApplier();
        auto result = applier->apply(id);

        assert(result.success());
        assert(backend->files["docs/new.md"] == "fresh\n");
        assert(backend->commits[0].message.rfind("Apply proposal " + id + "\n\n", 0) == 0);

        std::cout << "✓ New file test passed" << std::endl;
    }

    void testNotFoundAndWrongState() {
        std::cout << "Testing missing and non-committed proposals..." << std::endl;
        reset();

        auto applier = createApplier();
        auto missing = applier->apply("nobody_2025-01-01_00-00-00_000099");
        assert(missing.status == Warden::PatchStatus::PROPOSAL_NOT_FOUND);

        Warden::Proposal pending;
        pending.repo_root = "/repo";
        pending.metadata.proposer = "kart";
        pending.diffs.push_back({"docs/a.md",
            Warden::DiffGenerator::makeDiff(std::string("alpha\nbeta\n"), "x\n", "docs/a.md")});
        std::string id = store->create(pending);
        auto before = store->get(id);

        auto refused = applier->apply(id);
        assert(refused.status == Warden::PatchStatus::INVALID_TRANSITION);
        assert(refused.final_state == Warden::ProposalState::PENDING);

        auto after = store->get(id);
        assert(after->state == Warden::ProposalState::PENDING);
        assert(after->attempts == 0);
        assert(after->audit.size() == before->audit.size() && "Refused apply must not touch the record");
        assert(backend->validate_calls == 0);
        assert(backend->files["docs/a.md"] == "alpha\nbeta\n");

        std::cout << "✓ Missing and non-committed proposals test passed" << std::endl;
    }

    void testRetryBudget() {
        std::cout << "Testing retry budget..." << std::endl;
        reset();

        // Diff made against content the working tree no longer has
        std::string id = createCommitted("docs/a.md", std::string("gamma\ndelta\n"), "gamma\nDELTA\n");
        auto applier = createApplier(3);

        auto first = applier->apply(id);
        assert(first.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(first.stage == Warden::PatchStage::VALIDATION);
        assert(first.final_state == Warden::ProposalState::COMMITTED);
        assert(first.diagnostic.find("does not apply") != std::string::npos);
        assert(store->get(id)->attempts == 1);

        auto second = applier->apply(id);
        assert(second.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(store->get(id)->attempts == 2);

        auto third = applier->apply(id);
        assert(third.status == Warden::PatchStatus::RETRY_BUDGET_EXHAUSTED);
        assert(third.final_state == Warden::ProposalState::FAILED);
        assert(third.diagnostic.find("retry budget exhausted after 3 attempt(s)") != std::string::npos);

        auto proposal = store->get(id);
        assert(proposal->state == Warden::ProposalState::FAILED);
        assert(proposal->attempts == 3);
        assert(proposal->audit.back().action == "fail");

        // Failed is terminal
        auto fourth = applier->apply(id);
        assert(fourth.status == Warden::PatchStatus::INVALID_TRANSITION);
        assert(store->get(id)->attempts == 3);

        assert(backend->apply_calls == 0 && "Validation failures never touch the tree");
        assert(backend->commits.empty());
        assert(backend->files["docs/a.md"] == "alpha\nbeta\n");

        std::cout << "✓ Retry budget test passed" << std::endl;
    }

    void testStageFailures() {
        std::cout << "Testing failures at each stage..." << std::endl;
        reset();
        auto applier = createApplier(5);

        std::string timeout_id = createCommitted("docs/a.md", std::string("alpha\nbeta\n"), "x\n");
        backend->time_out_validation = true;
        auto timed_out = applier->apply(timeout_id);
        assert(timed_out.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(timed_out.diagnostic == "validation timed out");
        backend->time_out_validation = false;

        backend->fail_apply = true;
        auto apply_failed = applier->apply(timeout_id);
        assert(apply_failed.status == Warden::PatchStatus::APPLY_FAILED);
        assert(apply_failed.stage == Warden::PatchStage::APPLY);
        assert(apply_failed.diagnostic == "error: injected apply failure");
        backend->fail_apply = false;

        backend->fail_commit = true;
        auto commit_failed = applier->apply(timeout_id);
        assert(commit_failed.status == Warden::PatchStatus::COMMIT_FAILED);
        assert(commit_failed.stage == Warden::PatchStage::COMMIT);
        assert(commit_failed.final_state == Warden::ProposalState::COMMITTED);
        backend->fail_commit = false;

        reset();
        applier = createApplier(5);
        std::string throwing_id = createCommitted("docs/b.md", std::string("one\ntwo\n"), "one\n");
        backend->throw_on_commit = true;
        auto thrown = applier->apply(throwing_id);
        assert(thrown.status == Warden::PatchStatus::COMMIT_FAILED);
        assert(thrown.diagnostic == "commit error: injected commit exception");
        assert(store->get(throwing_id)->attempts == 1);

        std::cout << "✓ Stage failures test passed" << std::endl;
    }

    void testUnsafeAndEmptyProposals() {
        std::cout << "Testing unsafe and empty proposals..." << std::endl;
        reset();
        auto applier = createApplier();

        Warden::Proposal escaping;
        escaping.repo_root = "/repo";
        escaping.metadata.proposer = "mallory";
        escaping.diffs.push_back({"../etc/passwd",
            "--- a/../etc/passwd\n+++ b/../etc/passwd\n@@ -1 +1 @@\n-root\n+toor\n"});
        std::string escaping_id = store->create(escaping);
        assert(store->transition(escaping_id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED));

        auto refused = applier->apply(escaping_id);
        assert(refused.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(refused.diagnostic.find("outside the repository") != std::string::npos);
        assert(backend->validate_calls == 0);

        Warden::Proposal empty;
        empty.repo_root = "/repo";
        empty.metadata.proposer = "kart";
        empty.diffs.push_back({"docs/a.md", ""});
        std::string empty_id = store->create(empty);
        assert(store->transition(empty_id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED));

        auto dry = applier->validate(empty_id);
        assert(dry.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(store->get(empty_id)->state == Warden::ProposalState::COMMITTED);

        auto failed = applier->apply(empty_id);
        assert(failed.status == Warden::PatchStatus::RETRY_BUDGET_EXHAUSTED);
        assert(failed.final_state == Warden::ProposalState::FAILED);
        assert(failed.diagnostic == "proposal has no diff content");
        assert(store->get(empty_id)->attempts == 1);

        std::cout << "✓ Unsafe and empty proposals test passed" << std::endl;
    }

    void testDryRun() {
        std::cout << "Testing dry run validation..." << std::endl;
        reset();
        auto applier = createApplier();

        std::string good = createCommitted("docs/a.md", std::string("alpha\nbeta\n"), "alpha\n");
        std::string bad = createCommitted("docs/b.md", std::string("uno\n"), "dos\n");

        auto good_result = applier->validate(good);
        assert(good_result.success());
        assert(good_result.dry_run);

        auto bad_result = applier->validate(bad);
        assert(bad_result.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(bad_result.dry_run);

        auto batch = applier->validateAll();
        assert(batch.applied == 1 && batch.failed == 1);

        assert(store->get(good)->state == Warden::ProposalState::COMMITTED);
        assert(store->get(bad)->attempts == 0 && "Dry runs never spend the retry budget");
        assert(backend->apply_calls == 0);
        assert(backend->commits.empty());

        auto missing = applier->validate("nobody");
        assert(missing.status == Warden::PatchStatus::PROPOSAL_NOT_FOUND);

        std::cout << "✓ Dry run validation test passed" << std::endl;
    }

    void testMultiFileProposalIsAllOrNothing() {
        std::cout << "Testing multi-file proposal with one stale diff..." << std::endl;
        reset();
        auto applier = createApplier();

        Warden::Proposal proposal;
        proposal.repo_root = "/repo";
        proposal.tier = Warden::Tier::INFORM;
        proposal.metadata.proposer = "kart";
        proposal.metadata.summary = "Touch both docs";
        proposal.diffs.push_back({"docs/a.md", Warden::DiffGenerator::makeDiff(
            std::string("alpha\nbeta\n"), "alpha\nbeta\ngamma\n", "docs/a.md")});
        proposal.diffs.push_back({"docs/b.md", Warden::DiffGenerator::makeDiff(
            std::string("uno\ndos\n"), "uno\ntres\n", "docs/b.md")});
        std::string id = store->create(proposal);
        bool promoted = store->transition(id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED);
        assert(promoted);

        auto result = applier->apply(id);
        assert(result.status == Warden::PatchStatus::VALIDATION_FAILED);
        assert(result.stage == Warden::PatchStage::VALIDATION);
        assert(result.diagnostic.find("docs/b.md") != std::string::npos);

        assert(backend->files["docs/a.md"] == "alpha\nbeta\n" && "Applicable first diff must not land");
        assert(backend->files["docs/b.md"] == "one\ntwo\n");
        assert(backend->apply_calls == 0);
        assert(backend->commits.empty());
        assert(store->get(id)->state == Warden::ProposalState::COMMITTED);
        assert(store->get(id)->attempts == 1);

        std::cout << "✓ Multi-file all-or-nothing test passed" << std::endl;
    }

    void testApplyAllIsIdempotent() {
        std::cout << "Testing batch apply..." << std::endl;
        reset();
        auto applier = createApplier();

        std::string first = createCommitted("docs/a.md", std::string("alpha\nbeta\n"), "alpha\nbeta\ngamma\n");
        std::string broken = createCommitted("docs/c.md", std::string("missing\n"), "still missing\n");
        std::string third = createCommitted("docs/b.md", std::string("one\ntwo\n"), "zero\none\ntwo\n");

        auto batch = applier->applyAll();
        assert(batch.applied == 2);
        assert(batch.failed == 1);
        assert(batch.results.size() == 3);
        assert(batch.results[0].proposal_id == first);
        assert(batch.results[1].proposal_id == broken);
        assert(batch.results[2].proposal_id == third);
        assert(backend->commits.size() == 2);

        // Applied proposals are left alone, the failing one is retried
        auto again = applier->applyAll();
        assert(again.results.size() == 1);
        assert(again.results[0].proposal_id == broken);
        assert(backend->commits.size() == 2);
        assert(store->get(broken)->attempts == 2);

        std::cout << "✓ Batch apply test passed" << std::endl;
    }

    void testConcurrentApply() {
        std::cout << "Testing concurrent apply of one proposal..." << std::endl;
        reset();

        std::string id = createCommitted("docs/a.md", std::string("alpha\nbeta\n"), "alpha\n");
        auto applier = std::make_shared<Warden::PatchApplier>(store, backend);

        std::atomic<int> successes{0};
        std::atomic<int> refusals{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 6; t++) {
            threads.emplace_back([&]() {
                auto result = applier->apply(id);
                if (result.success()) {
                    successes++;
                } else if (result.status == Warden::PatchStatus::INVALID_TRANSITION) {
                    refusals++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(successes == 1);
        assert(refusals == 5);
        assert(backend->commits.size() == 1);
        assert(store->get(id)->attempts == 0);

        std::cout << "✓ Concurrent apply test passed" << std::endl;
    }

    void testRepositoryLockDirectory() {
        std::cout << "Testing repository lock directory..." << std::endl;
        reset();

        Warden::PatchApplierOptions options;
        options.lock_dir = test_dir + "/locks";
        options.lock_timeout = std::chrono::milliseconds(200);
        std::filesystem::create_directories(options.lock_dir);

        Warden::PatchApplier applier(store, backend, options);
        std::string id = createCommitted("docs/b.md", std::string("one\ntwo\n"), "one\ntwo\nthree\n");
        assert(applier.apply(id).success());

        size_t leftover = 0;
        for (const auto& entry : std::filesystem::directory_iterator(options.lock_dir)) {
            (void)entry;
            leftover++;
        }
        assert(leftover == 0 && "Repository lock must be released after apply");

        bool threw = false;
        try {
            Warden::PatchApplier broken(store, nullptr);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Repository lock directory test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PatchApplier unit tests..." << std::endl;

        testSuccessfulApply();
        testNewFileAndDefaultMessage();
        testNotFoundAndWrongState();
        testRetryBudget();
        testStageFailures();
        testUnsafeAndEmptyProposals();
        testDryRun();
        testMultiFileProposalIsAllOrNothing();
        testApplyAllIsIdempotent();
        testConcurrentApply();
        testRepositoryLockDirectory();

        std::cout << "All PatchApplier tests passed!" << std::endl;
    }
};

int main() {
    try {
        Warden::Logger::getInstance().setFileLogging(false);

        PatchApplierTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PatchApplier component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
