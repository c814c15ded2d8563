// =================================================================
// tests/ProposalStoreTest.cpp
// =================================================================
// Unit tests for the proposal stores and the lock-file protocol.

#include "Warden/ProposalStore.hpp"
#include "Warden/LockFile.hpp"
#include "Warden/DiffGenerator.hpp"
#include "Warden/Logger.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <thread>
#include <atomic>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

class ProposalStoreTest {
private:
    std::string test_dir;

    Warden::Proposal createProposal(const std::string& proposer, const std::string& summary) {
        Warden::Proposal proposal;
        proposal.repo_root = "/srv/repo";
        proposal.tier = Warden::Tier::INFORM;
        proposal.metadata.proposer = proposer;
        proposal.metadata.summary = summary;
        proposal.diffs.push_back({"docs/a.md",
            Warden::DiffGenerator::makeDiff(std::string("a\n"), "b\n", "docs/a.md")});
        return proposal;
    }

    void checkLifecycle(Warden::ProposalStore& store) {
        using S = Warden::ProposalState;

        std::string first = store.create(createProposal("kart", "first"));
        std::string second = store.create(createProposal("kart", "second"));
        assert(first != second);

        auto created = store.get(first);
        assert(created.has_value());
        assert(created->state == S::PENDING);
        assert(created->attempts == 0);
        assert(!created->metadata.created_at.empty());
        assert(created->audit.size() == 1);
        assert(created->audit[0].action == "create");
        assert(created->audit[0].detail == "1 file(s)");
        assert(store.get(second)->sequence > created->sequence);

        assert(!store.get("missing_proposal").has_value());

        // Compare-and-swap on the expected state
        assert(store.transition(first, S::PENDING, S::COMMITTED, "auto-promoted"));
        assert(!store.transition(first, S::PENDING, S::COMMITTED) && "Stale from-state must be refused");
        assert(!store.transition(first, S::COMMITTED, S::PENDING) && "Illegal edge must be refused");
        assert(!store.transition("missing_proposal", S::PENDING, S::COMMITTED));

        auto committed = store.get(first);
        assert(committed->state == S::COMMITTED);
        assert(committed->audit.size() == 4);
        assert(committed->audit[1].action == "promote" && committed->audit[1].success);
        assert(!committed->audit[2].success && committed->audit[2].detail == "state is Committed");
        assert(!committed->audit[3].success && committed->audit[3].detail == "illegal transition");

        auto listed = store.list();
        assert(listed.size() == 2);
        assert(listed[0].id == first && listed[1].id == second);

        auto pending = store.list(S::PENDING);
        assert(pending.size() == 1 && pending[0].id == second);
        assert(store.list(S::APPLIED).empty());

        // Attempts
        auto attempt = store.recordAttempt(first, Warden::AuditEntry::make("apply", "Committed", "Committed",
                                                                           false, "hunk 1 does not apply"));
        assert(attempt == 1);
        assert(store.recordAttempt(first, Warden::AuditEntry::make("apply", "Committed", "Committed", false)) == 2);
        assert(!store.recordAttempt("missing_proposal", Warden::AuditEntry::make("apply", "", "", false)));
        assert(store.get(first)->attempts == 2);

        assert(store.appendAudit(first, Warden::AuditEntry::make("note", "", "", true, "checked")));
        assert(store.attachReview(second, "review_000009"));
        assert(store.get(second)->review_id == "review_000009");

        // Only pending proposals can be withdrawn
        assert(!store.remove(first));
        assert(store.remove(second));
        assert(!store.get(second).has_value());
        assert(!store.remove(second));

        assert(store.transition(first, S::COMMITTED, S::APPLIED, "commit abc123"));
        assert(!store.transition(first, S::APPLIED, S::FAILED) && "Terminal states never move");
        assert(store.get(first)->state == S::APPLIED);
    }

    void checkConcurrentTransition(Warden::ProposalStore& store) {
        std::string id = store.create(createProposal("racer", "race"));
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < 8; t++) {
            threads.emplace_back([&store, &id, &winners]() {
                if (store.transition(id, Warden::ProposalState::PENDING,
                                     Warden::ProposalState::COMMITTED)) {
                    winners++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        assert(winners == 1 && "Exactly one concurrent transition may win");
        auto proposal = store.get(id);
        assert(proposal->state == Warden::ProposalState::COMMITTED);
        assert(proposal->audit.size() == 9);
    }

public:
    ProposalStoreTest() : test_dir("test_proposal_store") {
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    ~ProposalStoreTest() {
        std::filesystem::remove_all(test_dir);
    }

    void testMemoryStore() {
        std::cout << "Testing memory store lifecycle..." << std::endl;

        Warden::MemoryProposalStore store;
        assert(store.getName() == "memory");
        checkLifecycle(store);

        std::cout << "✓ Memory store lifecycle test passed" << std::endl;
    }

    void testFileStore() {
        std::cout << "Testing file store lifecycle..." << std::endl;

        Warden::FileProposalStore store(test_dir + "/lifecycle");
        assert(store.getName() == "file");
        checkLifecycle(store);

        std::cout << "✓ File store lifecycle test passed" << std::endl;
    }

    void testFileStorePersistence() {
        std::cout << "Testing file store persistence..." << std::endl;

        std::string dir = test_dir + "/persist";
        std::string id;
        {
            Warden::FileProposalStore store(dir);
            id = store.create(createProposal("hanz", "persisted"));
            assert(store.transition(id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED));
        }

        Warden::FileProposalStore reopened(dir);
        auto proposal = reopened.get(id);
        assert(proposal.has_value());
        assert(proposal->state == Warden::ProposalState::COMMITTED);
        assert(proposal->metadata.summary == "persisted");
        assert(proposal->diffs.size() == 1);

        // Sequence continues across instances
        std::string next = reopened.create(createProposal("hanz", "next"));
        assert(reopened.get(next)->sequence == proposal->sequence + 1);

        assert(std::filesystem::exists(dir + "/" + id + ".json"));
        assert(!std::filesystem::exists(dir + "/" + id + ".lock"));

        // Path traversal in ids is never resolved
        assert(!reopened.get("../escape").has_value());
        assert(!reopened.transition("../escape", Warden::ProposalState::PENDING,
                                    Warden::ProposalState::COMMITTED));

        {
            std::ofstream corrupt(dir + "/broken.json");
            corrupt << "{ not json";
        }
        bool threw = false;
        try {
            reopened.get("broken");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Corrupt records must be reported");

        std::cout << "✓ File store persistence test passed" << std::endl;
    }

    void testConcurrentTransitions() {
        std::cout << "Testing concurrent transitions..." << std::endl;

        Warden::MemoryProposalStore memory;
        checkConcurrentTransition(memory);

        Warden::FileProposalStore file(test_dir + "/race");
        checkConcurrentTransition(file);

        // Two store instances over one directory behave like two processes
        std::string dir = test_dir + "/shared";
        Warden::FileProposalStore a(dir);
        Warden::FileProposalStore b(dir);
        std::string id = a.create(createProposal("shared", "shared"));

        std::atomic<int> winners{0};
        std::thread ta([&]() {
            if (a.transition(id, Warden::ProposalState::PENDING, Warden::ProposalState::REJECTED)) winners++;
        });
        std::thread tb([&]() {
            if (b.transition(id, Warden::ProposalState::PENDING, Warden::ProposalState::COMMITTED)) winners++;
        });
        ta.join();
        tb.join();
        assert(winners == 1);

        std::cout << "✓ Concurrent transitions test passed" << std::endl;
    }

    void testLockFile() {
        std::cout << "Testing lock file protocol..." << std::endl;

        std::string path = test_dir + "/resource.lock";
        {
            Warden::LockFile first(path);
            assert(first.acquire());
            assert(first.isHeld());
            assert(std::filesystem::exists(path));

            Warden::LockFile second(path, std::chrono::milliseconds(50));
            assert(!second.tryAcquire());
            assert(!second.acquire() && "Held lock must time out");

            first.release();
            assert(!std::filesystem::exists(path));
            assert(second.tryAcquire());
        }
        assert(!std::filesystem::exists(path) && "Destructor releases the lock");

        // A file left behind by a crashed holder is not a held lock
        {
            std::ofstream leftover(path);
            leftover << "99999\n";
        }
        {
            Warden::LockFile recovering(path, std::chrono::milliseconds(100));
            assert(recovering.tryAcquire() && "Leftover lock file must be reclaimed at once");
        }

        // A live holder is never broken, however long it holds
        {
            Warden::LockFile holder(path);
            assert(holder.acquire());

            Warden::LockFile rival(path, std::chrono::milliseconds(1500));
            assert(!rival.acquire() && "Live lock must not be taken over");
            assert(holder.isHeld());
        }

        // A holder that exits without releasing frees the lock
        {
            pid_t child = fork();
            assert(child >= 0);
            if (child == 0) {
                Warden::LockFile crashed(path);
                _exit(crashed.tryAcquire() ? 0 : 1);
            }
            int status = 0;
            assert(waitpid(child, &status, 0) == child);
            assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
            assert(std::filesystem::exists(path) && "Exited holder leaves its file behind");

            Warden::LockFile survivor(path, std::chrono::milliseconds(100));
            assert(survivor.acquire());
        }
        assert(!std::filesystem::exists(path));

        std::cout << "✓ Lock file protocol test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProposalStore unit tests..." << std::endl;

        testMemoryStore();
        testFileStore();
        testFileStorePersistence();
        testConcurrentTransitions();
        testLockFile();

        std::cout << "All ProposalStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        Warden::Logger::getInstance().setFileLogging(false);

        ProposalStoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ProposalStore component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
