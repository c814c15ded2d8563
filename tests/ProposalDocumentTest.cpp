// =================================================================
// tests/ProposalDocumentTest.cpp
// =================================================================
// Unit tests for the proposal record, its lifecycle helpers and the
// markdown proposal document.

#include "Warden/Proposal.hpp"
#include "Warden/ProposalDocument.hpp"
#include "Warden/DiffGenerator.hpp"
#include "Warden/Logger.hpp"
#include <iostream>
#include <cassert>
#include <string>

class ProposalDocumentTest {
private:
    Warden::Proposal createProposal() {
        Warden::Proposal proposal;
        proposal.id = "kart_2025-01-01_12-00-00_000007";
        proposal.sequence = 7;
        proposal.repo_root = "/srv/repo";
        proposal.tier = Warden::Tier::GOVERN;
        proposal.review_id = "review_000002";
        proposal.metadata.proposer = "kart";
        proposal.metadata.summary = "Tighten the retry loop";
        proposal.metadata.change_type = "fix";
        proposal.metadata.created_at = "2025-01-01T12:00:00Z";
        proposal.diffs.push_back({"core/retry.py",
            Warden::DiffGenerator::makeDiff(std::string("retries = 5\n"), "retries = 3\n", "core/retry.py")});
        proposal.diffs.push_back({"docs/retry.md",
            Warden::DiffGenerator::makeDiff(std::nullopt, "Retries are capped.\n", "docs/retry.md")});
        proposal.audit.push_back(Warden::AuditEntry::make("create", "", "Pending", true, "2 file(s)"));
        return proposal;
    }

public:
    void testStateHelpers() {
        std::cout << "Testing proposal state helpers..." << std::endl;

        assert(Warden::getProposalStateName(Warden::ProposalState::COMMITTED) == "Committed");
        assert(Warden::getProposalStateTag(Warden::ProposalState::PENDING) == "pending");
        assert(Warden::getProposalStateTag(Warden::ProposalState::COMMITTED) == "commit");
        assert(Warden::getProposalStateTag(Warden::ProposalState::REJECTED) == "reject");

        assert(Warden::parseProposalState("applied") == Warden::ProposalState::APPLIED);
        assert(Warden::parseProposalState("Failed") == Warden::ProposalState::FAILED);
        assert(Warden::parseProposalState("commit") == Warden::ProposalState::COMMITTED);
        assert(!Warden::parseProposalState("merged").has_value());

        assert(!Warden::isTerminalState(Warden::ProposalState::PENDING));
        assert(!Warden::isTerminalState(Warden::ProposalState::COMMITTED));
        assert(Warden::isTerminalState(Warden::ProposalState::APPLIED));
        assert(Warden::isTerminalState(Warden::ProposalState::FAILED));
        assert(Warden::isTerminalState(Warden::ProposalState::REJECTED));

        using S = Warden::ProposalState;
        assert(Warden::isLegalTransition(S::PENDING, S::COMMITTED));
        assert(Warden::isLegalTransition(S::PENDING, S::REJECTED));
        assert(Warden::isLegalTransition(S::COMMITTED, S::APPLIED));
        assert(Warden::isLegalTransition(S::COMMITTED, S::FAILED));
        assert(!Warden::isLegalTransition(S::PENDING, S::APPLIED));
        assert(!Warden::isLegalTransition(S::APPLIED, S::COMMITTED));
        assert(!Warden::isLegalTransition(S::FAILED, S::COMMITTED));
        assert(!Warden::isLegalTransition(S::COMMITTED, S::COMMITTED));

        std::cout << "✓ Proposal state helpers test passed" << std::endl;
    }

    void testIdentifiers() {
        std::cout << "Testing proposal identifiers..." << std::endl;

        std::string id = Warden::generateProposalId("Kart Agent", 42);
        assert(id.rfind("Kart-Agent_", 0) == 0);
        assert(id.size() >= 6 && id.substr(id.size() - 6) == "000042");

        std::string anonymous = Warden::generateProposalId("", 1);
        assert(anonymous.rfind("anonymous_", 0) == 0);

        auto proposal = createProposal();
        assert(proposal.taggedId() == "kart_2025-01-01_12-00-00_000007.pending");
        assert(Warden::stripStateTag(proposal.taggedId()) == proposal.id);
        assert(Warden::stripStateTag("abc.commit") == "abc");
        assert(Warden::stripStateTag("abc.unknown") == "abc.unknown");
        assert(Warden::stripStateTag("abc") == "abc");

        std::string timestamp = Warden::currentTimestamp();
        assert(timestamp.size() == 20 && timestamp.back() == 'Z' && timestamp[10] == 'T');

        std::cout << "✓ Proposal identifiers test passed" << std::endl;
    }

    void testCombinedPatchAndPaths() {
        std::cout << "Testing combined patch..." << std::endl;

        auto proposal = createProposal();
        auto paths = proposal.paths();
        assert(paths.size() == 2 && paths[0] == "core/retry.py" && paths[1] == "docs/retry.md");
        assert(proposal.hasDiffContent());

        std::string combined = proposal.combinedPatch();
        assert(combined == proposal.diffs[0].diff + proposal.diffs[1].diff);

        Warden::Proposal blank;
        blank.diffs.push_back({"a.txt", "  \n"});
        assert(!blank.hasDiffContent());

        std::cout << "✓ Combined patch test passed" << std::endl;
    }

    void testJsonRoundTrip() {
        std::cout << "Testing proposal JSON record..." << std::endl;

        auto proposal = createProposal();
        proposal.state = Warden::ProposalState::COMMITTED;
        proposal.attempts = 2;

        nlohmann::json j = proposal;
        assert(j["state"] == "Committed");
        assert(j["tier"] == "GOVERN");
        assert(j["diffs"].size() == 2);

        Warden::Proposal restored = j.get<Warden::Proposal>();
        assert(restored.id == proposal.id);
        assert(restored.sequence == 7);
        assert(restored.state == Warden::ProposalState::COMMITTED);
        assert(restored.tier == Warden::Tier::GOVERN);
        assert(restored.attempts == 2);
        assert(restored.review_id == "review_000002");
        assert(restored.diffs[1].diff == proposal.diffs[1].diff);
        assert(restored.audit.size() == 1 && restored.audit[0].detail == "2 file(s)");

        std::cout << "✓ Proposal JSON record test passed" << std::endl;
    }

    void testRenderAndParse() {
        std::cout << "Testing document render and parse..." << std::endl;

        auto proposal = createProposal();
        std::string document = Warden::ProposalDocument::render(proposal);

        assert(document.rfind("# Proposal kart_2025-01-01_12-00-00_000007.pending\n", 0) == 0);
        assert(document.find("**Tier:** GOVERN") != std::string::npos);
        assert(document.find("**Review:** review_000002") != std::string::npos);
        assert(document.find("### core/retry.py") != std::string::npos);

        auto parsed = Warden::ProposalDocument::parse(document);
        assert(parsed.success);
        assert(parsed.metadata.proposer == "kart");
        assert(parsed.metadata.change_type == "fix");
        assert(parsed.metadata.summary == "Tighten the retry loop");
        assert(parsed.metadata.created_at == "2025-01-01T12:00:00Z");
        assert(parsed.diffs.size() == 2);
        assert(parsed.diffs[0].path == "core/retry.py");
        assert(parsed.diffs[0].diff == proposal.diffs[0].diff);
        assert(parsed.diffs[1].path == "docs/retry.md");
        assert(parsed.diffs[1].diff == proposal.diffs[1].diff);

        std::cout << "✓ Document render and parse test passed" << std::endl;
    }

    void testHandWrittenDocument() {
        std::cout << "Testing hand-written document..." << std::endl;

        std::string document =
            "# Proposal\n"
            "\n"
            "**Proposer:** hanz\n"
            "**Type:** docs\n"
            "\n"
            "## Summary\n"
            "\n"
            "\n"
            "Clarify install steps\n"
            "\n"
            "```diff\n"
            "--- a/docs/install.md+++ b/docs/install.md\n"
            "@@ -1 +1 @@\n"
            "-Run make.\n"
            "+Run cmake, then make.\n"
            "```\n";

        auto parsed = Warden::ProposalDocument::parse(document);
        assert(parsed.success);
        assert(parsed.metadata.proposer == "hanz");
        assert(parsed.metadata.summary == "Clarify install steps");
        assert(parsed.metadata.created_at.empty());
        assert(parsed.diffs.size() == 1);
        assert(parsed.diffs[0].path == "docs/install.md");

        std::cout << "✓ Hand-written document test passed" << std::endl;
    }

    void testInvalidDocuments() {
        std::cout << "Testing invalid documents..." << std::endl;

        auto no_diff = Warden::ProposalDocument::parse("**Proposer:** x\n\n## Summary\n\nNothing\n");
        assert(!no_diff.success);
        assert(no_diff.error == "document contains no ```diff block");

        auto broken = Warden::ProposalDocument::parse(
            "```diff\n--- a/x\n+++ b/x\n@@ -1,4 +1,4 @@\n-a\n+b\n```\n");
        assert(!broken.success);
        assert(broken.error.rfind("invalid diff: ", 0) == 0);

        auto no_summary = createProposal();
        no_summary.metadata.summary = "";
        auto reparsed = Warden::ProposalDocument::parse(Warden::ProposalDocument::render(no_summary));
        assert(reparsed.success);
        assert(reparsed.metadata.summary.empty());

        std::cout << "✓ Invalid documents test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProposalDocument unit tests..." << std::endl;

        testStateHelpers();
        testIdentifiers();
        testCombinedPatchAndPaths();
        testJsonRoundTrip();
        testRenderAndParse();
        testHandWrittenDocument();
        testInvalidDocuments();

        std::cout << "All ProposalDocument tests passed!" << std::endl;
    }
};

int main() {
    try {
        Warden::Logger::getInstance().setFileLogging(false);

        ProposalDocumentTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ProposalDocument component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
