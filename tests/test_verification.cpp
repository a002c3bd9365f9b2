#include <gtest/gtest.h>
#include "exception.hpp"
#include "fakes.hpp"
#include "verification.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

class VerificationTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        test_root = fs::absolute("tmp_verification_test");
        use_test_root(test_root);
    }

    void TearDown() override {
        set_root_path("/");
        fs::remove_all(test_root);
    }

    static TrustRegistry sample_registry() {
        return TrustRegistry{
            {"gadgets", RepositoryRef{"trusted", "gadgets"}},
            {"widgets", RepositoryRef{"trusted", "official-widgets"}},
        };
    }
};

TEST_F(VerificationTest, ParsesReferenceForms) {
    PackageReference url = PackageReference::parse("https://github.com/acme/widgets");
    EXPECT_EQ(url.kind, PackageReference::Kind::Raw);
    EXPECT_EQ(url.repo, (RepositoryRef{"acme", "widgets"}));

    PackageReference pair = PackageReference::parse("acme/widgets");
    EXPECT_EQ(pair.kind, PackageReference::Kind::Raw);
    EXPECT_EQ(pair.repo, (RepositoryRef{"acme", "widgets"}));

    PackageReference deep = PackageReference::parse("https://github.com/acme/widgets.git/tree/main");
    EXPECT_EQ(deep.repo, (RepositoryRef{"acme", "widgets"}));

    PackageReference name = PackageReference::parse(" gadgets ");
    EXPECT_EQ(name.kind, PackageReference::Kind::Name);
    EXPECT_EQ(name.name, "gadgets");
}

TEST_F(VerificationTest, RejectsMalformedReferences) {
    EXPECT_THROW(PackageReference::parse(""), InvalidReferenceError);
    EXPECT_THROW(PackageReference::parse("acme/"), InvalidReferenceError);
    EXPECT_THROW(PackageReference::parse("/widgets"), InvalidReferenceError);
    EXPECT_THROW(PackageReference::parse("acme/wid gets"), InvalidReferenceError);
    EXPECT_THROW(PackageReference::parse("../widgets"), InvalidReferenceError);
}

TEST_F(VerificationTest, ParsesRegistryList) {
    TrustRegistry registry = parse_trust_registry(
        "# verified packages\n"
        "\n"
        "gadgets : trusted/gadgets\n"
        "widgets : https://github.com/trusted/official-widgets\n"
        "broken line without separator\n"
        "bad : not-a-repo\n");

    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.at("gadgets"), (RepositoryRef{"trusted", "gadgets"}));
    EXPECT_EQ(registry.at("widgets"), (RepositoryRef{"trusted", "official-widgets"}));
}

TEST_F(VerificationTest, RegistryBuildIsBestEffort) {
    FakeContentSource source;
    Settings settings;
    EXPECT_TRUE(load_trust_registry(source, settings).empty()); // 404 from the fake

    source.put(RepositoryRef{settings.self_owner, settings.self_repo}, settings.registry_path,
               "gadgets : trusted/gadgets\n");
    TrustRegistry registry = load_trust_registry(source, settings);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(VerificationTest, UnverifiedRawReferenceIsBlocked) {
    VerificationService verifier(sample_registry());
    GateResult result = verifier.evaluate(PackageReference::parse("acme/tools"), true);
    EXPECT_EQ(result.decision, GateDecision::Blocked);
    EXPECT_FALSE(result.confirmation_consumed);
    EXPECT_FALSE(verifier.confirmation_pending());
}

TEST_F(VerificationTest, ConfirmationIsConsumedByOneAttempt) {
    VerificationService verifier(sample_registry());
    verifier.confirm();
    verifier.confirm(); // does not stack

    GateResult first = verifier.evaluate(PackageReference::parse("acme/tools"), true);
    EXPECT_EQ(first.decision, GateDecision::Proceed);
    EXPECT_TRUE(first.confirmation_consumed);
    EXPECT_FALSE(verifier.confirmation_pending());

    GateResult second = verifier.evaluate(PackageReference::parse("acme/tools"), true);
    EXPECT_EQ(second.decision, GateDecision::Blocked);
}

TEST_F(VerificationTest, MalformedTextStillConsumesConfirmation) {
    VerificationService verifier(sample_registry());
    verifier.confirm();

    EXPECT_THROW(verifier.evaluate(std::string("acme//tools"), true), InvalidReferenceError);
    EXPECT_FALSE(verifier.confirmation_pending());
    EXPECT_EQ(verifier.evaluate(std::string("acme/tools"), true).decision, GateDecision::Blocked);
}

TEST_F(VerificationTest, RegistryNameProceedsAndStillConsumesConfirmation) {
    VerificationService verifier(sample_registry());
    verifier.confirm();

    GateResult result = verifier.evaluate(PackageReference::parse("gadgets"), true);
    EXPECT_EQ(result.decision, GateDecision::Proceed);
    EXPECT_TRUE(result.registry_match);
    EXPECT_EQ(result.repo, (RepositoryRef{"trusted", "gadgets"}));
    EXPECT_FALSE(verifier.confirmation_pending());
}

TEST_F(VerificationTest, UnknownBareNameIsInvalid) {
    VerificationService verifier(sample_registry());
    EXPECT_THROW(verifier.evaluate(PackageReference::parse("nonexistent"), true), InvalidReferenceError);
}

TEST_F(VerificationTest, RawFormWinsOverRegistryName) {
    VerificationService verifier(sample_registry());
    // "widgets" is registered, but an explicit owner/repo is never resolved through the registry
    GateResult result = verifier.evaluate(PackageReference::parse("acme/widgets"), true);
    EXPECT_EQ(result.decision, GateDecision::Blocked);
    EXPECT_FALSE(result.registry_match);
    EXPECT_EQ(result.repo, (RepositoryRef{"acme", "widgets"}));
}

TEST_F(VerificationTest, SafeModeOffAlwaysProceeds) {
    VerificationService verifier;
    GateResult result = verifier.evaluate(PackageReference::parse("acme/tools"), false);
    EXPECT_EQ(result.decision, GateDecision::Proceed);
    EXPECT_FALSE(result.confirmation_consumed);
}

TEST_F(VerificationTest, ConcurrentAttemptsConsumeAtMostOnce) {
    for (int round = 0; round < 20; ++round) {
        VerificationService verifier;
        verifier.confirm();

        std::atomic<int> proceeded{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                GateResult r = verifier.evaluate(PackageReference::parse("acme/tools"), true);
                if (r.decision == GateDecision::Proceed) ++proceeded;
            });
        }
        for (auto& t : threads) t.join();

        EXPECT_EQ(proceeded.load(), 1);
    }
}
