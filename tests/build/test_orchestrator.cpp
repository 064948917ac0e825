/**
 * @file test_orchestrator.cpp
 * @brief Group builds on persistent and ephemeral checkouts
 */

#include "evmverify/build.hpp"

#include "../support/fakes.hpp"

#include <gtest/gtest.h>

using namespace evmverify::build;
using evmverify::BuildGroup;
using evmverify::BuildKey;
using evmverify::CompilerSettings;
using evmverify::repository::KnownRepository;
using evmverify::test::FakeBuilder;
using evmverify::test::FakeCheckoutProvider;
using evmverify::test::read_file;
using evmverify::test::set_origin;
using evmverify::test::TempDir;
using evmverify::test::write_file;

namespace {

constexpr const char* kRepo = "euler-xyz/euler-vault-kit";
constexpr const char* kRevision = "5b98b42048ba11ae82fb62dfec06d1010c8e41e6";
constexpr const char* kLocalToml = "[profile.default]\nsrc = \"src\"\noptimizer_runs = 1\n";

class OrchestratorTest : public ::testing::Test
{
protected:
    OrchestratorTest()
        : m_dir(std::string("orchestrator_")
                + ::testing::UnitTest::GetInstance()->current_test_info()->name())
        , m_provider(m_dir.path() / "clones")
    {}

    [[nodiscard]] BuildGroup group() const
    {
        CompilerSettings settings;
        settings.optimization_runs = 20000;
        return BuildGroup{.key = BuildKey{.repository_id = kRepo,
                                          .revision = kRevision,
                                          .compiler_settings = settings},
                          .members = {}};
    }

    /// Persistent checkout of kRepo at `head`
    std::filesystem::path make_local(const std::string& head)
    {
        const auto location = m_dir.path() / "workspace/lib/euler-vault-kit";
        set_origin(location, kRepo);
        write_file(location / "foundry.toml", kLocalToml);
        m_provider.set_head(location, head);
        m_repositories.push_back(KnownRepository{.id = kRepo, .location = location});
        return location;
    }

    [[nodiscard]] BuildOrchestrator orchestrator()
    {
        return BuildOrchestrator(m_repositories, m_provider, m_builder, evmverify::log::quiet());
    }

    TempDir m_dir;
    FakeCheckoutProvider m_provider;
    FakeBuilder m_builder;
    std::vector<KnownRepository> m_repositories;
};

}  // namespace

TEST_F(OrchestratorTest, EphemeralBuildIsPatchedAndRemoved)
{
    auto orch = orchestrator();
    std::filesystem::path removal_root;
    {
        auto built = orch.build(group());
        ASSERT_TRUE(built);
        EXPECT_TRUE(built->success);
        EXPECT_TRUE(built->checkout.is_ephemeral());
        removal_root = built->checkout.handle().removal_root;
        EXPECT_TRUE(std::filesystem::exists(built->checkout.location() / "foundry.toml"));
    }
    EXPECT_EQ(m_provider.clones(), 1);
    EXPECT_EQ(m_builder.builds(), 1);
    EXPECT_NE(m_builder.last_config().find("optimizer_runs = 20000"), std::string::npos);
    EXPECT_NE(m_builder.last_config().find("test = \"disabled_test\""), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(removal_root));
}

TEST_F(OrchestratorTest, BuildFailureKeepsCheckoutForTheGroup)
{
    m_builder.fail_repository(kRepo);
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_TRUE(built);
    EXPECT_FALSE(built->success);
    EXPECT_EQ(built->failure_reason, "compilation failed");
    EXPECT_TRUE(std::filesystem::exists(built->checkout.location()));
}

TEST_F(OrchestratorTest, CloneFailureIsAnError)
{
    m_provider.fail_clone(kRepo);
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, "CloneFailed");
    EXPECT_EQ(m_builder.builds(), 0);
}

TEST_F(OrchestratorTest, PersistentCheckoutAtRevision)
{
    const auto location = make_local(kRevision);
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_TRUE(built);
    EXPECT_TRUE(built->success);
    EXPECT_FALSE(built->checkout.is_ephemeral());
    EXPECT_EQ(built->checkout.location(), location);
    EXPECT_EQ(m_provider.clones(), 0);

    // Built with the deployment settings, then restored
    EXPECT_NE(m_builder.last_config().find("optimizer_runs = 20000"), std::string::npos);
    EXPECT_EQ(read_file(location / "foundry.toml"), kLocalToml);
}

TEST_F(OrchestratorTest, PersistentCheckoutAtOtherRevisionIsNotUsed)
{
    const auto location = make_local("0000000000000000000000000000000000000000");
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_TRUE(built);
    EXPECT_TRUE(built->checkout.is_ephemeral());
    EXPECT_NE(built->checkout.location(), location);
    EXPECT_EQ(m_provider.clones(), 1);
}

TEST_F(OrchestratorTest, FailedPersistentBuildFallsBackToClone)
{
    const auto location = make_local(kRevision);
    m_builder.fail_repository(kRepo);
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_TRUE(built);
    EXPECT_FALSE(built->success);
    EXPECT_TRUE(built->checkout.is_ephemeral());
    EXPECT_EQ(m_builder.builds(), 2);
    EXPECT_EQ(read_file(location / "foundry.toml"), kLocalToml);
}

TEST_F(OrchestratorTest, ThrowingBuilderRestoresPersistentConfig)
{
    const auto location = make_local(kRevision);
    m_builder.throw_for_repository(kRepo);
    auto orch = orchestrator();

    EXPECT_THROW(static_cast<void>(orch.build(group())), std::runtime_error);
    EXPECT_EQ(read_file(location / "foundry.toml"), kLocalToml);

    // The checkout lock was released while unwinding
    EXPECT_THROW(static_cast<void>(orch.build(group())), std::runtime_error);
}

TEST_F(OrchestratorTest, ThrowingBuilderRemovesEphemeralCheckout)
{
    m_builder.throw_for_repository(kRepo);
    auto orch = orchestrator();

    EXPECT_THROW(static_cast<void>(orch.build(group())), std::runtime_error);
    const auto created = m_provider.created();
    ASSERT_EQ(created.size(), 1U);
    EXPECT_FALSE(std::filesystem::exists(created.front()));
}

TEST_F(OrchestratorTest, TargetedBuildOnPersistentCheckoutIsPatched)
{
    const auto location = make_local(kRevision);
    auto orch = orchestrator();

    auto built = orch.build(group());
    ASSERT_TRUE(built);
    ASSERT_TRUE(orch.build_file(built->checkout, group().key.compiler_settings, "src/EVault/EVault.sol"));
    EXPECT_EQ(m_builder.file_builds(), 1);
    EXPECT_NE(m_builder.last_config().find("optimizer_runs = 20000"), std::string::npos);
    EXPECT_EQ(read_file(location / "foundry.toml"), kLocalToml);
}
