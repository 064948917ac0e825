/**
 * @file test_source_resolver.cpp
 * @brief Resolution rule ordering against a scratch workspace
 */

#include "evmverify/resolver.hpp"

#include "../support/fakes.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace evmverify::resolver;
using evmverify::ContractIdentity;
using evmverify::repository::KnownRepository;
using evmverify::test::FakeCheckoutProvider;
using evmverify::test::TempDir;
using evmverify::test::write_file;

namespace {

constexpr const char* kAddress = "0x1111111111111111111111111111111111111111";

class SourceResolverTest : public ::testing::Test
{
protected:
    SourceResolverTest()
        : m_workspace(std::string("source_resolver_")
                      + ::testing::UnitTest::GetInstance()->current_test_info()->name())
        , m_inspector(m_workspace.path() / "scratch")
    {
        const auto& ws = m_workspace.path();
        add_repository("euler-xyz/ethereum-vault-connector", "lib/ethereum-vault-connector", "evc1111");
        write_file(ws / "lib/ethereum-vault-connector/src/EthereumVaultConnector.sol", "");

        add_repository("euler-xyz/euler-vault-kit", "lib/euler-vault-kit", "evk2222");
        write_file(ws / "lib/euler-vault-kit/src/EVault/EVault.sol", "");
        write_file(ws / "lib/euler-vault-kit/src/test/Shared.sol", "");

        add_repository("euler-xyz/evk-periphery", "lib/evk-periphery", "peri3333");
        write_file(ws / "lib/evk-periphery/.gitmodules",
                   "[submodule \"lib/euler-price-oracle\"]\n"
                   "\tpath = lib/euler-price-oracle\n"
                   "\turl = https://github.com/euler-xyz/euler-price-oracle\n");
        write_file(ws / "lib/evk-periphery/lib/euler-price-oracle/src/adapter/ChainlinkOracle.sol", "");
        write_file(ws / "lib/evk-periphery/src/Lens/AccountLens.sol", "");

        add_repository("euler-xyz/permit2", "lib/permit2", "p2p2p2");
    }

    void add_repository(const std::string& id, const std::string& relative, const std::string& head)
    {
        const auto location = m_workspace.path() / relative;
        std::filesystem::create_directories(location);
        m_inspector.set_head(location, head);
        m_repositories.push_back(KnownRepository{.id = id, .location = location});
    }

    [[nodiscard]] SourceResolver make_resolver(OverrideTable overrides = {})
    {
        ResolverConfig config;
        config.workspace_root = m_workspace.path();
        config.periphery_repository = "euler-xyz/evk-periphery";
        return SourceResolver(config, m_repositories, std::move(overrides), m_inspector);
    }

    TempDir m_workspace;
    FakeCheckoutProvider m_inspector;
    std::vector<KnownRepository> m_repositories;
};

ContractIdentity identity(const std::string& name)
{
    return ContractIdentity{.logical_name = name, .address = kAddress};
}

}  // namespace

TEST_F(SourceResolverTest, DependencyPathRule)
{
    auto resolver = make_resolver();
    SourceHint hint;
    hint.file_path = "./lib/ethereum-vault-connector/src/EthereumVaultConnector.sol";
    hint.compiler_settings.compiler_version = "v0.8.19+commit.7dd6d404";

    auto resolved = resolver.resolve(identity("EVC"), hint);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kDependencyPath);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/ethereum-vault-connector");
    EXPECT_EQ(resolved->target.revision, "evc1111");
    EXPECT_EQ(resolved->target.artifact_name, "EthereumVaultConnector");
    EXPECT_EQ(resolved->target.source_file_path,
              "lib/ethereum-vault-connector/src/EthereumVaultConnector.sol");
    EXPECT_EQ(resolved->target.compiler_settings.compiler_version, "v0.8.19+commit.7dd6d404");
}

TEST_F(SourceResolverTest, NestedDependencyBuildsThePeriphery)
{
    auto resolver = make_resolver();
    SourceHint hint;
    hint.file_path = "lib/euler-price-oracle/src/adapter/ChainlinkOracle.sol";

    auto resolved = resolver.resolve(identity("ChainlinkOracle"), hint);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kNestedDependency);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/evk-periphery");
    EXPECT_EQ(resolved->target.revision, "peri3333");
    EXPECT_EQ(resolved->target.artifact_name, "ChainlinkOracle");
}

TEST_F(SourceResolverTest, SourceSearchRule)
{
    auto resolver = make_resolver();

    // No explorer path: logical name is the artifact
    auto resolved = resolver.resolve(identity("EVault"), SourceHint{});
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kSourceSearch);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/euler-vault-kit");
    EXPECT_EQ(resolved->target.revision, "evk2222");
    EXPECT_EQ(resolved->target.source_file_path, "src/EVault/EVault.sol");

    // Explorer path outside the dependency prefix falls back to the search
    SourceHint hint;
    hint.file_path = "src/Lens/AccountLens.sol";
    resolved = resolver.resolve(identity("AccountLens"), hint);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kSourceSearch);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/evk-periphery");
    EXPECT_EQ(resolved->target.source_file_path, "src/Lens/AccountLens.sol");
}

TEST_F(SourceResolverTest, SourceSearchSkipsTests)
{
    auto resolver = make_resolver();
    auto resolved = resolver.resolve(identity("Shared"), SourceHint{});
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, "NoMapping");
}

TEST_F(SourceResolverTest, SourceSearchTieBreakIsRepositoryId)
{
    add_repository("b-org/vaults", "lib/b-vaults", "bbbb");
    add_repository("a-org/vaults", "lib/a-vaults", "aaaa");
    write_file(m_workspace.path() / "lib/b-vaults/src/Twin.sol", "");
    write_file(m_workspace.path() / "lib/a-vaults/contracts/Twin.sol", "");

    auto resolver = make_resolver();
    auto resolved = resolver.resolve(identity("Twin"), SourceHint{});
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->target.repository_id, "a-org/vaults");
    EXPECT_EQ(resolved->target.source_file_path, "contracts/Twin.sol");
}

TEST_F(SourceResolverTest, UnknownDependencyFallsThrough)
{
    auto resolver = make_resolver();
    SourceHint hint;
    hint.file_path = "lib/unknown-lib/src/EVault.sol";

    auto resolved = resolver.resolve(identity("Vault"), hint);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kSourceSearch);
    EXPECT_EQ(resolved->target.artifact_name, "EVault");
    // Explorer path kept over the one found by the search
    EXPECT_EQ(resolved->target.source_file_path, "lib/unknown-lib/src/EVault.sol");
}

TEST_F(SourceResolverTest, OverrideWinsAndReadsRevision)
{
    auto overrides = OverrideTable::from_json({
        {"schema_version", "overrides.v1"},
        {       "entries",
         nlohmann::json::array({{{"name", "EVC"},
                                 {"repo", "euler-xyz/permit2"},
                                 {"revision_from", "lib/permit2"},
                                 {"artifact_name", "Permit2"}}})}
    });
    ASSERT_TRUE(overrides);
    auto resolver = make_resolver(std::move(*overrides));

    SourceHint hint;
    hint.file_path = "lib/ethereum-vault-connector/src/EthereumVaultConnector.sol";
    auto resolved = resolver.resolve(identity("EVC"), hint);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kOverride);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/permit2");
    EXPECT_EQ(resolved->target.revision, "p2p2p2");
    EXPECT_EQ(resolved->target.artifact_name, "Permit2");
    EXPECT_FALSE(resolved->target.source_file_path);
}

TEST_F(SourceResolverTest, OverrideWithMissingCheckoutFallsThrough)
{
    auto overrides = OverrideTable::from_json({
        {"schema_version", "overrides.v1"},
        {       "entries",
         nlohmann::json::array({{{"name", "EVault"},
                                 {"repo", "euler-xyz/elsewhere"},
                                 {"revision_from", "lib/not-checked-out"},
                                 {"artifact_name", "EVault"}}})}
    });
    ASSERT_TRUE(overrides);
    auto resolver = make_resolver(std::move(*overrides));

    auto resolved = resolver.resolve(identity("EVault"), SourceHint{});
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->rule, ResolutionRule::kSourceSearch);
    EXPECT_EQ(resolved->target.repository_id, "euler-xyz/euler-vault-kit");
}

TEST_F(SourceResolverTest, NothingMatches)
{
    auto resolver = make_resolver();
    SourceHint hint;
    hint.file_path = "lib/nowhere/src/Ghost.sol";
    auto resolved = resolver.resolve(identity("Ghost"), hint);
    ASSERT_FALSE(resolved);
    EXPECT_EQ(resolved.error().code, "NoMapping");
    EXPECT_NE(resolved.error().message.find("Ghost"), std::string::npos);
}

TEST(ArtifactName, Precedence)
{
    const auto id = identity("Logical");
    SourceHint hint;
    EXPECT_EQ(artifact_name_for(id, hint), "Logical");
    hint.file_path = "lib/x/src/FromPath.sol";
    EXPECT_EQ(artifact_name_for(id, hint), "FromPath");
    hint.artifact_name = "Explicit";
    EXPECT_EQ(artifact_name_for(id, hint), "Explicit");
}

TEST(ResolutionRuleNames, Stable)
{
    EXPECT_EQ(to_string(ResolutionRule::kOverride), "override");
    EXPECT_EQ(to_string(ResolutionRule::kDependencyPath), "dependency_path");
    EXPECT_EQ(to_string(ResolutionRule::kNestedDependency), "nested_dependency");
    EXPECT_EQ(to_string(ResolutionRule::kSourceSearch), "source_search");
}
