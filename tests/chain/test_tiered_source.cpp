/**
 * @file test_tiered_source.cpp
 * @brief Tiered on-chain bytecode fetch order
 */

#include "evmverify/bytecode_source.hpp"

#include "../support/fakes.hpp"

#include <gtest/gtest.h>

using evmverify::BytecodeKind;
using evmverify::TieredBytecodeSource;
using evmverify::chain::CreationTransaction;
using evmverify::test::FakeExplorer;
using evmverify::test::FakeNode;

namespace {

constexpr const char* kAddress = "0x1111111111111111111111111111111111111111";

}  // namespace

TEST(TieredFetch, DirectDeploymentUsesCreationInput)
{
    FakeExplorer explorer;
    FakeNode node;
    explorer.set(kAddress, {.creation_hash = "0xabc",
                            .transaction = CreationTransaction{.to = std::nullopt, .raw_input = "0x6080"},
                            .runtime = "0x6001",
                            .verified = std::nullopt});
    TieredBytecodeSource source(explorer, node, evmverify::log::quiet());

    auto code = source.fetch(kAddress);
    ASSERT_TRUE(code);
    EXPECT_EQ(code->hex, "0x6080");
    EXPECT_EQ(code->kind, BytecodeKind::kCreation);
    EXPECT_EQ(code->source, "creation_tx");
    EXPECT_EQ(node.calls(), 0);
}

TEST(TieredFetch, FactoryDeploymentFallsBackToExplorerRuntime)
{
    FakeExplorer explorer;
    FakeNode node;
    explorer.set(kAddress, {.creation_hash = "0xabc",
                            .transaction = CreationTransaction{.to = "0x2222222222222222222222222222222222222222",
                                                               .raw_input = "0xdeadbeef"},
                            .runtime = "0x6001",
                            .verified = std::nullopt});
    TieredBytecodeSource source(explorer, node, evmverify::log::quiet());

    auto code = source.fetch(kAddress);
    ASSERT_TRUE(code);
    EXPECT_EQ(code->hex, "0x6001");
    EXPECT_EQ(code->kind, BytecodeKind::kRuntime);
    EXPECT_EQ(code->source, "explorer");
}

TEST(TieredFetch, NodeIsTheLastResort)
{
    FakeExplorer explorer;
    FakeNode node;
    explorer.set(kAddress, {.unreachable = true});
    node.set(kAddress, "0x6002");
    TieredBytecodeSource source(explorer, node, evmverify::log::quiet());

    auto code = source.fetch(kAddress);
    ASSERT_TRUE(code);
    EXPECT_EQ(code->hex, "0x6002");
    EXPECT_EQ(code->kind, BytecodeKind::kRuntime);
    EXPECT_EQ(code->source, "rpc");

    const auto calls = explorer.calls();
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls[0], std::string("creation_transaction_hash:") + kAddress);
    EXPECT_EQ(calls[1], std::string("deployed_bytecode:") + kAddress);
}

TEST(TieredFetch, ThrowingTierIsSkipped)
{
    FakeExplorer explorer;
    FakeNode node;
    explorer.set(kAddress, {.throws = true});
    node.set(kAddress, "0x6003");
    TieredBytecodeSource source(explorer, node, evmverify::log::quiet());

    auto code = source.fetch(kAddress);
    ASSERT_TRUE(code);
    EXPECT_EQ(code->source, "rpc");
}

TEST(TieredFetch, EmptyPayloadsCountAsFailures)
{
    FakeExplorer explorer;
    FakeNode node;
    explorer.set(kAddress, {.creation_hash = "0xabc",
                            .transaction = CreationTransaction{.to = std::nullopt, .raw_input = "0x"},
                            .runtime = "0x",
                            .verified = std::nullopt});
    TieredBytecodeSource source(explorer, node, evmverify::log::quiet());

    auto code = source.fetch(kAddress);
    ASSERT_FALSE(code);
    EXPECT_EQ(code.error().code, "FetchUnavailable");
    EXPECT_EQ(node.calls(), 1);
}
