/**
 * @file test_comparator.cpp
 * @brief Metadata stripping and match heuristic tests
 */

#include "evmverify/bytecode.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace evmverify::bytecode;

namespace {

/// a2 64 "ipfs" 58 22 <34 bytes> 64 "solc" 43 <3 bytes> 00 33
std::string metadata_trailer(char fill)
{
    return "a264697066735822" + std::string(68, fill) + "64736f6c6343000818" + "0033";
}

Bytes bytes_of(const std::string& hex)
{
    auto decoded = from_hex(hex);
    EXPECT_TRUE(decoded) << hex;
    return decoded ? *decoded : Bytes{};
}

Comparison compare_strings(const std::string& on_chain, const std::string& compiled)
{
    auto result = compare_hex(on_chain, compiled);
    EXPECT_TRUE(result);
    return result ? *result : Comparison{};
}

std::string word(const std::string& last_byte)
{
    return std::string(62, '0') + last_byte;
}

}  // namespace

// ============================================================================
// Metadata stripping
// ============================================================================

TEST(StripMetadata, RemovesTrailer)
{
    const auto code = bytes_of("6080604052" + metadata_trailer('1'));
    EXPECT_EQ(to_hex(strip_metadata(code)), "6080604052");
}

TEST(StripMetadata, RemovesEveryTrailer)
{
    // Factories embed the child's creation code, metadata included
    const auto code =
        bytes_of("6001" + metadata_trailer('a') + "6002" + metadata_trailer('b') + "6003");
    EXPECT_EQ(to_hex(strip_metadata(code)), "600160026003");
}

TEST(StripMetadata, TruncatesWithoutTerminator)
{
    const auto code = bytes_of("6001a264697066735822ffff");
    EXPECT_EQ(to_hex(strip_metadata(code)), "6001");
}

TEST(StripMetadata, NoMarkerIsNoOp)
{
    const auto code = bytes_of("60806040526004361061003f57");
    EXPECT_EQ(strip_metadata(code), code);
}

TEST(StripMetadata, Idempotent)
{
    const std::string inputs[] = {
        "6080604052" + metadata_trailer('1'),
        "6001" + metadata_trailer('a') + "6002" + metadata_trailer('b'),
        "6001a264697066735822",
        "600160026003",
        "",
    };
    for (const auto& hex : inputs) {
        const auto once = strip_metadata(bytes_of(hex));
        EXPECT_EQ(strip_metadata(once), once) << hex;
    }
}

// ============================================================================
// Match heuristics
// ============================================================================

TEST(Comparator, ExactMatch)
{
    auto result = compare_strings("6001", "6001");
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kExact);
    EXPECT_FALSE(result.diagnostics.constructor_args_size);
    EXPECT_FALSE(result.diagnostics.create2_prefix_size);
    EXPECT_FALSE(result.diagnostics.immutable_vars);
    EXPECT_FALSE(result.diagnostics.first_diff_position);
}

TEST(Comparator, MetadataDifferencesIgnored)
{
    auto result = compare_strings("6080604052" + metadata_trailer('1'),
                                  "6080604052" + metadata_trailer('2'));
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kExact);
    EXPECT_EQ(result.diagnostics.deployed_size, 5U);
}

TEST(Comparator, ConstructorArgumentSuffix)
{
    auto result = compare_strings("6001" + std::string(62, '0') + "2a", "6001");
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kConstructorArgs);
    EXPECT_EQ(result.diagnostics.constructor_args_size, 32U);
}

TEST(Comparator, ConstructorArgumentLaw)
{
    const std::string compiled = "608060405234801561001057600080fd5b50";
    for (int words = 1; words <= 4; ++words) {
        std::string args;
        for (int w = 0; w < words; ++w) {
            args += word("7f");
        }
        auto result = compare_strings(compiled + args, compiled);
        EXPECT_TRUE(result.match) << words;
        EXPECT_EQ(result.diagnostics.constructor_args_size, static_cast<std::size_t>(32 * words));
    }
}

TEST(Comparator, MisalignedSuffixRejected)
{
    auto result = compare_strings("6001" + std::string(60, '0') + "2a", "6001");
    EXPECT_FALSE(result.match);
    EXPECT_FALSE(result.diagnostics.constructor_args_size);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kNone);
}

TEST(Comparator, Create2PrefixLaw)
{
    const std::string compiled = "608060405234801561001057600080fd5b506101";
    const std::string prefix = "3d602d80600a3d3981f3";

    auto bare = compare_strings(prefix + compiled, compiled);
    EXPECT_TRUE(bare.match);
    EXPECT_EQ(bare.diagnostics.kind, MatchKind::kCreate2Prefix);
    EXPECT_EQ(bare.diagnostics.create2_prefix_size, 10U);
    EXPECT_FALSE(bare.diagnostics.constructor_args_size);

    auto with_args = compare_strings(prefix + compiled + word("01"), compiled);
    EXPECT_TRUE(with_args.match);
    EXPECT_EQ(with_args.diagnostics.kind, MatchKind::kCreate2Prefix);
    EXPECT_EQ(with_args.diagnostics.create2_prefix_size, 10U);
    EXPECT_EQ(with_args.diagnostics.constructor_args_size, 32U);
}

TEST(Comparator, Create2WithMisalignedTailRejected)
{
    const std::string compiled = "608060405234801561001057600080fd5b506101";
    auto result = compare_strings("3d602d" + compiled + "ff", compiled);
    EXPECT_FALSE(result.match);
}

TEST(Comparator, ImmutableSlotScenario)
{
    auto result = compare_strings("60ff00", "600000");
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kImmutables);
    EXPECT_EQ(result.diagnostics.immutable_vars, 1U);
}

TEST(Comparator, ImmutableSlotLaw)
{
    const std::string head = "7f";
    const std::string tail = "6000396000f3";
    const std::string compiled = head + std::string(64, '0') + tail;
    const std::string on_chain = head + std::string(63, '0') + "1" + tail;
    auto result = compare_strings(on_chain, compiled);
    EXPECT_TRUE(result.match);
    EXPECT_EQ(result.diagnostics.immutable_vars, 1U);

    // Two separate slots
    const std::string two_compiled = head + word("00") + "50" + word("00") + tail;
    const std::string two_on_chain = head + word("aa") + "50" + word("bb") + tail;
    auto two = compare_strings(two_on_chain, two_compiled);
    EXPECT_TRUE(two.match);
    EXPECT_EQ(two.diagnostics.immutable_vars, 2U);
}

TEST(Comparator, NonZeroCompiledByteInDifferingRunRejected)
{
    // The differing run 01 02 vs 00 03 has a nonzero compiled byte
    auto result = compare_strings("600102", "600003");
    EXPECT_FALSE(result.match);
    EXPECT_FALSE(result.diagnostics.immutable_vars);

    // One good slot does not excuse a bad one
    auto mixed = compare_strings("60ff5001", "60005002");
    EXPECT_FALSE(mixed.match);
}

TEST(Comparator, FirstDifferenceScenario)
{
    auto result = compare_strings("6002", "6001");
    EXPECT_FALSE(result.match);
    EXPECT_EQ(result.diagnostics.kind, MatchKind::kNone);
    EXPECT_EQ(result.diagnostics.first_diff_position, 2U);
    EXPECT_EQ(result.diagnostics.first_diff_deployed, "6002");
    EXPECT_EQ(result.diagnostics.first_diff_compiled, "6001");
}

TEST(Comparator, LengthMismatchRecordsSizes)
{
    auto result = compare_strings("60016002", "600160026003");
    EXPECT_FALSE(result.match);
    EXPECT_EQ(result.diagnostics.deployed_size, 4U);
    EXPECT_EQ(result.diagnostics.compiled_size, 6U);
    EXPECT_EQ(result.diagnostics.first_diff_position, 8U);
}

TEST(Comparator, InvalidHexSurfacesSide)
{
    auto result = compare_hex("0x6001", "0x60__$abc$__");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidHex");
    EXPECT_NE(result.error().message.find("Compiled"), std::string::npos);
}

TEST(Comparator, DiagnosticsJson)
{
    auto result = compare_strings("6001" + word("2a"), "6001");
    const auto j = to_json(result.diagnostics);
    EXPECT_EQ(j.at("match_kind"), "constructor_args");
    EXPECT_EQ(j.at("constructor_args_size"), 32);
    EXPECT_EQ(j.at("deployed_size"), 34);
    EXPECT_EQ(j.at("compiled_size"), 2);
    EXPECT_FALSE(j.contains("immutable_vars"));
}
