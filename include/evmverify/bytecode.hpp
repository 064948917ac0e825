#pragma once

/**
 * @file bytecode.hpp
 * @brief Bytecode equivalence: metadata stripping and the ordered match heuristics
 *
 * Everything here is pure and deterministic. The comparator accepts on-chain
 * code as equivalent to compiled code when, after removing CBOR metadata
 * trailers, one of the following holds (tried in this order):
 *
 *  1. exact        byte-for-byte equal
 *  2. ctor args    on-chain = compiled ++ 32-byte-aligned constructor arguments
 *  3. create2      on-chain = factory prefix ++ compiled [++ aligned arguments]
 *  4. immutables   equal length, every differing run is zero-filled in compiled
 */

#include "evmverify/common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::bytecode {

using Bytes = std::vector<std::uint8_t>;
using BytesView = std::span<const std::uint8_t>;

/// CBOR map(2) "ipfs" bytes(34): start of the solc metadata trailer
constexpr std::array<std::uint8_t, 8> kMetadataMarker = {0xa2, 0x64, 0x69, 0x70,
                                                         0x66, 0x73, 0x58, 0x22};

/// Big-endian trailer length (0x33 = 51 bytes) closing the metadata blob
constexpr std::array<std::uint8_t, 2> kMetadataTerminator = {0x00, 0x33};

constexpr std::size_t kWordSize = 32;
constexpr std::size_t kCreate2NeedleSize = 20;
constexpr std::size_t kDiffContextBytes = 10;

/**
 * Decode hex, with or without "0x", case-insensitive.
 * @return Bytes or InvalidHex (odd length, non-hex characters such as
 *         unlinked library placeholders)
 */
[[nodiscard]] evmverify::Result<Bytes> from_hex(std::string_view hex);

/// Lowercase hex without prefix
[[nodiscard]] std::string to_hex(BytesView bytes);

/**
 * Remove every CBOR metadata trailer.
 *
 * Each marker occurrence is removed together with everything up to and
 * including the next terminator; a marker without a terminator truncates the
 * code. Idempotent; code without a marker is returned unchanged.
 */
[[nodiscard]] Bytes strip_metadata(BytesView code);

enum class MatchKind {
    kExact,
    kConstructorArgs,
    kCreate2Prefix,
    kImmutables,
    kNone
};

[[nodiscard]] std::string_view to_string(MatchKind kind) noexcept;

/**
 * @brief Facts recorded by a comparison
 *
 * Sizes are in bytes after stripping. first_diff_position is a hex-character
 * offset (2 * byte index) into the stripped code.
 */
struct Diagnostics
{
    MatchKind kind = MatchKind::kNone;
    std::size_t deployed_size = 0;
    std::size_t compiled_size = 0;
    std::optional<std::size_t> constructor_args_size;
    std::optional<std::size_t> create2_prefix_size;
    std::optional<std::size_t> immutable_vars;
    std::optional<std::size_t> first_diff_position;
    std::optional<std::string> first_diff_deployed;
    std::optional<std::string> first_diff_compiled;
};

struct Comparison
{
    bool match = false;
    Diagnostics diagnostics;
};

/**
 * Compare on-chain code against compiled code.
 * The first heuristic that succeeds decides the outcome.
 */
[[nodiscard]] Comparison compare(BytesView on_chain, BytesView compiled);

/**
 * Hex front end for compare().
 * @return Comparison, or InvalidHex naming which side failed to decode
 */
[[nodiscard]] evmverify::Result<Comparison> compare_hex(std::string_view on_chain_hex,
                                                        std::string_view compiled_hex);

[[nodiscard]] nlohmann::json to_json(const Diagnostics& diagnostics);

}  // namespace evmverify::bytecode
