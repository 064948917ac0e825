#pragma once

/**
 * @file types.hpp
 * @brief Verification data model: identities, compiler settings, build targets, outcomes
 */

#include "evmverify/common.hpp"

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify {

/**
 * @brief A deployed contract: logical name plus lowercase on-chain address
 */
struct ContractIdentity
{
    std::string logical_name;
    std::string address;

    auto operator<=>(const ContractIdentity&) const = default;
};

/**
 * Canonicalize an address: "0x" + 40 hex digits, lowercased.
 * @return Lowercase address or InvalidAddress
 */
[[nodiscard]] Result<std::string> canonical_address(std::string_view address);

/// "0x" followed by forty zeros
[[nodiscard]] bool is_zero_address(std::string_view address);

/**
 * @brief Compiler settings reported for a deployment
 *
 * Absent fields are not overridden in the checkout's build configuration.
 */
struct CompilerSettings
{
    std::optional<std::string> compiler_version;
    std::optional<bool> optimization_enabled;
    std::optional<std::uint64_t> optimization_runs;
    std::optional<std::string> evm_version;
    std::optional<bool> via_ir;

    auto operator<=>(const CompilerSettings&) const = default;
};

/**
 * Extract the "x.y.z" release from a compiler identifier such as
 * "v0.8.24+commit.e11b9ed9".
 */
[[nodiscard]] std::optional<std::string> parse_compiler_release(std::string_view compiler_version);

/**
 * @brief What to compile and how
 */
struct BuildTarget
{
    std::string repository_id;                    ///< "org/repo"
    std::string revision;                         ///< Commit hash or tag
    std::string artifact_name;                    ///< Contract name inside the build output
    std::optional<std::string> source_file_path;  ///< Source file relative to the checkout
    CompilerSettings compiler_settings;
};

/**
 * @brief Grouping key: targets with equal keys share one build
 *
 * artifact_name and source_file_path are deliberately absent.
 */
struct BuildKey
{
    std::string repository_id;
    std::string revision;
    CompilerSettings compiler_settings;

    auto operator<=>(const BuildKey&) const = default;
};

[[nodiscard]] BuildKey build_key_of(const BuildTarget& target);

/// "org/repo@0123456789ab" for log lines
[[nodiscard]] std::string describe(const BuildKey& key);

struct GroupMember
{
    ContractIdentity identity;
    BuildTarget target;
};

/**
 * @brief Contracts sharing one build
 */
struct BuildGroup
{
    BuildKey key;
    std::vector<GroupMember> members;
};

/**
 * @brief A checkout on disk
 *
 * For ephemeral checkouts removal_root is the private temporary directory that
 * contains the checkout and is deleted when the group finishes.
 */
struct CheckoutHandle
{
    std::filesystem::path location;
    bool is_ephemeral = false;
    std::filesystem::path removal_root;
};

enum class BytecodeKind {
    kCreation,
    kRuntime
};

[[nodiscard]] std::string_view to_string(BytecodeKind kind) noexcept;

/**
 * @brief Code read from the chain, tagged with what it is
 */
struct OnChainBytecode
{
    std::string hex;
    BytecodeKind kind = BytecodeKind::kRuntime;
    std::string source;  ///< Tier that produced it ("creation_tx", "explorer", "rpc")
};

/**
 * @brief Creation and runtime code of one compiled contract
 */
struct CompiledArtifact
{
    std::string creation_hex;
    std::string runtime_hex;
    std::filesystem::path path;
};

enum class ErrorKind {
    kUnresolved,
    kBuildFailure,
    kFetchUnavailable,
    kArtifactNotFound,
    kBytecodeMismatch
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Final verdict for one contract; never mutated after creation
 */
struct VerificationOutcome
{
    ContractIdentity identity;
    bool verified = false;
    std::optional<ErrorKind> error_kind;
    std::optional<std::string> error;
    nlohmann::json details = nlohmann::json::object();
};

// ============================================================================
// JSON conversion
// ============================================================================

[[nodiscard]] nlohmann::json to_json(const CompilerSettings& settings);

/**
 * Read settings from an object carrying compiler_version, optimization_enabled,
 * optimization_runs, evm_version and via_ir; null or missing fields stay unset.
 */
[[nodiscard]] Result<CompilerSettings> compiler_settings_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const VerificationOutcome& outcome);

}  // namespace evmverify
