#pragma once

/**
 * @file config.hpp
 * @brief Verifier configuration (verifier_config.v1)
 */

#include "evmverify/build.hpp"
#include "evmverify/chain.hpp"
#include "evmverify/checkout.hpp"
#include "evmverify/common.hpp"
#include "evmverify/repository.hpp"
#include "evmverify/resolver.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::config {

inline constexpr std::string_view kDefaultExplorerUrl = "https://www.hyperscan.com/api/v2";
inline constexpr std::string_view kDefaultRpcUrl = "https://rpc.hyperliquid.xyz/evm";
inline constexpr std::string_view kDefaultPeripheryRepository = "euler-xyz/evk-periphery";

/// Address files read by `verify --all` and `map`, relative to the workspace root
[[nodiscard]] std::vector<std::string> default_address_files();

struct VerifierConfig
{
    std::string explorer_url{kDefaultExplorerUrl};
    std::string rpc_url{kDefaultRpcUrl};
    chain::ExplorerTimeouts explorer_timeouts;
    std::chrono::milliseconds rpc_timeout{std::chrono::seconds(10)};

    resolver::ResolverConfig resolver;  ///< resolver.workspace_root is the workspace root
    checkout::GitCheckoutOptions git;
    build::ForgeOptions forge;

    /// Listed explicitly; take precedence over the workspace .gitmodules
    std::vector<repository::KnownRepository> repositories;
    resolver::OverrideTable overrides;
    std::vector<std::string> address_files = default_address_files();

    [[nodiscard]] const std::filesystem::path& workspace_root() const noexcept
    {
        return resolver.workspace_root;
    }
};

/**
 * Defaults for a workspace: no explicit repositories, no overrides, the
 * periphery repository set to kDefaultPeripheryRepository.
 */
[[nodiscard]] VerifierConfig default_config(const std::filesystem::path& workspace_root);

/**
 * Read a configuration object. Missing fields keep their defaults; relative
 * paths (workspace_root, repository paths, temp_root) are taken relative to
 * base_dir.
 * @return Config or ParseError / UnsupportedVersion
 */
[[nodiscard]] evmverify::Result<VerifierConfig> config_from_json(const nlohmann::json& j,
                                                                 const std::filesystem::path& base_dir);

/**
 * Load and schema-check a configuration file.
 */
[[nodiscard]] evmverify::Result<VerifierConfig> load_config(const std::filesystem::path& path,
                                                            const std::filesystem::path& schema_dir);

/**
 * Known repositories: the explicit list first, then the workspace .gitmodules
 * entries whose id is not listed explicitly.
 */
[[nodiscard]] evmverify::Result<std::vector<repository::KnownRepository>>
known_repositories(const VerifierConfig& config);

}  // namespace evmverify::config
