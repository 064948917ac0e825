#pragma once

/**
 * @file resolver.hpp
 * @brief Source resolution: deployed contract -> repository, revision and artifact
 *
 * Rules are tried in order and the first match wins:
 *   1. static override table
 *   2. reported file path under the dependency prefix naming a known checkout
 *   3. a nested dependency of the periphery checkout (the periphery is built)
 *   4. source-tree search over known checkouts, ordered by repository id
 */

#include "evmverify/common.hpp"
#include "evmverify/repository.hpp"
#include "evmverify/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::resolver {

/**
 * @brief A fully specified target for a contract automatic discovery cannot find
 *
 * Exactly one of revision / revision_from is set. revision_from names a
 * checkout (relative to the workspace root) whose current revision is used.
 */
struct OverrideEntry
{
    std::string logical_name;
    std::optional<std::string> address;  ///< When set, must match as well
    std::string repository_id;
    std::optional<std::string> revision;
    std::optional<std::string> revision_from;
    std::string artifact_name;
    std::optional<std::string> source_file_path;
    CompilerSettings compiler_settings;
};

/**
 * @brief Immutable override table, loaded once at start-up
 */
class OverrideTable
{
public:
    OverrideTable() = default;

    /**
     * Load an "overrides.v1" document: {"schema_version": ..., "entries": [...]}.
     * @return Table or ParseError / UnsupportedVersion
     */
    [[nodiscard]] static evmverify::Result<OverrideTable> from_json(const nlohmann::json& j);

    [[nodiscard]] const OverrideEntry* find(const ContractIdentity& identity) const;

    [[nodiscard]] const std::vector<OverrideEntry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

private:
    explicit OverrideTable(std::vector<OverrideEntry> entries);

    std::vector<OverrideEntry> m_entries;
};

struct ResolverConfig
{
    std::filesystem::path workspace_root;
    std::string dependency_prefix = "lib/";
    std::optional<std::string> periphery_repository;
    std::vector<std::string> source_dirs = {"src", "contracts"};
    std::string source_extension = ".sol";
};

enum class ResolutionRule {
    kOverride,
    kDependencyPath,
    kNestedDependency,
    kSourceSearch
};

[[nodiscard]] std::string_view to_string(ResolutionRule rule) noexcept;

/**
 * @brief What the explorer (or the caller) knows about a deployment
 */
struct SourceHint
{
    std::optional<std::string> file_path;      ///< Source path as reported by the explorer
    std::optional<std::string> artifact_name;  ///< Defaults to the file stem, then the logical name
    CompilerSettings compiler_settings;
};

struct ResolvedTarget
{
    BuildTarget target;
    ResolutionRule rule = ResolutionRule::kSourceSearch;
};

/**
 * Artifact name for a hint: explicit name, else file stem, else logical name.
 */
[[nodiscard]] std::string artifact_name_for(const ContractIdentity& identity, const SourceHint& hint);

class SourceResolver
{
public:
    SourceResolver(ResolverConfig config,
                   std::vector<repository::KnownRepository> repositories,
                   OverrideTable overrides,
                   repository::CheckoutInspector& inspector);

    /**
     * Resolve a deployed contract to a build target.
     * @return Target and the rule that produced it, or NoMapping
     */
    [[nodiscard]] evmverify::Result<ResolvedTarget> resolve(const ContractIdentity& identity,
                                                            const SourceHint& hint);

    [[nodiscard]] const std::vector<repository::KnownRepository>& repositories() const noexcept
    {
        return m_repositories;
    }

private:
    [[nodiscard]] std::optional<ResolvedTarget> from_override(const ContractIdentity& identity);
    [[nodiscard]] std::optional<ResolvedTarget> from_dependency_path(std::string_view library,
                                                                     const BuildTarget& base);
    [[nodiscard]] std::optional<ResolvedTarget> from_nested_dependency(std::string_view library,
                                                                       const BuildTarget& base);
    [[nodiscard]] std::optional<ResolvedTarget> from_source_search(const BuildTarget& base);

    [[nodiscard]] std::optional<std::filesystem::path>
    find_source(const std::filesystem::path& checkout, std::string_view artifact_name) const;

    [[nodiscard]] std::optional<std::string> revision_of(const std::filesystem::path& checkout);

    ResolverConfig m_config;
    std::vector<repository::KnownRepository> m_repositories;  ///< Sorted by id
    OverrideTable m_overrides;
    repository::CheckoutInspector& m_inspector;
};

}  // namespace evmverify::resolver
