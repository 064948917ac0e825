#pragma once

/**
 * @file repository.hpp
 * @brief Workspace repositories: .gitmodules parsing and checkout inspection
 */

#include "evmverify/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evmverify::repository {

/**
 * @brief One [submodule "name"] section of a .gitmodules file
 */
struct Submodule
{
    std::string name;
    std::string path;
    std::string url;
};

/**
 * Parse .gitmodules text. Sections lacking a path or url are dropped.
 * @return Submodules in file order, or ParseError on a malformed line
 */
[[nodiscard]] evmverify::Result<std::vector<Submodule>> parse_gitmodules(std::string_view text);

/**
 * Read <checkout>/.gitmodules; a checkout without one has no submodules.
 */
[[nodiscard]] evmverify::Result<std::vector<Submodule>>
read_gitmodules(const std::filesystem::path& checkout);

/**
 * "https://github.com/org/repo.git" -> "org/repo"
 *
 * Accepts scp-style remotes ("git@github.com:org/repo"). nullopt when the URL has
 * fewer than two path components.
 */
[[nodiscard]] std::optional<std::string> repository_id_from_url(std::string_view url);

/**
 * @brief A top-level checkout in the workspace
 */
struct KnownRepository
{
    std::string id;                  ///< "org/repo"
    std::filesystem::path location;  ///< Absolute checkout directory
};

/**
 * Known repositories declared by <workspace_root>/.gitmodules, in file order.
 * Duplicate repository ids keep their first declaration.
 */
[[nodiscard]] evmverify::Result<std::vector<KnownRepository>>
known_repositories(const std::filesystem::path& workspace_root);

[[nodiscard]] const KnownRepository* find_repository(const std::vector<KnownRepository>& repositories,
                                                     std::string_view id);

/**
 * @brief Read-only questions about a checkout on disk
 */
class CheckoutInspector
{
public:
    virtual ~CheckoutInspector() = default;

    /// Current commit of the checkout (git rev-parse HEAD)
    [[nodiscard]] virtual evmverify::Result<std::string>
    head_revision(const std::filesystem::path& checkout) = 0;
};

}  // namespace evmverify::repository
