/**
 * @file source_resolver.cpp
 * @brief Ordered source resolution rules
 */

#include "evmverify/resolver.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace evmverify::resolver {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool directory_exists(const fs::path& path)
{
    std::error_code ec;
    return fs::is_directory(path, ec);
}

// "lib/" + "euler-vault-kit/src/Foo.sol" -> "euler-vault-kit"
[[nodiscard]] std::optional<std::string> dependency_library(std::string_view file_path,
                                                            std::string_view prefix)
{
    const std::string normalized = common::normalize_path(file_path);
    const std::string normalized_prefix = common::normalize_path(prefix);
    if (normalized_prefix.empty()) {
        return std::nullopt;
    }
    const auto components = common::path_components(normalized);
    const auto prefix_components = common::path_components(normalized_prefix);
    if (components.size() <= prefix_components.size()) {
        return std::nullopt;
    }
    if (!std::equal(prefix_components.begin(), prefix_components.end(), components.begin())) {
        return std::nullopt;
    }
    return components[prefix_components.size()];
}

[[nodiscard]] bool is_test_source(const fs::path& relative, std::string_view extension)
{
    for (const auto& part : relative.parent_path()) {
        if (part.string() == "test") {
            return true;
        }
    }
    return relative.filename().string().ends_with(std::format(".t{}", extension));
}

}  // namespace

std::string_view to_string(ResolutionRule rule) noexcept
{
    switch (rule) {
        case ResolutionRule::kOverride:
            return "override";
        case ResolutionRule::kDependencyPath:
            return "dependency_path";
        case ResolutionRule::kNestedDependency:
            return "nested_dependency";
        case ResolutionRule::kSourceSearch:
            return "source_search";
    }
    return "source_search";
}

std::string artifact_name_for(const ContractIdentity& identity, const SourceHint& hint)
{
    if (hint.artifact_name && !hint.artifact_name->empty()) {
        return *hint.artifact_name;
    }
    if (hint.file_path) {
        auto stem = fs::path(common::normalize_path(*hint.file_path)).stem().string();
        if (!stem.empty()) {
            return stem;
        }
    }
    return identity.logical_name;
}

SourceResolver::SourceResolver(ResolverConfig config,
                               std::vector<repository::KnownRepository> repositories,
                               OverrideTable overrides,
                               repository::CheckoutInspector& inspector)
    : m_config(std::move(config))
    , m_repositories(std::move(repositories))
    , m_overrides(std::move(overrides))
    , m_inspector(inspector)
{
    std::ranges::sort(m_repositories, {}, &repository::KnownRepository::id);
}

std::optional<std::string> SourceResolver::revision_of(const fs::path& checkout)
{
    auto revision = m_inspector.head_revision(checkout);
    if (!revision) {
        return std::nullopt;
    }
    return *revision;
}

std::optional<ResolvedTarget> SourceResolver::from_override(const ContractIdentity& identity)
{
    const OverrideEntry* entry = m_overrides.find(identity);
    if (entry == nullptr) {
        return std::nullopt;
    }
    std::optional<std::string> revision = entry->revision;
    if (!revision && entry->revision_from) {
        const fs::path checkout = m_config.workspace_root / *entry->revision_from;
        if (!directory_exists(checkout)) {
            return std::nullopt;
        }
        revision = revision_of(checkout);
    }
    if (!revision) {
        return std::nullopt;
    }
    return ResolvedTarget{
        .target = BuildTarget{.repository_id = entry->repository_id,
                              .revision = std::move(*revision),
                              .artifact_name = entry->artifact_name,
                              .source_file_path = entry->source_file_path,
                              .compiler_settings = entry->compiler_settings},
        .rule = ResolutionRule::kOverride,
    };
}

std::optional<ResolvedTarget> SourceResolver::from_dependency_path(std::string_view library,
                                                                   const BuildTarget& base)
{
    for (const auto& repo : m_repositories) {
        if (repo.location.filename().string() != library || !directory_exists(repo.location)) {
            continue;
        }
        if (auto revision = revision_of(repo.location)) {
            BuildTarget target = base;
            target.repository_id = repo.id;
            target.revision = std::move(*revision);
            return ResolvedTarget{.target = std::move(target),
                                  .rule = ResolutionRule::kDependencyPath};
        }
    }
    return std::nullopt;
}

std::optional<ResolvedTarget> SourceResolver::from_nested_dependency(std::string_view library,
                                                                     const BuildTarget& base)
{
    if (!m_config.periphery_repository) {
        return std::nullopt;
    }
    const auto* periphery = repository::find_repository(m_repositories, *m_config.periphery_repository);
    if (periphery == nullptr || !directory_exists(periphery->location)) {
        return std::nullopt;
    }
    auto submodules = repository::read_gitmodules(periphery->location);
    if (!submodules) {
        return std::nullopt;
    }
    const std::string wanted =
        common::normalize_path(std::format("{}/{}", m_config.dependency_prefix, library));
    auto nested = std::ranges::find(*submodules, wanted, &repository::Submodule::path);
    if (nested == submodules->end() || !directory_exists(periphery->location / nested->path)) {
        return std::nullopt;
    }

    // The dependency compiles inside the periphery, so the periphery is the target
    auto revision = revision_of(periphery->location);
    if (!revision) {
        return std::nullopt;
    }
    BuildTarget target = base;
    target.repository_id = periphery->id;
    target.revision = std::move(*revision);
    return ResolvedTarget{.target = std::move(target), .rule = ResolutionRule::kNestedDependency};
}

std::optional<fs::path> SourceResolver::find_source(const fs::path& checkout,
                                                    std::string_view artifact_name) const
{
    const std::string file_name = std::format("{}{}", artifact_name, m_config.source_extension);
    for (const auto& dir : m_config.source_dirs) {
        const fs::path root = checkout / dir;
        if (!directory_exists(root)) {
            continue;
        }
        std::vector<fs::path> matches;
        std::error_code ec;
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end;
             it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec) || it->path().filename().string() != file_name) {
                continue;
            }
            fs::path relative = it->path().lexically_relative(checkout);
            if (!is_test_source(relative, m_config.source_extension)) {
                matches.push_back(std::move(relative));
            }
        }
        if (!matches.empty()) {
            std::ranges::sort(matches);
            return matches.front();
        }
    }
    return std::nullopt;
}

std::optional<ResolvedTarget> SourceResolver::from_source_search(const BuildTarget& base)
{
    for (const auto& repo : m_repositories) {
        if (!directory_exists(repo.location)) {
            continue;
        }
        auto source = find_source(repo.location, base.artifact_name);
        if (!source) {
            continue;
        }
        auto revision = revision_of(repo.location);
        if (!revision) {
            continue;
        }
        BuildTarget target = base;
        target.repository_id = repo.id;
        target.revision = std::move(*revision);
        if (!target.source_file_path) {
            target.source_file_path = source->generic_string();
        }
        return ResolvedTarget{.target = std::move(target), .rule = ResolutionRule::kSourceSearch};
    }
    return std::nullopt;
}

evmverify::Result<ResolvedTarget> SourceResolver::resolve(const ContractIdentity& identity,
                                                          const SourceHint& hint)
{
    if (auto resolved = from_override(identity)) {
        return *std::move(resolved);
    }

    BuildTarget base;
    base.artifact_name = artifact_name_for(identity, hint);
    if (hint.file_path && !hint.file_path->empty()) {
        base.source_file_path = common::normalize_path(*hint.file_path);
    }
    base.compiler_settings = hint.compiler_settings;

    if (base.source_file_path) {
        if (auto library = dependency_library(*base.source_file_path, m_config.dependency_prefix)) {
            if (auto resolved = from_dependency_path(*library, base)) {
                return *std::move(resolved);
            }
            if (auto resolved = from_nested_dependency(*library, base)) {
                return *std::move(resolved);
            }
        }
    }

    if (auto resolved = from_source_search(base)) {
        return *std::move(resolved);
    }
    return std::unexpected(Error::make(
        "NoMapping",
        std::format("No repository found for {} ({})", identity.logical_name, base.artifact_name)));
}

}  // namespace evmverify::resolver
