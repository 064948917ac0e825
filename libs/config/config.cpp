/**
 * @file config.cpp
 * @brief verifier_config.v1 loading
 */

#include "evmverify/config.hpp"

#include "evmverify/inputs.hpp"
#include "evmverify/schema_validate.hpp"
#include "evmverify/version.hpp"

#include <format>

namespace evmverify::config {

namespace {

[[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path& base_dir,
                                                 const std::string& value)
{
    std::filesystem::path path(value);
    if (path.is_relative()) {
        path = base_dir / path;
    }
    path = path.lexically_normal();
    // "a/b/.." normalizes to "a/"
    if (!path.has_filename() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

[[nodiscard]] std::chrono::milliseconds seconds_field(const nlohmann::json& j,
                                                      const char* key,
                                                      std::chrono::milliseconds fallback)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) {
        return fallback;
    }
    return std::chrono::seconds(it->get<std::uint64_t>());
}

void read_resolver(const nlohmann::json& j, resolver::ResolverConfig& out)
{
    out.dependency_prefix = j.value("dependency_prefix", out.dependency_prefix);
    if (auto it = j.find("periphery_repository"); it != j.end()) {
        out.periphery_repository =
            it->is_null() ? std::nullopt : std::optional<std::string>(it->get<std::string>());
    }
    out.source_dirs = j.value("source_dirs", out.source_dirs);
    out.source_extension = j.value("source_extension", out.source_extension);
}

void read_timeouts(const nlohmann::json& j, VerifierConfig& out)
{
    out.explorer_timeouts.lookup = seconds_field(j, "explorer_lookup", out.explorer_timeouts.lookup);
    out.explorer_timeouts.contract =
        seconds_field(j, "explorer_contract", out.explorer_timeouts.contract);
    out.rpc_timeout = seconds_field(j, "rpc", out.rpc_timeout);
    out.git.step_timeout = seconds_field(j, "git_step", out.git.step_timeout);
    out.git.fetch_timeout = seconds_field(j, "git_fetch", out.git.fetch_timeout);
    out.forge.timeout = seconds_field(j, "build", out.forge.timeout);
}

[[nodiscard]] evmverify::VoidResult read_repositories(const nlohmann::json& list,
                                                      const std::filesystem::path& workspace_root,
                                                      VerifierConfig& out)
{
    for (const auto& item : list) {
        const auto id = item.at("id").get<std::string>();
        if (repository::find_repository(out.repositories, id) != nullptr) {
            return std::unexpected(
                Error::make("ParseError", std::format("Repository '{}' listed twice", id)));
        }
        out.repositories.push_back(repository::KnownRepository{
            .id = id, .location = resolve_path(workspace_root, item.at("path").get<std::string>())});
    }
    return {};
}

}  // namespace

std::vector<std::string> default_address_files()
{
    return {
        "addresses/999/CoreAddresses.json",      "addresses/999/LensAddresses.json",
        "addresses/999/PeripheryAddresses.json", "addresses/999/EulerSwapAddresses.json",
        "addresses/999/GovernorAddresses.json",  "addresses/999/TokenAddresses.json",
        "addresses/999/BridgeAddresses.json",
    };
}

VerifierConfig default_config(const std::filesystem::path& workspace_root)
{
    VerifierConfig config;
    config.resolver.workspace_root = workspace_root;
    config.resolver.periphery_repository = std::string(kDefaultPeripheryRepository);
    return config;
}

evmverify::Result<VerifierConfig> config_from_json(const nlohmann::json& j,
                                                   const std::filesystem::path& base_dir)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("ParseError", "Config must be a JSON object"));
    }
    auto version = j.find("schema_version");
    if (version == j.end() || !version->is_string() || *version != kConfigSchemaVersion) {
        return std::unexpected(Error::make(
            "UnsupportedVersion",
            std::format("Config must declare schema_version {}", kConfigSchemaVersion)));
    }

    try {
        auto config = default_config(resolve_path(base_dir, j.value("workspace_root", ".")));
        config.explorer_url = j.value("explorer_url", config.explorer_url);
        config.rpc_url = j.value("rpc_url", config.rpc_url);

        if (auto it = j.find("resolver"); it != j.end()) {
            read_resolver(*it, config.resolver);
        }
        if (auto it = j.find("git"); it != j.end()) {
            config.git.git_binary = it->value("binary", config.git.git_binary);
            config.git.url_template = it->value("url_template", config.git.url_template);
            config.git.max_nesting_depth = it->value("max_nesting_depth", config.git.max_nesting_depth);
            if (auto root = it->find("temp_root"); root != it->end() && root->is_string()) {
                config.git.temp_root = resolve_path(base_dir, root->get<std::string>());
            }
        }
        if (auto it = j.find("builder"); it != j.end()) {
            config.forge.binary = it->value("binary", config.forge.binary);
            config.forge.config_file = it->value("config_file", config.forge.config_file);
            config.forge.output_dir = it->value("output_dir", config.forge.output_dir);
        }
        if (auto it = j.find("timeouts"); it != j.end()) {
            read_timeouts(*it, config);
        }
        if (auto it = j.find("repositories"); it != j.end()) {
            if (auto read = read_repositories(*it, config.workspace_root(), config); !read) {
                return std::unexpected(read.error());
            }
        }
        if (auto it = j.find("overrides"); it != j.end()) {
            auto overrides = resolver::OverrideTable::from_json(*it);
            if (!overrides) {
                return std::unexpected(overrides.error());
            }
            config.overrides = std::move(*overrides);
        }
        config.address_files = j.value("address_files", config.address_files);
        return config;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Invalid config: {}", ex.what())));
    }
}

evmverify::Result<VerifierConfig> load_config(const std::filesystem::path& path,
                                              const std::filesystem::path& schema_dir)
{
    auto j = inputs::read_json_file(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    if (auto valid = common::validate_document(*j, schema_dir, kConfigSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    auto base_dir = std::filesystem::absolute(path).parent_path();
    return config_from_json(*j, base_dir);
}

evmverify::Result<std::vector<repository::KnownRepository>>
known_repositories(const VerifierConfig& config)
{
    auto discovered = repository::known_repositories(config.workspace_root());
    if (!discovered) {
        return std::unexpected(discovered.error());
    }
    auto repositories = config.repositories;
    for (auto& repo : *discovered) {
        if (repository::find_repository(repositories, repo.id) == nullptr) {
            repositories.push_back(std::move(repo));
        }
    }
    return repositories;
}

}  // namespace evmverify::config
