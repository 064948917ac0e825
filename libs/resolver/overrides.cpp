/**
 * @file overrides.cpp
 * @brief Static override table loading
 */

#include "evmverify/resolver.hpp"
#include "evmverify/version.hpp"

#include <format>

namespace evmverify::resolver {

namespace {

[[nodiscard]] evmverify::Result<std::string> required_string(const nlohmann::json& j,
                                                             const char* key,
                                                             std::size_t index)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Override entry {}: '{}' must be a non-empty string", index, key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] evmverify::Result<OverrideEntry> parse_entry(const nlohmann::json& j,
                                                           std::size_t index)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make("ParseError", std::format("Override entry {} is not an object", index)));
    }
    auto name = required_string(j, "name", index);
    if (!name) {
        return std::unexpected(name.error());
    }
    auto repo = required_string(j, "repo", index);
    if (!repo) {
        return std::unexpected(repo.error());
    }
    auto artifact = required_string(j, "artifact_name", index);
    if (!artifact) {
        return std::unexpected(artifact.error());
    }
    auto settings = compiler_settings_from_json(j);
    if (!settings) {
        return std::unexpected(Error::make(
            settings.error().code,
            std::format("Override entry {}: {}", index, settings.error().message)));
    }

    OverrideEntry entry;
    entry.logical_name = std::move(*name);
    entry.repository_id = std::move(*repo);
    entry.artifact_name = std::move(*artifact);
    entry.revision = optional_string(j, "commit");
    entry.revision_from = optional_string(j, "revision_from");
    entry.source_file_path = optional_string(j, "file_path");
    entry.compiler_settings = std::move(*settings);

    if (entry.revision.has_value() == entry.revision_from.has_value()) {
        return std::unexpected(Error::make(
            "ParseError",
            std::format("Override entry '{}': exactly one of 'commit' and 'revision_from' is required",
                        entry.logical_name)));
    }
    if (auto address = optional_string(j, "address")) {
        auto canonical = canonical_address(*address);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        entry.address = std::move(*canonical);
    }
    return entry;
}

}  // namespace

OverrideTable::OverrideTable(std::vector<OverrideEntry> entries)
    : m_entries(std::move(entries))
{}

evmverify::Result<OverrideTable> OverrideTable::from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("ParseError", "Overrides must be a JSON object"));
    }
    auto version = j.find("schema_version");
    if (version == j.end() || !version->is_string() || *version != kOverridesVersion) {
        return std::unexpected(Error::make(
            "UnsupportedVersion", std::format("Overrides must declare schema_version {}",
                                              kOverridesVersion)));
    }
    auto entries = j.find("entries");
    if (entries == j.end()) {
        return OverrideTable{};
    }
    if (!entries->is_array()) {
        return std::unexpected(Error::make("ParseError", "Overrides 'entries' must be an array"));
    }

    std::vector<OverrideEntry> parsed;
    parsed.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        auto entry = parse_entry((*entries)[i], i);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        parsed.push_back(std::move(*entry));
    }
    return OverrideTable(std::move(parsed));
}

const OverrideEntry* OverrideTable::find(const ContractIdentity& identity) const
{
    for (const auto& entry : m_entries) {
        if (entry.logical_name != identity.logical_name) {
            continue;
        }
        if (entry.address && *entry.address != identity.address) {
            continue;
        }
        return &entry;
    }
    return nullptr;
}

}  // namespace evmverify::resolver
