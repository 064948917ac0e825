/**
 * @file inputs.cpp
 * @brief Address lists and contract mapping documents
 */

#include "evmverify/inputs.hpp"

#include "evmverify/canonical_json.hpp"
#include "evmverify/schema_validate.hpp"
#include "evmverify/version.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace evmverify::inputs {

namespace {

[[nodiscard]] evmverify::Result<std::string> required_string(const nlohmann::json& entry,
                                                             const char* key,
                                                             std::string_view name)
{
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Mapping entry '{}': '{}' must be a string", name, key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& entry, const char* key)
{
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] nlohmann::json nullable(const std::optional<std::string>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

[[nodiscard]] evmverify::Result<MappingEntry> entry_from_json(const std::string& name,
                                                              const nlohmann::json& entry)
{
    if (!entry.is_object()) {
        return std::unexpected(
            Error::make("ParseError", std::format("Mapping entry '{}' is not an object", name)));
    }
    auto address = required_string(entry, "address", name);
    if (!address) {
        return std::unexpected(address.error());
    }
    auto canonical = canonical_address(*address);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    auto repo = required_string(entry, "repo", name);
    if (!repo) {
        return std::unexpected(repo.error());
    }
    auto commit = required_string(entry, "commit", name);
    if (!commit) {
        return std::unexpected(commit.error());
    }
    auto settings = compiler_settings_from_json(entry);
    if (!settings) {
        return std::unexpected(Error::make(
            settings.error().code, std::format("Mapping entry '{}': {}", name, settings.error().message)));
    }

    MappingEntry mapped;
    mapped.identity = ContractIdentity{.logical_name = name, .address = std::move(*canonical)};
    mapped.target.repository_id = std::move(*repo);
    mapped.target.revision = std::move(*commit);
    mapped.target.artifact_name = optional_string(entry, "artifact_name").value_or(name);
    mapped.target.source_file_path = optional_string(entry, "file_path");
    mapped.target.compiler_settings = std::move(*settings);
    mapped.verified_at = optional_string(entry, "verified_at");
    return mapped;
}

[[nodiscard]] nlohmann::json entry_to_json(const MappingEntry& entry)
{
    nlohmann::json j = to_json(entry.target.compiler_settings);
    j["address"] = entry.identity.address;
    j["repo"] = entry.target.repository_id;
    j["commit"] = entry.target.revision;
    j["artifact_name"] = entry.target.artifact_name;
    j["file_path"] = nullable(entry.target.source_file_path);
    j["verified_at"] = nullable(entry.verified_at);
    return j;
}

[[nodiscard]] nlohmann::json wrap_mapping(const nlohmann::json& contracts)
{
    return nlohmann::json{
        {"schema_version", kMappingSchemaVersion},
        {     "contracts",            contracts}
    };
}

}  // namespace

evmverify::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

evmverify::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                const nlohmann::json& payload,
                                                int indent)
{
    auto canonical = canonical::canonicalize(payload, indent);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to create directory " + path.parent_path().string() + ": "
                               + ec.message()));
        }
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

evmverify::Result<std::vector<ContractIdentity>> load_address_file(const std::filesystem::path& path,
                                                                   log::Logger& logger)
{
    auto j = read_json_file(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    if (!j->is_object()) {
        return std::unexpected(
            Error::make("ParseError", "Address file must be a JSON object: " + path.string()));
    }

    std::vector<ContractIdentity> identities;
    for (const auto& [name, value] : j->items()) {
        if (!value.is_string()) {
            continue;
        }
        const auto& raw = value.get_ref<const std::string&>();
        if (raw.empty() || is_zero_address(raw)) {
            continue;
        }
        auto address = canonical_address(raw);
        if (!address) {
            logger.warn("{}: skipping {}: {}", path.string(), name, address.error().message);
            continue;
        }
        identities.push_back(ContractIdentity{.logical_name = name, .address = std::move(*address)});
    }
    return identities;
}

evmverify::Result<std::vector<ContractIdentity>>
load_address_files(const std::filesystem::path& root,
                   const std::vector<std::string>& files,
                   log::Logger& logger)
{
    std::vector<ContractIdentity> identities;
    for (const auto& file : files) {
        const auto path = root / file;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        auto loaded = load_address_file(path, logger);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        identities.insert(identities.end(), loaded->begin(), loaded->end());
    }
    return identities;
}

evmverify::Result<std::vector<ContractIdentity>> load_changed_file(const std::filesystem::path& path,
                                                                   log::Logger& logger)
{
    auto j = read_json_file(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    if (!j->is_array()) {
        return std::unexpected(
            Error::make("ParseError", "Changed-address file must be a JSON array: " + path.string()));
    }

    std::vector<ContractIdentity> identities;
    for (std::size_t i = 0; i < j->size(); ++i) {
        const auto& item = (*j)[i];
        if (!item.is_object() || !item.contains("name") || !item.contains("address")
            || !item["name"].is_string() || !item["address"].is_string()) {
            return std::unexpected(Error::make(
                "ParseError", std::format("{}: entry {} needs string name and address",
                                          path.string(), i)));
        }
        auto address = canonical_address(item["address"].get<std::string>());
        if (!address) {
            logger.warn("{}: skipping entry {}: {}", path.string(), i, address.error().message);
            continue;
        }
        identities.push_back(ContractIdentity{.logical_name = item["name"].get<std::string>(),
                                              .address = std::move(*address)});
    }
    return identities;
}

evmverify::Result<ContractMapping> mapping_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("ParseError", "Mapping must be a JSON object"));
    }
    const nlohmann::json* contracts = &j;
    if (auto version = j.find("schema_version"); version != j.end()) {
        if (!version->is_string() || *version != kMappingSchemaVersion) {
            return std::unexpected(Error::make(
                "UnsupportedVersion",
                std::format("Mapping schema_version must be {}", kMappingSchemaVersion)));
        }
        auto it = j.find("contracts");
        if (it == j.end() || !it->is_object()) {
            return std::unexpected(Error::make("ParseError", "Mapping 'contracts' must be an object"));
        }
        contracts = &*it;
    }

    ContractMapping mapping;
    for (const auto& [name, entry] : contracts->items()) {
        auto parsed = entry_from_json(name, entry);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        mapping.emplace(name, std::move(*parsed));
    }
    return mapping;
}

nlohmann::json to_json(const ContractMapping& mapping)
{
    nlohmann::json contracts = nlohmann::json::object();
    for (const auto& [name, entry] : mapping) {
        contracts[name] = entry_to_json(entry);
    }
    return wrap_mapping(contracts);
}

evmverify::Result<ContractMapping> load_mapping(const std::filesystem::path& path,
                                                const std::filesystem::path& schema_dir)
{
    auto j = read_json_file(path);
    if (!j) {
        return std::unexpected(j.error());
    }
    // The bare form is checked against the same schema once wrapped
    const nlohmann::json document =
        j->is_object() && !j->contains("schema_version") ? wrap_mapping(*j) : *j;
    if (auto valid = common::validate_document(document, schema_dir, kMappingSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    return mapping_from_json(document);
}

evmverify::VoidResult write_mapping(const std::filesystem::path& path,
                                    const ContractMapping& mapping,
                                    const std::filesystem::path& schema_dir)
{
    const nlohmann::json document = to_json(mapping);
    if (auto valid = common::validate_document(document, schema_dir, kMappingSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    return write_canonical_json_file(path, document);
}

}  // namespace evmverify::inputs
