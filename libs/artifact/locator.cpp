/**
 * @file locator.cpp
 * @brief Build-output search for compiled contract bytecode
 */

#include "evmverify/artifact.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::artifact {

namespace fs = std::filesystem;

namespace {

// bytecode.object / deployedBytecode.object, or "" when absent
[[nodiscard]] std::string bytecode_object(const nlohmann::json& artifact, const char* key)
{
    auto section = artifact.find(key);
    if (section == artifact.end()) {
        return {};
    }
    // Some toolchains store the object directly as a string
    if (section->is_string()) {
        return section->get<std::string>();
    }
    if (!section->is_object()) {
        return {};
    }
    auto object = section->find("object");
    if (object == section->end() || !object->is_string()) {
        return {};
    }
    return object->get<std::string>();
}

[[nodiscard]] bool usable(std::string_view hex)
{
    return !hex.empty() && hex != "0x";
}

[[nodiscard]] std::vector<fs::path> json_files(const fs::path& root)
{
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end;
         it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    std::ranges::sort(files);
    return files;
}

}  // namespace

ArtifactLocator::ArtifactLocator(std::string output_dir)
    : m_output_dir(std::move(output_dir))
{}

evmverify::Result<CompiledArtifact> ArtifactLocator::find(const fs::path& checkout,
                                                          std::string_view artifact_name,
                                                          BytecodeKind kind) const
{
    const fs::path root = checkout / m_output_dir;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(Error::make(
            "ArtifactNotFound", std::format("Artifact not found: {} (no {} directory)",
                                            artifact_name, m_output_dir)));
    }

    for (const auto& file : json_files(root)) {
        nlohmann::json artifact;
        try {
            std::ifstream in(file);
            if (!in) {
                continue;
            }
            artifact = nlohmann::json::parse(in);
        } catch (const std::exception&) {
            continue;
        }
        if (!artifact.is_object()) {
            continue;
        }

        std::string contract_name;
        if (auto it = artifact.find("contractName"); it != artifact.end() && it->is_string()) {
            contract_name = it->get<std::string>();
        }
        if (!common::iequals(contract_name, artifact_name)
            && !common::iequals(file.stem().string(), artifact_name)) {
            continue;
        }

        CompiledArtifact compiled{.creation_hex = bytecode_object(artifact, "bytecode"),
                                  .runtime_hex = bytecode_object(artifact, "deployedBytecode"),
                                  .path = file};
        const auto& wanted =
            kind == BytecodeKind::kRuntime ? compiled.runtime_hex : compiled.creation_hex;
        if (usable(wanted)) {
            return compiled;
        }
    }
    return std::unexpected(
        Error::make("ArtifactNotFound", std::format("Artifact not found: {}", artifact_name)));
}

evmverify::Result<std::string> ArtifactLocator::locate(const fs::path& checkout,
                                                       std::string_view artifact_name,
                                                       BytecodeKind kind) const
{
    auto compiled = find(checkout, artifact_name, kind);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    return kind == BytecodeKind::kRuntime ? compiled->runtime_hex : compiled->creation_hex;
}

}  // namespace evmverify::artifact
