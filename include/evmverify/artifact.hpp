#pragma once

/**
 * @file artifact.hpp
 * @brief Locate compiled bytecode in a checkout's build output
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace evmverify::artifact {

class ArtifactLocator
{
public:
    explicit ArtifactLocator(std::string output_dir = "out");

    /**
     * Find the artifact for a contract under <checkout>/<output_dir>.
     *
     * Files are visited in sorted path order. A file matches when its
     * contractName or its file stem equals artifact_name, ignoring case, and
     * it carries a non-empty bytecode object other than "0x". Unparseable
     * files are skipped.
     *
     * @return Artifact (creation and runtime hex), or ArtifactNotFound
     */
    [[nodiscard]] evmverify::Result<CompiledArtifact> find(const std::filesystem::path& checkout,
                                                           std::string_view artifact_name,
                                                           BytecodeKind kind) const;

    /// Hex of the requested kind from find()
    [[nodiscard]] evmverify::Result<std::string> locate(const std::filesystem::path& checkout,
                                                        std::string_view artifact_name,
                                                        BytecodeKind kind) const;

private:
    std::string m_output_dir;
};

}  // namespace evmverify::artifact
