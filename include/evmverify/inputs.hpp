#pragma once

/**
 * @file inputs.hpp
 * @brief Address files, changed-address files and the contract mapping
 */

#include "evmverify/common.hpp"
#include "evmverify/log.hpp"
#include "evmverify/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::inputs {

[[nodiscard]] evmverify::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write JSON in canonical form (sorted keys, no floats) followed by a newline.
 * @param indent -1 for compact output, otherwise pretty-print width
 */
[[nodiscard]] evmverify::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                              const nlohmann::json& payload,
                                                              int indent = 2);

/**
 * Load {name: address}. Zero addresses and non-string values are ignored;
 * malformed address strings are skipped with a warning.
 */
[[nodiscard]] evmverify::Result<std::vector<ContractIdentity>>
load_address_file(const std::filesystem::path& path, log::Logger& logger = log::quiet());

/**
 * Load several address files relative to root, in order. Missing files are
 * skipped.
 */
[[nodiscard]] evmverify::Result<std::vector<ContractIdentity>>
load_address_files(const std::filesystem::path& root,
                   const std::vector<std::string>& files,
                   log::Logger& logger = log::quiet());

/**
 * Load a changed-address list: [{name, address, ...}]. Entries without a
 * string name and address make the file invalid; malformed addresses are
 * skipped with a warning.
 */
[[nodiscard]] evmverify::Result<std::vector<ContractIdentity>>
load_changed_file(const std::filesystem::path& path, log::Logger& logger = log::quiet());

/**
 * @brief One mapped contract
 */
struct MappingEntry
{
    ContractIdentity identity;
    BuildTarget target;
    std::optional<std::string> verified_at;
};

/// Keyed by logical name
using ContractMapping = std::map<std::string, MappingEntry>;

/**
 * Read a mapping document.
 *
 * Accepts {"schema_version": "contract_mapping.v1", "contracts": {...}} and
 * the bare {name: entry} form.
 */
[[nodiscard]] evmverify::Result<ContractMapping> mapping_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const ContractMapping& mapping);

/**
 * Load and schema-check a mapping file.
 * @param schema_dir Directory holding contract_mapping.v1.schema.json
 */
[[nodiscard]] evmverify::Result<ContractMapping> load_mapping(const std::filesystem::path& path,
                                                              const std::filesystem::path& schema_dir);

[[nodiscard]] evmverify::VoidResult write_mapping(const std::filesystem::path& path,
                                                  const ContractMapping& mapping,
                                                  const std::filesystem::path& schema_dir);

}  // namespace evmverify::inputs
