#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of configuration, mapping and report documents
 */

#include "evmverify/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace evmverify::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] evmverify::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

/**
 * Resolve "<schema_dir>/<schema_version>.schema.json" and validate against it.
 */
[[nodiscard]] evmverify::VoidResult validate_document(const nlohmann::json& j,
                                                      const std::filesystem::path& schema_dir,
                                                      std::string_view schema_version);

}  // namespace evmverify::common
