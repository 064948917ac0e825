#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for reproducible report files
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - Integers only (no floating point)
 *
 * Two runs over the same inputs must produce byte-identical reports, whatever
 * the job count.
 */

#include "evmverify/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace evmverify::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @param indent -1 for the minimal representation, otherwise pretty-print width
 * @return Canonical byte string or error
 */
[[nodiscard]] evmverify::Result<std::string> canonicalize(const nlohmann::json& j,
                                                          int indent = -1);

/**
 * Validate JSON for canonical form requirements
 * - No floating point numbers
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] evmverify::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace evmverify::canonical
