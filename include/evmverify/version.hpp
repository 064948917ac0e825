#pragma once

/**
 * @file version.hpp
 * @brief evmverify version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace evmverify {

/// evmverify version string
constexpr const char* kVersion = "0.3.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document schema versions (embedded in all outputs)
constexpr const char* kConfigSchemaVersion = "verifier_config.v1";
constexpr const char* kMappingSchemaVersion = "contract_mapping.v1";
constexpr const char* kReportSchemaVersion = "verification_report.v1";
constexpr const char* kOverridesVersion = "overrides.v1";

}  // namespace evmverify
