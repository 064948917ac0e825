#pragma once

/**
 * @file report.hpp
 * @brief Verification report output and address change detection
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::report {

struct VerificationReport
{
    std::vector<VerificationOutcome> verified;
    std::vector<VerificationOutcome> failed;
    std::vector<std::string> skipped;

    [[nodiscard]] std::size_t total() const noexcept
    {
        return verified.size() + failed.size() + skipped.size();
    }
    [[nodiscard]] bool passed() const noexcept { return failed.empty(); }
};

/**
 * verification_report.v1 document: verified, failed, skipped and summary
 */
[[nodiscard]] nlohmann::json to_json(const VerificationReport& report);

/**
 * Schema-check and write the report in canonical form.
 */
[[nodiscard]] evmverify::VoidResult write_report(const std::filesystem::path& path,
                                                 const VerificationReport& report,
                                                 const std::filesystem::path& schema_dir);

/// Counts and the failed list
void print_summary(const VerificationReport& report, std::FILE* out = stdout);

enum class ChangeKind {
    kAdded,
    kModified,
    kRemoved
};

[[nodiscard]] std::string_view to_string(ChangeKind kind) noexcept;

struct AddressChange
{
    std::string file;
    std::string name;
    std::string address;  ///< Current address (previous one for removals)
    std::optional<std::string> old_address;
    ChangeKind kind = ChangeKind::kAdded;
};

struct ChangeSet
{
    std::vector<AddressChange> added;
    std::vector<AddressChange> modified;
    std::vector<AddressChange> removed;

    [[nodiscard]] std::size_t total() const noexcept
    {
        return added.size() + modified.size() + removed.size();
    }
};

/**
 * Diff two snapshots of address files, keyed by (file, contract name).
 *
 * @param files Address file names relative to both directories; empty means
 *              every *.json file found in either directory
 * @return Changes sorted by file then name
 */
[[nodiscard]] evmverify::Result<ChangeSet> detect_changes(const std::filesystem::path& base_dir,
                                                          const std::filesystem::path& head_dir,
                                                          const std::vector<std::string>& files);

/// Changed-address list (added + modified) accepted by `verify --changed-file`
[[nodiscard]] nlohmann::json to_json(const ChangeSet& changes);

void print_changes(const ChangeSet& changes, std::FILE* out = stderr);

}  // namespace evmverify::report
