/**
 * @file types.cpp
 * @brief Data model helpers and JSON conversion
 */

#include "evmverify/types.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace evmverify {

namespace {

constexpr std::size_t kAddressHexDigits = 40;
constexpr std::size_t kShortRevision = 12;

[[nodiscard]] bool is_hex_digit(char c)
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

template <typename T>
[[nodiscard]] Result<std::optional<T>> optional_field(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::optional<T>{};
    }
    try {
        return std::optional<T>{j.at(key).get<T>()};
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("InvalidField", std::format("Invalid value for '{}': {}", key, ex.what())));
    }
}

}  // namespace

Result<std::string> canonical_address(std::string_view address)
{
    auto trimmed = common::trim(address);
    const bool has_prefix = trimmed.starts_with("0x") || trimmed.starts_with("0X");
    if (trimmed.size() != kAddressHexDigits + 2 || !has_prefix
        || !std::ranges::all_of(trimmed.substr(2), is_hex_digit)) {
        return std::unexpected(
            Error::make("InvalidAddress", std::format("Not a 20-byte hex address: '{}'", address)));
    }
    return common::to_lower(trimmed);
}

bool is_zero_address(std::string_view address)
{
    auto lower = common::to_lower(common::trim(address));
    return lower == "0x" + std::string(kAddressHexDigits, '0');
}

std::optional<std::string> parse_compiler_release(std::string_view compiler_version)
{
    // First run of digit.digit.digit, optionally preceded by 'v'
    for (std::size_t start = 0; start < compiler_version.size(); ++start) {
        if (std::isdigit(static_cast<unsigned char>(compiler_version[start])) == 0) {
            continue;
        }
        std::size_t pos = start;
        int groups = 0;
        while (groups < 3) {
            const std::size_t digits_begin = pos;
            while (pos < compiler_version.size()
                   && std::isdigit(static_cast<unsigned char>(compiler_version[pos])) != 0) {
                ++pos;
            }
            if (pos == digits_begin) {
                break;
            }
            ++groups;
            if (groups < 3) {
                if (pos >= compiler_version.size() || compiler_version[pos] != '.') {
                    break;
                }
                ++pos;
            }
        }
        if (groups == 3) {
            return std::string(compiler_version.substr(start, pos - start));
        }
    }
    return std::nullopt;
}

BuildKey build_key_of(const BuildTarget& target)
{
    return BuildKey{.repository_id = target.repository_id,
                    .revision = target.revision,
                    .compiler_settings = target.compiler_settings};
}

std::string describe(const BuildKey& key)
{
    return std::format("{}@{}", key.repository_id, key.revision.substr(0, kShortRevision));
}

std::string_view to_string(BytecodeKind kind) noexcept
{
    switch (kind) {
        case BytecodeKind::kCreation:
            return "creation";
        case BytecodeKind::kRuntime:
            return "runtime";
    }
    return "runtime";
}

std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::kUnresolved:
            return "unresolved";
        case ErrorKind::kBuildFailure:
            return "build_failure";
        case ErrorKind::kFetchUnavailable:
            return "fetch_unavailable";
        case ErrorKind::kArtifactNotFound:
            return "artifact_not_found";
        case ErrorKind::kBytecodeMismatch:
            return "bytecode_mismatch";
    }
    return "bytecode_mismatch";
}

nlohmann::json to_json(const CompilerSettings& settings)
{
    nlohmann::json j = nlohmann::json::object();
    j["compiler_version"] = settings.compiler_version ? nlohmann::json(*settings.compiler_version)
                                                      : nlohmann::json(nullptr);
    j["optimization_enabled"] = settings.optimization_enabled
                                    ? nlohmann::json(*settings.optimization_enabled)
                                    : nlohmann::json(nullptr);
    j["optimization_runs"] = settings.optimization_runs
                                 ? nlohmann::json(*settings.optimization_runs)
                                 : nlohmann::json(nullptr);
    j["evm_version"] = settings.evm_version ? nlohmann::json(*settings.evm_version)
                                            : nlohmann::json(nullptr);
    j["via_ir"] = settings.via_ir ? nlohmann::json(*settings.via_ir) : nlohmann::json(nullptr);
    return j;
}

Result<CompilerSettings> compiler_settings_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidField", "Compiler settings must be an object"));
    }
    auto compiler_version = optional_field<std::string>(j, "compiler_version");
    if (!compiler_version) {
        return std::unexpected(compiler_version.error());
    }
    auto optimization_enabled = optional_field<bool>(j, "optimization_enabled");
    if (!optimization_enabled) {
        return std::unexpected(optimization_enabled.error());
    }
    auto optimization_runs = optional_field<std::uint64_t>(j, "optimization_runs");
    if (!optimization_runs) {
        return std::unexpected(optimization_runs.error());
    }
    auto evm_version = optional_field<std::string>(j, "evm_version");
    if (!evm_version) {
        return std::unexpected(evm_version.error());
    }
    auto via_ir = optional_field<bool>(j, "via_ir");
    if (!via_ir) {
        return std::unexpected(via_ir.error());
    }
    // Explorers report "" for unknown EVM versions
    if (*evm_version && (*evm_version)->empty()) {
        evm_version->reset();
    }
    return CompilerSettings{.compiler_version = std::move(*compiler_version),
                            .optimization_enabled = *optimization_enabled,
                            .optimization_runs = *optimization_runs,
                            .evm_version = std::move(*evm_version),
                            .via_ir = *via_ir};
}

nlohmann::json to_json(const VerificationOutcome& outcome)
{
    nlohmann::json j = {
        {    "name", outcome.identity.logical_name},
        { "address",      outcome.identity.address},
        {"verified",              outcome.verified},
        { "details",               outcome.details}
    };
    j["error"] = outcome.error ? nlohmann::json(*outcome.error) : nlohmann::json(nullptr);
    j["error_kind"] = outcome.error_kind ? nlohmann::json(std::string(to_string(*outcome.error_kind)))
                                         : nlohmann::json(nullptr);
    return j;
}

}  // namespace evmverify
