#pragma once

/**
 * @file build.hpp
 * @brief Build orchestration: one build per group, configuration patching, restore guards
 */

#include "evmverify/checkout.hpp"
#include "evmverify/common.hpp"
#include "evmverify/log.hpp"
#include "evmverify/repository.hpp"
#include "evmverify/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evmverify::build {

/**
 * Patch build configuration text (foundry.toml) so the build reproduces the
 * deployment's compiler settings.
 *
 * - script and test directories are always disabled
 * - optimizer, optimizer_runs, evm_version, via_ir only when known
 * - solc only when an x.y.z release parses out of the compiler identifier
 *
 * Every existing occurrence of a key is rewritten in place; a missing key is
 * added under [profile.default]. Applying twice yields the same text.
 */
[[nodiscard]] std::string apply_compiler_settings(std::string_view config_text,
                                                  const CompilerSettings& settings);

/**
 * Apply apply_compiler_settings() to a configuration file in place. A missing
 * file is left missing.
 */
[[nodiscard]] evmverify::VoidResult patch_config_file(const std::filesystem::path& file,
                                                      const CompilerSettings& settings);

/**
 * @brief Restores a configuration file to its captured content
 *
 * restore() runs at most once; the destructor calls it if nobody did.
 */
class ConfigBackup
{
public:
    [[nodiscard]] static evmverify::Result<ConfigBackup> capture(std::filesystem::path file);

    ~ConfigBackup();
    ConfigBackup(const ConfigBackup&) = delete;
    ConfigBackup& operator=(const ConfigBackup&) = delete;
    ConfigBackup(ConfigBackup&& other) noexcept;
    ConfigBackup& operator=(ConfigBackup&&) = delete;

    [[nodiscard]] evmverify::VoidResult restore();

private:
    ConfigBackup(std::filesystem::path file, std::optional<std::string> original);

    std::filesystem::path m_file;
    std::optional<std::string> m_original;
    bool m_armed = true;
};

/**
 * @brief Compiles a checkout
 */
class Builder
{
public:
    virtual ~Builder() = default;

    /// Full forced build of the checkout
    [[nodiscard]] virtual evmverify::VoidResult build(const std::filesystem::path& checkout) = 0;

    /// Incremental build of a single source file, relative to the checkout
    [[nodiscard]] virtual evmverify::VoidResult build_file(const std::filesystem::path& checkout,
                                                           const std::string& source_file) = 0;

    /// Build configuration file name, relative to the checkout
    [[nodiscard]] virtual std::string config_file() const = 0;

    /// Artifact output directory, relative to the checkout
    [[nodiscard]] virtual std::string output_dir() const = 0;
};

struct ForgeOptions
{
    std::string binary = "forge";
    std::string config_file = "foundry.toml";
    std::string output_dir = "out";
    std::chrono::milliseconds timeout{std::chrono::seconds(600)};
};

class ForgeBuilder final : public Builder
{
public:
    explicit ForgeBuilder(ForgeOptions options = {});

    [[nodiscard]] evmverify::VoidResult build(const std::filesystem::path& checkout) override;
    [[nodiscard]] evmverify::VoidResult build_file(const std::filesystem::path& checkout,
                                                   const std::string& source_file) override;

    [[nodiscard]] std::string config_file() const override { return m_options.config_file; }
    [[nodiscard]] std::string output_dir() const override { return m_options.output_dir; }

private:
    [[nodiscard]] evmverify::VoidResult run(const std::filesystem::path& checkout,
                                            std::vector<std::string> args);

    ForgeOptions m_options;
};

/**
 * @brief Outcome of building one group
 *
 * A checkout is returned even when the build failed (ephemeral case) so that
 * its removal stays tied to the group's lifetime.
 */
struct BuiltCheckout
{
    checkout::ScopedCheckout checkout;
    bool success = false;
    std::string failure_reason;
};

class BuildOrchestrator
{
public:
    BuildOrchestrator(std::vector<repository::KnownRepository> repositories,
                      checkout::CheckoutProvider& provider,
                      Builder& builder,
                      log::Logger& logger);

    /**
     * Build a group once.
     *
     * Uses the persistent checkout when it sits at the group's revision and its
     * build succeeds; otherwise builds a fresh ephemeral checkout.
     * @return Built checkout, or CloneFailed when no checkout could be created
     */
    [[nodiscard]] evmverify::Result<BuiltCheckout> build(const BuildGroup& group);

    /**
     * Targeted build of one source file inside an already built checkout.
     * Persistent checkouts get the same patch/restore treatment as build().
     */
    [[nodiscard]] evmverify::VoidResult build_file(const checkout::ScopedCheckout& checkout,
                                                   const CompilerSettings& settings,
                                                   const std::string& source_file);

    [[nodiscard]] const Builder& builder() const noexcept { return m_builder; }

private:
    [[nodiscard]] std::optional<BuiltCheckout> try_persistent(const BuildGroup& group);

    [[nodiscard]] evmverify::VoidResult patched_build(const std::filesystem::path& location,
                                                      const CompilerSettings& settings,
                                                      const std::optional<std::string>& source_file);

    std::vector<repository::KnownRepository> m_repositories;
    checkout::CheckoutProvider& m_provider;
    Builder& m_builder;
    log::Logger& m_logger;
    checkout::CheckoutLocks m_locks;
};

}  // namespace evmverify::build
