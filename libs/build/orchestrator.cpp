/**
 * @file orchestrator.cpp
 * @brief Builds each group once, preferring a matching persistent checkout
 */

#include "evmverify/build.hpp"

#include <format>
#include <system_error>

namespace evmverify::build {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool is_git_checkout(const fs::path& location)
{
    std::error_code ec;
    return fs::is_directory(location, ec) && fs::exists(location / ".git", ec);
}

}  // namespace

BuildOrchestrator::BuildOrchestrator(std::vector<repository::KnownRepository> repositories,
                                     checkout::CheckoutProvider& provider,
                                     Builder& builder,
                                     log::Logger& logger)
    : m_repositories(std::move(repositories))
    , m_provider(provider)
    , m_builder(builder)
    , m_logger(logger)
{}

evmverify::VoidResult BuildOrchestrator::patched_build(const fs::path& location,
                                                       const CompilerSettings& settings,
                                                       const std::optional<std::string>& source_file)
{
    const fs::path config = location / m_builder.config_file();
    auto backup = ConfigBackup::capture(config);
    if (!backup) {
        return std::unexpected(backup.error());
    }
    if (auto patched = patch_config_file(config, settings); !patched) {
        return patched;
    }
    auto built = source_file ? m_builder.build_file(location, *source_file)
                             : m_builder.build(location);
    if (auto restored = backup->restore(); !restored) {
        m_logger.warn("could not restore {}: {}", config.string(), restored.error().message);
    }
    return built;
}

std::optional<BuiltCheckout> BuildOrchestrator::try_persistent(const BuildGroup& group)
{
    const auto* repo = repository::find_repository(m_repositories, group.key.repository_id);
    if (repo == nullptr || !is_git_checkout(repo->location)) {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(m_locks.for_location(repo->location));
    auto current = m_provider.head_revision(repo->location);
    if (!current) {
        m_logger.debug("cannot read revision of {}: {}", repo->location.string(),
                       current.error().message);
        return std::nullopt;
    }
    if (*current != group.key.revision) {
        m_logger.debug("local {} is at {}, need {}", repo->id, current->substr(0, 12),
                       group.key.revision.substr(0, 12));
        return std::nullopt;
    }

    m_logger.debug("using local checkout {}", repo->location.string());
    auto built = patched_build(repo->location, group.key.compiler_settings, std::nullopt);
    if (!built) {
        m_logger.debug("local build failed, cloning fresh: {}", built.error().message);
        return std::nullopt;
    }
    return BuiltCheckout{
        .checkout = checkout::ScopedCheckout::persistent(repo->location, std::move(lock)),
        .success = true,
        .failure_reason = {},
    };
}

evmverify::Result<BuiltCheckout> BuildOrchestrator::build(const BuildGroup& group)
{
    if (auto persistent = try_persistent(group)) {
        return *std::move(persistent);
    }

    auto handle = m_provider.create_ephemeral(group.key.repository_id, group.key.revision);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    BuiltCheckout result{.checkout = checkout::ScopedCheckout::ephemeral(std::move(*handle)),
                         .success = false,
                         .failure_reason = {}};

    const fs::path location = result.checkout.location();
    if (auto patched = patch_config_file(location / m_builder.config_file(),
                                         group.key.compiler_settings);
        !patched) {
        result.failure_reason = patched.error().message;
        return result;
    }

    m_logger.debug("building {}", describe(group.key));
    auto built = m_builder.build(location);
    if (!built) {
        result.failure_reason = built.error().message;
        return result;
    }
    result.success = true;
    return result;
}

evmverify::VoidResult BuildOrchestrator::build_file(const checkout::ScopedCheckout& checkout,
                                                    const CompilerSettings& settings,
                                                    const std::string& source_file)
{
    m_logger.debug("compiling {}", source_file);
    if (checkout.is_ephemeral()) {
        return m_builder.build_file(checkout.location(), source_file);
    }
    return patched_build(checkout.location(), settings, source_file);
}

}  // namespace evmverify::build
