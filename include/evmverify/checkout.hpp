#pragma once

/**
 * @file checkout.hpp
 * @brief Checkout provisioning and lifetime management
 */

#include "evmverify/common.hpp"
#include "evmverify/log.hpp"
#include "evmverify/repository.hpp"
#include "evmverify/types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace evmverify::checkout {

/**
 * @brief Reads revisions of existing checkouts and creates fresh ones
 */
class CheckoutProvider : public repository::CheckoutInspector
{
public:
    /**
     * Create a private checkout of repository_id at revision, nested
     * dependencies included.
     * @return Handle with is_ephemeral = true, or CloneFailed
     */
    [[nodiscard]] virtual evmverify::Result<CheckoutHandle>
    create_ephemeral(const std::string& repository_id, const std::string& revision) = 0;
};

struct GitCheckoutOptions
{
    std::string git_binary = "git";
    std::string url_template = "https://github.com/{}.git";  ///< {} is replaced by "org/repo"
    std::filesystem::path temp_root;                         ///< Empty: system temp directory
    std::chrono::milliseconds step_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds fetch_timeout{std::chrono::seconds(120)};
    int max_nesting_depth = 3;
};

/**
 * @brief CheckoutProvider using shallow git fetches of pinned revisions
 */
class GitCheckoutProvider final : public CheckoutProvider
{
public:
    GitCheckoutProvider(GitCheckoutOptions options, log::Logger& logger);

    [[nodiscard]] evmverify::Result<std::string>
    head_revision(const std::filesystem::path& checkout) override;

    [[nodiscard]] evmverify::Result<CheckoutHandle>
    create_ephemeral(const std::string& repository_id, const std::string& revision) override;

    /// Remote URL for a repository id
    [[nodiscard]] std::string remote_url(const std::string& repository_id) const;

private:
    [[nodiscard]] evmverify::VoidResult git(const std::filesystem::path& cwd,
                                            std::vector<std::string> args,
                                            std::chrono::milliseconds timeout);
    [[nodiscard]] evmverify::VoidResult fetch_revision(const std::filesystem::path& dir,
                                                       const std::string& url,
                                                       const std::string& revision);
    void init_nested(const std::filesystem::path& checkout, int depth);

    GitCheckoutOptions m_options;
    log::Logger& m_logger;
};

/**
 * @brief Per-checkout mutexes for persistent checkouts shared between workers
 */
class CheckoutLocks
{
public:
    [[nodiscard]] std::mutex& for_location(const std::filesystem::path& location);

private:
    std::mutex m_guard;
    std::map<std::string, std::unique_ptr<std::mutex>> m_locks;
};

/**
 * @brief Owns a checkout for the duration of one build group
 *
 * Ephemeral checkouts are deleted (removal_root) on destruction. Persistent
 * checkouts keep their lock until destruction.
 */
class ScopedCheckout
{
public:
    ScopedCheckout() = default;
    ~ScopedCheckout();

    ScopedCheckout(const ScopedCheckout&) = delete;
    ScopedCheckout& operator=(const ScopedCheckout&) = delete;
    ScopedCheckout(ScopedCheckout&& other) noexcept;
    ScopedCheckout& operator=(ScopedCheckout&& other) noexcept;

    [[nodiscard]] static ScopedCheckout persistent(std::filesystem::path location,
                                                   std::unique_lock<std::mutex> lock);
    [[nodiscard]] static ScopedCheckout ephemeral(CheckoutHandle handle);

    [[nodiscard]] const CheckoutHandle& handle() const noexcept { return m_handle; }
    [[nodiscard]] const std::filesystem::path& location() const noexcept { return m_handle.location; }
    [[nodiscard]] bool is_ephemeral() const noexcept { return m_handle.is_ephemeral; }

    /// Remove (ephemeral) or unlock (persistent) now
    void release() noexcept;

private:
    CheckoutHandle m_handle;
    std::unique_lock<std::mutex> m_lock;
    bool m_active = false;
};

}  // namespace evmverify::checkout
