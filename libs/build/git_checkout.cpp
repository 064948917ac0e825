/**
 * @file git_checkout.cpp
 * @brief Ephemeral checkouts via shallow fetch of a pinned revision
 *
 * Steps per repository: git init, remote add origin, fetch --depth 1 of the
 * revision, checkout FETCH_HEAD. Nested dependencies listed by
 * `git submodule status` are fetched the same way at their pinned commits,
 * recursing until max_nesting_depth.
 */

#include "evmverify/checkout.hpp"
#include "evmverify/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <system_error>

namespace evmverify::checkout {

namespace fs = std::filesystem;

namespace {

struct PinnedSubmodule
{
    std::string revision;
    std::string path;
};

// " 1a2b... lib/forge-std (v1.9.4)" / "-1a2b... lib/forge-std"
[[nodiscard]] std::vector<PinnedSubmodule> parse_submodule_status(std::string_view output)
{
    std::vector<PinnedSubmodule> pinned;
    std::size_t pos = 0;
    while (pos < output.size()) {
        const auto end = std::min(output.find('\n', pos), output.size());
        std::string_view line = output.substr(pos, end - pos);
        pos = end + 1;

        if (!line.empty() && (line.front() == '-' || line.front() == '+' || line.front() == 'U'
                              || line.front() == ' ')) {
            line.remove_prefix(1);
        }
        line = common::trim(line);
        const auto space = line.find(' ');
        if (line.empty() || space == std::string_view::npos) {
            continue;
        }
        std::string_view path = common::trim(line.substr(space + 1));
        if (const auto paren = path.find(" ("); paren != std::string_view::npos) {
            path = path.substr(0, paren);
        }
        pinned.push_back(PinnedSubmodule{.revision = std::string(line.substr(0, space)),
                                         .path = std::string(path)});
    }
    return pinned;
}

[[nodiscard]] evmverify::Result<fs::path> make_temp_dir(const fs::path& temp_root)
{
    std::error_code ec;
    fs::path root = temp_root.empty() ? fs::temp_directory_path(ec) : temp_root;
    if (ec) {
        return std::unexpected(Error::make("IOError", "No temporary directory: " + ec.message()));
    }
    fs::create_directories(root, ec);
    std::string pattern = (root / "evmverify-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return std::unexpected(Error::make(
            "IOError", std::format("mkdtemp({}): {}", pattern, std::strerror(errno))));
    }
    return fs::path(pattern);
}

}  // namespace

GitCheckoutProvider::GitCheckoutProvider(GitCheckoutOptions options, log::Logger& logger)
    : m_options(std::move(options))
    , m_logger(logger)
{}

std::string GitCheckoutProvider::remote_url(const std::string& repository_id) const
{
    std::string url = m_options.url_template;
    const auto placeholder = url.find("{}");
    if (placeholder == std::string::npos) {
        return url;
    }
    return url.replace(placeholder, 2, repository_id);
}

evmverify::Result<std::string> GitCheckoutProvider::head_revision(const fs::path& checkout)
{
    auto result = process::run_checked(process::ProcessOptions{
        .argv = {m_options.git_binary, "rev-parse", "HEAD"},
        .cwd = checkout,
        .timeout = m_options.step_timeout,
    });
    if (!result) {
        return std::unexpected(result.error());
    }
    std::string revision(common::trim(result->stdout_output));
    if (revision.empty()) {
        return std::unexpected(
            Error::make("GitFailed", "git rev-parse HEAD printed nothing in " + checkout.string()));
    }
    return revision;
}

evmverify::VoidResult GitCheckoutProvider::git(const fs::path& cwd,
                                               std::vector<std::string> args,
                                               std::chrono::milliseconds timeout)
{
    args.insert(args.begin(), m_options.git_binary);
    auto result = process::run_checked(process::ProcessOptions{
        .argv = std::move(args),
        .cwd = cwd,
        .timeout = timeout,
    });
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

evmverify::VoidResult GitCheckoutProvider::fetch_revision(const fs::path& dir,
                                                          const std::string& url,
                                                          const std::string& revision)
{
    if (auto r = git(dir, {"init", "-q"}, m_options.step_timeout); !r) {
        return r;
    }
    if (auto r = git(dir, {"remote", "add", "origin", url}, m_options.step_timeout); !r) {
        return r;
    }
    if (auto r = git(dir, {"fetch", "--depth", "1", "origin", revision}, m_options.fetch_timeout);
        !r) {
        return r;
    }
    return git(dir, {"checkout", "-q", "FETCH_HEAD"}, m_options.step_timeout);
}

void GitCheckoutProvider::init_nested(const fs::path& checkout, int depth)
{
    if (depth >= m_options.max_nesting_depth) {
        m_logger.debug("nesting limit reached at {}", checkout.string());
        return;
    }
    auto declared = repository::read_gitmodules(checkout);
    if (!declared) {
        m_logger.debug("unreadable .gitmodules in {}: {}", checkout.string(), declared.error().message);
        return;
    }
    if (declared->empty()) {
        return;
    }
    auto status = process::run_checked(process::ProcessOptions{
        .argv = {m_options.git_binary, "submodule", "status"},
        .cwd = checkout,
        .timeout = m_options.step_timeout,
    });
    if (!status) {
        m_logger.debug("git submodule status failed: {}", status.error().message);
        return;
    }

    for (const auto& pinned : parse_submodule_status(status->stdout_output)) {
        const std::string path = common::normalize_path(pinned.path);
        auto entry = std::ranges::find(*declared, path, &repository::Submodule::path);
        if (entry == declared->end()) {
            m_logger.debug("no url for nested dependency {}", path);
            continue;
        }
        const fs::path dir = checkout / path;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            m_logger.debug("cannot create {}: {}", dir.string(), ec.message());
            continue;
        }
        m_logger.debug("fetching {} @ {}", path, pinned.revision.substr(0, 12));
        if (auto fetched = fetch_revision(dir, entry->url, pinned.revision); !fetched) {
            m_logger.debug("nested dependency {} skipped: {}", path, fetched.error().message);
            continue;
        }
        init_nested(dir, depth + 1);
    }
}

evmverify::Result<CheckoutHandle> GitCheckoutProvider::create_ephemeral(const std::string& repository_id,
                                                                        const std::string& revision)
{
    auto root = make_temp_dir(m_options.temp_root);
    if (!root) {
        return std::unexpected(root.error());
    }
    CheckoutHandle handle{.location = *root / "repo", .is_ephemeral = true, .removal_root = *root};

    auto fail = [&handle](const Error& error) -> evmverify::Result<CheckoutHandle> {
        std::error_code ec;
        fs::remove_all(handle.removal_root, ec);
        return std::unexpected(Error::make("CloneFailed", error.message));
    };

    std::error_code ec;
    fs::create_directories(handle.location, ec);
    if (ec) {
        return fail(Error::make("IOError", ec.message()));
    }

    m_logger.debug("cloning {} @ {}", repository_id, revision.substr(0, 12));
    if (auto fetched = fetch_revision(handle.location, remote_url(repository_id), revision);
        !fetched) {
        return fail(fetched.error());
    }
    init_nested(handle.location, 0);
    return handle;
}

}  // namespace evmverify::checkout
