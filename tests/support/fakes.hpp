#pragma once

/**
 * @file fakes.hpp
 * @brief In-memory stand-ins for the network, git and builder capabilities
 *
 * All fakes are safe to share between worker threads.
 */

#include "evmverify/build.hpp"
#include "evmverify/chain.hpp"
#include "evmverify/checkout.hpp"
#include "evmverify/repository.hpp"

#include "temp_dir.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::test {

/// Compiled output for one contract, written by FakeBuilder
struct FakeArtifact
{
    std::string name;
    std::string creation_hex;
    std::string runtime_hex;
    bool only_on_targeted_build = false;  ///< Emitted by build_file() only
};

inline void write_artifact(const std::filesystem::path& checkout,
                           const std::string& output_dir,
                           const FakeArtifact& artifact)
{
    const nlohmann::json j = {
        {    "contractName",                                         artifact.name},
        {        "bytecode",    nlohmann::json{{"object", artifact.creation_hex}}},
        {"deployedBytecode",     nlohmann::json{{"object", artifact.runtime_hex}}}
    };
    write_json(checkout / output_dir / (artifact.name + ".sol") / (artifact.name + ".json"), j);
}

class FakeTransport final : public chain::HttpTransport
{
public:
    void respond(const std::string& url, int status, std::string body)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responses[url] = chain::HttpResponse{.status = status, .body = std::move(body)};
    }

    void fail(const std::string& url, std::string code)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures[url] = std::move(code);
    }

    [[nodiscard]] evmverify::Result<chain::HttpResponse>
    get(const std::string& url, std::chrono::milliseconds /*timeout*/) override
    {
        return lookup(url, "");
    }

    [[nodiscard]] evmverify::Result<chain::HttpResponse>
    post_json(const std::string& url, const std::string& body, std::chrono::milliseconds /*timeout*/) override
    {
        return lookup(url, body);
    }

    [[nodiscard]] std::vector<std::string> requested() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requested;
    }

    [[nodiscard]] std::vector<std::string> posted_bodies() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_bodies;
    }

private:
    [[nodiscard]] evmverify::Result<chain::HttpResponse> lookup(const std::string& url,
                                                                const std::string& body)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requested.push_back(url);
        if (!body.empty()) {
            m_bodies.push_back(body);
        }
        if (auto it = m_failures.find(url); it != m_failures.end()) {
            return std::unexpected(Error::make(it->second, "simulated failure for " + url));
        }
        if (auto it = m_responses.find(url); it != m_responses.end()) {
            return it->second;
        }
        return chain::HttpResponse{.status = 404, .body = R"({"message":"Not found"})"};
    }

    mutable std::mutex m_mutex;
    std::map<std::string, chain::HttpResponse> m_responses;
    std::map<std::string, std::string> m_failures;
    std::vector<std::string> m_requested;
    std::vector<std::string> m_bodies;
};

class FakeExplorer final : public chain::ExplorerApi
{
public:
    struct Entry
    {
        std::optional<std::string> creation_hash;
        chain::CreationTransaction transaction;
        std::optional<std::string> runtime;
        std::optional<chain::VerifiedContract> verified;
        bool unreachable = false;  ///< Every call errors
        bool throws = false;       ///< Every call throws
    };

    void set(const std::string& address, Entry entry)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries[address] = std::move(entry);
    }

    [[nodiscard]] evmverify::Result<std::optional<std::string>>
    creation_transaction_hash(const std::string& address) override
    {
        auto entry = record("creation_transaction_hash", address);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        return entry->creation_hash;
    }

    [[nodiscard]] evmverify::Result<chain::CreationTransaction>
    transaction(const std::string& hash) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back("transaction:" + hash);
        for (const auto& [address, entry] : m_entries) {
            if (entry.creation_hash == hash) {
                return entry.transaction;
            }
        }
        return std::unexpected(Error::make("HttpStatus", "unknown transaction " + hash));
    }

    [[nodiscard]] evmverify::Result<std::optional<std::string>>
    deployed_bytecode(const std::string& address) override
    {
        auto entry = record("deployed_bytecode", address);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        return entry->runtime;
    }

    [[nodiscard]] evmverify::Result<std::optional<chain::VerifiedContract>>
    verified_contract(const std::string& address) override
    {
        auto entry = record("verified_contract", address);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        return entry->verified;
    }

    [[nodiscard]] std::vector<std::string> calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

private:
    [[nodiscard]] evmverify::Result<Entry> record(const std::string& method, const std::string& address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back(method + ":" + address);
        auto it = m_entries.find(address);
        if (it == m_entries.end()) {
            return Entry{};
        }
        if (it->second.throws) {
            throw std::runtime_error("explorer exploded");
        }
        if (it->second.unreachable) {
            return std::unexpected(Error::make("HttpTimeout", "explorer timed out"));
        }
        return it->second;
    }

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    std::vector<std::string> m_calls;
};

class FakeNode final : public chain::NodeRpc
{
public:
    void set(const std::string& address, std::string code)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_code[address] = std::move(code);
    }

    [[nodiscard]] evmverify::Result<std::string> get_code(const std::string& address) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_calls;
        if (auto it = m_code.find(address); it != m_code.end()) {
            return it->second;
        }
        return std::string("0x");
    }

    [[nodiscard]] int calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_code;
    int m_calls = 0;
};

/**
 * @brief Checkout provider creating empty directories under a scratch root
 */
class FakeCheckoutProvider final : public checkout::CheckoutProvider
{
public:
    explicit FakeCheckoutProvider(std::filesystem::path root)
        : m_root(std::move(root))
    {}

    void set_head(const std::filesystem::path& checkout, std::string revision)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_heads[checkout.lexically_normal().string()] = std::move(revision);
    }

    void fail_clone(const std::string& repository_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(repository_id);
    }

    [[nodiscard]] evmverify::Result<std::string>
    head_revision(const std::filesystem::path& checkout) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_heads.find(checkout.lexically_normal().string()); it != m_heads.end()) {
            return it->second;
        }
        return std::unexpected(Error::make("ProcessFailed", "not a git checkout"));
    }

    [[nodiscard]] evmverify::Result<CheckoutHandle>
    create_ephemeral(const std::string& repository_id, const std::string& revision) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_clones;
        if (m_failing.contains(repository_id)) {
            return std::unexpected(Error::make("CloneFailed", "simulated clone failure"));
        }
        const auto removal_root = m_root / ("clone-" + std::to_string(m_clones));
        const auto location = removal_root / "repo";
        std::filesystem::create_directories(location);
        write_file(location / "foundry.toml", "[profile.default]\nsrc = \"src\"\n");
        write_file(location / ".evmverify-origin", repository_id + "@" + revision);
        m_created.push_back(removal_root);
        return CheckoutHandle{.location = location, .is_ephemeral = true, .removal_root = removal_root};
    }

    [[nodiscard]] int clones() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_clones;
    }

    [[nodiscard]] std::vector<std::filesystem::path> created() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_created;
    }

private:
    std::filesystem::path m_root;
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_heads;
    std::set<std::string> m_failing;
    std::vector<std::filesystem::path> m_created;
    int m_clones = 0;
};

/**
 * @brief Builder that writes preconfigured artifacts instead of compiling
 *
 * Artifacts are keyed by the repository id recorded in the checkout (the
 * ".evmverify-origin" file written by FakeCheckoutProvider, or set_origin()
 * for persistent checkouts).
 */
class FakeBuilder final : public build::Builder
{
public:
    void add_artifact(const std::string& repository_id, FakeArtifact artifact)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_artifacts[repository_id].push_back(std::move(artifact));
    }

    void fail_repository(const std::string& repository_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(repository_id);
    }

    void throw_for_repository(const std::string& repository_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_throwing.insert(repository_id);
    }

    void throw_on_targeted_build(const std::string& repository_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_throwing_targeted.insert(repository_id);
    }

    [[nodiscard]] evmverify::VoidResult build(const std::filesystem::path& checkout) override
    {
        return run(checkout, std::nullopt);
    }

    [[nodiscard]] evmverify::VoidResult build_file(const std::filesystem::path& checkout,
                                                   const std::string& source_file) override
    {
        return run(checkout, source_file);
    }

    [[nodiscard]] std::string config_file() const override { return "foundry.toml"; }
    [[nodiscard]] std::string output_dir() const override { return "out"; }

    [[nodiscard]] int builds() const { return m_builds.load(); }
    [[nodiscard]] int file_builds() const { return m_file_builds.load(); }

    /// foundry.toml content seen by the most recent build
    [[nodiscard]] std::string last_config() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_config;
    }

private:
    [[nodiscard]] evmverify::VoidResult run(const std::filesystem::path& checkout,
                                            const std::optional<std::string>& source_file)
    {
        (source_file ? m_file_builds : m_builds).fetch_add(1);
        const auto origin = read_file(checkout / ".evmverify-origin");
        const auto repository_id = origin.substr(0, origin.find('@'));

        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_config = read_file(checkout / "foundry.toml");
        if (m_throwing.contains(repository_id) ||
            (source_file && m_throwing_targeted.contains(repository_id))) {
            throw std::runtime_error("builder crashed");
        }
        if (m_failing.contains(repository_id)) {
            return std::unexpected(Error::make("BuildFailed", "compilation failed"));
        }
        for (const auto& artifact : m_artifacts[repository_id]) {
            if (artifact.only_on_targeted_build && !source_file) {
                continue;
            }
            write_artifact(checkout, "out", artifact);
        }
        return {};
    }

    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<FakeArtifact>> m_artifacts;
    std::set<std::string> m_failing;
    std::set<std::string> m_throwing;
    std::set<std::string> m_throwing_targeted;
    std::string m_last_config;
    std::atomic<int> m_builds{0};
    std::atomic<int> m_file_builds{0};
};

/// Marks a directory as a persistent git checkout of repository_id for FakeBuilder
inline void set_origin(const std::filesystem::path& checkout, const std::string& repository_id)
{
    std::filesystem::create_directories(checkout / ".git");
    write_file(checkout / ".evmverify-origin", repository_id + "@persistent");
}

}  // namespace evmverify::test
