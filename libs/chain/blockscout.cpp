/**
 * @file blockscout.cpp
 * @brief Blockscout v2 REST client
 */

#include "evmverify/chain.hpp"

#include <format>

#include <nlohmann/json.hpp>

namespace evmverify::chain {

namespace {

constexpr int kNotFound = 404;

[[nodiscard]] bool is_success(int status)
{
    return status >= 200 && status < 300;
}

[[nodiscard]] evmverify::Result<nlohmann::json> parse_body(const std::string& url,
                                                           const HttpResponse& response)
{
    if (!is_success(response.status)) {
        return std::unexpected(
            Error::make("HttpStatus", std::format("HTTP {} from {}", response.status, url)));
    }
    try {
        auto j = nlohmann::json::parse(response.body);
        if (!j.is_object()) {
            return std::unexpected(
                Error::make("ParseError", "Expected a JSON object from " + url));
        }
        return j;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Invalid JSON from {}: {}", url, ex.what())));
    }
}

[[nodiscard]] std::optional<std::string> string_field(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<bool> bool_field(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

// Blockscout reports optimization_runs as a number, or as a string on older deployments
[[nodiscard]] std::optional<std::uint64_t> runs_field(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// "to" is null for contract creation, an address object ({"hash": ...}) otherwise
[[nodiscard]] std::optional<std::string> destination(const nlohmann::json& tx)
{
    auto it = tx.find("to");
    if (it == tx.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_object()) {
        if (auto hash = string_field(*it, "hash")) {
            return hash;
        }
        return std::string("unknown");
    }
    if (it->is_string()) {
        auto value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return std::string("unknown");
}

}  // namespace

BlockscoutExplorer::BlockscoutExplorer(HttpTransport& transport,
                                       std::string base_url,
                                       ExplorerTimeouts timeouts)
    : m_transport(transport)
    , m_base_url(std::move(base_url))
    , m_timeouts(timeouts)
{
    while (!m_base_url.empty() && m_base_url.back() == '/') {
        m_base_url.pop_back();
    }
}

evmverify::Result<std::optional<std::string>>
BlockscoutExplorer::creation_transaction_hash(const std::string& address)
{
    const std::string url = std::format("{}/addresses/{}", m_base_url, address);
    auto response = m_transport.get(url, m_timeouts.lookup);
    if (!response) {
        return std::unexpected(response.error());
    }
    auto body = parse_body(url, *response);
    if (!body) {
        return std::unexpected(body.error());
    }
    return string_field(*body, "creation_transaction_hash");
}

evmverify::Result<CreationTransaction> BlockscoutExplorer::transaction(const std::string& hash)
{
    const std::string url = std::format("{}/transactions/{}", m_base_url, hash);
    auto response = m_transport.get(url, m_timeouts.lookup);
    if (!response) {
        return std::unexpected(response.error());
    }
    auto body = parse_body(url, *response);
    if (!body) {
        return std::unexpected(body.error());
    }
    return CreationTransaction{.to = destination(*body),
                               .raw_input = string_field(*body, "raw_input")};
}

evmverify::Result<std::optional<std::string>>
BlockscoutExplorer::deployed_bytecode(const std::string& address)
{
    const std::string url = std::format("{}/smart-contracts/{}", m_base_url, address);
    auto response = m_transport.get(url, m_timeouts.contract);
    if (!response) {
        return std::unexpected(response.error());
    }
    auto body = parse_body(url, *response);
    if (!body) {
        return std::unexpected(body.error());
    }
    return string_field(*body, "deployed_bytecode");
}

evmverify::Result<std::optional<VerifiedContract>>
BlockscoutExplorer::verified_contract(const std::string& address)
{
    const std::string url = std::format("{}/smart-contracts/{}", m_base_url, address);
    auto response = m_transport.get(url, m_timeouts.contract);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == kNotFound) {
        return std::optional<VerifiedContract>{};
    }
    auto body = parse_body(url, *response);
    if (!body) {
        return std::unexpected(body.error());
    }
    const auto& j = *body;

    VerifiedContract contract;
    contract.name = string_field(j, "name");
    contract.file_path = string_field(j, "file_path");
    contract.verified_at = string_field(j, "verified_at");
    contract.compiler_settings.compiler_version = string_field(j, "compiler_version");
    contract.compiler_settings.optimization_enabled = bool_field(j, "optimization_enabled");
    contract.compiler_settings.optimization_runs = runs_field(j, "optimization_runs");
    contract.compiler_settings.evm_version = string_field(j, "evm_version");
    if (auto settings = j.find("compiler_settings");
        settings != j.end() && settings->is_object()) {
        contract.compiler_settings.via_ir = bool_field(*settings, "viaIR");
    }

    // Unverified contracts come back as 200 with no compiler information
    if (!contract.compiler_settings.compiler_version && !contract.name) {
        return std::optional<VerifiedContract>{};
    }
    return std::optional<VerifiedContract>{std::move(contract)};
}

}  // namespace evmverify::chain
