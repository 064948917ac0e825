#pragma once

/**
 * @file chain.hpp
 * @brief Block-explorer and node clients
 *
 * ExplorerApi and NodeRpc are the capabilities the verification engine needs
 * from the outside world. The concrete clients speak the Blockscout v2 REST API
 * and Ethereum JSON-RPC over an HttpTransport.
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace evmverify::chain {

struct HttpResponse
{
    int status = 0;
    std::string body;
};

class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual evmverify::Result<HttpResponse> get(const std::string& url,
                                                              std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual evmverify::Result<HttpResponse>
    post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief HttpTransport backed by the curl command-line client
 */
class CurlTransport final : public HttpTransport
{
public:
    explicit CurlTransport(std::string curl_binary = "curl");

    [[nodiscard]] evmverify::Result<HttpResponse> get(const std::string& url,
                                                      std::chrono::milliseconds timeout) override;

    [[nodiscard]] evmverify::Result<HttpResponse>
    post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) override;

private:
    std::string m_curl_binary;
};

/**
 * @brief The transaction that created a contract
 *
 * `to` is empty for a direct deployment and holds the factory address when the
 * contract was created by another contract.
 */
struct CreationTransaction
{
    std::optional<std::string> to;
    std::optional<std::string> raw_input;
};

/**
 * @brief Source metadata an explorer recorded when the contract was verified there
 */
struct VerifiedContract
{
    std::optional<std::string> name;
    std::optional<std::string> file_path;
    std::optional<std::string> verified_at;
    CompilerSettings compiler_settings;
};

class ExplorerApi
{
public:
    virtual ~ExplorerApi() = default;

    /// Hash of the creation transaction, nullopt when the explorer does not know it
    [[nodiscard]] virtual evmverify::Result<std::optional<std::string>>
    creation_transaction_hash(const std::string& address) = 0;

    [[nodiscard]] virtual evmverify::Result<CreationTransaction>
    transaction(const std::string& hash) = 0;

    /// Runtime code as recorded by the explorer, nullopt when absent
    [[nodiscard]] virtual evmverify::Result<std::optional<std::string>>
    deployed_bytecode(const std::string& address) = 0;

    /// nullopt when the contract is not verified on the explorer
    [[nodiscard]] virtual evmverify::Result<std::optional<VerifiedContract>>
    verified_contract(const std::string& address) = 0;
};

class NodeRpc
{
public:
    virtual ~NodeRpc() = default;

    /// eth_getCode at "latest"; "0x" for accounts without code
    [[nodiscard]] virtual evmverify::Result<std::string> get_code(const std::string& address) = 0;
};

struct ExplorerTimeouts
{
    std::chrono::milliseconds lookup{std::chrono::seconds(10)};
    std::chrono::milliseconds contract{std::chrono::seconds(30)};
};

/**
 * @brief Blockscout v2 REST client (addresses/, transactions/, smart-contracts/)
 */
class BlockscoutExplorer final : public ExplorerApi
{
public:
    BlockscoutExplorer(HttpTransport& transport, std::string base_url, ExplorerTimeouts timeouts = {});

    [[nodiscard]] evmverify::Result<std::optional<std::string>>
    creation_transaction_hash(const std::string& address) override;

    [[nodiscard]] evmverify::Result<CreationTransaction> transaction(const std::string& hash) override;

    [[nodiscard]] evmverify::Result<std::optional<std::string>>
    deployed_bytecode(const std::string& address) override;

    [[nodiscard]] evmverify::Result<std::optional<VerifiedContract>>
    verified_contract(const std::string& address) override;

private:
    HttpTransport& m_transport;
    std::string m_base_url;
    ExplorerTimeouts m_timeouts;
};

class JsonRpcNode final : public NodeRpc
{
public:
    JsonRpcNode(HttpTransport& transport,
                std::string url,
                std::chrono::milliseconds timeout = std::chrono::seconds(10));

    [[nodiscard]] evmverify::Result<std::string> get_code(const std::string& address) override;

private:
    HttpTransport& m_transport;
    std::string m_url;
    std::chrono::milliseconds m_timeout;
};

}  // namespace evmverify::chain
