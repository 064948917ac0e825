/**
 * @file json_rpc_node.cpp
 * @brief Ethereum JSON-RPC client (eth_getCode)
 */

#include "evmverify/chain.hpp"

#include <format>

#include <nlohmann/json.hpp>

namespace evmverify::chain {

JsonRpcNode::JsonRpcNode(HttpTransport& transport,
                         std::string url,
                         std::chrono::milliseconds timeout)
    : m_transport(transport)
    , m_url(std::move(url))
    , m_timeout(timeout)
{}

evmverify::Result<std::string> JsonRpcNode::get_code(const std::string& address)
{
    const nlohmann::json request = {
        {"jsonrpc",                   "2.0"},
        { "method",           "eth_getCode"},
        { "params", {address, "latest"}},
        {     "id",                       1}
    };
    auto response = m_transport.post_json(m_url, request.dump(), m_timeout);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(
            Error::make("HttpStatus", std::format("HTTP {} from {}", response->status, m_url)));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response->body);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::format("Invalid JSON-RPC response: {}", ex.what())));
    }
    if (!body.is_object()) {
        return std::unexpected(Error::make("ParseError", "JSON-RPC response is not an object"));
    }
    if (auto error = body.find("error"); error != body.end() && !error->is_null()) {
        std::string message = error->is_object() && error->contains("message")
                                      && (*error)["message"].is_string()
                                  ? (*error)["message"].get<std::string>()
                                  : error->dump();
        return std::unexpected(Error::make("RpcError", "eth_getCode: " + message));
    }
    auto result = body.find("result");
    if (result == body.end() || !result->is_string()) {
        return std::string("0x");
    }
    return result->get<std::string>();
}

}  // namespace evmverify::chain
