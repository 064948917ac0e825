/**
 * @file tiered_source.cpp
 * @brief Three-tier on-chain bytecode fetch
 */

#include "evmverify/bytecode_source.hpp"

#include <exception>

namespace evmverify {

namespace {

[[nodiscard]] bool has_code(const std::optional<std::string>& hex)
{
    return hex && !hex->empty() && *hex != "0x" && *hex != "0X";
}

}  // namespace

TieredBytecodeSource::TieredBytecodeSource(chain::ExplorerApi& explorer,
                                           chain::NodeRpc& node,
                                           log::Logger& logger)
    : m_explorer(explorer)
    , m_node(node)
    , m_logger(logger)
{}

std::optional<OnChainBytecode> TieredBytecodeSource::from_creation_transaction(
    const std::string& address)
{
    auto hash = m_explorer.creation_transaction_hash(address);
    if (!hash) {
        m_logger.debug("creation tx lookup failed: {}", hash.error().message);
        return std::nullopt;
    }
    if (!*hash) {
        m_logger.debug("no creation tx recorded for {}", address);
        return std::nullopt;
    }
    auto tx = m_explorer.transaction(**hash);
    if (!tx) {
        m_logger.debug("creation tx fetch failed: {}", tx.error().message);
        return std::nullopt;
    }
    if (tx->to) {
        m_logger.debug("factory deploy via {}, using runtime code", tx->to->substr(0, 14));
        return std::nullopt;
    }
    if (!has_code(tx->raw_input)) {
        m_logger.debug("creation tx has no input");
        return std::nullopt;
    }
    m_logger.debug("fetched creation bytecode ({} chars)", tx->raw_input->size());
    return OnChainBytecode{.hex = *tx->raw_input,
                           .kind = BytecodeKind::kCreation,
                           .source = "creation_tx"};
}

std::optional<OnChainBytecode> TieredBytecodeSource::from_explorer(const std::string& address)
{
    auto code = m_explorer.deployed_bytecode(address);
    if (!code) {
        m_logger.debug("explorer runtime code failed: {}", code.error().message);
        return std::nullopt;
    }
    if (!has_code(*code)) {
        m_logger.debug("explorer has no runtime code for {}", address);
        return std::nullopt;
    }
    m_logger.debug("fetched runtime bytecode ({} chars, explorer)", (*code)->size());
    return OnChainBytecode{.hex = **code, .kind = BytecodeKind::kRuntime, .source = "explorer"};
}

std::optional<OnChainBytecode> TieredBytecodeSource::from_node(const std::string& address)
{
    auto code = m_node.get_code(address);
    if (!code) {
        m_logger.debug("eth_getCode failed: {}", code.error().message);
        return std::nullopt;
    }
    if (!has_code(*code)) {
        m_logger.debug("no code at {}", address);
        return std::nullopt;
    }
    m_logger.debug("fetched runtime bytecode ({} chars, rpc)", code->size());
    return OnChainBytecode{.hex = *code, .kind = BytecodeKind::kRuntime, .source = "rpc"};
}

Result<OnChainBytecode> TieredBytecodeSource::fetch(const std::string& address)
{
    using Tier = std::optional<OnChainBytecode> (TieredBytecodeSource::*)(const std::string&);
    constexpr Tier kTiers[] = {&TieredBytecodeSource::from_creation_transaction,
                               &TieredBytecodeSource::from_explorer,
                               &TieredBytecodeSource::from_node};

    for (Tier tier : kTiers) {
        try {
            if (auto code = (this->*tier)(address)) {
                return *std::move(code);
            }
        } catch (const std::exception& ex) {
            m_logger.debug("bytecode fetch tier threw: {}", ex.what());
        }
    }
    return std::unexpected(
        Error::make("FetchUnavailable", "Could not fetch bytecode for " + address));
}

}  // namespace evmverify
