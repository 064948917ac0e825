#pragma once

/**
 * @file bytecode_source.hpp
 * @brief On-chain bytecode retrieval with tiered fallback
 */

#include "evmverify/chain.hpp"
#include "evmverify/common.hpp"
#include "evmverify/log.hpp"
#include "evmverify/types.hpp"

#include <string>

namespace evmverify {

class BytecodeSource
{
public:
    virtual ~BytecodeSource() = default;

    /**
     * Fetch the code to compare against for one address.
     * @return Tagged bytecode, or FetchUnavailable when every source failed
     */
    [[nodiscard]] virtual Result<OnChainBytecode> fetch(const std::string& address) = 0;
};

/**
 * @brief Creation transaction, then explorer runtime code, then eth_getCode
 *
 * Creation input is used only for direct deployments; a creation transaction
 * sent to a factory carries the factory's calldata, not the contract's code.
 * Each tier's failure (error, exception, empty payload) is logged at debug
 * level and the next tier is tried.
 */
class TieredBytecodeSource final : public BytecodeSource
{
public:
    TieredBytecodeSource(chain::ExplorerApi& explorer, chain::NodeRpc& node, log::Logger& logger);

    [[nodiscard]] Result<OnChainBytecode> fetch(const std::string& address) override;

private:
    [[nodiscard]] std::optional<OnChainBytecode> from_creation_transaction(const std::string& address);
    [[nodiscard]] std::optional<OnChainBytecode> from_explorer(const std::string& address);
    [[nodiscard]] std::optional<OnChainBytecode> from_node(const std::string& address);

    chain::ExplorerApi& m_explorer;
    chain::NodeRpc& m_node;
    log::Logger& m_logger;
};

}  // namespace evmverify
