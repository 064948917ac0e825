#pragma once

/**
 * @file driver.hpp
 * @brief Verification driver: resolve, group, build once per group, verify each member
 */

#include "evmverify/artifact.hpp"
#include "evmverify/build.hpp"
#include "evmverify/bytecode_source.hpp"
#include "evmverify/chain.hpp"
#include "evmverify/common.hpp"
#include "evmverify/inputs.hpp"
#include "evmverify/log.hpp"
#include "evmverify/report.hpp"
#include "evmverify/resolver.hpp"
#include "evmverify/types.hpp"

#include <string>
#include <vector>

namespace evmverify::driver {

/**
 * @brief Maps a deployed contract to its build target
 */
class TargetLookup
{
public:
    virtual ~TargetLookup() = default;

    /// NoMapping (or a lookup failure) when the contract cannot be mapped
    [[nodiscard]] virtual evmverify::Result<BuildTarget> lookup(const ContractIdentity& identity) = 0;
};

/**
 * @brief Lookup in a contract mapping file, by logical name
 */
class MappingLookup final : public TargetLookup
{
public:
    explicit MappingLookup(inputs::ContractMapping mapping);

    [[nodiscard]] evmverify::Result<BuildTarget> lookup(const ContractIdentity& identity) override;

private:
    inputs::ContractMapping m_mapping;
};

/**
 * @brief Builds mapping entries from explorer metadata and the source resolver
 */
class MappingGenerator
{
public:
    MappingGenerator(chain::ExplorerApi& explorer,
                     resolver::SourceResolver& resolver,
                     log::Logger& logger);

    /**
     * Map one contract.
     *
     * Contracts not verified on the explorer resolve only through the
     * override table.
     * @return Entry, or NotVerified / NoMapping / an explorer error
     */
    [[nodiscard]] evmverify::Result<inputs::MappingEntry> map_one(const ContractIdentity& identity);

    struct Result
    {
        inputs::ContractMapping mapping;
        std::vector<std::string> not_verified;
        std::vector<std::string> no_repository;
    };

    /// Map every contract; failures are listed, never fatal
    [[nodiscard]] Result generate(const std::vector<ContractIdentity>& identities);

private:
    chain::ExplorerApi& m_explorer;
    resolver::SourceResolver& m_resolver;
    log::Logger& m_logger;
};

/**
 * @brief Lookup resolving each contract on the fly
 */
class LiveLookup final : public TargetLookup
{
public:
    explicit LiveLookup(MappingGenerator& generator);

    [[nodiscard]] evmverify::Result<BuildTarget> lookup(const ContractIdentity& identity) override;

private:
    MappingGenerator& m_generator;
};

struct DriverOptions
{
    bool skip_unmapped = false;  ///< Unmapped contracts go to the skipped list
    bool strict = false;         ///< Any unmapped contract aborts before building
    unsigned jobs = 1;           ///< Groups built in parallel
};

/**
 * Group resolved contracts by build key, in first-seen order.
 */
[[nodiscard]] std::vector<BuildGroup> group_by_build_key(const std::vector<GroupMember>& members);

class VerificationDriver
{
public:
    VerificationDriver(TargetLookup& lookup,
                       build::BuildOrchestrator& orchestrator,
                       BytecodeSource& source,
                       const artifact::ArtifactLocator& locator,
                       log::Logger& logger,
                       DriverOptions options = {});

    /**
     * Verify every contract.
     *
     * Each group is built once; each member is fetched, located and compared
     * independently, so one member's failure never affects another. The report
     * is identical for any job count.
     * @return Report, or Unresolved in strict mode
     */
    [[nodiscard]] evmverify::Result<report::VerificationReport>
    verify_all(const std::vector<ContractIdentity>& identities);

private:
    [[nodiscard]] std::vector<VerificationOutcome> run_group(const BuildGroup& group,
                                                             std::size_t index,
                                                             std::size_t count);
    [[nodiscard]] VerificationOutcome verify_member(const GroupMember& member,
                                                    const checkout::ScopedCheckout& checkout);

    TargetLookup& m_lookup;
    build::BuildOrchestrator& m_orchestrator;
    BytecodeSource& m_source;
    const artifact::ArtifactLocator& m_locator;
    log::Logger& m_logger;
    DriverOptions m_options;
};

}  // namespace evmverify::driver
