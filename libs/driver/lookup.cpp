/**
 * @file lookup.cpp
 * @brief Mapping-file and live target lookups, mapping generation
 */

#include "evmverify/driver.hpp"

#include <format>

namespace evmverify::driver {

MappingLookup::MappingLookup(inputs::ContractMapping mapping)
    : m_mapping(std::move(mapping))
{}

evmverify::Result<BuildTarget> MappingLookup::lookup(const ContractIdentity& identity)
{
    auto it = m_mapping.find(identity.logical_name);
    if (it == m_mapping.end()) {
        return std::unexpected(Error::make("NoMapping", "No mapping"));
    }
    if (it->second.identity.address != identity.address) {
        // The mapping pins an address; a redeployment needs a fresh mapping
        return std::unexpected(Error::make(
            "NoMapping", std::format("No mapping (mapped address is {})",
                                     it->second.identity.address)));
    }
    return it->second.target;
}

MappingGenerator::MappingGenerator(chain::ExplorerApi& explorer,
                                   resolver::SourceResolver& resolver,
                                   log::Logger& logger)
    : m_explorer(explorer)
    , m_resolver(resolver)
    , m_logger(logger)
{}

evmverify::Result<inputs::MappingEntry> MappingGenerator::map_one(const ContractIdentity& identity)
{
    auto contract = m_explorer.verified_contract(identity.address);
    if (!contract) {
        // Overrides need no explorer data
        auto overridden = m_resolver.resolve(identity, resolver::SourceHint{});
        if (overridden && overridden->rule == resolver::ResolutionRule::kOverride) {
            m_logger.debug("{}: explorer unavailable ({}), using override", identity.logical_name,
                           contract.error().message);
            return inputs::MappingEntry{.identity = identity,
                                        .target = std::move(overridden->target),
                                        .verified_at = std::nullopt};
        }
        return std::unexpected(contract.error());
    }

    resolver::SourceHint hint;
    std::optional<std::string> verified_at;
    if (*contract) {
        hint.file_path = (*contract)->file_path;
        hint.compiler_settings = (*contract)->compiler_settings;
        verified_at = (*contract)->verified_at;
    }

    auto resolved = m_resolver.resolve(identity, hint);
    if (!*contract && (!resolved || resolved->rule != resolver::ResolutionRule::kOverride)) {
        return std::unexpected(Error::make("NotVerified", "Not verified on the explorer"));
    }
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    m_logger.debug("{}: {} -> {}@{} ({})", identity.logical_name, resolved->target.artifact_name,
                   resolved->target.repository_id, resolved->target.revision.substr(0, 12),
                   resolver::to_string(resolved->rule));
    return inputs::MappingEntry{.identity = identity,
                                .target = std::move(resolved->target),
                                .verified_at = std::move(verified_at)};
}

MappingGenerator::Result MappingGenerator::generate(const std::vector<ContractIdentity>& identities)
{
    Result result;
    for (const auto& identity : identities) {
        auto entry = map_one(identity);
        if (entry) {
            m_logger.info("  {}: {} -> {}@{}", identity.logical_name, entry->target.artifact_name,
                          entry->target.repository_id, entry->target.revision.substr(0, 12));
            result.mapping.insert_or_assign(identity.logical_name, std::move(*entry));
            continue;
        }
        if (entry.error().code == "NotVerified") {
            m_logger.info("  {}: NOT VERIFIED on explorer", identity.logical_name);
            result.not_verified.push_back(identity.logical_name);
        } else if (entry.error().code == "NoMapping") {
            m_logger.info("  {}: NO REPO FOUND", identity.logical_name);
            result.no_repository.push_back(identity.logical_name);
        } else {
            m_logger.warn("{}: {}", identity.logical_name, entry.error().message);
            result.not_verified.push_back(identity.logical_name);
        }
    }
    return result;
}

LiveLookup::LiveLookup(MappingGenerator& generator)
    : m_generator(generator)
{}

evmverify::Result<BuildTarget> LiveLookup::lookup(const ContractIdentity& identity)
{
    auto entry = m_generator.map_one(identity);
    if (!entry) {
        return std::unexpected(entry.error());
    }
    return std::move(entry->target);
}

}  // namespace evmverify::driver
