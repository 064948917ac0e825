/**
 * @file verification_driver.cpp
 * @brief Group contracts, build each group once, verify members independently
 */

#include "evmverify/driver.hpp"

#include "evmverify/bytecode.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <map>
#include <optional>
#include <thread>

namespace evmverify::driver {

namespace {

struct Unresolved
{
    ContractIdentity identity;
    Error error;
};

[[nodiscard]] nlohmann::json nullable(const std::optional<std::string>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

[[nodiscard]] nlohmann::json member_details(const GroupMember& member)
{
    const auto& settings = member.target.compiler_settings;
    return nlohmann::json{
        {            "repo",                                          member.target.repository_id},
        {          "commit",                                               member.target.revision},
        {   "artifact_name",                                          member.target.artifact_name},
        {"compiler_version",                                    nullable(settings.compiler_version)},
        {"optimization_runs",
         settings.optimization_runs ? nlohmann::json(*settings.optimization_runs) : nlohmann::json(nullptr)}
    };
}

[[nodiscard]] VerificationOutcome failure(ContractIdentity identity,
                                          ErrorKind kind,
                                          std::string error,
                                          nlohmann::json details)
{
    return VerificationOutcome{.identity = std::move(identity),
                               .verified = false,
                               .error_kind = kind,
                               .error = std::move(error),
                               .details = std::move(details)};
}

[[nodiscard]] std::string join_names(const std::vector<Unresolved>& unresolved)
{
    std::string names;
    for (const auto& entry : unresolved) {
        if (!names.empty()) {
            names += ", ";
        }
        names += entry.identity.logical_name;
    }
    return names;
}

}  // namespace

std::vector<BuildGroup> group_by_build_key(const std::vector<GroupMember>& members)
{
    std::vector<BuildGroup> groups;
    std::map<BuildKey, std::size_t> index;
    for (const auto& member : members) {
        auto key = build_key_of(member.target);
        auto it = index.find(key);
        if (it == index.end()) {
            it = index.emplace(key, groups.size()).first;
            groups.push_back(BuildGroup{.key = std::move(key), .members = {}});
        }
        groups[it->second].members.push_back(member);
    }
    return groups;
}

VerificationDriver::VerificationDriver(TargetLookup& lookup,
                                       build::BuildOrchestrator& orchestrator,
                                       BytecodeSource& source,
                                       const artifact::ArtifactLocator& locator,
                                       log::Logger& logger,
                                       DriverOptions options)
    : m_lookup(lookup)
    , m_orchestrator(orchestrator)
    , m_source(source)
    , m_locator(locator)
    , m_logger(logger)
    , m_options(options)
{}

evmverify::Result<report::VerificationReport>
VerificationDriver::verify_all(const std::vector<ContractIdentity>& identities)
{
    std::vector<GroupMember> members;
    std::vector<Unresolved> unresolved;
    for (const auto& identity : identities) {
        auto target = m_lookup.lookup(identity);
        if (target) {
            members.push_back(GroupMember{.identity = identity, .target = std::move(*target)});
        } else {
            unresolved.push_back(Unresolved{.identity = identity, .error = target.error()});
        }
    }

    if (m_options.strict && !unresolved.empty()) {
        return std::unexpected(Error::make(
            "Unresolved", std::format("{} contract(s) could not be mapped: {}", unresolved.size(),
                                      join_names(unresolved))));
    }

    report::VerificationReport report;
    for (auto& entry : unresolved) {
        if (m_options.skip_unmapped) {
            report.skipped.push_back(entry.identity.logical_name);
            continue;
        }
        m_logger.info("{}: No mapping", entry.identity.logical_name);
        report.failed.push_back(failure(std::move(entry.identity), ErrorKind::kUnresolved,
                                        "No mapping",
                                        nlohmann::json{{"reason", entry.error.message}}));
    }
    if (!report.skipped.empty()) {
        m_logger.info("Skipping {} unmapped contract(s)", report.skipped.size());
    }

    const auto groups = group_by_build_key(members);
    m_logger.info("Verifying {} contract(s) in {} build group(s)", members.size(), groups.size());

    std::vector<std::vector<VerificationOutcome>> results(groups.size());
    const auto workers = std::min<std::size_t>(std::max(1U, m_options.jobs), groups.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < groups.size(); ++i) {
            results[i] = run_group(groups[i], i, groups.size());
        }
    } else {
        std::atomic<std::size_t> next{0};
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                for (auto i = next.fetch_add(1); i < groups.size(); i = next.fetch_add(1)) {
                    results[i] = run_group(groups[i], i, groups.size());
                }
            });
        }
    }

    // Merged in group order so the report does not depend on scheduling
    for (auto& group_results : results) {
        for (auto& outcome : group_results) {
            if (outcome.verified) {
                report.verified.push_back(std::move(outcome));
            } else {
                report.failed.push_back(std::move(outcome));
            }
        }
    }
    return report;
}

std::vector<VerificationOutcome> VerificationDriver::run_group(const BuildGroup& group,
                                                               std::size_t index,
                                                               std::size_t count)
{
    m_logger.info("# [{}/{}] {} ({} contracts)", index + 1, count, describe(group.key),
                  group.members.size());

    std::vector<VerificationOutcome> outcomes;
    outcomes.reserve(group.members.size());

    const auto fail_all = [&](const std::string& reason) {
        outcomes.clear();
        for (const auto& member : group.members) {
            auto details = member_details(member);
            details["reason"] = reason;
            outcomes.push_back(failure(member.identity, ErrorKind::kBuildFailure,
                                       "Build failed: " + group.key.repository_id,
                                       std::move(details)));
        }
        m_logger.info("  Build failed: {}", reason);
    };

    std::optional<build::BuiltCheckout> built;
    try {
        auto result = m_orchestrator.build(group);
        if (!result) {
            fail_all(result.error().message);
            return outcomes;
        }
        built = std::move(*result);
    } catch (const std::exception& ex) {
        fail_all(std::format("Build error: {}", ex.what()));
        return outcomes;
    }
    if (!built->success) {
        fail_all(built->failure_reason);
        return outcomes;
    }

    for (std::size_t i = 0; i < group.members.size(); ++i) {
        const auto& member = group.members[i];
        VerificationOutcome outcome;
        try {
            outcome = verify_member(member, built->checkout);
        } catch (const std::exception& ex) {
            auto details = member_details(member);
            details["reason"] = ex.what();
            outcome = failure(member.identity, ErrorKind::kArtifactNotFound,
                              std::format("Verification error: {}", ex.what()), std::move(details));
        }
        if (outcome.verified) {
            m_logger.info("  [{}/{}] {}... VERIFIED", i + 1, group.members.size(),
                          member.identity.logical_name);
        } else {
            m_logger.info("  [{}/{}] {}... FAILED: {}", i + 1, group.members.size(),
                          member.identity.logical_name, outcome.error.value_or(""));
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

VerificationOutcome VerificationDriver::verify_member(const GroupMember& member,
                                                      const checkout::ScopedCheckout& checkout)
{
    auto details = member_details(member);

    auto on_chain = [&]() -> evmverify::Result<OnChainBytecode> {
        try {
            return m_source.fetch(member.identity.address);
        } catch (const std::exception& ex) {
            return std::unexpected(Error::make("FetchUnavailable", ex.what()));
        }
    }();
    if (!on_chain) {
        details["reason"] = on_chain.error().message;
        return failure(member.identity, ErrorKind::kFetchUnavailable,
                       "Could not fetch deployed bytecode", std::move(details));
    }
    details["bytecode_type"] = std::string(to_string(on_chain->kind));
    details["bytecode_source"] = on_chain->source;

    const auto& target = member.target;
    auto compiled = m_locator.locate(checkout.location(), target.artifact_name, on_chain->kind);
    if (!compiled && target.source_file_path) {
        // Some artifacts are only emitted when their source file is built directly
        auto rebuilt = [&]() -> evmverify::VoidResult {
            try {
                return m_orchestrator.build_file(checkout, target.compiler_settings,
                                                 *target.source_file_path);
            } catch (const std::exception& ex) {
                return std::unexpected(Error::make("BuildFailed", ex.what()));
            }
        }();
        if (!rebuilt) {
            m_logger.debug("{}: targeted build of {} failed: {}", member.identity.logical_name,
                           *target.source_file_path, rebuilt.error().message);
        }
        compiled = m_locator.locate(checkout.location(), target.artifact_name, on_chain->kind);
    }
    if (!compiled) {
        return failure(member.identity, ErrorKind::kArtifactNotFound,
                       "Artifact not found: " + target.artifact_name, std::move(details));
    }

    auto comparison = bytecode::compare_hex(on_chain->hex, *compiled);
    if (!comparison) {
        details["reason"] = comparison.error().message;
        return failure(member.identity, ErrorKind::kBytecodeMismatch, "Bytecode mismatch",
                       std::move(details));
    }
    details.update(bytecode::to_json(comparison->diagnostics));
    if (!comparison->match) {
        return failure(member.identity, ErrorKind::kBytecodeMismatch, "Bytecode mismatch",
                       std::move(details));
    }
    return VerificationOutcome{.identity = member.identity,
                               .verified = true,
                               .error_kind = std::nullopt,
                               .error = std::nullopt,
                               .details = std::move(details)};
}

}  // namespace evmverify::driver
