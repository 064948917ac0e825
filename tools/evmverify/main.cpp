/**
 * @file main.cpp
 * @brief evmverify CLI entry point
 *
 * Commands:
 *   verify    - Rebuild deployed contracts from source and compare bytecode
 *   map       - Resolve deployed contracts to repositories and write a mapping
 *   changes   - Diff two address-file snapshots
 *   compare   - Compare two bytecode strings
 *   version   - Show version information
 */

#include "evmverify/require_cpp23.hpp"

#include "evmverify/artifact.hpp"
#include "evmverify/build.hpp"
#include "evmverify/bytecode.hpp"
#include "evmverify/bytecode_source.hpp"
#include "evmverify/canonical_json.hpp"
#include "evmverify/chain.hpp"
#include "evmverify/checkout.hpp"
#include "evmverify/common.hpp"
#include "evmverify/config.hpp"
#include "evmverify/driver.hpp"
#include "evmverify/inputs.hpp"
#include "evmverify/log.hpp"
#include "evmverify/report.hpp"
#include "evmverify/resolver.hpp"
#include "evmverify/version.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_version()
{
    std::println("evmverify {} ({})", evmverify::kVersion, evmverify::kBuildId);
    std::println("  config:  {}", evmverify::kConfigSchemaVersion);
    std::println("  mapping: {}", evmverify::kMappingSchemaVersion);
    std::println("  report:  {}", evmverify::kReportSchemaVersion);
}

void print_help()
{
    std::print(R"(evmverify - Reproducible bytecode verification for deployed EVM contracts

Usage: evmverify <command> [options]

Commands:
  verify      Rebuild contracts from source and compare against on-chain bytecode
  map         Resolve contracts to source repositories and write a mapping file
  changes     Detect new and modified addresses between two snapshots
  compare     Compare two bytecode strings and print diagnostics
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'evmverify <command> --help' for command-specific options.
)");
}

void print_verify_help()
{
    std::print(R"(Usage: evmverify verify [options]

Rebuild contracts from source and compare against on-chain bytecode

Contract selection (exactly one):
  --all                     Every address in the configured address files
  --file FILE               Address file ({{"Name": "0x..."}})
  --changed-file FILE       Changed-address list written by 'evmverify changes'
  --address ADDR            A single address (with --name)

Options:
  --name NAME               Logical name for --address (default: the address)
  --mapping FILE            Contract mapping file; resolves live when omitted
  --skip-unmapped           List unmapped contracts as skipped instead of failed
  --strict                  Abort before building when any contract is unmapped
  --output FILE, -o         Write the verification report to FILE
  --jobs N, -j N            Build groups in parallel (default: 1)
  --config FILE             verifier_config.v1 file (default: built-in defaults)
  --workspace DIR           Workspace root (overrides the config)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug output (fetch tiers, clone steps, targeted builds)
  --help, -h                Show this help

Exit status is 0 only when no contract failed.
)");
}

void print_map_help()
{
    std::print(R"(Usage: evmverify map [options]

Resolve contracts to source repositories using explorer metadata

Options:
  --file FILE               Address file (repeatable; default: configured address files)
  --output FILE, -o         Output file (default: contract_mapping.json)
  --config FILE             verifier_config.v1 file (default: built-in defaults)
  --workspace DIR           Workspace root (overrides the config)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Debug output
  --help, -h                Show this help

Output:
  contract_mapping.v1 document
)");
}

void print_changes_help()
{
    std::print(R"(Usage: evmverify changes [options]

Detect new and modified addresses between two snapshots of the address files

Options:
  --base DIR                Directory holding the previous address files (required)
  --head DIR                Directory holding the current address files (default: .)
  --file NAME               Address file relative to both directories (repeatable;
                            default: every *.json file)
  --output FILE, -o         Output file (default: changed_addresses.json)
  --help, -h                Show this help

Output:
  New and modified entries, for 'evmverify verify --changed-file'.
  Nothing is written when no address was added or modified.
)");
}

void print_compare_help()
{
    std::print(R"(Usage: evmverify compare [options] <on-chain> <compiled>

Compare two bytecode strings; each argument is hex or a file holding hex

Options:
  --help, -h                Show this help

Exit status is 0 when the bytecode matches.
)");
}

struct CommonOptions
{
    std::optional<std::string> config;
    std::optional<std::string> workspace;
    std::string schema_dir;
    bool verbose;
};

struct VerifyOptions
{
    CommonOptions common;
    bool all;
    std::optional<std::string> file;
    std::optional<std::string> changed_file;
    std::optional<std::string> address;
    std::optional<std::string> name;
    std::optional<std::string> mapping;
    bool skip_unmapped;
    bool strict;
    std::optional<std::string> output;
    int jobs;
    bool show_help;
};

struct MapOptions
{
    CommonOptions common;
    std::vector<std::string> files;
    std::string output;
    bool show_help;
};

struct ChangesOptions
{
    std::string base;
    std::string head;
    std::vector<std::string> files;
    std::string output;
    bool show_help;
};

struct CompareOptions
{
    std::vector<std::string> operands;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> evmverify::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            evmverify::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] evmverify::Result<int> parse_jobs_value(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed < 1) {
        return std::unexpected(
            evmverify::Error::make("InvalidArgument",
                                   std::string("Invalid --jobs value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] auto set_common_option(std::string_view arg,
                                     // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                     std::span<char*> args,
                                     std::size_t idx,
                                     CommonOptions& options,
                                     bool& skip_next) -> evmverify::Result<bool>
{
    if (arg == "--verbose") {
        options.verbose = true;
        return evmverify::Result<bool>{true};
    }
    if (arg != "--config" && arg != "--workspace" && arg != "--schema-dir") {
        return evmverify::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (arg == "--config") {
        options.config = *value;
    } else if (arg == "--workspace") {
        options.workspace = *value;
    } else {
        options.schema_dir = *value;
    }
    skip_next = true;
    return evmverify::Result<bool>{true};
}

[[nodiscard]] auto set_verify_option(std::string_view arg,
                                     // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                     std::span<char*> args,
                                     std::size_t idx,
                                     VerifyOptions& options,
                                     bool& skip_next) -> evmverify::Result<bool>
{
    if (arg == "--all") {
        options.all = true;
        return evmverify::Result<bool>{true};
    }
    if (arg == "--skip-unmapped") {
        options.skip_unmapped = true;
        return evmverify::Result<bool>{true};
    }
    if (arg == "--strict") {
        options.strict = true;
        return evmverify::Result<bool>{true};
    }

    std::optional<std::string>* target = nullptr;
    if (arg == "--file") {
        target = &options.file;
    } else if (arg == "--changed-file") {
        target = &options.changed_file;
    } else if (arg == "--address") {
        target = &options.address;
    } else if (arg == "--name") {
        target = &options.name;
    } else if (arg == "--mapping") {
        target = &options.mapping;
    } else if (arg == "--output" || arg == "-o") {
        target = &options.output;
    } else if (arg != "--jobs" && arg != "-j") {
        return evmverify::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;
    if (target != nullptr) {
        *target = *value;
        return evmverify::Result<bool>{true};
    }
    auto parsed = parse_jobs_value(*value);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    options.jobs = *parsed;
    return evmverify::Result<bool>{true};
}

[[nodiscard]] evmverify::Result<VerifyOptions> parse_verify_args(std::span<char*> args)
{
    VerifyOptions options{.common = {.config = std::nullopt,
                                     .workspace = std::nullopt,
                                     .schema_dir = "schemas",
                                     .verbose = false},
                          .all = false,
                          .file = std::nullopt,
                          .changed_file = std::nullopt,
                          .address = std::nullopt,
                          .name = std::nullopt,
                          .mapping = std::nullopt,
                          .skip_unmapped = false,
                          .strict = false,
                          .output = std::nullopt,
                          .jobs = 1,
                          .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_common_option(arg, args, idx, options.common, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        handled = set_verify_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(evmverify::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] evmverify::Result<MapOptions> parse_map_args(std::span<char*> args)
{
    MapOptions options{.common = {.config = std::nullopt,
                                  .workspace = std::nullopt,
                                  .schema_dir = "schemas",
                                  .verbose = false},
                       .files = {},
                       .output = "contract_mapping.json",
                       .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_common_option(arg, args, idx, options.common, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg == "--file") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.files.push_back(*value);
            skip_next = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(evmverify::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] evmverify::Result<ChangesOptions> parse_changes_args(std::span<char*> args)
{
    ChangesOptions options{.base = std::string{},
                           .head = ".",
                           .files = {},
                           .output = "changed_addresses.json",
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--base") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.base = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--head") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.head = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--file") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.files.push_back(*value);
            skip_next = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(evmverify::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] evmverify::Result<CompareOptions> parse_compare_args(std::span<char*> args)
{
    CompareOptions options{.operands = {}, .show_help = false};
    for (const char* arg_ptr : args) {
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        options.operands.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] evmverify::Result<evmverify::config::VerifierConfig>
load_verifier_config(const CommonOptions& options)
{
    evmverify::config::VerifierConfig config;
    if (options.config) {
        auto loaded = evmverify::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    } else {
        config = evmverify::config::default_config(std::filesystem::current_path());
    }
    if (options.workspace) {
        config.resolver.workspace_root = std::filesystem::absolute(*options.workspace);
    }
    return config;
}

[[nodiscard]] evmverify::Result<std::vector<evmverify::ContractIdentity>>
collect_identities(const VerifyOptions& options,
                   const evmverify::config::VerifierConfig& config,
                   evmverify::log::Logger& logger)
{
    if (options.file) {
        return evmverify::inputs::load_address_file(*options.file, logger);
    }
    if (options.changed_file) {
        return evmverify::inputs::load_changed_file(*options.changed_file, logger);
    }
    if (options.address) {
        auto address = evmverify::canonical_address(*options.address);
        if (!address) {
            return std::unexpected(address.error());
        }
        return std::vector<evmverify::ContractIdentity>{evmverify::ContractIdentity{
            .logical_name = options.name.value_or(*address), .address = *address}};
    }
    return evmverify::inputs::load_address_files(config.workspace_root(), config.address_files,
                                                 logger);
}

/// Read a hex operand: the contents of a file when one exists at that path
[[nodiscard]] evmverify::Result<std::string> read_hex_operand(const std::string& operand)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(operand, ec)) {
        return operand;
    }
    std::ifstream in(operand);
    if (!in) {
        return std::unexpected(
            evmverify::Error::make("IOError", "Failed to open file: " + operand));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return std::string(evmverify::common::trim(content.str()));
}

[[nodiscard]] int run_verify(const VerifyOptions& options)
{
    auto config = load_verifier_config(options.common);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    evmverify::log::Logger logger(options.common.verbose ? evmverify::log::Level::kDebug
                                                         : evmverify::log::Level::kInfo);
    auto identities = collect_identities(options, *config, logger);
    if (!identities) {
        std::println(stderr, "Error: {}", identities.error().message);
        return 1;
    }
    if (identities->empty()) {
        std::println("[verify] No contracts to verify");
        return 0;
    }

    auto repositories = evmverify::config::known_repositories(*config);
    if (!repositories) {
        std::println(stderr, "Error: {}", repositories.error().message);
        return 1;
    }

    evmverify::chain::CurlTransport transport;
    evmverify::chain::BlockscoutExplorer explorer(transport, config->explorer_url,
                                                  config->explorer_timeouts);
    evmverify::chain::JsonRpcNode node(transport, config->rpc_url, config->rpc_timeout);
    evmverify::checkout::GitCheckoutProvider provider(config->git, logger);
    evmverify::build::ForgeBuilder builder(config->forge);
    evmverify::build::BuildOrchestrator orchestrator(*repositories, provider, builder, logger);
    evmverify::TieredBytecodeSource source(explorer, node, logger);
    const evmverify::artifact::ArtifactLocator locator(config->forge.output_dir);

    evmverify::resolver::SourceResolver resolver(config->resolver, *repositories, config->overrides,
                                                 provider);
    evmverify::driver::MappingGenerator generator(explorer, resolver, logger);
    std::optional<evmverify::driver::MappingLookup> mapping_lookup;
    std::optional<evmverify::driver::LiveLookup> live_lookup;
    evmverify::driver::TargetLookup* lookup = nullptr;
    if (options.mapping) {
        auto mapping = evmverify::inputs::load_mapping(*options.mapping, options.common.schema_dir);
        if (!mapping) {
            std::println(stderr, "Error: {}", mapping.error().message);
            return 1;
        }
        lookup = &mapping_lookup.emplace(std::move(*mapping));
    } else {
        lookup = &live_lookup.emplace(generator);
    }

    std::println("[verify] {} contract(s)", identities->size());
    evmverify::driver::VerificationDriver driver(
        *lookup, orchestrator, source, locator, logger,
        evmverify::driver::DriverOptions{.skip_unmapped = options.skip_unmapped,
                                         .strict = options.strict,
                                         .jobs = static_cast<unsigned>(options.jobs)});
    auto report = driver.verify_all(*identities);
    if (!report) {
        std::println(stderr, "Error: {}", report.error().message);
        return 1;
    }

    evmverify::report::print_summary(*report);
    if (options.output) {
        if (auto write =
                evmverify::report::write_report(*options.output, *report, options.common.schema_dir);
            !write) {
            std::println(stderr, "Error: failed to write report: {}", write.error().message);
            return 1;
        }
        std::println("[verify] Wrote {}", *options.output);
    }
    return report->passed() ? 0 : 1;
}

[[nodiscard]] int run_map(const MapOptions& options)
{
    auto config = load_verifier_config(options.common);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    evmverify::log::Logger logger(options.common.verbose ? evmverify::log::Level::kDebug
                                                         : evmverify::log::Level::kInfo);
    auto identities =
        options.files.empty()
            ? evmverify::inputs::load_address_files(config->workspace_root(), config->address_files,
                                                    logger)
            : evmverify::inputs::load_address_files(std::filesystem::current_path(), options.files,
                                                    logger);
    if (!identities) {
        std::println(stderr, "Error: {}", identities.error().message);
        return 1;
    }
    // Override entries with a pinned address are mapped even when no address file lists them
    for (const auto& entry : config->overrides.entries()) {
        if (!entry.address) {
            continue;
        }
        const bool listed = std::ranges::any_of(*identities, [&](const auto& identity) {
            return identity.logical_name == entry.logical_name;
        });
        if (!listed) {
            identities->push_back(evmverify::ContractIdentity{.logical_name = entry.logical_name,
                                                              .address = *entry.address});
        }
    }

    auto repositories = evmverify::config::known_repositories(*config);
    if (!repositories) {
        std::println(stderr, "Error: {}", repositories.error().message);
        return 1;
    }
    std::println("[map] {} contract(s), {} known repositories", identities->size(),
                 repositories->size());

    evmverify::chain::CurlTransport transport;
    evmverify::chain::BlockscoutExplorer explorer(transport, config->explorer_url,
                                                  config->explorer_timeouts);
    evmverify::checkout::GitCheckoutProvider provider(config->git, logger);
    evmverify::resolver::SourceResolver resolver(config->resolver, *repositories, config->overrides,
                                                 provider);
    evmverify::driver::MappingGenerator generator(explorer, resolver, logger);
    auto result = generator.generate(*identities);

    if (auto write = evmverify::inputs::write_mapping(options.output, result.mapping,
                                                      options.common.schema_dir);
        !write) {
        std::println(stderr, "Error: failed to write mapping: {}", write.error().message);
        return 1;
    }
    std::println("[map] Wrote {}", options.output);
    std::println("  mapped: {}", result.mapping.size());
    if (!result.not_verified.empty()) {
        std::println("  not verified on explorer ({}):", result.not_verified.size());
        for (const auto& name : result.not_verified) {
            std::println("    - {}", name);
        }
    }
    if (!result.no_repository.empty()) {
        std::println("  no repository found ({}):", result.no_repository.size());
        for (const auto& name : result.no_repository) {
            std::println("    - {}", name);
        }
    }
    return 0;
}

[[nodiscard]] int run_changes(const ChangesOptions& options)
{
    auto changes = evmverify::report::detect_changes(options.base, options.head, options.files);
    if (!changes) {
        std::println(stderr, "Error: {}", changes.error().message);
        return 1;
    }
    evmverify::report::print_changes(*changes);

    const auto list = evmverify::report::to_json(*changes);
    if (list.empty()) {
        return 0;
    }
    if (auto write = evmverify::inputs::write_canonical_json_file(options.output, list); !write) {
        std::println(stderr, "Error: {}", write.error().message);
        return 1;
    }
    std::println("[changes] Wrote {} ({} entries)", options.output, list.size());
    return 0;
}

[[nodiscard]] int run_compare(const CompareOptions& options)
{
    auto on_chain = read_hex_operand(options.operands[0]);
    if (!on_chain) {
        std::println(stderr, "Error: {}", on_chain.error().message);
        return 1;
    }
    auto compiled = read_hex_operand(options.operands[1]);
    if (!compiled) {
        std::println(stderr, "Error: {}", compiled.error().message);
        return 1;
    }
    auto comparison = evmverify::bytecode::compare_hex(*on_chain, *compiled);
    if (!comparison) {
        std::println(stderr, "Error: {}", comparison.error().message);
        return 1;
    }
    auto text = evmverify::canonical::canonicalize(
        evmverify::bytecode::to_json(comparison->diagnostics), 2);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    std::println("[compare] {}", comparison->match ? "MATCH" : "MISMATCH");
    std::println("{}", *text);
    return comparison->match ? 0 : 1;
}

int cmd_verify(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_verify_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_verify_help();
        return 0;
    }
    const int selected = (options->all ? 1 : 0) + (options->file ? 1 : 0)
                         + (options->changed_file ? 1 : 0) + (options->address ? 1 : 0);
    if (selected != 1) {
        std::println(stderr,
                     "Error: exactly one of --all, --file, --changed-file, --address is required");
        print_verify_help();
        return 1;
    }
    if (options->name && !options->address) {
        std::println(stderr, "Error: --name is only valid with --address");
        return 1;
    }
    return run_verify(*options);
}

int cmd_map(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_map_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_map_help();
        return 0;
    }
    return run_map(*options);
}

int cmd_changes(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_changes_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_changes_help();
        return 0;
    }
    if (options->base.empty()) {
        std::println(stderr, "Error: --base is required");
        print_changes_help();
        return 1;
    }
    return run_changes(*options);
}

int cmd_compare(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_compare_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_compare_help();
        return 0;
    }
    if (options->operands.size() != 2) {
        std::println(stderr, "Error: compare takes exactly two bytecode arguments");
        print_compare_help();
        return 1;
    }
    return run_compare(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "verify") {
            return cmd_verify(sub_argc, sub_argv);
        }
        if (cmd == "map") {
            return cmd_map(sub_argc, sub_argv);
        }
        if (cmd == "changes") {
            return cmd_changes(sub_argc, sub_argv);
        }
        if (cmd == "compare") {
            return cmd_compare(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
