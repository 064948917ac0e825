/**
 * @file forge_builder.cpp
 * @brief Builder backed by `forge build`
 */

#include "evmverify/build.hpp"
#include "evmverify/process.hpp"

namespace evmverify::build {

ForgeBuilder::ForgeBuilder(ForgeOptions options)
    : m_options(std::move(options))
{}

evmverify::VoidResult ForgeBuilder::run(const std::filesystem::path& checkout,
                                        std::vector<std::string> args)
{
    args.insert(args.begin(), m_options.binary);
    auto result = process::run_checked(process::ProcessOptions{
        .argv = std::move(args),
        .cwd = checkout,
        .timeout = m_options.timeout,
    });
    if (!result) {
        return std::unexpected(Error::make("BuildFailed", result.error().message));
    }
    return {};
}

evmverify::VoidResult ForgeBuilder::build(const std::filesystem::path& checkout)
{
    return run(checkout, {"build", "--force"});
}

// Incremental: a forced rebuild would wipe the group build's artifacts from out/
evmverify::VoidResult ForgeBuilder::build_file(const std::filesystem::path& checkout,
                                               const std::string& source_file)
{
    return run(checkout, {"build", source_file});
}

}  // namespace evmverify::build
