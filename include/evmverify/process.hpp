#pragma once

/**
 * @file process.hpp
 * @brief External process invocation with captured output and a hard timeout
 *
 * Used for git, the contract builder and the HTTP transport. A timeout kills
 * the child and is reported as that call's failure only.
 */

#include "evmverify/common.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace evmverify::process {

struct ProcessOptions
{
    std::vector<std::string> argv;
    std::filesystem::path cwd;  ///< Empty: inherit
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

struct ProcessResult
{
    int exit_code = 1;
    bool timed_out = false;
    std::string stdout_output;
    std::string stderr_output;

    [[nodiscard]] bool ok() const noexcept { return !timed_out && exit_code == 0; }
};

/**
 * Run a process to completion (or timeout).
 *
 * A nonzero exit is NOT an error here; callers decide. Errors are reserved for
 * failures to start the process at all (pipe/fork failures, empty argv).
 */
[[nodiscard]] evmverify::Result<ProcessResult> run(const ProcessOptions& options);

/// Convenience: run and turn nonzero exit / timeout into a ProcessFailed error
[[nodiscard]] evmverify::Result<ProcessResult> run_checked(const ProcessOptions& options);

/// "git fetch --depth 1 origin abc" style rendering for log lines
[[nodiscard]] std::string describe(const std::vector<std::string>& argv);

}  // namespace evmverify::process
