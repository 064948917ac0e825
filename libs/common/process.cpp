/**
 * @file process.cpp
 * @brief fork/exec process runner with poll-based timeout
 */

#include "evmverify/process.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evmverify::process {

namespace {

constexpr int kExecFailedExitCode = 127;
constexpr int kChdirFailedExitCode = 126;
constexpr std::size_t kTailBytes = 2000;

class Pipe
{
public:
    Pipe() = default;
    ~Pipe()
    {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // O_CLOEXEC: concurrent spawns must not inherit each other's write ends
    [[nodiscard]] bool open() { return ::pipe2(m_fds, O_CLOEXEC) == 0; }

    [[nodiscard]] int read_end() const noexcept { return m_fds[0]; }
    [[nodiscard]] int write_end() const noexcept { return m_fds[1]; }

    void close_read() noexcept
    {
        if (m_fds[0] >= 0) {
            ::close(m_fds[0]);
            m_fds[0] = -1;
        }
    }
    void close_write() noexcept
    {
        if (m_fds[1] >= 0) {
            ::close(m_fds[1]);
            m_fds[1] = -1;
        }
    }

private:
    int m_fds[2] = {-1, -1};
};

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void exec_child(const char* cwd, char* const* argv, Pipe& out, Pipe& err)
{
    // Own process group, so a timeout kill also reaches the compiler processes it starts
    ::setpgid(0, 0);
    ::dup2(out.write_end(), STDOUT_FILENO);
    ::dup2(err.write_end(), STDERR_FILENO);
    out.close_read();
    err.close_read();
    out.close_write();
    err.close_write();

    if (cwd != nullptr && ::chdir(cwd) != 0) {
        constexpr std::string_view kMessage = "evmverify: chdir failed\n";
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, kMessage.data(), kMessage.size());
        _exit(kChdirFailedExitCode);
    }
    ::execvp(argv[0], argv);

    constexpr std::string_view kMessage = "evmverify: exec failed\n";
    [[maybe_unused]] auto written = ::write(STDERR_FILENO, kMessage.data(), kMessage.size());
    _exit(kExecFailedExitCode);
}

[[nodiscard]] int decode_status(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

[[nodiscard]] std::string tail(const std::string& text)
{
    if (text.size() <= kTailBytes) {
        return text;
    }
    return "..." + text.substr(text.size() - kTailBytes);
}

}  // namespace

evmverify::Result<ProcessResult> run(const ProcessOptions& options)
{
    if (options.argv.empty()) {
        return std::unexpected(Error::make("InvalidArgument", "Empty command line"));
    }

    Pipe out;
    Pipe err;
    if (!out.open() || !err.open()) {
        return std::unexpected(
            Error::make("ProcessSpawnFailed", std::format("pipe(): {}", std::strerror(errno))));
    }

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = options.cwd.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(
            Error::make("ProcessSpawnFailed", std::format("fork(): {}", std::strerror(errno))));
    }
    if (pid == 0) {
        exec_child(cwd.empty() ? nullptr : cwd.c_str(), argv.data(), out, err);
    }

    ::setpgid(pid, pid);
    out.close_write();
    err.close_write();

    ProcessResult result;
    pollfd fds[2]{};
    fds[0] = {.fd = out.read_end(), .events = POLLIN, .revents = 0};
    fds[1] = {.fd = err.read_end(), .events = POLLIN, .revents = 0};
    int fds_open = 2;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;

    while (fds_open > 0) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }
        const int ret = ::poll(fds, 2, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ret == 0) {
            result.timed_out = true;
            break;
        }

        char chunk[4096];
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                (i == 0 ? result.stdout_output : result.stderr_output)
                    .append(chunk, static_cast<std::size_t>(n));
                continue;
            }
            fds[i].fd = -1;
            --fds_open;
        }
    }

    if (result.timed_out) {
        ::kill(-pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(Error::make(
                "ProcessWaitFailed", std::format("waitpid(): {}", std::strerror(errno))));
        }
    }
    result.exit_code = result.timed_out ? 1 : decode_status(status);
    return result;
}

evmverify::Result<ProcessResult> run_checked(const ProcessOptions& options)
{
    auto result = run(options);
    if (!result) {
        return result;
    }
    if (result->timed_out) {
        return std::unexpected(Error::make(
            "ProcessTimedOut",
            std::format("{} timed out after {}s", describe(options.argv),
                        std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count())));
    }
    if (result->exit_code != 0) {
        return std::unexpected(Error::make("ProcessFailed",
                                           std::format("{} exited with {}: {}",
                                                       describe(options.argv),
                                                       result->exit_code,
                                                       tail(result->stderr_output))));
    }
    return result;
}

std::string describe(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

}  // namespace evmverify::process
