#pragma once

/**
 * @file log.hpp
 * @brief Line-oriented progress and diagnostic logging
 *
 * Progress lines go to stdout, warnings and debug lines to stderr. All writes
 * are serialized so that worker threads never interleave partial lines.
 */

#include <format>
#include <mutex>
#include <string>
#include <string_view>

namespace evmverify::log {

enum class Level {
    kQuiet,  ///< Warnings only
    kInfo,   ///< Progress lines
    kDebug   ///< Tier fallbacks, clone steps, subprocess failures
};

class Logger
{
public:
    explicit Logger(Level level = Level::kInfo);

    [[nodiscard]] Level level() const noexcept { return m_level; }
    [[nodiscard]] bool debug_enabled() const noexcept { return m_level == Level::kDebug; }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (m_level != Level::kQuiet) {
            write_out(std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        write_err("warning: " + std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        if (m_level == Level::kDebug) {
            write_err("    " + std::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    void write_out(const std::string& line);
    void write_err(const std::string& line);

    Level m_level;
    std::mutex m_mutex;
};

/// Logger that drops everything except warnings; handy default for tests
[[nodiscard]] Logger& quiet();

}  // namespace evmverify::log
