/**
 * @file log.cpp
 * @brief Serialized console logger
 */

#include "evmverify/log.hpp"

#include <cstdio>
#include <print>

namespace evmverify::log {

Logger::Logger(Level level)
    : m_level(level)
{}

void Logger::write_out(const std::string& line)
{
    std::scoped_lock lock(m_mutex);
    std::println("{}", line);
    std::fflush(stdout);
}

void Logger::write_err(const std::string& line)
{
    std::scoped_lock lock(m_mutex);
    std::println(stderr, "{}", line);
}

Logger& quiet()
{
    static Logger logger(Level::kQuiet);
    return logger;
}

}  // namespace evmverify::log
