/**
 * @file build_config.cpp
 * @brief foundry.toml compiler-setting overrides and backup/restore
 *
 * Line based: a key line is `<indent><key> = <value>` with the key first on
 * the line. Other lines are left untouched.
 */

#include "evmverify/build.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace evmverify::build {

namespace {

constexpr std::string_view kDefaultProfile = "[profile.default]";

struct Setting
{
    std::string key;
    std::string value;
};

[[nodiscard]] std::string quoted(std::string_view value)
{
    return std::format("\"{}\"", value);
}

[[nodiscard]] std::vector<Setting> settings_to_apply(const CompilerSettings& settings)
{
    std::vector<Setting> out;
    out.push_back({"script", quoted("disabled_script")});
    out.push_back({"test", quoted("disabled_test")});
    if (settings.optimization_enabled) {
        out.push_back({"optimizer", *settings.optimization_enabled ? "true" : "false"});
    }
    if (settings.optimization_runs) {
        out.push_back({"optimizer_runs", std::to_string(*settings.optimization_runs)});
    }
    if (settings.evm_version && !settings.evm_version->empty()) {
        out.push_back({"evm_version", quoted(*settings.evm_version)});
    }
    if (settings.via_ir) {
        out.push_back({"via_ir", *settings.via_ir ? "true" : "false"});
    }
    if (settings.compiler_version) {
        if (auto release = parse_compiler_release(*settings.compiler_version)) {
            out.push_back({"solc", quoted(*release)});
        }
    }
    return out;
}

[[nodiscard]] std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto end = std::min(text.find('\n', pos), text.size());
        lines.emplace_back(text.substr(pos, end - pos));
        pos = end + 1;
    }
    return lines;
}

// Leading whitespace length when `line` assigns `key`, npos otherwise
[[nodiscard]] std::size_t assignment_indent(std::string_view line, std::string_view key)
{
    const auto indent = line.find_first_not_of(" \t");
    if (indent == std::string_view::npos) {
        return std::string_view::npos;
    }
    std::string_view rest = line.substr(indent);
    if (!rest.starts_with(key)) {
        return std::string_view::npos;
    }
    rest.remove_prefix(key.size());
    rest = common::trim(rest);
    if (rest.empty() || rest.front() != '=') {
        return std::string_view::npos;
    }
    return indent;
}

[[nodiscard]] evmverify::Result<std::optional<std::string>> read_file(const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::optional<std::string>{};
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open " + file.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return std::optional<std::string>{buffer.str()};
}

[[nodiscard]] evmverify::VoidResult write_file(const std::filesystem::path& file,
                                               std::string_view content)
{
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write " + file.string()));
    }
    out << content;
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write " + file.string()));
    }
    return {};
}

}  // namespace

std::string apply_compiler_settings(std::string_view config_text,
                                    const CompilerSettings& settings)
{
    std::vector<std::string> lines = split_lines(config_text);
    std::vector<std::string> missing;

    for (const auto& setting : settings_to_apply(settings)) {
        bool found = false;
        for (auto& line : lines) {
            const auto indent = assignment_indent(line, setting.key);
            if (indent == std::string_view::npos) {
                continue;
            }
            line = std::format("{}{} = {}", line.substr(0, indent), setting.key, setting.value);
            found = true;
        }
        if (!found) {
            missing.push_back(std::format("{} = {}", setting.key, setting.value));
        }
    }

    if (!missing.empty()) {
        auto header = std::ranges::find_if(
            lines, [](const std::string& line) { return common::trim(line) == kDefaultProfile; });
        if (header != lines.end()) {
            lines.insert(std::next(header), missing.begin(), missing.end());
        }
    }

    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    if (!config_text.empty() && !config_text.ends_with('\n') && !out.empty()) {
        out.pop_back();
    }
    return out;
}

evmverify::VoidResult patch_config_file(const std::filesystem::path& file,
                                        const CompilerSettings& settings)
{
    auto content = read_file(file);
    if (!content) {
        return std::unexpected(content.error());
    }
    if (!*content) {
        return {};
    }
    return write_file(file, apply_compiler_settings(**content, settings));
}

ConfigBackup::ConfigBackup(std::filesystem::path file, std::optional<std::string> original)
    : m_file(std::move(file))
    , m_original(std::move(original))
{}

evmverify::Result<ConfigBackup> ConfigBackup::capture(std::filesystem::path file)
{
    auto content = read_file(file);
    if (!content) {
        return std::unexpected(content.error());
    }
    return ConfigBackup(std::move(file), std::move(*content));
}

ConfigBackup::ConfigBackup(ConfigBackup&& other) noexcept
    : m_file(std::move(other.m_file))
    , m_original(std::move(other.m_original))
    , m_armed(std::exchange(other.m_armed, false))
{}

ConfigBackup::~ConfigBackup()
{
    // Best effort: a destructor cannot report the failure
    [[maybe_unused]] auto restored = restore();
}

evmverify::VoidResult ConfigBackup::restore()
{
    if (!m_armed) {
        return {};
    }
    m_armed = false;
    if (!m_original) {
        return {};
    }
    return write_file(m_file, *m_original);
}

}  // namespace evmverify::build
