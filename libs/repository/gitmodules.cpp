/**
 * @file gitmodules.cpp
 * @brief .gitmodules parsing and repository id derivation
 */

#include "evmverify/repository.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace evmverify::repository {

namespace {

constexpr std::string_view kSectionPrefix = "submodule";

// [submodule "lib/foo"] -> lib/foo; nullopt for other section kinds
[[nodiscard]] evmverify::Result<std::optional<std::string>> section_name(std::string_view line,
                                                                        std::size_t line_no)
{
    if (line.back() != ']') {
        return std::unexpected(Error::make(
            "ParseError", std::format(".gitmodules line {}: unterminated section", line_no)));
    }
    std::string_view inner = common::trim(line.substr(1, line.size() - 2));
    if (!inner.starts_with(kSectionPrefix)) {
        return std::optional<std::string>{};
    }
    inner = common::trim(inner.substr(kSectionPrefix.size()));
    if (inner.size() < 2 || inner.front() != '"' || inner.back() != '"') {
        return std::unexpected(Error::make(
            "ParseError", std::format(".gitmodules line {}: expected quoted name", line_no)));
    }
    return std::optional<std::string>{std::string(inner.substr(1, inner.size() - 2))};
}

void flush(std::optional<Submodule>& current, std::vector<Submodule>& out)
{
    if (current && !current->path.empty() && !current->url.empty()) {
        out.push_back(std::move(*current));
    }
    current.reset();
}

}  // namespace

evmverify::Result<std::vector<Submodule>> parse_gitmodules(std::string_view text)
{
    std::vector<Submodule> submodules;
    std::optional<Submodule> current;
    bool in_other_section = false;

    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const auto end = std::min(text.find('\n', pos), text.size());
        ++line_no;
        const std::string_view line = common::trim(text.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }
        if (line.front() == '[') {
            flush(current, submodules);
            auto name = section_name(line, line_no);
            if (!name) {
                return std::unexpected(name.error());
            }
            in_other_section = !name->has_value();
            if (!in_other_section) {
                current = Submodule{.name = **name, .path = {}, .url = {}};
            }
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return std::unexpected(Error::make(
                "ParseError", std::format(".gitmodules line {}: expected key = value", line_no)));
        }
        if (in_other_section || !current) {
            continue;
        }
        const std::string key = common::to_lower(common::trim(line.substr(0, eq)));
        const std::string value(common::trim(line.substr(eq + 1)));
        if (key == "path") {
            current->path = common::normalize_path(value);
        } else if (key == "url") {
            current->url = value;
        }
    }
    flush(current, submodules);
    return submodules;
}

evmverify::Result<std::vector<Submodule>> read_gitmodules(const std::filesystem::path& checkout)
{
    const auto file = checkout / ".gitmodules";
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return std::vector<Submodule>{};
    }
    std::ifstream in(file);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open " + file.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_gitmodules(buffer.str());
}

std::optional<std::string> repository_id_from_url(std::string_view url)
{
    std::string_view trimmed = common::trim(url);
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.remove_suffix(1);
    }
    if (trimmed.ends_with(".git")) {
        trimmed.remove_suffix(4);
    }

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= trimmed.size(); ++i) {
        if (i == trimmed.size() || trimmed[i] == '/' || trimmed[i] == ':') {
            if (i > start) {
                parts.push_back(trimmed.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    if (parts.size() < 2) {
        return std::nullopt;
    }
    return std::format("{}/{}", parts[parts.size() - 2], parts.back());
}

evmverify::Result<std::vector<KnownRepository>>
known_repositories(const std::filesystem::path& workspace_root)
{
    auto submodules = read_gitmodules(workspace_root);
    if (!submodules) {
        return std::unexpected(submodules.error());
    }

    std::vector<KnownRepository> repositories;
    for (const auto& submodule : *submodules) {
        auto id = repository_id_from_url(submodule.url);
        if (!id || find_repository(repositories, *id) != nullptr) {
            continue;
        }
        repositories.push_back(
            KnownRepository{.id = std::move(*id), .location = workspace_root / submodule.path});
    }
    return repositories;
}

const KnownRepository* find_repository(const std::vector<KnownRepository>& repositories,
                                       std::string_view id)
{
    auto it = std::ranges::find(repositories, id, &KnownRepository::id);
    return it == repositories.end() ? nullptr : &*it;
}

}  // namespace evmverify::repository
