/**
 * @file path.cpp
 * @brief Path normalization for deterministic source-path matching
 */

#include "evmverify/common.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <vector>

namespace evmverify::common {

namespace {

[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        for (auto sub : sv | std::views::split('\\')) {
            std::string_view sub_sv(sub.begin(), sub.end());
            if (!sub_sv.empty()) {
                parts.emplace_back(sub_sv);
            }
        }
    }
    return parts;
}

[[nodiscard]] std::vector<std::string> resolve_parts(const std::vector<std::string>& parts,
                                                     bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
                continue;
            }
            if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string result;
    bool first = true;
    for (const auto& p : parts) {
        if (!first) {
            result += '/';
        }
        first = false;
        result += p;
    }
    return result;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/') {
        return true;
    }
    // Windows drive paths still show up in explorer metadata uploaded from Windows hosts
    return path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
           && path[1] == ':' && (path[2] == '/' || path[2] == '\\');
}

std::vector<std::string> path_components(std::string_view path)
{
    return split_path(path);
}

std::string normalize_path(std::string_view input, std::string_view repo_root)
{
    if (input.empty()) {
        return ".";
    }
    const bool absolute_input = is_absolute_path(input);
    std::string path_str(input);
    std::ranges::replace(path_str, '\\', '/');

    std::string drive;
    if (path_str.size() >= 2 && path_str[1] == ':') {
        drive = std::string(1, static_cast<char>(std::tolower(path_str[0]))) + ":";
        path_str.erase(0, 2);
    }

    std::string normalized = join_path(resolve_parts(split_path(path_str), absolute_input));
    if (!drive.empty()) {
        normalized = drive + "/" + normalized;
    } else if (absolute_input) {
        normalized = "/" + normalized;
    }

    if (!repo_root.empty()) {
        std::string norm_root = normalize_path(repo_root);
        if (normalized.starts_with(norm_root)) {
            normalized = normalized.substr(norm_root.size());
            if (!normalized.empty() && normalized[0] == '/') {
                normalized = normalized.substr(1);
            }
        }
    }

    return normalized.empty() ? "." : normalized;
}

std::string to_lower(std::string_view value)
{
    std::string lower(value);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) noexcept {
        return std::tolower(a) == std::tolower(b);
    });
}

std::string_view trim(std::string_view value)
{
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return value.substr(first, last - first + 1);
}

}  // namespace evmverify::common
