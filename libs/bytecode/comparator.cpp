/**
 * @file comparator.cpp
 * @brief Metadata stripping and ordered equivalence heuristics
 */

#include "evmverify/bytecode.hpp"

#include <algorithm>
#include <format>

namespace evmverify::bytecode {

namespace {

[[nodiscard]] std::size_t find_sequence(BytesView haystack, BytesView needle, std::size_t from)
{
    if (needle.empty() || from >= haystack.size()) {
        return haystack.size();
    }
    auto found = std::ranges::search(haystack.subspan(from), needle);
    if (found.empty()) {
        return haystack.size();
    }
    return static_cast<std::size_t>(found.begin() - haystack.begin());
}

[[nodiscard]] bool starts_with(BytesView code, BytesView prefix)
{
    return code.size() >= prefix.size()
           && std::ranges::equal(code.first(prefix.size()), prefix);
}

[[nodiscard]] bool is_word_aligned(std::size_t extra)
{
    return extra > 0 && extra % kWordSize == 0;
}

[[nodiscard]] std::optional<std::size_t> match_constructor_args(BytesView deployed,
                                                                BytesView compiled)
{
    if (deployed.size() <= compiled.size()) {
        return std::nullopt;
    }
    const std::size_t extra = deployed.size() - compiled.size();
    if (!is_word_aligned(extra) || !starts_with(deployed, compiled)) {
        return std::nullopt;
    }
    return extra;
}

/// Returns true and fills diagnostics when a factory prefix explains the difference
[[nodiscard]] bool match_create2(BytesView deployed, BytesView compiled, Diagnostics& diagnostics)
{
    if (deployed.size() <= compiled.size() || compiled.empty()) {
        return false;
    }
    const auto needle = compiled.first(std::min(compiled.size(), kCreate2NeedleSize));
    const std::size_t offset = find_sequence(deployed, needle, 1);
    if (offset >= deployed.size()) {
        return false;
    }

    const auto trimmed = deployed.subspan(offset);
    if (std::ranges::equal(trimmed, compiled)) {
        diagnostics.create2_prefix_size = offset;
        return true;
    }
    if (auto args = match_constructor_args(trimmed, compiled)) {
        diagnostics.create2_prefix_size = offset;
        diagnostics.constructor_args_size = *args;
        return true;
    }
    return false;
}

/**
 * Immutable references are zero-filled in compiled runtime code and patched at
 * deployment. Each maximal run of differing bytes counts as one slot and must
 * be all zero on the compiled side.
 */
[[nodiscard]] std::optional<std::size_t> count_immutable_slots(BytesView deployed,
                                                               BytesView compiled)
{
    std::size_t slots = 0;
    std::size_t i = 0;
    const std::size_t n = deployed.size();
    while (i < n) {
        if (deployed[i] == compiled[i]) {
            ++i;
            continue;
        }
        bool zero_filled = true;
        while (i < n && deployed[i] != compiled[i]) {
            zero_filled = zero_filled && compiled[i] == 0;
            ++i;
        }
        if (!zero_filled) {
            return std::nullopt;
        }
        ++slots;
    }
    if (slots == 0) {
        return std::nullopt;
    }
    return slots;
}

[[nodiscard]] std::string context_window(BytesView code, std::size_t index)
{
    const std::size_t begin = index > kDiffContextBytes ? index - kDiffContextBytes : 0;
    const std::size_t end = std::min(code.size(), index + kDiffContextBytes);
    if (begin >= end) {
        return {};
    }
    return to_hex(code.subspan(begin, end - begin));
}

void record_first_difference(BytesView deployed, BytesView compiled, Diagnostics& diagnostics)
{
    const std::size_t common = std::min(deployed.size(), compiled.size());
    auto [deployed_it, compiled_it] =
        std::ranges::mismatch(deployed.first(common), compiled.first(common));
    const auto index = static_cast<std::size_t>(deployed_it - deployed.begin());
    if (index == common && deployed.size() == compiled.size()) {
        return;
    }
    diagnostics.first_diff_position = index * 2;
    diagnostics.first_diff_deployed = context_window(deployed, index);
    diagnostics.first_diff_compiled = context_window(compiled, index);
}

}  // namespace

Bytes strip_metadata(BytesView code)
{
    Bytes out(code.begin(), code.end());
    for (;;) {
        const std::size_t marker = find_sequence(out, kMetadataMarker, 0);
        if (marker >= out.size()) {
            break;
        }
        const std::size_t terminator = find_sequence(out, kMetadataTerminator, marker);
        if (terminator >= out.size()) {
            out.resize(marker);
            break;
        }
        const auto erase_begin = out.begin() + static_cast<std::ptrdiff_t>(marker);
        const auto erase_end =
            out.begin() + static_cast<std::ptrdiff_t>(terminator + kMetadataTerminator.size());
        out.erase(erase_begin, erase_end);
    }
    return out;
}

std::string_view to_string(MatchKind kind) noexcept
{
    switch (kind) {
        case MatchKind::kExact:
            return "exact";
        case MatchKind::kConstructorArgs:
            return "constructor_args";
        case MatchKind::kCreate2Prefix:
            return "create2_prefix";
        case MatchKind::kImmutables:
            return "immutables";
        case MatchKind::kNone:
            return "none";
    }
    return "none";
}

Comparison compare(BytesView on_chain, BytesView compiled)
{
    const Bytes deployed = strip_metadata(on_chain);
    const Bytes built = strip_metadata(compiled);

    Comparison result;
    Diagnostics& diagnostics = result.diagnostics;
    diagnostics.deployed_size = deployed.size();
    diagnostics.compiled_size = built.size();

    if (deployed == built) {
        diagnostics.kind = MatchKind::kExact;
        result.match = true;
        return result;
    }

    if (auto args = match_constructor_args(deployed, built)) {
        diagnostics.kind = MatchKind::kConstructorArgs;
        diagnostics.constructor_args_size = *args;
        result.match = true;
        return result;
    }

    if (match_create2(deployed, built, diagnostics)) {
        diagnostics.kind = MatchKind::kCreate2Prefix;
        result.match = true;
        return result;
    }

    if (deployed.size() == built.size()) {
        if (auto slots = count_immutable_slots(deployed, built)) {
            diagnostics.kind = MatchKind::kImmutables;
            diagnostics.immutable_vars = *slots;
            result.match = true;
            return result;
        }
    }

    diagnostics.kind = MatchKind::kNone;
    record_first_difference(deployed, built, diagnostics);
    return result;
}

evmverify::Result<Comparison> compare_hex(std::string_view on_chain_hex,
                                          std::string_view compiled_hex)
{
    auto on_chain = from_hex(on_chain_hex);
    if (!on_chain) {
        return std::unexpected(
            Error::make(on_chain.error().code, "On-chain code: " + on_chain.error().message));
    }
    auto compiled = from_hex(compiled_hex);
    if (!compiled) {
        return std::unexpected(
            Error::make(compiled.error().code, "Compiled code: " + compiled.error().message));
    }
    return compare(*on_chain, *compiled);
}

nlohmann::json to_json(const Diagnostics& diagnostics)
{
    nlohmann::json j = {
        {   "match_kind", std::string(to_string(diagnostics.kind))},
        {"deployed_size",                  diagnostics.deployed_size},
        {"compiled_size",                  diagnostics.compiled_size}
    };
    if (diagnostics.constructor_args_size) {
        j["constructor_args_size"] = *diagnostics.constructor_args_size;
    }
    if (diagnostics.create2_prefix_size) {
        j["create2_prefix_size"] = *diagnostics.create2_prefix_size;
    }
    if (diagnostics.immutable_vars) {
        j["immutable_vars"] = *diagnostics.immutable_vars;
    }
    if (diagnostics.first_diff_position) {
        j["first_diff_position"] = *diagnostics.first_diff_position;
    }
    if (diagnostics.first_diff_deployed) {
        j["first_diff_deployed"] = *diagnostics.first_diff_deployed;
    }
    if (diagnostics.first_diff_compiled) {
        j["first_diff_compiled"] = *diagnostics.first_diff_compiled;
    }
    return j;
}

}  // namespace evmverify::bytecode
