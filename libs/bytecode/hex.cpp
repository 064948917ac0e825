/**
 * @file hex.cpp
 * @brief Hex codec for bytecode payloads
 */

#include "evmverify/bytecode.hpp"

#include <format>

namespace evmverify::bytecode {

namespace {

[[nodiscard]] constexpr int nibble(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

evmverify::Result<Bytes> from_hex(std::string_view hex)
{
    hex = common::trim(hex);
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::unexpected(
            Error::make("InvalidHex", std::format("Odd number of hex digits ({})", hex.size())));
    }

    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(Error::make(
                "InvalidHex",
                std::format("Non-hex character at offset {}: '{}'", i, hex.substr(i, 2))));
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string to_hex(BytesView bytes)
{
    constexpr std::string_view kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return out;
}

}  // namespace evmverify::bytecode
