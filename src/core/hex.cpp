/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <format>
#include <optional>

namespace incmerkle::core {

namespace {

constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

/**
 * @brief Преобразовать hex символ в число
 */
[[nodiscard]] std::optional<uint8_t> hex_char_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

} // anonymous namespace

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(HEX_DIGITS[byte >> 4]);
        result.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return result;
}

Result<Hash256> parse_hash(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }

    Hash256 result{};
    if (hex.size() != result.size() * 2) {
        return Err<Hash256>(
            ErrorCode::InvalidHex,
            std::format("Ожидается {} hex символов, получено {}", result.size() * 2, hex.size())
        );
    }

    for (std::size_t i = 0; i < result.size(); ++i) {
        auto high = hex_char_to_int(hex[i * 2]);
        auto low = hex_char_to_int(hex[i * 2 + 1]);
        if (!high || !low) {
            return Err<Hash256>(
                ErrorCode::InvalidHex,
                std::format("Некорректный hex символ в позиции {}", i * 2)
            );
        }
        result[i] = static_cast<uint8_t>((*high << 4) | *low);
    }

    return result;
}

} // namespace incmerkle::core
