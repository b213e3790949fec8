/**
 * @file hex.hpp
 * @brief Hex кодирование хешей для CLI и логов
 *
 * Порядок байт не меняется: первый байт хеша - первые два символа строки.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace incmerkle::core {

/**
 * @brief Преобразовать байты в hex строку (нижний регистр, без префикса)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Разобрать 32-байтный хеш из hex строки
 *
 * Допускается префикс "0x". Строка должна содержать ровно 64 hex символа.
 *
 * @param hex Строка вида "ad3228b6...ba5fb5"
 * @return Result<Hash256> Хеш или ErrorCode::InvalidHex
 */
[[nodiscard]] Result<Hash256> parse_hash(std::string_view hex);

} // namespace incmerkle::core
