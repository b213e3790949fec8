/**
 * @file constants.hpp
 * @brief Константы аккумулятора incmerkle
 *
 * Глубина дерева задаётся одной константой TREE_DEPTH для всех компонентов.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace incmerkle::constants {

// =============================================================================
// Параметры дерева
// =============================================================================

/// @brief Размер хеша (лист, узел, корень) в байтах
inline constexpr std::size_t HASH_SIZE = 32;

/// @brief Глубина дерева по умолчанию (совместимость с on-chain верификатором)
inline constexpr std::size_t TREE_DEPTH = 32;

/// @brief Максимально поддерживаемая глубина (счётчик листьев 32-битный)
inline constexpr std::size_t MAX_TREE_DEPTH = 32;

static_assert(TREE_DEPTH >= 1 && TREE_DEPTH <= MAX_TREE_DEPTH,
              "Глубина дерева должна быть от 1 до 32");

/**
 * @brief Максимальное количество листьев для заданной глубины
 *
 * 2^depth - 1: наибольшее значение счётчика, представимое depth битами.
 *
 * @param depth Глубина дерева (1..MAX_TREE_DEPTH)
 */
[[nodiscard]] constexpr uint64_t max_leaves(std::size_t depth) noexcept {
    return (uint64_t{1} << depth) - 1;
}

static_assert(max_leaves(TREE_DEPTH) == 0xFFFFFFFFULL);

// =============================================================================
// Keccak-256
// =============================================================================

/// @brief Rate губки Keccak-256 в байтах (1600 - 2 * 256 бит)
inline constexpr std::size_t KECCAK256_RATE = 136;

/// @brief Количество раундов Keccak-f[1600]
inline constexpr std::size_t KECCAK_ROUNDS = 24;

// =============================================================================
// Формат записи и хранилище
// =============================================================================

/// @brief Версия формата сериализованного frontier
inline constexpr uint8_t FRONTIER_FORMAT_VERSION = 1;

/// @brief Магическое значение файла хранилища ("IMKV")
inline constexpr uint32_t STORE_FILE_MAGIC = 0x564B4D49;

/// @brief Версия формата файла хранилища
inline constexpr uint8_t STORE_FILE_VERSION = 1;

/// @brief Ключ, под которым хранится дерево
inline constexpr std::string_view DEFAULT_TREE_KEY = "TREE";

/// @brief Путь к файлу хранилища по умолчанию
inline constexpr std::string_view DEFAULT_STORE_PATH = "incmerkle.dat";

/// @brief Размер истории событий по умолчанию
inline constexpr std::size_t DEFAULT_EVENT_HISTORY = 200;

} // namespace incmerkle::constants
