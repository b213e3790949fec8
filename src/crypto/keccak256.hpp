/**
 * @file keccak256.hpp
 * @brief Keccak-256 (исходный Keccak, не FIPS-202 SHA3-256)
 *
 * Хеш-функция, используемая функцией commit аккумулятора. Совпадает с
 * keccak256 в EVM-совместимых контрактах: отличается от SHA3-256 только
 * байтом padding (0x01 вместо 0x06).
 *
 * Параметры губки:
 * - Перестановка Keccak-f[1600], 24 раунда
 * - Rate 136 байт, capacity 512 бит
 * - Выход 32 байта
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace incmerkle::crypto {

/**
 * @brief Состояние Keccak-f[1600] (25 x 64-bit lanes)
 */
using KeccakState = std::array<uint64_t, 25>;

/**
 * @brief Перестановка Keccak-f[1600]
 *
 * @param state Состояние губки (будет модифицировано)
 */
void keccak_f1600(KeccakState& state) noexcept;

/**
 * @brief Инкрементальный Keccak-256 хешер
 *
 * Пример использования:
 * @code
 * crypto::Keccak256 hasher;
 * hasher.update(left);
 * hasher.update(right);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Keccak256 {
public:
    Keccak256() noexcept;

    /**
     * @brief Добавить данные в губку
     */
    void update(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    void absorb_block(const uint8_t* block) noexcept;

    KeccakState state_{};
    std::array<uint8_t, constants::KECCAK256_RATE> buffer_{};
    std::size_t buffered_{0};
};

/**
 * @brief Вычислить Keccak-256 хеш данных произвольной длины
 */
[[nodiscard]] Hash256 keccak256(ByteSpan data) noexcept;

/**
 * @brief Вычислить Keccak-256 от конкатенации нескольких 32-байтных элементов
 *
 * keccak256(items[0] || items[1] || ...)
 */
[[nodiscard]] Hash256 keccak256_concat(std::span<const Hash256> items) noexcept;

} // namespace incmerkle::crypto
