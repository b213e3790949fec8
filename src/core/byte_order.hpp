/**
 * @file byte_order.hpp
 * @brief Little-endian загрузка и запись целых чисел
 *
 * Lanes Keccak, счётчик frontier и поля файла хранилища хранятся
 * в little-endian независимо от порядка байт хоста.
 */

#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

namespace incmerkle {

/**
 * @brief Беззнаковое целое размером 2, 4 или 8 байт
 */
template<typename T>
concept LittleEndianWord = std::unsigned_integral<T> &&
                           (sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Прочитать слово из буфера в little-endian порядке
 *
 * @param src Указатель на sizeof(T) байт
 */
template<LittleEndianWord T>
[[nodiscard]] inline T load_le(const uint8_t* src) noexcept {
    T value;
    std::memcpy(&value, src, sizeof(T));
    if constexpr (std::endian::native == std::endian::big) {
        value = std::byteswap(value);
    }
    return value;
}

/**
 * @brief Записать слово в буфер в little-endian порядке
 *
 * @param dest Указатель на sizeof(T) байт
 */
template<LittleEndianWord T>
inline void store_le(uint8_t* dest, T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        value = std::byteswap(value);
    }
    std::memcpy(dest, &value, sizeof(T));
}

} // namespace incmerkle
