/**
 * @file keccak256.cpp
 * @brief Программная реализация Keccak-256
 *
 * Перестановка Keccak-f[1600] по описанию "The Keccak reference" v3.0,
 * шаги theta / rho+pi / chi / iota объединены в один проход по раунду.
 */

#include "keccak256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <bit>

namespace incmerkle::crypto {

namespace {

/// @brief Константы раундов (шаг iota)
constexpr std::array<uint64_t, constants::KECCAK_ROUNDS> ROUND_CONSTANTS = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL,
    0x8000000080008000ULL, 0x000000000000808BULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008AULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800AULL, 0x800000008000000AULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

/// @brief Смещения вращения (шаг rho) в порядке обхода pi
constexpr std::array<int, 24> ROTATIONS = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

/// @brief Перестановка позиций lanes (шаг pi)
constexpr std::array<int, 24> PI_LANES = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

/// @brief Количество 64-битных lanes в одном блоке rate
constexpr std::size_t RATE_LANES = constants::KECCAK256_RATE / 8;

} // anonymous namespace

// =============================================================================
// Keccak-f[1600]
// =============================================================================

void keccak_f1600(KeccakState& st) noexcept {
    std::array<uint64_t, 5> bc{};

    for (std::size_t round = 0; round < constants::KECCAK_ROUNDS; ++round) {
        // === theta ===
        for (std::size_t i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (std::size_t i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ std::rotl(bc[(i + 1) % 5], 1);
            for (std::size_t j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // === rho + pi ===
        uint64_t t = st[1];
        for (std::size_t i = 0; i < 24; ++i) {
            int j = PI_LANES[i];
            uint64_t tmp = st[j];
            st[j] = std::rotl(t, ROTATIONS[i]);
            t = tmp;
        }

        // === chi ===
        for (std::size_t j = 0; j < 25; j += 5) {
            for (std::size_t i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (std::size_t i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // === iota ===
        st[0] ^= ROUND_CONSTANTS[round];
    }
}

// =============================================================================
// Keccak256
// =============================================================================

Keccak256::Keccak256() noexcept {
    reset();
}

void Keccak256::reset() noexcept {
    state_.fill(0);
    buffer_.fill(0);
    buffered_ = 0;
}

void Keccak256::absorb_block(const uint8_t* block) noexcept {
    for (std::size_t i = 0; i < RATE_LANES; ++i) {
        state_[i] ^= load_le<uint64_t>(block + i * 8);
    }
    keccak_f1600(state_);
}

void Keccak256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();

    // Дополняем частично заполненный буфер
    if (buffered_ > 0) {
        std::size_t take = std::min(len, constants::KECCAK256_RATE - buffered_);
        std::copy_n(ptr, take, buffer_.data() + buffered_);
        buffered_ += take;
        ptr += take;
        len -= take;

        if (buffered_ < constants::KECCAK256_RATE) {
            return;
        }
        absorb_block(buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки поглощаем напрямую из входа
    while (len >= constants::KECCAK256_RATE) {
        absorb_block(ptr);
        ptr += constants::KECCAK256_RATE;
        len -= constants::KECCAK256_RATE;
    }

    if (len > 0) {
        std::copy_n(ptr, len, buffer_.data());
        buffered_ = len;
    }
}

Hash256 Keccak256::finalize() noexcept {
    // Padding исходного Keccak: 0x01 ... 0x80 (pad10*1 с доменным битом 0)
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0);
    buffer_[buffered_] ^= 0x01;
    buffer_[constants::KECCAK256_RATE - 1] ^= 0x80;
    absorb_block(buffer_.data());

    Hash256 digest;
    for (std::size_t i = 0; i < digest.size() / 8; ++i) {
        store_le(digest.data() + i * 8, state_[i]);
    }

    reset();
    return digest;
}

// =============================================================================
// Функции-обёртки
// =============================================================================

Hash256 keccak256(ByteSpan data) noexcept {
    Keccak256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 keccak256_concat(std::span<const Hash256> items) noexcept {
    Keccak256 hasher;
    for (const auto& item : items) {
        hasher.update(item);
    }
    return hasher.finalize();
}

} // namespace incmerkle::crypto
