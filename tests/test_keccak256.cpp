/**
 * @file test_keccak256.cpp
 * @brief Тесты Keccak-256 реализации
 *
 * Проверяет известные тестовые векторы исходного Keccak (padding 0x01)
 * и совпадение инкрементального и однократного хеширования.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "crypto/keccak256.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace incmerkle::tests {

namespace {

Hash256 from_hex(std::string_view hex) {
    auto hash = core::parse_hash(hex);
    EXPECT_TRUE(hash.has_value()) << hex;
    return hash.value_or(Hash256{});
}

ByteSpan as_bytes(const std::string& s) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // anonymous namespace

class Keccak256Test : public ::testing::Test {};

/**
 * @brief Тест: пустое сообщение
 *
 * Keccak256("") = c5d24601...5d85a470 (не совпадает с SHA3-256(""))
 */
TEST_F(Keccak256Test, EmptyMessage) {
    auto hash = crypto::keccak256(ByteSpan{});
    EXPECT_EQ(hash, from_hex("c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
}

TEST_F(Keccak256Test, SimpleMessage) {
    auto hash = crypto::keccak256(as_bytes("abc"));
    EXPECT_EQ(hash, from_hex("4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"));
}

/**
 * @brief Тест: два нулевых хеша (первый zero-хеш дерева)
 */
TEST_F(Keccak256Test, SixtyFourZeroBytes) {
    const std::array<uint8_t, 64> zeros{};
    auto hash = crypto::keccak256(zeros);
    EXPECT_EQ(hash, from_hex("ad3228b676f7d3cd4284a5443f17f1962b36e491b30a40b2405849e597ba5fb5"));
}

TEST_F(Keccak256Test, ConcatMatchesOneShot) {
    const std::array<Hash256, 2> items{Hash256{}, Hash256{}};
    const std::array<uint8_t, 64> zeros{};
    EXPECT_EQ(crypto::keccak256_concat(items), crypto::keccak256(zeros));
}

/**
 * @brief Тест: инкрементальное хеширование по частям произвольного размера
 *
 * Длины выбраны вокруг границы блока rate (136 байт).
 */
TEST_F(Keccak256Test, IncrementalMatchesOneShot) {
    for (std::size_t length : {0u, 1u, 135u, 136u, 137u, 271u, 272u, 273u, 1000u}) {
        std::vector<uint8_t> data(length);
        for (std::size_t i = 0; i < length; ++i) {
            data[i] = static_cast<uint8_t>(i * 31 + 7);
        }
        const auto expected = crypto::keccak256(data);

        for (std::size_t chunk : {1u, 7u, 64u, 136u, 200u}) {
            crypto::Keccak256 hasher;
            for (std::size_t offset = 0; offset < length; offset += chunk) {
                std::size_t take = std::min(chunk, length - offset);
                hasher.update(ByteSpan{data.data() + offset, take});
            }
            EXPECT_EQ(hasher.finalize(), expected) << "length=" << length << " chunk=" << chunk;
        }
    }
}

TEST_F(Keccak256Test, FinalizeResetsHasher) {
    crypto::Keccak256 hasher;
    hasher.update(as_bytes("abc"));
    auto first = hasher.finalize();

    hasher.update(as_bytes("abc"));
    auto second = hasher.finalize();

    EXPECT_EQ(first, second);
    EXPECT_EQ(hasher.finalize(), crypto::keccak256(ByteSpan{}));
}

TEST_F(Keccak256Test, DifferentInputsDiffer) {
    EXPECT_NE(crypto::keccak256(as_bytes("abc")), crypto::keccak256(as_bytes("abd")));
}

} // namespace incmerkle::tests
