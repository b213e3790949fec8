/**
 * @file codec.hpp
 * @brief Кодек бинарных записей: frontier, доказательства, файл хранилища
 *
 * Все форматы строятся из одних примитивов:
 * - целые little-endian (u8 / u32 / u64)
 * - CompactSize длина (1, 3, 5 или 9 байт)
 * - список 32-байтных хешей с CompactSize префиксом
 * - ключ и значение с CompactSize префиксом длины
 */

#pragma once

#include "../types.hpp"
#include "../byte_order.hpp"

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace incmerkle::core::serialization {

/**
 * @brief Повреждённая или обрезанная запись
 *
 * Перехватывается в месте декодирования и превращается в Result с кодом
 * ошибки конкретного формата.
 */
class RecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Размер CompactSize кодировки значения
 */
[[nodiscard]] constexpr std::size_t compact_size_length(uint64_t value) noexcept {
    if (value < 0xFD) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFF) return 5;
    return 9;
}

/**
 * @brief Последовательное чтение записи без копирования входа
 */
class RecordReader {
public:
    explicit RecordReader(ByteSpan data) noexcept : data_(data) {}

    [[nodiscard]] uint8_t u8();

    template<LittleEndianWord T>
    [[nodiscard]] T le() {
        return load_le<T>(take(sizeof(T)).data());
    }

    [[nodiscard]] uint64_t compact_size();

    /**
     * @brief Следующие count байт как view на вход
     */
    [[nodiscard]] ByteSpan take(std::size_t count);

    [[nodiscard]] Hash256 hash();

    /**
     * @brief Список хешей с CompactSize префиксом
     *
     * Заявленная длина проверяется по остатку до выделения памяти.
     */
    [[nodiscard]] std::vector<Hash256> hash_list();

    /**
     * @brief Байтовая строка с CompactSize префиксом длины
     */
    [[nodiscard]] ByteSpan sized_bytes();

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    /**
     * @brief Проверить, что запись прочитана полностью
     *
     * @throws RecordError при наличии лишних байт
     */
    void expect_end() const;

private:
    ByteSpan data_;
    std::size_t pos_{0};
};

/**
 * @brief Построение записи в растущем буфере
 */
class RecordWriter {
public:
    RecordWriter() = default;
    explicit RecordWriter(std::size_t expected_size) { out_.reserve(expected_size); }

    void u8(uint8_t value) { out_.push_back(value); }

    template<LittleEndianWord T>
    void le(T value) {
        uint8_t buf[sizeof(T)];
        store_le(buf, value);
        out_.insert(out_.end(), buf, buf + sizeof(T));
    }

    void compact_size(uint64_t value);
    void bytes(ByteSpan data);
    void hash(const Hash256& value);
    void hash_list(std::span<const Hash256> hashes);
    void sized_bytes(ByteSpan data);
    void sized_string(std::string_view text);

    [[nodiscard]] std::size_t size() const noexcept { return out_.size(); }

    /**
     * @brief Забрать готовую запись
     */
    [[nodiscard]] Bytes finish() && noexcept { return std::move(out_); }

private:
    Bytes out_;
};

} // namespace incmerkle::core::serialization
