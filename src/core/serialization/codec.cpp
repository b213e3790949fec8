/**
 * @file codec.cpp
 * @brief Реализация кодека бинарных записей
 */

#include "codec.hpp"

#include "../constants.hpp"

#include <algorithm>
#include <format>

namespace incmerkle::core::serialization {

// =============================================================================
// RecordReader
// =============================================================================

ByteSpan RecordReader::take(std::size_t count) {
    if (count > remaining()) {
        throw RecordError(std::format(
            "запись обрезана: нужно {} байт, осталось {}", count, remaining()
        ));
    }
    ByteSpan view = data_.subspan(pos_, count);
    pos_ += count;
    return view;
}

uint8_t RecordReader::u8() {
    return take(1)[0];
}

uint64_t RecordReader::compact_size() {
    const uint8_t tag = u8();
    switch (tag) {
        case 0xFD: return le<uint16_t>();
        case 0xFE: return le<uint32_t>();
        case 0xFF: return le<uint64_t>();
        default:   return tag;
    }
}

Hash256 RecordReader::hash() {
    ByteSpan view = take(constants::HASH_SIZE);
    Hash256 result;
    std::copy(view.begin(), view.end(), result.begin());
    return result;
}

std::vector<Hash256> RecordReader::hash_list() {
    const uint64_t count = compact_size();
    if (count > remaining() / constants::HASH_SIZE) {
        throw RecordError(std::format(
            "заявлено {} хешей, данных на {}", count, remaining() / constants::HASH_SIZE
        ));
    }

    std::vector<Hash256> hashes;
    hashes.reserve(static_cast<std::size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        hashes.push_back(hash());
    }
    return hashes;
}

ByteSpan RecordReader::sized_bytes() {
    const uint64_t length = compact_size();
    if (length > remaining()) {
        throw RecordError(std::format(
            "заявлена длина {}, осталось {} байт", length, remaining()
        ));
    }
    return take(static_cast<std::size_t>(length));
}

void RecordReader::expect_end() const {
    if (remaining() != 0) {
        throw RecordError(std::format("{} лишних байт в конце записи", remaining()));
    }
}

// =============================================================================
// RecordWriter
// =============================================================================

void RecordWriter::compact_size(uint64_t value) {
    if (value < 0xFD) {
        u8(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        u8(0xFD);
        le(static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFF) {
        u8(0xFE);
        le(static_cast<uint32_t>(value));
    } else {
        u8(0xFF);
        le(value);
    }
}

void RecordWriter::bytes(ByteSpan data) {
    out_.insert(out_.end(), data.begin(), data.end());
}

void RecordWriter::hash(const Hash256& value) {
    bytes(value);
}

void RecordWriter::hash_list(std::span<const Hash256> hashes) {
    compact_size(hashes.size());
    for (const auto& h : hashes) {
        hash(h);
    }
}

void RecordWriter::sized_bytes(ByteSpan data) {
    compact_size(data.size());
    bytes(data);
}

void RecordWriter::sized_string(std::string_view text) {
    sized_bytes(ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

} // namespace incmerkle::core::serialization
