/**
 * @file kv_store.cpp
 * @brief Реализация key-value хранилищ
 */

#include "kv_store.hpp"
#include "../core/constants.hpp"
#include "../core/serialization/codec.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace incmerkle::storage {

// =============================================================================
// MemoryStore
// =============================================================================

Result<std::optional<Bytes>> MemoryStore::get(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::optional<Bytes>{};
    }
    return std::optional<Bytes>{it->second};
}

Result<void> MemoryStore::put(std::string_view key, ByteSpan value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.insert_or_assign(std::string(key), Bytes(value.begin(), value.end()));
    return {};
}

Result<void> MemoryStore::erase(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it != data_.end()) {
        data_.erase(it);
    }
    return {};
}

// =============================================================================
// FileStore
// =============================================================================

FileStore::FileStore(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<std::unique_ptr<FileStore>> FileStore::open(std::filesystem::path path) {
    std::unique_ptr<FileStore> store(new FileStore(std::move(path)));
    if (auto loaded = store->load(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return store;
}

Result<void> FileStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            return Err<void>(
                ErrorCode::StorageIOError,
                std::format("Не удалось проверить файл {}: {}", path_.string(), ec.message())
            );
        }
        // Файла ещё нет - пустое хранилище
        return {};
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return Err<void>(
            ErrorCode::StorageIOError,
            std::format("Не удалось открыть файл {}", path_.string())
        );
    }

    Bytes contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<void>(
            ErrorCode::StorageIOError,
            std::format("Ошибка чтения файла {}", path_.string())
        );
    }

    try {
        core::serialization::RecordReader record(contents);

        if (record.le<uint32_t>() != constants::STORE_FILE_MAGIC) {
            return Err<void>(
                ErrorCode::InvalidState,
                std::format("Файл {} не является хранилищем incmerkle", path_.string())
            );
        }
        const uint8_t version = record.u8();
        if (version != constants::STORE_FILE_VERSION) {
            return Err<void>(
                ErrorCode::InvalidState,
                std::format("Неподдерживаемая версия хранилища: {}", version)
            );
        }

        Entries entries;
        const uint64_t count = record.compact_size();
        for (uint64_t i = 0; i < count; ++i) {
            ByteSpan key = record.sized_bytes();
            ByteSpan value = record.sized_bytes();
            entries.insert_or_assign(std::string(key.begin(), key.end()), Bytes(value.begin(), value.end()));
        }
        record.expect_end();

        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::move(entries);
        return {};

    } catch (const core::serialization::RecordError& e) {
        return Err<void>(
            ErrorCode::InvalidState,
            std::format("Повреждённый файл хранилища {}: {}", path_.string(), e.what())
        );
    }
}

Result<void> FileStore::flush(const Entries& entries) const {
    core::serialization::RecordWriter record;
    record.le(constants::STORE_FILE_MAGIC);
    record.u8(constants::STORE_FILE_VERSION);
    record.compact_size(entries.size());
    for (const auto& [key, value] : entries) {
        record.sized_string(key);
        record.sized_bytes(value);
    }
    const Bytes bytes = std::move(record).finish();

    auto tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Err<void>(
                ErrorCode::StorageIOError,
                std::format("Не удалось создать файл {}", tmp_path.string())
            );
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            return Err<void>(
                ErrorCode::StorageIOError,
                std::format("Ошибка записи файла {}", tmp_path.string())
            );
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        return Err<void>(
            ErrorCode::StorageIOError,
            std::format("Не удалось заменить {}: {}", path_.string(), ec.message())
        );
    }
    return {};
}

Result<std::optional<Bytes>> FileStore::get(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::optional<Bytes>{};
    }
    return std::optional<Bytes>{it->second};
}

Result<void> FileStore::put(std::string_view key, ByteSpan value) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Изменения применяются в памяти только после успешной записи на диск
    auto updated = data_;
    updated.insert_or_assign(std::string(key), Bytes(value.begin(), value.end()));
    if (auto written = flush(updated); !written) {
        return written;
    }
    data_ = std::move(updated);
    return {};
}

Result<void> FileStore::erase(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto updated = data_;
    auto it = updated.find(key);
    if (it == updated.end()) {
        return {};
    }
    updated.erase(it);
    if (auto written = flush(updated); !written) {
        return written;
    }
    data_ = std::move(updated);
    return {};
}

} // namespace incmerkle::storage
