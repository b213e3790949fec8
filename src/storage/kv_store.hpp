/**
 * @file kv_store.hpp
 * @brief Key-value хранилище состояния
 *
 * Внешний сервис персистентности: ядро аккумулятора обращается к нему
 * только через TreeStore (load/save под одним ключом).
 *
 * Реализации:
 * - MemoryStore: в памяти процесса (тесты, backend "memory")
 * - FileStore: все записи в одном файле, перезапись через временный файл
 */

#pragma once

#include "../core/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace incmerkle::storage {

/**
 * @brief Абстрактный интерфейс key-value хранилища
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /**
     * @brief Получить значение по ключу
     *
     * @return Result<std::optional<Bytes>> Значение, nullopt если ключа нет, или ошибка
     */
    [[nodiscard]] virtual Result<std::optional<Bytes>> get(std::string_view key) = 0;

    /**
     * @brief Записать значение под ключом
     */
    [[nodiscard]] virtual Result<void> put(std::string_view key, ByteSpan value) = 0;

    /**
     * @brief Удалить ключ (отсутствующий ключ - не ошибка)
     */
    [[nodiscard]] virtual Result<void> erase(std::string_view key) = 0;
};

/**
 * @brief Хранилище в памяти
 */
class MemoryStore : public KeyValueStore {
public:
    [[nodiscard]] Result<std::optional<Bytes>> get(std::string_view key) override;
    [[nodiscard]] Result<void> put(std::string_view key, ByteSpan value) override;
    [[nodiscard]] Result<void> erase(std::string_view key) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Bytes, std::less<>> data_;
};

/**
 * @brief Файловое хранилище
 *
 * Формат файла: magic (u32 LE) | version (u8) | CompactSize N | N x (key, value),
 * где key и value - CompactSize длина и байты.
 *
 * Каждая запись переписывает файл целиком: данные пишутся во временный
 * файл рядом с целевым и атомарно переименовываются.
 */
class FileStore : public KeyValueStore {
public:
    /**
     * @brief Открыть файловое хранилище
     *
     * Отсутствующий файл - пустое хранилище.
     *
     * @param path Путь к файлу
     * @return Result<std::unique_ptr<FileStore>> Хранилище или ошибка
     *         (StorageIOError при ошибке чтения, InvalidState для повреждённого файла)
     */
    [[nodiscard]] static Result<std::unique_ptr<FileStore>> open(std::filesystem::path path);

    [[nodiscard]] Result<std::optional<Bytes>> get(std::string_view key) override;
    [[nodiscard]] Result<void> put(std::string_view key, ByteSpan value) override;
    [[nodiscard]] Result<void> erase(std::string_view key) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit FileStore(std::filesystem::path path);

    [[nodiscard]] Result<void> load();
    using Entries = std::map<std::string, Bytes, std::less<>>;

    [[nodiscard]] Result<void> flush(const Entries& entries) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    Entries data_;
};

} // namespace incmerkle::storage
