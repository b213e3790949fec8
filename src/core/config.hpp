/**
 * @file config.hpp
 * @brief Конфигурация incmerkle
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (incmerkle.toml):
 * @code
 * [tree]
 * depth = 32
 *
 * [storage]
 * backend = "file"      # "file" | "memory"
 * path = "incmerkle.dat"
 * key = "TREE"
 *
 * [logging]
 * level = "info"
 * event_history = 200
 * color = true
 * echo = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "../log/event_log.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace incmerkle {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Параметры дерева
 */
struct TreeConfig {
    /// @brief Глубина дерева (1..32)
    std::size_t depth = constants::TREE_DEPTH;
};

/**
 * @brief Параметры хранилища
 */
struct StorageConfig {
    /// @brief Тип хранилища: "file" или "memory"
    std::string backend = "file";

    /// @brief Путь к файлу хранилища (для backend "file")
    std::string path = std::string(constants::DEFAULT_STORE_PATH);

    /// @brief Ключ записи дерева
    std::string key = std::string(constants::DEFAULT_TREE_KEY);
};

/**
 * @brief Полная конфигурация incmerkle
 */
struct Config {
    TreeConfig tree;
    StorageConfig storage;
    log::EventLogConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * Отсутствующие ключи сохраняют значения по умолчанию.
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./incmerkle.toml
     * 3. /etc/incmerkle/incmerkle.toml
     * 4. ~/.config/incmerkle/incmerkle.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ErrorCode::ConfigNotFound
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * - Глубина дерева в диапазоне 1..32
     * - Известный тип хранилища, непустой путь для "file"
     * - Непустой ключ дерева
     * - Известный уровень логирования
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace incmerkle
