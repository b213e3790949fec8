/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace incmerkle {

namespace {

Result<void> parse_tree(const toml::table& section, TreeConfig& tree) {
    if (auto depth = section["depth"].value<int64_t>()) {
        if (*depth < 1 || *depth > static_cast<int64_t>(constants::MAX_TREE_DEPTH)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("tree.depth = {} вне диапазона 1..{}", *depth, constants::MAX_TREE_DEPTH)
            );
        }
        tree.depth = static_cast<std::size_t>(*depth);
    }
    return {};
}

void parse_storage(const toml::table& section, StorageConfig& storage) {
    storage.backend = section["backend"].value_or(storage.backend);
    storage.path = section["path"].value_or(storage.path);
    storage.key = section["key"].value_or(storage.key);
}

Result<void> parse_logging(const toml::table& section, log::EventLogConfig& logging) {
    logging.level = section["level"].value_or(logging.level);
    logging.color = section["color"].value_or(logging.color);
    logging.echo = section["echo"].value_or(logging.echo);

    if (auto history = section["event_history"].value<int64_t>()) {
        if (*history < 0) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                "logging.event_history не может быть отрицательным"
            );
        }
        logging.event_history = static_cast<std::size_t>(*history);
    }
    return {};
}

/**
 * @brief Стандартные пути поиска incmerkle.toml
 */
std::vector<std::filesystem::path> default_search_paths() {
    std::vector<std::filesystem::path> paths = {
        "incmerkle.toml",
        "/etc/incmerkle/incmerkle.toml",
    };
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(std::filesystem::path(home) / ".config" / "incmerkle" / "incmerkle.toml");
    }
    return paths;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    toml::table table;
    try {
        table = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }

    Config config;

    if (auto tree = table["tree"].as_table()) {
        if (auto parsed = parse_tree(*tree, config.tree); !parsed) {
            return std::unexpected(parsed.error());
        }
    }
    if (auto storage = table["storage"].as_table()) {
        parse_storage(*storage, config.storage);
    }
    if (auto logging = table["logging"].as_table()) {
        if (auto parsed = parse_logging(*logging, config.logging); !parsed) {
            return std::unexpected(parsed.error());
        }
    }

    return config;
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(*path);
    }

    for (const auto& candidate : default_search_paths()) {
        if (std::filesystem::exists(candidate)) {
            return load(candidate);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (tree.depth < 1 || tree.depth > constants::MAX_TREE_DEPTH) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Глубина дерева должна быть от 1 до {}", constants::MAX_TREE_DEPTH)
        );
    }

    if (storage.backend != "file" && storage.backend != "memory") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "storage.backend должен быть 'file' или 'memory'"
        );
    }

    if (storage.backend == "file" && storage.path.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Не указан путь к файлу хранилища (storage.path)"
        );
    }

    if (storage.key.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Ключ дерева не может быть пустым (storage.key)"
        );
    }

    if (auto level = log::parse_level(logging.level); !level) {
        return std::unexpected(level.error());
    }

    return {};
}

} // namespace incmerkle
