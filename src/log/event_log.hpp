/**
 * @file event_log.hpp
 * @brief Журнал событий аккумулятора
 *
 * Хранит последние события в кольцевом буфере и, при включённом echo,
 * печатает их в stderr с ANSI форматированием:
 *
 *   14:03:27 [INFO] [LEAF_INSERTED] leaf #5 0x...
 *
 * События ниже настроенного уровня отбрасываются.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace incmerkle::log {

// =============================================================================
// Уровни и типы событий
// =============================================================================

/**
 * @brief Уровень логирования (чем больше значение, тем подробнее)
 */
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] Result<LogLevel> parse_level(std::string_view name);

/**
 * @brief Тип события
 */
enum class EventType {
    LeafInserted,   ///< Лист добавлен в дерево
    RootComputed,   ///< Вычислен корень
    TreeFull,       ///< Отказ вставки: дерево заполнено
    InvalidState,   ///< Обнаружено некорректное состояние
    StateLoaded,    ///< Frontier загружен из хранилища
    StateSaved,     ///< Frontier сохранён в хранилище
    StorageError,   ///< Ошибка хранилища
    ProofRejected   ///< Доказательство отклонено
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::LeafInserted:  return "LEAF_INSERTED";
        case EventType::RootComputed:  return "ROOT";
        case EventType::TreeFull:      return "TREE_FULL";
        case EventType::InvalidState:  return "INVALID_STATE";
        case EventType::StateLoaded:   return "LOADED";
        case EventType::StateSaved:    return "SAVED";
        case EventType::StorageError:  return "STORAGE_ERROR";
        case EventType::ProofRejected: return "PROOF_REJECTED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    LogLevel level;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

// =============================================================================
// Конфигурация
// =============================================================================

/**
 * @brief Конфигурация журнала
 */
struct EventLogConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Размер истории событий
    std::size_t event_history = constants::DEFAULT_EVENT_HISTORY;

    /// @brief Использовать цветной вывод
    bool color = true;

    /// @brief Печатать события в поток вывода
    bool echo = true;
};

// =============================================================================
// EventLog
// =============================================================================

/**
 * @brief Потокобезопасный журнал событий
 */
class EventLog {
public:
    /**
     * @brief Создать журнал
     *
     * Неизвестный уровень в конфигурации трактуется как "info";
     * проверка выполняется в Config::validate().
     *
     * @param config Конфигурация
     * @param out Поток для echo (по умолчанию std::cerr)
     */
    explicit EventLog(const EventLogConfig& config, std::ostream& out = std::cerr);

    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /**
     * @brief Записать событие
     */
    void record(EventType type, LogLevel level, std::string message);

    void info(EventType type, std::string message) {
        record(type, LogLevel::Info, std::move(message));
    }

    void warn(EventType type, std::string message) {
        record(type, LogLevel::Warn, std::move(message));
    }

    void error(EventType type, std::string message) {
        record(type, LogLevel::Error, std::move(message));
    }

    void debug(EventType type, std::string message) {
        record(type, LogLevel::Debug, std::move(message));
    }

    /**
     * @brief Проверить, будет ли записано событие уровня level
     */
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    /**
     * @brief Последние count событий (от старых к новым)
     */
    [[nodiscard]] std::vector<EventRecord> recent(std::size_t count) const;

    [[nodiscard]] std::size_t size() const;

    void clear();

    [[nodiscard]] LogLevel level() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace incmerkle::log
