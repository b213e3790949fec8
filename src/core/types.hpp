/**
 * @file types.hpp
 * @brief Базовые типы для incmerkle
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (лист, узел дерева, корень)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 * - InternalFault: нарушение внутренней согласованности (не ошибка вызова)
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace incmerkle {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - листьев аккумулятора (уже захешированные данные вызывающей стороны)
 * - узлов дерева и zero-хешей
 * - корня дерева
 *
 * Хранится и передаётся как сырые байты, без hex и без префикса длины.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для сериализованных записей (frontier, proof, файл хранилища).
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок incmerkle
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Все ошибки обнаруживаются до изменения состояния: неудачный вызов
 * оставляет frontier нетронутым.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки дерева (100-199)
    TreeFull = 100,
    InvalidState = 101,
    InvalidProof = 102,

    // Ошибки конфигурации (200-299)
    ConfigNotFound = 200,
    ConfigParseError = 201,
    ConfigInvalidValue = 202,

    // Ошибки хранилища (300-399)
    StorageIOError = 300,

    // Ошибки входных данных (400-499)
    InvalidHex = 400,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::TreeFull: return "Дерево заполнено";
        case ErrorCode::InvalidState: return "Нарушен инвариант состояния дерева";
        case ErrorCode::InvalidProof: return "Некорректное доказательство включения";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::StorageIOError: return "Ошибка ввода/вывода хранилища";
        case ErrorCode::InvalidHex: return "Некорректная hex строка";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * auto root = frontier.root();
 * if (!root) {
 *     std::cerr << root.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Внутренние сбои
// =============================================================================

/**
 * @brief Нарушение внутренней согласованности алгоритма
 *
 * Вставка в дерево, прошедшее проверки ёмкости и инвариантов, всегда
 * завершается внутри цикла. Выход из цикла - баг, передаётся исключением.
 */
class InternalFault : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace incmerkle
