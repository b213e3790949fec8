/**
 * @file frontier.hpp
 * @brief Frontier инкрементального Merkle аккумулятора
 *
 * Frontier - минимальное O(depth) состояние, достаточное для вычисления
 * корня дерева из всех вставленных листьев (заполнение слева направо)
 * без хранения самих листьев:
 * - branch[i]: корень последнего завершённого поддерева высоты i
 * - count: количество вставленных листьев
 *
 * Инварианты:
 * - 1 <= depth <= MAX_TREE_DEPTH
 * - branch.size() <= depth
 * - count <= 2^depth - 1
 * - для каждого установленного бита i счётчика существует branch[i]
 *
 * @note Класс не потокобезопасен: вызывающий код сериализует доступ
 *       к одному экземпляру (один insert за раз).
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"
#include "merkle.hpp"

#include <cstdint>
#include <vector>

namespace incmerkle::core {

class Frontier {
public:
    /**
     * @brief Создать пустой frontier глубины TREE_DEPTH
     */
    Frontier() noexcept;

    /**
     * @brief Создать пустой frontier заданной глубины
     *
     * @param depth Глубина дерева (1..MAX_TREE_DEPTH)
     * @return Result<Frontier> Frontier или ErrorCode::InvalidState
     */
    [[nodiscard]] static Result<Frontier> with_depth(std::size_t depth);

    /**
     * @brief Восстановить frontier из сохранённых частей
     *
     * Проверяется только глубина. Нарушения остальных инвариантов
     * (повреждённое состояние хранилища) сообщаются операциями insert/root.
     */
    [[nodiscard]] static Result<Frontier> restore(
        std::size_t depth,
        std::vector<Hash256> branch,
        uint32_t count
    );

    /**
     * @brief Вставить лист
     *
     * Ripple-carry обновление: для нового значения счётчика n ищется
     * младший установленный бит j; лист поднимается через уровни 0..j-1,
     * объединяясь с сохранёнными поддеревьями, и записывается в branch[j].
     *
     * Проверки выполняются до любых изменений: при ошибке состояние
     * остаётся байт-в-байт прежним.
     *
     * @param leaf Хеш листа
     * @return Result<void> Успех, ErrorCode::TreeFull или ErrorCode::InvalidState
     * @throws InternalFault если цикл завершился без записи (нарушен инвариант ёмкости)
     */
    [[nodiscard]] Result<void> insert(const Hash256& leaf);

    /**
     * @brief Вычислить корень дерева
     *
     * Незаполненные позиции справа дополняются корнями пустых поддеревьев.
     *
     * @param zeros Таблица zero-хешей, ровно depth элементов
     * @return Result<Hash256> Корень или ErrorCode::InvalidState
     */
    [[nodiscard]] Result<Hash256> root(ZeroHashView zeros) const;

    /**
     * @brief Вычислить корень дерева с общей таблицей zero-хешей
     */
    [[nodiscard]] Result<Hash256> root() const;

    /**
     * @brief Проверить инварианты состояния
     */
    [[nodiscard]] Result<void> check_invariants() const;

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
    [[nodiscard]] uint32_t count() const noexcept { return count_; }
    [[nodiscard]] const std::vector<Hash256>& branch() const noexcept { return branch_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    /**
     * @brief Достигнута ли ёмкость дерева
     */
    [[nodiscard]] bool full() const noexcept;

    /**
     * @brief Сериализовать frontier
     *
     * Формат: version (u8) | depth (u8) | count (u32 LE) | CompactSize len | branch
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Десериализовать frontier
     *
     * @return Result<Frontier> Frontier или ErrorCode::InvalidState
     */
    [[nodiscard]] static Result<Frontier> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const Frontier& other) const = default;

private:
    Frontier(std::size_t depth, std::vector<Hash256> branch, uint32_t count) noexcept;

    std::size_t depth_;
    std::vector<Hash256> branch_;
    uint32_t count_;
};

} // namespace incmerkle::core
