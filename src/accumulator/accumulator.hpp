/**
 * @file accumulator.hpp
 * @brief Хранимый инкрементальный Merkle аккумулятор
 *
 * Связывает frontier с адаптером персистентности:
 * - insert: load -> Frontier::insert -> save
 * - get_root / get_tree: только чтение
 * - branch_root: проверка доказательств без состояния
 *
 * Блокировок нет: вызывающая сторона сериализует доступ к одному дереву.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/frontier.hpp"
#include "../core/primitives/merkle.hpp"
#include "../log/event_log.hpp"
#include "../storage/tree_store.hpp"

#include <span>

namespace incmerkle {

class Accumulator {
public:
    /**
     * @brief Создать аккумулятор поверх хранилища
     *
     * @param store Адаптер персистентности (должен жить дольше аккумулятора)
     * @param events Журнал событий (опционально)
     */
    explicit Accumulator(storage::TreeStore& store, log::EventLog* events = nullptr) noexcept;

    /**
     * @brief Добавить лист и сохранить новое состояние
     *
     * При любой ошибке (TreeFull, InvalidState, ошибка хранилища)
     * сохранённое состояние не меняется.
     *
     * @return Result<core::Frontier> Frontier после вставки
     */
    [[nodiscard]] Result<core::Frontier> insert(const Hash256& leaf);

    /**
     * @brief Корень текущего дерева
     */
    [[nodiscard]] Result<Hash256> get_root();

    /**
     * @brief Текущий frontier (пустой, если дерево ещё не сохранялось)
     */
    [[nodiscard]] Result<core::Frontier> get_tree();

    /**
     * @brief Корень по листу, пути соседей и индексу
     */
    [[nodiscard]] static Result<Hash256> branch_root(
        const Hash256& leaf,
        std::span<const Hash256> proof,
        uint64_t index,
        core::ProofPolicy policy = core::ProofPolicy::Strict,
        std::size_t depth = constants::TREE_DEPTH
    );

private:
    [[nodiscard]] Result<core::Frontier> load();
    void report(const Error& error);

    storage::TreeStore& store_;
    log::EventLog* events_;
};

} // namespace incmerkle
