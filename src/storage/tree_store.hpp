/**
 * @file tree_store.hpp
 * @brief Адаптер персистентности frontier
 *
 * Единственная точка, через которую ядро обращается к хранилищу:
 * load() и save() под одним фиксированным ключом.
 */

#pragma once

#include "kv_store.hpp"
#include "../core/constants.hpp"
#include "../core/primitives/frontier.hpp"

#include <string>

namespace incmerkle::storage {

class TreeStore {
public:
    /**
     * @brief Создать адаптер
     *
     * @param store Key-value хранилище (должно жить дольше адаптера)
     * @param key Ключ записи дерева
     * @param depth Глубина дерева для пустого frontier
     */
    explicit TreeStore(
        KeyValueStore& store,
        std::string key = std::string(constants::DEFAULT_TREE_KEY),
        std::size_t depth = constants::TREE_DEPTH
    );

    /**
     * @brief Загрузить frontier
     *
     * Отсутствующая запись - пустой frontier заданной глубины.
     * Запись с другой глубиной - ErrorCode::InvalidState.
     */
    [[nodiscard]] Result<core::Frontier> load();

    /**
     * @brief Сохранить frontier
     */
    [[nodiscard]] Result<void> save(const core::Frontier& frontier);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

private:
    KeyValueStore& store_;
    std::string key_;
    std::size_t depth_;
};

} // namespace incmerkle::storage
