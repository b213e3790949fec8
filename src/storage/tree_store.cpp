/**
 * @file tree_store.cpp
 * @brief Реализация адаптера персистентности frontier
 */

#include "tree_store.hpp"

#include <format>

namespace incmerkle::storage {

TreeStore::TreeStore(KeyValueStore& store, std::string key, std::size_t depth)
    : store_(store)
    , key_(std::move(key))
    , depth_(depth) {}

Result<core::Frontier> TreeStore::load() {
    auto record = store_.get(key_);
    if (!record) {
        return std::unexpected(record.error());
    }

    if (!record->has_value()) {
        return core::Frontier::with_depth(depth_);
    }

    auto frontier = core::Frontier::deserialize(**record);
    if (!frontier) {
        return frontier;
    }

    if (frontier->depth() != depth_) {
        return Err<core::Frontier>(
            ErrorCode::InvalidState,
            std::format("Сохранённое дерево '{}' имеет глубину {}, ожидается {}",
                        key_, frontier->depth(), depth_)
        );
    }
    return frontier;
}

Result<void> TreeStore::save(const core::Frontier& frontier) {
    if (frontier.depth() != depth_) {
        return Err<void>(
            ErrorCode::InvalidState,
            std::format("Глубина дерева {} не совпадает с хранилищем ({})", frontier.depth(), depth_)
        );
    }
    return store_.put(key_, frontier.serialize());
}

} // namespace incmerkle::storage
