/**
 * @file frontier.cpp
 * @brief Реализация frontier аккумулятора
 */

#include "frontier.hpp"
#include "../serialization/codec.hpp"

#include <bit>
#include <format>

namespace incmerkle::core {

namespace {

[[nodiscard]] bool depth_in_range(std::size_t depth) noexcept {
    return depth >= 1 && depth <= constants::MAX_TREE_DEPTH;
}

[[nodiscard]] Error depth_error(std::size_t depth) {
    return Error{
        ErrorCode::InvalidState,
        std::format("Глубина дерева {} вне диапазона 1..{}", depth, constants::MAX_TREE_DEPTH)
    };
}

} // anonymous namespace

Frontier::Frontier() noexcept
    : depth_(constants::TREE_DEPTH), count_(0) {}

Frontier::Frontier(std::size_t depth, std::vector<Hash256> branch, uint32_t count) noexcept
    : depth_(depth), branch_(std::move(branch)), count_(count) {}

Result<Frontier> Frontier::with_depth(std::size_t depth) {
    if (!depth_in_range(depth)) {
        return std::unexpected(depth_error(depth));
    }
    return Frontier(depth, {}, 0);
}

Result<Frontier> Frontier::restore(
    std::size_t depth,
    std::vector<Hash256> branch,
    uint32_t count
) {
    if (!depth_in_range(depth)) {
        return std::unexpected(depth_error(depth));
    }
    return Frontier(depth, std::move(branch), count);
}

bool Frontier::full() const noexcept {
    return count_ >= constants::max_leaves(depth_);
}

Result<void> Frontier::check_invariants() const {
    if (branch_.size() > depth_) {
        return Err<void>(
            ErrorCode::InvalidState,
            std::format("Длина branch {} превышает глубину {}", branch_.size(), depth_)
        );
    }
    if (count_ > constants::max_leaves(depth_)) {
        return Err<void>(
            ErrorCode::InvalidState,
            std::format("Счётчик {} превышает ёмкость дерева глубины {}", count_, depth_)
        );
    }
    // Каждый установленный бит счётчика должен иметь сохранённое поддерево
    if (branch_.size() < static_cast<std::size_t>(std::bit_width(count_))) {
        return Err<void>(
            ErrorCode::InvalidState,
            std::format("Длина branch {} меньше требуемой для счётчика {}", branch_.size(), count_)
        );
    }
    return {};
}

// =============================================================================
// Вставка
// =============================================================================

Result<void> Frontier::insert(const Hash256& leaf) {
    if (full()) {
        return Err<void>(
            ErrorCode::TreeFull,
            std::format("Дерево глубины {} заполнено ({} листьев)", depth_, count_)
        );
    }
    if (auto valid = check_invariants(); !valid) {
        return valid;
    }

    // Новый счётчик и перенос вычисляются локально: состояние меняется
    // только в момент записи в branch
    const uint32_t next = count_ + 1;
    Hash256 carry = leaf;

    for (std::size_t i = 0; i < depth_; ++i) {
        if ((next >> i) & 1) {
            // Уровень i завершается: сохраняем поддерево и останавливаемся
            if (i < branch_.size()) {
                branch_[i] = carry;
            } else {
                branch_.push_back(carry);
            }
            count_ = next;
            return {};
        }

        // На уровне i уже лежит завершённое левое поддерево
        carry = commit(branch_[i], carry);
    }

    throw InternalFault(std::format(
        "Вставка не завершилась: счётчик {} не помещается в {} бит", next, depth_
    ));
}

// =============================================================================
// Корень
// =============================================================================

Result<Hash256> Frontier::root(ZeroHashView zeros) const {
    if (auto valid = check_invariants(); !valid) {
        return std::unexpected(valid.error());
    }
    if (zeros.size() != depth_) {
        return Err<Hash256>(
            ErrorCode::InvalidState,
            std::format("Таблица zero-хешей содержит {} элементов, требуется {}", zeros.size(), depth_)
        );
    }

    Hash256 current{};
    for (std::size_t i = 0; i < depth_; ++i) {
        if ((count_ >> i) & 1) {
            // Завершённое левое поддерево + накопленная правая часть
            current = commit(branch_[i], current);
        } else {
            // Правый сосед гарантированно пуст
            current = commit(current, zeros[i]);
        }
    }
    return current;
}

Result<Hash256> Frontier::root() const {
    return root(ZeroHashView(zero_hashes()).first(depth_));
}

// =============================================================================
// Сериализация
// =============================================================================

Bytes Frontier::serialize() const {
    serialization::RecordWriter record(
        6 + serialization::compact_size_length(branch_.size()) + branch_.size() * constants::HASH_SIZE
    );

    record.u8(constants::FRONTIER_FORMAT_VERSION);
    record.u8(static_cast<uint8_t>(depth_));
    record.le(count_);
    record.hash_list(branch_);

    return std::move(record).finish();
}

Result<Frontier> Frontier::deserialize(ByteSpan data) {
    try {
        serialization::RecordReader record(data);

        const uint8_t version = record.u8();
        if (version != constants::FRONTIER_FORMAT_VERSION) {
            return Err<Frontier>(
                ErrorCode::InvalidState,
                std::format("Неизвестная версия формата frontier: {}", version)
            );
        }

        const uint8_t depth = record.u8();
        const auto count = record.le<uint32_t>();
        auto branch = record.hash_list();
        record.expect_end();

        return restore(depth, std::move(branch), count);

    } catch (const serialization::RecordError& e) {
        return Err<Frontier>(
            ErrorCode::InvalidState,
            std::format("Повреждённая запись frontier: {}", e.what())
        );
    }
}

} // namespace incmerkle::core
