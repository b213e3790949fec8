/**
 * @file merkle.hpp
 * @brief Merkle примитивы аккумулятора
 *
 * Предоставляет:
 * - commit: сжатие пары узлов Keccak-256(left || right)
 * - таблицу zero-хешей (корни пустых поддеревьев)
 * - branch_root: вычисление корня из листа, пути соседей и индекса
 *
 * Порядок конкатенации фиксирован: left, затем right. Внешний верификатор
 * вычисляет корни так же.
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace incmerkle::core {

// =============================================================================
// Commit
// =============================================================================

/**
 * @brief Объединить два хеша в родительский узел
 *
 * @param left Левый потомок
 * @param right Правый потомок
 * @return Hash256 Keccak256(left || right)
 */
[[nodiscard]] Hash256 commit(const Hash256& left, const Hash256& right) noexcept;

// =============================================================================
// Zero-хеши
// =============================================================================

/**
 * @brief Таблица zero-хешей: Z[i] - корень пустого поддерева высоты i
 *
 * Z[0] = 32 нулевых байта, Z[i] = commit(Z[i-1], Z[i-1]).
 */
using ZeroHashTable = std::vector<Hash256>;

/**
 * @brief Представление на таблицу zero-хешей без владения
 */
using ZeroHashView = std::span<const Hash256>;

/**
 * @brief Построить таблицу zero-хешей заданной длины
 *
 * @param depth Количество уровней
 */
[[nodiscard]] ZeroHashTable make_zero_hashes(std::size_t depth);

/**
 * @brief Общая таблица zero-хешей для MAX_TREE_DEPTH уровней
 *
 * Вычисляется один раз при первом обращении и больше не изменяется.
 * Таблица для глубины d - первые d элементов.
 */
[[nodiscard]] const ZeroHashTable& zero_hashes();

/**
 * @brief Получить zero-хеш уровня
 *
 * @param level Высота пустого поддерева (0..MAX_TREE_DEPTH-1)
 * @return Result<Hash256> Хеш или ErrorCode::InvalidState для level вне таблицы
 */
[[nodiscard]] Result<Hash256> zero_hash(std::size_t level);

// =============================================================================
// Проверка доказательств
// =============================================================================

/**
 * @brief Политика обработки доказательства неполной длины
 */
enum class ProofPolicy {
    /// Доказательство должно содержать ровно depth соседей, индекс < 2^depth
    Strict,
    /// Совместимость с исходным контрактом: недостающий сосед - 32 нулевых
    /// байта, лишние соседи и старшие биты индекса игнорируются
    ZeroPadded
};

/**
 * @brief Вычислить корень дерева по листу, пути соседей и индексу
 *
 * Функция не обращается к frontier и не сравнивает результат с корнем:
 * сравнение с доверенным корнем - ответственность вызывающего.
 *
 * Бит i индекса задаёт направление на уровне i:
 * - 1: текущий узел справа, current = commit(sibling, current)
 * - 0: текущий узел слева, current = commit(current, sibling)
 *
 * @param leaf Хеш листа
 * @param proof Соседи от уровня 0 к корню
 * @param index Позиция листа в дереве
 * @param policy Политика для неполного доказательства
 * @param depth Глубина дерева
 * @return Result<Hash256> Корень или ErrorCode::InvalidProof
 */
[[nodiscard]] Result<Hash256> branch_root(
    const Hash256& leaf,
    std::span<const Hash256> proof,
    uint64_t index,
    ProofPolicy policy = ProofPolicy::Strict,
    std::size_t depth = constants::TREE_DEPTH
);

/**
 * @brief Доказательство включения листа
 */
struct MerkleProof {
    /// @brief Хеши соседних узлов от листа к корню
    std::vector<Hash256> siblings;

    /// @brief Индекс листа (битовая маска направлений: 0=лево, 1=право)
    uint64_t index{0};

    /**
     * @brief Вычислить корень для листа
     */
    [[nodiscard]] Result<Hash256> compute_root(
        const Hash256& leaf,
        ProofPolicy policy = ProofPolicy::Strict,
        std::size_t depth = constants::TREE_DEPTH
    ) const;

    /**
     * @brief Проверить, что лист входит в дерево с ожидаемым корнем
     *
     * @return Result<bool> Совпадение корней или ошибка некорректного proof
     */
    [[nodiscard]] Result<bool> verify(
        const Hash256& leaf,
        const Hash256& expected_root,
        ProofPolicy policy = ProofPolicy::Strict,
        std::size_t depth = constants::TREE_DEPTH
    ) const;

    /**
     * @brief Сериализовать: CompactSize количество, хеши, индекс (u64 LE)
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Десериализовать доказательство
     *
     * @return Result<MerkleProof> Доказательство или ErrorCode::InvalidProof
     */
    [[nodiscard]] static Result<MerkleProof> deserialize(ByteSpan data);
};

} // namespace incmerkle::core
