/**
 * @file merkle.cpp
 * @brief Реализация Merkle примитивов
 */

#include "merkle.hpp"
#include "../serialization/codec.hpp"
#include "../../crypto/keccak256.hpp"

#include <format>

namespace incmerkle::core {

// =============================================================================
// Commit
// =============================================================================

Hash256 commit(const Hash256& left, const Hash256& right) noexcept {
    crypto::Keccak256 hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

// =============================================================================
// Zero-хеши
// =============================================================================

ZeroHashTable make_zero_hashes(std::size_t depth) {
    ZeroHashTable table;
    table.reserve(depth);

    Hash256 current{};
    for (std::size_t i = 0; i < depth; ++i) {
        table.push_back(current);
        current = commit(current, current);
    }
    return table;
}

const ZeroHashTable& zero_hashes() {
    // Инициализация function-local static потокобезопасна
    static const ZeroHashTable table = make_zero_hashes(constants::MAX_TREE_DEPTH);
    return table;
}

Result<Hash256> zero_hash(std::size_t level) {
    const auto& table = zero_hashes();
    if (level >= table.size()) {
        return Err<Hash256>(
            ErrorCode::InvalidState,
            std::format("Уровень zero-хеша {} вне таблицы (0..{})", level, table.size() - 1)
        );
    }
    return table[level];
}

// =============================================================================
// Проверка доказательств
// =============================================================================

Result<Hash256> branch_root(
    const Hash256& leaf,
    std::span<const Hash256> proof,
    uint64_t index,
    ProofPolicy policy,
    std::size_t depth
) {
    if (depth == 0 || depth > constants::MAX_TREE_DEPTH) {
        return Err<Hash256>(
            ErrorCode::InvalidState,
            std::format("Глубина дерева {} вне диапазона 1..{}", depth, constants::MAX_TREE_DEPTH)
        );
    }

    if (policy == ProofPolicy::Strict) {
        if (proof.size() != depth) {
            return Err<Hash256>(
                ErrorCode::InvalidProof,
                std::format("Доказательство содержит {} соседей, требуется {}", proof.size(), depth)
            );
        }
        if (index > constants::max_leaves(depth)) {
            return Err<Hash256>(
                ErrorCode::InvalidProof,
                std::format("Индекс {} не помещается в дерево глубины {}", index, depth)
            );
        }
    }

    const Hash256 zero{};
    Hash256 current = leaf;

    for (std::size_t i = 0; i < depth; ++i) {
        const Hash256& sibling = i < proof.size() ? proof[i] : zero;
        if ((index >> i) & 1) {
            current = commit(sibling, current);
        } else {
            current = commit(current, sibling);
        }
    }

    return current;
}

Result<Hash256> MerkleProof::compute_root(
    const Hash256& leaf,
    ProofPolicy policy,
    std::size_t depth
) const {
    return branch_root(leaf, siblings, index, policy, depth);
}

Result<bool> MerkleProof::verify(
    const Hash256& leaf,
    const Hash256& expected_root,
    ProofPolicy policy,
    std::size_t depth
) const {
    auto computed = compute_root(leaf, policy, depth);
    if (!computed) {
        return std::unexpected(computed.error());
    }
    return *computed == expected_root;
}

Bytes MerkleProof::serialize() const {
    serialization::RecordWriter record(
        serialization::compact_size_length(siblings.size()) + siblings.size() * constants::HASH_SIZE + 8
    );
    record.hash_list(siblings);
    record.le(index);
    return std::move(record).finish();
}

Result<MerkleProof> MerkleProof::deserialize(ByteSpan data) {
    try {
        serialization::RecordReader record(data);

        MerkleProof proof;
        proof.siblings = record.hash_list();
        proof.index = record.le<uint64_t>();
        record.expect_end();
        return proof;

    } catch (const serialization::RecordError& e) {
        return Err<MerkleProof>(
            ErrorCode::InvalidProof,
            std::format("Повреждённое доказательство: {}", e.what())
        );
    }
}

} // namespace incmerkle::core
