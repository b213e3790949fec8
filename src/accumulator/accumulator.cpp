/**
 * @file accumulator.cpp
 * @brief Реализация хранимого аккумулятора
 */

#include "accumulator.hpp"
#include "../core/hex.hpp"

#include <format>

namespace incmerkle {

Accumulator::Accumulator(storage::TreeStore& store, log::EventLog* events) noexcept
    : store_(store)
    , events_(events) {}

void Accumulator::report(const Error& error) {
    if (!events_) {
        return;
    }

    switch (error.code) {
        case ErrorCode::TreeFull:
            events_->warn(log::EventType::TreeFull, error.message);
            break;
        case ErrorCode::InvalidState:
            events_->error(log::EventType::InvalidState, error.message);
            break;
        case ErrorCode::InvalidProof:
            events_->warn(log::EventType::ProofRejected, error.message);
            break;
        default:
            events_->error(log::EventType::StorageError, error.message);
            break;
    }
}

Result<core::Frontier> Accumulator::load() {
    auto frontier = store_.load();
    if (!frontier) {
        report(frontier.error());
        return frontier;
    }

    if (events_) {
        events_->debug(log::EventType::StateLoaded, std::format(
            "'{}': {} листьев, branch {}", store_.key(), frontier->count(), frontier->branch().size()
        ));
    }
    return frontier;
}

Result<core::Frontier> Accumulator::insert(const Hash256& leaf) {
    auto frontier = load();
    if (!frontier) {
        return frontier;
    }

    if (auto inserted = frontier->insert(leaf); !inserted) {
        report(inserted.error());
        return std::unexpected(inserted.error());
    }

    if (auto saved = store_.save(*frontier); !saved) {
        report(saved.error());
        return std::unexpected(saved.error());
    }

    if (events_) {
        events_->info(log::EventType::LeafInserted, std::format(
            "#{} 0x{}", frontier->count() - 1, core::to_hex(leaf)
        ));
        events_->debug(log::EventType::StateSaved, std::format(
            "'{}': {} листьев", store_.key(), frontier->count()
        ));
    }
    return frontier;
}

Result<Hash256> Accumulator::get_root() {
    auto frontier = load();
    if (!frontier) {
        return std::unexpected(frontier.error());
    }

    auto root = frontier->root();
    if (!root) {
        report(root.error());
        return root;
    }

    if (events_) {
        events_->debug(log::EventType::RootComputed, std::format(
            "0x{} ({} листьев)", core::to_hex(*root), frontier->count()
        ));
    }
    return root;
}

Result<core::Frontier> Accumulator::get_tree() {
    return load();
}

Result<Hash256> Accumulator::branch_root(
    const Hash256& leaf,
    std::span<const Hash256> proof,
    uint64_t index,
    core::ProofPolicy policy,
    std::size_t depth
) {
    return core::branch_root(leaf, proof, index, policy, depth);
}

} // namespace incmerkle
