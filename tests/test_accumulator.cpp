/**
 * @file test_accumulator.cpp
 * @brief Тесты хранимого аккумулятора: цикл load/insert/save
 */

#include <gtest/gtest.h>

#include "accumulator/accumulator.hpp"
#include "storage/kv_store.hpp"
#include "reference_tree.hpp"

#include <optional>

namespace incmerkle::tests {

namespace {

/**
 * @brief Хранилище, отклоняющее запись после заданного числа put
 */
class FailingStore : public storage::KeyValueStore {
public:
    explicit FailingStore(std::size_t allowed_puts)
        : allowed_puts_(allowed_puts) {}

    Result<std::optional<Bytes>> get(std::string_view key) override {
        return inner_.get(key);
    }

    Result<void> put(std::string_view key, ByteSpan value) override {
        if (allowed_puts_ == 0) {
            return Err<void>(ErrorCode::StorageIOError, "disk full");
        }
        --allowed_puts_;
        return inner_.put(key, value);
    }

    Result<void> erase(std::string_view key) override {
        return inner_.erase(key);
    }

private:
    storage::MemoryStore inner_;
    std::size_t allowed_puts_;
};

log::EventLogConfig quiet_config() {
    log::EventLogConfig config;
    config.level = "debug";
    config.echo = false;
    return config;
}

} // anonymous namespace

class AccumulatorTest : public ::testing::Test {
protected:
    storage::MemoryStore kv_;
    storage::TreeStore store_{kv_};
    log::EventLog events_{quiet_config()};
    Accumulator accumulator_{store_, &events_};
};

TEST_F(AccumulatorTest, EmptyTree) {
    auto tree = accumulator_.get_tree();
    ASSERT_TRUE(tree.has_value());
    EXPECT_TRUE(tree->empty());

    auto root = accumulator_.get_root();
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, ReferenceTree({}, constants::TREE_DEPTH).root());
}

TEST_F(AccumulatorTest, InsertPersistsFrontier) {
    const auto leaves = make_leaves(10);
    for (uint64_t i = 0; i < leaves.size(); ++i) {
        auto frontier = accumulator_.insert(leaves[i]);
        ASSERT_TRUE(frontier.has_value()) << frontier.error().message;
        EXPECT_EQ(frontier->count(), i + 1);
    }

    auto root = accumulator_.get_root();
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(*root, ReferenceTree(leaves, constants::TREE_DEPTH).root());

    // Новый аккумулятор поверх того же хранилища видит то же состояние
    Accumulator reopened(store_);
    auto tree = reopened.get_tree();
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->count(), 10u);
}

TEST_F(AccumulatorTest, InsertedLeafProvesAgainstStoredRoot) {
    const auto leaves = make_leaves(6);
    for (const auto& leaf : leaves) {
        ASSERT_TRUE(accumulator_.insert(leaf).has_value());
    }
    auto root = accumulator_.get_root();
    ASSERT_TRUE(root.has_value());

    ReferenceTree reference(leaves, constants::TREE_DEPTH);
    auto computed = Accumulator::branch_root(leaves[5], reference.proof(5), 5);
    ASSERT_TRUE(computed.has_value());
    EXPECT_EQ(*computed, *root);
}

TEST_F(AccumulatorTest, TreeFullLeavesStoreUntouched) {
    storage::TreeStore small_store(kv_, "SMALL", 2);
    Accumulator small(small_store, &events_);

    for (const auto& leaf : make_leaves(3)) {
        ASSERT_TRUE(small.insert(leaf).has_value());
    }
    auto before = kv_.get("SMALL");
    ASSERT_TRUE(before.has_value());

    auto result = small.insert(make_leaf(3));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TreeFull);

    auto after = kv_.get("SMALL");
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(*after, *before);

    auto recent = events_.recent(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].type, log::EventType::TreeFull);
}

TEST_F(AccumulatorTest, FailedSaveKeepsPreviousState) {
    FailingStore failing(1);
    storage::TreeStore store(failing);
    Accumulator accumulator(store, &events_);

    ASSERT_TRUE(accumulator.insert(make_leaf(0)).has_value());

    auto result = accumulator.insert(make_leaf(1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StorageIOError);

    auto tree = accumulator.get_tree();
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->count(), 1u);
}

TEST_F(AccumulatorTest, CorruptStateIsReported) {
    ASSERT_TRUE(kv_.put(constants::DEFAULT_TREE_KEY, Bytes{0x02}).has_value());

    auto result = accumulator_.insert(make_leaf(0));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);

    auto recent = events_.recent(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].type, log::EventType::InvalidState);
}

TEST_F(AccumulatorTest, InsertIsLogged) {
    ASSERT_TRUE(accumulator_.insert(make_leaf(0)).has_value());

    bool found = false;
    for (const auto& event : events_.recent(10)) {
        if (event.type == log::EventType::LeafInserted) {
            found = true;
            EXPECT_EQ(event.level, log::LogLevel::Info);
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(AccumulatorTest, StrictBranchRootRejectsShortProof) {
    std::vector<Hash256> proof(3);
    auto strict = Accumulator::branch_root(make_leaf(0), proof, 0);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, ErrorCode::InvalidProof);

    auto legacy = Accumulator::branch_root(make_leaf(0), proof, 0, core::ProofPolicy::ZeroPadded);
    EXPECT_TRUE(legacy.has_value());
}

} // namespace incmerkle::tests
