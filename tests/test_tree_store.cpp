/**
 * @file test_tree_store.cpp
 * @brief Тесты key-value хранилищ и адаптера персистентности
 */

#include <gtest/gtest.h>

#include "storage/kv_store.hpp"
#include "storage/tree_store.hpp"
#include "reference_tree.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace incmerkle::tests {

namespace {

Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

} // anonymous namespace

// =============================================================================
// MemoryStore
// =============================================================================

TEST(MemoryStoreTest, AbsentKeyIsNullopt) {
    storage::MemoryStore store;
    auto value = store.get("missing");
    ASSERT_TRUE(value.has_value());
    EXPECT_FALSE(value->has_value());
}

TEST(MemoryStoreTest, PutGetErase) {
    storage::MemoryStore store;
    ASSERT_TRUE(store.put("a", to_bytes("one")).has_value());
    ASSERT_TRUE(store.put("a", to_bytes("two")).has_value());

    auto value = store.get("a");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ(**value, to_bytes("two"));

    ASSERT_TRUE(store.erase("a").has_value());
    ASSERT_TRUE(store.erase("a").has_value());
    EXPECT_FALSE(store.get("a")->has_value());
}

// =============================================================================
// FileStore
// =============================================================================

class FileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("incmerkle_") + info->name() + ".dat");
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        auto tmp = path_;
        tmp += ".tmp";
        std::filesystem::remove(tmp);
    }

    std::filesystem::path path_;
};

TEST_F(FileStoreTest, MissingFileIsEmptyStore) {
    auto store = storage::FileStore::open(path_);
    ASSERT_TRUE(store.has_value()) << store.error().message;

    auto value = (*store)->get("TREE");
    ASSERT_TRUE(value.has_value());
    EXPECT_FALSE(value->has_value());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(FileStoreTest, PersistsAcrossReopen) {
    {
        auto store = storage::FileStore::open(path_);
        ASSERT_TRUE(store.has_value());
        ASSERT_TRUE((*store)->put("TREE", to_bytes("state")).has_value());
        ASSERT_TRUE((*store)->put("OTHER", to_bytes("x")).has_value());
        ASSERT_TRUE((*store)->erase("OTHER").has_value());
    }

    auto reopened = storage::FileStore::open(path_);
    ASSERT_TRUE(reopened.has_value()) << reopened.error().message;

    auto value = (*reopened)->get("TREE");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->has_value());
    EXPECT_EQ(**value, to_bytes("state"));
    EXPECT_FALSE((*reopened)->get("OTHER")->has_value());
}

TEST_F(FileStoreTest, CorruptFileIsInvalidState) {
    {
        std::ofstream file(path_, std::ios::binary);
        file << "not a store";
    }

    auto store = storage::FileStore::open(path_);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, ErrorCode::InvalidState);
}

TEST_F(FileStoreTest, TruncatedFileIsInvalidState) {
    {
        auto store = storage::FileStore::open(path_);
        ASSERT_TRUE(store.has_value());
        ASSERT_TRUE((*store)->put("TREE", to_bytes("0123456789")).has_value());
    }
    std::filesystem::resize_file(path_, std::filesystem::file_size(path_) - 3);

    auto store = storage::FileStore::open(path_);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, ErrorCode::InvalidState);
}

TEST_F(FileStoreTest, UnwritableDirectoryIsIOError) {
    auto store = storage::FileStore::open(path_ / "nested" / "store.dat");
    ASSERT_TRUE(store.has_value());

    auto result = (*store)->put("TREE", to_bytes("state"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StorageIOError);
    EXPECT_FALSE((*store)->get("TREE")->has_value());
}

// =============================================================================
// TreeStore
// =============================================================================

TEST(TreeStoreTest, AbsentRecordLoadsEmptyFrontier) {
    storage::MemoryStore kv;
    storage::TreeStore store(kv);

    auto frontier = store.load();
    ASSERT_TRUE(frontier.has_value());
    EXPECT_EQ(frontier->count(), 0u);
    EXPECT_EQ(frontier->depth(), constants::TREE_DEPTH);
}

TEST(TreeStoreTest, SaveThenLoad) {
    storage::MemoryStore kv;
    storage::TreeStore store(kv);

    core::Frontier frontier;
    for (const auto& leaf : make_leaves(9)) {
        ASSERT_TRUE(frontier.insert(leaf).has_value());
    }
    ASSERT_TRUE(store.save(frontier).has_value());

    auto raw = kv.get(constants::DEFAULT_TREE_KEY);
    ASSERT_TRUE(raw.has_value());
    ASSERT_TRUE(raw->has_value());
    EXPECT_EQ(**raw, frontier.serialize());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, frontier);
}

TEST(TreeStoreTest, KeysAreIndependent) {
    storage::MemoryStore kv;
    storage::TreeStore first(kv, "A");
    storage::TreeStore second(kv, "B");

    core::Frontier frontier;
    ASSERT_TRUE(frontier.insert(make_leaf(0)).has_value());
    ASSERT_TRUE(first.save(frontier).has_value());

    auto other = second.load();
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other->empty());
}

TEST(TreeStoreTest, DepthMismatchIsInvalidState) {
    storage::MemoryStore kv;
    storage::TreeStore deep(kv, "TREE", 32);
    storage::TreeStore shallow(kv, "TREE", 4);

    core::Frontier frontier;
    ASSERT_TRUE(deep.save(frontier).has_value());

    auto loaded = shallow.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidState);

    auto saved = shallow.save(frontier);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ErrorCode::InvalidState);
}

TEST(TreeStoreTest, CorruptRecordIsInvalidState) {
    storage::MemoryStore kv;
    ASSERT_TRUE(kv.put("TREE", Bytes{0x01, 0x20}).has_value());

    storage::TreeStore store(kv);
    auto loaded = store.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidState);
}

} // namespace incmerkle::tests
