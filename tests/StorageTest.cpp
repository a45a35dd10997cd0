#include <gtest/gtest.h>
#include <memo/key/KeyDerivation.hpp>
#include <memo/storage/MapStorage.hpp>
#include <memo/storage/SingleSlotStorage.hpp>
#include <chrono>
#include <thread>

/**
 * @brief Тесты для хранилищ
 *
 * Проверяем:
 * - SingleSlotStorage игнорирует ключ
 * - MapStorage: get/set/remove/clear/removeIf
 * - Время записи обновляется при перезаписи
 */

// ==================== SingleSlotStorage ====================

TEST(SingleSlotStorageTest, EmptyOnCreate) {
    SingleSlotStorage storage;

    EXPECT_FALSE(storage.get(CacheKey{}).has_value());
    EXPECT_EQ(storage.size(), 0u);
}

TEST(SingleSlotStorageTest, SetThenGetIgnoresKey) {
    SingleSlotStorage storage;

    auto storedAt = storage.set(deriveKey({1}), Values{42, "x"});
    auto entry = storage.get(deriveKey({"completely", "different"}));

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->values, (Values{42, "x"}));
    EXPECT_EQ(entry->storedAt, storedAt);
    EXPECT_EQ(storage.size(), 1u);
}

TEST(SingleSlotStorageTest, SetOverwritesSlot) {
    SingleSlotStorage storage;

    storage.set(CacheKey{}, Values{1});
    storage.set(CacheKey{}, Values{2});

    EXPECT_EQ(storage.get(CacheKey{})->values, Values{2});
    EXPECT_EQ(storage.size(), 1u);
}

TEST(SingleSlotStorageTest, RemoveResetsSlotForAnyKey) {
    SingleSlotStorage storage;
    storage.set(CacheKey{}, Values{1});

    EXPECT_TRUE(storage.remove(deriveKey({"whatever"})));
    EXPECT_FALSE(storage.get(CacheKey{}).has_value());
    EXPECT_FALSE(storage.remove(CacheKey{}));
}

TEST(SingleSlotStorageTest, ClearReturnsCount) {
    SingleSlotStorage storage;

    EXPECT_EQ(storage.clear(), 0u);
    storage.set(CacheKey{}, Values{1});
    EXPECT_EQ(storage.clear(), 1u);
    EXPECT_EQ(storage.size(), 0u);
}

// ==================== MapStorage ====================

TEST(MapStorageTest, GetMissingReturnsNullopt) {
    MapStorage storage;

    EXPECT_FALSE(storage.get(deriveKey({1})).has_value());
}

TEST(MapStorageTest, SetAndGet) {
    MapStorage storage;

    storage.set(deriveKey({2, 3}), Values{5});

    auto entry = storage.get(deriveKey({2, 3}));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->values, Values{5});
    EXPECT_FALSE(storage.get(deriveKey({3, 2})).has_value());
}

TEST(MapStorageTest, OverwriteUpdatesTimestamp) {
    MapStorage storage;
    auto key = deriveKey({1});

    auto first = storage.set(key, Values{1});
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto second = storage.set(key, Values{2});

    EXPECT_GT(second, first);
    EXPECT_EQ(storage.get(key)->storedAt, second);
    EXPECT_EQ(storage.get(key)->values, Values{2});
    EXPECT_EQ(storage.size(), 1u);
}

TEST(MapStorageTest, RemoveOnlyOneKey) {
    MapStorage storage;
    storage.set(deriveKey({1}), Values{10});
    storage.set(deriveKey({2}), Values{20});

    EXPECT_TRUE(storage.remove(deriveKey({1})));

    EXPECT_FALSE(storage.get(deriveKey({1})).has_value());
    EXPECT_TRUE(storage.get(deriveKey({2})).has_value());
}

TEST(MapStorageTest, RemoveMissingIsNoop) {
    MapStorage storage;

    EXPECT_FALSE(storage.remove(deriveKey({"nope"})));
}

TEST(MapStorageTest, ClearRemovesEverything) {
    MapStorage storage;
    storage.set(deriveKey({1}), Values{1});
    storage.set(deriveKey({2}, "other"), Values{2});

    EXPECT_EQ(storage.clear(), 2u);
    EXPECT_EQ(storage.size(), 0u);
}

TEST(MapStorageTest, RemoveIfRemovesOnlyMatching) {
    MapStorage storage;
    storage.set(deriveKey({1}, "a"), Values{1});
    storage.set(deriveKey({2}, "a"), Values{2});
    storage.set(deriveKey({1}, "b"), Values{3});

    size_t removed = storage.removeIf([](const CacheKey& key) {
        return key.isOwnedBy("a");
    });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(storage.size(), 1u);
    EXPECT_TRUE(storage.get(deriveKey({1}, "b")).has_value());
}

TEST(MapStorageTest, RemoveIfWithNullPredicateIsNoop) {
    MapStorage storage;
    storage.set(deriveKey({1}), Values{1});

    EXPECT_EQ(storage.removeIf(nullptr), 0u);
    EXPECT_EQ(storage.size(), 1u);
}

TEST(MapStorageTest, KeysSnapshot) {
    MapStorage storage;
    storage.set(deriveKey({1}, "a"), Values{1});
    storage.set(deriveKey({2}, "b"), Values{2});

    auto keys = storage.keys();

    EXPECT_EQ(keys.size(), 2u);
}
