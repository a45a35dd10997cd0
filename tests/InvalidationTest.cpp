#include <gtest/gtest.h>
#include <memo/MemoCache.hpp>
#include <atomic>
#include <memory>

/**
 * @brief Тесты для инвалидации MemoCache::clear
 *
 * Проверяем:
 * - Удаление одной записи
 * - Полную очистку собственного хранилища
 * - Очистку только своих записей в общем хранилище
 * - Сброс single-slot независимо от аргументов
 */

namespace {

struct Counted {
    std::atomic<int> calls{0};

    MemoCache::Function echo() {
        return [this](const Values& args) {
            ++calls;
            return args;
        };
    }
};

CacheOptions mapOptions(const std::string& name) {
    CacheOptions options;
    options.name = name;
    options.kind = StorageKind::Map;
    return options;
}

CacheOptions sharedOptions(const std::string& name, std::shared_ptr<MapStorage> pool) {
    CacheOptions options = mapOptions(name);
    options.sharedResults = true;
    options.storage = std::move(pool);
    return options;
}

}  // namespace

// ==================== Одна запись ====================

TEST(InvalidationTest, ClearArgsRemovesExactlyOneEntry) {
    Counted f;
    MemoCache cache(mapOptions("f"), f.echo());
    cache.invoke({1});
    cache.invoke({2});

    EXPECT_EQ(cache.clear({1}), 1u);
    EXPECT_EQ(cache.storage()->size(), 1u);

    cache.invoke({1});  // пересчёт
    cache.invoke({2});  // попадание
    EXPECT_EQ(f.calls.load(), 3);
}

TEST(InvalidationTest, ClearMissingArgsIsNoop) {
    Counted f;
    MemoCache cache(mapOptions("f"), f.echo());
    cache.invoke({1});

    EXPECT_EQ(cache.clear({42}), 0u);
    EXPECT_EQ(cache.storage()->size(), 1u);
}

TEST(InvalidationTest, ClearArgsUsesStructuralKey) {
    Counted f;
    MemoCache cache(mapOptions("f"), f.echo());
    cache.invoke({Value::list({1, 2})});

    EXPECT_EQ(cache.clear({Value::list({1, 2})}), 1u);
    EXPECT_EQ(cache.storage()->size(), 0u);
}

// ==================== Собственное хранилище ====================

TEST(InvalidationTest, ClearAllOnPrivateMapEmptiesStore) {
    Counted f;
    MemoCache cache(mapOptions("f"), f.echo());
    cache.invoke({1});
    cache.invoke({2});
    cache.invoke({3});

    EXPECT_EQ(cache.clear(), 3u);
    EXPECT_EQ(cache.storage()->size(), 0u);

    cache.invoke({1});
    cache.invoke({2});
    EXPECT_EQ(f.calls.load(), 5);
}

TEST(InvalidationTest, ClearOnEmptyCacheIsNoop) {
    Counted f;
    MemoCache cache(mapOptions("f"), f.echo());

    EXPECT_EQ(cache.clear(), 0u);
}

// ==================== Single-slot ====================

TEST(InvalidationTest, SingleSlotClearWithArgsResetsSlot) {
    Counted f;
    CacheOptions options = mapOptions("now");
    options.kind = StorageKind::SingleSlot;
    MemoCache cache(options, f.echo());
    cache.invoke({});

    EXPECT_EQ(cache.clear({"ignored", 1}), 1u);
    EXPECT_FALSE(cache.peek({}).has_value());

    cache.invoke({});
    EXPECT_EQ(f.calls.load(), 2);
}

TEST(InvalidationTest, SingleSlotClearResetsSlot) {
    Counted f;
    CacheOptions options = mapOptions("now");
    options.kind = StorageKind::SingleSlot;
    MemoCache cache(options, f.echo());
    cache.invoke({});

    EXPECT_EQ(cache.clear(), 1u);
    EXPECT_EQ(cache.storage()->size(), 0u);
}

// ==================== Общее хранилище ====================

TEST(InvalidationTest, SharedCachesDoNotCollide) {
    auto pool = std::make_shared<MapStorage>();
    Counted sum;
    Counted product;
    MemoCache sumOf(sharedOptions("sumOf", pool), [&sum](const Values& args) {
        ++sum.calls;
        return Values{args[0].asInt() + args[1].asInt()};
    });
    MemoCache productOf(sharedOptions("productOf", pool), [&product](const Values& args) {
        ++product.calls;
        return Values{args[0].asInt() * args[1].asInt()};
    });

    EXPECT_EQ(sumOf.invoke({2, 3}), Values{5});
    EXPECT_EQ(productOf.invoke({2, 3}), Values{6});

    EXPECT_EQ(pool->size(), 2u);
    EXPECT_EQ(sumOf.keyFor({2, 3}).owner, "sumOf");
    EXPECT_EQ(productOf.keyFor({2, 3}).owner, "productOf");
}

TEST(InvalidationTest, SharedClearRemovesOnlyOwnEntries) {
    auto pool = std::make_shared<MapStorage>();
    Counted a;
    Counted b;
    MemoCache first(sharedOptions("first", pool), a.echo());
    MemoCache second(sharedOptions("second", pool), b.echo());

    first.invoke({1});
    first.invoke({2});
    second.invoke({1});

    EXPECT_EQ(first.clear(), 2u);

    EXPECT_EQ(pool->size(), 1u);
    EXPECT_FALSE(first.peek({1}).has_value());
    EXPECT_TRUE(second.peek({1}).has_value());

    second.invoke({1});
    EXPECT_EQ(b.calls.load(), 1);
}

TEST(InvalidationTest, SharedClearArgsRemovesOnlyOwnKey) {
    auto pool = std::make_shared<MapStorage>();
    Counted a;
    Counted b;
    MemoCache first(sharedOptions("first", pool), a.echo());
    MemoCache second(sharedOptions("second", pool), b.echo());

    first.invoke({7});
    second.invoke({7});

    EXPECT_EQ(first.clear({7}), 1u);
    EXPECT_TRUE(second.peek({7}).has_value());
}

TEST(InvalidationTest, SharedNamePrefixIsNotOwnership) {
    auto pool = std::make_shared<MapStorage>();
    Counted a;
    Counted b;
    MemoCache shortName(sharedOptions("f", pool), a.echo());
    MemoCache longName(sharedOptions("ff", pool), b.echo());

    shortName.invoke({1});
    longName.invoke({1});

    EXPECT_EQ(shortName.clear(), 1u);
    EXPECT_TRUE(longName.peek({1}).has_value());
}
