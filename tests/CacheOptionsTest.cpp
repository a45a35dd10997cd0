#include <gtest/gtest.h>
#include <memo/config/CacheOptions.hpp>
#include <chrono>

/**
 * @brief Тесты для CacheOptions и разбора конфигурации
 */

namespace {

CacheOptions valid() {
    CacheOptions options;
    options.name = "ns::f";
    return options;
}

}  // namespace

TEST(CacheOptionsTest, DefaultsAreMapWithoutTimeout) {
    CacheOptions options;

    EXPECT_EQ(options.kind, StorageKind::Map);
    EXPECT_FALSE(options.sharedResults);
    EXPECT_FALSE(options.timeout.has_value());
    EXPECT_FALSE(options.arity.has_value());
}

TEST(CacheOptionsTest, ValidOptionsPass) {
    auto options = valid();
    options.timeout = std::chrono::seconds(1);

    EXPECT_NO_THROW(options.validate());
}

TEST(CacheOptionsTest, EmptyNameThrows) {
    CacheOptions options;
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CacheOptionsTest, NonPositiveTimeoutThrows) {
    auto options = valid();
    options.timeout = CacheOptions::Duration::zero();
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options.timeout = std::chrono::milliseconds(-5);
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CacheOptionsTest, SharedSingleSlotThrows) {
    auto options = valid();
    options.kind = StorageKind::SingleSlot;
    options.sharedResults = true;
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CacheOptionsTest, ExternalStorageForSingleSlotThrows) {
    auto options = valid();
    options.kind = StorageKind::SingleSlot;
    options.storageFactory = []() { return std::shared_ptr<IStorage>(); };
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CacheOptionsTest, ExplicitStorageRequiresShared) {
    auto options = valid();
    options.storage = std::make_shared<MapStorage>();
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options.sharedResults = true;
    EXPECT_NO_THROW(options.validate());
}

TEST(CacheOptionsTest, FactoryWithSharedThrows) {
    auto options = valid();
    options.sharedResults = true;
    options.storageFactory = []() { return std::shared_ptr<IStorage>(); };
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CacheOptionsTest, UnknownKindThrows) {
    auto options = valid();
    options.kind = static_cast<StorageKind>(7);
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

// ==================== Разбор вида хранилища ====================

TEST(StorageKindTest, ParseKnownKinds) {
    EXPECT_EQ(parseStorageKind("single-slot"), StorageKind::SingleSlot);
    EXPECT_EQ(parseStorageKind("map"), StorageKind::Map);
}

TEST(StorageKindTest, ParseUnknownThrows) {
    EXPECT_THROW(parseStorageKind("lru"), std::invalid_argument);
    EXPECT_THROW(parseStorageKind(""), std::invalid_argument);
}

TEST(StorageKindTest, ToStringRoundTrip) {
    EXPECT_STREQ(toString(StorageKind::SingleSlot), "single-slot");
    EXPECT_EQ(parseStorageKind(toString(StorageKind::Map)), StorageKind::Map);
}

TEST(NamespaceOfTest, SplitsOnLastSeparator) {
    EXPECT_EQ(namespaceOf("geo::area"), "geo");
    EXPECT_EQ(namespaceOf("a::b::f"), "a::b");
    EXPECT_EQ(namespaceOf("f"), "");
}
