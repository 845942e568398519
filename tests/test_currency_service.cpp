#include <gtest/gtest.h>
#include "CurrencyService.hpp"
#include <filesystem>
#include <fstream>

using namespace ledger;

class CurrencyServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        cachePath = std::filesystem::temp_directory_path() / "ledger_test_rates.json";
        std::filesystem::remove(cachePath);
    }

    void TearDown() override {
        std::filesystem::remove(cachePath);
    }

    std::filesystem::path cachePath;
};

TEST_F(CurrencyServiceTest, BaseCurrencyRateIsOne) {
    auto service = CurrencyService::withDefaults();
    auto rate = service.getRate("KZT");
    ASSERT_TRUE(rate.has_value());
    EXPECT_DOUBLE_EQ(*rate, 1.0);
}

TEST_F(CurrencyServiceTest, ConvertUsesRate) {
    auto service = CurrencyService::withDefaults();
    auto amount = service.convert(10.0, "USD");
    ASSERT_TRUE(amount.has_value());
    EXPECT_DOUBLE_EQ(*amount, 5000.0);
}

TEST_F(CurrencyServiceTest, UnknownCurrencyIsNotFound) {
    auto service = CurrencyService::withDefaults();
    auto rate = service.getRate("GBP");
    ASSERT_FALSE(rate.has_value());
    EXPECT_EQ(rate.error().kind, ErrorKind::NotFound);
}

TEST_F(CurrencyServiceTest, MissingCacheFallsBackToDefaults) {
    auto service = CurrencyService::fromCacheFile(cachePath);
    ASSERT_TRUE(service.has_value());
    EXPECT_EQ(service->allRates().size(), 3);
}

TEST_F(CurrencyServiceTest, CacheRoundTrip) {
    CurrencyService original({{"USD", 480.0}, {"CNY", 70.0}});
    ASSERT_TRUE(original.saveCacheFile(cachePath).has_value());

    auto loaded = CurrencyService::fromCacheFile(cachePath);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_DOUBLE_EQ(loaded->getRate("CNY").value(), 70.0);
    EXPECT_DOUBLE_EQ(loaded->getRate("USD").value(), 480.0);
}

TEST_F(CurrencyServiceTest, CacheWithNonPositiveRateRejected) {
    {
        std::ofstream file(cachePath);
        file << R"({"USD": 0})";
    }
    auto loaded = CurrencyService::fromCacheFile(cachePath);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Validation);
}

TEST_F(CurrencyServiceTest, CorruptCacheIsStorageError) {
    {
        std::ofstream file(cachePath);
        file << "{not json";
    }
    auto loaded = CurrencyService::fromCacheFile(cachePath);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Storage);
}
