#include <gtest/gtest.h>
#include "BackupManager.hpp"
#include "Bootstrap.hpp"
#include "CurrencyService.hpp"
#include "JsonFileStorage.hpp"
#include "LedgerService.hpp"
#include "SQLiteStorage.hpp"
#include <ctime>
#include <filesystem>
#include <memory>
#include <sstream>

using namespace ledger;

class BackupBootstrapTest : public ::testing::Test {
protected:
    void SetUp() override {
        workDir = std::filesystem::temp_directory_path() /
            (std::string("ledger_bootstrap_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(workDir);
        std::filesystem::create_directories(workDir);

        config.jsonPath = workDir / "data.json";
        config.sqlitePath = workDir / "finance.db";
        config.schemaPath = LEDGER_SCHEMA_PATH;
    }

    void TearDown() override {
        std::filesystem::remove_all(workDir);
    }

    void seedJson() {
        JsonFileStorage storage(config.jsonPath);
        CurrencyService rates = CurrencyService::withDefaults();
        LedgerService service(storage, rates);

        ASSERT_TRUE(service.setSystemInitialBalance(500.0).has_value());
        auto savings = service.createWallet("Savings", "KZT", 0.0);
        ASSERT_TRUE(savings.has_value());

        OperationRequest income;
        income.date = "2025-03-01";
        income.amount = 200.0;
        income.currency = "KZT";
        ASSERT_TRUE(service.createIncome(income).has_value());

        TransferRequest transfer;
        transfer.fromWalletId = kSystemWalletId;
        transfer.toWalletId = savings->id();
        transfer.date = "2025-03-02";
        transfer.amount = 150.0;
        transfer.currency = "KZT";
        ASSERT_TRUE(service.createTransfer(transfer).has_value());
    }

    std::filesystem::path workDir;
    LedgerConfig config;
    std::ostringstream log;
};

// ============================================================================
// ТЕСТЫ: Резервные копии
// ============================================================================

TEST_F(BackupBootstrapTest, BackupPathFormat) {
    std::tm local{};
    local.tm_year = 2025 - 1900;
    local.tm_mon = 2;
    local.tm_mday = 7;
    local.tm_hour = 9;
    local.tm_min = 5;
    local.tm_sec = 3;
    local.tm_isdst = -1;
    auto now = std::chrono::system_clock::from_time_t(std::mktime(&local));

    auto path = BackupManager::backupPathFor(workDir / "data.json", now);
    EXPECT_EQ(path, workDir / "backups" / "data_backup_20250307_090503.json");
}

TEST_F(BackupBootstrapTest, BackupOfMissingFileIsSkipped) {
    BackupManager backups(log);
    auto backup = backups.createBackup(config.jsonPath);
    ASSERT_TRUE(backup.has_value());
    EXPECT_FALSE(backup->has_value());
    EXPECT_FALSE(std::filesystem::exists(workDir / "backups"));
}

TEST_F(BackupBootstrapTest, BackupCopiesDocument) {
    seedJson();
    BackupManager backups(log);
    auto backup = backups.createBackup(config.jsonPath);
    ASSERT_TRUE(backup.has_value()) << backup.error().message;
    ASSERT_TRUE(backup->has_value());
    EXPECT_TRUE(std::filesystem::exists(**backup));
    EXPECT_EQ(std::filesystem::file_size(**backup), std::filesystem::file_size(config.jsonPath));
}

TEST_F(BackupBootstrapTest, ExportToJsonMirrorsSQLite) {
    SQLiteStorage sqlite(config.sqlitePath.string());
    ASSERT_TRUE(sqlite.saveWallet(*Wallet::systemDefault("KZT", 42.0)).has_value());

    BackupManager backups(log);
    ASSERT_TRUE(backups.exportToJson(sqlite, config.jsonPath).has_value());

    JsonFileStorage json(config.jsonPath);
    auto wallets = json.loadWallets();
    ASSERT_TRUE(wallets.has_value());
    ASSERT_EQ(wallets->size(), 1);
    EXPECT_DOUBLE_EQ(wallets->front().initialBalance(), 42.0);
}

// ============================================================================
// ТЕСТЫ: Выбор хранилища
// ============================================================================

TEST_F(BackupBootstrapTest, JsonModeReturnsJsonStorage) {
    config.useSqlite = false;
    auto storage = bootstrapStorage(config, log);
    ASSERT_TRUE(storage.has_value()) << storage.error().message;
    EXPECT_NE(dynamic_cast<JsonFileStorage*>(storage->get()), nullptr);
    EXPECT_FALSE(std::filesystem::exists(config.sqlitePath));
}

TEST_F(BackupBootstrapTest, SqliteModeMigratesExistingJson) {
    seedJson();
    auto storage = bootstrapStorage(config, log);
    ASSERT_TRUE(storage.has_value()) << storage.error().message << "\n" << log.str();
    EXPECT_NE(dynamic_cast<SQLiteStorage*>(storage->get()), nullptr);

    auto snapshot = (*storage)->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->wallets.size(), 2);
    EXPECT_EQ(snapshot->transfers.size(), 1);
    EXPECT_EQ(snapshot->records.size(), 3);
    EXPECT_DOUBLE_EQ(netWorth(snapshot->wallets, snapshot->records), 700.0);

    EXPECT_NE(log.str().find("one-time migration"), std::string::npos);
    EXPECT_FALSE(std::filesystem::is_empty(workDir / "backups"));
}

TEST_F(BackupBootstrapTest, SecondStartSkipsMigration) {
    seedJson();
    ASSERT_TRUE(bootstrapStorage(config, log).has_value());

    std::ostringstream secondLog;
    auto storage = bootstrapStorage(config, secondLog);
    ASSERT_TRUE(storage.has_value()) << storage.error().message;
    EXPECT_NE(secondLog.str().find("migration skipped"), std::string::npos);
    EXPECT_NE(secondLog.str().find("Integrity check passed"), std::string::npos);
}

TEST_F(BackupBootstrapTest, SqliteModeWithoutJsonStartsEmpty) {
    config.backupEnabled = false;
    auto storage = bootstrapStorage(config, log);
    ASSERT_TRUE(storage.has_value()) << storage.error().message;
    EXPECT_TRUE((*storage)->loadWallets().value().empty());
    EXPECT_TRUE(std::filesystem::exists(config.jsonPath));
}

// ============================================================================
// ТЕСТЫ: Сверка при запуске
// ============================================================================

TEST_F(BackupBootstrapTest, IntegrityMismatchIsEmergency) {
    seedJson();
    ASSERT_TRUE(bootstrapStorage(config, log).has_value());

    // JSON расходится с SQLite
    {
        JsonFileStorage json(config.jsonPath);
        auto wallets = json.loadWallets();
        ASSERT_TRUE(wallets.has_value());
        ASSERT_TRUE(json.saveWallet(wallets->front().withInitialBalance(9999.0)).has_value());
    }

    SQLiteStorage sqlite(config.sqlitePath.string());
    auto result = validateStartupIntegrity(config, sqlite, log);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Storage);
    EXPECT_EQ(result.error().message.rfind("Emergency mode: net worth mismatch", 0), 0u);

    auto restarted = bootstrapStorage(config, log);
    ASSERT_FALSE(restarted.has_value());
    EXPECT_NE(restarted.error().message.find("Emergency mode"), std::string::npos);
}

TEST_F(BackupBootstrapTest, CountMismatchIsEmergency) {
    seedJson();
    ASSERT_TRUE(bootstrapStorage(config, log).has_value());

    {
        SQLiteStorage sqlite(config.sqlitePath.string());
        ASSERT_TRUE(sqlite.saveWallet(*Wallet::create(9, "Extra", "KZT", 0.0)).has_value());
    }

    SQLiteStorage sqlite(config.sqlitePath.string());
    auto result = validateStartupIntegrity(config, sqlite, log);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("wallets mismatch JSON=2 SQLite=3"), std::string::npos);
}
