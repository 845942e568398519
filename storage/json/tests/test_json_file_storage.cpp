#include <gtest/gtest.h>
#include "JsonFileStorage.hpp"
#include <filesystem>
#include <fstream>
#include <memory>

using namespace ledger;
using namespace std::chrono;

class JsonFileStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        testPath = std::filesystem::temp_directory_path() /
            (std::string("test_ledger_storage_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");

        // Удаляем файл если существует
        if (std::filesystem::exists(testPath)) {
            std::filesystem::remove(testPath);
        }

        storage = std::make_unique<JsonFileStorage>(testPath);
    }

    void TearDown() override {
        storage.reset();

        // Очищаем после теста
        if (std::filesystem::exists(testPath)) {
            std::filesystem::remove(testPath);
        }
    }

    void writeRaw(const std::string& text) {
        std::ofstream file(testPath);
        file << text;
    }

    Record record(RecordType type, int walletId, double amount,
                  std::optional<int> transferId = std::nullopt) {
        RecordDraft d;
        d.type = type;
        d.date = Date{year{2025}, month{1}, day{10}};
        d.walletId = walletId;
        d.transferId = transferId;
        d.amountOriginal = amount;
        d.currency = "KZT";
        d.amountKzt = amount;
        return *Record::create(d, "KZT");
    }

    Transfer transfer(int id, int from, int to, double amount) {
        TransferDraft d;
        d.id = id;
        d.fromWalletId = from;
        d.toWalletId = to;
        d.date = Date{year{2025}, month{1}, day{10}};
        d.amountOriginal = amount;
        d.currency = "KZT";
        d.amountKzt = amount;
        return *Transfer::create(d, "KZT");
    }

    std::filesystem::path testPath;
    std::unique_ptr<JsonFileStorage> storage;
};

// ============================================================================
// ТЕСТЫ: Пустое хранилище
// ============================================================================

TEST_F(JsonFileStorageTest, MissingFileIsEmptyLedger) {
    auto snapshot = storage->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_TRUE(snapshot->wallets.empty());
    EXPECT_TRUE(snapshot->records.empty());
    EXPECT_FALSE(std::filesystem::exists(testPath));
}

// ============================================================================
// ТЕСТЫ: Кошельки и записи
// ============================================================================

TEST_F(JsonFileStorageTest, SaveWalletUpserts) {
    auto wallet = Wallet::create(1, "Main", "KZT", 100.0, true);
    ASSERT_TRUE(storage->saveWallet(*wallet).has_value());
    ASSERT_TRUE(storage->saveWallet(wallet->withInitialBalance(200.0)).has_value());

    auto wallets = storage->loadWallets();
    ASSERT_TRUE(wallets.has_value());
    ASSERT_EQ(wallets->size(), 1);
    EXPECT_DOUBLE_EQ(wallets->front().initialBalance(), 200.0);
}

TEST_F(JsonFileStorageTest, SaveAssignsNextId) {
    ASSERT_TRUE(storage->saveWallet(*Wallet::systemDefault("KZT")).has_value());

    auto first = storage->save(record(RecordType::Income, 1, 10.0));
    auto second = storage->save(record(RecordType::Expense, 1, 5.0));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->id(), 1);
    EXPECT_EQ(second->id(), 2);

    auto duplicate = storage->save(first->withId(1));
    ASSERT_TRUE(duplicate.has_value());
    EXPECT_EQ(duplicate->id(), 3);
}

TEST_F(JsonFileStorageTest, DeleteByIndex) {
    ASSERT_TRUE(storage->save(record(RecordType::Income, 1, 10.0)).has_value());
    ASSERT_TRUE(storage->save(record(RecordType::Income, 1, 20.0)).has_value());

    EXPECT_TRUE(storage->deleteByIndex(0).value());
    EXPECT_FALSE(storage->deleteByIndex(5).value());

    auto all = storage->loadAll();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all->size(), 1);
    EXPECT_DOUBLE_EQ(all->front().amountKzt(), 20.0);
}

TEST_F(JsonFileStorageTest, ReplaceUnknownRecord) {
    auto result = storage->replace(record(RecordType::Income, 1, 1.0).withId(9));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(JsonFileStorageTest, MandatoryTemplatesStoredSeparately) {
    RecordDraft d;
    d.type = RecordType::MandatoryExpense;
    d.walletId = 1;
    d.amountOriginal = 50.0;
    d.currency = "KZT";
    d.amountKzt = 50.0;
    d.category = "Rent";
    d.period = Period::Monthly;
    auto tmpl = Record::create(d, "KZT");
    ASSERT_TRUE(tmpl.has_value());

    ASSERT_TRUE(storage->saveMandatoryExpense(*tmpl).has_value());
    EXPECT_EQ(storage->loadMandatoryExpenses().value().size(), 1);
    EXPECT_TRUE(storage->loadAll().value().empty());

    auto notTemplate = storage->saveMandatoryExpense(record(RecordType::Expense, 1, 1.0));
    EXPECT_FALSE(notTemplate.has_value());

    ASSERT_TRUE(storage->deleteAllMandatoryExpenses().has_value());
    EXPECT_TRUE(storage->loadMandatoryExpenses().value().empty());
}

// ============================================================================
// ТЕСТЫ: Целостность переводов
// ============================================================================

TEST_F(JsonFileStorageTest, ReplaceRecordsAndTransfersValidates) {
    std::vector<Record> records = {
        record(RecordType::Expense, 1, 30.0, 1).withId(1),
        record(RecordType::Income, 2, 30.0, 1).withId(2)};
    std::vector<Transfer> transfers = {transfer(1, 1, 2, 30.0)};

    ASSERT_TRUE(storage->replaceRecordsAndTransfers(records, transfers).has_value());
    EXPECT_EQ(storage->loadTransfers().value().size(), 1);

    std::vector<Record> broken = {records[0]};
    auto result = storage->replaceRecordsAndTransfers(broken, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::BrokenTransferPair);
    EXPECT_EQ(storage->loadAll().value().size(), 2);
}

TEST_F(JsonFileStorageTest, LoadRejectsBrokenDocument) {
    writeRaw(R"({
        "wallets": [{"id": 1, "name": "Main", "currency": "KZT", "initial_balance": 0, "system": true}],
        "records": [{"id": 1, "type": "expense", "date": "2025-01-10", "wallet_id": 1,
                     "transfer_id": 4, "amount_original": 5, "currency": "KZT",
                     "rate_at_operation": 1, "amount_kzt": 5, "category": "Transfer"}],
        "mandatory_expenses": [],
        "transfers": []
    })");

    auto snapshot = storage->loadSnapshot();
    ASSERT_FALSE(snapshot.has_value());
    EXPECT_EQ(snapshot.error().kind, ErrorKind::DanglingTransferLink);
}

TEST_F(JsonFileStorageTest, CorruptDocumentIsStorageError) {
    writeRaw("{ not json");
    auto snapshot = storage->loadSnapshot();
    ASSERT_FALSE(snapshot.has_value());
    EXPECT_EQ(snapshot.error().kind, ErrorKind::Storage);
}

// ============================================================================
// ТЕСТЫ: Legacy-форматы
// ============================================================================

TEST_F(JsonFileStorageTest, LegacyListUpgraded) {
    writeRaw(R"([
        {"type": "income", "date": "2024-05-01", "amount": 1000, "category": "Salary"},
        {"type": "expense", "date": "2024-05-02", "amount": -200}
    ])");

    auto snapshot = storage->loadSnapshot();
    ASSERT_TRUE(snapshot.has_value()) << snapshot.error().message;
    ASSERT_EQ(snapshot->wallets.size(), 1);
    EXPECT_TRUE(snapshot->wallets[0].isSystem());
    ASSERT_EQ(snapshot->records.size(), 2);
    EXPECT_EQ(snapshot->records[0].id(), 1);
    EXPECT_EQ(snapshot->records[1].id(), 2);
    EXPECT_DOUBLE_EQ(snapshot->records[1].amountKzt(), 200.0);
    EXPECT_EQ(snapshot->records[1].category(), "General");

    // Документ переписан в текущем формате
    std::ifstream file(testPath);
    json document = json::parse(file);
    EXPECT_TRUE(document.contains("wallets"));
}

TEST_F(JsonFileStorageTest, LegacyObjectKeepsInitialBalance) {
    writeRaw(R"({"initial_balance": 300, "records": []})");

    JsonFileStorage readOnly(testPath, "KZT", false);
    auto snapshot = readOnly.loadSnapshot();
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->wallets.size(), 1);
    EXPECT_DOUBLE_EQ(snapshot->wallets[0].initialBalance(), 300.0);

    // Без write-back исходный документ не меняется
    std::ifstream file(testPath);
    json document = json::parse(file);
    EXPECT_FALSE(document.contains("wallets"));
}

TEST_F(JsonFileStorageTest, SerializeRoundTrip) {
    LedgerSnapshot snapshot;
    snapshot.wallets = {*Wallet::systemDefault("KZT", 10.0), *Wallet::create(2, "Card", "USD", 0.0)};
    snapshot.records = {
        record(RecordType::Expense, 1, 30.0, 1).withId(1),
        record(RecordType::Income, 2, 30.0, 1).withId(2),
        record(RecordType::Expense, 1, 1.5).withId(3).withCommissionForTransferId(1)};
    snapshot.transfers = {transfer(1, 1, 2, 30.0)};

    ASSERT_TRUE(storage->replaceAllData(snapshot).has_value());
    auto loaded = storage->loadSnapshot();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->wallets, snapshot.wallets);
    EXPECT_EQ(loaded->records, snapshot.records);
    EXPECT_EQ(loaded->transfers, snapshot.transfers);
}

TEST_F(JsonFileStorageTest, NoTemporaryFileLeftBehind) {
    ASSERT_TRUE(storage->saveWallet(*Wallet::systemDefault("KZT")).has_value());
    std::filesystem::path tmp = testPath;
    tmp += ".tmp";
    EXPECT_TRUE(std::filesystem::exists(testPath));
    EXPECT_FALSE(std::filesystem::exists(tmp));
}
