#include <gtest/gtest.h>
#include "CurrencyService.hpp"
#include "JsonFileStorage.hpp"
#include "LedgerService.hpp"
#include "SQLiteStorage.hpp"
#include <filesystem>
#include <memory>

using namespace ledger;

class LedgerServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dataPath = std::filesystem::temp_directory_path() /
            (std::string("ledger_service_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        std::filesystem::remove(dataPath);

        storage = std::make_unique<JsonFileStorage>(dataPath);
        service = std::make_unique<LedgerService>(*storage, rates);
    }

    void TearDown() override {
        service.reset();
        storage.reset();
        std::filesystem::remove(dataPath);
    }

    // Кошельки A и B без системного баланса
    std::pair<int, int> twoWallets(double a, double b) {
        auto first = service->createWallet("A", "KZT", a);
        auto second = service->createWallet("B", "KZT", b);
        EXPECT_TRUE(first.has_value());
        EXPECT_TRUE(second.has_value());
        return {first->id(), second->id()};
    }

    TransferRequest transfer(int from, int to, double amount, double commission = 0.0) {
        TransferRequest request;
        request.fromWalletId = from;
        request.toWalletId = to;
        request.date = "2025-01-10";
        request.amount = amount;
        request.currency = "KZT";
        request.commissionAmount = commission;
        return request;
    }

    CurrencyService rates = CurrencyService::withDefaults();
    std::filesystem::path dataPath;
    std::unique_ptr<JsonFileStorage> storage;
    std::unique_ptr<LedgerService> service;
};

// ============================================================================
// ТЕСТЫ: Кошельки
// ============================================================================

TEST_F(LedgerServiceTest, FirstWalletCreatesSystemWallet) {
    auto wallet = service->createWallet("Card", "KZT", 100.0);
    ASSERT_TRUE(wallet.has_value()) << wallet.error().message;
    EXPECT_EQ(wallet->id(), 2);

    auto all = service->wallets();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all->size(), 2);
    EXPECT_TRUE(all->front().isSystem());
}

TEST_F(LedgerServiceTest, WalletNameRequired) {
    auto wallet = service->createWallet("  ", "KZT", 0.0);
    ASSERT_FALSE(wallet.has_value());
    EXPECT_EQ(wallet.error().kind, ErrorKind::Validation);
}

TEST_F(LedgerServiceTest, WalletCurrencyValidated) {
    auto wallet = service->createWallet("Card", "US", 0.0);
    ASSERT_FALSE(wallet.has_value());
    EXPECT_EQ(wallet.error().kind, ErrorKind::Validation);
}

TEST_F(LedgerServiceTest, SoftDeleteRequiresZeroBalance) {
    auto [a, b] = twoWallets(100.0, 0.0);

    auto refused = service->softDeleteWallet(a);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().kind, ErrorKind::Domain);

    ASSERT_TRUE(service->softDeleteWallet(b).has_value());
    auto active = service->activeWallets();
    ASSERT_TRUE(active.has_value());
    for (const auto& w : *active) {
        EXPECT_NE(w.id(), b);
    }

    auto again = service->softDeleteWallet(b);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::Domain);
}

TEST_F(LedgerServiceTest, SystemWalletCannotBeDeleted) {
    twoWallets(0.0, 0.0);
    auto result = service->softDeleteWallet(kSystemWalletId);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Domain);
}

TEST_F(LedgerServiceTest, SystemFlagTakesPrecedenceOverFirstId) {
    ASSERT_TRUE(storage->saveWallet(*Wallet::create(1, "Plain", "KZT", 0.0)).has_value());
    ASSERT_TRUE(storage->saveWallet(*Wallet::create(5, "Main", "KZT", 0.0, true)).has_value());

    ASSERT_TRUE(service->setSystemInitialBalance(300.0).has_value());
    auto wallets = service->wallets();
    ASSERT_TRUE(wallets.has_value());
    EXPECT_DOUBLE_EQ(findWallet(*wallets, 5)->initialBalance(), 300.0);
    EXPECT_DOUBLE_EQ(findWallet(*wallets, 1)->initialBalance(), 0.0);
    EXPECT_DOUBLE_EQ(service->systemInitialBalance().value(), 300.0);

    auto refused = service->softDeleteWallet(5);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().kind, ErrorKind::Domain);
    EXPECT_TRUE(service->softDeleteWallet(1).has_value());
}

TEST_F(LedgerServiceTest, DeleteUnknownWallet) {
    auto result = service->softDeleteWallet(42);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
}

TEST_F(LedgerServiceTest, SystemInitialBalance) {
    ASSERT_TRUE(service->setSystemInitialBalance(750.0).has_value());
    auto balance = service->systemInitialBalance();
    ASSERT_TRUE(balance.has_value());
    EXPECT_DOUBLE_EQ(*balance, 750.0);
    EXPECT_DOUBLE_EQ(service->netWorth().value(), 750.0);
}

// ============================================================================
// ТЕСТЫ: Доходы и расходы
// ============================================================================

TEST_F(LedgerServiceTest, IncomeConvertedToBaseCurrency) {
    OperationRequest request;
    request.date = "2025-01-10";
    request.amount = 10.0;
    request.currency = "usd";
    request.category = "Salary";

    auto record = service->createIncome(request);
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->currency(), "USD");
    EXPECT_DOUBLE_EQ(record->amountKzt(), 5000.0);
    EXPECT_DOUBLE_EQ(record->rateAtOperation(), 500.0);
    EXPECT_DOUBLE_EQ(service->walletBalance(kSystemWalletId).value(), 5000.0);
}

TEST_F(LedgerServiceTest, FutureDateRejected) {
    OperationRequest request;
    request.date = "2999-01-01";
    request.amount = 10.0;
    request.currency = "KZT";

    auto record = service->createExpense(request);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().kind, ErrorKind::Validation);
}

TEST_F(LedgerServiceTest, InvalidDateRejected) {
    OperationRequest request;
    request.date = "2025-13-01";
    request.amount = 10.0;
    request.currency = "KZT";
    EXPECT_FALSE(service->createExpense(request).has_value());
}

TEST_F(LedgerServiceTest, NegativeAmountRejected) {
    OperationRequest request;
    request.date = "2025-01-10";
    request.amount = -5.0;
    request.currency = "KZT";
    EXPECT_FALSE(service->createIncome(request).has_value());
}

TEST_F(LedgerServiceTest, OperationOnInactiveWalletRejected) {
    auto [a, b] = twoWallets(0.0, 0.0);
    ASSERT_TRUE(service->softDeleteWallet(b).has_value());

    OperationRequest request;
    request.date = "2025-01-10";
    request.walletId = b;
    request.amount = 5.0;
    request.currency = "KZT";

    auto record = service->createIncome(request);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().kind, ErrorKind::Domain);
}

TEST_F(LedgerServiceTest, UpdateAmountKzt) {
    OperationRequest request;
    request.date = "2025-01-10";
    request.amount = 10.0;
    request.currency = "USD";
    auto record = service->createExpense(request);
    ASSERT_TRUE(record.has_value());

    ASSERT_TRUE(service->updateRecordAmountKzt(record->id(), 5500.0).has_value());
    auto all = service->records();
    ASSERT_TRUE(all.has_value());
    ASSERT_EQ(all->size(), 1);
    EXPECT_DOUBLE_EQ(all->front().amountKzt(), 5500.0);
    EXPECT_DOUBLE_EQ(all->front().rateAtOperation(), 550.0);

    auto missing = service->updateRecordAmountKzt(99, 1.0);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

// ============================================================================
// ТЕСТЫ: Обязательные расходы
// ============================================================================

TEST_F(LedgerServiceTest, MandatoryExpenseLifecycle) {
    MandatoryExpenseRequest request;
    request.amount = 20.0;
    request.currency = "EUR";
    request.category = "Rent";
    request.period = "monthly";

    auto tmpl = service->createMandatoryExpense(request);
    ASSERT_TRUE(tmpl.has_value()) << tmpl.error().message;
    EXPECT_DOUBLE_EQ(tmpl->amountKzt(), 11800.0);

    auto applied = service->applyMandatoryExpense(0, "2025-02-01", kSystemWalletId);
    ASSERT_TRUE(applied.has_value()) << applied.error().message;
    EXPECT_EQ(applied->type(), RecordType::MandatoryExpense);
    EXPECT_DOUBLE_EQ(service->walletBalance(kSystemWalletId).value(), -11800.0);

    auto outOfRange = service->applyMandatoryExpense(5, "2025-02-01", kSystemWalletId);
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(outOfRange.error().kind, ErrorKind::NotFound);

    EXPECT_TRUE(service->deleteMandatoryExpense(0).value());
    EXPECT_FALSE(service->deleteMandatoryExpense(0).value());
}

TEST_F(LedgerServiceTest, MandatoryExpenseInvalidPeriod) {
    MandatoryExpenseRequest request;
    request.amount = 20.0;
    request.currency = "KZT";
    request.period = "hourly";
    EXPECT_FALSE(service->createMandatoryExpense(request).has_value());
}

// ============================================================================
// ТЕСТЫ: Переводы
// ============================================================================

TEST_F(LedgerServiceTest, TransferMovesMoney) {
    auto [a, b] = twoWallets(1000.0, 500.0);

    auto id = service->createTransfer(transfer(a, b, 100.0));
    ASSERT_TRUE(id.has_value()) << id.error().message;

    EXPECT_DOUBLE_EQ(service->walletBalance(a).value(), 900.0);
    EXPECT_DOUBLE_EQ(service->walletBalance(b).value(), 600.0);
    EXPECT_DOUBLE_EQ(service->netWorth().value(), 1500.0);

    auto records = service->records();
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2);
    EXPECT_EQ(records->at(0).transferId(), *id);
    EXPECT_EQ(records->at(1).transferId(), *id);
}

TEST_F(LedgerServiceTest, TransferWithCommission) {
    auto [a, b] = twoWallets(120.0, 10.0);

    auto id = service->createTransfer(transfer(a, b, 30.0, 2.0));
    ASSERT_TRUE(id.has_value()) << id.error().message;
    EXPECT_DOUBLE_EQ(service->walletBalance(a).value(), 88.0);
    EXPECT_DOUBLE_EQ(service->walletBalance(b).value(), 40.0);

    ASSERT_TRUE(service->deleteTransfer(*id).has_value());
    EXPECT_DOUBLE_EQ(service->walletBalance(a).value(), 120.0);
    EXPECT_DOUBLE_EQ(service->walletBalance(b).value(), 10.0);
    EXPECT_TRUE(service->records().value().empty());

    auto again = service->deleteTransfer(*id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::Domain);
}

TEST_F(LedgerServiceTest, InsufficientFundsLeavesDataUnchanged) {
    auto [a, b] = twoWallets(50.0, 0.0);

    auto id = service->createTransfer(transfer(a, b, 49.0, 2.0));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().kind, ErrorKind::InsufficientFunds);
    EXPECT_TRUE(service->transfers().value().empty());
    EXPECT_DOUBLE_EQ(service->walletBalance(a).value(), 50.0);
}

TEST_F(LedgerServiceTest, AllowNegativeWalletCanOverdraw) {
    auto a = service->createWallet("Credit", "KZT", 0.0, true);
    auto b = service->createWallet("Cash", "KZT", 0.0);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    auto id = service->createTransfer(transfer(a->id(), b->id(), 30.0));
    ASSERT_TRUE(id.has_value());
    EXPECT_DOUBLE_EQ(service->walletBalance(a->id()).value(), -30.0);
}

TEST_F(LedgerServiceTest, TransferValidation) {
    auto [a, b] = twoWallets(100.0, 0.0);

    auto same = service->createTransfer(transfer(a, a, 10.0));
    ASSERT_FALSE(same.has_value());
    EXPECT_EQ(same.error().kind, ErrorKind::Validation);

    auto zero = service->createTransfer(transfer(a, b, 0.0));
    ASSERT_FALSE(zero.has_value());

    auto negativeCommission = service->createTransfer(transfer(a, b, 10.0, -1.0));
    ASSERT_FALSE(negativeCommission.has_value());

    auto missing = service->createTransfer(transfer(a, 77, 10.0));
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(LedgerServiceTest, DeletingLegRemovesWholeTransfer) {
    auto [a, b] = twoWallets(100.0, 0.0);
    ASSERT_TRUE(service->createTransfer(transfer(a, b, 10.0, 1.0)).has_value());

    auto deleted = service->deleteRecord(1);
    ASSERT_TRUE(deleted.has_value()) << deleted.error().message;
    EXPECT_TRUE(*deleted);
    EXPECT_TRUE(service->records().value().empty());
    EXPECT_TRUE(service->transfers().value().empty());
}

TEST_F(LedgerServiceTest, DeleteRecordOutOfRange) {
    auto deleted = service->deleteRecord(3);
    ASSERT_TRUE(deleted.has_value());
    EXPECT_FALSE(*deleted);
}

TEST_F(LedgerServiceTest, TransferLegCannotBeEdited) {
    auto [a, b] = twoWallets(100.0, 0.0);
    ASSERT_TRUE(service->createTransfer(transfer(a, b, 10.0)).has_value());

    int legId = service->records().value().front().id();
    auto result = service->updateRecordAmountKzt(legId, 5.0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Domain);
}

// ============================================================================
// ТЕСТЫ: То же поведение на SQLite
// ============================================================================

TEST(LedgerServiceSQLiteTest, TransferAndDeleteOnSQLite) {
    auto dbPath = std::filesystem::temp_directory_path() / "ledger_service_sqlite.db";
    std::filesystem::remove(dbPath);
    {
        SQLiteStorage storage(dbPath.string());
        CurrencyService rates = CurrencyService::withDefaults();
        LedgerService service(storage, rates);

        auto a = service.createWallet("A", "KZT", 120.0);
        auto b = service.createWallet("B", "KZT", 10.0);
        ASSERT_TRUE(a.has_value());
        ASSERT_TRUE(b.has_value());

        TransferRequest request;
        request.fromWalletId = a->id();
        request.toWalletId = b->id();
        request.date = "2025-01-10";
        request.amount = 30.0;
        request.currency = "KZT";
        request.commissionAmount = 2.0;

        auto id = service.createTransfer(request);
        ASSERT_TRUE(id.has_value()) << id.error().message;
        EXPECT_DOUBLE_EQ(service.walletBalance(a->id()).value(), 88.0);
        EXPECT_DOUBLE_EQ(service.walletBalance(b->id()).value(), 40.0);

        ASSERT_TRUE(service.deleteTransfer(*id).has_value());
        EXPECT_DOUBLE_EQ(service.walletBalance(a->id()).value(), 120.0);
        EXPECT_FALSE(service.deleteTransfer(*id).has_value());
    }
    std::filesystem::remove(dbPath);
}
