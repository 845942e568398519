#include <gtest/gtest.h>
#include "TransferIntegrity.hpp"

using namespace ledger;
using namespace std::chrono;

class TransferIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        TransferDraft t;
        t.id = 1;
        t.fromWalletId = 1;
        t.toWalletId = 2;
        t.date = Date{year{2025}, month{1}, day{5}};
        t.amountOriginal = 100.0;
        t.currency = "KZT";
        t.amountKzt = 100.0;
        transfers.push_back(*Transfer::create(t, "KZT"));
    }

    Record makeLeg(int id, RecordType type, int walletId, double amount = 100.0) {
        RecordDraft d;
        d.id = id;
        d.type = type;
        d.date = Date{year{2025}, month{1}, day{5}};
        d.walletId = walletId;
        d.transferId = 1;
        d.amountOriginal = amount;
        d.currency = "KZT";
        d.amountKzt = amount;
        d.category = "Transfer";
        return *Record::create(d, "KZT");
    }

    std::vector<Transfer> transfers;
    Record expense = makeLeg(10, RecordType::Expense, 1);
    Record income = makeLeg(11, RecordType::Income, 2);
};

// ============================================================================
// ТЕСТЫ: Корректные данные
// ============================================================================

TEST_F(TransferIntegrityTest, ValidPairPasses) {
    EXPECT_TRUE(validateTransferIntegrity({expense, income}, transfers).has_value());
}

TEST_F(TransferIntegrityTest, EmptyLedgerPasses) {
    EXPECT_TRUE(validateTransferIntegrity({}, {}).has_value());
}

// ============================================================================
// ТЕСТЫ: Нарушения
// ============================================================================

TEST_F(TransferIntegrityTest, DanglingLinkDetected) {
    auto result = validateTransferIntegrity({expense, income}, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::DanglingTransferLink);
}

TEST_F(TransferIntegrityTest, MissingLegDetected) {
    auto result = validateTransferIntegrity({expense}, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::BrokenTransferPair);
    EXPECT_NE(result.error().message.find("#1"), std::string::npos);
}

TEST_F(TransferIntegrityTest, TwoExpensesDetected) {
    Record second = makeLeg(11, RecordType::Expense, 2);
    auto result = validateTransferIntegrity({expense, second}, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::BrokenTransferPair);
}

TEST_F(TransferIntegrityTest, SwappedWalletsDetected) {
    Record wrongExpense = makeLeg(10, RecordType::Expense, 2);
    Record wrongIncome = makeLeg(11, RecordType::Income, 1);
    auto result = validateTransferIntegrity({wrongExpense, wrongIncome}, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::BrokenTransferPair);
}

TEST_F(TransferIntegrityTest, DisagreeingAmountsDetected) {
    Record bigger = makeLeg(11, RecordType::Income, 2, 120.0);
    auto result = validateTransferIntegrity({expense, bigger}, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::BrokenTransferPair);
}

TEST_F(TransferIntegrityTest, DanglingCommissionDetected) {
    RecordDraft d;
    d.id = 12;
    d.type = RecordType::Expense;
    d.date = Date{year{2025}, month{1}, day{5}};
    d.walletId = 1;
    d.commissionForTransferId = 7;
    d.amountOriginal = 2.0;
    d.currency = "KZT";
    d.amountKzt = 2.0;
    Record commission = *Record::create(d, "KZT");

    auto result = validateTransferIntegrity({expense, income, commission}, transfers);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::DanglingTransferLink);
}

TEST_F(TransferIntegrityTest, CollectReportsEveryIssue) {
    TransferDraft t = transfers.front().toDraft();
    t.id = 2;
    transfers.push_back(*Transfer::create(t, "KZT"));

    auto issues = collectTransferIntegrityIssues({expense}, transfers);
    EXPECT_EQ(issues.size(), 2);
}
