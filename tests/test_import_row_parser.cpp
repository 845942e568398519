#include <gtest/gtest.h>
#include "CurrencyService.hpp"
#include "ImportRowParser.hpp"

using namespace ledger;

class ImportRowParserTest : public ::testing::Test {
protected:
    ImportRowParser parser(ImportPolicy policy, bool mandatoryOnly = false) {
        return ImportRowParser(ParserOptions{policy, &rates, "KZT", mandatoryOnly});
    }

    static const Record* asRecord(const RowOutcome& outcome) {
        return std::get_if<Record>(&outcome);
    }

    static std::string errorOf(const RowOutcome& outcome) {
        auto* error = std::get_if<RowError>(&outcome);
        return error ? error->message : std::string{};
    }

    CurrencyService rates = CurrencyService::withDefaults();

    ImportRow fullRow{
        {"date", "2025-01-15"},
        {"type", "income"},
        {"wallet_id", "1"},
        {"category", "Salary"},
        {"amount_original", "10"},
        {"currency", "usd"},
        {"rate_at_operation", "480"},
        {"amount_kzt", "4800"},
        {"description", "January"},
    };
};

// ============================================================================
// ТЕСТЫ: Нормализация
// ============================================================================

TEST_F(ImportRowParserTest, NormalizeKey) {
    EXPECT_EQ(ImportRowParser::normalizeKey("  Amount Original "), "amount_original");
    EXPECT_EQ(ImportRowParser::normalizeKey("TYPE"), "type");
}

TEST_F(ImportRowParserTest, NormalizeTypeAliases) {
    EXPECT_EQ(ImportRowParser::normalizeType("Mandatory"), "mandatory_expense");
    EXPECT_EQ(ImportRowParser::normalizeType("mandatory expenses"), "mandatory_expense");
    EXPECT_EQ(ImportRowParser::normalizeType("Income"), "income");
}

TEST_F(ImportRowParserTest, ParseNumber) {
    EXPECT_DOUBLE_EQ(ImportRowParser::parseNumber(" 12.5 ").value(), 12.5);
    EXPECT_DOUBLE_EQ(ImportRowParser::parseNumber("(12.5)").value(), -12.5);
    EXPECT_DOUBLE_EQ(ImportRowParser::parseNumber("+3").value(), 3.0);
    EXPECT_FALSE(ImportRowParser::parseNumber("12,5").has_value());
    EXPECT_FALSE(ImportRowParser::parseNumber("abc").has_value());
    EXPECT_FALSE(ImportRowParser::parseNumber("").has_value());
}

TEST_F(ImportRowParserTest, BlankRow) {
    EXPECT_TRUE(ImportRowParser::isBlankRow({{"date", " "}, {"type", ""}}));
    EXPECT_FALSE(ImportRowParser::isBlankRow({{"date", "2025-01-01"}}));
}

TEST_F(ImportRowParserTest, ParsePolicy) {
    EXPECT_EQ(parseImportPolicy("Full Backup").value(), ImportPolicy::FullBackup);
    EXPECT_EQ(parseImportPolicy("current_rate").value(), ImportPolicy::CurrentRate);
    EXPECT_FALSE(parseImportPolicy("whatever").has_value());
}

// ============================================================================
// ТЕСТЫ: Политики
// ============================================================================

TEST_F(ImportRowParserTest, FullBackupKeepsStoredAmounts) {
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(fullRow, "row 1");
    const Record* record = asRecord(outcome);
    ASSERT_NE(record, nullptr) << errorOf(outcome);
    EXPECT_EQ(record->currency(), "USD");
    EXPECT_DOUBLE_EQ(record->amountKzt(), 4800.0);
    EXPECT_DOUBLE_EQ(record->rateAtOperation(), 480.0);
    EXPECT_EQ(record->description(), "January");
}

TEST_F(ImportRowParserTest, FullBackupRequiresRate) {
    ImportRow row = fullRow;
    row.erase("rate_at_operation");
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("rate_at_operation"), std::string::npos);
}

TEST_F(ImportRowParserTest, CurrentRateUsesService) {
    auto outcome = parser(ImportPolicy::CurrentRate).parseRow(fullRow, "row 1");
    const Record* record = asRecord(outcome);
    ASSERT_NE(record, nullptr) << errorOf(outcome);
    EXPECT_DOUBLE_EQ(record->amountKzt(), 5000.0);
    EXPECT_DOUBLE_EQ(record->rateAtOperation(), 500.0);
}

TEST_F(ImportRowParserTest, CurrentRateWithoutServiceFails) {
    ImportRowParser noRates(ParserOptions{ImportPolicy::CurrentRate, nullptr, "KZT", false});
    auto outcome = noRates.parseRow(fullRow, "row 1");
    EXPECT_NE(errorOf(outcome).find("currency service"), std::string::npos);
}

TEST_F(ImportRowParserTest, LegacyUsesBaseCurrency) {
    ImportRow row{
        {"date", "2025-01-15"},
        {"type", "expense"},
        {"category", "Food"},
        {"amount", "-250"},
    };
    auto outcome = parser(ImportPolicy::Legacy).parseRow(row, "row 1");
    const Record* record = asRecord(outcome);
    ASSERT_NE(record, nullptr) << errorOf(outcome);
    EXPECT_EQ(record->currency(), "KZT");
    EXPECT_DOUBLE_EQ(record->amountKzt(), 250.0);
    EXPECT_EQ(record->walletId(), kSystemWalletId);
}

// ============================================================================
// ТЕСТЫ: Ошибки строки
// ============================================================================

TEST_F(ImportRowParserTest, InvalidDateIsRowError) {
    ImportRow row = fullRow;
    row["date"] = "2025-13-01";
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 2");
    std::string error = errorOf(outcome);
    ASSERT_FALSE(error.empty());
    EXPECT_EQ(error.rfind("row 2:", 0), 0u);
}

TEST_F(ImportRowParserTest, InvalidCurrencyIsRowError) {
    ImportRow row = fullRow;
    row["currency"] = "US";
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("invalid currency"), std::string::npos);
}

TEST_F(ImportRowParserTest, MissingFieldReported) {
    ImportRow row = fullRow;
    row.erase("category");
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("missing required field 'category'"), std::string::npos);
}

TEST_F(ImportRowParserTest, UnsupportedType) {
    ImportRow row = fullRow;
    row["type"] = "refund";
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("unsupported type"), std::string::npos);
}

TEST_F(ImportRowParserTest, InvalidWalletId) {
    ImportRow row = fullRow;
    row["wallet_id"] = "1.5";
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("invalid wallet_id"), std::string::npos);
}

TEST_F(ImportRowParserTest, OutOfRangeIdsRejected) {
    ImportRow row = fullRow;
    row["wallet_id"] = "99999999999";
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("invalid wallet_id"), std::string::npos);

    row = fullRow;
    row["transfer_id"] = "1e12";
    outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    EXPECT_NE(errorOf(outcome).find("invalid transfer_id"), std::string::npos);

    ImportRow transfer{
        {"date", "2025-01-20"},
        {"from_wallet_id", "-99999999999"},
        {"to_wallet_id", "2"},
        {"amount_original", "100"},
        {"currency", "KZT"},
        {"rate_at_operation", "1"},
        {"amount_kzt", "100"},
    };
    auto transferOutcome = parser(ImportPolicy::FullBackup).parseTransferRow(transfer, "row 2", 1);
    auto* error = std::get_if<RowError>(&transferOutcome);
    ASSERT_NE(error, nullptr);
    EXPECT_NE(error->message.find("invalid transfer wallets"), std::string::npos);
}

TEST_F(ImportRowParserTest, InitialBalanceRow) {
    ImportRow row{{"type", "initial_balance"}, {"amount_original", "1500"}};
    auto outcome = parser(ImportPolicy::FullBackup).parseRow(row, "row 1");
    auto* balance = std::get_if<InitialBalanceRow>(&outcome);
    ASSERT_NE(balance, nullptr);
    EXPECT_DOUBLE_EQ(balance->amount, 1500.0);
}

TEST_F(ImportRowParserTest, MandatoryRowDefaultsToMonthly) {
    ImportRow row = fullRow;
    row.erase("date");
    row["type"] = "mandatory";
    auto outcome = parser(ImportPolicy::FullBackup, true).parseRow(row, "row 1");
    const Record* record = asRecord(outcome);
    ASSERT_NE(record, nullptr) << errorOf(outcome);
    EXPECT_EQ(record->type(), RecordType::MandatoryExpense);
    EXPECT_EQ(record->period(), Period::Monthly);
    EXPECT_FALSE(record->date().has_value());
}

// ============================================================================
// ТЕСТЫ: Строка перевода
// ============================================================================

TEST_F(ImportRowParserTest, TransferRowExpandsIntoLegs) {
    ImportRow row{
        {"date", "2025-01-20"},
        {"type", "transfer"},
        {"from_wallet_id", "1"},
        {"to_wallet_id", "2"},
        {"amount_original", "100"},
        {"currency", "KZT"},
        {"rate_at_operation", "1"},
        {"amount_kzt", "100"},
    };
    auto outcome = parser(ImportPolicy::FullBackup).parseTransferRow(row, "row 1", 7);
    auto* parsed = std::get_if<ParsedTransfer>(&outcome);
    ASSERT_NE(parsed, nullptr);
    EXPECT_EQ(parsed->transfer.id(), 7);
    EXPECT_EQ(parsed->expenseLeg.walletId(), 1);
    EXPECT_EQ(parsed->expenseLeg.type(), RecordType::Expense);
    EXPECT_EQ(parsed->incomeLeg.walletId(), 2);
    EXPECT_EQ(parsed->incomeLeg.transferId(), 7);
    EXPECT_EQ(parsed->incomeLeg.category(), "Transfer");
}

TEST_F(ImportRowParserTest, TransferRowSameWalletsRejected) {
    ImportRow row{
        {"date", "2025-01-20"},
        {"from_wallet_id", "2"},
        {"to_wallet_id", "2"},
        {"amount_original", "100"},
        {"currency", "KZT"},
        {"rate_at_operation", "1"},
        {"amount_kzt", "100"},
    };
    auto outcome = parser(ImportPolicy::FullBackup).parseTransferRow(row, "row 1", 1);
    EXPECT_TRUE(std::holds_alternative<RowError>(outcome));
}
