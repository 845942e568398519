// include/ImportRowParser.hpp
#pragma once

#include "ICurrencyRates.hpp"
#include "LedgerError.hpp"
#include "Record.hpp"
#include "Transfer.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Политика импорта
// ═══════════════════════════════════════════════════════════════════════════════

enum class ImportPolicy {
    FullBackup,   // amount_original, currency, rate_at_operation, amount_kzt
    CurrentRate,  // amount_original, currency; курс из ICurrencyRates
    Legacy        // amount в базовой валюте
};

std::string_view toString(ImportPolicy policy) noexcept;

// "full_backup" | "current_rate" | "legacy"
Expected<ImportPolicy> parseImportPolicy(std::string_view text);

// Строка источника: ключ -> значение, всё строками
using ImportRow = std::map<std::string, std::string>;

// ═══════════════════════════════════════════════════════════════════════════════
// Результат разбора строки
// ═══════════════════════════════════════════════════════════════════════════════

struct InitialBalanceRow {
    double amount = 0.0;
};

struct RowError {
    std::string message;
};

using RowOutcome = std::variant<Record, InitialBalanceRow, RowError>;

// Компактная строка type=transfer, развёрнутая в агрегат и две ноги
struct ParsedTransfer {
    Transfer transfer;
    Record expenseLeg;   // from_wallet
    Record incomeLeg;    // to_wallet
};

using TransferRowOutcome = std::variant<ParsedTransfer, RowError>;

struct ParserOptions {
    ImportPolicy policy = ImportPolicy::FullBackup;
    const ICurrencyRates* rates = nullptr;  // обязателен для CurrentRate
    std::string baseCurrency = "KZT";
    bool mandatoryOnly = false;             // файл шаблонов обязательных расходов
};

// ═══════════════════════════════════════════════════════════════════════════════
// ImportRowParser - одна строка -> запись / начальный баланс / ошибка
// ═══════════════════════════════════════════════════════════════════════════════
//
// Никогда не бросает исключений: любая ошибка валидации возвращается
// как RowError и не прерывает разбор остальных строк.

class ImportRowParser {
public:
    explicit ImportRowParser(ParserOptions options);

    RowOutcome parseRow(const ImportRow& row, std::string_view rowLabel) const;

    // fallbackTransferId используется, если в строке нет transfer_id
    TransferRowOutcome parseTransferRow(
        const ImportRow& row,
        std::string_view rowLabel,
        int fallbackTransferId) const;

    const ParserOptions& options() const noexcept { return options_; }

    // ───────────────────────────────────────────────────────────────────────────
    // Нормализация
    // ───────────────────────────────────────────────────────────────────────────

    // trim, нижний регистр, пробелы -> '_'
    static std::string normalizeKey(std::string_view key);
    static ImportRow normalizeKeys(const ImportRow& row);

    // Псевдонимы типа: mandatory, mandatory_expenses, ... -> mandatory_expense
    static std::string normalizeType(std::string_view type);

    // "12.5", " -3 ", "(12.5)" -> -12.5; иначе nullopt
    static std::optional<double> parseNumber(std::string_view text);

    static bool isBlankRow(const ImportRow& row);

private:
    struct Amounts {
        double amountOriginal = 0.0;
        std::string currency;
        double amountKzt = 0.0;
    };

    std::expected<Amounts, std::string> resolveAmounts(
        const ImportRow& row, std::string_view rowLabel) const;

    ParserOptions options_;
};

} // namespace ledger
