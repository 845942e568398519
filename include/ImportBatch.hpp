// include/ImportBatch.hpp
#pragma once

#include "ImportRowParser.hpp"
#include "LedgerSnapshot.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ledger {

inline constexpr std::size_t kDefaultMaxImportRows = 100000;

struct ImportSummary {
    std::size_t imported = 0;
    std::size_t skipped = 0;
    std::vector<std::string> errors;
};

struct ImportBatchOptions {
    ImportPolicy policy = ImportPolicy::FullBackup;
    const ICurrencyRates* rates = nullptr;
    std::string baseCurrency = "KZT";
    std::size_t maxRows = kDefaultMaxImportRows;
    std::optional<std::set<int>> walletIds;  // известные кошельки, если проверка нужна
};

struct RecordBatch {
    std::vector<Record> records;
    std::vector<Transfer> transfers;
    std::optional<double> initialBalance;
    ImportSummary summary;
};

struct MandatoryBatch {
    std::vector<Record> expenses;
    ImportSummary summary;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ImportBatch - правила пакетного импорта поверх ImportRowParser
// ═══════════════════════════════════════════════════════════════════════════════

class ImportBatch {
public:
    // Ошибка возвращается только при превышении лимита строк;
    // ошибки отдельных строк собираются в summary
    static Expected<RecordBatch> parseRecords(
        const std::vector<ImportRow>& rows,
        const ImportBatchOptions& options);

    static Expected<MandatoryBatch> parseMandatoryExpenses(
        const std::vector<ImportRow>& rows,
        const ImportBatchOptions& options);

    // Строки для повторного импорта политикой FullBackup:
    // initial_balance системного кошелька, записи вне переводов, строки transfer
    static std::vector<ImportRow> exportRows(const LedgerSnapshot& snapshot);

    static std::vector<ImportRow> exportMandatoryRows(const std::vector<Record>& expenses);

private:
    static Result checkRowLimit(std::size_t count, std::size_t maxRows);

    // Восстановить агрегаты переводов по ногам, если строк transfer не было
    static void restoreMissingTransfers(
        const std::vector<Record>& records,
        std::vector<Transfer>& transfers,
        std::string_view baseCurrency,
        ImportSummary& summary);
};

} // namespace ledger
