// include/ImportService.hpp
#pragma once

#include "ILedgerStorage.hpp"
#include "ImportBatch.hpp"
#include <vector>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// ImportService - применение пакета импорта к хранилищу
// ═══════════════════════════════════════════════════════════════════════════════
//
// Импорт атомарный: если хотя бы одна строка отклонена, хранилище
// не изменяется, а ошибка перечисляет первые три причины.

class ImportService {
public:
    ImportService(ILedgerStorage& storage, ImportBatchOptions options);

    // Полная замена записей и переводов
    Expected<ImportSummary> importRecords(const std::vector<ImportRow>& rows);

    // Полная замена шаблонов обязательных расходов
    Expected<ImportSummary> importMandatoryExpenses(const std::vector<ImportRow>& rows);

    // Восстановление полного снимка
    Result importFullBackup(const LedgerSnapshot& snapshot);

    Expected<std::vector<ImportRow>> exportRecords();
    Expected<std::vector<ImportRow>> exportMandatoryExpenses();

private:
    static Result ensureImportValid(const ImportSummary& summary);

    ILedgerStorage& storage_;
    ImportBatchOptions options_;
};

} // namespace ledger
