// include/ILedgerStorage.hpp
#pragma once

#include "LedgerError.hpp"
#include "LedgerSnapshot.hpp"
#include "Record.hpp"
#include "Transfer.hpp"
#include "Wallet.hpp"
#include <cstddef>
#include <vector>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ILedgerStorage
// ═══════════════════════════════════════════════════════════════════════════════
//
// Общий контракт JSON- и SQLite-хранилища. Каждый метод загрузки
// повторно проверяет целостность переводов и не возвращает данные
// при нарушении. Массовые замены атомарны.

class ILedgerStorage {
public:
    virtual ~ILedgerStorage() = default;

    // ───────────────────────────────────────────────────────────────────────────
    // Кошельки
    // ───────────────────────────────────────────────────────────────────────────

    virtual Expected<std::vector<Wallet>> loadWallets() = 0;

    // Upsert по id
    virtual Result saveWallet(const Wallet& wallet) = 0;

    // ───────────────────────────────────────────────────────────────────────────
    // Записи
    // ───────────────────────────────────────────────────────────────────────────

    virtual Expected<std::vector<Record>> loadAll() = 0;

    // Добавить запись; если id не задан или занят - назначается следующий
    virtual Expected<Record> save(const Record& record) = 0;

    // Заменить запись с тем же id
    virtual Result replace(const Record& record) = 0;

    // false - индекс вне диапазона
    virtual Expected<bool> deleteByIndex(std::size_t index) = 0;

    // Удаляет все записи и все переводы
    virtual Result deleteAll() = 0;

    // ───────────────────────────────────────────────────────────────────────────
    // Переводы
    // ───────────────────────────────────────────────────────────────────────────

    virtual Expected<std::vector<Transfer>> loadTransfers() = 0;

    // Upsert по id
    virtual Result saveTransfer(const Transfer& transfer) = 0;

    // ───────────────────────────────────────────────────────────────────────────
    // Шаблоны обязательных расходов
    // ───────────────────────────────────────────────────────────────────────────

    virtual Expected<std::vector<Record>> loadMandatoryExpenses() = 0;
    virtual Expected<Record> saveMandatoryExpense(const Record& expense) = 0;
    virtual Expected<bool> deleteMandatoryExpenseByIndex(std::size_t index) = 0;
    virtual Result deleteAllMandatoryExpenses() = 0;

    // ───────────────────────────────────────────────────────────────────────────
    // Массовые операции
    // ───────────────────────────────────────────────────────────────────────────

    virtual Result replaceRecordsAndTransfers(
        const std::vector<Record>& records,
        const std::vector<Transfer>& transfers) = 0;

    virtual Result replaceAllData(const LedgerSnapshot& snapshot) = 0;

    virtual Expected<LedgerSnapshot> loadSnapshot() = 0;
};

} // namespace ledger
