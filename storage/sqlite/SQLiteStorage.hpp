// storage/sqlite/SQLiteStorage.hpp
#pragma once

#include "ILedgerStorage.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace ledger {

class SQLiteStorage : public ILedgerStorage {
public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // createSchema = false: открыть базу без создания таблиц (dry-run)
    explicit SQLiteStorage(
        std::string_view dbPath,
        std::string baseCurrency = "KZT",
        bool createSchema = true);
    ~SQLiteStorage() override;

    // Disable copy
    SQLiteStorage(const SQLiteStorage&) = delete;
    SQLiteStorage& operator=(const SQLiteStorage&) = delete;

    const std::string& path() const noexcept { return dbPath_; }

    // ═════════════════════════════════════════════════════════════════════════
    // ILedgerStorage interface
    // ═════════════════════════════════════════════════════════════════════════

    Expected<std::vector<Wallet>> loadWallets() override;
    Result saveWallet(const Wallet& wallet) override;

    Expected<std::vector<Record>> loadAll() override;
    Expected<Record> save(const Record& record) override;
    Result replace(const Record& record) override;
    Expected<bool> deleteByIndex(std::size_t index) override;
    Result deleteAll() override;

    Expected<std::vector<Transfer>> loadTransfers() override;
    Result saveTransfer(const Transfer& transfer) override;

    Expected<std::vector<Record>> loadMandatoryExpenses() override;
    Expected<Record> saveMandatoryExpense(const Record& expense) override;
    Expected<bool> deleteMandatoryExpenseByIndex(std::size_t index) override;
    Result deleteAllMandatoryExpenses() override;

    Result replaceRecordsAndTransfers(
        const std::vector<Record>& records,
        const std::vector<Transfer>& transfers) override;

    Result replaceAllData(const LedgerSnapshot& snapshot) override;

    Expected<LedgerSnapshot> loadSnapshot() override;

    // ═════════════════════════════════════════════════════════════════════════
    // Схема
    // ═════════════════════════════════════════════════════════════════════════

    // Выполнить SQL-скрипт схемы из файла
    Result applySchemaFile(const std::filesystem::path& schemaPath);

    // Проверить, что схема применяется, и откатить (без записи)
    Result checkSchemaFile(const std::filesystem::path& schemaPath);

    // ═════════════════════════════════════════════════════════════════════════
    // Транзакции
    // ═════════════════════════════════════════════════════════════════════════

    Result beginTransaction();
    Result commitTransaction();
    Result rollbackTransaction();

    // ═════════════════════════════════════════════════════════════════════════
    // Построчные операции для миграции (внутри внешней транзакции)
    // ═════════════════════════════════════════════════════════════════════════

    // preserveId = false: id назначает AUTOINCREMENT. Возвращает id строки
    Expected<int> insertWallet(const Wallet& wallet, bool preserveId);
    Expected<int> insertTransfer(const Transfer& transfer, bool preserveId);
    Expected<int> insertRecord(const Record& record, bool preserveId);
    Expected<int> insertMandatoryExpense(const Record& expense, bool preserveId);

    // Выровнять sqlite_sequence по MAX(id) таблицы
    Result syncSequence(std::string_view table);

    Expected<TableCounts> tableCounts();

    // Балансы, посчитанные средствами SQL
    Expected<std::map<int, double>> queryWalletBalances();
    Expected<double> queryNetWorth();

    Expected<bool> hasAnyData();

    // Произвольный SQL без результата
    Result execute(std::string_view sql);

private:
    Result initializeDatabase(bool createSchema);
    Result createTables();

    Expected<LedgerSnapshot> readAll();
    Expected<std::vector<Wallet>> readWallets();
    Expected<std::vector<Record>> readRecords();
    Expected<std::vector<Record>> readMandatoryExpenses();
    Expected<std::vector<Transfer>> readTransfers();

    Result clearRecordsAndTransfers();
    Expected<int> recordIdAt(std::string_view table, std::size_t index);
    Expected<bool> rowExists(std::string_view table, int id);
    Expected<std::size_t> countRows(std::string_view table);

    Error sqliteError(const std::string& what) const;

    std::string dbPath_;
    std::string baseCurrency_;
    sqlite3* db_ = nullptr;
};

// ═════════════════════════════════════════════════════════════════════════════
// SQLiteTransaction - откатывает транзакцию, если не было commit()
// ═════════════════════════════════════════════════════════════════════════════

class SQLiteTransaction {
public:
    // Бросает std::runtime_error, если BEGIN не удался
    explicit SQLiteTransaction(SQLiteStorage& storage);
    ~SQLiteTransaction();

    SQLiteTransaction(const SQLiteTransaction&) = delete;
    SQLiteTransaction& operator=(const SQLiteTransaction&) = delete;

    Result commit();
    Result rollback();

    bool active() const noexcept { return active_; }

private:
    SQLiteStorage& storage_;
    bool active_ = false;
};

} // namespace ledger
