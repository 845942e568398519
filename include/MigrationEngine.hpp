// include/MigrationEngine.hpp
#pragma once

#include "LedgerError.hpp"
#include "LedgerSnapshot.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace ledger {

class SQLiteStorage;

struct MigrationOptions {
    std::filesystem::path jsonPath;
    std::filesystem::path sqlitePath;
    std::filesystem::path schemaPath{"db/schema.sql"};
    bool dryRun = false;
    std::string baseCurrency = "KZT";
};

struct MigrationReport {
    TableCounts source;
    TableCounts inserted;
    bool noOp = false;      // цель уже содержит те же данные
    bool dryRun = false;
};

// Точка вмешательства для тестов: между вставкой и проверкой
struct MigrationHooks {
    std::function<void(SQLiteStorage&)> beforeVerify;
};

// Соответствие id источника и id в SQLite
struct MigrationIdMaps {
    std::map<int, int> wallets;
    std::map<int, int> transfers;
    std::map<std::size_t, int> records;            // по позиции в источнике
    std::map<std::size_t, int> mandatoryExpenses;  // по позиции в источнике
};

// ═══════════════════════════════════════════════════════════════════════════════
// MigrationEngine - перенос JSON-хранилища в SQLite
// ═══════════════════════════════════════════════════════════════════════════════
//
// Реальный запуск на пустой цели вставляет всё в одной транзакции и
// фиксирует её только если количества строк, балансы кошельков и
// net worth, посчитанные SQL по цели, совпадают с источником.
// Повторный запуск на эквивалентной цели ничего не делает;
// на отличающейся цели завершается ошибкой без записи.

class MigrationEngine {
public:
    explicit MigrationEngine(MigrationOptions options, std::ostream& log = std::cout);

    void setHooks(MigrationHooks hooks) { hooks_ = std::move(hooks); }

    Expected<MigrationReport> run();

    // Проверки источника до любых операций с целью
    static Result validateSource(const LedgerSnapshot& source);

    // Пустой результат - цель соответствует источнику
    static std::vector<std::string> verifyTarget(
        SQLiteStorage& target,
        const LedgerSnapshot& source,
        const MigrationIdMaps& maps);

    // id, которые insertAll присваивает в пустой цели: исходные или по порядку
    static MigrationIdMaps expectedMaps(const LedgerSnapshot& source);

private:
    Expected<LedgerSnapshot> loadSource();
    Expected<MigrationReport> runDry(const LedgerSnapshot& source);
    Expected<MigrationReport> runReal(const LedgerSnapshot& source);

    Expected<MigrationIdMaps> insertAll(SQLiteStorage& target, const LedgerSnapshot& source);

    MigrationOptions options_;
    MigrationHooks hooks_;
    std::ostream& log_;
};

} // namespace ledger
