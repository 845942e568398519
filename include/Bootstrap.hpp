// include/Bootstrap.hpp
#pragma once

#include "ILedgerStorage.hpp"
#include "LedgerConfig.hpp"
#include <iostream>
#include <memory>

namespace ledger {

class SQLiteStorage;

// ═══════════════════════════════════════════════════════════════════════════════
// Выбор хранилища при запуске
// ═══════════════════════════════════════════════════════════════════════════════
//
// use_sqlite = false: JSON-хранилище как есть.
// Иначе: резервная копия JSON, однократная миграция в пустую SQLite,
// сверка количеств и net worth двух хранилищ, зеркалирование SQLite
// обратно в JSON. Любое расхождение - аварийная ошибка.

Expected<std::unique_ptr<ILedgerStorage>> bootstrapStorage(
    const LedgerConfig& config,
    std::ostream& log = std::cout);

// Сверка JSON-документа с SQLite: количества кошельков, записей,
// переводов и net worth с допуском 1e-5
Result validateStartupIntegrity(
    const LedgerConfig& config,
    SQLiteStorage& sqlite,
    std::ostream& log = std::cout);

} // namespace ledger
