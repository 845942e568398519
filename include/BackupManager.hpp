// include/BackupManager.hpp
#pragma once

#include "LedgerError.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>

namespace ledger {

class SQLiteStorage;

// ═══════════════════════════════════════════════════════════════════════════════
// BackupManager - копии JSON-документа и зеркало SQLite -> JSON
// ═══════════════════════════════════════════════════════════════════════════════

class BackupManager {
public:
    explicit BackupManager(std::ostream& log = std::cout);

    // <dir>/backups/<stem>_backup_YYYYMMDD_HHMMSS<ext>;
    // nullopt, если исходного файла нет
    Expected<std::optional<std::filesystem::path>> createBackup(
        const std::filesystem::path& jsonPath,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Полностью перезаписывает JSON-документ содержимым SQLite
    Result exportToJson(SQLiteStorage& sqlite, const std::filesystem::path& jsonPath);

    static std::filesystem::path backupPathFor(
        const std::filesystem::path& jsonPath,
        std::chrono::system_clock::time_point now);

private:
    std::ostream& log_;
};

} // namespace ledger
