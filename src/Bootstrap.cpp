#include "Bootstrap.hpp"
#include "BackupManager.hpp"
#include "JsonFileStorage.hpp"
#include "MigrationEngine.hpp"
#include "Money.hpp"
#include "SQLiteStorage.hpp"
#include <sstream>

namespace ledger {

namespace {

Error emergency(const std::string& message) {
    return Error{ErrorKind::Storage, "Emergency mode: " + message};
}

Result compareCount(const char* name, std::size_t json, std::size_t sqlite) {
    if (json == sqlite) {
        return {};
    }
    return std::unexpected(emergency(std::string(name) + " mismatch JSON="
        + std::to_string(json) + " SQLite=" + std::to_string(sqlite)));
}

} // namespace

Result validateStartupIntegrity(
    const LedgerConfig& config,
    SQLiteStorage& sqlite,
    std::ostream& log)
{
    JsonFileStorage json(config.jsonPath, config.baseCurrency);
    auto source = json.loadSnapshot();
    if (!source) {
        return std::unexpected(emergency("JSON load failed: " + source.error().message));
    }

    auto counts = sqlite.tableCounts();
    if (!counts) {
        return std::unexpected(counts.error());
    }

    if (auto r = compareCount("wallets", source->wallets.size(), counts->wallets); !r) {
        return r;
    }
    if (auto r = compareCount("records", source->records.size(), counts->records); !r) {
        return r;
    }
    if (auto r = compareCount("transfers", source->transfers.size(), counts->transfers); !r) {
        return r;
    }

    auto sqliteNetWorth = sqlite.queryNetWorth();
    if (!sqliteNetWorth) {
        return std::unexpected(sqliteNetWorth.error());
    }
    double jsonNetWorth = netWorth(source->wallets, source->records);
    if (!nearlyEqual(jsonNetWorth, *sqliteNetWorth)) {
        std::ostringstream message;
        message << "net worth mismatch JSON=" << jsonNetWorth << " SQLite=" << *sqliteNetWorth;
        return std::unexpected(emergency(message.str()));
    }

    log << "[bootstrap] Integrity check passed\n";
    return {};
}

Expected<std::unique_ptr<ILedgerStorage>> bootstrapStorage(
    const LedgerConfig& config,
    std::ostream& log)
{
    if (!config.useSqlite) {
        log << "[bootstrap] Storage selected: JSON\n";
        return std::make_unique<JsonFileStorage>(config.jsonPath, config.baseCurrency);
    }

    log << "[bootstrap] Storage selected: SQLite\n";
    BackupManager backups(log);
    if (config.backupEnabled) {
        auto backup = backups.createBackup(config.jsonPath);
        if (!backup) {
            return std::unexpected(backup.error());
        }
    }

    std::unique_ptr<SQLiteStorage> sqlite;
    try {
        sqlite = std::make_unique<SQLiteStorage>(config.sqlitePath.string(), config.baseCurrency);
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage, e.what());
    }

    auto hasData = sqlite->hasAnyData();
    if (!hasData) {
        return std::unexpected(hasData.error());
    }

    bool jsonExists = std::filesystem::exists(config.jsonPath);
    if (!*hasData && jsonExists) {
        log << "[bootstrap] SQLite empty, starting one-time migration from JSON\n";

        MigrationOptions options;
        options.jsonPath = config.jsonPath;
        options.sqlitePath = config.sqlitePath;
        options.schemaPath = config.schemaPath;
        options.baseCurrency = config.baseCurrency;

        // Миграция открывает собственное соединение
        sqlite.reset();
        MigrationEngine engine(options, log);
        auto report = engine.run();
        if (!report) {
            return std::unexpected(emergency("migration to SQLite failed: " + report.error().message));
        }

        try {
            sqlite = std::make_unique<SQLiteStorage>(config.sqlitePath.string(), config.baseCurrency);
        } catch (const std::exception& e) {
            return makeError(ErrorKind::Storage, e.what());
        }
    } else if (*hasData) {
        log << "[bootstrap] SQLite already has data, migration skipped\n";
    } else {
        log << "[bootstrap] JSON source file not found, migration skipped\n";
    }

    if (jsonExists) {
        auto integrity = validateStartupIntegrity(config, *sqlite, log);
        if (!integrity) {
            return std::unexpected(integrity.error());
        }
    }

    auto exported = backups.exportToJson(*sqlite, config.jsonPath);
    if (!exported) {
        return std::unexpected(exported.error());
    }

    return std::unique_ptr<ILedgerStorage>(std::move(sqlite));
}

} // namespace ledger
