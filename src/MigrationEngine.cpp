#include "MigrationEngine.hpp"
#include "JsonFileStorage.hpp"
#include "Money.hpp"
#include "SQLiteStorage.hpp"
#include "TransferIntegrity.hpp"
#include <set>
#include <sstream>

namespace ledger {

namespace {

template <typename T>
bool allPositiveUnique(const std::vector<T>& items) {
    std::set<int> seen;
    for (const auto& item : items) {
        if (item.id() <= 0 || !seen.insert(item.id()).second) {
            return false;
        }
    }
    return true;
}

Expected<int> mapId(const std::map<int, int>& map, int sourceId, const std::string& what) {
    auto it = map.find(sourceId);
    if (it == map.end()) {
        return makeError(ErrorKind::Migration,
            what + " id mapping missing for source #" + std::to_string(sourceId));
    }
    return it->second;
}

Expected<std::optional<int>> mapOptionalId(
    const std::map<int, int>& map, const std::optional<int>& sourceId, const std::string& what)
{
    if (!sourceId) {
        return std::optional<int>{};
    }
    auto mapped = mapId(map, *sourceId, what);
    if (!mapped) {
        return std::unexpected(mapped.error());
    }
    return std::optional<int>{*mapped};
}

std::string joinFirst(const std::vector<std::string>& lines, std::size_t limit) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size() && i < limit; ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += lines[i];
    }
    return joined;
}

void printCounts(std::ostream& log, const TableCounts& counts) {
    log << "  wallets: " << counts.wallets << "\n"
        << "  transfers: " << counts.transfers << "\n"
        << "  records: " << counts.records << "\n"
        << "  mandatory_expenses: " << counts.mandatoryExpenses << "\n";
}

} // namespace

MigrationEngine::MigrationEngine(MigrationOptions options, std::ostream& log)
    : options_(std::move(options))
    , log_(log)
{
}

// ═════════════════════════════════════════════════════════════════════════════
// Источник
// ═════════════════════════════════════════════════════════════════════════════

Expected<LedgerSnapshot> MigrationEngine::loadSource() {
    if (!std::filesystem::exists(options_.jsonPath)) {
        return makeError(ErrorKind::Migration,
            "Source JSON not found: " + options_.jsonPath.string());
    }

    // Источник только читается: обновлённый legacy-формат не записывается
    JsonFileStorage source(options_.jsonPath, options_.baseCurrency, false);
    return source.loadSnapshot();
}

Result MigrationEngine::validateSource(const LedgerSnapshot& source) {
    if (source.wallets.empty()) {
        return makeError(ErrorKind::Validation, "Source JSON has no wallets");
    }

    // Повторяющиеся id не ошибка: insertAll перенумерует их и перепишет ссылки
    std::set<int> walletIds;
    for (const auto& w : source.wallets) {
        walletIds.insert(w.id());
    }

    for (const auto& t : source.transfers) {
        if (t.id() <= 0) {
            return makeError(ErrorKind::Validation,
                "Transfer id must be positive, got " + std::to_string(t.id()));
        }
        if (!walletIds.contains(t.fromWalletId()) || !walletIds.contains(t.toWalletId())) {
            return makeError(ErrorKind::Validation,
                "Transfer #" + std::to_string(t.id()) + " has missing wallet links: from="
                + std::to_string(t.fromWalletId()) + " to=" + std::to_string(t.toWalletId()));
        }
    }

    for (const auto& r : source.records) {
        if (!walletIds.contains(r.walletId())) {
            return makeError(ErrorKind::Validation,
                "Record #" + std::to_string(r.id()) + ": wallet_id="
                + std::to_string(r.walletId()) + " does not exist");
        }
    }

    auto integrity = validateTransferIntegrity(source.records, source.transfers);
    if (!integrity) {
        return integrity;
    }

    for (const auto& e : source.mandatoryExpenses) {
        if (!walletIds.contains(e.walletId())) {
            return makeError(ErrorKind::Validation,
                "MandatoryExpense #" + std::to_string(e.id()) + ": wallet_id="
                + std::to_string(e.walletId()) + " does not exist");
        }
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Проверка цели
// ═════════════════════════════════════════════════════════════════════════════

MigrationIdMaps MigrationEngine::expectedMaps(const LedgerSnapshot& source) {
    MigrationIdMaps maps;

    bool preserveWallets = allPositiveUnique(source.wallets);
    for (std::size_t i = 0; i < source.wallets.size(); ++i) {
        int id = source.wallets[i].id();
        maps.wallets[id] = preserveWallets ? id : static_cast<int>(i) + 1;
    }

    bool preserveTransfers = allPositiveUnique(source.transfers);
    for (std::size_t i = 0; i < source.transfers.size(); ++i) {
        int id = source.transfers[i].id();
        maps.transfers[id] = preserveTransfers ? id : static_cast<int>(i) + 1;
    }

    bool preserveRecords = allPositiveUnique(source.records);
    for (std::size_t i = 0; i < source.records.size(); ++i) {
        maps.records[i] = preserveRecords ? source.records[i].id() : static_cast<int>(i) + 1;
    }

    bool preserveTemplates = allPositiveUnique(source.mandatoryExpenses);
    for (std::size_t i = 0; i < source.mandatoryExpenses.size(); ++i) {
        maps.mandatoryExpenses[i] =
            preserveTemplates ? source.mandatoryExpenses[i].id() : static_cast<int>(i) + 1;
    }
    return maps;
}

std::vector<std::string> MigrationEngine::verifyTarget(
    SQLiteStorage& target,
    const LedgerSnapshot& source,
    const MigrationIdMaps& maps)
{
    std::vector<std::string> errors;

    auto counts = target.tableCounts();
    if (!counts) {
        errors.push_back(counts.error().message);
        return errors;
    }

    TableCounts expected = countsOf(source);
    auto compare = [&](const char* name, std::size_t json, std::size_t sqlite) {
        if (json != sqlite) {
            errors.push_back(std::string("Count mismatch for ") + name + ": json="
                + std::to_string(json) + ", sqlite=" + std::to_string(sqlite));
        }
    };
    compare("wallets", expected.wallets, counts->wallets);
    compare("transfers", expected.transfers, counts->transfers);
    compare("records", expected.records, counts->records);
    compare("mandatory_expenses", expected.mandatoryExpenses, counts->mandatoryExpenses);

    auto targetBalances = target.queryWalletBalances();
    if (!targetBalances) {
        errors.push_back(targetBalances.error().message);
        return errors;
    }

    std::map<int, double> sourceBalances = walletBalances(source.wallets, source.records);
    double sourceNetWorth = 0.0;
    for (const auto& [sourceId, balance] : sourceBalances) {
        sourceNetWorth += balance;

        auto mapped = maps.wallets.find(sourceId);
        if (mapped == maps.wallets.end()) {
            errors.push_back("Wallet id mapping missing for source wallet #" + std::to_string(sourceId));
            continue;
        }
        auto actual = targetBalances->find(mapped->second);
        if (actual == targetBalances->end()) {
            errors.push_back("Wallet #" + std::to_string(sourceId) + " -> #"
                + std::to_string(mapped->second) + " is absent in SQLite balance set");
            continue;
        }
        if (!nearlyEqual(balance, actual->second)) {
            std::ostringstream message;
            message << "Wallet balance mismatch for wallet #" << sourceId << " -> #"
                    << mapped->second << ": json=" << balance << ", sqlite=" << actual->second;
            errors.push_back(message.str());
        }
    }

    double targetNetWorth = 0.0;
    for (const auto& [id, balance] : *targetBalances) {
        targetNetWorth += balance;
    }
    if (!nearlyEqual(sourceNetWorth, targetNetWorth)) {
        std::ostringstream message;
        message << "Net worth mismatch: json=" << sourceNetWorth << ", sqlite=" << targetNetWorth;
        errors.push_back(message.str());
    }

    if (maps.records.size() != source.records.size()) {
        errors.push_back("Record id mapping is incomplete");
    }
    if (maps.transfers.size() != source.transfers.size()) {
        errors.push_back("Transfer id mapping is incomplete");
    }
    if (maps.mandatoryExpenses.size() != source.mandatoryExpenses.size()) {
        errors.push_back("Mandatory expense id mapping is incomplete");
    }
    return errors;
}

// ═════════════════════════════════════════════════════════════════════════════
// Вставка: Wallets -> Transfers -> Records -> MandatoryExpenses
// ═════════════════════════════════════════════════════════════════════════════

Expected<MigrationIdMaps> MigrationEngine::insertAll(
    SQLiteStorage& target, const LedgerSnapshot& source)
{
    MigrationIdMaps maps;

    log_ << "[1/4] Migrating wallets...\n";
    bool preserveWallets = allPositiveUnique(source.wallets);
    for (const auto& w : source.wallets) {
        auto id = target.insertWallet(w, preserveWallets);
        if (!id) {
            return std::unexpected(id.error());
        }
        maps.wallets[w.id()] = *id;
    }
    if (preserveWallets) {
        if (auto synced = target.syncSequence("wallets"); !synced) {
            return std::unexpected(synced.error());
        }
    }

    log_ << "[2/4] Migrating transfers...\n";
    bool preserveTransfers = allPositiveUnique(source.transfers);
    for (const auto& t : source.transfers) {
        auto from = mapId(maps.wallets, t.fromWalletId(), "Wallet");
        if (!from) return std::unexpected(from.error());
        auto to = mapId(maps.wallets, t.toWalletId(), "Wallet");
        if (!to) return std::unexpected(to.error());

        auto id = target.insertTransfer(t.withWallets(*from, *to), preserveTransfers);
        if (!id) {
            return std::unexpected(id.error());
        }
        maps.transfers[t.id()] = *id;
    }
    if (preserveTransfers) {
        if (auto synced = target.syncSequence("transfers"); !synced) {
            return std::unexpected(synced.error());
        }
    }

    log_ << "[3/4] Migrating records...\n";
    bool preserveRecords = allPositiveUnique(source.records);
    for (std::size_t i = 0; i < source.records.size(); ++i) {
        const Record& r = source.records[i];

        auto wallet = mapId(maps.wallets, r.walletId(), "Wallet");
        if (!wallet) return std::unexpected(wallet.error());
        auto transfer = mapOptionalId(maps.transfers, r.transferId(), "Transfer");
        if (!transfer) return std::unexpected(transfer.error());
        auto commission = mapOptionalId(maps.transfers, r.commissionForTransferId(), "Transfer");
        if (!commission) return std::unexpected(commission.error());

        Record mapped = r.withWallet(*wallet)
                         .withTransferId(*transfer)
                         .withCommissionForTransferId(*commission);
        auto id = target.insertRecord(mapped, preserveRecords);
        if (!id) {
            return std::unexpected(id.error());
        }
        maps.records[i] = *id;
    }
    if (preserveRecords) {
        if (auto synced = target.syncSequence("records"); !synced) {
            return std::unexpected(synced.error());
        }
    }

    log_ << "[4/4] Migrating mandatory_expenses...\n";
    bool preserveTemplates = allPositiveUnique(source.mandatoryExpenses);
    for (std::size_t i = 0; i < source.mandatoryExpenses.size(); ++i) {
        const Record& e = source.mandatoryExpenses[i];

        auto wallet = mapId(maps.wallets, e.walletId(), "Wallet");
        if (!wallet) return std::unexpected(wallet.error());

        auto id = target.insertMandatoryExpense(e.withWallet(*wallet), preserveTemplates);
        if (!id) {
            return std::unexpected(id.error());
        }
        maps.mandatoryExpenses[i] = *id;
    }
    if (preserveTemplates) {
        if (auto synced = target.syncSequence("mandatory_expenses"); !synced) {
            return std::unexpected(synced.error());
        }
    }

    return maps;
}

// ═════════════════════════════════════════════════════════════════════════════
// Запуск
// ═════════════════════════════════════════════════════════════════════════════

Expected<MigrationReport> MigrationEngine::run() {
    if (!std::filesystem::exists(options_.schemaPath)) {
        log_ << "[error] schema.sql not found: " << options_.schemaPath.string() << "\n";
        return makeError(ErrorKind::Migration,
            "Schema file not found: " + options_.schemaPath.string());
    }

    auto source = loadSource();
    if (!source) {
        log_ << "[error] Failed to load source: " << source.error().message << "\n";
        return std::unexpected(source.error());
    }

    auto valid = validateSource(*source);
    if (!valid) {
        log_ << "[error] Source validation failed: " << valid.error().message << "\n";
        return std::unexpected(valid.error());
    }

    return options_.dryRun ? runDry(*source) : runReal(*source);
}

Expected<MigrationReport> MigrationEngine::runDry(const LedgerSnapshot& source) {
    log_ << "== DRY RUN: JSON -> SQLite migration check ==\n";

    try {
        SQLiteStorage target(options_.sqlitePath.string(), options_.baseCurrency, false);
        log_ << "[ok] SQLite connection is available: " << options_.sqlitePath.string() << "\n";

        auto schema = target.checkSchemaFile(options_.schemaPath);
        if (!schema) {
            log_ << "[error] Dry-run failed: " << schema.error().message << "\n";
            return std::unexpected(schema.error());
        }
        log_ << "[ok] Schema path resolved: " << options_.schemaPath.string() << "\n";
    } catch (const std::exception& e) {
        log_ << "[error] Dry-run failed: " << e.what() << "\n";
        return makeError(ErrorKind::Migration, e.what());
    }

    MigrationReport report;
    report.dryRun = true;
    report.source = countsOf(source);

    log_ << "[ok] JSON source loaded: " << options_.jsonPath.string() << "\n";
    printCounts(log_, report.source);
    log_ << "[ok] Integrity checks passed\n";
    log_ << "[dry-run] No INSERT and no explicit COMMIT executed\n";
    return report;
}

Expected<MigrationReport> MigrationEngine::runReal(const LedgerSnapshot& source) {
    log_ << "== MIGRATION: JSON -> SQLite ==\n";
    log_ << "[ok] Source data integrity passed\n";

    MigrationReport report;
    report.source = countsOf(source);
    bool transactionStarted = false;

    try {
        SQLiteStorage target(options_.sqlitePath.string(), options_.baseCurrency);

        auto schema = target.applySchemaFile(options_.schemaPath);
        if (!schema) {
            log_ << "[error] Migration failed: " << schema.error().message << "\n";
            return std::unexpected(schema.error());
        }

        auto hasData = target.hasAnyData();
        if (!hasData) {
            log_ << "[error] Migration failed: " << hasData.error().message << "\n";
            return std::unexpected(hasData.error());
        }
        if (*hasData) {
            auto differences = verifyTarget(target, source, expectedMaps(source));
            if (differences.empty()) {
                log_ << "[ok] Target SQLite already contains equivalent data, migration skipped\n";
                report.noOp = true;
                return report;
            }
            std::string details = "Target SQLite is not empty and differs from source JSON: "
                + joinFirst(differences, 3);
            log_ << "[error] Migration failed: " << details << "\n";
            return makeError(ErrorKind::Migration, details);
        }

        SQLiteTransaction tx(target);
        transactionStarted = true;
        log_ << "[tx] Transaction started\n";

        auto maps = insertAll(target, source);
        if (!maps) {
            auto rolledBack = tx.rollback();
            log_ << (rolledBack ? "[tx] Rollback complete\n" : "[warn] Rollback failed\n");
            log_ << "[error] Migration failed: " << maps.error().message << "\n";
            return makeError(ErrorKind::Migration, maps.error().message);
        }

        if (hooks_.beforeVerify) {
            hooks_.beforeVerify(target);
        }

        auto errors = verifyTarget(target, source, *maps);
        if (!errors.empty()) {
            log_ << "[error] Validation failed, rollback started\n";
            for (const auto& line : errors) {
                log_ << "  - " << line << "\n";
            }
            auto rolledBack = tx.rollback();
            log_ << (rolledBack ? "[tx] Rollback complete\n" : "[warn] Rollback failed\n");
            return makeError(ErrorKind::Migration,
                "Migration verification failed: " + joinFirst(errors, 3));
        }

        auto committed = tx.commit();
        if (!committed) {
            log_ << "[error] Migration failed: " << committed.error().message << "\n";
            return makeError(ErrorKind::Migration, committed.error().message);
        }
        log_ << "[tx] Commit complete\n";
        log_ << "[ok] Migration finished successfully\n";

        report.inserted = TableCounts{
            maps->wallets.size(),
            maps->records.size(),
            maps->transfers.size(),
            maps->mandatoryExpenses.size()};
        return report;
    } catch (const std::exception& e) {
        // Деструктор SQLiteTransaction уже откатил транзакцию
        if (transactionStarted) {
            log_ << "[tx] Rollback complete\n";
        }
        log_ << "[error] Migration failed: " << e.what() << "\n";
        return makeError(ErrorKind::Migration, e.what());
    }
}

} // namespace ledger
