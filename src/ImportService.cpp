#include "ImportService.hpp"
#include "TransferIntegrity.hpp"
#include <algorithm>

namespace ledger {

namespace {

std::set<int> walletIdsOf(const std::vector<Wallet>& wallets) {
    std::set<int> ids;
    for (const auto& w : wallets) {
        ids.insert(w.id());
    }
    return ids;
}

std::vector<Wallet>::iterator systemWallet(std::vector<Wallet>& wallets) {
    auto it = std::find_if(wallets.begin(), wallets.end(),
        [](const Wallet& w) { return w.isSystem(); });
    if (it != wallets.end()) {
        return it;
    }
    return std::find_if(wallets.begin(), wallets.end(),
        [](const Wallet& w) { return w.id() == kSystemWalletId; });
}

} // namespace

ImportService::ImportService(ILedgerStorage& storage, ImportBatchOptions options)
    : storage_(storage)
    , options_(std::move(options))
{
}

Result ImportService::ensureImportValid(const ImportSummary& summary) {
    if (summary.skipped == 0) {
        return {};
    }

    std::string details = "invalid rows";
    if (!summary.errors.empty()) {
        details.clear();
        std::size_t shown = std::min<std::size_t>(summary.errors.size(), 3);
        for (std::size_t i = 0; i < shown; ++i) {
            if (i > 0) {
                details += "; ";
            }
            details += summary.errors[i];
        }
    }
    return makeError(ErrorKind::Validation,
        "Import aborted: " + std::to_string(summary.skipped) + " invalid rows (" + details + ")");
}

// ═════════════════════════════════════════════════════════════════════════════
// Импорт
// ═════════════════════════════════════════════════════════════════════════════

Expected<ImportSummary> ImportService::importRecords(const std::vector<ImportRow>& rows) {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    // Пустое хранилище: системный кошелёк появится вместе с данными
    bool walletsChanged = false;
    if (snapshot->wallets.empty()) {
        auto system = Wallet::systemDefault(options_.baseCurrency);
        if (!system) {
            return std::unexpected(system.error());
        }
        snapshot->wallets.push_back(*system);
        walletsChanged = true;
    }

    ImportBatchOptions options = options_;
    options.walletIds = walletIdsOf(snapshot->wallets);

    auto batch = ImportBatch::parseRecords(rows, options);
    if (!batch) {
        return std::unexpected(batch.error());
    }

    auto valid = ensureImportValid(batch->summary);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    if (batch->initialBalance) {
        auto it = systemWallet(snapshot->wallets);
        if (it == snapshot->wallets.end()) {
            return makeError(ErrorKind::NotFound, "System wallet not found");
        }
        auto updated = Wallet::create(it->id(), it->name(), it->currency(),
            *batch->initialBalance, it->isSystem(), it->allowNegative(), it->isActive());
        if (!updated) {
            return std::unexpected(updated.error());
        }
        *it = *updated;
        walletsChanged = true;
    }

    Result written;
    if (walletsChanged) {
        snapshot->records = batch->records;
        snapshot->transfers = batch->transfers;
        written = storage_.replaceAllData(*snapshot);
    } else {
        written = storage_.replaceRecordsAndTransfers(batch->records, batch->transfers);
    }
    if (!written) {
        return std::unexpected(written.error());
    }
    return batch->summary;
}

Expected<ImportSummary> ImportService::importMandatoryExpenses(const std::vector<ImportRow>& rows) {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    if (snapshot->wallets.empty()) {
        auto system = Wallet::systemDefault(options_.baseCurrency);
        if (!system) {
            return std::unexpected(system.error());
        }
        snapshot->wallets.push_back(*system);
    }

    ImportBatchOptions options = options_;
    options.walletIds = walletIdsOf(snapshot->wallets);

    auto batch = ImportBatch::parseMandatoryExpenses(rows, options);
    if (!batch) {
        return std::unexpected(batch.error());
    }

    auto valid = ensureImportValid(batch->summary);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    snapshot->mandatoryExpenses = batch->expenses;
    auto written = storage_.replaceAllData(*snapshot);
    if (!written) {
        return std::unexpected(written.error());
    }
    return batch->summary;
}

Result ImportService::importFullBackup(const LedgerSnapshot& snapshot) {
    if (snapshot.wallets.empty()) {
        return makeError(ErrorKind::Validation, "Backup contains no wallets");
    }

    std::set<int> walletIds = walletIdsOf(snapshot.wallets);
    if (walletIds.size() != snapshot.wallets.size()) {
        return makeError(ErrorKind::Validation, "Backup contains duplicate wallet ids");
    }

    auto checkWallet = [&](const Record& r, const char* collection) -> Result {
        if (!walletIds.contains(r.walletId())) {
            return makeError(ErrorKind::NotFound,
                std::string(collection) + " #" + std::to_string(r.id())
                + " references missing wallet " + std::to_string(r.walletId()));
        }
        return {};
    };
    for (const auto& r : snapshot.records) {
        if (auto ok = checkWallet(r, "Record"); !ok) {
            return ok;
        }
    }
    for (const auto& r : snapshot.mandatoryExpenses) {
        if (auto ok = checkWallet(r, "Mandatory expense"); !ok) {
            return ok;
        }
    }
    for (const auto& t : snapshot.transfers) {
        if (!walletIds.contains(t.fromWalletId()) || !walletIds.contains(t.toWalletId())) {
            return makeError(ErrorKind::NotFound,
                "Transfer #" + std::to_string(t.id()) + " references missing wallet");
        }
    }

    auto integrity = validateTransferIntegrity(snapshot.records, snapshot.transfers);
    if (!integrity) {
        return integrity;
    }
    return storage_.replaceAllData(snapshot);
}

// ═════════════════════════════════════════════════════════════════════════════
// Экспорт
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<ImportRow>> ImportService::exportRecords() {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return ImportBatch::exportRows(*snapshot);
}

Expected<std::vector<ImportRow>> ImportService::exportMandatoryExpenses() {
    auto expenses = storage_.loadMandatoryExpenses();
    if (!expenses) {
        return std::unexpected(expenses.error());
    }
    return ImportBatch::exportMandatoryRows(*expenses);
}

} // namespace ledger
