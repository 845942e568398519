#include "JsonFileStorage.hpp"
#include "Money.hpp"
#include "TransferIntegrity.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>

namespace ledger {

namespace {

bool hasValue(const json& j, const char* key) {
    return j.contains(key) && !j.at(key).is_null();
}

std::optional<int> optionalInt(const json& j, const char* key) {
    if (!hasValue(j, key)) {
        return std::nullopt;
    }
    return j.at(key).get<int>();
}

Error withContext(const Error& error, const std::string& context) {
    return Error{error.kind, context + ": " + error.message};
}

// Назначить последовательные id записям без id (id == 0)
void assignMissingIds(std::vector<Record>& records) {
    int maxId = 0;
    for (const auto& r : records) {
        maxId = std::max(maxId, r.id());
    }
    for (auto& r : records) {
        if (r.id() == 0) {
            r = r.withId(++maxId);
        }
    }
}

} // namespace

JsonFileStorage::JsonFileStorage(
    std::filesystem::path filePath,
    std::string baseCurrency,
    bool writeBackUpgrades)
    : filePath_(std::move(filePath))
    , baseCurrency_(std::move(baseCurrency))
    , writeBackUpgrades_(writeBackUpgrades)
{
}

// ═════════════════════════════════════════════════════════════════════════════
// Сериализация
// ═════════════════════════════════════════════════════════════════════════════

json JsonFileStorage::serializeWallet(const Wallet& wallet) {
    json j;
    j["id"] = wallet.id();
    j["name"] = wallet.name();
    j["currency"] = wallet.currency();
    j["initial_balance"] = wallet.initialBalance();
    j["system"] = wallet.isSystem();
    j["allow_negative"] = wallet.allowNegative();
    j["is_active"] = wallet.isActive();
    return j;
}

json JsonFileStorage::serializeRecord(const Record& record) {
    json j;
    j["id"] = record.id();
    j["type"] = std::string(toString(record.type()));
    j["date"] = record.date() ? formatDate(*record.date()) : std::string{};
    j["wallet_id"] = record.walletId();
    j["transfer_id"] = record.transferId() ? json(*record.transferId()) : json(nullptr);
    if (record.commissionForTransferId()) {
        j["commission_for_transfer_id"] = *record.commissionForTransferId();
    }
    j["amount_original"] = record.amountOriginal();
    j["currency"] = record.currency();
    j["rate_at_operation"] = record.rateAtOperation();
    j["amount_kzt"] = record.amountKzt();
    j["category"] = record.category();
    j["description"] = record.description();
    if (record.period()) {
        j["period"] = std::string(toString(*record.period()));
    }
    return j;
}

json JsonFileStorage::serializeTransfer(const Transfer& transfer) {
    json j;
    j["id"] = transfer.id();
    j["from_wallet_id"] = transfer.fromWalletId();
    j["to_wallet_id"] = transfer.toWalletId();
    j["date"] = formatDate(transfer.date());
    j["amount_original"] = transfer.amountOriginal();
    j["currency"] = transfer.currency();
    j["rate_at_operation"] = transfer.rateAtOperation();
    j["amount_kzt"] = transfer.amountKzt();
    j["description"] = transfer.description();
    return j;
}

json JsonFileStorage::serializeSnapshot(const LedgerSnapshot& snapshot) {
    json doc;
    doc["wallets"] = json::array();
    doc["records"] = json::array();
    doc["mandatory_expenses"] = json::array();
    doc["transfers"] = json::array();

    for (const auto& w : snapshot.wallets) {
        doc["wallets"].push_back(serializeWallet(w));
    }
    for (const auto& r : snapshot.records) {
        doc["records"].push_back(serializeRecord(r));
    }
    for (const auto& m : snapshot.mandatoryExpenses) {
        doc["mandatory_expenses"].push_back(serializeRecord(m));
    }
    for (const auto& t : snapshot.transfers) {
        doc["transfers"].push_back(serializeTransfer(t));
    }
    return doc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Десериализация
// ═════════════════════════════════════════════════════════════════════════════

Expected<Wallet> JsonFileStorage::deserializeWallet(const json& j) {
    return Wallet::create(
        j.at("id").get<int>(),
        j.value("name", std::string{}),
        j.value("currency", std::string{"KZT"}),
        j.value("initial_balance", 0.0),
        j.value("system", false),
        j.value("allow_negative", false),
        j.value("is_active", true));
}

Expected<Record> JsonFileStorage::deserializeRecord(
    const json& j, std::string_view baseCurrency, bool& upgraded)
{
    RecordDraft draft;

    auto type = parseRecordType(j.at("type").get<std::string>());
    if (!type) {
        return std::unexpected(type.error());
    }
    draft.type = *type;

    draft.id = j.value("id", 0);
    if (draft.id <= 0) {
        draft.id = 0;
        upgraded = true;
    }

    std::string dateText = hasValue(j, "date") ? j.at("date").get<std::string>() : "";
    if (!dateText.empty()) {
        auto date = parseDate(dateText);
        if (!date) {
            return std::unexpected(date.error());
        }
        draft.date = *date;
    }

    if (!hasValue(j, "wallet_id")) {
        upgraded = true;
    }
    draft.walletId = hasValue(j, "wallet_id") ? j.at("wallet_id").get<int>() : kSystemWalletId;
    draft.transferId = optionalInt(j, "transfer_id");
    draft.commissionForTransferId = optionalInt(j, "commission_for_transfer_id");

    if (hasValue(j, "amount_original")) {
        draft.amountOriginal = j.at("amount_original").get<double>();
        draft.currency = j.value("currency", std::string(baseCurrency));
        draft.amountKzt = hasValue(j, "amount_kzt")
            ? j.at("amount_kzt").get<double>()
            : draft.amountOriginal;
    } else {
        // Legacy: одна сумма в базовой валюте
        double amount = std::fabs(j.at("amount").get<double>());
        draft.amountOriginal = amount;
        draft.amountKzt = amount;
        draft.currency = std::string(baseCurrency);
        upgraded = true;
    }

    draft.category = j.value("category", std::string(kDefaultCategory));
    if (draft.category.empty()) {
        draft.category = std::string(kDefaultCategory);
    }
    draft.description = hasValue(j, "description") ? j.at("description").get<std::string>() : "";

    if (draft.type == RecordType::MandatoryExpense) {
        auto period = parsePeriod(j.value("period", std::string{"monthly"}));
        if (!period) {
            return std::unexpected(period.error());
        }
        draft.period = *period;
    }

    return Record::create(draft, baseCurrency);
}

Expected<Transfer> JsonFileStorage::deserializeTransfer(
    const json& j, std::string_view baseCurrency)
{
    auto date = parseDate(j.at("date").get<std::string>());
    if (!date) {
        return std::unexpected(date.error());
    }

    TransferDraft draft;
    draft.id = j.at("id").get<int>();
    draft.fromWalletId = j.at("from_wallet_id").get<int>();
    draft.toWalletId = j.at("to_wallet_id").get<int>();
    draft.date = *date;
    draft.amountOriginal = j.at("amount_original").get<double>();
    draft.currency = j.value("currency", std::string(baseCurrency));
    draft.amountKzt = j.value("amount_kzt", draft.amountOriginal);
    draft.description = hasValue(j, "description") ? j.at("description").get<std::string>() : "";
    return Transfer::create(draft, baseCurrency);
}

Expected<LedgerSnapshot> JsonFileStorage::deserializeSnapshot(
    const json& document,
    std::string_view baseCurrency,
    bool& upgraded)
{
    try {
        LedgerSnapshot snapshot;
        json records = json::array();
        json mandatory = json::array();
        json transfers = json::array();

        if (document.is_array()) {
            // Legacy: голый список записей
            records = document;
            auto wallet = Wallet::systemDefault(baseCurrency);
            if (!wallet) {
                return std::unexpected(wallet.error());
            }
            snapshot.wallets.push_back(*wallet);
            upgraded = true;
        } else if (document.is_object()) {
            if (!document.contains("wallets")) {
                // Legacy: {initial_balance, records} без кошельков
                auto wallet = Wallet::systemDefault(baseCurrency,
                    document.value("initial_balance", 0.0));
                if (!wallet) {
                    return std::unexpected(withContext(wallet.error(), "legacy initial_balance"));
                }
                snapshot.wallets.push_back(*wallet);
                upgraded = true;
            } else {
                for (const auto& item : document.at("wallets")) {
                    auto wallet = deserializeWallet(item);
                    if (!wallet) {
                        return std::unexpected(withContext(wallet.error(), "wallets"));
                    }
                    snapshot.wallets.push_back(*wallet);
                }
            }
            records = document.value("records", json::array());
            mandatory = document.value("mandatory_expenses", json::array());
            transfers = document.value("transfers", json::array());
        } else {
            return makeError(ErrorKind::Storage, "Unsupported JSON document layout");
        }

        for (std::size_t i = 0; i < records.size(); ++i) {
            auto record = deserializeRecord(records[i], baseCurrency, upgraded);
            if (!record) {
                return std::unexpected(withContext(record.error(),
                    "records[" + std::to_string(i) + "]"));
            }
            snapshot.records.push_back(*record);
        }

        for (std::size_t i = 0; i < mandatory.size(); ++i) {
            json item = mandatory[i];
            item["type"] = "mandatory_expense";
            auto record = deserializeRecord(item, baseCurrency, upgraded);
            if (!record) {
                return std::unexpected(withContext(record.error(),
                    "mandatory_expenses[" + std::to_string(i) + "]"));
            }
            snapshot.mandatoryExpenses.push_back(*record);
        }

        for (std::size_t i = 0; i < transfers.size(); ++i) {
            auto transfer = deserializeTransfer(transfers[i], baseCurrency);
            if (!transfer) {
                return std::unexpected(withContext(transfer.error(),
                    "transfers[" + std::to_string(i) + "]"));
            }
            snapshot.transfers.push_back(*transfer);
        }

        assignMissingIds(snapshot.records);
        assignMissingIds(snapshot.mandatoryExpenses);
        return snapshot;
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage, std::string("Deserialization error: ") + e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение и атомарная запись документа
// ═════════════════════════════════════════════════════════════════════════════

Expected<LedgerSnapshot> JsonFileStorage::readDocument() {
    if (!std::filesystem::exists(filePath_)) {
        return LedgerSnapshot{};
    }

    json document;
    try {
        std::ifstream file(filePath_);
        if (!file.is_open()) {
            return makeError(ErrorKind::Storage,
                "Failed to open file: " + filePath_.string());
        }
        file >> document;
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage,
            "Failed to parse " + filePath_.string() + ": " + e.what());
    }

    bool upgraded = false;
    auto snapshot = deserializeSnapshot(document, baseCurrency_, upgraded);
    if (!snapshot) {
        return snapshot;
    }

    if (upgraded && writeBackUpgrades_) {
        auto written = writeDocument(*snapshot);
        if (!written) {
            return std::unexpected(written.error());
        }
    }

    return snapshot;
}

Result JsonFileStorage::writeDocument(const LedgerSnapshot& snapshot) {
    std::filesystem::path tmpPath = filePath_;
    tmpPath += ".tmp";

    try {
        if (filePath_.has_parent_path()) {
            std::filesystem::create_directories(filePath_.parent_path());
        }

        {
            std::ofstream file(tmpPath, std::ios::trunc);
            if (!file.is_open()) {
                return makeError(ErrorKind::Storage,
                    "Failed to open file for writing: " + tmpPath.string());
            }
            file << serializeSnapshot(snapshot).dump(2);
            file.flush();
            if (!file) {
                return makeError(ErrorKind::Storage,
                    "Failed to write file: " + tmpPath.string());
            }
        }

        std::filesystem::rename(tmpPath, filePath_);
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmpPath, ec);
        return makeError(ErrorKind::Storage,
            std::string("Failed to save ") + filePath_.string() + ": " + e.what());
    }

    return {};
}

Expected<LedgerSnapshot> JsonFileStorage::readValidated() {
    auto snapshot = readDocument();
    if (!snapshot) {
        return snapshot;
    }
    auto integrity = validateTransferIntegrity(snapshot->records, snapshot->transfers);
    if (!integrity) {
        return std::unexpected(integrity.error());
    }
    return snapshot;
}

// ═════════════════════════════════════════════════════════════════════════════
// Кошельки
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Wallet>> JsonFileStorage::loadWallets() {
    auto snapshot = readValidated();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->wallets;
}

Result JsonFileStorage::saveWallet(const Wallet& wallet) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto it = std::find_if(snapshot->wallets.begin(), snapshot->wallets.end(),
        [&](const Wallet& w) { return w.id() == wallet.id(); });
    if (it != snapshot->wallets.end()) {
        *it = wallet;
    } else {
        snapshot->wallets.push_back(wallet);
    }
    return writeDocument(*snapshot);
}

// ═════════════════════════════════════════════════════════════════════════════
// Записи
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Record>> JsonFileStorage::loadAll() {
    auto snapshot = readValidated();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->records;
}

Expected<Record> JsonFileStorage::save(const Record& record) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    std::set<int> usedIds;
    int maxId = 0;
    for (const auto& r : snapshot->records) {
        usedIds.insert(r.id());
        maxId = std::max(maxId, r.id());
    }

    Record stored = record;
    if (record.id() <= 0 || usedIds.contains(record.id())) {
        stored = record.withId(maxId + 1);
    }

    snapshot->records.push_back(stored);
    auto written = writeDocument(*snapshot);
    if (!written) {
        return std::unexpected(written.error());
    }
    return stored;
}

Result JsonFileStorage::replace(const Record& record) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto it = std::find_if(snapshot->records.begin(), snapshot->records.end(),
        [&](const Record& r) { return r.id() == record.id(); });
    if (it == snapshot->records.end()) {
        return makeError(ErrorKind::NotFound,
            "Record not found: #" + std::to_string(record.id()));
    }
    *it = record;
    return writeDocument(*snapshot);
}

Expected<bool> JsonFileStorage::deleteByIndex(std::size_t index) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    if (index >= snapshot->records.size()) {
        return false;
    }

    snapshot->records.erase(snapshot->records.begin() + static_cast<std::ptrdiff_t>(index));
    auto written = writeDocument(*snapshot);
    if (!written) {
        return std::unexpected(written.error());
    }
    return true;
}

Result JsonFileStorage::deleteAll() {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    snapshot->records.clear();
    snapshot->transfers.clear();
    return writeDocument(*snapshot);
}

// ═════════════════════════════════════════════════════════════════════════════
// Переводы
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Transfer>> JsonFileStorage::loadTransfers() {
    auto snapshot = readValidated();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->transfers;
}

Result JsonFileStorage::saveTransfer(const Transfer& transfer) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto it = std::find_if(snapshot->transfers.begin(), snapshot->transfers.end(),
        [&](const Transfer& t) { return t.id() == transfer.id(); });
    if (it != snapshot->transfers.end()) {
        *it = transfer;
    } else {
        snapshot->transfers.push_back(transfer);
    }
    return writeDocument(*snapshot);
}

// ═════════════════════════════════════════════════════════════════════════════
// Шаблоны обязательных расходов
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Record>> JsonFileStorage::loadMandatoryExpenses() {
    auto snapshot = readValidated();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->mandatoryExpenses;
}

Expected<Record> JsonFileStorage::saveMandatoryExpense(const Record& expense) {
    if (expense.type() != RecordType::MandatoryExpense) {
        return makeError(ErrorKind::Validation,
            "Only mandatory expense records can be saved as templates");
    }

    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    int maxId = 0;
    for (const auto& m : snapshot->mandatoryExpenses) {
        maxId = std::max(maxId, m.id());
    }

    Record stored = expense.withId(maxId + 1);
    snapshot->mandatoryExpenses.push_back(stored);
    auto written = writeDocument(*snapshot);
    if (!written) {
        return std::unexpected(written.error());
    }
    return stored;
}

Expected<bool> JsonFileStorage::deleteMandatoryExpenseByIndex(std::size_t index) {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    if (index >= snapshot->mandatoryExpenses.size()) {
        return false;
    }

    auto& templates = snapshot->mandatoryExpenses;
    templates.erase(templates.begin() + static_cast<std::ptrdiff_t>(index));
    auto written = writeDocument(*snapshot);
    if (!written) {
        return std::unexpected(written.error());
    }
    return true;
}

Result JsonFileStorage::deleteAllMandatoryExpenses() {
    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    snapshot->mandatoryExpenses.clear();
    return writeDocument(*snapshot);
}

// ═════════════════════════════════════════════════════════════════════════════
// Массовые операции
// ═════════════════════════════════════════════════════════════════════════════

Result JsonFileStorage::replaceRecordsAndTransfers(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers)
{
    auto integrity = validateTransferIntegrity(records, transfers);
    if (!integrity) {
        return integrity;
    }

    auto snapshot = readDocument();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    snapshot->records = records;
    snapshot->transfers = transfers;
    return writeDocument(*snapshot);
}

Result JsonFileStorage::replaceAllData(const LedgerSnapshot& snapshot) {
    auto integrity = validateTransferIntegrity(snapshot.records, snapshot.transfers);
    if (!integrity) {
        return integrity;
    }
    return writeDocument(snapshot);
}

Expected<LedgerSnapshot> JsonFileStorage::loadSnapshot() {
    return readValidated();
}

} // namespace ledger
