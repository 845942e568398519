// storage/json/JsonFileStorage.hpp
#pragma once

#include "ILedgerStorage.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace ledger {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// JsonFileStorage - весь набор данных в одном JSON-документе
// ═══════════════════════════════════════════════════════════════════════════════
//
// Запись: прочитать документ, изменить в памяти, записать во временный
// файл рядом с целевым и переименовать поверх. Файл никогда не виден
// наполовину записанным, но параллельные процессы не изолированы:
// побеждает последний писатель. Хранилище рассчитано на один процесс.

class JsonFileStorage : public ILedgerStorage {
public:
    // writeBackUpgrades: сохранять ли документ после обновления legacy-формата
    explicit JsonFileStorage(
        std::filesystem::path filePath,
        std::string baseCurrency = "KZT",
        bool writeBackUpgrades = true);

    // Disable copy
    JsonFileStorage(const JsonFileStorage&) = delete;
    JsonFileStorage& operator=(const JsonFileStorage&) = delete;

    const std::filesystem::path& filePath() const noexcept { return filePath_; }

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
    // Сериализация документа
    // ═════════════════════════════════════════════════════════════════════════

    static json serializeSnapshot(const LedgerSnapshot& snapshot);

    // upgraded выставляется в true, если документ был в legacy-формате
    static Expected<LedgerSnapshot> deserializeSnapshot(
        const json& document,
        std::string_view baseCurrency,
        bool& upgraded);

private:
    // Документ без проверки целостности (для операций записи)
    Expected<LedgerSnapshot> readDocument();
    Result writeDocument(const LedgerSnapshot& snapshot);

    // Чтение с проверкой целостности (для операций загрузки)
    Expected<LedgerSnapshot> readValidated();

    static json serializeWallet(const Wallet& wallet);
    static json serializeRecord(const Record& record);
    static json serializeTransfer(const Transfer& transfer);

    static Expected<Wallet> deserializeWallet(const json& j);
    static Expected<Record> deserializeRecord(
        const json& j, std::string_view baseCurrency, bool& upgraded);
    static Expected<Transfer> deserializeTransfer(
        const json& j, std::string_view baseCurrency);

    std::filesystem::path filePath_;
    std::string baseCurrency_;
    bool writeBackUpgrades_;
};

} // namespace ledger
