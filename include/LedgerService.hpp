// include/LedgerService.hpp
#pragma once

#include "ICurrencyRates.hpp"
#include "ILedgerStorage.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ledger {

// Доход или расход, введённый пользователем
struct OperationRequest {
    std::string date;                 // YYYY-MM-DD, не в будущем
    int walletId = kSystemWalletId;
    double amount = 0.0;              // в валюте currency
    std::string currency;
    std::string category{kDefaultCategory};
    std::string description;
};

struct MandatoryExpenseRequest {
    int walletId = kSystemWalletId;
    double amount = 0.0;
    std::string currency;
    std::string category{kDefaultCategory};
    std::string description;
    std::string period = "monthly";
};

struct TransferRequest {
    int fromWalletId = 0;
    int toWalletId = 0;
    std::string date;
    double amount = 0.0;
    std::string currency;
    std::string description;
    double commissionAmount = 0.0;
    std::string commissionCurrency;   // пусто - валюта перевода
};

// ═══════════════════════════════════════════════════════════════════════════════
// LedgerService - сценарии работы с кошельками, записями и переводами
// ═══════════════════════════════════════════════════════════════════════════════
//
// Все изменения, затрагивающие переводы, выполняются одной массовой
// записью в хранилище: при ошибке данные остаются прежними.

class LedgerService {
public:
    LedgerService(ILedgerStorage& storage, const ICurrencyRates& rates);

    // Disable copy
    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    // ═════════════════════════════════════════════════════════════════════════
    // Кошельки
    // ═════════════════════════════════════════════════════════════════════════

    Expected<Wallet> createWallet(
        std::string name,
        std::string_view currency,
        double initialBalance,
        bool allowNegative = false);

    // Только нулевой баланс и не системный кошелёк
    Result softDeleteWallet(int walletId);

    Expected<std::vector<Wallet>> wallets();
    Expected<std::vector<Wallet>> activeWallets();

    Expected<double> walletBalance(int walletId);
    Expected<double> netWorth();

    Result setSystemInitialBalance(double balance);
    Expected<double> systemInitialBalance();

    // ═════════════════════════════════════════════════════════════════════════
    // Записи
    // ═════════════════════════════════════════════════════════════════════════

    Expected<Record> createIncome(const OperationRequest& request);
    Expected<Record> createExpense(const OperationRequest& request);

    Expected<std::vector<Record>> records();

    // Удаление ноги перевода удаляет весь перевод
    Expected<bool> deleteRecord(std::size_t index);
    Result deleteAllRecords();

    Result updateRecordAmountKzt(int recordId, double newAmountKzt);

    // ═════════════════════════════════════════════════════════════════════════
    // Обязательные расходы
    // ═════════════════════════════════════════════════════════════════════════

    Expected<Record> createMandatoryExpense(const MandatoryExpenseRequest& request);
    Expected<std::vector<Record>> mandatoryExpenses();

    // Шаблон -> датированная запись в кошельке walletId
    Expected<Record> applyMandatoryExpense(
        std::size_t templateIndex,
        std::string_view date,
        int walletId);

    Expected<bool> deleteMandatoryExpense(std::size_t index);
    Result deleteAllMandatoryExpenses();

    // ═════════════════════════════════════════════════════════════════════════
    // Переводы
    // ═════════════════════════════════════════════════════════════════════════

    // Возвращает id созданного перевода
    Expected<int> createTransfer(const TransferRequest& request);

    // Удаляет перевод, обе ноги и комиссию
    Result deleteTransfer(int transferId);

    Expected<std::vector<Transfer>> transfers();

private:
    // Пустое хранилище получает системный кошелёк
    Result ensureSystemWallet();

    Expected<Wallet> requireActiveWallet(const std::vector<Wallet>& wallets, int walletId) const;

    Expected<Record> createOperation(RecordType type, const OperationRequest& request);

    ILedgerStorage& storage_;
    const ICurrencyRates& rates_;
};

} // namespace ledger
