// include/Record.hpp
#pragma once

#include "Date.hpp"
#include "LedgerError.hpp"
#include "Wallet.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Дискриминант записи и период обязательного расхода
// ═══════════════════════════════════════════════════════════════════════════════

enum class RecordType {
    Income,
    Expense,
    MandatoryExpense
};

enum class Period {
    Daily,
    Weekly,
    Monthly,
    Yearly
};

std::string_view toString(RecordType type) noexcept;
std::string_view toString(Period period) noexcept;

// "income" | "expense" | "mandatory_expense"
Expected<RecordType> parseRecordType(std::string_view text);
Expected<Period> parsePeriod(std::string_view text);

inline constexpr std::string_view kDefaultCategory = "General";
inline constexpr std::string_view kCommissionCategory = "Commission";
inline constexpr std::string_view kTransferCategory = "Transfer";

// ═══════════════════════════════════════════════════════════════════════════════
// Черновик записи - неподтверждённые входные данные
// ═══════════════════════════════════════════════════════════════════════════════

struct RecordDraft {
    RecordType type = RecordType::Income;
    int id = 0;                         // 0 - id ещё не назначен
    std::optional<Date> date;           // Шаблон обязательного расхода может быть без даты
    int walletId = kSystemWalletId;
    std::optional<int> transferId;
    std::optional<int> commissionForTransferId;
    double amountOriginal = 0.0;
    std::string currency;
    double amountKzt = 0.0;
    std::string category{kDefaultCategory};
    std::string description;
    std::optional<Period> period;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Record - неизменяемая денежная операция по кошельку
// ═══════════════════════════════════════════════════════════════════════════════

class Record {
public:
    // rate_at_operation всегда выводится из сумм, amount_kzt хранится по модулю
    static Expected<Record> create(const RecordDraft& draft, std::string_view baseCurrency);

    int id() const noexcept { return id_; }
    RecordType type() const noexcept { return type_; }
    const std::optional<Date>& date() const noexcept { return date_; }
    int walletId() const noexcept { return walletId_; }
    const std::optional<int>& transferId() const noexcept { return transferId_; }
    const std::optional<int>& commissionForTransferId() const noexcept {
        return commissionForTransferId_;
    }
    double amountOriginal() const noexcept { return amountOriginal_; }
    const std::string& currency() const noexcept { return currency_; }
    double rateAtOperation() const noexcept { return rateAtOperation_; }
    double amountKzt() const noexcept { return amountKzt_; }
    const std::string& category() const noexcept { return category_; }
    const std::string& description() const noexcept { return description_; }
    const std::optional<Period>& period() const noexcept { return period_; }

    bool isTransferLeg() const noexcept { return transferId_.has_value(); }

    // +amount_kzt для дохода, -amount_kzt для расходов
    double signedAmountKzt() const noexcept;

    RecordDraft toDraft() const;

    // Обновления возвращают новое значение
    Record withId(int id) const;
    Record withWallet(int walletId) const;
    Record withTransferId(std::optional<int> transferId) const;
    Record withCommissionForTransferId(std::optional<int> transferId) const;
    Expected<Record> withAmountKzt(double amountKzt, std::string_view baseCurrency) const;

    // Шаблон обязательного расхода -> датированная запись
    Expected<Record> materialize(const Date& date) const;

    bool operator==(const Record&) const = default;

private:
    Record() = default;

    int id_ = 0;
    RecordType type_ = RecordType::Income;
    std::optional<Date> date_;
    int walletId_ = kSystemWalletId;
    std::optional<int> transferId_;
    std::optional<int> commissionForTransferId_;
    double amountOriginal_ = 0.0;
    std::string currency_;
    double rateAtOperation_ = 1.0;
    double amountKzt_ = 0.0;
    std::string category_;
    std::string description_;
    std::optional<Period> period_;
};

} // namespace ledger
