// include/Transfer.hpp
#pragma once

#include "Date.hpp"
#include "LedgerError.hpp"
#include <string>
#include <string_view>

namespace ledger {

struct TransferDraft {
    int id = 0;
    int fromWalletId = 0;
    int toWalletId = 0;
    Date date{};
    double amountOriginal = 0.0;
    std::string currency;
    double amountKzt = 0.0;
    std::string description;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Transfer - перевод между кошельками (агрегат двух связанных записей)
// ═══════════════════════════════════════════════════════════════════════════════

class Transfer {
public:
    static Expected<Transfer> create(const TransferDraft& draft, std::string_view baseCurrency);

    int id() const noexcept { return id_; }
    int fromWalletId() const noexcept { return fromWalletId_; }
    int toWalletId() const noexcept { return toWalletId_; }
    const Date& date() const noexcept { return date_; }
    double amountOriginal() const noexcept { return amountOriginal_; }
    const std::string& currency() const noexcept { return currency_; }
    double rateAtOperation() const noexcept { return rateAtOperation_; }
    double amountKzt() const noexcept { return amountKzt_; }
    const std::string& description() const noexcept { return description_; }

    TransferDraft toDraft() const;

    Transfer withId(int id) const;
    Transfer withWallets(int fromWalletId, int toWalletId) const;

    bool operator==(const Transfer&) const = default;

private:
    Transfer() = default;

    int id_ = 0;
    int fromWalletId_ = 0;
    int toWalletId_ = 0;
    Date date_{};
    double amountOriginal_ = 0.0;
    std::string currency_;
    double rateAtOperation_ = 1.0;
    double amountKzt_ = 0.0;
    std::string description_;
};

} // namespace ledger
