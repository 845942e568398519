// include/Wallet.hpp
#pragma once

#include "LedgerError.hpp"
#include <string>
#include <string_view>

namespace ledger {

// Кошелёк по умолчанию, когда ни один не помечен как system
inline constexpr int kSystemWalletId = 1;

// ═══════════════════════════════════════════════════════════════════════════════
// Wallet - именованный счёт с валютой и начальным балансом
// ═══════════════════════════════════════════════════════════════════════════════

class Wallet {
public:
    static Expected<Wallet> create(
        int id,
        std::string name,
        std::string_view currency,
        double initialBalance,
        bool system = false,
        bool allowNegative = false,
        bool isActive = true);

    // Кошелёк id=1 "Main wallet" в базовой валюте
    static Expected<Wallet> systemDefault(std::string_view baseCurrency, double initialBalance = 0.0);

    int id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
    const std::string& currency() const noexcept { return currency_; }
    double initialBalance() const noexcept { return initialBalance_; }
    bool isSystem() const noexcept { return system_; }
    bool allowNegative() const noexcept { return allowNegative_; }
    bool isActive() const noexcept { return isActive_; }

    // Обновления возвращают новое значение
    Wallet withId(int id) const;
    Wallet withInitialBalance(double balance) const;
    Wallet withAllowNegative(bool allow) const;
    Wallet deactivated() const;

    bool operator==(const Wallet&) const = default;

private:
    Wallet() = default;

    int id_ = 0;
    std::string name_;
    std::string currency_;
    double initialBalance_ = 0.0;
    bool system_ = false;
    bool allowNegative_ = false;
    bool isActive_ = true;
};

} // namespace ledger
