#include "Wallet.hpp"
#include "Money.hpp"
#include <algorithm>
#include <cctype>

namespace ledger {

Expected<Wallet> Wallet::create(
    int id,
    std::string name,
    std::string_view currency,
    double initialBalance,
    bool system,
    bool allowNegative,
    bool isActive)
{
    if (id <= 0) {
        return makeError(ErrorKind::Validation,
            "Wallet id must be positive, got " + std::to_string(id));
    }

    bool blank = std::all_of(name.begin(), name.end(),
        [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return makeError(ErrorKind::Validation, "Wallet name is empty");
    }

    auto code = normalizeCurrency(currency);
    if (!code) {
        return std::unexpected(code.error());
    }

    if (!std::isfinite(initialBalance) || initialBalance < 0.0) {
        return makeError(ErrorKind::Validation,
            "Wallet initial balance cannot be negative");
    }

    Wallet w;
    w.id_ = id;
    w.name_ = std::move(name);
    w.currency_ = std::move(*code);
    w.initialBalance_ = initialBalance;
    w.system_ = system;
    w.allowNegative_ = allowNegative;
    w.isActive_ = isActive;
    return w;
}

Expected<Wallet> Wallet::systemDefault(std::string_view baseCurrency, double initialBalance) {
    return create(kSystemWalletId, "Main wallet", baseCurrency, initialBalance, true);
}

Wallet Wallet::withId(int id) const {
    Wallet copy = *this;
    copy.id_ = id;
    return copy;
}

Wallet Wallet::withInitialBalance(double balance) const {
    Wallet copy = *this;
    copy.initialBalance_ = balance;
    return copy;
}

Wallet Wallet::withAllowNegative(bool allow) const {
    Wallet copy = *this;
    copy.allowNegative_ = allow;
    return copy;
}

Wallet Wallet::deactivated() const {
    Wallet copy = *this;
    copy.isActive_ = false;
    return copy;
}

} // namespace ledger
