#include "LedgerSnapshot.hpp"
#include <algorithm>

namespace ledger {

TableCounts countsOf(const LedgerSnapshot& snapshot) noexcept {
    return TableCounts{
        snapshot.wallets.size(),
        snapshot.records.size(),
        snapshot.transfers.size(),
        snapshot.mandatoryExpenses.size()};
}

double walletBalance(const Wallet& wallet, const std::vector<Record>& records) {
    double balance = wallet.initialBalance();
    for (const auto& record : records) {
        if (record.walletId() == wallet.id()) {
            balance += record.signedAmountKzt();
        }
    }
    return balance;
}

std::map<int, double> walletBalances(
    const std::vector<Wallet>& wallets,
    const std::vector<Record>& records)
{
    std::map<int, double> balances;
    for (const auto& wallet : wallets) {
        balances[wallet.id()] = wallet.initialBalance();
    }
    for (const auto& record : records) {
        auto it = balances.find(record.walletId());
        if (it != balances.end()) {
            it->second += record.signedAmountKzt();
        }
    }
    return balances;
}

double netWorth(const std::vector<Wallet>& wallets, const std::vector<Record>& records) {
    double total = 0.0;
    for (const auto& [id, balance] : walletBalances(wallets, records)) {
        total += balance;
    }
    return total;
}

std::optional<Wallet> findWallet(const std::vector<Wallet>& wallets, int walletId) {
    auto it = std::find_if(wallets.begin(), wallets.end(),
        [walletId](const Wallet& w) { return w.id() == walletId; });
    if (it == wallets.end()) {
        return std::nullopt;
    }
    return *it;
}

} // namespace ledger
