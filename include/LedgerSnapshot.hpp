// include/LedgerSnapshot.hpp
#pragma once

#include "Record.hpp"
#include "Transfer.hpp"
#include "Wallet.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace ledger {

// Полный набор данных хранилища
struct LedgerSnapshot {
    std::vector<Wallet> wallets;
    std::vector<Record> records;
    std::vector<Record> mandatoryExpenses;
    std::vector<Transfer> transfers;
};

// Количество строк по таблицам
struct TableCounts {
    std::size_t wallets = 0;
    std::size_t records = 0;
    std::size_t transfers = 0;
    std::size_t mandatoryExpenses = 0;

    bool operator==(const TableCounts&) const = default;
};

TableCounts countsOf(const LedgerSnapshot& snapshot) noexcept;

// initial_balance + сумма знаковых amount_kzt по записям кошелька
double walletBalance(const Wallet& wallet, const std::vector<Record>& records);

// walletId -> баланс, по всем кошелькам (включая неактивные)
std::map<int, double> walletBalances(
    const std::vector<Wallet>& wallets,
    const std::vector<Record>& records);

double netWorth(const std::vector<Wallet>& wallets, const std::vector<Record>& records);

std::optional<Wallet> findWallet(const std::vector<Wallet>& wallets, int walletId);

} // namespace ledger
