// include/LedgerError.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Категории ошибок
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorKind {
    Validation,            // Дата, валюта, период, сумма, тип
    DanglingTransferLink,  // Запись ссылается на несуществующий перевод
    BrokenTransferPair,    // У перевода не ровно income + expense
    NotFound,
    Domain,                // Прочие нарушения бизнес-правил
    InsufficientFunds,
    Storage,               // I/O, JSON, SQLite
    Migration
};

struct Error {
    ErrorKind kind;
    std::string message;
};

using Result = std::expected<void, Error>;

template <typename T>
using Expected = std::expected<T, Error>;

inline std::unexpected<Error> makeError(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

std::string_view toString(ErrorKind kind) noexcept;

} // namespace ledger
