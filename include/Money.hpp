// include/Money.hpp
#pragma once

#include "LedgerError.hpp"
#include <cmath>
#include <string>
#include <string_view>

namespace ledger {

// Абсолютный допуск для сравнения балансов
inline constexpr double kBalanceEpsilon = 1e-5;

inline bool nearlyEqual(double a, double b, double eps = kBalanceEpsilon) noexcept {
    return std::fabs(a - b) <= eps;
}

// Ровно 3 латинские буквы, приводится к верхнему регистру
Expected<std::string> normalizeCurrency(std::string_view code);

// Единственный источник rate_at_operation:
// 1.0 для базовой валюты или нулевой суммы, иначе amountKzt / amountOriginal
double deriveRate(double amountOriginal, double amountKzt,
                  std::string_view currency, std::string_view baseCurrency) noexcept;

} // namespace ledger
