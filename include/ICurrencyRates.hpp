// include/ICurrencyRates.hpp
#pragma once

#include "LedgerError.hpp"
#include <string>
#include <string_view>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ICurrencyRates - курсы к базовой валюте
// ═══════════════════════════════════════════════════════════════════════════════

class ICurrencyRates {
public:
    virtual ~ICurrencyRates() = default;

    virtual const std::string& baseCurrency() const noexcept = 0;

    // Курс валюты к базовой; для базовой валюты всегда 1.0
    virtual Expected<double> getRate(std::string_view currency) const = 0;

    // Сумма в базовой валюте
    virtual Expected<double> convert(double amount, std::string_view currency) const = 0;
};

} // namespace ledger
