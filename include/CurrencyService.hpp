// include/CurrencyService.hpp
#pragma once

#include "ICurrencyRates.hpp"
#include <filesystem>
#include <map>
#include <string>

namespace ledger {

// Курсы из статической таблицы (без сетевой загрузки)
class CurrencyService : public ICurrencyRates {
public:
    CurrencyService(std::map<std::string, double> rates, std::string baseCurrency = "KZT");

    // USD 500, EUR 590, RUB 6.5
    static CurrencyService withDefaults(std::string baseCurrency = "KZT");

    // JSON-объект {"USD": 500.0, ...}; отсутствующий файл - курсы по умолчанию
    static Expected<CurrencyService> fromCacheFile(
        const std::filesystem::path& cachePath,
        std::string baseCurrency = "KZT");

    Result saveCacheFile(const std::filesystem::path& cachePath) const;

    const std::string& baseCurrency() const noexcept override { return baseCurrency_; }
    Expected<double> getRate(std::string_view currency) const override;
    Expected<double> convert(double amount, std::string_view currency) const override;

    const std::map<std::string, double>& allRates() const noexcept { return rates_; }

private:
    std::map<std::string, double> rates_;
    std::string baseCurrency_;
};

} // namespace ledger
