#include "CurrencyService.hpp"
#include "Money.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace ledger {

CurrencyService::CurrencyService(std::map<std::string, double> rates, std::string baseCurrency)
    : rates_(std::move(rates))
    , baseCurrency_(std::move(baseCurrency))
{
}

CurrencyService CurrencyService::withDefaults(std::string baseCurrency) {
    return CurrencyService(
        {{"USD", 500.0}, {"EUR", 590.0}, {"RUB", 6.5}},
        std::move(baseCurrency));
}

Expected<CurrencyService> CurrencyService::fromCacheFile(
    const std::filesystem::path& cachePath,
    std::string baseCurrency)
{
    if (!std::filesystem::exists(cachePath)) {
        return withDefaults(std::move(baseCurrency));
    }

    try {
        std::ifstream file(cachePath);
        if (!file.is_open()) {
            return makeError(ErrorKind::Storage,
                "Failed to open rate cache: " + cachePath.string());
        }

        nlohmann::json j;
        file >> j;

        std::map<std::string, double> rates;
        for (const auto& [code, value] : j.items()) {
            auto normalized = normalizeCurrency(code);
            if (!normalized) {
                return std::unexpected(normalized.error());
            }
            double rate = value.get<double>();
            if (rate <= 0.0) {
                return makeError(ErrorKind::Validation,
                    "Rate for " + *normalized + " must be positive");
            }
            rates[*normalized] = rate;
        }
        return CurrencyService(std::move(rates), std::move(baseCurrency));
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage,
            "Failed to read rate cache " + cachePath.string() + ": " + e.what());
    }
}

Result CurrencyService::saveCacheFile(const std::filesystem::path& cachePath) const {
    std::ofstream file(cachePath);
    if (!file.is_open()) {
        return makeError(ErrorKind::Storage,
            "Failed to open rate cache for writing: " + cachePath.string());
    }

    nlohmann::json j = rates_;
    file << j.dump(2);
    if (!file) {
        return makeError(ErrorKind::Storage, "Failed to write rate cache: " + cachePath.string());
    }
    return {};
}

Expected<double> CurrencyService::getRate(std::string_view currency) const {
    if (currency == baseCurrency_) {
        return 1.0;
    }

    auto it = rates_.find(std::string(currency));
    if (it == rates_.end()) {
        return makeError(ErrorKind::NotFound,
            "No rate for currency " + std::string(currency));
    }
    return it->second;
}

Expected<double> CurrencyService::convert(double amount, std::string_view currency) const {
    auto rate = getRate(currency);
    if (!rate) {
        return std::unexpected(rate.error());
    }
    return amount * *rate;
}

} // namespace ledger
