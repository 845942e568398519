#include "Money.hpp"
#include <cctype>

namespace ledger {

Expected<std::string> normalizeCurrency(std::string_view code) {
    // Пробелы по краям допустимы, всё остальное - нет
    std::size_t begin = 0;
    std::size_t end = code.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(code[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(code[end - 1]))) {
        --end;
    }
    std::string_view trimmed = code.substr(begin, end - begin);

    if (trimmed.size() != 3) {
        return makeError(ErrorKind::Validation,
            "invalid currency '" + std::string(code) + "'");
    }

    std::string result;
    result.reserve(3);
    for (char c : trimmed) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalpha(uc) || uc > 127) {
            return makeError(ErrorKind::Validation,
                "invalid currency '" + std::string(code) + "'");
        }
        result.push_back(static_cast<char>(std::toupper(uc)));
    }
    return result;
}

double deriveRate(double amountOriginal, double amountKzt,
                  std::string_view currency, std::string_view baseCurrency) noexcept {
    if (currency == baseCurrency || amountOriginal == 0.0) {
        return 1.0;
    }
    return std::fabs(amountKzt) / amountOriginal;
}

} // namespace ledger
