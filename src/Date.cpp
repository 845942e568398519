#include "Date.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ledger {

namespace {

int digitsToInt(std::string_view text) {
    int value = 0;
    for (char c : text) {
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

Expected<Date> parseDate(std::string_view text) {
    // Формат: 4 цифры - 2 цифры - 2 цифры, ничего лишнего
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return makeError(ErrorKind::Validation,
            "invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
    }

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return makeError(ErrorKind::Validation,
                "invalid date '" + std::string(text) + "': expected YYYY-MM-DD");
        }
    }

    Date date{
        std::chrono::year{digitsToInt(text.substr(0, 4))},
        std::chrono::month{static_cast<unsigned>(digitsToInt(text.substr(5, 2)))},
        std::chrono::day{static_cast<unsigned>(digitsToInt(text.substr(8, 2)))}};

    if (!date.ok()) {
        return makeError(ErrorKind::Validation,
            "invalid date '" + std::string(text) + "': no such calendar day");
    }

    return date;
}

std::string formatDate(const Date& date) {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(date.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.day());
    return oss.str();
}

Date today() {
    return Date{std::chrono::floor<std::chrono::days>(
        std::chrono::system_clock::now())};
}

Result ensureNotFuture(const Date& date, const Date& reference) {
    if (std::chrono::sys_days{date} > std::chrono::sys_days{reference}) {
        return makeError(ErrorKind::Validation,
            "date " + formatDate(date) + " is in the future");
    }
    return {};
}

} // namespace ledger
