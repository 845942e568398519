// include/Date.hpp
#pragma once

#include "LedgerError.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace ledger {

using Date = std::chrono::year_month_day;

// Строго YYYY-MM-DD, календарно корректная дата
Expected<Date> parseDate(std::string_view text);

std::string formatDate(const Date& date);

// Текущая дата (UTC)
Date today();

// Пользовательские операции не могут быть датированы будущим
Result ensureNotFuture(const Date& date, const Date& reference = today());

} // namespace ledger
