#include "ImportRowParser.hpp"
#include "Money.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <vector>

namespace ledger {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Значение поля без пробелов по краям; пустая строка, если поля нет
std::string field(const ImportRow& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) {
        return {};
    }
    return std::string(trim(it->second));
}

std::string label(std::string_view rowLabel, const std::string& message) {
    return std::string(rowLabel) + ": " + message;
}

std::optional<int> parseId(const std::string& text) {
    auto number = ImportRowParser::parseNumber(text);
    if (!number || *number != std::floor(*number)) {
        return std::nullopt;
    }
    // Идентификаторы строго положительные и помещаются в int
    if (*number < 1.0 || *number > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(*number);
}

} // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Политика
// ═════════════════════════════════════════════════════════════════════════════

std::string_view toString(ImportPolicy policy) noexcept {
    switch (policy) {
        case ImportPolicy::FullBackup:  return "full_backup";
        case ImportPolicy::CurrentRate: return "current_rate";
        case ImportPolicy::Legacy:      return "legacy";
    }
    return "full_backup";
}

Expected<ImportPolicy> parseImportPolicy(std::string_view text) {
    std::string normalized = ImportRowParser::normalizeKey(text);
    if (normalized == "full_backup") return ImportPolicy::FullBackup;
    if (normalized == "current_rate") return ImportPolicy::CurrentRate;
    if (normalized == "legacy") return ImportPolicy::Legacy;

    return makeError(ErrorKind::Validation,
        "Unknown import policy: " + std::string(text));
}

// ═════════════════════════════════════════════════════════════════════════════
// Нормализация
// ═════════════════════════════════════════════════════════════════════════════

std::string ImportRowParser::normalizeKey(std::string_view key) {
    std::string result = toLower(trim(key));
    std::replace(result.begin(), result.end(), ' ', '_');
    return result;
}

ImportRow ImportRowParser::normalizeKeys(const ImportRow& row) {
    ImportRow result;
    for (const auto& [key, value] : row) {
        result[normalizeKey(key)] = value;
    }
    return result;
}

std::string ImportRowParser::normalizeType(std::string_view type) {
    std::string normalized = normalizeKey(type);
    if (normalized == "mandatory_expense_record" ||
        normalized == "mandatory_expenses" ||
        normalized == "mandatory" ||
        normalized == "mandatoryexpense") {
        return "mandatory_expense";
    }
    return normalized;
}

std::optional<double> ImportRowParser::parseNumber(std::string_view text) {
    std::string raw(trim(text));
    if (raw.size() >= 2 && raw.front() == '(' && raw.back() == ')') {
        raw = "-" + raw.substr(1, raw.size() - 2);
    }
    if (!raw.empty() && raw.front() == '+') {
        raw.erase(0, 1);
    }
    if (raw.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool ImportRowParser::isBlankRow(const ImportRow& row) {
    return std::all_of(row.begin(), row.end(),
        [](const auto& entry) { return trim(entry.second).empty(); });
}

// ═════════════════════════════════════════════════════════════════════════════
// Разбор строки
// ═════════════════════════════════════════════════════════════════════════════

ImportRowParser::ImportRowParser(ParserOptions options)
    : options_(std::move(options))
{
}

std::expected<ImportRowParser::Amounts, std::string> ImportRowParser::resolveAmounts(
    const ImportRow& row, std::string_view rowLabel) const
{
    Amounts amounts;

    if (options_.policy == ImportPolicy::Legacy) {
        auto amount = parseNumber(field(row, "amount"));
        if (!amount) {
            return std::unexpected(label(rowLabel, "invalid amount"));
        }
        amounts.amountOriginal = std::fabs(*amount);
        amounts.amountKzt = std::fabs(*amount);
        amounts.currency = options_.baseCurrency;
        return amounts;
    }

    auto original = parseNumber(field(row, "amount_original"));
    if (!original) {
        return std::unexpected(label(rowLabel, "invalid amount_original"));
    }
    amounts.amountOriginal = *original;

    std::string currencyText = field(row, "currency");
    auto currency = normalizeCurrency(currencyText);
    if (!currency) {
        return std::unexpected(label(rowLabel, "invalid currency '" + currencyText + "'"));
    }
    amounts.currency = *currency;

    if (options_.policy == ImportPolicy::CurrentRate) {
        if (options_.rates == nullptr) {
            return std::unexpected(label(rowLabel, "current-rate policy requires currency service"));
        }
        auto rate = options_.rates->getRate(amounts.currency);
        if (!rate) {
            return std::unexpected(label(rowLabel,
                "failed to get current rate for " + amounts.currency + " (" + rate.error().message + ")"));
        }
        amounts.amountKzt = amounts.amountOriginal * *rate;
    } else {
        std::string rateText = field(row, "rate_at_operation");
        if (rateText.empty()) {
            return std::unexpected(label(rowLabel, "missing required field 'rate_at_operation'"));
        }
        auto rate = parseNumber(rateText);
        if (!rate || *rate <= 0.0) {
            return std::unexpected(label(rowLabel, "invalid rate_at_operation"));
        }

        std::string kztText = field(row, "amount_kzt");
        if (kztText.empty()) {
            return std::unexpected(label(rowLabel, "missing required field 'amount_kzt'"));
        }
        auto kzt = parseNumber(kztText);
        if (!kzt) {
            return std::unexpected(label(rowLabel, "invalid amount_kzt"));
        }
        amounts.amountKzt = *kzt;
    }

    if (amounts.amountOriginal < 0.0) {
        return std::unexpected(label(rowLabel, "amount_original must be >= 0"));
    }
    return amounts;
}

RowOutcome ImportRowParser::parseRow(const ImportRow& rawRow, std::string_view rowLabel) const {
    ImportRow row = normalizeKeys(rawRow);
    std::string type = normalizeType(field(row, "type"));

    // Начальный баланс: amount_original, затем amount_kzt, затем amount
    if (type == "initial_balance") {
        for (const char* key : {"amount_original", "amount_kzt", "amount"}) {
            auto it = row.find(key);
            if (it != row.end()) {
                return InitialBalanceRow{parseNumber(it->second).value_or(0.0)};
            }
        }
        return InitialBalanceRow{0.0};
    }

    if (options_.mandatoryOnly) {
        type = "mandatory_expense";
    }

    std::vector<std::string> required = {"category", "type"};
    if (!options_.mandatoryOnly) {
        required.push_back("date");
    }
    if (options_.policy == ImportPolicy::Legacy) {
        required.push_back("amount");
    } else {
        required.push_back("amount_original");
        required.push_back("currency");
    }
    for (const auto& name : required) {
        if (field(row, name).empty()) {
            return RowError{label(rowLabel, "missing required field '" + name + "'")};
        }
    }

    RecordDraft draft;

    std::string dateText = field(row, "date");
    if (!dateText.empty()) {
        auto date = parseDate(dateText);
        if (!date) {
            return RowError{label(rowLabel, date.error().message)};
        }
        draft.date = *date;
    }

    auto recordType = parseRecordType(type);
    if (!recordType) {
        return RowError{label(rowLabel, "unsupported type '" + type + "'")};
    }
    draft.type = *recordType;

    std::string walletText = field(row, "wallet_id");
    if (!walletText.empty()) {
        auto walletId = parseId(walletText);
        if (!walletId || *walletId <= 0) {
            return RowError{label(rowLabel, "invalid wallet_id '" + walletText + "'")};
        }
        draft.walletId = *walletId;
    }

    // Нога перевода: income/expense с transfer_id
    std::string transferText = field(row, "transfer_id");
    if (!transferText.empty()) {
        auto transferId = parseId(transferText);
        if (!transferId || *transferId <= 0) {
            return RowError{label(rowLabel, "invalid transfer_id '" + transferText + "'")};
        }
        if (draft.type == RecordType::MandatoryExpense) {
            return RowError{label(rowLabel, "mandatory expense cannot be a transfer leg")};
        }
        draft.transferId = *transferId;
    }

    std::string commissionText = field(row, "commission_for_transfer_id");
    if (!commissionText.empty()) {
        auto commissionFor = parseId(commissionText);
        if (!commissionFor || *commissionFor <= 0) {
            return RowError{label(rowLabel,
                "invalid commission_for_transfer_id '" + commissionText + "'")};
        }
        draft.commissionForTransferId = *commissionFor;
    }

    auto amounts = resolveAmounts(row, rowLabel);
    if (!amounts) {
        return RowError{amounts.error()};
    }
    draft.amountOriginal = amounts->amountOriginal;
    draft.currency = amounts->currency;
    draft.amountKzt = std::fabs(amounts->amountKzt);

    std::string category = field(row, "category");
    draft.category = category.empty() ? std::string(kDefaultCategory) : category;
    auto descIt = row.find("description");
    draft.description = descIt != row.end() ? descIt->second : std::string{};

    if (draft.type == RecordType::MandatoryExpense) {
        std::string periodText = toLower(field(row, "period"));
        if (periodText.empty()) {
            periodText = "monthly";
        }
        auto period = parsePeriod(periodText);
        if (!period) {
            return RowError{label(rowLabel, "invalid mandatory period '" + periodText + "'")};
        }
        draft.period = *period;
    }

    auto record = Record::create(draft, options_.baseCurrency);
    if (!record) {
        return RowError{label(rowLabel, record.error().message)};
    }
    return *record;
}

// ═════════════════════════════════════════════════════════════════════════════
// Строка перевода
// ═════════════════════════════════════════════════════════════════════════════

TransferRowOutcome ImportRowParser::parseTransferRow(
    const ImportRow& rawRow,
    std::string_view rowLabel,
    int fallbackTransferId) const
{
    ImportRow row = normalizeKeys(rawRow);

    std::string dateText = field(row, "date");
    if (dateText.empty()) {
        return RowError{label(rowLabel, "missing required field 'date'")};
    }
    auto date = parseDate(dateText);
    if (!date) {
        return RowError{label(rowLabel, date.error().message)};
    }

    auto fromWallet = parseId(field(row, "from_wallet_id"));
    auto toWallet = parseId(field(row, "to_wallet_id"));
    if (!fromWallet || !toWallet || *fromWallet <= 0 || *toWallet <= 0) {
        return RowError{label(rowLabel,
            "invalid transfer wallets (from_wallet_id/to_wallet_id)")};
    }
    if (*fromWallet == *toWallet) {
        return RowError{label(rowLabel, "transfer wallets must be different")};
    }

    auto amounts = resolveAmounts(row, rowLabel);
    if (!amounts) {
        return RowError{amounts.error()};
    }

    int transferId = fallbackTransferId;
    std::string transferText = field(row, "transfer_id");
    if (!transferText.empty()) {
        auto parsed = parseId(transferText);
        if (parsed && *parsed > 0) {
            transferId = *parsed;
        }
    }

    std::string category = field(row, "category");
    if (category.empty()) {
        category = std::string(kTransferCategory);
    }
    auto descIt = row.find("description");
    std::string description = descIt != row.end() ? descIt->second : std::string{};

    TransferDraft transferDraft;
    transferDraft.id = transferId;
    transferDraft.fromWalletId = *fromWallet;
    transferDraft.toWalletId = *toWallet;
    transferDraft.date = *date;
    transferDraft.amountOriginal = amounts->amountOriginal;
    transferDraft.currency = amounts->currency;
    transferDraft.amountKzt = std::fabs(amounts->amountKzt);
    transferDraft.description = description;

    auto transfer = Transfer::create(transferDraft, options_.baseCurrency);
    if (!transfer) {
        return RowError{label(rowLabel, "invalid transfer (" + transfer.error().message + ")")};
    }

    RecordDraft leg;
    leg.date = *date;
    leg.transferId = transferId;
    leg.amountOriginal = transfer->amountOriginal();
    leg.currency = transfer->currency();
    leg.amountKzt = transfer->amountKzt();
    leg.category = category;
    leg.description = description;

    leg.type = RecordType::Expense;
    leg.walletId = *fromWallet;
    auto expense = Record::create(leg, options_.baseCurrency);

    leg.type = RecordType::Income;
    leg.walletId = *toWallet;
    auto income = Record::create(leg, options_.baseCurrency);

    if (!expense || !income) {
        const Error& error = !expense ? expense.error() : income.error();
        return RowError{label(rowLabel, "invalid transfer leg (" + error.message + ")")};
    }

    // Обе ноги должны совпадать между собой и с агрегатом
    constexpr double kTolerance = 1e-6;
    bool agree =
        expense->currency() == income->currency() &&
        expense->currency() == transfer->currency() &&
        nearlyEqual(expense->amountOriginal(), income->amountOriginal(), kTolerance) &&
        nearlyEqual(expense->rateAtOperation(), income->rateAtOperation(), kTolerance) &&
        nearlyEqual(expense->rateAtOperation(), transfer->rateAtOperation(), kTolerance);
    if (!agree) {
        return RowError{label(rowLabel, "transfer legs disagree on amount/currency/rate")};
    }

    return ParsedTransfer{*transfer, *expense, *income};
}

} // namespace ledger
