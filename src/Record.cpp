#include "Record.hpp"
#include "Money.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace ledger {

namespace {

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c); });
}

} // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Строковые представления
// ═════════════════════════════════════════════════════════════════════════════

std::string_view toString(RecordType type) noexcept {
    switch (type) {
        case RecordType::Income:           return "income";
        case RecordType::Expense:          return "expense";
        case RecordType::MandatoryExpense: return "mandatory_expense";
    }
    return "expense";
}

std::string_view toString(Period period) noexcept {
    switch (period) {
        case Period::Daily:   return "daily";
        case Period::Weekly:  return "weekly";
        case Period::Monthly: return "monthly";
        case Period::Yearly:  return "yearly";
    }
    return "monthly";
}

Expected<RecordType> parseRecordType(std::string_view text) {
    if (text == "income") {
        return RecordType::Income;
    }
    if (text == "expense") {
        return RecordType::Expense;
    }
    if (text == "mandatory_expense") {
        return RecordType::MandatoryExpense;
    }
    return makeError(ErrorKind::Validation,
        "unsupported record type '" + std::string(text) + "'");
}

Expected<Period> parsePeriod(std::string_view text) {
    if (text == "daily")   return Period::Daily;
    if (text == "weekly")  return Period::Weekly;
    if (text == "monthly") return Period::Monthly;
    if (text == "yearly")  return Period::Yearly;

    return makeError(ErrorKind::Validation,
        "invalid mandatory period '" + std::string(text) + "'");
}

// ═════════════════════════════════════════════════════════════════════════════
// Создание
// ═════════════════════════════════════════════════════════════════════════════

Expected<Record> Record::create(const RecordDraft& draft, std::string_view baseCurrency) {
    if (draft.id < 0) {
        return makeError(ErrorKind::Validation, "Record id cannot be negative");
    }

    if (draft.walletId <= 0) {
        return makeError(ErrorKind::Validation, "wallet_id must be a positive integer");
    }

    if (draft.type != RecordType::MandatoryExpense && !draft.date) {
        return makeError(ErrorKind::Validation,
            std::string(toString(draft.type)) + " record requires a date");
    }

    if (draft.transferId) {
        if (*draft.transferId <= 0) {
            return makeError(ErrorKind::Validation,
                "transfer_id must be a positive integer");
        }
        if (draft.commissionForTransferId) {
            return makeError(ErrorKind::Validation,
                "Transfer leg cannot also be a commission record");
        }
    }

    if (draft.commissionForTransferId && *draft.commissionForTransferId <= 0) {
        return makeError(ErrorKind::Validation,
            "commission_for_transfer_id must be a positive integer");
    }

    if (!std::isfinite(draft.amountOriginal) || !std::isfinite(draft.amountKzt)) {
        return makeError(ErrorKind::Validation, "invalid amount");
    }

    if (draft.amountOriginal < 0.0) {
        return makeError(ErrorKind::Validation, "amount_original must be >= 0");
    }

    auto currency = normalizeCurrency(draft.currency.empty()
        ? baseCurrency : std::string_view(draft.currency));
    if (!currency) {
        return std::unexpected(currency.error());
    }

    if (isBlank(draft.category)) {
        return makeError(ErrorKind::Validation, "Record category is empty");
    }

    if (draft.type == RecordType::MandatoryExpense && !draft.period) {
        return makeError(ErrorKind::Validation,
            "Mandatory expense requires a period");
    }

    Record r;
    r.id_ = draft.id;
    r.type_ = draft.type;
    r.date_ = draft.date;
    r.walletId_ = draft.walletId;
    r.transferId_ = draft.transferId;
    r.commissionForTransferId_ = draft.commissionForTransferId;
    r.amountOriginal_ = draft.amountOriginal;
    r.currency_ = std::move(*currency);
    r.amountKzt_ = std::fabs(draft.amountKzt);
    r.rateAtOperation_ = deriveRate(
        r.amountOriginal_, r.amountKzt_, r.currency_, baseCurrency);
    r.category_ = draft.category;
    r.description_ = draft.description;
    if (draft.type == RecordType::MandatoryExpense) {
        r.period_ = draft.period;
    }
    return r;
}

double Record::signedAmountKzt() const noexcept {
    switch (type_) {
        case RecordType::Income:
            return amountKzt_;
        case RecordType::Expense:
        case RecordType::MandatoryExpense:
            return -amountKzt_;
    }
    return 0.0;
}

RecordDraft Record::toDraft() const {
    RecordDraft d;
    d.type = type_;
    d.id = id_;
    d.date = date_;
    d.walletId = walletId_;
    d.transferId = transferId_;
    d.commissionForTransferId = commissionForTransferId_;
    d.amountOriginal = amountOriginal_;
    d.currency = currency_;
    d.amountKzt = amountKzt_;
    d.category = category_;
    d.description = description_;
    d.period = period_;
    return d;
}

// ═════════════════════════════════════════════════════════════════════════════
// Чистые обновления
// ═════════════════════════════════════════════════════════════════════════════

Record Record::withId(int id) const {
    Record copy = *this;
    copy.id_ = id;
    return copy;
}

Record Record::withWallet(int walletId) const {
    Record copy = *this;
    copy.walletId_ = walletId;
    return copy;
}

Record Record::withTransferId(std::optional<int> transferId) const {
    Record copy = *this;
    copy.transferId_ = transferId;
    return copy;
}

Record Record::withCommissionForTransferId(std::optional<int> transferId) const {
    Record copy = *this;
    copy.commissionForTransferId_ = transferId;
    return copy;
}

Expected<Record> Record::withAmountKzt(double amountKzt, std::string_view baseCurrency) const {
    if (!std::isfinite(amountKzt) || amountKzt < 0.0) {
        return makeError(ErrorKind::Validation, "amount_kzt must be a non-negative number");
    }
    RecordDraft d = toDraft();
    d.amountKzt = amountKzt;
    // В базовой валюте исходная сумма совпадает с суммой в тенге
    if (currency_ == baseCurrency) {
        d.amountOriginal = amountKzt;
    }
    return create(d, baseCurrency);
}

Expected<Record> Record::materialize(const Date& date) const {
    if (type_ != RecordType::MandatoryExpense) {
        return makeError(ErrorKind::Domain,
            "Only mandatory expense templates can be applied");
    }
    Record copy = *this;
    copy.id_ = 0;
    copy.date_ = date;
    return copy;
}

} // namespace ledger
