#include "Transfer.hpp"
#include "Money.hpp"
#include <cmath>

namespace ledger {

Expected<Transfer> Transfer::create(const TransferDraft& draft, std::string_view baseCurrency) {
    if (draft.id <= 0) {
        return makeError(ErrorKind::Validation, "Transfer id must be positive");
    }
    if (draft.fromWalletId <= 0 || draft.toWalletId <= 0) {
        return makeError(ErrorKind::Validation, "Transfer wallet ids must be positive");
    }
    if (draft.fromWalletId == draft.toWalletId) {
        return makeError(ErrorKind::Validation,
            "Transfer source and destination wallets must be different");
    }
    if (!draft.date.ok()) {
        return makeError(ErrorKind::Validation, "Transfer date is invalid");
    }
    if (!std::isfinite(draft.amountOriginal) || draft.amountOriginal <= 0.0) {
        return makeError(ErrorKind::Validation, "Transfer amount must be positive");
    }
    if (!std::isfinite(draft.amountKzt) || draft.amountKzt <= 0.0) {
        return makeError(ErrorKind::Validation, "Transfer amount_kzt must be positive");
    }

    auto currency = normalizeCurrency(draft.currency.empty()
        ? baseCurrency : std::string_view(draft.currency));
    if (!currency) {
        return std::unexpected(currency.error());
    }

    Transfer t;
    t.id_ = draft.id;
    t.fromWalletId_ = draft.fromWalletId;
    t.toWalletId_ = draft.toWalletId;
    t.date_ = draft.date;
    t.amountOriginal_ = draft.amountOriginal;
    t.currency_ = std::move(*currency);
    t.amountKzt_ = draft.amountKzt;
    t.rateAtOperation_ = deriveRate(
        t.amountOriginal_, t.amountKzt_, t.currency_, baseCurrency);
    t.description_ = draft.description;
    return t;
}

TransferDraft Transfer::toDraft() const {
    TransferDraft d;
    d.id = id_;
    d.fromWalletId = fromWalletId_;
    d.toWalletId = toWalletId_;
    d.date = date_;
    d.amountOriginal = amountOriginal_;
    d.currency = currency_;
    d.amountKzt = amountKzt_;
    d.description = description_;
    return d;
}

Transfer Transfer::withId(int id) const {
    Transfer copy = *this;
    copy.id_ = id;
    return copy;
}

Transfer Transfer::withWallets(int fromWalletId, int toWalletId) const {
    Transfer copy = *this;
    copy.fromWalletId_ = fromWalletId;
    copy.toWalletId_ = toWalletId;
    return copy;
}

} // namespace ledger
