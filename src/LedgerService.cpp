#include "LedgerService.hpp"
#include "Money.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace ledger {

namespace {

template <typename T>
int nextId(const std::vector<T>& items) {
    int maxId = 0;
    for (const auto& item : items) {
        maxId = std::max(maxId, item.id());
    }
    return maxId + 1;
}

std::string trimmed(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

// Дата пользовательской операции: формат и не в будущем
Expected<Date> operationDate(std::string_view text) {
    auto date = parseDate(text);
    if (!date) {
        return std::unexpected(date.error());
    }
    auto notFuture = ensureNotFuture(*date);
    if (!notFuture) {
        return std::unexpected(notFuture.error());
    }
    return *date;
}

// Кошелёк с флагом system; кошелёк #1 - только если флага нет ни у кого
std::vector<Wallet>::const_iterator findSystemWallet(const std::vector<Wallet>& wallets) {
    auto flagged = std::find_if(wallets.begin(), wallets.end(),
        [](const Wallet& w) { return w.isSystem(); });
    if (flagged != wallets.end()) {
        return flagged;
    }
    return std::find_if(wallets.begin(), wallets.end(),
        [](const Wallet& w) { return w.id() == kSystemWalletId; });
}

} // namespace

LedgerService::LedgerService(ILedgerStorage& storage, const ICurrencyRates& rates)
    : storage_(storage)
    , rates_(rates)
{
}

Result LedgerService::ensureSystemWallet() {
    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }
    if (!wallets->empty()) {
        return {};
    }

    auto system = Wallet::systemDefault(rates_.baseCurrency());
    if (!system) {
        return std::unexpected(system.error());
    }
    return storage_.saveWallet(*system);
}

Expected<Wallet> LedgerService::requireActiveWallet(
    const std::vector<Wallet>& wallets, int walletId) const
{
    auto wallet = findWallet(wallets, walletId);
    if (!wallet) {
        return makeError(ErrorKind::NotFound, "Wallet not found: " + std::to_string(walletId));
    }
    if (!wallet->isActive()) {
        return makeError(ErrorKind::Domain,
            "Wallet #" + std::to_string(walletId) + " is inactive");
    }
    return *wallet;
}

// ═════════════════════════════════════════════════════════════════════════════
// Кошельки
// ═════════════════════════════════════════════════════════════════════════════

Expected<Wallet> LedgerService::createWallet(
    std::string name,
    std::string_view currency,
    double initialBalance,
    bool allowNegative)
{
    name = trimmed(name);
    if (name.empty()) {
        return makeError(ErrorKind::Validation, "Wallet name is required");
    }

    auto ensured = ensureSystemWallet();
    if (!ensured) {
        return std::unexpected(ensured.error());
    }

    auto existing = storage_.loadWallets();
    if (!existing) {
        return std::unexpected(existing.error());
    }

    auto wallet = Wallet::create(nextId(*existing), std::move(name), currency,
        initialBalance, false, allowNegative);
    if (!wallet) {
        return std::unexpected(wallet.error());
    }

    auto saved = storage_.saveWallet(*wallet);
    if (!saved) {
        return std::unexpected(saved.error());
    }
    return *wallet;
}

Result LedgerService::softDeleteWallet(int walletId) {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto wallet = findWallet(snapshot->wallets, walletId);
    if (!wallet) {
        return makeError(ErrorKind::NotFound, "Wallet not found: " + std::to_string(walletId));
    }
    auto system = findSystemWallet(snapshot->wallets);
    if (system != snapshot->wallets.end() && system->id() == walletId) {
        return makeError(ErrorKind::Domain, "System wallet cannot be deleted");
    }
    if (!wallet->isActive()) {
        return makeError(ErrorKind::Domain,
            "Wallet #" + std::to_string(walletId) + " is already inactive");
    }

    double balance = ledger::walletBalance(*wallet, snapshot->records);
    if (!nearlyEqual(balance, 0.0)) {
        return makeError(ErrorKind::Domain,
            "Wallet #" + std::to_string(walletId) + " has non-zero balance");
    }

    return storage_.saveWallet(wallet->deactivated());
}

Expected<std::vector<Wallet>> LedgerService::wallets() {
    return storage_.loadWallets();
}

Expected<std::vector<Wallet>> LedgerService::activeWallets() {
    auto all = storage_.loadWallets();
    if (!all) {
        return std::unexpected(all.error());
    }

    std::vector<Wallet> active;
    std::copy_if(all->begin(), all->end(), std::back_inserter(active),
        [](const Wallet& w) { return w.isActive(); });
    return active;
}

Expected<double> LedgerService::walletBalance(int walletId) {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto wallet = findWallet(snapshot->wallets, walletId);
    if (!wallet) {
        return makeError(ErrorKind::NotFound, "Wallet not found: " + std::to_string(walletId));
    }
    return ledger::walletBalance(*wallet, snapshot->records);
}

Expected<double> LedgerService::netWorth() {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return ledger::netWorth(snapshot->wallets, snapshot->records);
}

Result LedgerService::setSystemInitialBalance(double balance) {
    auto ensured = ensureSystemWallet();
    if (!ensured) {
        return ensured;
    }

    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }

    auto it = findSystemWallet(*wallets);
    if (it == wallets->end()) {
        return makeError(ErrorKind::NotFound, "System wallet not found");
    }

    auto updated = Wallet::create(it->id(), it->name(), it->currency(), balance,
        it->isSystem(), it->allowNegative(), it->isActive());
    if (!updated) {
        return std::unexpected(updated.error());
    }
    return storage_.saveWallet(*updated);
}

Expected<double> LedgerService::systemInitialBalance() {
    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }

    auto it = findSystemWallet(*wallets);
    if (it == wallets->end()) {
        return 0.0;
    }
    return it->initialBalance();
}

// ═════════════════════════════════════════════════════════════════════════════
// Записи
// ═════════════════════════════════════════════════════════════════════════════

Expected<Record> LedgerService::createOperation(RecordType type, const OperationRequest& request) {
    auto date = operationDate(request.date);
    if (!date) {
        return std::unexpected(date.error());
    }
    if (!std::isfinite(request.amount) || request.amount < 0.0) {
        return makeError(ErrorKind::Validation, "Amount cannot be negative");
    }

    auto currency = normalizeCurrency(request.currency);
    if (!currency) {
        return std::unexpected(currency.error());
    }

    auto ensured = ensureSystemWallet();
    if (!ensured) {
        return std::unexpected(ensured.error());
    }
    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }
    auto wallet = requireActiveWallet(*wallets, request.walletId);
    if (!wallet) {
        return std::unexpected(wallet.error());
    }

    auto amountKzt = rates_.convert(request.amount, *currency);
    if (!amountKzt) {
        return std::unexpected(amountKzt.error());
    }

    RecordDraft draft;
    draft.type = type;
    draft.date = *date;
    draft.walletId = request.walletId;
    draft.amountOriginal = request.amount;
    draft.currency = *currency;
    draft.amountKzt = *amountKzt;
    draft.category = request.category;
    draft.description = request.description;

    auto record = Record::create(draft, rates_.baseCurrency());
    if (!record) {
        return std::unexpected(record.error());
    }
    return storage_.save(*record);
}

Expected<Record> LedgerService::createIncome(const OperationRequest& request) {
    return createOperation(RecordType::Income, request);
}

Expected<Record> LedgerService::createExpense(const OperationRequest& request) {
    return createOperation(RecordType::Expense, request);
}

Expected<std::vector<Record>> LedgerService::records() {
    return storage_.loadAll();
}

Expected<bool> LedgerService::deleteRecord(std::size_t index) {
    auto all = storage_.loadAll();
    if (!all) {
        return std::unexpected(all.error());
    }
    if (index >= all->size()) {
        return false;
    }

    const Record& target = (*all)[index];
    if (target.transferId()) {
        auto deleted = deleteTransfer(*target.transferId());
        if (!deleted) {
            return std::unexpected(deleted.error());
        }
        return true;
    }
    return storage_.deleteByIndex(index);
}

Result LedgerService::deleteAllRecords() {
    return storage_.deleteAll();
}

Result LedgerService::updateRecordAmountKzt(int recordId, double newAmountKzt) {
    auto all = storage_.loadAll();
    if (!all) {
        return std::unexpected(all.error());
    }

    auto it = std::find_if(all->begin(), all->end(),
        [recordId](const Record& r) { return r.id() == recordId; });
    if (it == all->end()) {
        return makeError(ErrorKind::NotFound, "Record not found: #" + std::to_string(recordId));
    }
    if (it->isTransferLeg()) {
        return makeError(ErrorKind::Domain, "Transfer-linked records cannot be edited");
    }

    auto updated = it->withAmountKzt(newAmountKzt, rates_.baseCurrency());
    if (!updated) {
        return std::unexpected(updated.error());
    }
    return storage_.replace(*updated);
}

// ═════════════════════════════════════════════════════════════════════════════
// Обязательные расходы
// ═════════════════════════════════════════════════════════════════════════════

Expected<Record> LedgerService::createMandatoryExpense(const MandatoryExpenseRequest& request) {
    if (!std::isfinite(request.amount) || request.amount < 0.0) {
        return makeError(ErrorKind::Validation, "Amount cannot be negative");
    }

    auto currency = normalizeCurrency(request.currency);
    if (!currency) {
        return std::unexpected(currency.error());
    }
    auto period = parsePeriod(request.period);
    if (!period) {
        return std::unexpected(period.error());
    }

    auto ensured = ensureSystemWallet();
    if (!ensured) {
        return std::unexpected(ensured.error());
    }
    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }
    auto wallet = requireActiveWallet(*wallets, request.walletId);
    if (!wallet) {
        return std::unexpected(wallet.error());
    }

    auto amountKzt = rates_.convert(request.amount, *currency);
    if (!amountKzt) {
        return std::unexpected(amountKzt.error());
    }

    RecordDraft draft;
    draft.type = RecordType::MandatoryExpense;
    draft.walletId = request.walletId;
    draft.amountOriginal = request.amount;
    draft.currency = *currency;
    draft.amountKzt = *amountKzt;
    draft.category = request.category;
    draft.description = request.description;
    draft.period = *period;

    auto expense = Record::create(draft, rates_.baseCurrency());
    if (!expense) {
        return std::unexpected(expense.error());
    }
    return storage_.saveMandatoryExpense(*expense);
}

Expected<std::vector<Record>> LedgerService::mandatoryExpenses() {
    return storage_.loadMandatoryExpenses();
}

Expected<Record> LedgerService::applyMandatoryExpense(
    std::size_t templateIndex,
    std::string_view date,
    int walletId)
{
    auto templates = storage_.loadMandatoryExpenses();
    if (!templates) {
        return std::unexpected(templates.error());
    }
    if (templateIndex >= templates->size()) {
        return makeError(ErrorKind::NotFound,
            "Mandatory expense not found at index " + std::to_string(templateIndex));
    }

    auto recordDate = operationDate(date);
    if (!recordDate) {
        return std::unexpected(recordDate.error());
    }

    auto wallets = storage_.loadWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }
    auto wallet = requireActiveWallet(*wallets, walletId);
    if (!wallet) {
        return std::unexpected(wallet.error());
    }

    auto record = (*templates)[templateIndex].withWallet(walletId).materialize(*recordDate);
    if (!record) {
        return std::unexpected(record.error());
    }
    return storage_.save(*record);
}

Expected<bool> LedgerService::deleteMandatoryExpense(std::size_t index) {
    return storage_.deleteMandatoryExpenseByIndex(index);
}

Result LedgerService::deleteAllMandatoryExpenses() {
    return storage_.deleteAllMandatoryExpenses();
}

// ═════════════════════════════════════════════════════════════════════════════
// Переводы
// ═════════════════════════════════════════════════════════════════════════════

Expected<int> LedgerService::createTransfer(const TransferRequest& request) {
    auto date = operationDate(request.date);
    if (!date) {
        return std::unexpected(date.error());
    }
    if (request.fromWalletId == request.toWalletId) {
        return makeError(ErrorKind::Validation, "Source and destination wallets must be different");
    }
    if (!std::isfinite(request.amount) || request.amount <= 0.0) {
        return makeError(ErrorKind::Validation, "Transfer amount must be positive");
    }
    if (!std::isfinite(request.commissionAmount) || request.commissionAmount < 0.0) {
        return makeError(ErrorKind::Validation, "Commission cannot be negative");
    }

    auto currency = normalizeCurrency(request.currency);
    if (!currency) {
        return std::unexpected(currency.error());
    }
    std::string commissionCurrency = *currency;
    if (request.commissionAmount > 0.0 && !trimmed(request.commissionCurrency).empty()) {
        auto normalized = normalizeCurrency(request.commissionCurrency);
        if (!normalized) {
            return std::unexpected(normalized.error());
        }
        commissionCurrency = *normalized;
    }

    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto from = requireActiveWallet(snapshot->wallets, request.fromWalletId);
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = requireActiveWallet(snapshot->wallets, request.toWalletId);
    if (!to) {
        return std::unexpected(to.error());
    }

    auto amountKzt = rates_.convert(request.amount, *currency);
    if (!amountKzt) {
        return std::unexpected(amountKzt.error());
    }
    double commissionKzt = 0.0;
    if (request.commissionAmount > 0.0) {
        auto converted = rates_.convert(request.commissionAmount, commissionCurrency);
        if (!converted) {
            return std::unexpected(converted.error());
        }
        commissionKzt = *converted;
    }

    // Проверка средств до любой записи
    double available = ledger::walletBalance(*from, snapshot->records);
    if (!from->allowNegative() && available - *amountKzt - commissionKzt < -kBalanceEpsilon) {
        return makeError(ErrorKind::InsufficientFunds,
            "Insufficient funds in wallet #" + std::to_string(from->id())
            + ": balance " + std::to_string(available)
            + ", required " + std::to_string(*amountKzt + commissionKzt));
    }

    TransferDraft transferDraft;
    transferDraft.id = nextId(snapshot->transfers);
    transferDraft.fromWalletId = from->id();
    transferDraft.toWalletId = to->id();
    transferDraft.date = *date;
    transferDraft.amountOriginal = request.amount;
    transferDraft.currency = *currency;
    transferDraft.amountKzt = *amountKzt;
    transferDraft.description = trimmed(request.description);

    auto transfer = Transfer::create(transferDraft, rates_.baseCurrency());
    if (!transfer) {
        return std::unexpected(transfer.error());
    }

    int recordId = nextId(snapshot->records);

    RecordDraft leg;
    leg.date = *date;
    leg.transferId = transfer->id();
    leg.amountOriginal = transfer->amountOriginal();
    leg.currency = transfer->currency();
    leg.amountKzt = transfer->amountKzt();
    leg.category = std::string(kTransferCategory);
    leg.description = transfer->description();

    leg.type = RecordType::Expense;
    leg.id = recordId++;
    leg.walletId = from->id();
    auto expenseLeg = Record::create(leg, rates_.baseCurrency());
    if (!expenseLeg) {
        return std::unexpected(expenseLeg.error());
    }

    leg.type = RecordType::Income;
    leg.id = recordId++;
    leg.walletId = to->id();
    auto incomeLeg = Record::create(leg, rates_.baseCurrency());
    if (!incomeLeg) {
        return std::unexpected(incomeLeg.error());
    }

    std::vector<Record> records = snapshot->records;
    std::vector<Transfer> transfers = snapshot->transfers;
    transfers.push_back(*transfer);
    records.push_back(*expenseLeg);
    records.push_back(*incomeLeg);

    if (request.commissionAmount > 0.0) {
        RecordDraft commission;
        commission.type = RecordType::Expense;
        commission.id = recordId++;
        commission.date = *date;
        commission.walletId = from->id();
        commission.commissionForTransferId = transfer->id();
        commission.amountOriginal = request.commissionAmount;
        commission.currency = commissionCurrency;
        commission.amountKzt = commissionKzt;
        commission.category = std::string(kCommissionCategory);
        commission.description = "Commission for transfer #" + std::to_string(transfer->id());

        auto commissionRecord = Record::create(commission, rates_.baseCurrency());
        if (!commissionRecord) {
            return std::unexpected(commissionRecord.error());
        }
        records.push_back(*commissionRecord);
    }

    auto written = storage_.replaceRecordsAndTransfers(records, transfers);
    if (!written) {
        return std::unexpected(written.error());
    }
    return transfer->id();
}

Result LedgerService::deleteTransfer(int transferId) {
    auto snapshot = storage_.loadSnapshot();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    auto transferIt = std::find_if(snapshot->transfers.begin(), snapshot->transfers.end(),
        [transferId](const Transfer& t) { return t.id() == transferId; });
    if (transferIt == snapshot->transfers.end()) {
        return makeError(ErrorKind::Domain, "Transfer not found: #" + std::to_string(transferId));
    }

    std::vector<Transfer> transfers;
    for (const auto& t : snapshot->transfers) {
        if (t.id() != transferId) {
            transfers.push_back(t);
        }
    }

    std::vector<Record> records;
    for (const auto& r : snapshot->records) {
        bool leg = r.transferId() == transferId;
        bool commission = r.commissionForTransferId() == transferId;
        if (!leg && !commission) {
            records.push_back(r);
        }
    }

    return storage_.replaceRecordsAndTransfers(records, transfers);
}

Expected<std::vector<Transfer>> LedgerService::transfers() {
    return storage_.loadTransfers();
}

} // namespace ledger
