#include "ImportBatch.hpp"
#include "TransferIntegrity.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <map>

namespace ledger {

namespace {

std::string rowLabel(std::size_t index) {
    return "row " + std::to_string(index + 1);
}

// Кратчайшее представление, восстанавливающее то же значение
std::string formatNumber(double value) {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer, ptr);
}

void skip(ImportSummary& summary, std::string message) {
    ++summary.skipped;
    summary.errors.push_back(std::move(message));
}

bool walletKnown(const ImportBatchOptions& options, int walletId) {
    return !options.walletIds || options.walletIds->contains(walletId);
}

// Явные transfer_id строк, чтобы новые id с ними не пересекались
int firstFreeTransferId(const std::vector<ImportRow>& rows) {
    int maxId = 0;
    for (const auto& raw : rows) {
        ImportRow row = ImportRowParser::normalizeKeys(raw);
        auto it = row.find("transfer_id");
        if (it == row.end()) {
            continue;
        }
        auto id = ImportRowParser::parseNumber(it->second);
        // Вне диапазона int строку всё равно отклонит парсер
        if (id && *id >= 1.0 && *id == std::floor(*id) &&
            *id < static_cast<double>(std::numeric_limits<int>::max())) {
            maxId = std::max(maxId, static_cast<int>(*id));
        }
    }
    return maxId + 1;
}

} // namespace

Result ImportBatch::checkRowLimit(std::size_t count, std::size_t maxRows) {
    if (count > maxRows) {
        return makeError(ErrorKind::Validation,
            "Import aborted: " + std::to_string(count) +
            " rows exceed the limit of " + std::to_string(maxRows));
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Записи и переводы
// ═════════════════════════════════════════════════════════════════════════════

Expected<RecordBatch> ImportBatch::parseRecords(
    const std::vector<ImportRow>& rows,
    const ImportBatchOptions& options)
{
    auto limit = checkRowLimit(rows.size(), options.maxRows);
    if (!limit) {
        return std::unexpected(limit.error());
    }

    ImportRowParser parser(ParserOptions{
        options.policy, options.rates, options.baseCurrency, false});

    RecordBatch batch;
    std::set<int> transferIds;
    int nextTransferId = firstFreeTransferId(rows);

    for (std::size_t i = 0; i < rows.size(); ++i) {
        const std::string label = rowLabel(i);
        if (ImportRowParser::isBlankRow(rows[i])) {
            continue;
        }

        ImportRow row = ImportRowParser::normalizeKeys(rows[i]);
        auto typeIt = row.find("type");
        std::string type = ImportRowParser::normalizeType(
            typeIt != row.end() ? typeIt->second : std::string{});

        if (type == "transfer") {
            auto outcome = parser.parseTransferRow(row, label, nextTransferId);
            if (auto* error = std::get_if<RowError>(&outcome)) {
                skip(batch.summary, error->message);
                continue;
            }

            auto& parsed = std::get<ParsedTransfer>(outcome);
            int id = parsed.transfer.id();
            if (transferIds.contains(id)) {
                skip(batch.summary, label + ": duplicate transfer_id #" + std::to_string(id));
                continue;
            }
            if (!walletKnown(options, parsed.transfer.fromWalletId())) {
                skip(batch.summary, label + ": wallet not found ("
                    + std::to_string(parsed.transfer.fromWalletId()) + ")");
                continue;
            }
            if (!walletKnown(options, parsed.transfer.toWalletId())) {
                skip(batch.summary, label + ": wallet not found ("
                    + std::to_string(parsed.transfer.toWalletId()) + ")");
                continue;
            }

            if (id < std::numeric_limits<int>::max()) {
                nextTransferId = std::max(nextTransferId, id + 1);
            }
            transferIds.insert(id);
            batch.transfers.push_back(parsed.transfer);
            batch.records.push_back(parsed.expenseLeg);
            batch.records.push_back(parsed.incomeLeg);
            ++batch.summary.imported;
            continue;
        }

        auto outcome = parser.parseRow(row, label);
        if (auto* error = std::get_if<RowError>(&outcome)) {
            skip(batch.summary, error->message);
            continue;
        }

        if (auto* balance = std::get_if<InitialBalanceRow>(&outcome)) {
            // Первый начальный баланс побеждает
            if (batch.initialBalance) {
                skip(batch.summary, label + ": duplicate initial_balance");
                continue;
            }
            batch.initialBalance = balance->amount;
            continue;
        }

        const Record& record = std::get<Record>(outcome);
        if (!walletKnown(options, record.walletId())) {
            skip(batch.summary, label + ": wallet not found ("
                + std::to_string(record.walletId()) + ")");
            continue;
        }
        batch.records.push_back(record);
        ++batch.summary.imported;
    }

    // Последовательные id записей
    for (std::size_t i = 0; i < batch.records.size(); ++i) {
        batch.records[i] = batch.records[i].withId(static_cast<int>(i + 1));
    }

    restoreMissingTransfers(batch.records, batch.transfers, options.baseCurrency, batch.summary);

    for (const auto& issue : collectTransferIntegrityIssues(batch.records, batch.transfers)) {
        skip(batch.summary, issue.message);
    }

    return batch;
}

void ImportBatch::restoreMissingTransfers(
    const std::vector<Record>& records,
    std::vector<Transfer>& transfers,
    std::string_view baseCurrency,
    ImportSummary& summary)
{
    std::set<int> known;
    for (const auto& t : transfers) {
        known.insert(t.id());
    }

    std::map<int, std::vector<const Record*>> legs;
    for (const auto& r : records) {
        if (r.transferId() && !known.contains(*r.transferId())) {
            legs[*r.transferId()].push_back(&r);
        }
    }

    for (const auto& [transferId, linked] : legs) {
        const Record* expense = nullptr;
        const Record* income = nullptr;
        for (const Record* r : linked) {
            if (r->type() == RecordType::Expense && !expense) {
                expense = r;
            } else if (r->type() == RecordType::Income && !income) {
                income = r;
            }
        }
        // Неполную пару отметит проверка целостности
        if (!expense || !income || !expense->date()) {
            continue;
        }

        TransferDraft draft;
        draft.id = transferId;
        draft.fromWalletId = expense->walletId();
        draft.toWalletId = income->walletId();
        draft.date = *expense->date();
        draft.amountOriginal = expense->amountOriginal();
        draft.currency = expense->currency();
        draft.amountKzt = expense->amountKzt();
        draft.description = expense->description();

        auto transfer = Transfer::create(draft, baseCurrency);
        if (!transfer) {
            skip(summary, "Transfer #" + std::to_string(transferId)
                + ": cannot restore from legs (" + transfer.error().message + ")");
            continue;
        }
        transfers.push_back(*transfer);
    }

    std::sort(transfers.begin(), transfers.end(),
        [](const Transfer& a, const Transfer& b) { return a.id() < b.id(); });
}

// ═════════════════════════════════════════════════════════════════════════════
// Шаблоны обязательных расходов
// ═════════════════════════════════════════════════════════════════════════════

Expected<MandatoryBatch> ImportBatch::parseMandatoryExpenses(
    const std::vector<ImportRow>& rows,
    const ImportBatchOptions& options)
{
    auto limit = checkRowLimit(rows.size(), options.maxRows);
    if (!limit) {
        return std::unexpected(limit.error());
    }

    ImportRowParser parser(ParserOptions{
        options.policy, options.rates, options.baseCurrency, true});

    MandatoryBatch batch;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const std::string label = rowLabel(i);
        if (ImportRowParser::isBlankRow(rows[i])) {
            continue;
        }

        auto outcome = parser.parseRow(rows[i], label);
        if (auto* error = std::get_if<RowError>(&outcome)) {
            skip(batch.summary, error->message);
            continue;
        }
        if (std::holds_alternative<InitialBalanceRow>(outcome)) {
            skip(batch.summary, label + ": unsupported type 'initial_balance'");
            continue;
        }

        const Record& expense = std::get<Record>(outcome);
        if (!walletKnown(options, expense.walletId())) {
            skip(batch.summary, label + ": wallet not found ("
                + std::to_string(expense.walletId()) + ")");
            continue;
        }
        batch.expenses.push_back(expense.withId(static_cast<int>(batch.expenses.size() + 1)));
        ++batch.summary.imported;
    }
    return batch;
}

// ═════════════════════════════════════════════════════════════════════════════
// Экспорт
// ═════════════════════════════════════════════════════════════════════════════

std::vector<ImportRow> ImportBatch::exportRows(const LedgerSnapshot& snapshot) {
    std::vector<ImportRow> rows;

    auto system = std::find_if(snapshot.wallets.begin(), snapshot.wallets.end(),
        [](const Wallet& w) { return w.isSystem(); });
    if (system == snapshot.wallets.end()) {
        system = std::find_if(snapshot.wallets.begin(), snapshot.wallets.end(),
            [](const Wallet& w) { return w.id() == kSystemWalletId; });
    }
    if (system != snapshot.wallets.end()) {
        rows.push_back({
            {"type", "initial_balance"},
            {"amount_original", formatNumber(system->initialBalance())},
        });
    }

    for (const auto& record : snapshot.records) {
        if (record.isTransferLeg()) {
            continue;
        }
        ImportRow row{
            {"date", record.date() ? formatDate(*record.date()) : std::string{}},
            {"type", std::string(toString(record.type()))},
            {"wallet_id", std::to_string(record.walletId())},
            {"category", record.category()},
            {"amount_original", formatNumber(record.amountOriginal())},
            {"currency", record.currency()},
            {"rate_at_operation", formatNumber(record.rateAtOperation())},
            {"amount_kzt", formatNumber(record.amountKzt())},
            {"description", record.description()},
            {"period", record.period() ? std::string(toString(*record.period())) : std::string{}},
        };
        if (record.commissionForTransferId()) {
            row["commission_for_transfer_id"] = std::to_string(*record.commissionForTransferId());
        }
        rows.push_back(std::move(row));
    }

    for (const auto& transfer : snapshot.transfers) {
        rows.push_back({
            {"date", formatDate(transfer.date())},
            {"type", "transfer"},
            {"category", std::string(kTransferCategory)},
            {"amount_original", formatNumber(transfer.amountOriginal())},
            {"currency", transfer.currency()},
            {"rate_at_operation", formatNumber(transfer.rateAtOperation())},
            {"amount_kzt", formatNumber(transfer.amountKzt())},
            {"description", transfer.description()},
            {"transfer_id", std::to_string(transfer.id())},
            {"from_wallet_id", std::to_string(transfer.fromWalletId())},
            {"to_wallet_id", std::to_string(transfer.toWalletId())},
        });
    }

    return rows;
}

std::vector<ImportRow> ImportBatch::exportMandatoryRows(const std::vector<Record>& expenses) {
    std::vector<ImportRow> rows;
    for (const auto& expense : expenses) {
        rows.push_back({
            {"date", expense.date() ? formatDate(*expense.date()) : std::string{}},
            {"type", "mandatory_expense"},
            {"wallet_id", std::to_string(expense.walletId())},
            {"category", expense.category()},
            {"amount_original", formatNumber(expense.amountOriginal())},
            {"currency", expense.currency()},
            {"rate_at_operation", formatNumber(expense.rateAtOperation())},
            {"amount_kzt", formatNumber(expense.amountKzt())},
            {"description", expense.description()},
            {"period", expense.period() ? std::string(toString(*expense.period())) : "monthly"},
        });
    }
    return rows;
}

} // namespace ledger
