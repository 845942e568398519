#include "SQLiteStorage.hpp"
#include "TransferIntegrity.hpp"
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace ledger {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void bindText(sqlite3_stmt* stmt, int index, std::string_view value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bindOptionalInt(sqlite3_stmt* stmt, int index, const std::optional<int>& value) {
    if (value) {
        sqlite3_bind_int(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string columnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::optional<int> columnOptionalInt(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, index);
}

std::string dateText(const std::optional<Date>& date) {
    return date ? formatDate(*date) : std::string{};
}

} // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteStorage::SQLiteStorage(
    std::string_view dbPath,
    std::string baseCurrency,
    bool createSchema)
    : dbPath_(dbPath)
    , baseCurrency_(std::move(baseCurrency))
{
    auto result = initializeDatabase(createSchema);
    if (!result) {
        throw std::runtime_error("Failed to initialize database: " + result.error().message);
    }
}

SQLiteStorage::~SQLiteStorage() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Error SQLiteStorage::sqliteError(const std::string& what) const {
    return Error{ErrorKind::Storage, what + ": " + std::string(sqlite3_errmsg(db_))};
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteStorage::initializeDatabase(bool createSchema) {
    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return makeError(ErrorKind::Storage, error);
    }

    // Ошибка после открытия: соединение закрывается, деструктор не вызовется
    auto closeOnFailure = [this](Result result) {
        if (!result) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return result;
    };

    // Включаем поддержку внешних ключей
    auto fk = execute("PRAGMA foreign_keys = ON");
    if (!fk) {
        return closeOnFailure(fk);
    }

    if (!createSchema) {
        return {};
    }

    auto wal = execute("PRAGMA journal_mode = WAL");
    if (!wal) {
        return closeOnFailure(wal);
    }

    return closeOnFailure(createTables());
}

Result SQLiteStorage::createTables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS wallets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL CHECK(length(trim(name)) > 0),
            currency TEXT NOT NULL CHECK(length(trim(currency)) = 3),
            initial_balance REAL NOT NULL DEFAULT 0 CHECK(initial_balance >= 0),
            system INTEGER NOT NULL DEFAULT 0 CHECK(system IN (0, 1)),
            allow_negative INTEGER NOT NULL DEFAULT 0 CHECK(allow_negative IN (0, 1)),
            is_active INTEGER NOT NULL DEFAULT 1 CHECK(is_active IN (0, 1))
        );

        CREATE TABLE IF NOT EXISTS transfers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            from_wallet_id INTEGER NOT NULL,
            to_wallet_id INTEGER NOT NULL,
            date TEXT NOT NULL CHECK(length(date) = 10),
            amount_original REAL NOT NULL CHECK(amount_original > 0),
            currency TEXT NOT NULL CHECK(length(trim(currency)) = 3),
            rate_at_operation REAL NOT NULL CHECK(rate_at_operation > 0),
            amount_kzt REAL NOT NULL CHECK(amount_kzt > 0),
            description TEXT NOT NULL DEFAULT '',
            FOREIGN KEY(from_wallet_id) REFERENCES wallets(id) ON UPDATE CASCADE ON DELETE RESTRICT,
            FOREIGN KEY(to_wallet_id) REFERENCES wallets(id) ON UPDATE CASCADE ON DELETE RESTRICT,
            CHECK(from_wallet_id <> to_wallet_id)
        );

        -- Записи: commission_for_transfer_id связывает комиссию с переводом
        CREATE TABLE IF NOT EXISTS records (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL CHECK(type IN ('income', 'expense', 'mandatory_expense')),
            date TEXT NOT NULL CHECK(length(date) = 10),
            wallet_id INTEGER NOT NULL,
            transfer_id INTEGER,
            commission_for_transfer_id INTEGER,
            amount_original REAL NOT NULL CHECK(amount_original >= 0),
            currency TEXT NOT NULL CHECK(length(trim(currency)) = 3),
            rate_at_operation REAL NOT NULL CHECK(rate_at_operation > 0),
            amount_kzt REAL NOT NULL CHECK(amount_kzt >= 0),
            category TEXT NOT NULL CHECK(length(trim(category)) > 0),
            description TEXT NOT NULL DEFAULT '',
            period TEXT CHECK(period IN ('daily', 'weekly', 'monthly', 'yearly') OR period IS NULL),
            FOREIGN KEY(wallet_id) REFERENCES wallets(id) ON UPDATE CASCADE ON DELETE RESTRICT,
            FOREIGN KEY(transfer_id) REFERENCES transfers(id) ON UPDATE CASCADE ON DELETE SET NULL,
            FOREIGN KEY(commission_for_transfer_id) REFERENCES transfers(id) ON UPDATE CASCADE ON DELETE SET NULL,
            CHECK(transfer_id IS NULL OR commission_for_transfer_id IS NULL)
        );

        -- Шаблоны обязательных расходов (дата может быть пустой)
        CREATE TABLE IF NOT EXISTS mandatory_expenses (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            date TEXT NOT NULL DEFAULT '',
            wallet_id INTEGER NOT NULL,
            amount_original REAL NOT NULL CHECK(amount_original >= 0),
            currency TEXT NOT NULL CHECK(length(trim(currency)) = 3),
            rate_at_operation REAL NOT NULL CHECK(rate_at_operation > 0),
            amount_kzt REAL NOT NULL CHECK(amount_kzt >= 0),
            category TEXT NOT NULL CHECK(length(trim(category)) > 0),
            description TEXT NOT NULL DEFAULT '',
            period TEXT NOT NULL CHECK(period IN ('daily', 'weekly', 'monthly', 'yearly')),
            FOREIGN KEY(wallet_id) REFERENCES wallets(id) ON UPDATE CASCADE ON DELETE RESTRICT
        );

        -- Индексы для оптимизации
        CREATE INDEX IF NOT EXISTS idx_records_date ON records(date);
        CREATE INDEX IF NOT EXISTS idx_records_wallet_id ON records(wallet_id);
        CREATE INDEX IF NOT EXISTS idx_records_transfer_id ON records(transfer_id);
        CREATE INDEX IF NOT EXISTS idx_transfers_date ON transfers(date);
        CREATE INDEX IF NOT EXISTS idx_transfers_wallet_from ON transfers(from_wallet_id);
        CREATE INDEX IF NOT EXISTS idx_transfers_wallet_to ON transfers(to_wallet_id);
        CREATE INDEX IF NOT EXISTS idx_mandatory_expenses_date ON mandatory_expenses(date);
        CREATE INDEX IF NOT EXISTS idx_mandatory_expenses_wallet_id ON mandatory_expenses(wallet_id);
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return makeError(ErrorKind::Storage, "Failed to create tables: " + error);
    }

    return {};
}

Result SQLiteStorage::execute(std::string_view sql) {
    std::string statement(sql);
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return makeError(ErrorKind::Storage, "SQL error: " + error);
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Схема из файла
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteStorage::applySchemaFile(const std::filesystem::path& schemaPath) {
    std::ifstream file(schemaPath);
    if (!file.is_open()) {
        return makeError(ErrorKind::Migration,
            "Schema file not found: " + schemaPath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = execute(buffer.str());
    if (!result) {
        return makeError(ErrorKind::Migration,
            "Failed to apply schema: " + result.error().message);
    }
    return {};
}

Result SQLiteStorage::checkSchemaFile(const std::filesystem::path& schemaPath) {
    auto begin = beginTransaction();
    if (!begin) {
        return begin;
    }

    auto applied = applySchemaFile(schemaPath);
    auto rolledBack = rollbackTransaction();

    if (!applied) {
        return applied;
    }
    return rolledBack;
}

// ═════════════════════════════════════════════════════════════════════════════
// Транзакции
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteStorage::beginTransaction() {
    return execute("BEGIN TRANSACTION");
}

Result SQLiteStorage::commitTransaction() {
    return execute("COMMIT");
}

Result SQLiteStorage::rollbackTransaction() {
    return execute("ROLLBACK");
}

SQLiteTransaction::SQLiteTransaction(SQLiteStorage& storage)
    : storage_(storage)
{
    auto result = storage_.beginTransaction();
    if (!result) {
        throw std::runtime_error("Failed to begin transaction: " + result.error().message);
    }
    active_ = true;
}

SQLiteTransaction::~SQLiteTransaction() {
    if (active_) {
        // Ошибку отката из деструктора передать некуда
        [[maybe_unused]] auto result = storage_.rollbackTransaction();
    }
}

Result SQLiteTransaction::commit() {
    if (!active_) {
        return makeError(ErrorKind::Storage, "Transaction is not active");
    }
    auto result = storage_.commitTransaction();
    if (!result) {
        return result;
    }
    active_ = false;
    return {};
}

Result SQLiteTransaction::rollback() {
    if (!active_) {
        return {};
    }
    active_ = false;
    return storage_.rollbackTransaction();
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение таблиц
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Wallet>> SQLiteStorage::readWallets() {
    const char* sql =
        "SELECT id, name, currency, initial_balance, system, allow_negative, is_active "
        "FROM wallets ORDER BY id";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare wallets select"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    std::vector<Wallet> wallets;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto wallet = Wallet::create(
            sqlite3_column_int(stmt.get(), 0),
            columnText(stmt.get(), 1),
            columnText(stmt.get(), 2),
            sqlite3_column_double(stmt.get(), 3),
            sqlite3_column_int(stmt.get(), 4) != 0,
            sqlite3_column_int(stmt.get(), 5) != 0,
            sqlite3_column_int(stmt.get(), 6) != 0);
        if (!wallet) {
            return std::unexpected(wallet.error());
        }
        wallets.push_back(*wallet);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read wallets"));
    }
    return wallets;
}

Expected<std::vector<Record>> SQLiteStorage::readRecords() {
    const char* sql =
        "SELECT id, type, date, wallet_id, transfer_id, commission_for_transfer_id, "
        "amount_original, currency, rate_at_operation, amount_kzt, category, description, period "
        "FROM records ORDER BY id";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare records select"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    std::vector<Record> records;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        RecordDraft draft;
        draft.id = sqlite3_column_int(s, 0);

        auto type = parseRecordType(columnText(s, 1));
        if (!type) {
            return std::unexpected(type.error());
        }
        draft.type = *type;

        auto date = parseDate(columnText(s, 2));
        if (!date) {
            return std::unexpected(date.error());
        }
        draft.date = *date;

        draft.walletId = sqlite3_column_int(s, 3);
        draft.transferId = columnOptionalInt(s, 4);
        draft.commissionForTransferId = columnOptionalInt(s, 5);
        draft.amountOriginal = sqlite3_column_double(s, 6);
        draft.currency = columnText(s, 7);
        draft.amountKzt = sqlite3_column_double(s, 9);
        draft.category = columnText(s, 10);
        draft.description = columnText(s, 11);

        if (sqlite3_column_type(s, 12) != SQLITE_NULL) {
            auto period = parsePeriod(columnText(s, 12));
            if (!period) {
                return std::unexpected(period.error());
            }
            draft.period = *period;
        }

        auto record = Record::create(draft, baseCurrency_);
        if (!record) {
            return std::unexpected(Error{record.error().kind,
                "record #" + std::to_string(draft.id) + ": " + record.error().message});
        }
        records.push_back(*record);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read records"));
    }
    return records;
}

Expected<std::vector<Record>> SQLiteStorage::readMandatoryExpenses() {
    const char* sql =
        "SELECT id, date, wallet_id, amount_original, currency, rate_at_operation, "
        "amount_kzt, category, description, period "
        "FROM mandatory_expenses ORDER BY id";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare mandatory expenses select"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    std::vector<Record> templates;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        RecordDraft draft;
        draft.type = RecordType::MandatoryExpense;
        draft.id = sqlite3_column_int(s, 0);

        std::string date = columnText(s, 1);
        if (!date.empty()) {
            auto parsed = parseDate(date);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            draft.date = *parsed;
        }

        draft.walletId = sqlite3_column_int(s, 2);
        draft.amountOriginal = sqlite3_column_double(s, 3);
        draft.currency = columnText(s, 4);
        draft.amountKzt = sqlite3_column_double(s, 6);
        draft.category = columnText(s, 7);
        draft.description = columnText(s, 8);

        auto period = parsePeriod(columnText(s, 9));
        if (!period) {
            return std::unexpected(period.error());
        }
        draft.period = *period;

        auto record = Record::create(draft, baseCurrency_);
        if (!record) {
            return std::unexpected(record.error());
        }
        templates.push_back(*record);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read mandatory expenses"));
    }
    return templates;
}

Expected<std::vector<Transfer>> SQLiteStorage::readTransfers() {
    const char* sql =
        "SELECT id, from_wallet_id, to_wallet_id, date, amount_original, currency, "
        "rate_at_operation, amount_kzt, description "
        "FROM transfers ORDER BY id";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare transfers select"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    std::vector<Transfer> transfers;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        auto date = parseDate(columnText(s, 3));
        if (!date) {
            return std::unexpected(date.error());
        }

        TransferDraft draft;
        draft.id = sqlite3_column_int(s, 0);
        draft.fromWalletId = sqlite3_column_int(s, 1);
        draft.toWalletId = sqlite3_column_int(s, 2);
        draft.date = *date;
        draft.amountOriginal = sqlite3_column_double(s, 4);
        draft.currency = columnText(s, 5);
        draft.amountKzt = sqlite3_column_double(s, 7);
        draft.description = columnText(s, 8);

        auto transfer = Transfer::create(draft, baseCurrency_);
        if (!transfer) {
            return std::unexpected(transfer.error());
        }
        transfers.push_back(*transfer);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to read transfers"));
    }
    return transfers;
}

Expected<LedgerSnapshot> SQLiteStorage::readAll() {
    LedgerSnapshot snapshot;

    auto wallets = readWallets();
    if (!wallets) {
        return std::unexpected(wallets.error());
    }
    auto records = readRecords();
    if (!records) {
        return std::unexpected(records.error());
    }
    auto templates = readMandatoryExpenses();
    if (!templates) {
        return std::unexpected(templates.error());
    }
    auto transfers = readTransfers();
    if (!transfers) {
        return std::unexpected(transfers.error());
    }

    auto integrity = validateTransferIntegrity(*records, *transfers);
    if (!integrity) {
        return std::unexpected(integrity.error());
    }

    snapshot.wallets = std::move(*wallets);
    snapshot.records = std::move(*records);
    snapshot.mandatoryExpenses = std::move(*templates);
    snapshot.transfers = std::move(*transfers);
    return snapshot;
}

// ═════════════════════════════════════════════════════════════════════════════
// Построчная вставка
// ═════════════════════════════════════════════════════════════════════════════

Expected<int> SQLiteStorage::insertWallet(const Wallet& wallet, bool preserveId) {
    const char* sql = preserveId
        ? "INSERT INTO wallets (name, currency, initial_balance, system, allow_negative, "
          "is_active, id) VALUES (?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO wallets (name, currency, initial_balance, system, allow_negative, "
          "is_active) VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare wallet insert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    bindText(raw, 1, wallet.name());
    bindText(raw, 2, wallet.currency());
    sqlite3_bind_double(raw, 3, wallet.initialBalance());
    sqlite3_bind_int(raw, 4, wallet.isSystem() ? 1 : 0);
    sqlite3_bind_int(raw, 5, wallet.allowNegative() ? 1 : 0);
    sqlite3_bind_int(raw, 6, wallet.isActive() ? 1 : 0);
    if (preserveId) {
        sqlite3_bind_int(raw, 7, wallet.id());
    }

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError(
            "Failed to insert wallet #" + std::to_string(wallet.id())));
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db_));
}

Expected<int> SQLiteStorage::insertTransfer(const Transfer& transfer, bool preserveId) {
    const char* sql = preserveId
        ? "INSERT INTO transfers (from_wallet_id, to_wallet_id, date, amount_original, currency, "
          "rate_at_operation, amount_kzt, description, id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO transfers (from_wallet_id, to_wallet_id, date, amount_original, currency, "
          "rate_at_operation, amount_kzt, description) VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare transfer insert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_int(raw, 1, transfer.fromWalletId());
    sqlite3_bind_int(raw, 2, transfer.toWalletId());
    bindText(raw, 3, formatDate(transfer.date()));
    sqlite3_bind_double(raw, 4, transfer.amountOriginal());
    bindText(raw, 5, transfer.currency());
    sqlite3_bind_double(raw, 6, transfer.rateAtOperation());
    sqlite3_bind_double(raw, 7, transfer.amountKzt());
    bindText(raw, 8, transfer.description());
    if (preserveId) {
        sqlite3_bind_int(raw, 9, transfer.id());
    }

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError(
            "Failed to insert transfer #" + std::to_string(transfer.id())));
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db_));
}

Expected<int> SQLiteStorage::insertRecord(const Record& record, bool preserveId) {
    const char* sql = preserveId
        ? "INSERT INTO records (type, date, wallet_id, transfer_id, commission_for_transfer_id, "
          "amount_original, currency, rate_at_operation, amount_kzt, category, description, "
          "period, id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO records (type, date, wallet_id, transfer_id, commission_for_transfer_id, "
          "amount_original, currency, rate_at_operation, amount_kzt, category, description, "
          "period) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare record insert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    bindText(raw, 1, toString(record.type()));
    bindText(raw, 2, dateText(record.date()));
    sqlite3_bind_int(raw, 3, record.walletId());
    bindOptionalInt(raw, 4, record.transferId());
    bindOptionalInt(raw, 5, record.commissionForTransferId());
    sqlite3_bind_double(raw, 6, record.amountOriginal());
    bindText(raw, 7, record.currency());
    sqlite3_bind_double(raw, 8, record.rateAtOperation());
    sqlite3_bind_double(raw, 9, record.amountKzt());
    bindText(raw, 10, record.category());
    bindText(raw, 11, record.description());
    if (record.period()) {
        bindText(raw, 12, toString(*record.period()));
    } else {
        sqlite3_bind_null(raw, 12);
    }
    if (preserveId) {
        sqlite3_bind_int(raw, 13, record.id());
    }

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError(
            "Failed to insert record #" + std::to_string(record.id())));
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db_));
}

Expected<int> SQLiteStorage::insertMandatoryExpense(const Record& expense, bool preserveId) {
    if (!expense.period()) {
        return makeError(ErrorKind::Validation,
            "Mandatory expense #" + std::to_string(expense.id()) + " has no period");
    }

    const char* sql = preserveId
        ? "INSERT INTO mandatory_expenses (date, wallet_id, amount_original, currency, "
          "rate_at_operation, amount_kzt, category, description, period, id) "
          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        : "INSERT INTO mandatory_expenses (date, wallet_id, amount_original, currency, "
          "rate_at_operation, amount_kzt, category, description, period) "
          "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare mandatory expense insert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    bindText(raw, 1, dateText(expense.date()));
    sqlite3_bind_int(raw, 2, expense.walletId());
    sqlite3_bind_double(raw, 3, expense.amountOriginal());
    bindText(raw, 4, expense.currency());
    sqlite3_bind_double(raw, 5, expense.rateAtOperation());
    sqlite3_bind_double(raw, 6, expense.amountKzt());
    bindText(raw, 7, expense.category());
    bindText(raw, 8, expense.description());
    bindText(raw, 9, toString(*expense.period()));
    if (preserveId) {
        sqlite3_bind_int(raw, 10, expense.id());
    }

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError(
            "Failed to insert mandatory expense #" + std::to_string(expense.id())));
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db_));
}

Result SQLiteStorage::syncSequence(std::string_view table) {
    std::string name(table);
    std::string maxId = "(SELECT COALESCE(MAX(id), 0) FROM " + name + ")";

    auto updated = execute(
        "UPDATE sqlite_sequence SET seq = " + maxId + " WHERE name = '" + name + "'");
    if (!updated) {
        return updated;
    }
    if (sqlite3_changes(db_) > 0) {
        return {};
    }
    return execute(
        "INSERT INTO sqlite_sequence (name, seq) VALUES ('" + name + "', " + maxId + ")");
}

// ═════════════════════════════════════════════════════════════════════════════
// Агрегаты средствами SQL
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::size_t> SQLiteStorage::countRows(std::string_view table) {
    std::string sql = "SELECT COUNT(*) FROM " + std::string(table);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to count " + std::string(table)));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    if (sqlite3_step(raw) != SQLITE_ROW) {
        return std::unexpected(sqliteError("Failed to count " + std::string(table)));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(raw, 0));
}

Expected<TableCounts> SQLiteStorage::tableCounts() {
    TableCounts counts;

    auto wallets = countRows("wallets");
    if (!wallets) return std::unexpected(wallets.error());
    auto records = countRows("records");
    if (!records) return std::unexpected(records.error());
    auto transfers = countRows("transfers");
    if (!transfers) return std::unexpected(transfers.error());
    auto templates = countRows("mandatory_expenses");
    if (!templates) return std::unexpected(templates.error());

    counts.wallets = *wallets;
    counts.records = *records;
    counts.transfers = *transfers;
    counts.mandatoryExpenses = *templates;
    return counts;
}

Expected<std::map<int, double>> SQLiteStorage::queryWalletBalances() {
    const char* sql = R"(
        SELECT w.id,
               w.initial_balance + COALESCE(SUM(
                   CASE WHEN r.type = 'income' THEN r.amount_kzt
                        ELSE -ABS(r.amount_kzt) END), 0)
        FROM wallets w
        LEFT JOIN records r ON r.wallet_id = w.id
        GROUP BY w.id
        ORDER BY w.id
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare balance query"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    std::map<int, double> balances;
    int rc;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        balances[sqlite3_column_int(raw, 0)] = sqlite3_column_double(raw, 1);
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to compute wallet balances"));
    }
    return balances;
}

Expected<double> SQLiteStorage::queryNetWorth() {
    auto balances = queryWalletBalances();
    if (!balances) {
        return std::unexpected(balances.error());
    }
    double total = 0.0;
    for (const auto& [id, balance] : *balances) {
        total += balance;
    }
    return total;
}

Expected<bool> SQLiteStorage::hasAnyData() {
    auto counts = tableCounts();
    if (!counts) {
        return std::unexpected(counts.error());
    }
    return counts->wallets + counts->records + counts->transfers + counts->mandatoryExpenses > 0;
}

// ═════════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════════

Expected<int> SQLiteStorage::recordIdAt(std::string_view table, std::size_t index) {
    std::string sql = "SELECT id FROM " + std::string(table) + " ORDER BY id LIMIT 1 OFFSET ?";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare index lookup"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);
    sqlite3_bind_int64(raw, 1, static_cast<sqlite3_int64>(index));

    int rc = sqlite3_step(raw);
    if (rc == SQLITE_ROW) {
        return sqlite3_column_int(raw, 0);
    }
    if (rc == SQLITE_DONE) {
        return 0;
    }
    return std::unexpected(sqliteError("Failed to look up row by index"));
}

Expected<bool> SQLiteStorage::rowExists(std::string_view table, int id) {
    std::string sql = "SELECT 1 FROM " + std::string(table) + " WHERE id = ?";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare existence check"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);
    sqlite3_bind_int(raw, 1, id);

    int rc = sqlite3_step(raw);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return std::unexpected(sqliteError("Failed to check row existence"));
}

Result SQLiteStorage::clearRecordsAndTransfers() {
    auto records = execute("DELETE FROM records");
    if (!records) {
        return records;
    }
    return execute("DELETE FROM transfers");
}

// ═════════════════════════════════════════════════════════════════════════════
// Кошельки
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Wallet>> SQLiteStorage::loadWallets() {
    auto snapshot = readAll();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->wallets;
}

Result SQLiteStorage::saveWallet(const Wallet& wallet) {
    const char* sql = R"(
        INSERT INTO wallets (id, name, currency, initial_balance, system, allow_negative, is_active)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            currency = excluded.currency,
            initial_balance = excluded.initial_balance,
            system = excluded.system,
            allow_negative = excluded.allow_negative,
            is_active = excluded.is_active
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare wallet upsert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_int(raw, 1, wallet.id());
    bindText(raw, 2, wallet.name());
    bindText(raw, 3, wallet.currency());
    sqlite3_bind_double(raw, 4, wallet.initialBalance());
    sqlite3_bind_int(raw, 5, wallet.isSystem() ? 1 : 0);
    sqlite3_bind_int(raw, 6, wallet.allowNegative() ? 1 : 0);
    sqlite3_bind_int(raw, 7, wallet.isActive() ? 1 : 0);

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to save wallet #" + std::to_string(wallet.id())));
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Записи
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Record>> SQLiteStorage::loadAll() {
    auto snapshot = readAll();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->records;
}

Expected<Record> SQLiteStorage::save(const Record& record) {
    bool preserveId = false;
    if (record.id() > 0) {
        auto exists = rowExists("records", record.id());
        if (!exists) {
            return std::unexpected(exists.error());
        }
        preserveId = !*exists;
    }

    auto id = insertRecord(record, preserveId);
    if (!id) {
        return std::unexpected(id.error());
    }
    return record.withId(*id);
}

Result SQLiteStorage::replace(const Record& record) {
    const char* sql = R"(
        UPDATE records SET
            type = ?, date = ?, wallet_id = ?, transfer_id = ?, commission_for_transfer_id = ?,
            amount_original = ?, currency = ?, rate_at_operation = ?, amount_kzt = ?,
            category = ?, description = ?, period = ?
        WHERE id = ?
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare record update"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    bindText(raw, 1, toString(record.type()));
    bindText(raw, 2, dateText(record.date()));
    sqlite3_bind_int(raw, 3, record.walletId());
    bindOptionalInt(raw, 4, record.transferId());
    bindOptionalInt(raw, 5, record.commissionForTransferId());
    sqlite3_bind_double(raw, 6, record.amountOriginal());
    bindText(raw, 7, record.currency());
    sqlite3_bind_double(raw, 8, record.rateAtOperation());
    sqlite3_bind_double(raw, 9, record.amountKzt());
    bindText(raw, 10, record.category());
    bindText(raw, 11, record.description());
    if (record.period()) {
        bindText(raw, 12, toString(*record.period()));
    } else {
        sqlite3_bind_null(raw, 12);
    }
    sqlite3_bind_int(raw, 13, record.id());

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError("Failed to update record #" + std::to_string(record.id())));
    }
    if (sqlite3_changes(db_) == 0) {
        return makeError(ErrorKind::NotFound,
            "Record not found: #" + std::to_string(record.id()));
    }
    return {};
}

Expected<bool> SQLiteStorage::deleteByIndex(std::size_t index) {
    auto id = recordIdAt("records", index);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (*id == 0) {
        return false;
    }

    auto result = execute("DELETE FROM records WHERE id = " + std::to_string(*id));
    if (!result) {
        return std::unexpected(result.error());
    }
    return true;
}

Result SQLiteStorage::deleteAll() {
    try {
        SQLiteTransaction tx(*this);
        auto cleared = clearRecordsAndTransfers();
        if (!cleared) {
            return cleared;
        }
        return tx.commit();
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage, e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Переводы
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Transfer>> SQLiteStorage::loadTransfers() {
    auto snapshot = readAll();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->transfers;
}

Result SQLiteStorage::saveTransfer(const Transfer& transfer) {
    const char* sql = R"(
        INSERT INTO transfers (id, from_wallet_id, to_wallet_id, date, amount_original,
                               currency, rate_at_operation, amount_kzt, description)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            from_wallet_id = excluded.from_wallet_id,
            to_wallet_id = excluded.to_wallet_id,
            date = excluded.date,
            amount_original = excluded.amount_original,
            currency = excluded.currency,
            rate_at_operation = excluded.rate_at_operation,
            amount_kzt = excluded.amount_kzt,
            description = excluded.description
    )";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        return std::unexpected(sqliteError("Failed to prepare transfer upsert"));
    }
    StatementPtr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_int(raw, 1, transfer.id());
    sqlite3_bind_int(raw, 2, transfer.fromWalletId());
    sqlite3_bind_int(raw, 3, transfer.toWalletId());
    bindText(raw, 4, formatDate(transfer.date()));
    sqlite3_bind_double(raw, 5, transfer.amountOriginal());
    bindText(raw, 6, transfer.currency());
    sqlite3_bind_double(raw, 7, transfer.rateAtOperation());
    sqlite3_bind_double(raw, 8, transfer.amountKzt());
    bindText(raw, 9, transfer.description());

    if (sqlite3_step(raw) != SQLITE_DONE) {
        return std::unexpected(sqliteError(
            "Failed to save transfer #" + std::to_string(transfer.id())));
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Шаблоны обязательных расходов
// ═════════════════════════════════════════════════════════════════════════════

Expected<std::vector<Record>> SQLiteStorage::loadMandatoryExpenses() {
    auto snapshot = readAll();
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }
    return snapshot->mandatoryExpenses;
}

Expected<Record> SQLiteStorage::saveMandatoryExpense(const Record& expense) {
    if (expense.type() != RecordType::MandatoryExpense) {
        return makeError(ErrorKind::Validation,
            "Only mandatory expense records can be saved as templates");
    }

    auto id = insertMandatoryExpense(expense, false);
    if (!id) {
        return std::unexpected(id.error());
    }
    return expense.withId(*id);
}

Expected<bool> SQLiteStorage::deleteMandatoryExpenseByIndex(std::size_t index) {
    auto id = recordIdAt("mandatory_expenses", index);
    if (!id) {
        return std::unexpected(id.error());
    }
    if (*id == 0) {
        return false;
    }

    auto result = execute("DELETE FROM mandatory_expenses WHERE id = " + std::to_string(*id));
    if (!result) {
        return std::unexpected(result.error());
    }
    return true;
}

Result SQLiteStorage::deleteAllMandatoryExpenses() {
    return execute("DELETE FROM mandatory_expenses");
}

// ═════════════════════════════════════════════════════════════════════════════
// Массовые операции
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteStorage::replaceRecordsAndTransfers(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers)
{
    auto integrity = validateTransferIntegrity(records, transfers);
    if (!integrity) {
        return integrity;
    }

    try {
        SQLiteTransaction tx(*this);

        auto cleared = clearRecordsAndTransfers();
        if (!cleared) {
            return cleared;
        }

        for (const auto& transfer : transfers) {
            auto id = insertTransfer(transfer, true);
            if (!id) {
                return std::unexpected(id.error());
            }
        }
        for (const auto& record : records) {
            auto id = insertRecord(record, record.id() > 0);
            if (!id) {
                return std::unexpected(id.error());
            }
        }

        return tx.commit();
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage, e.what());
    }
}

Result SQLiteStorage::replaceAllData(const LedgerSnapshot& snapshot) {
    auto integrity = validateTransferIntegrity(snapshot.records, snapshot.transfers);
    if (!integrity) {
        return integrity;
    }

    try {
        SQLiteTransaction tx(*this);

        // Сначала зависимые таблицы
        for (const char* sql : {"DELETE FROM records", "DELETE FROM mandatory_expenses",
                                "DELETE FROM transfers", "DELETE FROM wallets"}) {
            auto result = execute(sql);
            if (!result) {
                return result;
            }
        }

        for (const auto& wallet : snapshot.wallets) {
            auto id = insertWallet(wallet, true);
            if (!id) {
                return std::unexpected(id.error());
            }
        }
        for (const auto& transfer : snapshot.transfers) {
            auto id = insertTransfer(transfer, true);
            if (!id) {
                return std::unexpected(id.error());
            }
        }
        for (const auto& record : snapshot.records) {
            auto id = insertRecord(record, record.id() > 0);
            if (!id) {
                return std::unexpected(id.error());
            }
        }
        for (const auto& expense : snapshot.mandatoryExpenses) {
            auto id = insertMandatoryExpense(expense, expense.id() > 0);
            if (!id) {
                return std::unexpected(id.error());
            }
        }

        return tx.commit();
    } catch (const std::exception& e) {
        return makeError(ErrorKind::Storage, e.what());
    }
}

Expected<LedgerSnapshot> SQLiteStorage::loadSnapshot() {
    return readAll();
}

} // namespace ledger
