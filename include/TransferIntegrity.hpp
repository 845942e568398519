// include/TransferIntegrity.hpp
#pragma once

#include "LedgerError.hpp"
#include "Record.hpp"
#include "Transfer.hpp"
#include <vector>

namespace ledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Проверка двойной записи переводов
// ═══════════════════════════════════════════════════════════════════════════════
//
// Для каждого перевода T ровно две записи с transfer_id == T.id:
// expense на from_wallet и income на to_wallet, с одинаковыми
// amount_original / currency / rate. Ссылки transfer_id и
// commission_for_transfer_id должны указывать на существующие переводы.

Result validateTransferIntegrity(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers);

// Все нарушения, а не только первое (для сводки импорта)
std::vector<Error> collectTransferIntegrityIssues(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers);

} // namespace ledger
