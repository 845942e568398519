#include "TransferIntegrity.hpp"
#include "Money.hpp"
#include <cmath>
#include <map>
#include <set>

namespace ledger {

namespace {

constexpr double kRateTolerance = 1e-6;

std::string transferTag(int transferId) {
    return "Transfer integrity violated for #" + std::to_string(transferId);
}

} // namespace

std::vector<Error> collectTransferIntegrityIssues(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers)
{
    std::vector<Error> issues;

    std::set<int> transferIds;
    for (const auto& transfer : transfers) {
        transferIds.insert(transfer.id());
    }

    // Ссылки на несуществующие переводы
    std::map<int, std::vector<const Record*>> linked;
    for (const auto& record : records) {
        if (record.transferId()) {
            if (!transferIds.contains(*record.transferId())) {
                issues.push_back({ErrorKind::DanglingTransferLink,
                    "Dangling transfer link in record #" + std::to_string(record.id())});
                continue;
            }
            linked[*record.transferId()].push_back(&record);
        }
        if (record.commissionForTransferId() &&
            !transferIds.contains(*record.commissionForTransferId())) {
            issues.push_back({ErrorKind::DanglingTransferLink,
                "Dangling commission link in record #" + std::to_string(record.id())});
        }
    }

    // Ровно income + expense на каждый перевод
    for (const auto& transfer : transfers) {
        const auto& legs = linked[transfer.id()];
        if (legs.size() != 2) {
            issues.push_back({ErrorKind::BrokenTransferPair,
                transferTag(transfer.id()) + ": " + std::to_string(legs.size()) + " records"});
            continue;
        }

        const Record* income = nullptr;
        const Record* expense = nullptr;
        for (const Record* leg : legs) {
            if (leg->type() == RecordType::Income) {
                income = leg;
            } else if (leg->type() == RecordType::Expense) {
                expense = leg;
            }
        }
        if (!income || !expense) {
            issues.push_back({ErrorKind::BrokenTransferPair,
                transferTag(transfer.id()) + ": invalid record types"});
            continue;
        }

        if (expense->walletId() != transfer.fromWalletId() ||
            income->walletId() != transfer.toWalletId()) {
            issues.push_back({ErrorKind::BrokenTransferPair,
                transferTag(transfer.id()) + ": legs do not match transfer wallets"});
            continue;
        }

        bool legsAgree =
            income->currency() == expense->currency() &&
            nearlyEqual(income->amountOriginal(), expense->amountOriginal(), kRateTolerance) &&
            nearlyEqual(income->rateAtOperation(), expense->rateAtOperation(), kRateTolerance);
        if (!legsAgree) {
            issues.push_back({ErrorKind::BrokenTransferPair,
                transferTag(transfer.id()) + ": legs disagree on amount/currency/rate"});
        }
    }

    return issues;
}

Result validateTransferIntegrity(
    const std::vector<Record>& records,
    const std::vector<Transfer>& transfers)
{
    auto issues = collectTransferIntegrityIssues(records, transfers);
    if (!issues.empty()) {
        return std::unexpected(issues.front());
    }
    return {};
}

} // namespace ledger
