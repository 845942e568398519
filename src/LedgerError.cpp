#include "LedgerError.hpp"

namespace ledger {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:           return "validation";
        case ErrorKind::DanglingTransferLink: return "dangling transfer link";
        case ErrorKind::BrokenTransferPair:   return "broken transfer pair";
        case ErrorKind::NotFound:             return "not found";
        case ErrorKind::Domain:               return "domain";
        case ErrorKind::InsufficientFunds:    return "insufficient funds";
        case ErrorKind::Storage:              return "storage";
        case ErrorKind::Migration:            return "migration";
    }
    return "unknown";
}

} // namespace ledger
