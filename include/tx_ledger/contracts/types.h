#pragma once

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tx_ledger {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

// Amounts are fixed-point values scaled by 10^kAmountScale.
using Amount = std::int64_t;
constexpr int kAmountScale = 4;

enum class TransactionType {
    kDeposit,
    kWithdrawal,
    kDispute,
    kResolve,
    kChargeback,
};

struct Transaction {
    TransactionType type{TransactionType::kDeposit};
    ClientId client_id{0};
    TxId tx_id{0};
    std::optional<Amount> amount;
};

struct Account {
    ClientId client_id{0};
    Amount available{0};
    Amount held{0};
    Amount total{0};
    bool locked{false};
};

// Ordered by client id so snapshots come out in a stable order.
using AccountMap = std::map<ClientId, Account>;

inline bool IsReferenceable(TransactionType type) {
    return type == TransactionType::kDeposit || type == TransactionType::kWithdrawal;
}

inline const char* ToString(TransactionType type) {
    switch (type) {
        case TransactionType::kDeposit:
            return "deposit";
        case TransactionType::kWithdrawal:
            return "withdrawal";
        case TransactionType::kDispute:
            return "dispute";
        case TransactionType::kResolve:
            return "resolve";
        case TransactionType::kChargeback:
            return "chargeback";
    }
    return "unknown";
}

// Accepts the lowercase wire names in any letter case.
inline bool ParseTransactionType(const std::string& raw, TransactionType* type) {
    if (type == nullptr) {
        return false;
    }
    std::string normalized = raw;
    for (char& ch : normalized) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (normalized == "deposit") {
        *type = TransactionType::kDeposit;
    } else if (normalized == "withdrawal") {
        *type = TransactionType::kWithdrawal;
    } else if (normalized == "dispute") {
        *type = TransactionType::kDispute;
    } else if (normalized == "resolve") {
        *type = TransactionType::kResolve;
    } else if (normalized == "chargeback") {
        *type = TransactionType::kChargeback;
    } else {
        return false;
    }
    return true;
}

}  // namespace tx_ledger
