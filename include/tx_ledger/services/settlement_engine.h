#pragma once

#include "tx_ledger/contracts/types.h"
#include "tx_ledger/core/ledger_config.h"

namespace tx_ledger {

enum class SettlementOutcome {
    kApplied,
    kMissingAmount,
    kInsufficientFunds,
    kMissingReference,
    kAccountLocked,
    kForeignReference,
    kInvalidAccount,
    // A resulting balance would not fit the scaled int64 representation.
    kAmountOverflow,
};

const char* ToString(SettlementOutcome outcome);

struct SettlementPolicy {
    LockedAccountPolicy locked_account_policy{LockedAccountPolicy::kPermissive};
    bool reject_foreign_references{false};

    static SettlementPolicy FromRuntime(const LedgerRuntimeConfig& runtime);
};

// Applies one transaction to one account. Amounts for dispute, resolve and chargeback
// are always read from the referenced deposit/withdrawal, never from the current
// balances, so neither funds nor dispute ordering are validated on those paths.
class SettlementEngine {
public:
    explicit SettlementEngine(SettlementPolicy policy = {});

    // `referenced` is the deposit/withdrawal sharing the transaction's tx_id; it is
    // ignored for deposits and withdrawals. Anything other than kApplied leaves the
    // account untouched.
    SettlementOutcome Settle(Account* account,
                             const Transaction& transaction,
                             const Transaction* referenced) const;

    const SettlementPolicy& policy() const noexcept { return policy_; }

private:
    SettlementPolicy policy_;
};

}  // namespace tx_ledger
