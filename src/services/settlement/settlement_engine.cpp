#include "tx_ledger/services/settlement_engine.h"

#include "tx_ledger/core/fixed_decimal.h"

namespace tx_ledger {

namespace {

// Applies `available += available_delta` and `held += held_delta` (total follows) only when
// all three balances stay representable.
SettlementOutcome ApplyDeltas(Account* account, Amount available_delta, Amount held_delta) {
    Amount available = 0;
    Amount held = 0;
    Amount total = 0;
    if (!FixedDecimal::CheckedAdd(account->available, available_delta, &available) ||
        !FixedDecimal::CheckedAdd(account->held, held_delta, &held) ||
        !FixedDecimal::CheckedAdd(available, held, &total)) {
        return SettlementOutcome::kAmountOverflow;
    }
    account->available = available;
    account->held = held;
    account->total = total;
    return SettlementOutcome::kApplied;
}

}  // namespace

const char* ToString(SettlementOutcome outcome) {
    switch (outcome) {
        case SettlementOutcome::kApplied:
            return "applied";
        case SettlementOutcome::kMissingAmount:
            return "missing_amount";
        case SettlementOutcome::kInsufficientFunds:
            return "insufficient_funds";
        case SettlementOutcome::kMissingReference:
            return "missing_reference";
        case SettlementOutcome::kAccountLocked:
            return "account_locked";
        case SettlementOutcome::kForeignReference:
            return "foreign_reference";
        case SettlementOutcome::kInvalidAccount:
            return "invalid_account";
        case SettlementOutcome::kAmountOverflow:
            return "amount_overflow";
    }
    return "unknown";
}

SettlementPolicy SettlementPolicy::FromRuntime(const LedgerRuntimeConfig& runtime) {
    SettlementPolicy policy;
    policy.locked_account_policy = runtime.locked_account_policy;
    policy.reject_foreign_references = runtime.reject_foreign_references;
    return policy;
}

SettlementEngine::SettlementEngine(SettlementPolicy policy) : policy_(policy) {}

SettlementOutcome SettlementEngine::Settle(Account* account,
                                           const Transaction& transaction,
                                           const Transaction* referenced) const {
    if (account == nullptr) {
        return SettlementOutcome::kInvalidAccount;
    }
    if (account->locked && policy_.locked_account_policy == LockedAccountPolicy::kFreeze) {
        return SettlementOutcome::kAccountLocked;
    }

    switch (transaction.type) {
        case TransactionType::kDeposit: {
            if (!transaction.amount.has_value()) {
                return SettlementOutcome::kMissingAmount;
            }
            return ApplyDeltas(account, *transaction.amount, 0);
        }
        case TransactionType::kWithdrawal: {
            if (!transaction.amount.has_value()) {
                return SettlementOutcome::kMissingAmount;
            }
            const Amount amount = *transaction.amount;
            if (account->available < amount) {
                return SettlementOutcome::kInsufficientFunds;
            }
            Amount debit = 0;
            if (!FixedDecimal::CheckedSub(0, amount, &debit)) {
                return SettlementOutcome::kAmountOverflow;
            }
            return ApplyDeltas(account, debit, 0);
        }
        case TransactionType::kDispute:
        case TransactionType::kResolve:
        case TransactionType::kChargeback:
            break;
    }

    if (referenced == nullptr) {
        return SettlementOutcome::kMissingReference;
    }
    if (policy_.reject_foreign_references && referenced->client_id != transaction.client_id) {
        return SettlementOutcome::kForeignReference;
    }
    if (!referenced->amount.has_value()) {
        return SettlementOutcome::kMissingAmount;
    }

    const Amount amount = *referenced->amount;
    Amount negated = 0;
    if (!FixedDecimal::CheckedSub(0, amount, &negated)) {
        return SettlementOutcome::kAmountOverflow;
    }
    switch (transaction.type) {
        case TransactionType::kDispute:
            return ApplyDeltas(account, negated, amount);
        case TransactionType::kResolve:
            return ApplyDeltas(account, amount, negated);
        case TransactionType::kChargeback: {
            const auto outcome = ApplyDeltas(account, 0, negated);
            if (outcome == SettlementOutcome::kApplied) {
                account->locked = true;
            }
            return outcome;
        }
        case TransactionType::kDeposit:
        case TransactionType::kWithdrawal:
            break;
    }
    return SettlementOutcome::kApplied;
}

}  // namespace tx_ledger
