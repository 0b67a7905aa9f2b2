#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <vector>

#include "tx_ledger/contracts/types.h"
#include "tx_ledger/services/settlement_engine.h"

namespace tx_ledger {

struct ProcessingStats {
    std::size_t transactions_total{0};
    std::size_t settled{0};
    std::size_t applied{0};
    std::size_t missing_amount{0};
    std::size_t insufficient_funds{0};
    std::size_t account_locked{0};
    std::size_t foreign_reference{0};
    std::size_t amount_overflow{0};
    std::size_t deferrals{0};
    std::size_t unresolved{0};
};

struct UnresolvedTransaction {
    Transaction transaction;
    std::size_t deferrals{0};
};

struct ProcessingResult {
    AccountMap accounts;
    std::vector<UnresolvedTransaction> unresolved;
    ProcessingStats stats;
};

struct ProcessorOptions {
    // 0 means a transaction is only given up on by the no-progress rule.
    int max_deferrals_per_transaction{0};
    bool metrics_enabled{true};
};

using SettlementObserver =
    std::function<void(const Transaction& transaction, SettlementOutcome outcome)>;

// Replays an ordered transaction stream into per-client accounts.
//
// Deposits and withdrawals settle on arrival and join the reference index. Disputes,
// resolves and chargebacks whose tx_id is not indexed yet are pushed to the back of the
// queue. Once every queued transaction has been deferred since the last settlement the
// index can no longer grow, so the remainder is reported as unresolved.
class TransactionProcessor {
public:
    explicit TransactionProcessor(SettlementEngine engine = SettlementEngine(),
                                  ProcessorOptions options = {});

    // Called once per settled transaction, including no-op outcomes. Deferrals are not
    // reported here.
    void SetSettlementObserver(SettlementObserver observer);

    ProcessingResult Process(std::deque<Transaction> transactions) const;

private:
    void RecordOutcome(const Transaction& transaction,
                       SettlementOutcome outcome,
                       ProcessingStats* stats) const;

    SettlementEngine engine_;
    ProcessorOptions options_;
    SettlementObserver observer_;
};

}  // namespace tx_ledger
