#include "tx_ledger/services/transaction_processor.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "tx_ledger/core/fixed_decimal.h"
#include "tx_ledger/monitoring/metric_registry.h"

namespace tx_ledger {

namespace {

struct PendingTransaction {
    Transaction transaction;
    std::size_t deferrals{0};
};

std::shared_ptr<MonitoringCounter> TransactionsCounter(const std::string& type) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<MonitoringCounter>> counters;
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = counters.find(type);
    if (it != counters.end()) {
        return it->second;
    }
    auto counter = MetricRegistry::Instance().BuildCounter(
        "tx_ledger_transactions_total",
        "Total transactions read into the processing loop",
        {{"type", type}});
    counters.emplace(type, counter);
    return counter;
}

std::shared_ptr<MonitoringCounter> OutcomeCounter(const std::string& outcome) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<MonitoringCounter>> counters;
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = counters.find(outcome);
    if (it != counters.end()) {
        return it->second;
    }
    auto counter = MetricRegistry::Instance().BuildCounter(
        "tx_ledger_settlement_outcomes_total",
        "Total settlement attempts by outcome",
        {{"outcome", outcome}});
    counters.emplace(outcome, counter);
    return counter;
}

std::shared_ptr<MonitoringCounter> DeferralsCounter() {
    static auto counter = MetricRegistry::Instance().BuildCounter(
        "tx_ledger_deferrals_total",
        "Total requeues of transactions whose reference was not yet known");
    return counter;
}

std::shared_ptr<MonitoringCounter> UnresolvedCounter() {
    static auto counter = MetricRegistry::Instance().BuildCounter(
        "tx_ledger_unresolved_transactions_total",
        "Total transactions given up on because their reference never appeared");
    return counter;
}

std::shared_ptr<MonitoringGauge> AccountsGauge(const std::string& state) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<MonitoringGauge>> gauges;
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = gauges.find(state);
    if (it != gauges.end()) {
        return it->second;
    }
    auto gauge = MetricRegistry::Instance().BuildGauge(
        "tx_ledger_accounts", "Accounts in the last processed snapshot", {{"state", state}});
    gauges.emplace(state, gauge);
    return gauge;
}

std::shared_ptr<MonitoringGauge> FundsGauge(const std::string& bucket) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<MonitoringGauge>> gauges;
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = gauges.find(bucket);
    if (it != gauges.end()) {
        return it->second;
    }
    auto gauge = MetricRegistry::Instance().BuildGauge(
        "tx_ledger_funds", "Funds summed over all accounts in the last snapshot",
        {{"bucket", bucket}});
    gauges.emplace(bucket, gauge);
    return gauge;
}

}  // namespace

TransactionProcessor::TransactionProcessor(SettlementEngine engine, ProcessorOptions options)
    : engine_(std::move(engine)), options_(options) {}

void TransactionProcessor::SetSettlementObserver(SettlementObserver observer) {
    observer_ = std::move(observer);
}

void TransactionProcessor::RecordOutcome(const Transaction& transaction,
                                         SettlementOutcome outcome,
                                         ProcessingStats* stats) const {
    ++stats->settled;
    switch (outcome) {
        case SettlementOutcome::kApplied:
            ++stats->applied;
            break;
        case SettlementOutcome::kMissingAmount:
            ++stats->missing_amount;
            break;
        case SettlementOutcome::kInsufficientFunds:
            ++stats->insufficient_funds;
            break;
        case SettlementOutcome::kAccountLocked:
            ++stats->account_locked;
            break;
        case SettlementOutcome::kForeignReference:
            ++stats->foreign_reference;
            break;
        case SettlementOutcome::kAmountOverflow:
            ++stats->amount_overflow;
            break;
        case SettlementOutcome::kMissingReference:
        case SettlementOutcome::kInvalidAccount:
            break;
    }
    if (options_.metrics_enabled) {
        OutcomeCounter(ToString(outcome))->Increment();
    }
    if (observer_) {
        observer_(transaction, outcome);
    }
}

ProcessingResult TransactionProcessor::Process(std::deque<Transaction> transactions) const {
    ProcessingResult result;
    result.stats.transactions_total = transactions.size();

    std::deque<PendingTransaction> queue;
    for (auto& transaction : transactions) {
        if (options_.metrics_enabled) {
            TransactionsCounter(ToString(transaction.type))->Increment();
        }
        queue.push_back(PendingTransaction{std::move(transaction), 0});
    }
    transactions.clear();

    std::unordered_map<TxId, Transaction> reference_index;
    const auto max_deferrals = static_cast<std::size_t>(
        options_.max_deferrals_per_transaction > 0 ? options_.max_deferrals_per_transaction : 0);

    // Number of transactions requeued since the last settlement. When it covers the whole
    // queue, a full pass made no progress and none of the remainder can ever resolve.
    std::size_t deferred_since_progress = 0;
    while (!queue.empty() && deferred_since_progress < queue.size()) {
        PendingTransaction pending = std::move(queue.front());
        queue.pop_front();
        const Transaction& transaction = pending.transaction;

        auto account_it = result.accounts.find(transaction.client_id);
        if (account_it == result.accounts.end()) {
            Account account;
            account.client_id = transaction.client_id;
            account_it = result.accounts.emplace(transaction.client_id, account).first;
        }
        Account* account = &account_it->second;

        if (IsReferenceable(transaction.type)) {
            RecordOutcome(transaction, engine_.Settle(account, transaction, nullptr), &result.stats);
            reference_index.insert_or_assign(transaction.tx_id, transaction);
            deferred_since_progress = 0;
            continue;
        }

        const auto reference_it = reference_index.find(transaction.tx_id);
        if (reference_it != reference_index.end()) {
            RecordOutcome(
                transaction, engine_.Settle(account, transaction, &reference_it->second),
                &result.stats);
            deferred_since_progress = 0;
            continue;
        }

        ++pending.deferrals;
        ++result.stats.deferrals;
        if (options_.metrics_enabled) {
            DeferralsCounter()->Increment();
        }
        if (max_deferrals > 0 && pending.deferrals > max_deferrals) {
            result.unresolved.push_back(
                UnresolvedTransaction{std::move(pending.transaction), pending.deferrals});
            continue;
        }
        queue.push_back(std::move(pending));
        ++deferred_since_progress;
    }

    for (auto& pending : queue) {
        result.unresolved.push_back(
            UnresolvedTransaction{std::move(pending.transaction), pending.deferrals});
    }
    result.stats.unresolved = result.unresolved.size();

    if (options_.metrics_enabled) {
        UnresolvedCounter()->Increment(static_cast<double>(result.stats.unresolved));
        // Summed as long double; the int64 total over all accounts may not fit.
        std::size_t locked_accounts = 0;
        long double available = 0;
        long double held = 0;
        long double total = 0;
        for (const auto& [client_id, account] : result.accounts) {
            (void)client_id;
            if (account.locked) {
                ++locked_accounts;
            }
            available += FixedDecimal::ToLongDouble(account.available, kAmountScale);
            held += FixedDecimal::ToLongDouble(account.held, kAmountScale);
            total += FixedDecimal::ToLongDouble(account.total, kAmountScale);
        }
        AccountsGauge("open")->Set(
            static_cast<double>(result.accounts.size() - locked_accounts));
        AccountsGauge("locked")->Set(static_cast<double>(locked_accounts));
        FundsGauge("available")->Set(static_cast<double>(available));
        FundsGauge("held")->Set(static_cast<double>(held));
        FundsGauge("total")->Set(static_cast<double>(total));
    }
    return result;
}

}  // namespace tx_ledger
