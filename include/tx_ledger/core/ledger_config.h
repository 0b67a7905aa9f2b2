#pragma once

#include <string>

namespace tx_ledger {

enum class LockedAccountPolicy {
    // Locked accounts keep settling; the lock is informational.
    kPermissive,
    // Every transaction against a locked account is a no-op.
    kFreeze,
};

struct LedgerRuntimeConfig {
    std::string log_level{"info"};
    std::string log_sink{"stderr"};
    LockedAccountPolicy locked_account_policy{LockedAccountPolicy::kPermissive};
    bool reject_foreign_references{false};
    // 0 leaves deferrals bounded only by the no-progress rule.
    int max_deferrals_per_transaction{0};
    bool metrics_enabled{true};
};

bool ParseLockedAccountPolicy(const std::string& raw, LockedAccountPolicy* policy);
const char* ToString(LockedAccountPolicy policy);

}  // namespace tx_ledger
