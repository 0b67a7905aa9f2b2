#include "tx_ledger/io/account_csv_writer.h"

#include <sstream>

#include "tx_ledger/core/fixed_decimal.h"

namespace tx_ledger {

std::string FormatAccountsCsv(const AccountMap& accounts) {
    std::ostringstream oss;
    oss << "client,available,held,total,locked\n";
    for (const auto& [client_id, account] : accounts) {
        oss << client_id << ',' << FixedDecimal::Format(account.available, kAmountScale) << ','
            << FixedDecimal::Format(account.held, kAmountScale) << ','
            << FixedDecimal::Format(account.total, kAmountScale) << ','
            << (account.locked ? "true" : "false") << '\n';
    }
    return oss.str();
}

bool WriteAccountsCsv(const AccountMap& accounts, std::ostream& out, std::string* error) {
    out << FormatAccountsCsv(accounts);
    out.flush();
    if (!out.good()) {
        if (error != nullptr) {
            *error = "failed to write account snapshot csv";
        }
        return false;
    }
    return true;
}

}  // namespace tx_ledger
