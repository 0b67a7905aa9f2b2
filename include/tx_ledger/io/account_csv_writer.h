#pragma once

#include <ostream>
#include <string>

#include "tx_ledger/contracts/types.h"

namespace tx_ledger {

// `client,available,held,total,locked`, one row per account in client order.
std::string FormatAccountsCsv(const AccountMap& accounts);

bool WriteAccountsCsv(const AccountMap& accounts, std::ostream& out, std::string* error);

}  // namespace tx_ledger
