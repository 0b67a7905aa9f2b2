#pragma once

#include <cstddef>
#include <deque>
#include <istream>
#include <string>
#include <vector>

#include "tx_ledger/contracts/types.h"

namespace tx_ledger {

struct TransactionCsvStats {
    std::size_t lines_total{0};
    std::size_t blank_lines{0};
    std::size_t records_loaded{0};
    std::size_t absent_amounts{0};
};

// Reads `type,client,tx,amount` records. Column order follows the header row; the
// amount column and trailing amount cells may be omitted. Blank or unparsable amounts
// load as absent; well-formed amounts outside the int64 range and any other malformed
// record fail the whole load.
class TransactionCsvReader {
public:
    bool LoadFromFile(const std::string& path,
                      std::deque<Transaction>* out,
                      std::string* error);
    bool LoadFromStream(std::istream& input,
                        const std::string& source_name,
                        std::deque<Transaction>* out,
                        std::string* error);

    const TransactionCsvStats& stats() const noexcept { return stats_; }

private:
    TransactionCsvStats stats_;
};

std::vector<std::string> SplitCsvLine(const std::string& line);

}  // namespace tx_ledger
