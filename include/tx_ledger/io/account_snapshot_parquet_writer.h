#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tx_ledger/contracts/types.h"

namespace tx_ledger {

class AccountSnapshotParquetWriter {
   public:
    AccountSnapshotParquetWriter() = default;
    ~AccountSnapshotParquetWriter() = default;

    bool Open(const std::string& output_path, std::string* error);
    bool Append(const Account& account, std::string* error);
    bool Close(std::string* error);

    std::int64_t rows_written() const noexcept { return rows_written_; }
    const std::string& output_path() const noexcept { return output_path_; }
    bool is_open() const noexcept { return is_open_; }

   private:
    bool is_open_{false};
    std::int64_t rows_written_{0};
    std::string output_path_;

#if TX_LEDGER_ENABLE_ARROW_PARQUET
    std::vector<Account> rows_;
#endif
};

// Convenience wrapper: open, append every account, close.
bool WriteAccountSnapshotParquet(const AccountMap& accounts,
                                 const std::string& output_path,
                                 std::string* error);

}  // namespace tx_ledger
