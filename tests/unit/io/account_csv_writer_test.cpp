#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "tx_ledger/io/account_csv_writer.h"

namespace tx_ledger {
namespace {

Account MakeAccount(ClientId client_id, Amount available, Amount held, bool locked) {
    Account account;
    account.client_id = client_id;
    account.available = available;
    account.held = held;
    account.total = available + held;
    account.locked = locked;
    return account;
}

TEST(AccountCsvWriterTest, FormatsFourFractionDigitsInClientOrder) {
    AccountMap accounts;
    accounts.emplace(2, MakeAccount(2, 20000, 0, false));
    accounts.emplace(1, MakeAccount(1, 15000005, 0, true));
    accounts.emplace(7, MakeAccount(7, -4000, 4000, false));

    EXPECT_EQ(FormatAccountsCsv(accounts),
              "client,available,held,total,locked\n"
              "1,1500.0005,0.0000,1500.0005,true\n"
              "2,2.0000,0.0000,2.0000,false\n"
              "7,-0.4000,0.4000,0.0000,false\n");
}

TEST(AccountCsvWriterTest, EmptySnapshotWritesHeaderOnly) {
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(WriteAccountsCsv({}, out, &error)) << error;
    EXPECT_EQ(out.str(), "client,available,held,total,locked\n");
}

TEST(AccountCsvWriterTest, ReportsFailedStream) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    std::string error;
    EXPECT_FALSE(WriteAccountsCsv({}, out, &error));
    EXPECT_EQ(error, "failed to write account snapshot csv");
}

}  // namespace
}  // namespace tx_ledger
