#include <gtest/gtest.h>

#include <string>

#include "tx_ledger/core/structured_log.h"

namespace tx_ledger {
namespace {

TEST(StructuredLogTest, NormalizesAndRanksLevels) {
    EXPECT_EQ(NormalizeLogLevel("WARNING"), "warn");
    EXPECT_EQ(NormalizeLogLevel("Debug"), "debug");
    EXPECT_TRUE(IsKnownLogLevel("ERROR"));
    EXPECT_FALSE(IsKnownLogLevel("trace"));
    EXPECT_LT(LogLevelRank("debug"), LogLevelRank("info"));
    EXPECT_LT(LogLevelRank("warn"), LogLevelRank("error"));
}

TEST(StructuredLogTest, FiltersBelowConfiguredLevel) {
    LedgerRuntimeConfig runtime;
    runtime.log_level = "warn";
    EXPECT_FALSE(IsLogLevelEnabled(&runtime, "info"));
    EXPECT_TRUE(IsLogLevelEnabled(&runtime, "warn"));
    EXPECT_TRUE(IsLogLevelEnabled(&runtime, "error"));
    EXPECT_TRUE(IsLogLevelEnabled(nullptr, "info"));
    EXPECT_FALSE(IsLogLevelEnabled(nullptr, "debug"));
}

TEST(StructuredLogTest, WritesKeyValueLineToStderr) {
    LedgerRuntimeConfig runtime;
    testing::internal::CaptureStderr();
    EmitStructuredLog(&runtime, "tx_ledger", "info", "input_loaded",
                      {{"path", "in.csv"}, {"note", "say \"hi\""}});
    EmitStructuredLog(&runtime, "tx_ledger", "debug", "transaction_ignored");
    const std::string captured = testing::internal::GetCapturedStderr();

    EXPECT_EQ(captured.rfind("ts_ns=", 0), 0U);
    EXPECT_NE(captured.find(" level=info app=tx_ledger event=input_loaded path=\"in.csv\""),
              std::string::npos);
    EXPECT_NE(captured.find("note=\"say \\\"hi\\\"\""), std::string::npos);
    EXPECT_EQ(captured.find("transaction_ignored"), std::string::npos);
}

TEST(StructuredLogTest, StdoutSinkKeepsStderrClean) {
    LedgerRuntimeConfig runtime;
    runtime.log_sink = "stdout";
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    EmitStructuredLog(&runtime, "tx_ledger", "error", "output_write_failed");
    const std::string err = testing::internal::GetCapturedStderr();
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(err.empty());
    EXPECT_NE(out.find("event=output_write_failed"), std::string::npos);
}

}  // namespace
}  // namespace tx_ledger
