#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "tx_ledger/core/ledger_config_loader.h"

namespace tx_ledger {
namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, const char* value)
        : key_(std::move(key)) {
        const char* previous = std::getenv(key_.c_str());
        if (previous != nullptr) {
            had_previous_ = true;
            previous_value_ = previous;
        }
        if (value == nullptr) {
            unsetenv(key_.c_str());
        } else {
            setenv(key_.c_str(), value, 1);
        }
    }

    ~ScopedEnvVar() {
        if (had_previous_) {
            setenv(key_.c_str(), previous_value_.c_str(), 1);
            return;
        }
        unsetenv(key_.c_str());
    }

private:
    std::string key_;
    bool had_previous_{false};
    std::string previous_value_;
};

std::filesystem::path WriteTempConfig(const std::string& body) {
    const auto token = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto path = std::filesystem::temp_directory_path() /
                      ("tx_ledger_config_loader_test_" + token + ".yaml");
    std::ofstream out(path);
    out << body;
    return path;
}

TEST(LedgerConfigLoaderTest, MissingKeysKeepDefaults) {
    const auto path = WriteTempConfig("ledger:\n  # nothing configured\n");

    LedgerFileConfig config;
    std::string error;
    ASSERT_TRUE(LedgerConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.source_path, path.string());
    EXPECT_EQ(config.runtime.log_level, "info");
    EXPECT_EQ(config.runtime.log_sink, "stderr");
    EXPECT_EQ(config.runtime.locked_account_policy, LockedAccountPolicy::kPermissive);
    EXPECT_FALSE(config.runtime.reject_foreign_references);
    EXPECT_EQ(config.runtime.max_deferrals_per_transaction, 0);
    EXPECT_TRUE(config.runtime.metrics_enabled);
    std::filesystem::remove(path);
}

TEST(LedgerConfigLoaderTest, LoadsEveryKey) {
    const auto path = WriteTempConfig(
        "ledger:\n"
        "  log_level: WARNING\n"
        "  log_sink: stdout\n"
        "  locked_account_policy: freeze  # stop settling after chargeback\n"
        "  reject_foreign_references: yes\n"
        "  max_deferrals_per_transaction: 3\n"
        "  metrics_enabled: false\n"
        "  unknown_key: ignored\n");

    LedgerFileConfig config;
    std::string error;
    ASSERT_TRUE(LedgerConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.runtime.log_level, "warn");
    EXPECT_EQ(config.runtime.log_sink, "stdout");
    EXPECT_EQ(config.runtime.locked_account_policy, LockedAccountPolicy::kFreeze);
    EXPECT_TRUE(config.runtime.reject_foreign_references);
    EXPECT_EQ(config.runtime.max_deferrals_per_transaction, 3);
    EXPECT_FALSE(config.runtime.metrics_enabled);
    std::filesystem::remove(path);
}

TEST(LedgerConfigLoaderTest, ExpandsEnvVarsInValues) {
    const ScopedEnvVar level("TX_LEDGER_TEST_LOG_LEVEL", "debug");
    const ScopedEnvVar policy("TX_LEDGER_TEST_POLICY", "freeze");
    const auto path = WriteTempConfig(
        "log_level: \"${TX_LEDGER_TEST_LOG_LEVEL}\"\n"
        "locked_account_policy: ${TX_LEDGER_TEST_POLICY}\n");

    LedgerFileConfig config;
    std::string error;
    ASSERT_TRUE(LedgerConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.runtime.log_level, "debug");
    EXPECT_EQ(config.runtime.locked_account_policy, LockedAccountPolicy::kFreeze);
    std::filesystem::remove(path);
}

TEST(LedgerConfigLoaderTest, UnknownEnvVarExpandsEmptyAndFailsValidation) {
    const ScopedEnvVar unset("TX_LEDGER_TEST_UNSET_POLICY", nullptr);
    const auto path = WriteTempConfig("locked_account_policy: ${TX_LEDGER_TEST_UNSET_POLICY}\n");

    LedgerFileConfig config;
    std::string error;
    EXPECT_FALSE(LedgerConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_EQ(error, "invalid locked_account_policy: ");
    std::filesystem::remove(path);
}

TEST(LedgerConfigLoaderTest, RejectsInvalidValues) {
    struct Case {
        std::string body;
        std::string expected_error;
    };
    const Case cases[] = {
        {"log_level: verbose\n", "invalid log_level: verbose"},
        {"log_sink: syslog\n", "invalid log_sink: syslog"},
        {"locked_account_policy: strict\n", "invalid locked_account_policy: strict"},
        {"reject_foreign_references: maybe\n",
         "invalid bool value for reject_foreign_references"},
        {"max_deferrals_per_transaction: -1\n",
         "invalid integer for key: max_deferrals_per_transaction"},
        {"max_deferrals_per_transaction: 2x\n",
         "invalid integer for key: max_deferrals_per_transaction"},
        {"metrics_enabled: on-ish\n", "invalid bool value for metrics_enabled"},
    };

    for (const auto& test_case : cases) {
        const auto path = WriteTempConfig(test_case.body);
        LedgerFileConfig config;
        std::string error;
        EXPECT_FALSE(LedgerConfigLoader::LoadFromYaml(path.string(), &config, &error))
            << test_case.body;
        EXPECT_EQ(error, test_case.expected_error);
        std::filesystem::remove(path);
    }
}

TEST(LedgerConfigLoaderTest, MissingFileReportsPath) {
    LedgerFileConfig config;
    std::string error;
    EXPECT_FALSE(
        LedgerConfigLoader::LoadFromYaml("/nonexistent/tx_ledger/ledger.yaml", &config, &error));
    EXPECT_EQ(error, "unable to open config: /nonexistent/tx_ledger/ledger.yaml");
}

TEST(LedgerConfigLoaderTest, GetEnvOrDefaultFallsBackWhenUnset) {
    const ScopedEnvVar unset("TX_LEDGER_TEST_MISSING", nullptr);
    EXPECT_EQ(GetEnvOrDefault("TX_LEDGER_TEST_MISSING", "fallback"), "fallback");
    const ScopedEnvVar set("TX_LEDGER_TEST_PRESENT", "value");
    EXPECT_EQ(GetEnvOrDefault("TX_LEDGER_TEST_PRESENT", "fallback"), "value");
}

}  // namespace
}  // namespace tx_ledger
