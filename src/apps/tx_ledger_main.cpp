#include <deque>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "tx_ledger/apps/cli_support.h"
#include "tx_ledger/core/ledger_config_loader.h"
#include "tx_ledger/core/structured_log.h"
#include "tx_ledger/io/account_csv_writer.h"
#include "tx_ledger/io/account_snapshot_parquet_writer.h"
#include "tx_ledger/io/transaction_csv_reader.h"
#include "tx_ledger/monitoring/metric_registry.h"
#include "tx_ledger/services/settlement_engine.h"
#include "tx_ledger/services/transaction_processor.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRuntimeError = 1;
constexpr int kExitConfigError = 2;

constexpr const char* kApp = "tx_ledger";

const std::vector<std::string> kKnownOptions = {
    "config", "output", "output-parquet", "metrics-textfile", "log-level", "max-deferrals",
};

void PrintUsage(std::ostream& out) {
    out << "usage: tx_ledger <transactions.csv> [--config <ledger.yaml>] [--output <accounts.csv>]\n"
           "                 [--output-parquet <accounts.parquet>] [--metrics-textfile <path>]\n"
           "                 [--log-level debug|info|warn|error] [--max-deferrals <n>]\n";
}

bool IsKnownOption(const std::string& key) {
    for (const auto& known : kKnownOptions) {
        if (known == key) {
            return true;
        }
    }
    return false;
}

bool ParseNonNegativeInt(const std::string& raw, int* out) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(raw, &consumed);
        if (consumed != raw.size() || parsed < 0) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ResolveRuntimeConfig(const tx_ledger::apps::ArgMap& options,
                          tx_ledger::LedgerRuntimeConfig* runtime,
                          std::string* error) {
    using namespace tx_ledger;

    const auto config_path =
        apps::GetArg(options, "config", GetEnvOrDefault("TX_LEDGER_CONFIG_PATH", ""));
    if (!config_path.empty()) {
        LedgerFileConfig file_config;
        if (!LedgerConfigLoader::LoadFromYaml(config_path, &file_config, error)) {
            return false;
        }
        *runtime = file_config.runtime;
    }

    if (apps::HasArg(options, "log-level")) {
        const auto level = apps::GetArg(options, "log-level");
        if (!IsKnownLogLevel(level)) {
            *error = "invalid --log-level: " + level;
            return false;
        }
        runtime->log_level = NormalizeLogLevel(level);
    }
    if (apps::HasArg(options, "max-deferrals")) {
        const auto raw = apps::GetArg(options, "max-deferrals");
        if (!ParseNonNegativeInt(raw, &runtime->max_deferrals_per_transaction)) {
            *error = "invalid --max-deferrals: " + raw;
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace tx_ledger;

    LedgerRuntimeConfig runtime;

    const auto args = apps::ParseArgs(argc, argv);
    if (apps::HasArg(args.options, "help")) {
        PrintUsage(std::cout);
        return kExitOk;
    }
    for (const auto& [key, value] : args.options) {
        (void)value;
        if (!IsKnownOption(key)) {
            EmitStructuredLog(&runtime, kApp, "error", "invalid_arguments",
                              {{"error", "unknown option: --" + key}});
            PrintUsage(std::cerr);
            return kExitConfigError;
        }
    }
    if (args.positionals.size() != 1) {
        EmitStructuredLog(&runtime, kApp, "error", "invalid_arguments",
                          {{"error", args.positionals.empty()
                                         ? "no transactions file provided"
                                         : "expected exactly one transactions file"}});
        PrintUsage(std::cerr);
        return kExitConfigError;
    }
    const std::string input_path = args.positionals.front();

    std::string config_error;
    if (!ResolveRuntimeConfig(args.options, &runtime, &config_error)) {
        EmitStructuredLog(&runtime, kApp, "error", "config_load_failed",
                          {{"error", config_error}});
        return kExitConfigError;
    }

    TransactionCsvReader reader;
    std::deque<Transaction> transactions;
    std::string load_error;
    if (!reader.LoadFromFile(input_path, &transactions, &load_error)) {
        EmitStructuredLog(&runtime, kApp, "error", "input_load_failed",
                          {{"path", input_path}, {"error", load_error}});
        return kExitRuntimeError;
    }
    EmitStructuredLog(&runtime, kApp, "info", "input_loaded",
                      {{"path", input_path},
                       {"lines", std::to_string(reader.stats().lines_total)},
                       {"records", std::to_string(reader.stats().records_loaded)},
                       {"absent_amounts", std::to_string(reader.stats().absent_amounts)}});

    ProcessorOptions processor_options;
    processor_options.max_deferrals_per_transaction = runtime.max_deferrals_per_transaction;
    processor_options.metrics_enabled = runtime.metrics_enabled;
    TransactionProcessor processor(SettlementEngine(SettlementPolicy::FromRuntime(runtime)),
                                   processor_options);
    if (IsLogLevelEnabled(&runtime, "debug")) {
        processor.SetSettlementObserver(
            [&runtime](const Transaction& transaction, SettlementOutcome outcome) {
                if (outcome == SettlementOutcome::kApplied) {
                    return;
                }
                EmitStructuredLog(&runtime, kApp, "debug", "transaction_ignored",
                                  {{"type", ToString(transaction.type)},
                                   {"client", std::to_string(transaction.client_id)},
                                   {"tx", std::to_string(transaction.tx_id)},
                                   {"outcome", ToString(outcome)}});
            });
    }

    const auto result = processor.Process(std::move(transactions));

    for (const auto& unresolved : result.unresolved) {
        EmitStructuredLog(&runtime, kApp, "warn", "transaction_unresolved",
                          {{"type", ToString(unresolved.transaction.type)},
                           {"client", std::to_string(unresolved.transaction.client_id)},
                           {"tx", std::to_string(unresolved.transaction.tx_id)},
                           {"deferrals", std::to_string(unresolved.deferrals)}});
    }
    EmitStructuredLog(&runtime, kApp, "info", "processing_completed",
                      {{"transactions", std::to_string(result.stats.transactions_total)},
                       {"settled", std::to_string(result.stats.settled)},
                       {"applied", std::to_string(result.stats.applied)},
                       {"insufficient_funds", std::to_string(result.stats.insufficient_funds)},
                       {"missing_amount", std::to_string(result.stats.missing_amount)},
                       {"account_locked", std::to_string(result.stats.account_locked)},
                       {"foreign_reference", std::to_string(result.stats.foreign_reference)},
                       {"amount_overflow", std::to_string(result.stats.amount_overflow)},
                       {"deferrals", std::to_string(result.stats.deferrals)},
                       {"unresolved", std::to_string(result.stats.unresolved)},
                       {"accounts", std::to_string(result.accounts.size())},
                       {"locked_account_policy", ToString(runtime.locked_account_policy)}});

    std::string write_error;
    const auto output_path = apps::GetArg(args.options, "output");
    const bool csv_written =
        output_path.empty()
            ? WriteAccountsCsv(result.accounts, std::cout, &write_error)
            : apps::WriteTextFile(output_path, FormatAccountsCsv(result.accounts), &write_error);
    if (!csv_written) {
        EmitStructuredLog(&runtime, kApp, "error", "output_write_failed",
                          {{"path", output_path.empty() ? "<stdout>" : output_path},
                           {"error", write_error}});
        return kExitRuntimeError;
    }

    if (const auto parquet_path = apps::GetArg(args.options, "output-parquet");
        !parquet_path.empty()) {
        if (!WriteAccountSnapshotParquet(result.accounts, parquet_path, &write_error)) {
            EmitStructuredLog(&runtime, kApp, "error", "parquet_write_failed",
                              {{"path", parquet_path}, {"error", write_error}});
            return kExitRuntimeError;
        }
    }

    if (const auto metrics_path = apps::GetArg(args.options, "metrics-textfile");
        !metrics_path.empty()) {
        std::string exposition;
        if (!MetricRegistry::Instance().SerializeText(&exposition, &write_error) ||
            !apps::WriteTextFile(metrics_path, exposition, &write_error)) {
            EmitStructuredLog(&runtime, kApp, "error", "metrics_write_failed",
                              {{"path", metrics_path}, {"error", write_error}});
            return kExitRuntimeError;
        }
    }

    return kExitOk;
}
