#pragma once

#include <string>

#include "tx_ledger/core/ledger_config.h"

namespace tx_ledger {

struct LedgerFileConfig {
    LedgerRuntimeConfig runtime;
    std::string source_path;
};

class LedgerConfigLoader {
   public:
    static bool LoadFromYaml(const std::string& path, LedgerFileConfig* config, std::string* error);
};

std::string GetEnvOrDefault(const char* key, const std::string& fallback);

}  // namespace tx_ledger
