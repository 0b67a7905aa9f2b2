#include "tx_ledger/core/ledger_config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "tx_ledger/core/structured_log.h"

namespace tx_ledger {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// Expands ${NAME} from the environment; unknown names expand to "".
std::string ResolveEnvVars(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
        const auto start = raw.find("${", pos);
        if (start == std::string::npos) {
            out.append(raw, pos, std::string::npos);
            break;
        }
        const auto end = raw.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(raw, pos, std::string::npos);
            break;
        }
        out.append(raw, pos, start - pos);
        const auto name = raw.substr(start + 2, end - start - 2);
        out += GetEnvOrDefault(name.c_str(), "");
        pos = end + 1;
    }
    return out;
}

std::unordered_map<std::string, std::string> LoadSimpleYaml(const std::string& path,
                                                            std::string* error) {
    std::unordered_map<std::string, std::string> kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "ledger:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = Trim(ResolveEnvVars(line.substr(pos + 1)));
        if (!key.empty()) {
            kv[key] = value;
        }
    }
    return kv;
}

bool ParseBoolValue(const std::string& value, bool* out) {
    if (out == nullptr) {
        return false;
    }
    const auto normalized = Lowercase(Trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes") {
        *out = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no") {
        *out = false;
        return true;
    }
    return false;
}

bool ParseIntValue(const std::string& value, int* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

std::string GetEnvOrDefault(const char* key, const std::string& fallback) {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return fallback;
    }
    return std::string(raw);
}

bool ParseLockedAccountPolicy(const std::string& raw, LockedAccountPolicy* policy) {
    if (policy == nullptr) {
        return false;
    }
    const auto normalized = Lowercase(Trim(raw));
    if (normalized == "permissive") {
        *policy = LockedAccountPolicy::kPermissive;
        return true;
    }
    if (normalized == "freeze") {
        *policy = LockedAccountPolicy::kFreeze;
        return true;
    }
    return false;
}

const char* ToString(LockedAccountPolicy policy) {
    switch (policy) {
        case LockedAccountPolicy::kPermissive:
            return "permissive";
        case LockedAccountPolicy::kFreeze:
            return "freeze";
    }
    return "unknown";
}

bool LedgerConfigLoader::LoadFromYaml(const std::string& path,
                                      LedgerFileConfig* config,
                                      std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    LedgerFileConfig loaded;
    loaded.source_path = path;

    if (const auto it = kv.find("log_level"); it != kv.end()) {
        if (!IsKnownLogLevel(it->second)) {
            if (error != nullptr) {
                *error = "invalid log_level: " + it->second;
            }
            return false;
        }
        loaded.runtime.log_level = NormalizeLogLevel(it->second);
    }

    if (const auto it = kv.find("log_sink"); it != kv.end()) {
        const auto sink = Lowercase(it->second);
        if (sink != "stderr" && sink != "stdout") {
            if (error != nullptr) {
                *error = "invalid log_sink: " + it->second;
            }
            return false;
        }
        loaded.runtime.log_sink = sink;
    }

    if (const auto it = kv.find("locked_account_policy"); it != kv.end()) {
        if (!ParseLockedAccountPolicy(it->second, &loaded.runtime.locked_account_policy)) {
            if (error != nullptr) {
                *error = "invalid locked_account_policy: " + it->second;
            }
            return false;
        }
    }

    if (const auto it = kv.find("reject_foreign_references"); it != kv.end()) {
        if (!ParseBoolValue(it->second, &loaded.runtime.reject_foreign_references)) {
            if (error != nullptr) {
                *error = "invalid bool value for reject_foreign_references";
            }
            return false;
        }
    }

    if (const auto it = kv.find("max_deferrals_per_transaction"); it != kv.end()) {
        int parsed = 0;
        if (!ParseIntValue(it->second, &parsed) || parsed < 0) {
            if (error != nullptr) {
                *error = "invalid integer for key: max_deferrals_per_transaction";
            }
            return false;
        }
        loaded.runtime.max_deferrals_per_transaction = parsed;
    }

    if (const auto it = kv.find("metrics_enabled"); it != kv.end()) {
        if (!ParseBoolValue(it->second, &loaded.runtime.metrics_enabled)) {
            if (error != nullptr) {
                *error = "invalid bool value for metrics_enabled";
            }
            return false;
        }
    }

    *config = std::move(loaded);
    return true;
}

}  // namespace tx_ledger
