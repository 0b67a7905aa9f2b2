#pragma once

#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace tx_ledger::apps {

using ArgMap = std::unordered_map<std::string, std::string>;

struct ParsedArgs {
    ArgMap options;
    std::vector<std::string> positionals;
};

// `--key value`, `--key=value` and bare `--flag` (stored as "true"); everything else is
// positional. A lone `--` ends option parsing.
inline ParsedArgs ParseArgs(int argc, char** argv) {
    ParsedArgs parsed;
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if (options_done || token.rfind("--", 0) != 0) {
            parsed.positionals.push_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }
        token = token.substr(2);
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string::npos) {
            parsed.options[token.substr(0, eq_pos)] = token.substr(eq_pos + 1);
            continue;
        }
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            parsed.options[token] = argv[++i];
            continue;
        }
        parsed.options[token] = "true";
    }
    return parsed;
}

inline std::string GetArg(const ArgMap& args,
                          const std::string& key,
                          const std::string& fallback = "") {
    const auto it = args.find(key);
    if (it == args.end()) {
        return fallback;
    }
    return it->second;
}

inline bool HasArg(const ArgMap& args, const std::string& key) {
    return args.find(key) != args.end();
}

inline bool WriteTextFile(const std::string& path, const std::string& content, std::string* error) {
    if (path.empty()) {
        return true;
    }
    try {
        const std::filesystem::path file_path(path);
        if (!file_path.parent_path().empty()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            if (error != nullptr) {
                *error = "unable to open output file: " + path;
            }
            return false;
        }
        out << content;
        out.flush();
        if (!out.good()) {
            if (error != nullptr) {
                *error = "failed writing output file: " + path;
            }
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        return false;
    }
}

}  // namespace tx_ledger::apps
