#include "tx_ledger/io/transaction_csv_reader.h"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <utility>

#include "tx_ledger/core/fixed_decimal.h"

namespace tx_ledger {

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() &&
           std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin &&
           std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string ToLower(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

bool ParseUnsigned(const std::string& raw, std::uint64_t max_value, std::uint64_t* out) {
    if (raw.empty()) {
        return false;
    }
    std::uint64_t value = 0;
    for (const char ch : raw) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
        const auto digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (max_value - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    *out = value;
    return true;
}

struct ColumnLayout {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::optional<std::size_t> amount;
    std::size_t width{0};
};

bool ParseHeader(const std::string& line, ColumnLayout* layout, std::string* error) {
    const auto headers = SplitCsvLine(line);
    std::map<std::string, std::size_t> header_index;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        header_index.emplace(ToLower(Trim(headers[i])), i);
    }

    const auto require = [&](const char* name, std::size_t* index) {
        const auto it = header_index.find(name);
        if (it == header_index.end()) {
            return SetError(std::string("missing header column: ") + name, error);
        }
        *index = it->second;
        return true;
    };
    if (!require("type", &layout->type) || !require("client", &layout->client) ||
        !require("tx", &layout->tx)) {
        return false;
    }
    if (const auto it = header_index.find("amount"); it != header_index.end()) {
        layout->amount = it->second;
    }
    layout->width = headers.size();
    return true;
}

bool ParseRecord(const ColumnLayout& layout,
                 const std::vector<std::string>& cells,
                 Transaction* out,
                 bool* amount_absent,
                 std::string* error) {
    if (cells.size() > layout.width) {
        return SetError("expected at most " + std::to_string(layout.width) + " fields, found " +
                            std::to_string(cells.size()),
                        error);
    }

    const auto cell = [&](std::size_t index) -> std::optional<std::string> {
        if (index >= cells.size()) {
            return std::nullopt;
        }
        return Trim(cells[index]);
    };

    const auto type_cell = cell(layout.type);
    const auto client_cell = cell(layout.client);
    const auto tx_cell = cell(layout.tx);
    if (!type_cell.has_value() || !client_cell.has_value() || !tx_cell.has_value()) {
        return SetError("record is missing a type, client or tx field", error);
    }

    Transaction transaction;
    if (!ParseTransactionType(*type_cell, &transaction.type)) {
        return SetError("unknown transaction type '" + *type_cell + "'", error);
    }

    std::uint64_t client_id = 0;
    if (!ParseUnsigned(*client_cell, std::numeric_limits<ClientId>::max(), &client_id)) {
        return SetError("invalid client id '" + *client_cell + "'", error);
    }
    transaction.client_id = static_cast<ClientId>(client_id);

    std::uint64_t tx_id = 0;
    if (!ParseUnsigned(*tx_cell, std::numeric_limits<TxId>::max(), &tx_id)) {
        return SetError("invalid tx id '" + *tx_cell + "'", error);
    }
    transaction.tx_id = static_cast<TxId>(tx_id);

    // Dispute-family records point at another transaction's amount and never carry one.
    if (IsReferenceable(transaction.type) && layout.amount.has_value()) {
        const auto amount_cell = cell(*layout.amount);
        Amount amount = 0;
        const auto status =
            amount_cell.has_value()
                ? FixedDecimal::TryParse(*amount_cell, kAmountScale, FixedRoundingMode::kHalfUp,
                                         &amount)
                : FixedParseStatus::kMalformed;
        if (status == FixedParseStatus::kOutOfRange) {
            return SetError("amount out of range '" + *amount_cell + "'", error);
        }
        if (status == FixedParseStatus::kOk) {
            transaction.amount = amount;
        }
    }
    *amount_absent = IsReferenceable(transaction.type) && !transaction.amount.has_value();

    *out = std::move(transaction);
    return true;
}

}  // namespace

std::vector<std::string> SplitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;
    for (char ch : line) {
        if (ch == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (ch == ',' && !in_quotes) {
            cells.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    cells.push_back(current);
    return cells;
}

bool TransactionCsvReader::LoadFromFile(const std::string& path,
                                        std::deque<Transaction>* out,
                                        std::string* error) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return SetError("unable to open transactions file: " + path, error);
    }
    return LoadFromStream(input, path, out, error);
}

bool TransactionCsvReader::LoadFromStream(std::istream& input,
                                          const std::string& source_name,
                                          std::deque<Transaction>* out,
                                          std::string* error) {
    if (out == nullptr) {
        return SetError("transaction output is null", error);
    }
    stats_ = TransactionCsvStats{};

    std::string line;
    std::size_t line_number = 0;
    ColumnLayout layout;
    bool have_header = false;
    std::deque<Transaction> loaded;
    while (std::getline(input, line)) {
        ++line_number;
        ++stats_.lines_total;
        if (line_number == 1 && line.compare(0, sizeof(kUtf8Bom) - 1, kUtf8Bom) == 0) {
            line.erase(0, sizeof(kUtf8Bom) - 1);
        }
        if (Trim(line).empty()) {
            ++stats_.blank_lines;
            continue;
        }

        std::string record_error;
        if (!have_header) {
            if (!ParseHeader(line, &layout, &record_error)) {
                return SetError(source_name + ":" + std::to_string(line_number) + ": " +
                                    record_error,
                                error);
            }
            have_header = true;
            continue;
        }

        Transaction transaction;
        bool amount_absent = false;
        if (!ParseRecord(layout, SplitCsvLine(line), &transaction, &amount_absent,
                         &record_error)) {
            return SetError(
                source_name + ":" + std::to_string(line_number) + ": " + record_error, error);
        }
        if (amount_absent) {
            ++stats_.absent_amounts;
        }
        loaded.push_back(std::move(transaction));
        ++stats_.records_loaded;
    }

    if (input.bad()) {
        return SetError("read failure on transactions input: " + source_name, error);
    }
    if (!have_header) {
        return SetError("transactions input has no header row: " + source_name, error);
    }

    *out = std::move(loaded);
    return true;
}

}  // namespace tx_ledger
