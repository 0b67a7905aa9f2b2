#include "tx_ledger/io/account_snapshot_parquet_writer.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#if TX_LEDGER_ENABLE_ARROW_PARQUET
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#endif

namespace tx_ledger {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

#if TX_LEDGER_ENABLE_ARROW_PARQUET
// int64 scaled amounts need at most 19 significant digits.
constexpr std::int32_t kAmountPrecision = 19;

bool ExpectArrowStatus(const arrow::Status& status, const std::string& prefix, std::string* error) {
    if (status.ok()) {
        return true;
    }
    return SetError(prefix + ": " + status.ToString(), error);
}

template <typename BuilderT>
bool FinishArray(BuilderT* builder, const std::string& name, std::shared_ptr<arrow::Array>* out,
                 std::string* error) {
    const auto status = builder->Finish(out);
    return ExpectArrowStatus(status, "failed to finalize account snapshot field '" + name + "'",
                             error);
}
#endif

}  // namespace

bool AccountSnapshotParquetWriter::Open(const std::string& output_path, std::string* error) {
    if (is_open_) {
        return SetError("account snapshot writer is already open", error);
    }
    if (output_path.empty()) {
        return SetError("account snapshot output path is empty", error);
    }

#if !TX_LEDGER_ENABLE_ARROW_PARQUET
    (void)output_path;
    return SetError("account snapshot parquet requires TX_LEDGER_ENABLE_ARROW_PARQUET=ON", error);
#else
    try {
        const std::filesystem::path path(output_path);
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::exception& ex) {
        return SetError(std::string("failed to prepare account snapshot path: ") + ex.what(),
                        error);
    }

    output_path_ = output_path;
    rows_written_ = 0;
    rows_.clear();
    is_open_ = true;
    return true;
#endif
}

bool AccountSnapshotParquetWriter::Append(const Account& account, std::string* error) {
    if (!is_open_) {
        return SetError("account snapshot writer is not open", error);
    }

#if !TX_LEDGER_ENABLE_ARROW_PARQUET
    (void)account;
    return SetError("account snapshot parquet requires TX_LEDGER_ENABLE_ARROW_PARQUET=ON", error);
#else
    rows_.push_back(account);
    ++rows_written_;
    return true;
#endif
}

bool AccountSnapshotParquetWriter::Close(std::string* error) {
    if (!is_open_) {
        return true;
    }

#if !TX_LEDGER_ENABLE_ARROW_PARQUET
    return SetError("account snapshot parquet requires TX_LEDGER_ENABLE_ARROW_PARQUET=ON", error);
#else
    const auto amount_type = arrow::decimal128(kAmountPrecision, kAmountScale);
    arrow::UInt16Builder client_builder;
    arrow::Decimal128Builder available_builder(amount_type);
    arrow::Decimal128Builder held_builder(amount_type);
    arrow::Decimal128Builder total_builder(amount_type);
    arrow::BooleanBuilder locked_builder;

    for (const auto& row : rows_) {
        if (!ExpectArrowStatus(client_builder.Append(row.client_id), "failed appending client",
                               error) ||
            !ExpectArrowStatus(available_builder.Append(arrow::Decimal128(row.available)),
                               "failed appending available", error) ||
            !ExpectArrowStatus(held_builder.Append(arrow::Decimal128(row.held)),
                               "failed appending held", error) ||
            !ExpectArrowStatus(total_builder.Append(arrow::Decimal128(row.total)),
                               "failed appending total", error) ||
            !ExpectArrowStatus(locked_builder.Append(row.locked), "failed appending locked",
                               error)) {
            return false;
        }
    }

    std::shared_ptr<arrow::Array> client_array;
    std::shared_ptr<arrow::Array> available_array;
    std::shared_ptr<arrow::Array> held_array;
    std::shared_ptr<arrow::Array> total_array;
    std::shared_ptr<arrow::Array> locked_array;
    if (!FinishArray(&client_builder, "client", &client_array, error) ||
        !FinishArray(&available_builder, "available", &available_array, error) ||
        !FinishArray(&held_builder, "held", &held_array, error) ||
        !FinishArray(&total_builder, "total", &total_array, error) ||
        !FinishArray(&locked_builder, "locked", &locked_array, error)) {
        return false;
    }

    auto schema = arrow::schema({
        arrow::field("client", arrow::uint16(), false),
        arrow::field("available", amount_type, false),
        arrow::field("held", amount_type, false),
        arrow::field("total", amount_type, false),
        arrow::field("locked", arrow::boolean(), false),
    });

    auto table = arrow::Table::Make(
        schema, {client_array, available_array, held_array, total_array, locked_array});

    const std::filesystem::path output_path(output_path_);
    const std::filesystem::path tmp_path(output_path_ + ".tmp");

    auto file_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!file_result.ok()) {
        return SetError("failed to open account snapshot parquet output: " +
                            file_result.status().ToString(),
                        error);
    }
    std::shared_ptr<arrow::io::FileOutputStream> output_stream = file_result.ValueOrDie();

    parquet::WriterProperties::Builder writer_props_builder;
    writer_props_builder.compression(parquet::Compression::SNAPPY);
    std::shared_ptr<parquet::WriterProperties> writer_props = writer_props_builder.build();
    parquet::ArrowWriterProperties::Builder arrow_props_builder;
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_props = arrow_props_builder.build();

    const auto write_status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), output_stream,
        std::max<std::int64_t>(1, rows_written_), writer_props, arrow_props);
    if (!write_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to write account snapshot parquet: " + write_status.ToString(),
                        error);
    }

    const auto close_status = output_stream->Close();
    if (!close_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError(
            "failed to close account snapshot parquet file: " + close_status.ToString(), error);
    }

    try {
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        std::filesystem::rename(tmp_path, output_path);
    } catch (const std::exception& ex) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError(std::string("failed to finalize account snapshot parquet: ") + ex.what(),
                        error);
    }

    rows_.clear();
    is_open_ = false;
    return true;
#endif
}

bool WriteAccountSnapshotParquet(const AccountMap& accounts,
                                 const std::string& output_path,
                                 std::string* error) {
    AccountSnapshotParquetWriter writer;
    if (!writer.Open(output_path, error)) {
        return false;
    }
    for (const auto& [client_id, account] : accounts) {
        (void)client_id;
        if (!writer.Append(account, error)) {
            return false;
        }
    }
    return writer.Close(error);
}

}  // namespace tx_ledger
