#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/exception.h>
#include <parquet/file_reader.h>
#include <memory>
#include <string>

#include "profile_record.h"
#include "logger.h"

namespace profile_export {

/**
 * Read ProfileRecords back from a table part file.
 *
 * Loads the whole file on open; part files hold one page of profiles each.
 */
class ParquetReader {
public:
    explicit ParquetReader(const std::string& path)
        : path_(path), current_row_idx_(0) {

        auto maybe_file = arrow::io::ReadableFile::Open(path);
        if (!maybe_file.ok()) {
            throw std::runtime_error("Failed to open Parquet file for reading: " + path +
                                   " - " + maybe_file.status().ToString());
        }
        file_ = *maybe_file;

        parquet::arrow::FileReaderBuilder builder;
        auto status = builder.Open(file_);
        if (!status.ok()) {
            throw std::runtime_error("Failed to open Parquet reader: " + status.ToString());
        }
        std::unique_ptr<parquet::arrow::FileReader> reader;
        status = builder.Build(&reader);
        if (!status.ok()) {
            throw std::runtime_error("Failed to build Parquet reader: " + status.ToString());
        }

        std::shared_ptr<arrow::Table> table;
        status = reader->ReadTable(&table);
        if (!status.ok()) {
            throw std::runtime_error("Failed to read Parquet table " + path + ": " +
                                   status.ToString());
        }

        auto maybe_combined = table->CombineChunksToBatch();
        if (!maybe_combined.ok()) {
            throw std::runtime_error("Failed to combine Parquet chunks: " +
                                   maybe_combined.status().ToString());
        }
        batch_ = *maybe_combined;
        if (batch_->num_columns() != 3) {
            throw std::runtime_error("Unexpected column count in " + path);
        }
    }

    /**
     * Read the next record.
     *
     * @return true if a record was read, false at end of file
     */
    bool next(ProfileRecord& record) {
        if (current_row_idx_ >= batch_->num_rows()) {
            return false;
        }
        record = read_row(current_row_idx_++);
        return true;
    }

    int64_t num_rows() const { return batch_->num_rows(); }

    ~ParquetReader() {
        if (file_) {
            auto status = file_->Close();
            if (!status.ok()) {
                LOG_WARNING("Failed to close " + path_ + ": " + status.ToString());
            }
        }
    }

    // No copying
    ParquetReader(const ParquetReader&) = delete;
    ParquetReader& operator=(const ParquetReader&) = delete;

private:
    ProfileRecord read_row(int64_t row_idx) {
        auto distinct_id_array = std::static_pointer_cast<arrow::StringArray>(batch_->column(0));
        auto last_seen_array = std::static_pointer_cast<arrow::StringArray>(batch_->column(1));
        auto properties_array = std::static_pointer_cast<arrow::StringArray>(batch_->column(2));

        ProfileRecord record;
        record.distinct_id = distinct_id_array->GetString(row_idx);
        if (!last_seen_array->IsNull(row_idx)) {
            record.last_seen = last_seen_array->GetString(row_idx);
        }
        record.properties_json = properties_array->GetString(row_idx);
        return record;
    }

    std::string path_;
    std::shared_ptr<arrow::io::ReadableFile> file_;
    std::shared_ptr<arrow::RecordBatch> batch_;
    int64_t current_row_idx_;
};

/**
 * Row count from the Parquet footer, without reading any data pages.
 */
inline int64_t parquet_row_count(const std::string& path) {
    std::unique_ptr<parquet::ParquetFileReader> reader;
    try {
        reader = parquet::ParquetFileReader::OpenFile(path, /*memory_map=*/false);
    } catch (const parquet::ParquetException& e) {
        throw std::runtime_error("Failed to open Parquet file " + path + ": " + e.what());
    }
    return reader->metadata()->num_rows();
}

} // namespace profile_export
