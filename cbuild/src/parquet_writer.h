#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>
#include <memory>
#include <string>
#include <vector>

#include "profile_record.h"
#include "logger.h"

namespace profile_export {

/**
 * Arrow schema of a profile table part file.
 */
inline std::shared_ptr<arrow::Schema> profile_schema() {
    return arrow::schema({
        arrow::field("distinct_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("last_seen", arrow::utf8()),
        arrow::field("properties", arrow::utf8(), /*nullable=*/false)
    });
}

/**
 * Write ProfileRecords to a Parquet file.
 *
 * Each write_batch() call is capped at `row_group_size` rows per row group,
 * so the export batch size maps directly to the commit granularity.
 */
class ParquetWriter {
public:
    /**
     * Open a Parquet file for writing.
     *
     * @param path Output file path
     * @param compression Compression codec (UNCOMPRESSED, SNAPPY, GZIP, LZ4, ZSTD)
     * @param row_group_size Maximum rows per row group
     */
    explicit ParquetWriter(const std::string& path,
                           parquet::Compression::type compression = parquet::Compression::SNAPPY,
                           size_t row_group_size = 1000)
        : path_(path), rows_written_(0) {

        schema_ = profile_schema();

        auto maybe_file = arrow::io::FileOutputStream::Open(path);
        if (!maybe_file.ok()) {
            throw std::runtime_error("Failed to open Parquet file for writing: " + path +
                                   " - " + maybe_file.status().ToString());
        }
        file_ = *maybe_file;

        parquet::WriterProperties::Builder props_builder;
        props_builder.compression(compression);
        props_builder.version(parquet::ParquetVersion::PARQUET_2_6);
        props_builder.max_row_group_length(static_cast<int64_t>(row_group_size));

        auto props = props_builder.build();

        auto status_writer = parquet::arrow::FileWriter::Open(
            *schema_,
            arrow::default_memory_pool(),
            file_,
            props
        );

        if (!status_writer.ok()) {
            throw std::runtime_error("Failed to create Parquet writer: " +
                                   status_writer.status().ToString());
        }
        writer_ = std::move(*status_writer);
    }

    /**
     * Write a batch of ProfileRecords to the Parquet file.
     * A missing last_seen is stored as null.
     */
    void write_batch(const std::vector<ProfileRecord>& records) {
        write_batch(records, 0, records.size());
    }

    /**
     * Write records[begin, end).
     */
    void write_batch(const std::vector<ProfileRecord>& records, size_t begin, size_t end) {
        if (begin >= end) {
            return;
        }

        arrow::StringBuilder distinct_id_builder;
        arrow::StringBuilder last_seen_builder;
        arrow::StringBuilder properties_builder;

        for (size_t i = begin; i < end; ++i) {
            const ProfileRecord& record = records[i];

            auto status = distinct_id_builder.Append(record.distinct_id);
            if (!status.ok()) {
                throw std::runtime_error("Parquet append failed: " + status.ToString());
            }

            if (record.last_seen) {
                status = last_seen_builder.Append(*record.last_seen);
            } else {
                status = last_seen_builder.AppendNull();
            }
            if (!status.ok()) throw std::runtime_error("Parquet append failed");

            status = properties_builder.Append(record.properties_json);
            if (!status.ok()) throw std::runtime_error("Parquet append failed");
        }

        auto maybe_distinct_id = distinct_id_builder.Finish();
        auto maybe_last_seen = last_seen_builder.Finish();
        auto maybe_properties = properties_builder.Finish();

        if (!maybe_distinct_id.ok() || !maybe_last_seen.ok() || !maybe_properties.ok()) {
            throw std::runtime_error("Failed to finish Parquet builders");
        }

        auto batch = arrow::RecordBatch::Make(
            schema_,
            static_cast<int64_t>(end - begin),
            {
                *maybe_distinct_id,
                *maybe_last_seen,
                *maybe_properties
            }
        );

        auto status = writer_->WriteRecordBatch(*batch);
        if (!status.ok()) {
            throw std::runtime_error("Failed to write Parquet batch: " + status.ToString());
        }

        rows_written_ += end - begin;
    }

    /**
     * Finalize the file footer. Unlike the destructor, reports failures.
     */
    void close() {
        if (writer_) {
            auto status = writer_->Close();
            writer_.reset();
            if (!status.ok()) {
                throw std::runtime_error("Failed to close Parquet writer: " + status.ToString());
            }
        }

        if (file_) {
            auto status = file_->Close();
            file_.reset();
            if (!status.ok()) {
                throw std::runtime_error("Failed to close Parquet file: " + status.ToString());
            }
        }

        LOG_DEBUG("Wrote " + std::to_string(rows_written_) + " rows to Parquet: " + path_);
    }

    uint64_t rows_written() const { return rows_written_; }

    ~ParquetWriter() {
        try {
            close();
        } catch (const std::exception& e) {
            LOG_WARNING(std::string("Closing Parquet writer during cleanup: ") + e.what());
        }
    }

    // No copying
    ParquetWriter(const ParquetWriter&) = delete;
    ParquetWriter& operator=(const ParquetWriter&) = delete;

private:
    std::string path_;
    std::shared_ptr<arrow::Schema> schema_;
    std::shared_ptr<arrow::io::FileOutputStream> file_;
    std::unique_ptr<parquet::arrow::FileWriter> writer_;
    uint64_t rows_written_;
};

} // namespace profile_export
