#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <parquet/properties.h>

#include "file_utils.h"
#include "json_parser.h"
#include "logger.h"
#include "parquet_reader.h"
#include "parquet_writer.h"
#include "string_utils.h"
#include "table_store.h"
#include "time_utils.h"

/**
 * Local table store backed by Parquet part files.
 *
 * Layout:
 *   <root>/<table>/part-00000.parquet   first write (create)
 *   <root>/<table>/part-00001.parquet   each append adds one part
 *   <root>/<table>/_metadata.json       {"type", "fetched_at", "filter_where"}
 *
 * Part files are written as *.inprogress and renamed when complete, so a
 * failed write never leaves a partial part behind.
 */
namespace profile_export {

/**
 * Convert compression string to Parquet compression type.
 */
inline parquet::Compression::type parse_compression(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "none" || lower == "uncompressed") {
        return parquet::Compression::UNCOMPRESSED;
    } else if (lower == "snappy") {
        return parquet::Compression::SNAPPY;
    } else if (lower == "gzip" || lower == "gz") {
        return parquet::Compression::GZIP;
    } else if (lower == "lz4") {
        return parquet::Compression::LZ4;
    } else if (lower == "zstd") {
        return parquet::Compression::ZSTD;
    } else {
        throw std::runtime_error("Unknown compression type: " + str +
                               " (valid: none, snappy, gzip, lz4, zstd)");
    }
}

class ParquetTableStore : public TableStore {
public:
    static constexpr const char* kMetadataFile = "_metadata.json";
    static constexpr const char* kPartExtension = ".parquet";

    explicit ParquetTableStore(const fs::path& root,
                               parquet::Compression::type compression = parquet::Compression::SNAPPY)
        : root_(root), compression_(compression) {
        file_utils::create_directories(root_);
    }

    size_t create_table(const std::string& name,
                        const std::vector<ProfileRecord>& records,
                        const TableMetadata& metadata,
                        size_t batch_size) override {
        const fs::path dir = table_dir(name);
        if (fs::exists(dir)) {
            throw TableExistsError(name);
        }
        validate_records(records);

        file_utils::create_directories(dir);
        try {
            size_t rows = write_part(dir, records, batch_size);
            write_metadata(dir, metadata);
            LOG_INFO("Created table " + name + " (" + std::to_string(rows) + " rows)");
            return rows;
        } catch (...) {
            file_utils::remove_directory(dir);
            throw;
        }
    }

    size_t append_table(const std::string& name,
                        const std::vector<ProfileRecord>& records,
                        const TableMetadata& metadata,
                        size_t batch_size) override {
        const fs::path dir = table_dir(name);
        if (!fs::is_directory(dir)) {
            throw TableNotFoundError(name);
        }
        validate_records(records);

        size_t rows = write_part(dir, records, batch_size);
        write_metadata(dir, metadata);
        return rows;
    }

    bool table_exists(const std::string& name) const {
        return fs::is_directory(table_dir(name));
    }

    /**
     * Tables under the root, sorted by name.
     */
    std::vector<std::string> list_tables() const {
        std::vector<std::string> tables;
        for (const auto& entry : fs::directory_iterator(root_)) {
            if (entry.is_directory()) {
                tables.push_back(entry.path().filename().string());
            }
        }
        std::sort(tables.begin(), tables.end());
        return tables;
    }

    uint64_t row_count(const std::string& name) const {
        uint64_t total = 0;
        for (const auto& part : existing_parts(name)) {
            total += static_cast<uint64_t>(parquet_row_count(part.string()));
        }
        return total;
    }

    /**
     * All rows of a table, in part (write) order.
     */
    std::vector<ProfileRecord> read_table(const std::string& name) const {
        std::vector<ProfileRecord> records;
        for (const auto& part : existing_parts(name)) {
            ParquetReader reader(part.string());
            records.reserve(records.size() + static_cast<size_t>(reader.num_rows()));
            ProfileRecord record;
            while (reader.next(record)) {
                records.push_back(std::move(record));
            }
        }
        return records;
    }

    json::Value read_metadata(const std::string& name) const {
        const fs::path dir = table_dir(name);
        if (!fs::is_directory(dir)) {
            throw TableNotFoundError(name);
        }
        return json::parse_file((dir / kMetadataFile).string());
    }

    const fs::path& root() const { return root_; }

private:
    fs::path table_dir(const std::string& name) const {
        if (!string_utils::is_valid_table_name(name)) {
            throw std::invalid_argument("Invalid table name: '" + name + "'");
        }
        return root_ / name;
    }

    std::vector<fs::path> existing_parts(const std::string& name) const {
        const fs::path dir = table_dir(name);
        if (!fs::is_directory(dir)) {
            throw TableNotFoundError(name);
        }
        return file_utils::list_files(dir, kPartExtension);
    }

    /**
     * Malformed rows fail the whole write before anything touches disk.
     */
    static void validate_records(const std::vector<ProfileRecord>& records) {
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].distinct_id.empty()) {
                throw std::runtime_error("Record " + std::to_string(i) +
                                       " has no distinct_id");
            }
        }
    }

    size_t write_part(const fs::path& dir,
                      const std::vector<ProfileRecord>& records,
                      size_t batch_size) {
        if (batch_size == 0) {
            batch_size = records.size() > 0 ? records.size() : 1;
        }

        size_t part_number = file_utils::list_files(dir, kPartExtension).size();
        char filename[32];
        std::snprintf(filename, sizeof(filename), "part-%05zu.parquet", part_number);

        const fs::path final_path = dir / filename;
        fs::path tmp_path = final_path;
        tmp_path += ".inprogress";

        try {
            ParquetWriter writer(tmp_path.string(), compression_, batch_size);
            for (size_t begin = 0; begin < records.size(); begin += batch_size) {
                size_t end = std::min(records.size(), begin + batch_size);
                writer.write_batch(records, begin, end);
            }
            writer.close();
        } catch (...) {
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw;
        }

        fs::rename(tmp_path, final_path);
        return records.size();
    }

    static void write_metadata(const fs::path& dir, const TableMetadata& metadata) {
        json::Value doc = json::Value::make_object();
        doc.object["type"] = json::Value::make_string(metadata.type);
        doc.object["fetched_at"] =
            json::Value::make_string(time_utils::to_rfc3339_utc(metadata.fetched_at));
        doc.object["filter_where"] = metadata.filter_where
            ? json::Value::make_string(*metadata.filter_where)
            : json::Value();
        file_utils::write_file_atomic(dir / kMetadataFile, json::serialize(doc) + "\n");
    }

    fs::path root_;
    parquet::Compression::type compression_;
};

} // namespace profile_export
