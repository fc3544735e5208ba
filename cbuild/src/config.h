#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "export_types.h"
#include "json_parser.h"

/**
 * Configuration for one profile export.
 *
 * The config file is a JSON object; every key is optional and command-line
 * flags override whatever the file sets:
 * {
 *   "table": "profiles",
 *   "where": "properties[\"plan\"] == \"pro\"",
 *   "cohort_id": "12345",
 *   "output_properties": ["$email", "plan"],
 *   "append": false,
 *   "workers": 5,
 *   "batch_size": 1000,
 *   "max_consecutive_failures": 3,
 *   "source_dir": "recorded/profiles",
 *   "store_dir": "data",
 *   "compression": "snappy"
 * }
 */
namespace profile_export {

struct ExportConfig {
    std::string table = "profiles";
    std::optional<std::string> where;
    std::optional<std::string> cohort_id;
    std::optional<std::vector<std::string>> output_properties;
    bool append = false;
    size_t workers = 5;
    size_t batch_size = 1000;
    size_t max_consecutive_failures = 3;
    std::string source_dir;             // Directory of recorded pages
    std::string store_dir = "data";     // Root of the table store
    std::string compression = "snappy"; // Parquet compression: none, snappy, gzip, lz4, zstd

    /**
     * Load configuration from a JSON file.
     */
    static ExportConfig load_from_file(const std::string& config_path) {
        json::Value root = json::parse_file(config_path);
        ExportConfig config;
        config.merge(root);
        return config;
    }

    /**
     * Apply the keys present in `root` on top of the current values.
     * Unknown keys are ignored; keys of the wrong type are errors.
     */
    void merge(const json::Value& root) {
        if (root.type != json::Value::OBJECT) {
            throw std::runtime_error("Config: root must be a JSON object");
        }

        read_string(root, "table", table);
        read_optional_string(root, "where", where);
        read_optional_string(root, "cohort_id", cohort_id);

        if (const json::Value* props = root.find("output_properties")) {
            if (props->is_null()) {
                output_properties.reset();
            } else if (props->is_array()) {
                std::vector<std::string> names;
                for (const auto& item : props->array) {
                    if (!item.is_string()) {
                        throw std::runtime_error("Config: 'output_properties' must contain strings");
                    }
                    names.push_back(item.string);
                }
                output_properties = std::move(names);
            } else {
                throw std::runtime_error("Config: 'output_properties' must be an array");
            }
        }

        if (const json::Value* value = root.find("append")) {
            if (!value->is_bool()) {
                throw std::runtime_error("Config: 'append' must be a boolean");
            }
            append = value->boolean;
        }

        read_count(root, "workers", workers);
        read_count(root, "batch_size", batch_size);
        read_count(root, "max_consecutive_failures", max_consecutive_failures);
        read_string(root, "source_dir", source_dir);
        read_string(root, "store_dir", store_dir);
        read_string(root, "compression", compression);
    }

    /**
     * Check the values an export cannot run without.
     */
    void validate() const {
        if (table.empty()) {
            throw std::runtime_error("Config: 'table' must not be empty");
        }
        if (source_dir.empty()) {
            throw std::runtime_error("Config: 'source_dir' is required");
        }
        if (store_dir.empty()) {
            throw std::runtime_error("Config: 'store_dir' must not be empty");
        }
        if (workers == 0 || batch_size == 0 || max_consecutive_failures == 0) {
            throw std::runtime_error("Config: workers, batch_size and "
                                     "max_consecutive_failures must be positive");
        }
    }

    FetchSpec to_fetch_spec() const {
        FetchSpec spec;
        spec.table = table;
        spec.where = where;
        spec.cohort_id = cohort_id;
        spec.output_properties = output_properties;
        spec.append = append;
        spec.max_workers = workers;
        spec.batch_size = batch_size;
        spec.max_consecutive_failures = max_consecutive_failures;
        return spec;
    }

private:
    static void read_string(const json::Value& root, const std::string& key, std::string& out) {
        if (const json::Value* value = root.find(key)) {
            if (!value->is_string()) {
                throw std::runtime_error("Config: '" + key + "' must be a string");
            }
            out = value->string;
        }
    }

    static void read_optional_string(const json::Value& root, const std::string& key,
                                     std::optional<std::string>& out) {
        if (const json::Value* value = root.find(key)) {
            if (value->is_null()) {
                out.reset();
            } else if (value->is_string()) {
                out = value->string;
            } else {
                throw std::runtime_error("Config: '" + key + "' must be a string or null");
            }
        }
    }

    static void read_count(const json::Value& root, const std::string& key, size_t& out) {
        if (const json::Value* value = root.find(key)) {
            if (!value->is_number() || value->number < 1 ||
                value->number != std::floor(value->number) ||
                value->number >= static_cast<double>(std::numeric_limits<size_t>::max())) {
                throw std::runtime_error("Config: '" + key + "' must be a positive integer");
            }
            out = static_cast<size_t>(value->number);
        }
    }
};

} // namespace profile_export
