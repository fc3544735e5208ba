#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include "profile_record.h"

namespace profile_export {

class TableExistsError : public std::runtime_error {
public:
    explicit TableExistsError(const std::string& table)
        : std::runtime_error("Table already exists: " + table) {}
};

class TableNotFoundError : public std::runtime_error {
public:
    explicit TableNotFoundError(const std::string& table)
        : std::runtime_error("Table not found: " + table) {}
};

/**
 * Append-only local table store.
 *
 * Not safe for concurrent use: the export engine guarantees that a single
 * thread calls it for the whole lifetime of an export.
 */
class TableStore {
public:
    virtual ~TableStore() = default;

    /**
     * Create `name` and write `records` to it.
     * Throws TableExistsError if the table already exists.
     *
     * @param batch_size Rows per commit; does not affect the result
     * @return Number of rows written
     */
    virtual size_t create_table(const std::string& name,
                                const std::vector<ProfileRecord>& records,
                                const TableMetadata& metadata,
                                size_t batch_size) = 0;

    /**
     * Append `records` to an existing table.
     * Throws TableNotFoundError if the table does not exist.
     */
    virtual size_t append_table(const std::string& name,
                                const std::vector<ProfileRecord>& records,
                                const TableMetadata& metadata,
                                size_t batch_size) = 0;
};

} // namespace profile_export
