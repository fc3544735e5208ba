#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>

#include "cancellation.h"
#include "page_client.h"
#include "time_utils.h"

namespace profile_export {

/**
 * Raised when the export cannot start: page 0 could not be fetched, so
 * there is no session to continue with.
 */
class FatalExportError : public std::runtime_error {
public:
    explicit FatalExportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Outcome of one page, reported once that outcome is final.
 */
struct PageProgress {
    int page_index = 0;
    std::optional<int> total_pages;  // Unknown while pages are discovered
    size_t rows = 0;
    bool success = false;
    std::optional<std::string> error;
    size_t cumulative_rows = 0;
};

using PageProgressCallback = std::function<void(const PageProgress&)>;

/**
 * Parameters of one export invocation. Read-only once the export starts.
 */
struct FetchSpec {
    std::string table;
    std::optional<std::string> where;
    std::optional<std::string> cohort_id;
    std::optional<std::vector<std::string>> output_properties;
    bool append = false;
    size_t max_workers = 5;                // Capped at kMaxProfileWorkers
    size_t batch_size = 1000;              // Rows per store commit
    size_t max_consecutive_failures = 3;   // Stop exploring after this many failed fetches in a row
    PageProgressCallback on_page_complete;
    CancellationToken* cancellation = nullptr;  // Not owned

    PageFilters filters() const {
        PageFilters f;
        f.where = where;
        f.cohort_id = cohort_id;
        f.output_properties = output_properties;
        return f;
    }
};

/**
 * Aggregate outcome of an export.
 *
 * successful_pages + failed_pages equals the number of pages attempted.
 */
struct ExportResult {
    std::string table;
    size_t total_rows = 0;
    size_t successful_pages = 0;
    size_t failed_pages = 0;
    std::vector<int> failed_page_indices;
    double duration_seconds = 0.0;
    time_utils::TimePoint fetched_at;
    bool cancelled = false;

    bool has_failures() const { return failed_pages > 0; }
};

} // namespace profile_export
