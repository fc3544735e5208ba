#pragma once

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bounded_queue.h"
#include "export_types.h"
#include "logger.h"
#include "page_client.h"
#include "profile_transform.h"
#include "string_utils.h"
#include "table_store.h"
#include "time_utils.h"

/**
 * Parallel profile export.
 *
 * Page 0 is fetched synchronously to obtain the session id, then a pool of
 * fetch workers walks the remaining pages while a single writer thread
 * drains a bounded queue into the TableStore:
 *
 *   coordinator --page index--> fetch workers --WriteTask--> writer --> TableStore
 *        ^                           |
 *        +------ FetchCompletion ----+
 *
 * Each fetched page reports has_more to the coordinator, which submits the
 * next page index. The writer is the only thread that touches the store.
 */
namespace profile_export {

// Profile export is more conservative than other exports: every worker
// consumes the hourly request quota.
constexpr size_t kMaxProfileWorkers = 5;
constexpr size_t kDefaultProfileWorkers = 5;

// The Engage API allows 60 requests per hour.
constexpr size_t kRateLimitWarningThreshold = 48;

namespace detail {

/**
 * Unit of work for the writer. Moved into the queue by a fetch worker and
 * moved out exactly once by the writer.
 */
struct WriteTask {
    std::vector<ProfileRecord> records;
    TableMetadata metadata;
    int page_index = 0;
    size_t rows = 0;
};

/**
 * Fetch outcome sent from a fetch worker to the coordinator.
 */
struct FetchCompletion {
    enum Status { FETCHED, FAILED, SKIPPED };

    int page_index = 0;
    Status status = FAILED;
    bool has_more = false;
    std::string error;
};

/**
 * Counters shared by the coordinator, the fetch workers and the writer.
 * Every mutation goes through one mutex; progress callbacks are serialized
 * on a second one so they never run concurrently with each other.
 */
class ExportAggregator {
public:
    explicit ExportAggregator(PageProgressCallback callback)
        : callback_(std::move(callback)) {}

    void record_success(int page_index, size_t rows) {
        PageProgress progress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            total_rows_ += rows;
            ++successful_pages_;
            progress = make_progress(page_index, rows, true, std::nullopt);
        }
        notify(progress);
    }

    void record_failure(int page_index, const std::string& error) {
        PageProgress progress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++failed_pages_;
            failed_page_indices_.push_back(page_index);
            progress = make_progress(page_index, 0, false, error);
        }
        notify(progress);
    }

    void fill(ExportResult& result) const {
        std::lock_guard<std::mutex> lock(mutex_);
        result.total_rows = total_rows_;
        result.successful_pages = successful_pages_;
        result.failed_pages = failed_pages_;
        result.failed_page_indices = failed_page_indices_;
    }

private:
    PageProgress make_progress(int page_index, size_t rows, bool success,
                               std::optional<std::string> error) const {
        PageProgress progress;
        progress.page_index = page_index;
        progress.total_pages = std::nullopt;
        progress.rows = rows;
        progress.success = success;
        progress.error = std::move(error);
        progress.cumulative_rows = total_rows_;
        return progress;
    }

    void notify(const PageProgress& progress) {
        if (!callback_) {
            return;
        }
        std::lock_guard<std::mutex> lock(callback_mutex_);
        try {
            callback_(progress);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress callback failed for page " +
                      std::to_string(progress.page_index) + ": " + e.what());
        } catch (...) {
            LOG_ERROR("Progress callback failed for page " +
                      std::to_string(progress.page_index) + ": unknown error");
        }
    }

    PageProgressCallback callback_;
    mutable std::mutex mutex_;
    std::mutex callback_mutex_;
    size_t total_rows_ = 0;
    size_t successful_pages_ = 0;
    size_t failed_pages_ = 0;
    std::vector<int> failed_page_indices_;
};

inline WriteTask make_write_task(const ProfilePage& page, const FetchSpec& spec) {
    WriteTask task;
    task.records.reserve(page.profiles.size());
    for (const auto& raw : page.profiles) {
        task.records.push_back(transform_profile(raw));
    }
    task.metadata.type = "profiles";
    task.metadata.fetched_at = time_utils::Clock::now();
    task.metadata.filter_where = spec.where;
    task.page_index = page.page_index;
    task.rows = task.records.size();
    return task;
}

} // namespace detail

/**
 * Exports all profile pages of one query into a table.
 *
 * The client must tolerate concurrent fetch_page() calls; the store is only
 * ever called from one thread at a time.
 */
class ParallelProfileFetcher {
public:
    ParallelProfileFetcher(PageClient& client, TableStore& store)
        : client_(client), store_(store) {}

    /**
     * Fetch every page and write it to `spec.table`.
     *
     * Per-page fetch and write failures are recorded in the result. Throws
     * FatalExportError if page 0 cannot be fetched, and
     * std::invalid_argument for an unusable spec.
     */
    ExportResult fetch_profiles(const FetchSpec& spec) {
        validate(spec);

        auto steady_start = std::chrono::steady_clock::now();
        size_t requested = spec.max_workers == 0 ? kDefaultProfileWorkers : spec.max_workers;
        size_t workers = std::min(requested, kMaxProfileWorkers);

        LOG_INFO("Starting parallel profile fetch with " + std::to_string(workers) + " workers");

        const PageFilters filters = spec.filters();
        ProfilePage page_0;
        try {
            page_0 = client_.fetch_page(0, std::nullopt, filters);
        } catch (const std::exception& e) {
            throw FatalExportError("Failed to fetch page 0: " + std::string(e.what()));
        } catch (...) {
            throw FatalExportError("Failed to fetch page 0: unknown error");
        }
        page_0.page_index = 0;

        const std::optional<std::string> session_id = page_0.session_id;
        if (page_0.has_more && !session_id) {
            LOG_WARNING("Page 0 returned no session id; continuing without one");
        }

        detail::ExportAggregator aggregator(spec.on_page_complete);
        bool table_created = false;

        {
            detail::WriteTask task = detail::make_write_task(page_0, spec);
            page_0.profiles.clear();
            write_page(spec, task, table_created, aggregator);
        }

        bool cancelled = is_cancelled(spec);
        if (page_0.has_more && !cancelled) {
            cancelled = run_parallel_pages(spec, filters, session_id, workers,
                                           table_created, aggregator);
        }

        ExportResult result;
        result.table = spec.table;
        aggregator.fill(result);
        result.duration_seconds = time_utils::seconds_since(steady_start);
        result.fetched_at = time_utils::Clock::now();
        result.cancelled = cancelled || is_cancelled(spec);

        std::ostringstream msg;
        msg << "Parallel profile fetch " << (result.cancelled ? "cancelled" : "completed")
            << ": " << result.total_rows << " rows, "
            << result.successful_pages << "/" << (result.successful_pages + result.failed_pages)
            << " pages successful, " << std::fixed << std::setprecision(2)
            << result.duration_seconds << "s";
        LOG_INFO(msg.str());

        return result;
    }

private:
    static void validate(const FetchSpec& spec) {
        if (!string_utils::is_valid_table_name(spec.table)) {
            throw std::invalid_argument("Invalid table name: '" + spec.table + "'");
        }
        if (spec.batch_size == 0) {
            throw std::invalid_argument("batch_size must be positive");
        }
    }

    static bool is_cancelled(const FetchSpec& spec) {
        return spec.cancellation != nullptr && spec.cancellation->is_cancelled();
    }

    /**
     * Write one page through the store. Called from the coordinator for
     * page 0 and from the writer thread afterwards, never concurrently.
     */
    void write_page(const FetchSpec& spec, detail::WriteTask& task,
                    bool& table_created, detail::ExportAggregator& aggregator) {
        if (task.records.empty()) {
            aggregator.record_success(task.page_index, 0);
            return;
        }

        try {
            size_t rows = 0;
            if (!spec.append && !table_created) {
                rows = store_.create_table(spec.table, task.records, task.metadata, spec.batch_size);
                table_created = true;
            } else {
                rows = store_.append_table(spec.table, task.records, task.metadata, spec.batch_size);
            }
            aggregator.record_success(task.page_index, rows);
            LOG_DEBUG("Page " + std::to_string(task.page_index) + " written: " +
                      std::to_string(rows) + " rows");
        } catch (const std::exception& e) {
            LOG_ERROR("Page " + std::to_string(task.page_index) + " write failed: " + e.what());
            aggregator.record_failure(task.page_index, "Write failed: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Page " + std::to_string(task.page_index) + " write failed: unknown error");
            aggregator.record_failure(task.page_index, "Write failed: unknown error");
        }
    }

    /**
     * Pages 1..N. Returns true if the export was cancelled.
     */
    bool run_parallel_pages(const FetchSpec& spec,
                            const PageFilters& filters,
                            const std::optional<std::string>& session_id,
                            size_t workers,
                            bool& table_created,
                            detail::ExportAggregator& aggregator) {
        auto jobs = BoundedQueue<int>::unbounded();
        auto completions = BoundedQueue<detail::FetchCompletion>::unbounded();
        BoundedQueue<detail::WriteTask> write_queue(workers * 2);

        CancellationToken::Registration on_cancel(spec.cancellation, [&write_queue] {
            write_queue.interrupt();
        });

        std::thread writer([&]() {
            while (auto task = write_queue.pop()) {
                if (is_cancelled(spec)) {
                    aggregator.record_failure(task->page_index, "Cancelled before write");
                    continue;
                }
                write_page(spec, *task, table_created, aggregator);
            }
        });

        std::vector<std::thread> fetchers;
        fetchers.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            fetchers.emplace_back([&]() {
                while (auto page_index = jobs.pop()) {
                    fetch_one(spec, filters, session_id, *page_index,
                              completions, write_queue, aggregator);
                }
            });
        }

        // Dynamic page discovery
        std::set<int> pending;
        int max_page_submitted = 0;
        bool more_pages_exist = true;
        size_t pages_discovered = 0;
        size_t consecutive_failures = 0;
        bool warned_about_rate_limits = false;

        auto submit_next = [&]() {
            int next_page = max_page_submitted + 1;
            pending.insert(next_page);
            max_page_submitted = next_page;
            jobs.push(next_page);
        };

        submit_next();

        while (!pending.empty()) {
            auto completion = completions.pop();
            if (!completion) {
                break;  // Not reached: completions is never closed during the loop
            }
            pending.erase(completion->page_index);

            const bool at_frontier = completion->page_index == max_page_submitted;
            const bool may_submit = more_pages_exist && at_frontier && !is_cancelled(spec);

            switch (completion->status) {
                case detail::FetchCompletion::SKIPPED:
                    break;

                case detail::FetchCompletion::FAILED:
                    LOG_WARNING("Page " + std::to_string(completion->page_index) +
                                " fetch failed: " + completion->error);
                    aggregator.record_failure(completion->page_index, completion->error);
                    ++consecutive_failures;
                    if (may_submit && consecutive_failures < spec.max_consecutive_failures) {
                        submit_next();
                    } else if (may_submit) {
                        LOG_WARNING("Stopping page discovery after " +
                                    std::to_string(consecutive_failures) +
                                    " consecutive fetch failures");
                        more_pages_exist = false;
                    }
                    break;

                case detail::FetchCompletion::FETCHED:
                    consecutive_failures = 0;
                    ++pages_discovered;

                    if (!warned_about_rate_limits && pages_discovered >= kRateLimitWarningThreshold) {
                        warned_about_rate_limits = true;
                        LOG_WARNING("Large profile export: " + std::to_string(pages_discovered) +
                                    "+ pages may exceed rate limits. Consider using cohort filters "
                                    "or output_properties to reduce dataset size.");
                    }

                    if (!completion->has_more) {
                        more_pages_exist = false;
                    } else if (may_submit) {
                        submit_next();
                    }
                    break;
            }
        }

        // In-flight fetches are awaited: every worker finishes its page and
        // its queue push before the writer sees end-of-stream.
        jobs.close();
        for (auto& fetcher : fetchers) {
            fetcher.join();
        }
        write_queue.close();
        writer.join();

        return is_cancelled(spec);
    }

    void fetch_one(const FetchSpec& spec,
                   const PageFilters& filters,
                   const std::optional<std::string>& session_id,
                   int page_index,
                   BoundedQueue<detail::FetchCompletion>& completions,
                   BoundedQueue<detail::WriteTask>& write_queue,
                   detail::ExportAggregator& aggregator) {
        detail::FetchCompletion completion;
        completion.page_index = page_index;

        if (is_cancelled(spec)) {
            completion.status = detail::FetchCompletion::SKIPPED;
            completions.push(std::move(completion));
            return;
        }

        ProfilePage page;
        try {
            page = client_.fetch_page(page_index, session_id, filters);
        } catch (const std::exception& e) {
            completion.status = detail::FetchCompletion::FAILED;
            completion.error = e.what();
            completions.push(std::move(completion));
            return;
        } catch (...) {
            completion.status = detail::FetchCompletion::FAILED;
            completion.error = "unknown error";
            completions.push(std::move(completion));
            return;
        }
        page.page_index = page_index;

        detail::WriteTask task = detail::make_write_task(page, spec);

        // Report before the (possibly blocking) push so discovery keeps moving
        completion.status = detail::FetchCompletion::FETCHED;
        completion.has_more = page.has_more;
        completions.push(std::move(completion));

        if (!write_queue.push(std::move(task))) {
            aggregator.record_failure(page_index, "Cancelled before write");
        }
    }

    PageClient& client_;
    TableStore& store_;
};

} // namespace profile_export
