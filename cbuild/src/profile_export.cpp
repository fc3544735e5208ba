/**
 * Parallel Profile Export
 *
 * Exports every page of a profile query into a local Parquet table store:
 *
 * 1. Reads an optional JSON config and command-line overrides
 * 2. Fetches page 0 to open an export session
 * 3. Fetches the remaining pages with up to 5 concurrent workers
 * 4. Writes every page through a single writer thread
 * 5. Reports rows written and the indices of any failed pages
 *
 * Pages come from recorded API responses (page-N.json[.gz]) in --source.
 * SIGINT/SIGTERM stop the export after the pages already in flight.
 *
 * Usage:
 *   ./profile_export --source recorded/profiles --store data --table profiles --workers 5
 *
 * Exit status: 0 on success, 2 if some pages failed or the export was
 * cancelled, 1 on a fatal error.
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <optional>
#include <vector>
#include <pthread.h>

#include "cancellation.h"
#include "config.h"
#include "logger.h"
#include "parallel_profile_fetcher.h"
#include "parquet_table_store.h"
#include "replay_page_client.h"
#include "string_utils.h"
#include "time_utils.h"

using namespace profile_export;

/**
 * Command-line arguments. Set values override the config file.
 */
struct Arguments {
    std::string config_file;
    std::optional<std::string> table;
    std::optional<std::string> where;
    std::optional<std::string> cohort_id;
    std::vector<std::string> output_properties;
    bool append = false;
    std::optional<size_t> workers;
    std::optional<size_t> batch_size;
    std::optional<size_t> max_failures;
    std::optional<std::string> source_dir;
    std::optional<std::string> store_dir;
    std::optional<std::string> compression;
    bool verbose = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options (override values from --config):\n"
              << "  --config FILE             JSON configuration file\n"
              << "  --source DIR              Directory of recorded pages (page-N.json[.gz])\n"
              << "  --store DIR               Table store root (default: data)\n"
              << "  --table NAME              Destination table (default: profiles)\n"
              << "  --where EXPR              Filter expression\n"
              << "  --cohort ID               Cohort filter\n"
              << "  --output-property NAME    Property to keep (repeatable)\n"
              << "  --append                  Append to an existing table instead of creating it\n"
              << "  --workers N               Concurrent fetch workers, capped at 5 (default: 5)\n"
              << "  --batch-size N            Rows per write commit (default: 1000)\n"
              << "  --max-failures N          Stop discovery after N consecutive failed pages (default: 3)\n"
              << "  --compression STR         Parquet compression: none, snappy, gzip, lz4, zstd (default: snappy)\n"
              << "  --verbose                 Enable debug logging\n"
              << "\n"
              << "The export API allows about 60 requests per hour; large exports\n"
              << "should be narrowed with --cohort, --where or --output-property.\n"
              << "\n"
              << "Example:\n"
              << "  " << program_name << " --source recorded/profiles --store data \\\n"
              << "    --table pro_users --where 'properties[\"plan\"] == \"pro\"' --workers 3\n";
}

size_t parse_count(const std::string& arg, const std::string& value) {
    size_t pos = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + arg + ": " + value);
    }
    if (pos != value.size() || parsed == 0) {
        throw std::runtime_error("Invalid value for " + arg + ": " + value);
    }
    return static_cast<size_t>(parsed);
}

Arguments parse_arguments(int argc, char** argv) {
    Arguments args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto get_next_arg = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for argument: " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            args.config_file = get_next_arg();
        } else if (arg == "--source") {
            args.source_dir = get_next_arg();
        } else if (arg == "--store") {
            args.store_dir = get_next_arg();
        } else if (arg == "--table") {
            args.table = get_next_arg();
        } else if (arg == "--where") {
            args.where = get_next_arg();
        } else if (arg == "--cohort") {
            args.cohort_id = get_next_arg();
        } else if (arg == "--output-property") {
            args.output_properties.push_back(get_next_arg());
        } else if (arg == "--append") {
            args.append = true;
        } else if (arg == "--workers") {
            args.workers = parse_count(arg, get_next_arg());
        } else if (arg == "--batch-size") {
            args.batch_size = parse_count(arg, get_next_arg());
        } else if (arg == "--max-failures") {
            args.max_failures = parse_count(arg, get_next_arg());
        } else if (arg == "--compression") {
            args.compression = get_next_arg();
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }

    return args;
}

ExportConfig build_config(const Arguments& args) {
    ExportConfig config;
    if (!args.config_file.empty()) {
        config = ExportConfig::load_from_file(args.config_file);
    }

    if (args.table) config.table = *args.table;
    if (args.where) config.where = args.where;
    if (args.cohort_id) config.cohort_id = args.cohort_id;
    if (!args.output_properties.empty()) config.output_properties = args.output_properties;
    if (args.append) config.append = true;
    if (args.workers) config.workers = *args.workers;
    if (args.batch_size) config.batch_size = *args.batch_size;
    if (args.max_failures) config.max_consecutive_failures = *args.max_failures;
    if (args.source_dir) config.source_dir = *args.source_dir;
    if (args.store_dir) config.store_dir = *args.store_dir;
    if (args.compression) config.compression = *args.compression;

    config.validate();
    return config;
}

/**
 * Turns SIGINT/SIGTERM into a cancellation request.
 *
 * The signals are blocked in every thread (the mask is inherited by the
 * export's workers) and consumed synchronously by a watcher thread.
 * SIGUSR1 is used internally to stop the watcher.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &token]() {
            while (true) {
                int signal_number = 0;
                if (sigwait(&signals_, &signal_number) != 0 || signal_number == SIGUSR1) {
                    return;
                }
                LOG_WARNING("Received signal " + std::to_string(signal_number) +
                            ", cancelling export after pages in flight");
                token.cancel();
            }
        });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t signals_;
    std::thread thread_;
};

void log_progress(const PageProgress& progress) {
    std::ostringstream msg;
    msg << "Page " << progress.page_index << ": ";
    if (progress.success) {
        msg << progress.rows << " rows";
    } else {
        msg << "FAILED (" << progress.error.value_or("unknown error") << ")";
    }
    msg << " | Total: " << progress.cumulative_rows << " rows";
    LOG_INFO(msg.str());
}

int main(int argc, char** argv) {
    try {
        Arguments args = parse_arguments(argc, argv);

        if (args.verbose) {
            Logger::instance().set_level(LogLevel::DEBUG);
        } else {
            Logger::instance().set_level(LogLevel::INFO);
        }

        ExportConfig config = build_config(args);

        LOG_INFO("=== PARALLEL PROFILE EXPORT ===");
        LOG_INFO("Source: " + config.source_dir);
        LOG_INFO("Store: " + config.store_dir);
        LOG_INFO("Table: " + config.table + (config.append ? " (append)" : " (create)"));
        if (config.where) LOG_INFO("Where: " + *config.where);
        if (config.cohort_id) LOG_INFO("Cohort: " + *config.cohort_id);

        ReplayPageClient client(config.source_dir);
        ParquetTableStore store(config.store_dir, parse_compression(config.compression));
        ParallelProfileFetcher fetcher(client, store);

        CancellationToken cancellation;
        SignalWatcher watcher(cancellation);

        FetchSpec spec = config.to_fetch_spec();
        spec.cancellation = &cancellation;
        spec.on_page_complete = log_progress;

        ExportResult result = fetcher.fetch_profiles(spec);

        LOG_INFO("=== EXPORT " + std::string(result.cancelled ? "CANCELLED" : "COMPLETE") + " ===");
        std::ostringstream summary;
        summary << "Table: " << result.table
                << " | Rows: " << result.total_rows
                << " | Pages: " << result.successful_pages << " ok, " << result.failed_pages << " failed"
                << " | Requests: " << client.requests()
                << " | Time: " << std::fixed << std::setprecision(2) << result.duration_seconds << "s"
                << " | Completed: " << time_utils::to_rfc3339_utc(result.fetched_at);
        LOG_INFO(summary.str());

        if (result.has_failures()) {
            LOG_WARNING("Failed pages: " + string_utils::join(result.failed_page_indices, ", "));
            return 2;
        }
        return result.cancelled ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
