#pragma once

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "file_utils.h"
#include "json_parser.h"
#include "logger.h"
#include "page_client.h"

/**
 * PageClient that serves recorded Engage responses from a directory.
 *
 * Each page lives in page-<N>.json or page-<N>.json.gz:
 *   {
 *     "page": 0,
 *     "page_size": 1000,
 *     "session_id": "1234567890-EBGMJNA",
 *     "results": [ {"$distinct_id": "...", "$properties": {...}}, ... ]
 *   }
 *
 * has_more follows the live API: a full page means more pages may follow.
 * Like the live API, the page right after the last recorded one is served
 * as an empty final page; a request further out is a PageFetchError.
 * The files are immutable, so concurrent fetch_page() calls are safe.
 */
namespace profile_export {

class ReplayPageClient : public PageClient {
public:
    explicit ReplayPageClient(const fs::path& source_dir)
        : source_dir_(source_dir) {
        if (!fs::is_directory(source_dir_)) {
            throw std::runtime_error("Page source directory not found: " + source_dir_.string());
        }
    }

    ProfilePage fetch_page(int page_index,
                           const std::optional<std::string>& session_id,
                           const PageFilters& filters) override {
        requests_.fetch_add(1);

        if (filters.where || filters.cohort_id) {
            LOG_DEBUG("Page " + std::to_string(page_index) +
                      ": where/cohort filters were applied when the pages were recorded");
        }

        auto path = file_utils::find_page_file(source_dir_, page_index);
        if (!path && page_index > 0 &&
            file_utils::find_page_file(source_dir_, page_index - 1)) {
            // One past the last recorded page: the live API answers with an
            // empty final page.
            ProfilePage past_end;
            past_end.page_index = page_index;
            past_end.has_more = false;
            return past_end;
        }
        if (!path) {
            throw PageFetchError(page_index, "No recorded response for page " +
                                 std::to_string(page_index) + " in " + source_dir_.string());
        }

        json::Value response;
        try {
            response = json::parse(file_utils::read_file(*path));
        } catch (const std::exception& e) {
            throw PageFetchError(page_index, "Invalid response for page " +
                                 std::to_string(page_index) + ": " + e.what());
        }

        const json::Value* results = response.find("results");
        if (results == nullptr || !results->is_array()) {
            throw PageFetchError(page_index, "Response for page " +
                                 std::to_string(page_index) + " has no results array");
        }

        const json::Value* recorded_session = response.find("session_id");
        std::optional<std::string> recorded_id;
        if (recorded_session != nullptr && recorded_session->is_string()) {
            recorded_id = recorded_session->string;
        }

        ProfilePage page;
        page.page_index = page_index;

        if (page_index == 0) {
            page.session_id = recorded_id;
        } else if (recorded_id && session_id != recorded_id) {
            throw PageFetchError(page_index, "Session id mismatch for page " +
                                 std::to_string(page_index));
        }

        page.profiles.reserve(results->array.size());
        for (const auto& profile : results->array) {
            if (filters.output_properties) {
                page.profiles.push_back(select_properties(profile, *filters.output_properties));
            } else {
                page.profiles.push_back(profile);
            }
        }

        const json::Value* page_size = response.find("page_size");
        if (page_size != nullptr && page_size->is_number() && page_size->number > 0) {
            page.has_more = static_cast<double>(results->array.size()) >= page_size->number;
        } else {
            page.has_more = file_utils::find_page_file(source_dir_, page_index + 1).has_value();
        }

        return page;
    }

    /**
     * Number of fetch_page() calls served so far.
     */
    size_t requests() const { return requests_.load(); }

private:
    /**
     * Keep only allowlisted $properties (and $last_seen).
     */
    static RawProfile select_properties(const RawProfile& profile,
                                        const std::vector<std::string>& allowlist) {
        const json::Value* props = profile.find("$properties");
        if (props == nullptr || !props->is_object()) {
            return profile;
        }

        RawProfile copy = profile;
        json::Value& selected = copy.object["$properties"];
        selected.object.clear();
        for (const auto& [key, value] : props->object) {
            if (key == "$last_seen" ||
                std::find(allowlist.begin(), allowlist.end(), key) != allowlist.end()) {
                selected.object.emplace(key, value);
            }
        }
        return copy;
    }

    fs::path source_dir_;
    std::atomic<size_t> requests_{0};
};

} // namespace profile_export
