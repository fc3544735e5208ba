#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include "profile_record.h"

namespace profile_export {

/**
 * Raised by a PageClient when a single page request fails.
 */
class PageFetchError : public std::runtime_error {
public:
    PageFetchError(int page_index, const std::string& message)
        : std::runtime_error(message), page_index_(page_index) {}

    int page_index() const { return page_index_; }

private:
    int page_index_;
};

/**
 * Query filters forwarded unchanged on every page request.
 */
struct PageFilters {
    std::optional<std::string> where;
    std::optional<std::string> cohort_id;
    std::optional<std::vector<std::string>> output_properties;
};

/**
 * One page of an Engage-style export.
 */
struct ProfilePage {
    int page_index = 0;
    std::vector<RawProfile> profiles;
    bool has_more = false;
    std::optional<std::string> session_id;  // Only set on page 0
};

/**
 * Paginated remote fetch interface.
 *
 * The session id returned with page 0 must be passed back unchanged on
 * every later request of the same export. has_more == false ends the
 * pagination sequence. Implementations must allow concurrent calls.
 */
class PageClient {
public:
    virtual ~PageClient() = default;

    /**
     * Fetch one page. Throws (typically PageFetchError) on failure.
     */
    virtual ProfilePage fetch_page(int page_index,
                                   const std::optional<std::string>& session_id,
                                   const PageFilters& filters) = 0;
};

} // namespace profile_export
