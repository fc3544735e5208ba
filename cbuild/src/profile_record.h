#pragma once

#include <string>
#include <optional>
#include <cstdint>

#include "json_parser.h"
#include "time_utils.h"

/**
 * Core data structures representing profiles as they flow through the export.
 */
namespace profile_export {

/**
 * A profile exactly as the remote API returned it:
 * {"$distinct_id": "...", "$properties": {...}}
 */
using RawProfile = json::Value;

/**
 * ProfileRecord is the normalized row written to the table store.
 *
 * 1. Fetched as a RawProfile by a page worker
 * 2. Normalized by transform_profile()
 * 3. Handed to the single writer inside a WriteTask
 * 4. Written to a table part file
 */
struct ProfileRecord {
    // Profile identifier (e.g., "user_12345")
    std::string distinct_id;

    // Value of $last_seen as sent by the API, if present
    std::optional<std::string> last_seen;

    // Remaining $properties as a compact JSON object with sorted keys
    std::string properties_json = "{}";

    bool operator==(const ProfileRecord& other) const {
        return distinct_id == other.distinct_id &&
               last_seen == other.last_seen &&
               properties_json == other.properties_json;
    }

    bool operator!=(const ProfileRecord& other) const {
        return !(*this == other);
    }
};

/**
 * Metadata stored alongside every write to a table.
 */
struct TableMetadata {
    std::string type = "profiles";
    time_utils::TimePoint fetched_at;
    std::optional<std::string> filter_where;
};

} // namespace profile_export
