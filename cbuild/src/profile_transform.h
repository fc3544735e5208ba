#pragma once

#include <string>

#include "json_parser.h"
#include "profile_record.h"

namespace profile_export {

/**
 * Normalize one raw API profile into a storage row.
 *
 *   {"$distinct_id": "u1", "$properties": {"$last_seen": "2024-01-15T10:30:00",
 *                                          "$email": "a@b.c", "plan": "pro"}}
 *   -> distinct_id = "u1"
 *      last_seen   = "2024-01-15T10:30:00"
 *      properties  = {"$email":"a@b.c","plan":"pro"}
 *
 * Pure and total: shape problems (missing id, non-object properties) are
 * passed through as empty values and left for the store to reject.
 * Safe to call from any thread.
 */
inline ProfileRecord transform_profile(const RawProfile& raw) {
    ProfileRecord record;

    if (const json::Value* id = raw.find("$distinct_id")) {
        if (id->is_string()) {
            record.distinct_id = id->string;
        } else if (!id->is_null()) {
            record.distinct_id = json::serialize(*id);
        }
    }

    json::Value properties = json::Value::make_object();
    if (const json::Value* props = raw.find("$properties")) {
        if (props->is_object()) {
            for (const auto& [key, value] : props->object) {
                if (key == "$last_seen") {
                    if (value.is_string()) {
                        record.last_seen = value.string;
                    }
                    continue;
                }
                properties.object.emplace(key, value);
            }
        }
    }
    record.properties_json = json::serialize(properties);

    return record;
}

} // namespace profile_export
