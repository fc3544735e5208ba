#include <gtest/gtest.h>

#include <vector>

#include "parquet_table_store.h"
#include "test_helpers.h"

using namespace profile_export;
using profile_export::testing_support::TempDir;

namespace {

std::vector<ProfileRecord> make_records(const std::string& prefix, size_t count) {
    std::vector<ProfileRecord> records;
    for (size_t i = 0; i < count; ++i) {
        ProfileRecord record;
        record.distinct_id = prefix + std::to_string(i);
        if (i % 2 == 0) {
            record.last_seen = "2024-01-15T10:30:00";
        }
        record.properties_json = "{\"n\":" + std::to_string(i) + "}";
        records.push_back(record);
    }
    return records;
}

TableMetadata make_metadata(std::optional<std::string> where = std::nullopt) {
    TableMetadata metadata;
    metadata.fetched_at = time_utils::Clock::time_point(std::chrono::milliseconds(1705314600000));
    metadata.filter_where = std::move(where);
    return metadata;
}

} // namespace

TEST(ParquetTableStore, CreateThenReadBack) {
    TempDir dir;
    ParquetTableStore store(dir.path());

    auto records = make_records("u", 25);
    EXPECT_EQ(store.create_table("profiles", records, make_metadata(), 10), 25u);

    EXPECT_TRUE(store.table_exists("profiles"));
    EXPECT_EQ(store.row_count("profiles"), 25u);
    EXPECT_EQ(store.read_table("profiles"), records);
    EXPECT_EQ(store.list_tables(), std::vector<std::string>{"profiles"});
}

TEST(ParquetTableStore, AppendAddsPartsInOrder) {
    TempDir dir;
    ParquetTableStore store(dir.path(), parse_compression("none"));

    auto first = make_records("a", 3);
    auto second = make_records("b", 4);
    store.create_table("profiles", first, make_metadata(), 1000);
    EXPECT_EQ(store.append_table("profiles", second, make_metadata(), 1000), 4u);

    EXPECT_EQ(store.row_count("profiles"), 7u);
    auto all = store.read_table("profiles");
    ASSERT_EQ(all.size(), 7u);
    EXPECT_EQ(all.front().distinct_id, "a0");
    EXPECT_EQ(all.back().distinct_id, "b3");

    EXPECT_TRUE(fs::exists(dir.path() / "profiles" / "part-00000.parquet"));
    EXPECT_TRUE(fs::exists(dir.path() / "profiles" / "part-00001.parquet"));
}

TEST(ParquetTableStore, CreateOnExistingTableThrows) {
    TempDir dir;
    ParquetTableStore store(dir.path());
    store.create_table("profiles", make_records("u", 2), make_metadata(), 1000);

    EXPECT_THROW(store.create_table("profiles", make_records("v", 2), make_metadata(), 1000),
                 TableExistsError);
    EXPECT_EQ(store.row_count("profiles"), 2u);
}

TEST(ParquetTableStore, AppendToMissingTableThrows) {
    TempDir dir;
    ParquetTableStore store(dir.path());

    EXPECT_THROW(store.append_table("missing", make_records("u", 2), make_metadata(), 1000),
                 TableNotFoundError);
    EXPECT_FALSE(store.table_exists("missing"));
    EXPECT_THROW(store.row_count("missing"), TableNotFoundError);
}

TEST(ParquetTableStore, RecordWithoutIdFailsWholeWrite) {
    TempDir dir;
    ParquetTableStore store(dir.path());

    auto records = make_records("u", 3);
    records[1].distinct_id.clear();

    EXPECT_THROW(store.create_table("profiles", records, make_metadata(), 1000), std::runtime_error);
    EXPECT_FALSE(store.table_exists("profiles"));

    store.create_table("profiles", make_records("u", 1), make_metadata(), 1000);
    EXPECT_THROW(store.append_table("profiles", records, make_metadata(), 1000), std::runtime_error);
    EXPECT_EQ(store.row_count("profiles"), 1u);
}

TEST(ParquetTableStore, MetadataRecordsFilterAndTimestamp) {
    TempDir dir;
    ParquetTableStore store(dir.path());

    store.create_table("pro_users", make_records("u", 1),
                       make_metadata(std::string("properties[\"plan\"] == \"pro\"")), 1000);
    json::Value metadata = store.read_metadata("pro_users");
    EXPECT_EQ(metadata["type"].string, "profiles");
    EXPECT_EQ(metadata["fetched_at"].string, "2024-01-15T10:30:00.000Z");
    EXPECT_EQ(metadata["filter_where"].string, "properties[\"plan\"] == \"pro\"");

    store.create_table("all_users", make_records("u", 1), make_metadata(), 1000);
    EXPECT_TRUE(store.read_metadata("all_users")["filter_where"].is_null());
}

TEST(ParquetTableStore, InvalidTableNameIsRejected) {
    TempDir dir;
    ParquetTableStore store(dir.path());
    EXPECT_THROW(store.create_table("../escape", make_records("u", 1), make_metadata(), 1000),
                 std::invalid_argument);
    EXPECT_THROW(store.table_exists(""), std::invalid_argument);
}

TEST(ParquetTableStore, ParseCompressionAcceptsKnownCodecs) {
    EXPECT_EQ(parse_compression("SNAPPY"), parquet::Compression::SNAPPY);
    EXPECT_EQ(parse_compression("none"), parquet::Compression::UNCOMPRESSED);
    EXPECT_EQ(parse_compression("gz"), parquet::Compression::GZIP);
    EXPECT_EQ(parse_compression("zstd"), parquet::Compression::ZSTD);
    EXPECT_THROW(parse_compression("brotli2"), std::runtime_error);
}
