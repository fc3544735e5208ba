#include <gtest/gtest.h>

#include <fstream>

#include "config.h"
#include "test_helpers.h"

using namespace profile_export;
using profile_export::testing_support::TempDir;

TEST(ExportConfig, DefaultsMatchDocumentedValues) {
    ExportConfig config;
    EXPECT_EQ(config.table, "profiles");
    EXPECT_EQ(config.workers, 5u);
    EXPECT_EQ(config.batch_size, 1000u);
    EXPECT_EQ(config.max_consecutive_failures, 3u);
    EXPECT_EQ(config.store_dir, "data");
    EXPECT_EQ(config.compression, "snappy");
    EXPECT_FALSE(config.append);
    EXPECT_FALSE(config.where.has_value());
    EXPECT_FALSE(config.output_properties.has_value());
}

TEST(ExportConfig, MergeOverridesPresentKeysOnly) {
    ExportConfig config;
    config.merge(json::parse(R"({
        "table": "pro_users",
        "where": "properties[\"plan\"] == \"pro\"",
        "output_properties": ["$email", "plan"],
        "append": true,
        "workers": 3,
        "source_dir": "recorded/profiles",
        "unknown_key": 1
    })"));

    EXPECT_EQ(config.table, "pro_users");
    ASSERT_TRUE(config.where.has_value());
    EXPECT_EQ(*config.where, "properties[\"plan\"] == \"pro\"");
    ASSERT_TRUE(config.output_properties.has_value());
    EXPECT_EQ(*config.output_properties, (std::vector<std::string>{"$email", "plan"}));
    EXPECT_TRUE(config.append);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.batch_size, 1000u);
    EXPECT_EQ(config.source_dir, "recorded/profiles");
    EXPECT_FALSE(config.cohort_id.has_value());
}

TEST(ExportConfig, NullClearsOptionalValues) {
    ExportConfig config;
    config.where = "x";
    config.output_properties = std::vector<std::string>{"a"};
    config.merge(json::parse(R"({"where": null, "output_properties": null})"));
    EXPECT_FALSE(config.where.has_value());
    EXPECT_FALSE(config.output_properties.has_value());
}

TEST(ExportConfig, WrongTypesAreRejected) {
    ExportConfig config;
    EXPECT_THROW(config.merge(json::parse("[]")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"table": 5})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"append": "yes"})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"workers": 0})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"batch_size": 2.5})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"batch_size": 1e300})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"workers": 18446744073709551616})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"output_properties": [1]})")), std::runtime_error);
    EXPECT_THROW(config.merge(json::parse(R"({"where": false})")), std::runtime_error);
}

TEST(ExportConfig, ValidateRequiresSource) {
    ExportConfig config;
    EXPECT_THROW(config.validate(), std::runtime_error);
    config.source_dir = "recorded";
    EXPECT_NO_THROW(config.validate());
    config.table.clear();
    EXPECT_THROW(config.validate(), std::runtime_error);
}

TEST(ExportConfig, LoadFromFileAndBuildFetchSpec) {
    TempDir dir;
    auto path = dir.path() / "export.json";
    {
        std::ofstream out(path);
        out << R"({"table": "cohort_export", "cohort_id": "12345", "workers": 8,
                   "batch_size": 250, "max_consecutive_failures": 2, "source_dir": "src"})";
    }

    ExportConfig config = ExportConfig::load_from_file(path.string());
    FetchSpec spec = config.to_fetch_spec();

    EXPECT_EQ(spec.table, "cohort_export");
    EXPECT_EQ(spec.cohort_id, std::optional<std::string>("12345"));
    EXPECT_EQ(spec.max_workers, 8u);  // Capped later by the fetcher
    EXPECT_EQ(spec.batch_size, 250u);
    EXPECT_EQ(spec.max_consecutive_failures, 2u);
    EXPECT_EQ(spec.cancellation, nullptr);
    EXPECT_FALSE(spec.append);
}
