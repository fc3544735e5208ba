#include <gtest/gtest.h>

#include <fstream>
#include <zlib.h>

#include "parallel_profile_fetcher.h"
#include "replay_page_client.h"
#include "test_helpers.h"

using namespace profile_export;
using profile_export::testing_support::RecordingStore;
using profile_export::testing_support::TempDir;

namespace {

std::string page_json(int page, size_t page_size, size_t results, const std::string& session) {
    std::string out = "{\"page\":" + std::to_string(page) +
                      ",\"page_size\":" + std::to_string(page_size) +
                      ",\"session_id\":\"" + session + "\",\"results\":[";
    for (size_t i = 0; i < results; ++i) {
        if (i > 0) out += ",";
        out += "{\"$distinct_id\":\"p" + std::to_string(page) + "-" + std::to_string(i) +
               "\",\"$properties\":{\"$last_seen\":\"2024-01-15T10:30:00\","
               "\"$email\":\"u@example.com\",\"plan\":\"pro\",\"city\":\"Oslo\"}}";
    }
    return out + "]}";
}

void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

void write_gz(const fs::path& path, const std::string& content) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    ASSERT_EQ(gzwrite(gz, content.data(), static_cast<unsigned>(content.size())),
              static_cast<int>(content.size()));
    ASSERT_EQ(gzclose(gz), Z_OK);
}

} // namespace

TEST(ReplayPageClient, MissingDirectoryThrows) {
    TempDir dir;
    EXPECT_THROW(ReplayPageClient(dir.path() / "nope"), std::runtime_error);
}

TEST(ReplayPageClient, PageZeroReturnsSessionAndProfiles) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", page_json(0, 3, 3, "sess-1"));

    ReplayPageClient client(dir.path());
    ProfilePage page = client.fetch_page(0, std::nullopt, PageFilters{});

    EXPECT_EQ(page.page_index, 0);
    ASSERT_TRUE(page.session_id.has_value());
    EXPECT_EQ(*page.session_id, "sess-1");
    EXPECT_EQ(page.profiles.size(), 3u);
    EXPECT_TRUE(page.has_more);  // full page
    EXPECT_EQ(client.requests(), 1u);
}

TEST(ReplayPageClient, ShortPageEndsExport) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", page_json(0, 3, 3, "sess-1"));
    write_text(dir.path() / "page-1.json", page_json(1, 3, 2, "sess-1"));

    ReplayPageClient client(dir.path());
    ProfilePage page = client.fetch_page(1, std::string("sess-1"), PageFilters{});

    EXPECT_FALSE(page.has_more);
    EXPECT_FALSE(page.session_id.has_value());
    EXPECT_EQ(page.profiles.size(), 2u);
}

TEST(ReplayPageClient, ReadsGzipPages) {
    TempDir dir;
    write_gz(dir.path() / "page-0.json.gz", page_json(0, 10, 4, "sess-gz"));

    ReplayPageClient client(dir.path());
    ProfilePage page = client.fetch_page(0, std::nullopt, PageFilters{});

    EXPECT_EQ(page.profiles.size(), 4u);
    EXPECT_EQ(page.session_id, std::optional<std::string>("sess-gz"));
    EXPECT_FALSE(page.has_more);
}

TEST(ReplayPageClient, WithoutPageSizeLooksForNextFile) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", R"({"session_id":"s","results":[{"$distinct_id":"a"}]})");
    write_text(dir.path() / "page-1.json", R"({"session_id":"s","results":[]})");

    ReplayPageClient client(dir.path());
    EXPECT_TRUE(client.fetch_page(0, std::nullopt, PageFilters{}).has_more);
    EXPECT_FALSE(client.fetch_page(1, std::string("s"), PageFilters{}).has_more);
}

TEST(ReplayPageClient, SessionMismatchFailsPage) {
    TempDir dir;
    write_text(dir.path() / "page-1.json", page_json(1, 3, 1, "sess-1"));

    ReplayPageClient client(dir.path());
    EXPECT_THROW(client.fetch_page(1, std::string("other"), PageFilters{}), PageFetchError);
    EXPECT_THROW(client.fetch_page(1, std::nullopt, PageFilters{}), PageFetchError);
}

TEST(ReplayPageClient, MissingOrInvalidPageFails) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", "{not json");
    write_text(dir.path() / "page-1.json", R"({"session_id":"s"})");

    ReplayPageClient client(dir.path());
    try {
        client.fetch_page(0, std::nullopt, PageFilters{});
        FAIL() << "Expected PageFetchError";
    } catch (const PageFetchError& e) {
        EXPECT_EQ(e.page_index(), 0);
    }
    EXPECT_THROW(client.fetch_page(1, std::string("s"), PageFilters{}), PageFetchError);
    EXPECT_THROW(client.fetch_page(7, std::string("s"), PageFilters{}), PageFetchError);
    EXPECT_EQ(client.requests(), 3u);
}

TEST(ReplayPageClient, OutputPropertiesKeepAllowlistAndLastSeen) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", page_json(0, 5, 1, "s"));

    ReplayPageClient client(dir.path());
    PageFilters filters;
    filters.output_properties = std::vector<std::string>{"plan"};
    ProfilePage page = client.fetch_page(0, std::nullopt, filters);

    ASSERT_EQ(page.profiles.size(), 1u);
    const json::Value& props = page.profiles[0]["$properties"];
    EXPECT_EQ(props.object.size(), 2u);
    EXPECT_TRUE(props.has_key("plan"));
    EXPECT_TRUE(props.has_key("$last_seen"));
    EXPECT_FALSE(props.has_key("$email"));
    EXPECT_EQ(page.profiles[0]["$distinct_id"].string, "p0-0");
}

TEST(ReplayPageClient, PageAfterLastRecordedIsEmptyFinalPage) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", page_json(0, 2, 2, "s"));
    write_text(dir.path() / "page-1.json", page_json(1, 2, 2, "s"));

    ReplayPageClient client(dir.path());
    ProfilePage page = client.fetch_page(2, std::string("s"), PageFilters{});

    EXPECT_EQ(page.page_index, 2);
    EXPECT_TRUE(page.profiles.empty());
    EXPECT_FALSE(page.has_more);

    // A gap further out is still an error
    EXPECT_THROW(client.fetch_page(4, std::string("s"), PageFilters{}), PageFetchError);
}

TEST(ReplayPageClient, ExactlyFullLastPageExportsWithoutFailures) {
    TempDir dir;
    write_text(dir.path() / "page-0.json", page_json(0, 2, 2, "s"));
    write_text(dir.path() / "page-1.json", page_json(1, 2, 2, "s"));

    ReplayPageClient client(dir.path());
    RecordingStore store;
    ParallelProfileFetcher fetcher(client, store);

    FetchSpec spec;
    spec.table = "profiles";
    ExportResult result = fetcher.fetch_profiles(spec);

    EXPECT_EQ(result.total_rows, 4u);
    EXPECT_EQ(result.successful_pages, 3u);
    EXPECT_EQ(result.failed_pages, 0u);
    EXPECT_TRUE(result.failed_page_indices.empty());
    EXPECT_EQ(client.requests(), 3u);
    EXPECT_EQ(store.rows("profiles").size(), 4u);
}
