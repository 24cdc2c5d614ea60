/**
 * @file test_json_report_sink.cc
 * @brief Unit tests for the JSON migration report
 */

#include <core/report/json_report_sink.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace handover::core::test {

namespace fs = std::filesystem;
using json = nlohmann::json;

class JsonReportSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path()
                / ("handover_report_test_"
                   + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
    }

    void TearDown() override { fs::remove_all(root_); }

    json ReadReport(const fs::path& path) {
        std::ifstream ifs(path);
        return json::parse(ifs);
    }

    fs::path root_;
};

TEST_F(JsonReportSinkTest, RewritesFileOnEveryEvent) {
    auto path = root_ / "reports" / "report.json";
    JsonReportSink sink(path, "old-laptop", "/mnt/new");

    sink.RecordStart();
    ASSERT_TRUE(fs::exists(path));
    auto report = ReadReport(path);
    EXPECT_FALSE(report["start"].get<std::string>().empty());
    EXPECT_TRUE(report["end"].get<std::string>().empty());
    EXPECT_EQ(report["source_device"], "old-laptop");
    EXPECT_EQ(report["target_device"], "/mnt/new");

    sink.RecordTotalSize(61);
    EXPECT_EQ(ReadReport(path)["size_bytes"], 61);

    sink.RecordMigratedFile("/home/me/a.txt");
    sink.RecordError("Failed to send File /home/me/b.txt");
    report = ReadReport(path);
    EXPECT_EQ(report["migrated_files"], json::array({"/home/me/a.txt"}));
    EXPECT_EQ(report["errors"], json::array({"Failed to send File /home/me/b.txt"}));

    sink.RecordEnd();
    EXPECT_FALSE(ReadReport(path)["end"].get<std::string>().empty());
}

TEST_F(JsonReportSinkTest, InMemoryReportMatchesEvents) {
    JsonReportSink sink(root_ / "report.json", "src", "dst");
    sink.RecordTotalSize(10);
    sink.RecordMigratedFile("/a");

    auto report = sink.report();
    EXPECT_EQ(report.size_bytes, 10);
    ASSERT_EQ(report.migrated_files.size(), 1u);
    EXPECT_EQ(report.migrated_files[0], "/a");
    EXPECT_TRUE(report.errors.empty());
}

TEST_F(JsonReportSinkTest, WriteFailureDoesNotThrow) {
    fs::create_directories(root_);
    // A regular file where the report directory should be
    std::ofstream(root_ / "blocked") << "x";
    JsonReportSink sink(root_ / "blocked" / "report.json", "src", "dst");

    EXPECT_NO_THROW(sink.RecordStart());
    EXPECT_NO_THROW(sink.RecordError("boom"));
    EXPECT_EQ(sink.report().errors.size(), 1u);
}

TEST_F(JsonReportSinkTest, DefaultReportFileLivesInReportDir) {
    auto path = JsonReportSink::DefaultReportFile(root_);
    EXPECT_EQ(path.parent_path(), root_);
    EXPECT_EQ(path.extension(), ".json");
    EXPECT_EQ(path.filename().string().rfind("migration-report-", 0), 0u);
}

TEST(FormatTimestampTest, IsoLikeLocalTime) {
    auto text = FormatTimestamp(std::chrono::system_clock::now());
    ASSERT_EQ(text.size(), 19u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], 'T');
    EXPECT_EQ(text[13], ':');
}

} // namespace handover::core::test
