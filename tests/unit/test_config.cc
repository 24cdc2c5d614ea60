/**
 * @file test_config.cc
 * @brief Unit tests for loading and saving settings
 */

#include <chrono>
#include <core/constant/migration.h>
#include <core/util/config.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace handover::core::test {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path()
                / ("handover_config_test_"
                   + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);
        saved_ = settings;
    }

    void TearDown() override {
        settings = saved_;
        config = toml::table{};
        fs::remove_all(root_);
    }

    void WriteConfig(const std::string& content) {
        std::ofstream ofs(root_ / "config.toml");
        ofs << content;
    }

    fs::path root_;
    Settings saved_;
};

TEST_F(ConfigTest, MissingFileGetsDefaults) {
    InitConfig(root_ / "config.toml");

    EXPECT_TRUE(fs::exists(root_ / "config.toml"));
    EXPECT_EQ(settings.first_sample_delay, migration::kDefaultFirstSampleDelay);
    EXPECT_EQ(settings.sample_interval, migration::kDefaultSampleInterval);
    EXPECT_TRUE(settings.generate_report);
    EXPECT_FALSE(settings.device_name.empty());
}

TEST_F(ConfigTest, ReadsSettingTable) {
    WriteConfig(R"([setting]
device-name = "studio"
first-sample-delay = 3
sample-interval = 15
generate-report = false
report-dir = "/var/tmp/reports"
)");
    InitConfig(root_ / "config.toml");

    EXPECT_EQ(settings.device_name, "studio");
    EXPECT_EQ(settings.first_sample_delay, std::chrono::seconds(3));
    EXPECT_EQ(settings.sample_interval, std::chrono::seconds(15));
    EXPECT_FALSE(settings.generate_report);
    EXPECT_EQ(settings.report_dir, fs::path("/var/tmp/reports"));
}

TEST_F(ConfigTest, NonPositiveIntervalsFallBackToDefaults) {
    WriteConfig(R"([setting]
first-sample-delay = 0
sample-interval = -4
)");
    InitConfig(root_ / "config.toml");

    EXPECT_EQ(settings.first_sample_delay, migration::kDefaultFirstSampleDelay);
    EXPECT_EQ(settings.sample_interval, migration::kDefaultSampleInterval);
}

TEST_F(ConfigTest, MalformedFileUsesDefaults) {
    WriteConfig("[setting\nsample-interval = ");
    InitConfig(root_ / "config.toml");

    EXPECT_EQ(settings.sample_interval, migration::kDefaultSampleInterval);
}

TEST_F(ConfigTest, SaveWritesSettingsBack) {
    InitConfig(root_ / "config.toml");
    settings.sample_interval = std::chrono::seconds(42);
    settings.generate_report = false;
    SaveConfig();

    settings.sample_interval = std::chrono::seconds(1);
    InitConfig(root_ / "config.toml");
    EXPECT_EQ(settings.sample_interval, std::chrono::seconds(42));
    EXPECT_FALSE(settings.generate_report);
}

} // namespace handover::core::test
