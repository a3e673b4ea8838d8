#include "core/ConfigLoader.h"
#include "core/SimConfig.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace CampusSim;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "campussim_config_test";
        std::filesystem::create_directories(testDir_);
        ConfigLoader::setConfigDir(testDir_.string());
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, MissingFileIsAnError)
{
    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("not found"), std::string::npos);
    EXPECT_FALSE(ConfigLoader::findConfigFile("campussim.json").has_value());
}

TEST_F(ConfigLoaderTest, LoadOrDefaultFallsBackOnlyWhenAbsent)
{
    auto missing = ConfigLoader::loadOrDefault<SimConfig>("campussim.json");
    ASSERT_TRUE(missing.isValue());
    EXPECT_EQ(missing.value().defaultLocationId, "B083");

    writeConfigFile("campussim.json", R"({"day_start": "25:00"})");
    auto broken = ConfigLoader::loadOrDefault<SimConfig>("campussim.json");
    ASSERT_TRUE(broken.isError());
    EXPECT_NE(broken.errorValue().find("day_start"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyObjectKeepsDefaults)
{
    writeConfigFile("campussim.json", "{}");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const SimConfig defaults;
    EXPECT_EQ(result.value().dataDir, defaults.dataDir);
    EXPECT_EQ(result.value().defaultLocationId, "B083");
    EXPECT_EQ(result.value().advisorWorkingSlots.size(), 7u);
    EXPECT_EQ(result.value().availability.timeSlots.size(), 5u);
}

TEST_F(ConfigLoaderTest, LoadsSimConfigFields)
{
    writeConfigFile("campussim.json", R"({
        "data_dir": "/srv/campus",
        "default_location_id": "B010",
        "start_time": "Week 2, Wednesday, 07:30",
        "day_start": "07:00",
        "advisor_working_slots": ["10:00-11:00", "15:00-16:00"],
        "availability": {"time_slots": ["08:00-09:00"], "seed_salt": 7},
        "log_spec": "*:info"
    })");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    const SimConfig& config = result.value();
    EXPECT_EQ(config.dataDir, "/srv/campus");
    EXPECT_EQ(config.defaultLocationId, "B010");
    EXPECT_EQ(config.startTime.toString(), "Week 2, Wednesday, 07:30");
    EXPECT_EQ(config.dayStartMinute, 7 * 60);
    ASSERT_EQ(config.advisorWorkingSlots.size(), 2u);
    EXPECT_EQ(config.advisorWorkingSlots[1].toString(), "15:00-16:00");
    ASSERT_EQ(config.availability.timeSlots.size(), 1u);
    EXPECT_EQ(config.availability.seedSalt, 7u);
    EXPECT_EQ(config.availability.propertyPool.size(), 4u);
    EXPECT_EQ(config.logSpec, "*:info");
}

TEST_F(ConfigLoaderTest, InvalidValuesAreReportedWithTheFileName)
{
    writeConfigFile("campussim.json", R"({"availability": {"properties_per_item": 9}})");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("campussim.json"), std::string::npos);
    EXPECT_NE(result.errorValue().find("property pool"), std::string::npos);
}

TEST_F(ConfigLoaderTest, BadStartTimeIsRejected)
{
    writeConfigFile("campussim.json", R"({"start_time": "noon"})");
    EXPECT_TRUE(ConfigLoader::load<SimConfig>("campussim.json").isError());
}

TEST_F(ConfigLoaderTest, LocalFileTakesPrecedenceOverBase)
{
    writeConfigFile("campussim.json", R"({"data_dir": "base"})");
    writeConfigFile("campussim.json.local", R"({"data_dir": "local"})");

    auto path = ConfigLoader::findConfigFile("campussim.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "campussim.json.local");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().dataDir, "local");
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsError)
{
    writeConfigFile("campussim.json", "not valid json {{{");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyLocalFileDoesNotFallBackToBase)
{
    writeConfigFile("campussim.json", R"({"data_dir": "base"})");
    writeConfigFile("campussim.json.local", "");

    auto result = ConfigLoader::load<SimConfig>("campussim.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().find("Empty config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ReadJsonFileUsesTheExactPath)
{
    writeConfigFile("map.json", R"({"nodes": []})");

    auto found = ConfigLoader::readJsonFile(testDir_ / "map.json");
    ASSERT_TRUE(found.isValue());
    EXPECT_TRUE(found.value().contains("nodes"));

    EXPECT_TRUE(ConfigLoader::readJsonFile(testDir_ / "courses.json").isError());
}
