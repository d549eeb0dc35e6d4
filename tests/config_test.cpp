#include "config.h"
#include "errors_t.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

class ConfigTest : public ::testing::Test {
protected:
	std::filesystem::path dir = {};

	void SetUp() override
	{
		dir = std::filesystem::temp_directory_path() /
		      ("ff_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
		       "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
		std::filesystem::create_directories(dir);
	}

	void TearDown() override
	{
		std::error_code ec = {};
		std::filesystem::remove_all(dir, ec);
	}

	std::filesystem::path write(const std::string& content)
	{
		const auto path = dir / "config.xml";
		std::ofstream(path) << content;
		return path;
	}
};

} // namespace

TEST_F(ConfigTest, Defaults)
{
	const FinderConfig config = {};

	EXPECT_TRUE(config.fullscreen());
	EXPECT_EQ(config.prompt, "> ");
	EXPECT_FALSE(config.multi_select);
	EXPECT_TRUE(config.show_help);
	EXPECT_EQ(config.cache_capacity, Display::DefaultCacheCapacity);
}

TEST_F(ConfigTest, ViewportRows)
{
	FinderConfig config = {};
	EXPECT_EQ(config.viewport_rows(30), 30u);

	config.height_mode = HeightMode::Fixed;
	config.height      = 10;
	EXPECT_EQ(config.viewport_rows(30), 10u);
	EXPECT_EQ(config.viewport_rows(6), 6u);

	config.height_mode       = HeightMode::Percentage;
	config.height_percentage = 40;
	EXPECT_EQ(config.viewport_rows(30), 12u);
	EXPECT_EQ(config.viewport_rows(2), 1u);
	EXPECT_EQ(config.viewport_rows(0), 0u);
}

TEST_F(ConfigTest, LoadsEverySetting)
{
	const auto path = write(R"(<?xml version="1.0"?>
<ff>
	<heightPercentage>30</heightPercentage>
	<prompt>find: </prompt>
	<multiSelect>yes</multiSelect>
	<showHelp>false</showHelp>
	<showStatus>0</showStatus>
	<loadingMessage>Scanning</loadingMessage>
	<readyMessage>Done</readyMessage>
	<cacheCapacity>8</cacheCapacity>
</ff>)");

	FinderConfig config = {};
	ConfigLoader::load(path, config);

	EXPECT_EQ(config.height_mode, HeightMode::Percentage);
	EXPECT_EQ(config.height_percentage, 30u);
	EXPECT_EQ(config.prompt, "find: ");
	EXPECT_TRUE(config.multi_select);
	EXPECT_FALSE(config.show_help);
	EXPECT_FALSE(config.show_status);
	EXPECT_EQ(config.loading_message, "Scanning");
	EXPECT_EQ(config.ready_message, "Done");
	EXPECT_EQ(config.cache_capacity, 8u);
}

TEST_F(ConfigTest, FixedHeight)
{
	FinderConfig config = {};
	ConfigLoader::load(write("<ff><height>12</height></ff>"), config);

	EXPECT_EQ(config.height_mode, HeightMode::Fixed);
	EXPECT_EQ(config.height, 12u);
}

TEST_F(ConfigTest, InvalidValueLeavesConfigUntouched)
{
	FinderConfig config = {};
	EXPECT_THROW(ConfigLoader::load(write("<ff><prompt>$ </prompt><height>tall</height></ff>"),
	                                config),
	             ConfigError);
	EXPECT_EQ(config.prompt, "> ");
	EXPECT_TRUE(config.fullscreen());
}

TEST_F(ConfigTest, RejectsOutOfRangePercentage)
{
	FinderConfig config = {};
	EXPECT_THROW(ConfigLoader::load(write("<ff><heightPercentage>150</heightPercentage></ff>"),
	                                config),
	             ConfigError);
}

TEST_F(ConfigTest, RejectsWrongRootAndMalformedXml)
{
	FinderConfig config = {};
	EXPECT_THROW(ConfigLoader::load(write("<finder/>"), config), ConfigError);
	EXPECT_THROW(ConfigLoader::load(write("<ff><height>"), config), ConfigError);
	EXPECT_THROW(ConfigLoader::load(dir / "missing.xml", config), ConfigError);
}

TEST_F(ConfigTest, LoadOrDefaultFallsBackOnErrors)
{
	const auto config = ConfigLoader::load_or_default((dir / "missing.xml").string());
	EXPECT_TRUE(config.fullscreen());
	EXPECT_EQ(config.prompt, "> ");
}

TEST_F(ConfigTest, LoadOrDefaultUsesExplicitFile)
{
	const auto config = ConfigLoader::load_or_default(write("<ff><prompt>? </prompt></ff>").string());
	EXPECT_EQ(config.prompt, "? ");
}

TEST_F(ConfigTest, ParseHelpers)
{
	EXPECT_TRUE(ConfigLoader::parse_bool(" TRUE "));
	EXPECT_FALSE(ConfigLoader::parse_bool("no"));
	EXPECT_THROW((void)ConfigLoader::parse_bool("maybe"), ConfigError);

	EXPECT_EQ(ConfigLoader::parse_size(" 42 "), 42u);
	EXPECT_THROW((void)ConfigLoader::parse_size("-1"), ConfigError);
	EXPECT_THROW((void)ConfigLoader::parse_size(""), ConfigError);
}
