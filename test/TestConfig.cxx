/*
 * Unit tests for src/config/
 */

#include "config/Data.hxx"
#include "config/File.hxx"
#include "config/Option.hxx"
#include "config/Parser.hxx"
#include "util/Exception.hxx"
#include "LogBackend.hxx"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace std::chrono_literals;

static ConfigData
ParseConfig(const char *text)
{
	ConfigData config;
	std::istringstream is(text);
	ReadConfigFile(config, is, "test.conf");
	return config;
}

TEST(Config, OptionNames)
{
	EXPECT_EQ(ParseConfigOptionName("listen_address"),
		  ConfigOption::LISTEN_ADDRESS);
	EXPECT_EQ(ParseConfigOptionName("discovery_cache_ttl"),
		  ConfigOption::DISCOVERY_CACHE_TTL);
	EXPECT_EQ(ParseConfigOptionName("log_level"), ConfigOption::LOG_LEVEL);
	EXPECT_EQ(ParseConfigOptionName("music_directory"), ConfigOption::MAX);
	EXPECT_STREQ(GetConfigOptionName(ConfigOption::HTTP_TIMEOUT),
		     "http_timeout");
}

TEST(Config, Empty)
{
	const auto config = ParseConfig("");
	EXPECT_EQ(config.GetParam(ConfigOption::LISTEN_ADDRESS), nullptr);
	EXPECT_EQ(config.GetString(ConfigOption::LISTEN_ADDRESS), nullptr);
	EXPECT_EQ(config.GetPort(ConfigOption::LISTEN_PORT, 42), 42u);
	EXPECT_EQ(config.GetDuration(ConfigOption::DISCOVERY_TIMEOUT, 1s, 4s),
		  std::chrono::steady_clock::duration(4s));
}

TEST(Config, Values)
{
	const auto config = ParseConfig(
		"# comment\n"
		"\n"
		"listen_address \"192.168.1.10\"\n"
		"  listen_port \"49152\"  # trailing comment\n"
		"discovery_timeout \"2\"\n"
		"discovery_cache_ttl \"60\"\n"
		"http_timeout \"3\"\n"
		"log_level \"verbose\"\n");

	EXPECT_STREQ(config.GetString(ConfigOption::LISTEN_ADDRESS),
		     "192.168.1.10");
	EXPECT_EQ(config.GetPort(ConfigOption::LISTEN_PORT, 0), 49152u);
	EXPECT_EQ(config.GetDuration(ConfigOption::DISCOVERY_TIMEOUT, 1s, 4s),
		  std::chrono::steady_clock::duration(2s));
	EXPECT_EQ(config.GetDuration(ConfigOption::DISCOVERY_CACHE_TTL, 0s, 300s),
		  std::chrono::steady_clock::duration(60s));
	EXPECT_EQ(config.GetDuration(ConfigOption::HTTP_TIMEOUT, 1s, 5s),
		  std::chrono::steady_clock::duration(3s));
	EXPECT_STREQ(config.GetString(ConfigOption::LOG_LEVEL), "verbose");

	const auto *param = config.GetParam(ConfigOption::LISTEN_PORT);
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->line, 4u);
}

TEST(Config, Redefined)
{
	const auto config = ParseConfig("listen_port \"1\"\n"
					"listen_port \"2\"\n");
	EXPECT_EQ(config.GetPort(ConfigOption::LISTEN_PORT, 0), 2u);
}

TEST(Config, UnknownOption)
{
	try {
		ParseConfig("listen_address \"0.0.0.0\"\n"
			    "music_directory \"/music\"\n");
		FAIL();
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "Error in test.conf line 2: unrecognized parameter: music_directory");
	}
}

TEST(Config, MalformedLine)
{
	EXPECT_THROW(ParseConfig("listen_port\n"), std::runtime_error);
	EXPECT_THROW(ParseConfig("listen_port 6600\n"), std::runtime_error);
	EXPECT_THROW(ParseConfig("listen_port \"6600\" extra\n"),
		     std::runtime_error);
	EXPECT_THROW(ParseConfig("listen_port \"6600\n"), std::runtime_error);
}

TEST(Config, MalformedValue)
{
	const auto config = ParseConfig("listen_port \"abc\"\n"
					"discovery_timeout \"0\"\n");

	try {
		config.GetPort(ConfigOption::LISTEN_PORT, 0);
		FAIL();
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "Error on line 1: Failed to parse number");
	}

	EXPECT_THROW(config.GetDuration(ConfigOption::DISCOVERY_TIMEOUT, 1s, 4s),
		     std::runtime_error);
}

TEST(Config, PortRange)
{
	const auto config = ParseConfig("listen_port \"65536\"\n");
	EXPECT_THROW(config.GetPort(ConfigOption::LISTEN_PORT, 0),
		     std::runtime_error);
	EXPECT_EQ(config.GetUnsigned(ConfigOption::LISTEN_PORT, 0), 65536u);
}

TEST(Config, Parser)
{
	EXPECT_EQ(ParseUnsigned("0"), 0u);
	EXPECT_EQ(ParseUnsigned("7"), 7u);
	EXPECT_THROW(ParseUnsigned("-1"), std::runtime_error);
	EXPECT_THROW(ParseUnsigned(""), std::runtime_error);
	EXPECT_THROW(ParseUnsigned("12x"), std::runtime_error);
	EXPECT_EQ(ParseDuration("300"),
		  std::chrono::steady_clock::duration(300s));
}

TEST(Config, Clear)
{
	auto config = ParseConfig("listen_port \"1\"\n");
	config.Clear();
	EXPECT_EQ(config.GetParam(ConfigOption::LISTEN_PORT), nullptr);
}

TEST(Config, LogLevel)
{
	EXPECT_EQ(ParseLogLevel("default"), LogLevel::NOTICE);
	EXPECT_EQ(ParseLogLevel("info"), LogLevel::INFO);
	EXPECT_EQ(ParseLogLevel("verbose"), LogLevel::DEBUG);
	EXPECT_THROW(ParseLogLevel("loud"), std::runtime_error);
}
