/*
 * LiveVault - Logger Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include <LiveVault/Logger/NullLogger.hpp>
#include <LiveVault/Logger/PrintLogger.hpp>

using namespace LiveVault::Logger;

class PrintLoggerTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		oldOut = std::cout.rdbuf(out.rdbuf());
		oldLog = std::clog.rdbuf(err.rdbuf());
	}

	void TearDown() override
	{
		std::cout.rdbuf(oldOut);
		std::clog.rdbuf(oldLog);
	}

	std::ostringstream out;
	std::ostringstream err;
	std::streambuf *oldOut = nullptr;
	std::streambuf *oldLog = nullptr;
};

TEST_F(PrintLoggerTest, WritesNameLocationAndFields)
{
	PrintLogger logger(LogLevel::Debug);
	logger.info("RecordingSaved", {{"streamKey", "abc"}, {"size", "10"}});

	const std::string line = out.str();
	EXPECT_NE(line.find("level=INFO"), std::string::npos);
	EXPECT_NE(line.find("name=RecordingSaved"), std::string::npos);
	EXPECT_NE(line.find("PrintLogger_test.cpp:"), std::string::npos);
	EXPECT_NE(line.find("\tstreamKey=abc\tsize=10"), std::string::npos);
}

TEST_F(PrintLoggerTest, WarningsGoToLogStream)
{
	PrintLogger logger;
	logger.warn("UnknownStorageBackend");
	logger.error("S3BucketUnreachable");

	EXPECT_TRUE(out.str().empty());
	EXPECT_NE(err.str().find("level=WARN"), std::string::npos);
	EXPECT_NE(err.str().find("level=ERROR"), std::string::npos);
}

TEST_F(PrintLoggerTest, FiltersBelowMinimumLevel)
{
	PrintLogger logger(LogLevel::Warn);
	logger.debug("Noise");
	logger.info("MoreNoise");

	EXPECT_TRUE(out.str().empty());
	EXPECT_EQ(logger.minLevel(), LogLevel::Warn);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively)
{
	EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
	EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
	EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warn);
	EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
	EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(NullLoggerTest, SharedInstanceDiscardsEverything)
{
	auto logger = NullLogger::instance();
	ASSERT_NE(logger, nullptr);
	EXPECT_EQ(logger, NullLogger::instance());
	logger->error("Ignored", {{"k", "v"}});
}
