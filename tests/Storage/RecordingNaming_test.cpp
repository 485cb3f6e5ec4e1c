/*
 * LiveVault - Storage Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <LiveVault/Storage/RecordingNaming.hpp>

using namespace LiveVault::Storage;

namespace {

std::chrono::system_clock::time_point sampleTime()
{
	using namespace std::chrono;
	// 2025-03-04T05:06:07.089Z
	return system_clock::time_point(seconds(1741064767)) + milliseconds(89);
}

} // namespace

TEST(RecordingNamingTest, FormatsIsoTimestampWithMilliseconds)
{
	EXPECT_EQ(formatIsoTimestamp(sampleTime()), "2025-03-04T05:06:07.089Z");
}

TEST(RecordingNamingTest, FileSafeTimestampReplacesSeparators)
{
	EXPECT_EQ(formatFileSafeTimestamp(sampleTime()), "2025-03-04T05-06-07-089Z");
}

TEST(RecordingNamingTest, ParsesIsoTimestamp)
{
	auto parsed = parseIsoTimestamp("2025-03-04T05:06:07.089Z");
	ASSERT_TRUE(parsed.has_value());
	EXPECT_EQ(*parsed, sampleTime());

	auto whole = parseIsoTimestamp("2025-03-04T05:06:07Z");
	ASSERT_TRUE(whole.has_value());
	EXPECT_EQ(*whole, sampleTime() - std::chrono::milliseconds(89));

	EXPECT_FALSE(parseIsoTimestamp("yesterday").has_value());
	EXPECT_FALSE(parseIsoTimestamp("").has_value());
}

TEST(RecordingNamingTest, RecordingFileNameJoinsKeyAndTimestamp)
{
	EXPECT_EQ(makeRecordingFileName("abc", sampleTime(), ".flv"), "abc_2025-03-04T05-06-07-089Z.flv");
	EXPECT_EQ(streamKeyFromFileName("abc_2025-03-04T05-06-07-089Z.flv"), "abc");
}

TEST(RecordingNamingTest, RejectsUnsafePathComponents)
{
	EXPECT_TRUE(isSafePathComponent("abc-123"));
	EXPECT_FALSE(isSafePathComponent(""));
	EXPECT_FALSE(isSafePathComponent("."));
	EXPECT_FALSE(isSafePathComponent(".."));
	EXPECT_FALSE(isSafePathComponent("a/b"));
	EXPECT_FALSE(isSafePathComponent("a\\b"));
	EXPECT_FALSE(isSafePathComponent(std::string_view("a\0b", 3)));
}
