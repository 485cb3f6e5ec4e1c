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
#include <LiveVault/Storage/S3Xml.hpp>

using namespace LiveVault::Storage;

TEST(S3XmlTest, ParsesListObjectsV2Page)
{
	const std::string xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>livestream-recordings</Name>
  <Prefix>recordings/</Prefix>
  <KeyCount>2</KeyCount>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>token-2</NextContinuationToken>
  <Contents>
    <Key>recordings/abc/abc_1.flv</Key>
    <LastModified>2025-03-04T05:06:07.000Z</LastModified>
    <Size>1024</Size>
  </Contents>
  <Contents>
    <Key>recordings/a&amp;b/a&amp;b_1.flv</Key>
    <LastModified>2025-03-04T05:06:08.000Z</LastModified>
    <Size>2048</Size>
  </Contents>
</ListBucketResult>)";

	S3ListPage page = parseListObjectsV2(xml);

	EXPECT_TRUE(page.isTruncated);
	EXPECT_EQ(page.nextContinuationToken, "token-2");
	ASSERT_EQ(page.objects.size(), 2u);
	EXPECT_EQ(page.objects[0].key, "recordings/abc/abc_1.flv");
	EXPECT_EQ(page.objects[0].size, 1024u);
	EXPECT_EQ(page.objects[0].lastModified, parseIsoTimestamp("2025-03-04T05:06:07.000Z"));
	EXPECT_EQ(page.objects[1].key, "recordings/a&b/a&b_1.flv");
}

TEST(S3XmlTest, EmptyListingIsNotTruncated)
{
	S3ListPage page = parseListObjectsV2(
		"<ListBucketResult><IsTruncated>false</IsTruncated><KeyCount>0</KeyCount></ListBucketResult>");
	EXPECT_FALSE(page.isTruncated);
	EXPECT_TRUE(page.objects.empty());
}

TEST(S3XmlTest, RejectsNonListingDocument)
{
	EXPECT_THROW(parseListObjectsV2("<Error><Code>AccessDenied</Code></Error>"), std::runtime_error);
}

TEST(S3XmlTest, ExtractsErrorCode)
{
	EXPECT_EQ(parseS3ErrorCode("<Error><Code>NoSuchBucket</Code><Message>x</Message></Error>"), "NoSuchBucket");
	EXPECT_FALSE(parseS3ErrorCode("").has_value());
}

TEST(S3XmlTest, DecodesEntities)
{
	EXPECT_EQ(decodeXmlEntities("a &lt;b&gt; &quot;c&quot; &apos;d&apos; &amp;amp;"), "a <b> \"c\" 'd' &amp;");
}
