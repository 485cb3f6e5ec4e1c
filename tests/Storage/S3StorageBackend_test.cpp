/*
 * LiveVault - Storage Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <memory>

#include <LiveVault/Storage/S3StorageBackend.hpp>

#include "../TestSupport/FakeS3Client.hpp"
#include "../TestSupport/RecordingLogger.hpp"
#include "../TestSupport/TemporaryDirectory.hpp"

using namespace LiveVault::Storage;
using LiveVault::Tests::FakeS3Client;
using LiveVault::Tests::RecordingLogger;
using LiveVault::Tests::TemporaryDirectory;

namespace fs = std::filesystem;

class S3StorageBackendTest : public ::testing::Test {
protected:
	std::unique_ptr<S3StorageBackend> makeBackend(std::optional<std::string> cdnDomain = std::nullopt)
	{
		return makeBackend(defaultOptions(std::move(cdnDomain)));
	}

	std::unique_ptr<S3StorageBackend> makeBackend(const S3StorageOptions &options)
	{
		return std::make_unique<S3StorageBackend>(options, client, logger);
	}

	static S3StorageOptions defaultOptions(std::optional<std::string> cdnDomain = std::nullopt)
	{
		S3StorageOptions options;
		options.bucket = "livestream-recordings";
		options.prefix = "recordings/";
		options.cdnDomain = std::move(cdnDomain);
		return options;
	}

	TemporaryDirectory dir;
	std::shared_ptr<FakeS3Client> client = std::make_shared<FakeS3Client>();
	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
};

TEST_F(S3StorageBackendTest, UnreachableBucketFailsConstruction)
{
	client->bucketUnreachable = true;
	EXPECT_THROW(makeBackend(), std::runtime_error);
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Error, "S3BucketUnreachable"));
}

TEST_F(S3StorageBackendTest, SaveUploadsUnderStreamKeyPrefixThenDeletesTempFile)
{
	auto backend = makeBackend();
	const fs::path temp = dir.writeFile("abc.flv", "0123456789");

	StorageMetadataOverrides overrides;
	overrides.duration = 12.5;
	overrides.attributes["Codec"] = "h264";
	StorageResult result = backend->save(temp, "abc", overrides);

	ASSERT_TRUE(result.success) << result.error.value_or("");
	EXPECT_EQ(client->sourceExistedAtPut, true);
	EXPECT_FALSE(fs::exists(temp));

	ASSERT_TRUE(result.filePath.has_value());
	EXPECT_TRUE(result.filePath->starts_with("recordings/abc/abc_"));
	EXPECT_TRUE(result.filePath->ends_with(".flv"));
	EXPECT_EQ(result.url, "https://bucket.s3.example.com/" + *result.filePath);
	EXPECT_EQ(result.metadata.fileSize, 10u);

	const auto &stored = client->objects.at(*result.filePath);
	EXPECT_EQ(stored.metadata.at("streamkey"), "abc");
	EXPECT_EQ(stored.metadata.at("originalfilename"), "abc.flv");
	EXPECT_EQ(stored.metadata.at("filesize"), "10");
	EXPECT_EQ(stored.metadata.at("duration"), "12.5");
	EXPECT_EQ(stored.metadata.at("codec"), "h264");
	EXPECT_EQ(stored.contentType, "video/x-flv");
	EXPECT_EQ(stored.storageClass, "STANDARD_IA");
}

TEST_F(S3StorageBackendTest, FailedUploadKeepsTempFile)
{
	auto backend = makeBackend();
	const fs::path temp = dir.writeFile("abc.flv", "data");
	client->failPut = true;

	StorageResult result = backend->save(temp, "abc");

	EXPECT_FALSE(result.success);
	ASSERT_TRUE(result.error.has_value());
	EXPECT_NE(result.error->find("SlowDown"), std::string::npos);
	EXPECT_TRUE(fs::exists(temp));
}

TEST_F(S3StorageBackendTest, SaveReportsTempFileLeftBehind)
{
	auto backend = makeBackend();
	const fs::path temp = dir.writeFile("abc.flv", "0123456789");
	client->onPut = [](const S3PutObjectRequest &request) {
		fs::remove(request.sourceFile);
		fs::create_directories(request.sourceFile / "busy");
	};

	StorageResult result = backend->save(temp, "abc");

	EXPECT_TRUE(result.success);
	ASSERT_TRUE(result.error.has_value());
	EXPECT_NE(result.error->find("TempFileNotRemoved"), std::string::npos);
	EXPECT_NE(result.error->find(temp.string()), std::string::npos);
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Warn, "TempFileRemoveError"));
	EXPECT_EQ(client->objects.size(), 1u);
}

TEST_F(S3StorageBackendTest, SaveOfMissingFileFails)
{
	auto backend = makeBackend();
	StorageResult result = backend->save(dir.path() / "missing.flv", "abc");

	EXPECT_FALSE(result.success);
	EXPECT_NE(result.error.value_or("").find("TempFileNotFound"), std::string::npos);
	EXPECT_TRUE(client->objects.empty());
}

TEST_F(S3StorageBackendTest, CdnDomainIsUsedForUrls)
{
	auto backend = makeBackend("cdn.example.com");
	StorageResult result = backend->save(dir.writeFile("abc.mp4", "mp4"), "abc");

	ASSERT_TRUE(result.success);
	EXPECT_EQ(result.url, "https://cdn.example.com/" + *result.filePath);
	EXPECT_EQ(backend->resolveUrl(*result.filePath, std::chrono::seconds(60)), *result.url);
}

TEST_F(S3StorageBackendTest, ResolveUrlPresignsWithoutCdn)
{
	auto backend = makeBackend();
	client->addObject("recordings/abc/abc_1.flv", 1, std::chrono::system_clock::now());

	EXPECT_EQ(backend->resolveUrl("recordings/abc/abc_1.flv"),
		  "https://bucket.s3.example.com/recordings/abc/abc_1.flv?X-Amz-Expires=3600");
	EXPECT_THROW(backend->resolveUrl("recordings/abc/missing.flv"), RecordingNotFoundError);
}

TEST_F(S3StorageBackendTest, ResolveUrlUsesConfiguredDefaultExpiry)
{
	S3StorageOptions options = defaultOptions();
	options.defaultUrlExpiry = std::chrono::seconds(600);
	std::shared_ptr<IStorageBackend> backend = makeBackend(options);
	client->addObject("recordings/abc/abc_1.flv", 1, std::chrono::system_clock::now());

	EXPECT_EQ(backend->resolveUrl("recordings/abc/abc_1.flv"),
		  "https://bucket.s3.example.com/recordings/abc/abc_1.flv?X-Amz-Expires=600");
	EXPECT_EQ(backend->resolveUrl("recordings/abc/abc_1.flv", std::chrono::seconds(30)),
		  "https://bucket.s3.example.com/recordings/abc/abc_1.flv?X-Amz-Expires=30");
}

TEST_F(S3StorageBackendTest, RemoveReportsWhetherObjectExisted)
{
	auto backend = makeBackend();
	client->addObject("recordings/abc/abc_1.flv", 1, std::chrono::system_clock::now());

	EXPECT_TRUE(backend->remove("recordings/abc/abc_1.flv"));
	EXPECT_FALSE(backend->remove("recordings/abc/abc_1.flv"));
	EXPECT_EQ(client->deletedKeys.size(), 1u);
}

TEST_F(S3StorageBackendTest, ListReadsMetadataAndDegradesOnHeadFailure)
{
	auto backend = makeBackend();
	const auto now = std::chrono::system_clock::now();
	client->addObject("recordings/abc/abc_1.flv", 10, now - std::chrono::hours(2),
			  {{"streamkey", "abc"}, {"quality", "720p"}, {"duration", "30"}});
	client->addObject("recordings/abc/abc_2.flv", 20, now - std::chrono::hours(1));
	client->addObject("recordings/xyz/xyz_1.flv", 30, now);
	client->failingHeads.insert("recordings/abc/abc_2.flv");

	std::vector<StorageMetadata> abc = backend->list("abc");

	ASSERT_EQ(abc.size(), 2u);
	EXPECT_EQ(client->listedPrefixes.back(), "recordings/abc/");
	EXPECT_EQ(abc[0].fileName, "abc_2.flv");
	EXPECT_EQ(abc[0].streamKey, "unknown");
	EXPECT_EQ(abc[1].streamKey, "abc");
	EXPECT_EQ(abc[1].quality, "720p");
	EXPECT_EQ(abc[1].duration, 30.0);

	EXPECT_EQ(backend->list().size(), 3u);
}

TEST_F(S3StorageBackendTest, UsagePaginatesAcrossPages)
{
	auto backend = makeBackend();
	client->pageSize = 2;
	for (int i = 0; i < 5; ++i) {
		client->addObject(fmt::format("recordings/abc/abc_{}.flv", i), 100, std::chrono::system_clock::now());
	}

	StorageUsage usage = backend->usageInfo();

	EXPECT_EQ(usage.used, 500u);
	EXPECT_EQ(client->listCalls, 3u);
}

TEST_F(S3StorageBackendTest, UsageReadsEveryPageOfLargeListings)
{
	auto backend = makeBackend();
	client->pageSize = 1;
	const auto now = std::chrono::system_clock::now();
	for (int i = 0; i < 10050; ++i) {
		client->addObject(fmt::format("recordings/abc/abc_{:05}.flv", i), 1, now);
	}

	StorageUsage usage = backend->usageInfo();

	EXPECT_EQ(usage.used, 10050u);
	EXPECT_EQ(client->listCalls, 10050u);
}
