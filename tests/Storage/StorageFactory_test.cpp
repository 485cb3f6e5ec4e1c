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

#include <LiveVault/Storage/StorageFactory.hpp>

#include "../TestSupport/FakeS3Client.hpp"
#include "../TestSupport/RecordingLogger.hpp"
#include "../TestSupport/TemporaryDirectory.hpp"

using namespace LiveVault::Storage;
using LiveVault::Tests::FakeS3Client;
using LiveVault::Tests::RecordingLogger;
using LiveVault::Tests::TemporaryDirectory;

class StorageFactoryTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		settings.local.recordingsPath = dir.path() / "recordings";
		settings.local.tempPath = dir.path() / "temp";
	}

	S3ClientFactory fakeFactory()
	{
		return [this](const S3ClientOptions &options) {
			capturedOptions = options;
			return client;
		};
	}

	TemporaryDirectory dir;
	StorageSettings settings;
	std::shared_ptr<FakeS3Client> client = std::make_shared<FakeS3Client>();
	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
	std::optional<S3ClientOptions> capturedOptions;
};

TEST(StorageBackendTypeTest, ParsesNamesCaseInsensitively)
{
	EXPECT_EQ(parseStorageBackendType("local"), StorageBackendType::Local);
	EXPECT_EQ(parseStorageBackendType("LOCAL"), StorageBackendType::Local);
	EXPECT_EQ(parseStorageBackendType("remote"), StorageBackendType::Remote);
	EXPECT_EQ(parseStorageBackendType("S3"), StorageBackendType::Remote);
	EXPECT_FALSE(parseStorageBackendType("gcs").has_value());
	EXPECT_FALSE(parseStorageBackendType("").has_value());
}

TEST_F(StorageFactoryTest, DefaultsToLocal)
{
	auto backend = createStorageBackend(settings, logger, fakeFactory());
	EXPECT_EQ(backend->kind(), "local");
	EXPECT_FALSE(capturedOptions.has_value());
}

TEST_F(StorageFactoryTest, UnknownBackendFallsBackToLocalWithWarning)
{
	settings.backend = "azure";

	auto backend = createStorageBackend(settings, logger, fakeFactory());

	EXPECT_EQ(backend->kind(), "local");
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Warn, "UnknownStorageBackend"));
}

TEST_F(StorageFactoryTest, RemoteAliasSelectsS3Backend)
{
	settings.backend = "s3";
	settings.remote.bucket = "my-bucket";

	auto backend = createStorageBackend(settings, logger, fakeFactory());

	EXPECT_EQ(backend->kind(), "remote");
	ASSERT_TRUE(capturedOptions.has_value());
	EXPECT_EQ(capturedOptions->bucket, "my-bucket");
	EXPECT_EQ(client->headBucketCalls, 1u);
}

TEST_F(StorageFactoryTest, UnreachableRemoteBucketThrows)
{
	settings.backend = "remote";
	client->bucketUnreachable = true;

	EXPECT_THROW(createStorageBackend(settings, logger, fakeFactory()), std::runtime_error);
}
