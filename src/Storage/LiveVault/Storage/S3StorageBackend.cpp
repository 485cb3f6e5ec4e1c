/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault Storage Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "S3StorageBackend.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include <LiveVault/Logger/NullLogger.hpp>

#include "RecordingNaming.hpp"
#include "S3Signing.hpp"

namespace fs = std::filesystem;

namespace LiveVault::Storage {

namespace {

std::string contentTypeFor(std::string_view extension)
{
	if (extension == ".mp4")
		return "video/mp4";
	if (extension == ".ts")
		return "video/mp2t";
	return "video/x-flv";
}

std::optional<double> parseDuration(const std::string &text)
{
	double value = 0;
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size())
		return std::nullopt;
	return value;
}

std::string fileNameOfKey(std::string_view key)
{
	std::size_t slash = key.rfind('/');
	return std::string(slash == std::string_view::npos ? key : key.substr(slash + 1));
}

} // anonymous namespace

S3StorageBackend::S3StorageBackend(S3StorageOptions options, std::shared_ptr<IS3Client> client,
				   std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  client_(std::move(client)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (!client_) {
		logger_->error("S3ClientIsNullError");
		throw std::invalid_argument("S3ClientIsNullError(S3StorageBackend::S3StorageBackend)");
	}

	try {
		client_->headBucket();
	} catch (const std::exception &e) {
		logger_->error("S3BucketUnreachable", {{"bucket", options_.bucket}, {"exception", e.what()}});
		throw std::runtime_error(
			fmt::format("BucketUnreachableError(S3StorageBackend::S3StorageBackend):{}", options_.bucket));
	}

	logger_->info("S3StorageInitialized", {{"bucket", options_.bucket},
					       {"prefix", options_.prefix},
					       {"cdnDomain", options_.cdnDomain.value_or("")}});
}

S3StorageBackend::~S3StorageBackend() noexcept = default;

std::string S3StorageBackend::objectKey(std::string_view streamKey, std::string_view fileName) const
{
	return fmt::format("{}{}/{}", options_.prefix, streamKey, fileName);
}

StorageResult S3StorageBackend::save(const fs::path &tempFilePath, std::string_view streamKey,
				     const StorageMetadataOverrides &overrides)
{
	const auto now = std::chrono::system_clock::now();

	StorageResult result;
	result.metadata.streamKey = std::string(streamKey);
	result.metadata.uploadTime = now;

	try {
		if (!isSafePathComponent(streamKey)) {
			logger_->warn("InvalidStreamKey", {{"streamKey", streamKey}});
			result.error = fmt::format("InvalidStreamKey: '{}'", streamKey);
			return result;
		}

		std::error_code ec;
		if (!fs::is_regular_file(tempFilePath, ec)) {
			logger_->error("TempFileNotFound", {{"path", tempFilePath.string()}});
			result.error = fmt::format("TempFileNotFound: {}", tempFilePath.string());
			return result;
		}

		std::uintmax_t size = fs::file_size(tempFilePath, ec);
		if (ec) {
			logger_->error("FileSizeError", {{"path", tempFilePath.string()}, {"error", ec.message()}});
			result.error = fmt::format("StatFailed: {}: {}", tempFilePath.string(), ec.message());
			return result;
		}

		std::string extension = tempFilePath.extension().string();
		if (extension.empty()) {
			extension = options_.defaultExtension;
		}

		std::string fileName = makeRecordingFileName(streamKey, now, extension);
		std::string key = objectKey(streamKey, fileName);
		for (int suffix = 1; client_->headObject(key).has_value(); ++suffix) {
			fileName = fmt::format("{}-{}{}", makeRecordingFileName(streamKey, now, ""), suffix, extension);
			key = objectKey(streamKey, fileName);
		}

		S3PutObjectRequest request;
		request.key = key;
		request.sourceFile = tempFilePath;
		request.contentType = contentTypeFor(extension);
		request.storageClass = options_.storageClass;
		request.serverSideEncryption = options_.serverSideEncryption;
		for (const auto &[name, value] : overrides.attributes) {
			std::string lowered = name;
			std::transform(lowered.begin(), lowered.end(), lowered.begin(),
				       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			request.metadata[std::move(lowered)] = value;
		}
		if (overrides.duration.has_value()) {
			request.metadata["duration"] = fmt::format("{}", *overrides.duration);
		}
		if (overrides.quality.has_value()) {
			request.metadata["quality"] = *overrides.quality;
		}
		if (overrides.thumbnailPath.has_value()) {
			request.metadata["thumbnailpath"] = *overrides.thumbnailPath;
		}
		request.metadata["streamkey"] = std::string(streamKey);
		request.metadata["originalfilename"] = tempFilePath.filename().string();
		request.metadata["uploadtime"] = formatIsoTimestamp(now);
		request.metadata["filesize"] = std::to_string(size);

		std::string location = client_->putObject(request);

		if (!fs::remove(tempFilePath, ec) && ec) {
			logger_->warn("TempFileRemoveError",
				      {{"path", tempFilePath.string()}, {"key", key}, {"error", ec.message()}});
			result.error = fmt::format("TempFileNotRemoved: {}: {}", tempFilePath.string(), ec.message());
		}

		result.metadata.fileName = fileName;
		result.metadata.fileSize = static_cast<std::uint64_t>(size);
		result.metadata.duration = overrides.duration;
		result.metadata.quality = overrides.quality;
		result.metadata.thumbnailPath = overrides.thumbnailPath;

		result.success = true;
		result.filePath = key;
		result.url = cdnUrl(key).value_or(location);

		logger_->info("RecordingUploaded",
			      {{"streamKey", streamKey}, {"key", key}, {"size", std::to_string(size)}});
	} catch (const std::exception &e) {
		logger_->error("RecordingUploadError", {{"streamKey", streamKey}, {"exception", e.what()}});
		result.success = false;
		result.error = e.what();
	}

	return result;
}

std::string S3StorageBackend::resolveUrl(std::string_view identifier, std::chrono::seconds expiry)
{
	const std::string key(identifier);
	if (key.empty() || !client_->headObject(key).has_value()) {
		throw RecordingNotFoundError(key);
	}

	if (std::optional<std::string> url = cdnUrl(key)) {
		return *url;
	}
	return client_->presignGetObject(key, expiry);
}

bool S3StorageBackend::remove(std::string_view identifier)
{
	const std::string key(identifier);
	try {
		if (key.empty() || !client_->headObject(key).has_value()) {
			return false;
		}
		client_->deleteObject(key);
	} catch (const std::exception &e) {
		logger_->error("RecordingDeleteError", {{"key", key}, {"exception", e.what()}});
		return false;
	}

	logger_->info("RecordingDeleted", {{"key", key}});
	return true;
}

std::vector<StorageMetadata> S3StorageBackend::list(std::optional<std::string_view> streamKeyFilter)
{
	std::string prefix = options_.prefix;
	if (streamKeyFilter.has_value()) {
		prefix += fmt::format("{}/", *streamKeyFilter);
	}

	std::vector<StorageMetadata> recordings;
	try {
		forEachObject(prefix, [this, &recordings](const S3ObjectSummary &object) {
			if (object.key.ends_with('/'))
				return;

			StorageMetadata metadata;
			metadata.streamKey = "unknown";
			metadata.fileName = fileNameOfKey(object.key);
			metadata.fileSize = object.size;
			metadata.uploadTime = object.lastModified;

			try {
				if (std::optional<S3ObjectHead> head = client_->headObject(object.key)) {
					const auto &attributes = head->metadata;
					if (auto it = attributes.find("streamkey"); it != attributes.end())
						metadata.streamKey = it->second;
					if (auto it = attributes.find("quality"); it != attributes.end())
						metadata.quality = it->second;
					if (auto it = attributes.find("duration"); it != attributes.end())
						metadata.duration = parseDuration(it->second);
					if (auto it = attributes.find("thumbnailpath"); it != attributes.end())
						metadata.thumbnailPath = it->second;
				}
			} catch (const std::exception &e) {
				logger_->warn("RecordingMetadataUnavailable", {{"key", object.key}, {"exception", e.what()}});
			}

			recordings.push_back(std::move(metadata));
		});
	} catch (const std::exception &e) {
		logger_->error("RecordingListError", {{"prefix", prefix}, {"exception", e.what()}});
		return {};
	}

	std::sort(recordings.begin(), recordings.end(),
		  [](const StorageMetadata &a, const StorageMetadata &b) { return a.uploadTime > b.uploadTime; });
	return recordings;
}

StorageUsage S3StorageBackend::usageInfo()
{
	StorageUsage usage;
	usage.available = options_.capacityBytes;

	try {
		forEachObject(options_.prefix, [&usage](const S3ObjectSummary &object) { usage.used += object.size; });
	} catch (const std::exception &e) {
		logger_->error("StorageUsageError", {{"prefix", options_.prefix}, {"exception", e.what()}});
		return StorageUsage{};
	}

	return usage;
}

std::optional<std::string> S3StorageBackend::cdnUrl(std::string_view key) const
{
	if (!options_.cdnDomain.has_value() || options_.cdnDomain->empty())
		return std::nullopt;
	return fmt::format("https://{}/{}", *options_.cdnDomain, awsUriEncode(key, false));
}

template<typename Visitor> void S3StorageBackend::forEachObject(const std::string &prefix, Visitor &&visitor)
{
	std::optional<std::string> token;
	while (true) {
		S3ListPage result = client_->listObjectsV2(prefix, token);
		for (const auto &object : result.objects) {
			visitor(object);
		}

		if (!result.isTruncated)
			return;
		if (!result.nextContinuationToken.has_value() || result.nextContinuationToken == token) {
			logger_->warn("S3ListTokenMissing", {{"prefix", prefix}});
			return;
		}
		token = std::move(result.nextContinuationToken);
	}
}

} // namespace LiveVault::Storage
