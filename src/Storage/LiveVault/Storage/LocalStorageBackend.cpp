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

#include "LocalStorageBackend.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include <LiveVault/Logger/NullLogger.hpp>

#include "RecordingNaming.hpp"

namespace fs = std::filesystem;

namespace LiveVault::Storage {

namespace {

std::chrono::system_clock::time_point toSystemTime(fs::file_time_type fileTime)
{
	using namespace std::chrono;
	return time_point_cast<system_clock::duration>(fileTime - fs::file_time_type::clock::now() +
						       system_clock::now());
}

void createDirectoryOrThrow(const fs::path &path, const Logger::ILogger &logger)
{
	std::error_code ec;
	fs::create_directories(path, ec);
	if (ec) {
		logger.error("DirectoryCreateError", {{"path", path.string()}, {"error", ec.message()}});
		throw std::runtime_error("DirectoryCreateError(LocalStorageBackend::LocalStorageBackend):" +
					 path.string());
	}
}

} // anonymous namespace

LocalStorageBackend::LocalStorageBackend(LocalStorageOptions options, std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (options_.recordingsPath.empty()) {
		logger_->error("RecordingsPathIsEmptyError");
		throw std::invalid_argument("RecordingsPathIsEmptyError(LocalStorageBackend::LocalStorageBackend)");
	}

	createDirectoryOrThrow(options_.recordingsPath, *logger_);
	createDirectoryOrThrow(thumbnailsPath(), *logger_);
	if (!options_.tempPath.empty()) {
		createDirectoryOrThrow(options_.tempPath, *logger_);
	}

	logger_->info("LocalStorageInitialized", {{"recordingsPath", options_.recordingsPath.string()},
						  {"tempPath", options_.tempPath.string()}});
}

LocalStorageBackend::~LocalStorageBackend() noexcept = default;

StorageResult LocalStorageBackend::save(const fs::path &tempFilePath, std::string_view streamKey,
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

		std::string extension = tempFilePath.extension().string();
		if (extension.empty()) {
			extension = options_.defaultExtension;
		}

		fs::path destination;
		{
			std::scoped_lock lock(saveMutex_);
			destination = reserveDestination(streamKey, now, extension);

			std::string moveError;
			if (!moveIntoPlace(tempFilePath, destination, moveError)) {
				result.error = fmt::format("MoveFailed: {}: {}", tempFilePath.string(), moveError);
				return result;
			}
		}

		std::uintmax_t size = fs::file_size(destination, ec);
		if (ec) {
			logger_->error("FileSizeError", {{"path", destination.string()}, {"error", ec.message()}});
			result.error = fmt::format("StatFailed: {}: {}", destination.string(), ec.message());
			return result;
		}

		const std::string fileName = destination.filename().string();
		result.metadata.fileName = fileName;
		result.metadata.fileSize = static_cast<std::uint64_t>(size);
		result.metadata.duration = overrides.duration;
		result.metadata.quality = overrides.quality;
		result.metadata.thumbnailPath = overrides.thumbnailPath;

		result.success = true;
		result.filePath = destination.string();
		result.url = fmt::format("{}/{}", options_.publicBaseUrl, fileName);

		logger_->info("RecordingSaved",
			      {{"streamKey", streamKey}, {"path", destination.string()}, {"size", std::to_string(size)}});
	} catch (const std::exception &e) {
		logger_->error("RecordingSaveError", {{"streamKey", streamKey}, {"exception", e.what()}});
		result.success = false;
		result.error = e.what();
	}

	return result;
}

std::string LocalStorageBackend::resolveUrl(std::string_view identifier, std::chrono::seconds)
{
	if (!isSafePathComponent(identifier)) {
		throw RecordingNotFoundError(std::string(identifier));
	}

	std::error_code ec;
	if (!fs::is_regular_file(options_.recordingsPath / identifier, ec)) {
		throw RecordingNotFoundError(std::string(identifier));
	}

	return fmt::format("{}/{}", options_.publicBaseUrl, identifier);
}

bool LocalStorageBackend::remove(std::string_view identifier)
{
	if (!isSafePathComponent(identifier)) {
		logger_->warn("InvalidRecordingIdentifier", {{"identifier", identifier}});
		return false;
	}

	std::error_code ec;
	const fs::directory_entry entry(options_.recordingsPath / identifier, ec);
	if (ec || !isRecordingFile(entry)) {
		return false;
	}

	bool removed = fs::remove(entry.path(), ec);
	if (ec) {
		logger_->error("RecordingDeleteError", {{"identifier", identifier}, {"error", ec.message()}});
		return false;
	}

	if (removed) {
		logger_->info("RecordingDeleted", {{"identifier", identifier}});
	}
	return removed;
}

std::vector<StorageMetadata> LocalStorageBackend::list(std::optional<std::string_view> streamKeyFilter)
{
	std::vector<StorageMetadata> recordings;

	try {
		std::string prefix;
		if (streamKeyFilter.has_value()) {
			prefix = fmt::format("{}_", *streamKeyFilter);
		}

		for (const auto &entry : fs::directory_iterator(options_.recordingsPath)) {
			if (!isRecordingFile(entry))
				continue;

			std::string fileName = entry.path().filename().string();
			if (!prefix.empty() && !fileName.starts_with(prefix))
				continue;

			std::error_code ec;
			std::uintmax_t size = entry.file_size(ec);
			if (ec)
				continue;
			fs::file_time_type modified = entry.last_write_time(ec);
			if (ec)
				continue;

			StorageMetadata metadata;
			metadata.streamKey = streamKeyFromFileName(fileName);
			metadata.fileName = std::move(fileName);
			metadata.fileSize = static_cast<std::uint64_t>(size);
			metadata.uploadTime = toSystemTime(modified);
			recordings.push_back(std::move(metadata));
		}
	} catch (const std::exception &e) {
		logger_->error("RecordingListError",
			       {{"path", options_.recordingsPath.string()}, {"exception", e.what()}});
		return {};
	}

	std::sort(recordings.begin(), recordings.end(),
		  [](const StorageMetadata &a, const StorageMetadata &b) { return a.uploadTime > b.uploadTime; });
	return recordings;
}

StorageUsage LocalStorageBackend::usageInfo()
{
	StorageUsage usage;
	usage.available = options_.capacityBytes;

	try {
		for (const auto &entry : fs::recursive_directory_iterator(options_.recordingsPath)) {
			std::error_code ec;
			if (!entry.is_regular_file(ec))
				continue;
			std::uintmax_t size = entry.file_size(ec);
			if (!ec)
				usage.used += static_cast<std::uint64_t>(size);
		}
	} catch (const std::exception &e) {
		logger_->error("StorageUsageError", {{"path", options_.recordingsPath.string()}, {"exception", e.what()}});
		return StorageUsage{};
	}

	return usage;
}

std::size_t LocalStorageBackend::cleanupOldRecordings(std::chrono::hours maxAge)
{
	const fs::file_time_type cutoff = fs::file_time_type::clock::now() - maxAge;
	std::size_t deleted = 0;

	try {
		for (const auto &entry : fs::directory_iterator(options_.recordingsPath)) {
			if (!isRecordingFile(entry))
				continue;

			std::error_code ec;
			fs::file_time_type modified = entry.last_write_time(ec);
			if (ec || modified >= cutoff)
				continue;

			if (fs::remove(entry.path(), ec)) {
				++deleted;
				logger_->info("OldRecordingDeleted", {{"path", entry.path().string()}});
			} else if (ec) {
				logger_->warn("OldRecordingDeleteError",
					      {{"path", entry.path().string()}, {"error", ec.message()}});
			}
		}
	} catch (const std::exception &e) {
		logger_->error("RecordingCleanupError", {{"exception", e.what()}});
	}

	logger_->info("RecordingCleanupFinished", {{"deleted", std::to_string(deleted)}});
	return deleted;
}

bool LocalStorageBackend::isRecordingFile(const fs::directory_entry &entry) const
{
	std::error_code ec;
	if (!entry.is_regular_file(ec))
		return false;

	const std::string extension = entry.path().extension().string();
	return std::find(options_.recordingExtensions.begin(), options_.recordingExtensions.end(), extension) !=
	       options_.recordingExtensions.end();
}

fs::path LocalStorageBackend::reserveDestination(std::string_view streamKey, std::chrono::system_clock::time_point now,
						 std::string_view extension) const
{
	const std::string fileName = makeRecordingFileName(streamKey, now, extension);
	fs::path destination = options_.recordingsPath / fileName;

	std::error_code ec;
	for (int suffix = 1; fs::exists(destination, ec); ++suffix) {
		fs::path stem = fs::path(fileName).stem();
		destination = options_.recordingsPath / fmt::format("{}-{}{}", stem.string(), suffix, extension);
	}
	return destination;
}

bool LocalStorageBackend::moveIntoPlace(const fs::path &source, const fs::path &destination,
					std::string &errorMessage) const
{
	std::error_code ec;
	if (options_.renameFile) {
		options_.renameFile(source, destination, ec);
	} else {
		fs::rename(source, destination, ec);
	}
	if (!ec)
		return true;

	if (ec != std::errc::cross_device_link) {
		logger_->error("RecordingRenameError",
			       {{"from", source.string()}, {"to", destination.string()}, {"error", ec.message()}});
		errorMessage = ec.message();
		return false;
	}

	// Different filesystems: copy, then drop the source once the copy is complete.
	fs::copy_file(source, destination, fs::copy_options::none, ec);
	if (ec) {
		logger_->error("RecordingCopyError",
			       {{"from", source.string()}, {"to", destination.string()}, {"error", ec.message()}});
		std::error_code cleanupError;
		fs::remove(destination, cleanupError);
		errorMessage = ec.message();
		return false;
	}

	if (options_.removeFile) {
		options_.removeFile(source, ec);
	} else {
		fs::remove(source, ec);
	}
	if (ec) {
		logger_->error("TempFileRemoveError", {{"path", source.string()}, {"error", ec.message()}});
		std::error_code cleanupError;
		fs::remove(destination, cleanupError);
		errorMessage = ec.message();
		return false;
	}
	return true;
}

} // namespace LiveVault::Storage
