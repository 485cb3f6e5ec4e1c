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

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <LiveVault/Logger/ILogger.hpp>

#include "IStorageBackend.hpp"

namespace LiveVault::Storage {

struct LocalStorageOptions {
	std::filesystem::path recordingsPath = "./media/recordings";
	std::filesystem::path tempPath = "./media/temp";
	std::string publicBaseUrl = "http://localhost:8002/recordings";
	std::uint64_t capacityBytes = 100ULL * 1024 * 1024 * 1024;
	std::string defaultExtension = ".flv";
	std::vector<std::string> recordingExtensions{".flv", ".mp4"};

	// Filesystem primitives used when moving a capture into place. Empty means std::filesystem.
	std::function<void(const std::filesystem::path &, const std::filesystem::path &, std::error_code &)>
		renameFile;
	std::function<bool(const std::filesystem::path &, std::error_code &)> removeFile;
};

/**
 * Keeps recordings as plain files in one directory.
 *
 * Identifiers are file names relative to the recordings directory. File
 * modification time stands in for upload time when listing and for age when
 * cleaning up.
 */
class LocalStorageBackend final : public IStorageBackend {
public:
	LocalStorageBackend(LocalStorageOptions options, std::shared_ptr<const Logger::ILogger> logger);
	~LocalStorageBackend() noexcept override;

	LocalStorageBackend(const LocalStorageBackend &) = delete;
	LocalStorageBackend &operator=(const LocalStorageBackend &) = delete;

	using IStorageBackend::list;
	using IStorageBackend::resolveUrl;
	using IStorageBackend::save;

	StorageResult save(const std::filesystem::path &tempFilePath, std::string_view streamKey,
			   const StorageMetadataOverrides &overrides) override;

	std::string resolveUrl(std::string_view identifier, std::chrono::seconds expiry) override;

	bool remove(std::string_view identifier) override;

	std::vector<StorageMetadata> list(std::optional<std::string_view> streamKeyFilter) override;

	StorageUsage usageInfo() override;

	std::string_view kind() const noexcept override { return "local"; }

	/// Deletes recordings last modified before now - maxAge and returns how many were deleted.
	std::size_t cleanupOldRecordings(std::chrono::hours maxAge = std::chrono::hours(168));

	const std::filesystem::path &recordingsPath() const noexcept { return options_.recordingsPath; }
	const std::filesystem::path &tempPath() const noexcept { return options_.tempPath; }
	std::filesystem::path thumbnailsPath() const { return options_.recordingsPath / "thumbnails"; }

private:
	bool isRecordingFile(const std::filesystem::directory_entry &entry) const;
	std::filesystem::path reserveDestination(std::string_view streamKey, std::chrono::system_clock::time_point now,
						 std::string_view extension) const;
	bool moveIntoPlace(const std::filesystem::path &source, const std::filesystem::path &destination,
			   std::string &errorMessage) const;

	const LocalStorageOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	// Serializes choosing a destination name with claiming it.
	std::mutex saveMutex_;
};

} // namespace LiveVault::Storage
