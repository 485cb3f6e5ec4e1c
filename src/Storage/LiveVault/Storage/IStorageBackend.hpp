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
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "StorageTypes.hpp"

namespace LiveVault::Storage {

class RecordingNotFoundError : public std::runtime_error {
public:
	explicit RecordingNotFoundError(const std::string &identifier)
		: std::runtime_error("RecordingNotFoundError:" + identifier),
		  identifier_(identifier)
	{
	}

	const std::string &identifier() const noexcept { return identifier_; }

private:
	std::string identifier_;
};

inline constexpr std::chrono::seconds kDefaultUrlExpiry{3600};

/**
 * Persistence contract shared by every recording backend.
 *
 * save, remove, list and usageInfo report failures through their return
 * values and never throw for I/O or network problems. resolveUrl is the one
 * operation that throws, with RecordingNotFoundError when the object is absent.
 * Implementations must tolerate concurrent calls for different stream keys.
 */
class IStorageBackend {
public:
	virtual ~IStorageBackend() = default;

	/**
	 * Moves the finished capture at `tempFilePath` into durable storage.
	 *
	 * On success the temp file no longer exists and metadata.fileSize is the
	 * size of the persisted object. A missing temp file yields success=false
	 * with an error naming TempFileNotFound and the path.
	 */
	virtual StorageResult save(const std::filesystem::path &tempFilePath, std::string_view streamKey,
				   const StorageMetadataOverrides &overrides) = 0;

	/// @throws RecordingNotFoundError
	virtual std::string resolveUrl(std::string_view identifier, std::chrono::seconds expiry) = 0;

	/// Returns false when there was nothing to delete or deletion failed.
	virtual bool remove(std::string_view identifier) = 0;

	/// Newest first. An empty result may also mean enumeration failed, which is logged.
	virtual std::vector<StorageMetadata> list(std::optional<std::string_view> streamKeyFilter) = 0;

	virtual StorageUsage usageInfo() = 0;

	/// "local" or "remote".
	virtual std::string_view kind() const noexcept = 0;

	/// Expiry used by resolveUrl when the caller names none.
	virtual std::chrono::seconds defaultUrlExpiry() const noexcept { return kDefaultUrlExpiry; }

	StorageResult save(const std::filesystem::path &tempFilePath, std::string_view streamKey)
	{
		return save(tempFilePath, streamKey, StorageMetadataOverrides{});
	}

	std::string resolveUrl(std::string_view identifier) { return resolveUrl(identifier, defaultUrlExpiry()); }

	std::vector<StorageMetadata> list() { return list(std::nullopt); }
};

} // namespace LiveVault::Storage
