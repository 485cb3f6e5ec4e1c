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
#include <memory>
#include <optional>
#include <string>

#include <LiveVault/Logger/ILogger.hpp>

#include "IS3Client.hpp"
#include "IStorageBackend.hpp"

namespace LiveVault::Storage {

struct S3StorageOptions {
	std::string bucket = "livestream-recordings";
	std::string prefix = "recordings/";
	/// When set, every URL handed out is https://<cdnDomain>/<key>.
	std::optional<std::string> cdnDomain;
	/// Largest integer a JSON double represents exactly; the store itself has no fixed limit.
	std::uint64_t capacityBytes = 9007199254740991ULL;
	std::string defaultExtension = ".flv";
	std::string storageClass = "STANDARD_IA";
	std::string serverSideEncryption = "AES256";
	/// Presigned URL lifetime when resolveUrl is given no expiry.
	std::chrono::seconds defaultUrlExpiry = kDefaultUrlExpiry;
};

/**
 * Recordings in an S3 bucket under `<prefix><streamKey>/<fileName>`.
 * Identifiers are full object keys. The temp file is deleted only after the
 * store has acknowledged the upload.
 */
class S3StorageBackend final : public IStorageBackend {
public:
	/// @throws std::runtime_error when the bucket cannot be reached.
	S3StorageBackend(S3StorageOptions options, std::shared_ptr<IS3Client> client,
			 std::shared_ptr<const Logger::ILogger> logger);
	~S3StorageBackend() noexcept override;

	S3StorageBackend(const S3StorageBackend &) = delete;
	S3StorageBackend &operator=(const S3StorageBackend &) = delete;

	using IStorageBackend::list;
	using IStorageBackend::resolveUrl;
	using IStorageBackend::save;

	StorageResult save(const std::filesystem::path &tempFilePath, std::string_view streamKey,
			   const StorageMetadataOverrides &overrides) override;

	std::string resolveUrl(std::string_view identifier, std::chrono::seconds expiry) override;

	bool remove(std::string_view identifier) override;

	std::vector<StorageMetadata> list(std::optional<std::string_view> streamKeyFilter) override;

	StorageUsage usageInfo() override;

	std::string_view kind() const noexcept override { return "remote"; }

	std::chrono::seconds defaultUrlExpiry() const noexcept override { return options_.defaultUrlExpiry; }

	std::string objectKey(std::string_view streamKey, std::string_view fileName) const;

private:
	std::optional<std::string> cdnUrl(std::string_view key) const;

	template<typename Visitor> void forEachObject(const std::string &prefix, Visitor &&visitor);

	const S3StorageOptions options_;
	const std::shared_ptr<IS3Client> client_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace LiveVault::Storage
