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
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace LiveVault::Storage {

struct S3ObjectHead {
	std::uint64_t contentLength = 0;
	/// x-amz-meta-* headers with the prefix removed, names lower-cased.
	std::map<std::string, std::string> metadata;
};

struct S3ObjectSummary {
	std::string key;
	std::uint64_t size = 0;
	std::chrono::system_clock::time_point lastModified;
};

struct S3ListPage {
	std::vector<S3ObjectSummary> objects;
	bool isTruncated = false;
	std::optional<std::string> nextContinuationToken;
};

struct S3PutObjectRequest {
	std::string key;
	std::filesystem::path sourceFile;
	std::string contentType;
	std::string storageClass;
	std::string serverSideEncryption;
	std::map<std::string, std::string> metadata;
};

/**
 * The subset of the S3 REST API the recording backend relies on.
 * Every operation throws std::runtime_error on transport or service errors.
 */
class IS3Client {
public:
	virtual ~IS3Client() = default;

	virtual void headBucket() = 0;

	/// std::nullopt when the object does not exist.
	virtual std::optional<S3ObjectHead> headObject(const std::string &key) = 0;

	/// Returns the object's URL once the store has acknowledged the write.
	virtual std::string putObject(const S3PutObjectRequest &request) = 0;

	virtual void deleteObject(const std::string &key) = 0;

	virtual S3ListPage listObjectsV2(const std::string &prefix,
					 const std::optional<std::string> &continuationToken) = 0;

	virtual std::string presignGetObject(const std::string &key, std::chrono::seconds expiry) = 0;
};

} // namespace LiveVault::Storage
