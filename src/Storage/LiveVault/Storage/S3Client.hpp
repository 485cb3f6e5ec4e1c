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
#include <memory>
#include <optional>
#include <string>

#include <LiveVault/Logger/ILogger.hpp>

#include "IS3Client.hpp"
#include "S3Signing.hpp"

namespace LiveVault::Storage {

struct S3ClientOptions {
	std::string bucket;
	std::string region = "ap-southeast-1";
	/// e.g. "http://localhost:9000" for an S3-compatible store. Empty means AWS.
	std::string endpoint;
	bool forcePathStyle = false;
	S3Credentials credentials;
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds requestTimeout{60};
	/// Zero disables the limit. Stalled uploads still fail through the low-speed check.
	std::chrono::seconds uploadTimeout{0};
};

/**
 * S3 REST client on libcurl. Requests are signed by curl's built-in SigV4
 * support; presigned URLs are computed locally. Each call uses its own easy
 * handle, so one client may serve concurrent callers.
 */
class S3Client final : public IS3Client {
public:
	S3Client(S3ClientOptions options, std::shared_ptr<const Logger::ILogger> logger);
	~S3Client() noexcept override;

	S3Client(const S3Client &) = delete;
	S3Client &operator=(const S3Client &) = delete;

	void headBucket() override;

	std::optional<S3ObjectHead> headObject(const std::string &key) override;

	std::string putObject(const S3PutObjectRequest &request) override;

	void deleteObject(const std::string &key) override;

	S3ListPage listObjectsV2(const std::string &prefix,
				 const std::optional<std::string> &continuationToken) override;

	std::string presignGetObject(const std::string &key, std::chrono::seconds expiry) override;

	const S3Endpoint &endpoint() const noexcept { return endpoint_; }

private:
	const S3ClientOptions options_;
	const S3Endpoint endpoint_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace LiveVault::Storage
