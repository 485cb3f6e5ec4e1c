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
#include <optional>
#include <string>
#include <string_view>

namespace LiveVault::Storage {

struct S3Credentials {
	std::string accessKeyId;
	std::string secretAccessKey;
	std::optional<std::string> sessionToken;
};

/// Where requests for one bucket go. `basePath` is "/<bucket>" for path-style addressing, otherwise empty.
struct S3Endpoint {
	std::string scheme = "https";
	std::string host;
	std::string basePath;
	std::string region;

	/// Canonical, already encoded path of an object.
	std::string objectPath(std::string_view key) const;

	std::string bucketUrl() const;
	std::string objectUrl(std::string_view key) const;
};

/**
 * Builds the endpoint for a bucket. Without a custom endpoint the regional
 * AWS host is used with virtual-hosted addressing unless `forcePathStyle`.
 * @throws std::invalid_argument for an empty bucket or region or an unparsable endpoint.
 */
S3Endpoint makeS3Endpoint(std::string_view bucket, std::string_view region, std::string_view customEndpoint,
			  bool forcePathStyle);

/// URI encoding as SigV4 canonical requests define it.
std::string awsUriEncode(std::string_view text, bool encodeSlash);

/// "YYYYMMDDTHHMMSSZ"
std::string formatAmzDate(std::chrono::system_clock::time_point time);

inline constexpr std::chrono::seconds kMaxPresignExpiry{7 * 24 * 3600};

/**
 * Query-string authenticated GET URL for an object, valid for `expiry`
 * from `now`. The expiry is clamped to [1 s, 7 days].
 */
std::string presignGetObjectUrl(const S3Endpoint &endpoint, const S3Credentials &credentials, std::string_view key,
				std::chrono::seconds expiry, std::chrono::system_clock::time_point now);

} // namespace LiveVault::Storage
