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

#include "S3Signing.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <LiveVault/Crypto/Digest.hpp>

namespace LiveVault::Storage {

namespace {

bool isUnreserved(unsigned char c) noexcept
{
	return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
	       c == '.' || c == '~';
}

std::string signingKey(std::string_view secret, std::string_view date, std::string_view region)
{
	std::string key = Crypto::hmacSha256(fmt::format("AWS4{}", secret), date);
	key = Crypto::hmacSha256(key, region);
	key = Crypto::hmacSha256(key, "s3");
	return Crypto::hmacSha256(key, "aws4_request");
}

} // anonymous namespace

std::string S3Endpoint::objectPath(std::string_view key) const
{
	return fmt::format("{}/{}", basePath, awsUriEncode(key, false));
}

std::string S3Endpoint::bucketUrl() const
{
	return fmt::format("{}://{}{}/", scheme, host, basePath);
}

std::string S3Endpoint::objectUrl(std::string_view key) const
{
	return fmt::format("{}://{}{}", scheme, host, objectPath(key));
}

S3Endpoint makeS3Endpoint(std::string_view bucket, std::string_view region, std::string_view customEndpoint,
			  bool forcePathStyle)
{
	if (bucket.empty()) {
		throw std::invalid_argument("BucketIsEmptyError(makeS3Endpoint)");
	}
	if (region.empty()) {
		throw std::invalid_argument("RegionIsEmptyError(makeS3Endpoint)");
	}

	S3Endpoint endpoint;
	endpoint.region = std::string(region);

	if (customEndpoint.empty()) {
		if (forcePathStyle) {
			endpoint.host = fmt::format("s3.{}.amazonaws.com", region);
			endpoint.basePath = fmt::format("/{}", bucket);
		} else {
			endpoint.host = fmt::format("{}.s3.{}.amazonaws.com", bucket, region);
		}
		return endpoint;
	}

	std::string_view rest = customEndpoint;
	if (std::size_t sep = rest.find("://"); sep != std::string_view::npos) {
		endpoint.scheme = std::string(rest.substr(0, sep));
		rest.remove_prefix(sep + 3);
	}
	while (!rest.empty() && rest.back() == '/')
		rest.remove_suffix(1);
	if (rest.empty() || rest.find('/') != std::string_view::npos) {
		throw std::invalid_argument(fmt::format("EndpointParseError(makeS3Endpoint):{}", customEndpoint));
	}

	if (forcePathStyle) {
		endpoint.host = std::string(rest);
		endpoint.basePath = fmt::format("/{}", bucket);
	} else {
		endpoint.host = fmt::format("{}.{}", bucket, rest);
	}
	return endpoint;
}

std::string awsUriEncode(std::string_view text, bool encodeSlash)
{
	std::string out;
	out.reserve(text.size() * 3);
	for (unsigned char c : text) {
		if (isUnreserved(c) || (c == '/' && !encodeSlash)) {
			out.push_back(static_cast<char>(c));
		} else {
			out += fmt::format("%{:02X}", c);
		}
	}
	return out;
}

std::string formatAmzDate(std::chrono::system_clock::time_point time)
{
	std::time_t tt = std::chrono::system_clock::to_time_t(time);
	std::tm tm{};
	if (!gmtime_r(&tt, &tm)) {
		throw std::runtime_error("TimeConversionError(formatAmzDate)");
	}
	return fmt::format("{:04}{:02}{:02}T{:02}{:02}{:02}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
			   tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string presignGetObjectUrl(const S3Endpoint &endpoint, const S3Credentials &credentials, std::string_view key,
				std::chrono::seconds expiry, std::chrono::system_clock::time_point now)
{
	if (credentials.accessKeyId.empty() || credentials.secretAccessKey.empty()) {
		throw std::invalid_argument("CredentialsAreEmptyError(presignGetObjectUrl)");
	}

	expiry = std::clamp(expiry, std::chrono::seconds(1), kMaxPresignExpiry);

	const std::string amzDate = formatAmzDate(now);
	const std::string date = amzDate.substr(0, 8);
	const std::string scope = fmt::format("{}/{}/s3/aws4_request", date, endpoint.region);

	std::vector<std::pair<std::string, std::string>> params{
		{"X-Amz-Algorithm", "AWS4-HMAC-SHA256"},
		{"X-Amz-Credential", fmt::format("{}/{}", credentials.accessKeyId, scope)},
		{"X-Amz-Date", amzDate},
		{"X-Amz-Expires", std::to_string(expiry.count())},
		{"X-Amz-SignedHeaders", "host"},
	};
	if (credentials.sessionToken.has_value()) {
		params.emplace_back("X-Amz-Security-Token", *credentials.sessionToken);
	}
	std::sort(params.begin(), params.end());

	std::string query;
	for (const auto &[name, value] : params) {
		if (!query.empty())
			query += '&';
		query += fmt::format("{}={}", awsUriEncode(name, true), awsUriEncode(value, true));
	}

	const std::string canonicalPath = endpoint.objectPath(key);
	const std::string canonicalRequest =
		fmt::format("GET\n{}\n{}\nhost:{}\n\nhost\nUNSIGNED-PAYLOAD", canonicalPath, query, endpoint.host);

	const std::string stringToSign = fmt::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", amzDate, scope,
						     Crypto::toHex(Crypto::sha256(canonicalRequest)));

	const std::string signature = Crypto::toHex(
		Crypto::hmacSha256(signingKey(credentials.secretAccessKey, date, endpoint.region), stringToSign));

	return fmt::format("{}://{}{}?{}&X-Amz-Signature={}", endpoint.scheme, endpoint.host, canonicalPath, query,
			   signature);
}

} // namespace LiveVault::Storage
