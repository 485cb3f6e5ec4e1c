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

#include "S3Client.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include <LiveVault/CurlHelper/CurlHandle.hpp>
#include <LiveVault/CurlHelper/CurlHeaderCallback.hpp>
#include <LiveVault/CurlHelper/CurlReadCallback.hpp>
#include <LiveVault/CurlHelper/CurlSlistHandle.hpp>
#include <LiveVault/CurlHelper/CurlUrlSearchParams.hpp>
#include <LiveVault/CurlHelper/CurlWriteCallback.hpp>
#include <LiveVault/Logger/NullLogger.hpp>

#include "S3Xml.hpp"

namespace LiveVault::Storage {

namespace {

constexpr std::string_view kMetadataHeaderPrefix = "x-amz-meta-";

struct S3Response {
	long status = 0;
	std::string body;
	CurlHelper::CurlHeaderMap headers;
};

enum class Method { Head, Get, Put, Delete };

const char *methodName(Method method) noexcept
{
	switch (method) {
	case Method::Head:
		return "HEAD";
	case Method::Get:
		return "GET";
	case Method::Put:
		return "PUT";
	case Method::Delete:
		return "DELETE";
	}
	return "GET";
}

/// Header values must be printable ASCII.
std::string sanitizeHeaderValue(std::string_view value)
{
	std::string out;
	out.reserve(value.size());
	for (unsigned char c : value) {
		out.push_back(c >= 0x20 && c < 0x7f ? static_cast<char>(c) : '_');
	}
	return out;
}

CurlHelper::CurlSlistHandle makeBaseHeaders(const S3ClientOptions &options)
{
	CurlHelper::CurlSlistHandle headers;
	headers.append("x-amz-content-sha256: UNSIGNED-PAYLOAD");
	if (options.credentials.sessionToken.has_value()) {
		headers.append(fmt::format("x-amz-security-token: {}", *options.credentials.sessionToken));
	}
	return headers;
}

S3Response perform(const CurlHelper::CurlHandle &curl, Method method, const std::string &url,
		   const CurlHelper::CurlSlistHandle &headers, const S3ClientOptions &options,
		   const Logger::ILogger &logger, std::ifstream *upload = nullptr, std::uintmax_t uploadSize = 0)
{
	S3Response response;
	CURL *handle = curl.get();

	const std::string userpwd =
		fmt::format("{}:{}", options.credentials.accessKeyId, options.credentials.secretAccessKey);
	const std::string sigv4 = fmt::format("aws:amz:{}:s3", options.region);

	curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
	curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
	curl_easy_setopt(handle, CURLOPT_AWS_SIGV4, sigv4.c_str());
	curl_easy_setopt(handle, CURLOPT_USERPWD, userpwd.c_str());

	curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderMapCallback);
	curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

	curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connectTimeout.count()));
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

	switch (method) {
	case Method::Head:
		curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options.requestTimeout.count()));
		break;
	case Method::Get:
		curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options.requestTimeout.count()));
		break;
	case Method::Delete:
		curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options.requestTimeout.count()));
		break;
	case Method::Put:
		if (!upload || !upload->is_open()) {
			logger.error("UploadStreamIsNotOpenError", {{"url", url}});
			throw std::invalid_argument("UploadStreamIsNotOpenError(S3Client::perform)");
		}
		curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
		curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(uploadSize));
		curl_easy_setopt(handle, CURLOPT_READFUNCTION, CurlHelper::CurlIfstreamReadCallback);
		curl_easy_setopt(handle, CURLOPT_READDATA, upload);
		curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options.uploadTimeout.count()));
		curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
		curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, 60L);
		break;
	}

	CURLcode res = curl_easy_perform(handle);
	if (res != CURLE_OK) {
		logger.error("CurlPerformError",
			     {{"method", methodName(method)}, {"url", url}, {"error", curl_easy_strerror(res)}});
		throw std::runtime_error(fmt::format("CurlPerformError(S3Client::perform):{}", curl_easy_strerror(res)));
	}

	response.status = curl.responseCode();
	return response;
}

[[noreturn]] void throwServiceError(const char *operation, const S3Response &response, std::string_view target,
				    const Logger::ILogger &logger)
{
	std::string code = parseS3ErrorCode(response.body).value_or("Unknown");
	logger.error("S3ServiceError", {{"operation", operation},
					{"target", target},
					{"status", std::to_string(response.status)},
					{"code", code}});
	throw std::runtime_error(fmt::format("S3ServiceError({}):{}:{}", operation, response.status, code));
}

} // anonymous namespace

S3Client::S3Client(S3ClientOptions options, std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  endpoint_(makeS3Endpoint(options_.bucket, options_.region, options_.endpoint, options_.forcePathStyle)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (options_.credentials.accessKeyId.empty() || options_.credentials.secretAccessKey.empty()) {
		logger_->error("S3CredentialsAreEmptyError");
		throw std::invalid_argument("CredentialsAreEmptyError(S3Client::S3Client)");
	}
}

S3Client::~S3Client() noexcept = default;

void S3Client::headBucket()
{
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlSlistHandle headers = makeBaseHeaders(options_);

	S3Response response = perform(curl, Method::Head, endpoint_.bucketUrl(), headers, options_, *logger_);
	if (response.status != 200) {
		throwServiceError("S3Client::headBucket", response, options_.bucket, *logger_);
	}
}

std::optional<S3ObjectHead> S3Client::headObject(const std::string &key)
{
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlSlistHandle headers = makeBaseHeaders(options_);

	S3Response response = perform(curl, Method::Head, endpoint_.objectUrl(key), headers, options_, *logger_);
	if (response.status == 404) {
		return std::nullopt;
	}
	if (response.status != 200) {
		throwServiceError("S3Client::headObject", response, key, *logger_);
	}

	S3ObjectHead head;
	if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
		const std::string &value = it->second;
		auto [ptr, fromCharsError] = std::from_chars(value.data(), value.data() + value.size(), head.contentLength);
		if (fromCharsError != std::errc()) {
			logger_->warn("ContentLengthParseError", {{"key", key}, {"value", value}});
		}
	}
	for (const auto &[name, value] : response.headers) {
		if (name.starts_with(kMetadataHeaderPrefix)) {
			head.metadata.emplace(name.substr(kMetadataHeaderPrefix.size()), value);
		}
	}
	return head;
}

std::string S3Client::putObject(const S3PutObjectRequest &request)
{
	std::error_code ec;
	std::uintmax_t size = std::filesystem::file_size(request.sourceFile, ec);
	if (ec) {
		logger_->error("UploadSourceStatError", {{"path", request.sourceFile.string()}, {"error", ec.message()}});
		throw std::runtime_error("UploadSourceStatError(S3Client::putObject):" + request.sourceFile.string());
	}

	std::ifstream ifs(request.sourceFile, std::ios::binary);
	if (!ifs.is_open()) {
		logger_->error("UploadSourceOpenError", {{"path", request.sourceFile.string()}});
		throw std::runtime_error("UploadSourceOpenError(S3Client::putObject):" + request.sourceFile.string());
	}

	CurlHelper::CurlHandle curl;
	CurlHelper::CurlSlistHandle headers = makeBaseHeaders(options_);
	if (!request.contentType.empty()) {
		headers.append(fmt::format("Content-Type: {}", request.contentType));
	}
	if (!request.storageClass.empty()) {
		headers.append(fmt::format("x-amz-storage-class: {}", request.storageClass));
	}
	if (!request.serverSideEncryption.empty()) {
		headers.append(fmt::format("x-amz-server-side-encryption: {}", request.serverSideEncryption));
	}
	for (const auto &[name, value] : request.metadata) {
		headers.append(fmt::format("{}{}: {}", kMetadataHeaderPrefix, name, sanitizeHeaderValue(value)));
	}

	const std::string url = endpoint_.objectUrl(request.key);
	S3Response response = perform(curl, Method::Put, url, headers, options_, *logger_, &ifs, size);
	if (response.status != 200) {
		throwServiceError("S3Client::putObject", response, request.key, *logger_);
	}

	logger_->debug("S3ObjectUploaded", {{"key", request.key}, {"size", std::to_string(size)}});
	return url;
}

void S3Client::deleteObject(const std::string &key)
{
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlSlistHandle headers = makeBaseHeaders(options_);

	S3Response response = perform(curl, Method::Delete, endpoint_.objectUrl(key), headers, options_, *logger_);
	if (response.status != 204 && response.status != 200) {
		throwServiceError("S3Client::deleteObject", response, key, *logger_);
	}
}

S3ListPage S3Client::listObjectsV2(const std::string &prefix, const std::optional<std::string> &continuationToken)
{
	CurlHelper::CurlHandle curl;
	CurlHelper::CurlSlistHandle headers = makeBaseHeaders(options_);

	CurlHelper::CurlUrlSearchParams params(curl);
	params.append("list-type", "2");
	if (!prefix.empty()) {
		params.append("prefix", prefix);
	}
	if (continuationToken.has_value()) {
		params.append("continuation-token", *continuationToken);
	}
	params.sort();

	const std::string url = fmt::format("{}?{}", endpoint_.bucketUrl(), params.toString());
	S3Response response = perform(curl, Method::Get, url, headers, options_, *logger_);
	if (response.status != 200) {
		throwServiceError("S3Client::listObjectsV2", response, prefix, *logger_);
	}

	return parseListObjectsV2(response.body);
}

std::string S3Client::presignGetObject(const std::string &key, std::chrono::seconds expiry)
{
	return presignGetObjectUrl(endpoint_, options_.credentials, key, expiry, std::chrono::system_clock::now());
}

} // namespace LiveVault::Storage
