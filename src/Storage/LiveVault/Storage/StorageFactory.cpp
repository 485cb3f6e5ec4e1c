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

#include "StorageFactory.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::Storage {

std::optional<StorageBackendType> parseStorageBackendType(std::string_view text)
{
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lowered == "local")
		return StorageBackendType::Local;
	if (lowered == "remote" || lowered == "s3")
		return StorageBackendType::Remote;
	return std::nullopt;
}

std::shared_ptr<IStorageBackend> createStorageBackend(const StorageSettings &settings,
						      std::shared_ptr<const Logger::ILogger> logger)
{
	return createStorageBackend(settings, logger, [logger](const S3ClientOptions &options) {
		return std::make_shared<S3Client>(options, logger);
	});
}

std::shared_ptr<IStorageBackend> createStorageBackend(const StorageSettings &settings,
						      std::shared_ptr<const Logger::ILogger> logger,
						      const S3ClientFactory &clientFactory)
{
	if (!logger) {
		logger = Logger::NullLogger::instance();
	}

	std::optional<StorageBackendType> type = parseStorageBackendType(settings.backend);
	if (!type.has_value()) {
		logger->warn("UnknownStorageBackend", {{"backend", settings.backend}, {"fallback", "local"}});
		type = StorageBackendType::Local;
	}

	if (*type == StorageBackendType::Remote) {
		if (!clientFactory) {
			logger->error("S3ClientFactoryIsEmptyError");
			throw std::invalid_argument("S3ClientFactoryIsEmptyError(createStorageBackend)");
		}

		S3ClientOptions clientOptions = settings.remoteClient;
		clientOptions.bucket = settings.remote.bucket;

		logger->info("StorageBackendSelected", {{"backend", "remote"}, {"bucket", settings.remote.bucket}});
		return std::make_shared<S3StorageBackend>(settings.remote, clientFactory(clientOptions), logger);
	}

	logger->info("StorageBackendSelected", {{"backend", "local"}});
	return std::make_shared<LocalStorageBackend>(settings.local, logger);
}

} // namespace LiveVault::Storage
