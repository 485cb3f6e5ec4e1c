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

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <LiveVault/Logger/ILogger.hpp>

#include "IS3Client.hpp"
#include "IStorageBackend.hpp"
#include "LocalStorageBackend.hpp"
#include "S3Client.hpp"
#include "S3StorageBackend.hpp"

namespace LiveVault::Storage {

enum class StorageBackendType { Local, Remote };

/// "local", or "remote" and its alias "s3", compared case-insensitively.
std::optional<StorageBackendType> parseStorageBackendType(std::string_view text);

struct StorageSettings {
	/// Anything unrecognized, including empty, selects the local backend.
	std::string backend = "local";
	LocalStorageOptions local;
	S3StorageOptions remote;
	S3ClientOptions remoteClient;
};

using S3ClientFactory = std::function<std::shared_ptr<IS3Client>(const S3ClientOptions &)>;

/**
 * Picks the backend named by the settings. An unknown backend name falls back
 * to local storage with a warning. A remote backend whose bucket cannot be
 * reached throws.
 */
std::shared_ptr<IStorageBackend> createStorageBackend(const StorageSettings &settings,
						      std::shared_ptr<const Logger::ILogger> logger);

/// As above, with the S3 client supplied by `clientFactory`.
std::shared_ptr<IStorageBackend> createStorageBackend(const StorageSettings &settings,
						      std::shared_ptr<const Logger::ILogger> logger,
						      const S3ClientFactory &clientFactory);

} // namespace LiveVault::Storage
