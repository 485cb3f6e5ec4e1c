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
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace LiveVault::Storage {

struct StorageMetadata {
	std::string streamKey;
	std::string fileName;
	std::uint64_t fileSize = 0;
	std::optional<double> duration;
	std::optional<std::string> quality;
	std::optional<std::string> thumbnailPath;
	std::chrono::system_clock::time_point uploadTime;
};

void to_json(nlohmann::json &j, const StorageMetadata &p);
void from_json(const nlohmann::json &j, StorageMetadata &p);

/// Caller-supplied metadata merged into what a backend computes on save.
struct StorageMetadataOverrides {
	std::optional<double> duration;
	std::optional<std::string> quality;
	std::optional<std::string> thumbnailPath;
	std::map<std::string, std::string> attributes;
};

struct StorageResult {
	bool success = false;
	std::optional<std::string> filePath;
	std::optional<std::string> url;
	StorageMetadata metadata;
	/// Set on failure. A successful save may also set it when the temp file was left behind.
	std::optional<std::string> error;
};

void to_json(nlohmann::json &j, const StorageResult &p);

struct StorageUsage {
	std::uint64_t used = 0;
	std::uint64_t available = 0;
};

void to_json(nlohmann::json &j, const StorageUsage &p);

} // namespace LiveVault::Storage
