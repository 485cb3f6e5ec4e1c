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

#include "StorageTypes.hpp"

#include <stdexcept>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "RecordingNaming.hpp"

namespace LiveVault::Storage {

void to_json(nlohmann::json &j, const StorageMetadata &p)
{
	j = nlohmann::json{{"streamKey", p.streamKey},
			   {"fileName", p.fileName},
			   {"fileSize", p.fileSize},
			   {"uploadTime", formatIsoTimestamp(p.uploadTime)}};
	if (p.duration.has_value()) {
		j["duration"] = p.duration.value();
	}
	if (p.quality.has_value()) {
		j["quality"] = p.quality.value();
	}
	if (p.thumbnailPath.has_value()) {
		j["thumbnailPath"] = p.thumbnailPath.value();
	}
}

void from_json(const nlohmann::json &j, StorageMetadata &p)
{
	j.at("streamKey").get_to(p.streamKey);
	j.at("fileName").get_to(p.fileName);
	j.at("fileSize").get_to(p.fileSize);

	std::optional<std::chrono::system_clock::time_point> uploadTime =
		parseIsoTimestamp(j.at("uploadTime").get<std::string>());
	if (!uploadTime.has_value()) {
		throw std::invalid_argument("UploadTimeParseError(StorageMetadata::from_json)");
	}
	p.uploadTime = uploadTime.value();

	auto set_optional = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			field = it->get<typename std::decay_t<decltype(field)>::value_type>();
		}
	};
	set_optional("duration", p.duration);
	set_optional("quality", p.quality);
	set_optional("thumbnailPath", p.thumbnailPath);
}

void to_json(nlohmann::json &j, const StorageResult &p)
{
	j = nlohmann::json{{"success", p.success}, {"metadata", p.metadata}};
	if (p.filePath.has_value()) {
		j["filePath"] = p.filePath.value();
	}
	if (p.url.has_value()) {
		j["url"] = p.url.value();
	}
	if (p.error.has_value()) {
		j["error"] = p.error.value();
	}
}

void to_json(nlohmann::json &j, const StorageUsage &p)
{
	j = nlohmann::json{{"used", p.used}, {"available", p.available}};
}

} // namespace LiveVault::Storage
