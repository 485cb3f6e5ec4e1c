/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Session Module
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <LiveVault/Logger/ILogger.hpp>
#include <LiveVault/Storage/IStorageBackend.hpp>

namespace LiveVault::StreamLifecycle::Session {

struct RecordingPipelineOptions {
	/// The transport writes live captures to <tempPath>/recordings/<streamKey><captureExtension>.
	std::filesystem::path tempPath = "./media/temp";
	std::string captureExtension = ".flv";
};

/// Hands finished captures to the storage backend.
class RecordingPipeline {
public:
	RecordingPipeline(std::shared_ptr<Storage::IStorageBackend> storage, RecordingPipelineOptions options,
			  std::shared_ptr<const Logger::ILogger> logger = nullptr);
	~RecordingPipeline() noexcept;

	RecordingPipeline(const RecordingPipeline &) = delete;
	RecordingPipeline &operator=(const RecordingPipeline &) = delete;

	[[nodiscard]] std::filesystem::path captureFileFor(std::string_view streamKey) const;

	/// Persists `captureFile`, or the conventional capture path of the stream key when none is given.
	Storage::StorageResult persist(std::string_view streamKey,
				       std::optional<std::filesystem::path> captureFile = std::nullopt,
				       const Storage::StorageMetadataOverrides &overrides = {});

	/// Creates the directory captures are written to.
	void prepareCaptureDirectory() const;

private:
	const std::shared_ptr<Storage::IStorageBackend> storage_;
	const RecordingPipelineOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace LiveVault::StreamLifecycle::Session
