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

#include "RecordingPipeline.hpp"

#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::StreamLifecycle::Session {

RecordingPipeline::RecordingPipeline(std::shared_ptr<Storage::IStorageBackend> storage,
				     RecordingPipelineOptions options, std::shared_ptr<const Logger::ILogger> logger)
	: storage_(std::move(storage)),
	  options_(std::move(options)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (!storage_) {
		logger_->error("StorageIsNullError");
		throw std::invalid_argument("StorageIsNullError(RecordingPipeline::RecordingPipeline)");
	}
}

RecordingPipeline::~RecordingPipeline() noexcept = default;

std::filesystem::path RecordingPipeline::captureFileFor(std::string_view streamKey) const
{
	return options_.tempPath / "recordings" / fmt::format("{}{}", streamKey, options_.captureExtension);
}

void RecordingPipeline::prepareCaptureDirectory() const
{
	const std::filesystem::path directory = options_.tempPath / "recordings";
	std::error_code ec;
	std::filesystem::create_directories(directory, ec);
	if (ec) {
		logger_->error("CaptureDirectoryCreateError", {{"path", directory.string()}, {"error", ec.message()}});
		throw std::runtime_error("CaptureDirectoryCreateError(RecordingPipeline::prepareCaptureDirectory)");
	}
}

Storage::StorageResult RecordingPipeline::persist(std::string_view streamKey,
						  std::optional<std::filesystem::path> captureFile,
						  const Storage::StorageMetadataOverrides &overrides)
{
	const std::filesystem::path source = captureFile.value_or(captureFileFor(streamKey));

	logger_->info("RecordingPersistStarted",
		      {{"streamKey", streamKey}, {"source", source.string()}, {"backend", storage_->kind()}});

	Storage::StorageResult result = storage_->save(source, streamKey, overrides);
	if (result.success) {
		logger_->info("RecordingPersisted",
			      {{"streamKey", streamKey}, {"url", result.url.value_or("")}, {"fileName", result.metadata.fileName}});
	} else {
		logger_->error("RecordingPersistFailed", {{"streamKey", streamKey}, {"error", result.error.value_or("")}});
	}
	return result;
}

} // namespace LiveVault::StreamLifecycle::Session
