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

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <LiveVault/Logger/ILogger.hpp>
#include <LiveVault/Storage/StorageTypes.hpp>

#include "RecordingPipeline.hpp"
#include "SessionRegistry.hpp"

namespace LiveVault::StreamLifecycle::Session {

/// Last '/'-separated segment of a stream path, e.g. "abc" for "/live/abc".
std::string streamKeyFromPath(std::string_view streamPath);

/// Entry points for the media transport's publish callbacks.
class PublishEventHandler {
public:
	/// `pipeline` may be null when recordings are not kept.
	PublishEventHandler(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<RecordingPipeline> pipeline,
			    std::shared_ptr<const Logger::ILogger> logger = nullptr);
	~PublishEventHandler() noexcept;

	PublishEventHandler(const PublishEventHandler &) = delete;
	PublishEventHandler &operator=(const PublishEventHandler &) = delete;

	/// Returns false when the publish must be rejected. Nothing is registered in that case.
	[[nodiscard]] bool onPublishStart(std::string_view sessionId, std::string_view streamPath);

	/// Unregisters the stream key and persists the capture. The storage result is returned when a pipeline is wired.
	/// An end from a session that a newer publish superseded is ignored.
	std::optional<Storage::StorageResult> onPublishEnd(std::string_view sessionId, std::string_view streamPath);

private:
	const std::shared_ptr<SessionRegistry> registry_;
	const std::shared_ptr<RecordingPipeline> pipeline_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace LiveVault::StreamLifecycle::Session
