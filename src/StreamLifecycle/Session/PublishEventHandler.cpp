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

#include "PublishEventHandler.hpp"

#include <stdexcept>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::StreamLifecycle::Session {

std::string streamKeyFromPath(std::string_view streamPath)
{
	std::size_t slash = streamPath.rfind('/');
	return std::string(slash == std::string_view::npos ? streamPath : streamPath.substr(slash + 1));
}

PublishEventHandler::PublishEventHandler(std::shared_ptr<SessionRegistry> registry,
					 std::shared_ptr<RecordingPipeline> pipeline,
					 std::shared_ptr<const Logger::ILogger> logger)
	: registry_(std::move(registry)),
	  pipeline_(std::move(pipeline)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (!registry_) {
		logger_->error("SessionRegistryIsNullError");
		throw std::invalid_argument("SessionRegistryIsNullError(PublishEventHandler::PublishEventHandler)");
	}
}

PublishEventHandler::~PublishEventHandler() noexcept = default;

bool PublishEventHandler::onPublishStart(std::string_view sessionId, std::string_view streamPath)
{
	const std::string streamKey = streamKeyFromPath(streamPath);
	logger_->info("PublishStart", {{"sessionId", sessionId}, {"path", streamPath}, {"streamKey", streamKey}});

	if (streamKey.empty()) {
		logger_->warn("PublishRejected", {{"sessionId", sessionId}, {"reason", "EmptyStreamKey"}});
		return false;
	}

	try {
		registry_->registerSession(streamKey, std::string(sessionId));
	} catch (const std::invalid_argument &e) {
		logger_->warn("PublishRejected", {{"sessionId", sessionId}, {"reason", e.what()}});
		return false;
	}
	return true;
}

std::optional<Storage::StorageResult> PublishEventHandler::onPublishEnd(std::string_view sessionId,
									std::string_view streamPath)
{
	const std::string streamKey = streamKeyFromPath(streamPath);
	logger_->info("PublishEnd", {{"sessionId", sessionId}, {"path", streamPath}, {"streamKey", streamKey}});

	if (streamKey.empty()) {
		logger_->warn("PublishEndIgnored", {{"sessionId", sessionId}, {"reason", "EmptyStreamKey"}});
		return std::nullopt;
	}

	// A late end from a superseded session must not finalize the newer session's capture.
	if (!registry_->releaseSession(streamKey, sessionId)) {
		logger_->warn("PublishEndIgnored", {{"sessionId", sessionId}, {"reason", "SessionSuperseded"}});
		return std::nullopt;
	}

	if (!pipeline_) {
		return std::nullopt;
	}
	return pipeline_->persist(streamKey);
}

} // namespace LiveVault::StreamLifecycle::Session
