/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Service Module
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

#include <cstddef>
#include <memory>

#include <LiveVault/Async/EventLoop.hpp>
#include <LiveVault/LiveKit/ILiveKitApi.hpp>
#include <LiveVault/Logger/ILogger.hpp>
#include <LiveVault/Storage/IStorageBackend.hpp>

#include <EgressOrchestrator.hpp>
#include <PublishEventHandler.hpp>
#include <RecorderConfig.hpp>
#include <RecordingPipeline.hpp>
#include <SessionRegistry.hpp>
#include <WebhookReceiver.hpp>

namespace LiveVault::StreamLifecycle::Service {

/// Collaborators that replace the ones built from configuration.
struct StreamLifecycleDependencies {
	std::shared_ptr<Storage::IStorageBackend> storage;
	std::shared_ptr<LiveKit::ILiveKitApi> liveKitApi;
};

/**
 * Owns the recorder's components. Egress orchestration and the webhook
 * endpoint exist only when LiveKit is configured.
 */
class StreamLifecycleService {
public:
	/// Logs through a PrintLogger at the configured level when `logger` is null.
	/// @throws std::runtime_error when the configured remote bucket is unreachable.
	StreamLifecycleService(Config::RecorderConfig config, std::shared_ptr<const Logger::ILogger> logger,
			       StreamLifecycleDependencies dependencies = {});
	~StreamLifecycleService() noexcept;

	StreamLifecycleService(const StreamLifecycleService &) = delete;
	StreamLifecycleService &operator=(const StreamLifecycleService &) = delete;

	void start();
	void stop() noexcept;

	[[nodiscard]] Session::PublishEventHandler &publishEvents() noexcept { return *publishEvents_; }

	[[nodiscard]] Session::SessionRegistry &sessions() noexcept { return *registry_; }

	[[nodiscard]] Storage::IStorageBackend &storage() noexcept { return *storage_; }

	/// Null when LiveKit is not configured.
	[[nodiscard]] Webhook::WebhookReceiver *webhooks() noexcept { return webhooks_.get(); }

	/// Null when LiveKit is not configured.
	[[nodiscard]] Egress::EgressOrchestrator *egress() noexcept { return orchestrator_.get(); }

	/// Deletes local recordings older than the configured age. Remote storage is left alone.
	std::size_t cleanupOldRecordings();

private:
	const Config::RecorderConfig config_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	std::shared_ptr<Storage::IStorageBackend> storage_;
	std::shared_ptr<Session::SessionRegistry> registry_;
	std::shared_ptr<Session::RecordingPipeline> pipeline_;
	std::unique_ptr<Session::PublishEventHandler> publishEvents_;

	std::shared_ptr<Async::EventLoop> eventLoop_;
	std::shared_ptr<Egress::EgressOrchestrator> orchestrator_;
	std::unique_ptr<Webhook::WebhookReceiver> webhooks_;
};

} // namespace LiveVault::StreamLifecycle::Service
