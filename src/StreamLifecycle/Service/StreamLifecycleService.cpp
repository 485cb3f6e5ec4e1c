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

#include "StreamLifecycleService.hpp"

#include <stdexcept>
#include <utility>

#include <LiveVault/CurlHelper/CurlHandle.hpp>
#include <LiveVault/LiveKit/LiveKitApiClient.hpp>
#include <LiveVault/LiveKit/WebhookVerifier.hpp>
#include <LiveVault/Logger/PrintLogger.hpp>
#include <LiveVault/Storage/LocalStorageBackend.hpp>
#include <LiveVault/Storage/StorageFactory.hpp>

namespace LiveVault::StreamLifecycle::Service {

StreamLifecycleService::StreamLifecycleService(Config::RecorderConfig config,
					       std::shared_ptr<const Logger::ILogger> logger,
					       StreamLifecycleDependencies dependencies)
	: config_(std::move(config)),
	  logger_(logger ? std::move(logger) : std::make_shared<Logger::PrintLogger>(config_.logLevel))
{
	storage_ = dependencies.storage ? std::move(dependencies.storage)
					: Storage::createStorageBackend(config_.storage, logger_);

	registry_ = std::make_shared<Session::SessionRegistry>(logger_);

	Session::RecordingPipelineOptions pipelineOptions;
	pipelineOptions.tempPath = config_.storage.local.tempPath;
	pipelineOptions.captureExtension = config_.storage.local.defaultExtension;
	pipeline_ = std::make_shared<Session::RecordingPipeline>(storage_, std::move(pipelineOptions), logger_);
	pipeline_->prepareCaptureDirectory();

	publishEvents_ = std::make_unique<Session::PublishEventHandler>(registry_, pipeline_, logger_);

	eventLoop_ = std::make_shared<Async::EventLoop>(logger_);

	const Config::LiveKitSettings &liveKit = config_.liveKit;
	if (!liveKit.enabled() && !dependencies.liveKitApi) {
		logger_->info("EgressOrchestrationDisabled");
		return;
	}

	std::shared_ptr<LiveKit::ILiveKitApi> api = std::move(dependencies.liveKitApi);
	if (!api) {
		LiveKit::LiveKitApiOptions apiOptions;
		apiOptions.apiUrl = liveKit.apiUrl;
		apiOptions.apiKey = liveKit.apiKey;
		apiOptions.apiSecret = liveKit.apiSecret;
		api = std::make_shared<LiveKit::LiveKitApiClient>(std::move(apiOptions),
								  std::make_shared<CurlHelper::CurlHandle>(), logger_);
	}

	Egress::EgressOrchestratorOptions egressOptions;
	egressOptions.retry.maxAttempts = liveKit.participantMaxAttempts;
	egressOptions.retry.retryDelay = liveKit.participantRetryDelay;
	egressOptions.streamUrls = liveKit.egressStreamUrls;
	egressOptions.filePathTemplate = liveKit.egressFilePath;
	orchestrator_ = std::make_shared<Egress::EgressOrchestrator>(std::move(api), eventLoop_->timer(),
								     std::move(egressOptions), logger_);

	webhooks_ = std::make_unique<Webhook::WebhookReceiver>(
		std::make_shared<LiveKit::WebhookVerifier>(liveKit.apiKey, liveKit.apiSecret), orchestrator_,
		eventLoop_->launcher(), logger_);
}

StreamLifecycleService::~StreamLifecycleService() noexcept
{
	stop();
}

void StreamLifecycleService::start()
{
	eventLoop_->start();
	logger_->info("StreamLifecycleServiceStarted");
}

void StreamLifecycleService::stop() noexcept
{
	if (eventLoop_ && eventLoop_->isRunning()) {
		eventLoop_->stop();
		logger_->info("StreamLifecycleServiceStopped");
	}
}

std::size_t StreamLifecycleService::cleanupOldRecordings()
{
	auto *local = dynamic_cast<Storage::LocalStorageBackend *>(storage_.get());
	if (!local) {
		logger_->info("CleanupSkipped", {{"backend", storage_->kind()}});
		return 0;
	}
	return local->cleanupOldRecordings(config_.cleanupMaxAge);
}

} // namespace LiveVault::StreamLifecycle::Service
