/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Webhook Module
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

#include "WebhookReceiver.hpp"

#include <stdexcept>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::StreamLifecycle::Webhook {

WebhookReceiver::WebhookReceiver(std::shared_ptr<const LiveKit::WebhookVerifier> verifier,
				 std::shared_ptr<Egress::EgressOrchestrator> orchestrator, Async::TaskLauncher launcher,
				 std::shared_ptr<const Logger::ILogger> logger, Clock clock)
	: verifier_(std::move(verifier)),
	  orchestrator_(std::move(orchestrator)),
	  launcher_(std::move(launcher)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance()),
	  clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
	if (!verifier_) {
		logger_->error("WebhookVerifierIsNullError");
		throw std::invalid_argument("WebhookVerifierIsNullError(WebhookReceiver::WebhookReceiver)");
	}
	if (!orchestrator_) {
		logger_->error("EgressOrchestratorIsNullError");
		throw std::invalid_argument("EgressOrchestratorIsNullError(WebhookReceiver::WebhookReceiver)");
	}
	if (!launcher_) {
		logger_->error("TaskLauncherIsNullError");
		throw std::invalid_argument("TaskLauncherIsNullError(WebhookReceiver::WebhookReceiver)");
	}
}

WebhookReceiver::~WebhookReceiver() noexcept = default;

WebhookResponse WebhookReceiver::handle(std::string_view body, std::string_view authorization)
{
	LiveKit::WebhookEvent event;
	try {
		event = verifier_->receive(body, authorization, clock_());
	} catch (const LiveKit::TokenVerificationError &e) {
		logger_->warn("WebhookUnauthorized", {{"exception", e.what()}});
		return {401, "unauthorized"};
	} catch (const LiveKit::WebhookPayloadError &e) {
		logger_->warn("WebhookMalformed", {{"exception", e.what()}});
		return {400, "malformed payload"};
	}

	logger_->info("WebhookReceived", {{"id", event.id}, {"event", event.event}, {"room", event.roomName}});

	if ((event.event == "track_published" || event.event == "ingress_ended") && event.roomName.empty()) {
		logger_->warn("WebhookMalformed", {{"event", event.event}, {"reason", "RoomNameIsEmpty"}});
		return {400, "malformed payload"};
	}
	if (event.event == "track_published" && !event.track) {
		logger_->warn("WebhookMalformed", {{"event", event.event}, {"reason", "TrackIsMissing"}});
		return {400, "malformed payload"};
	}

	dispatch(event);
	return {200, "ok"};
}

void WebhookReceiver::dispatch(const LiveKit::WebhookEvent &event)
{
	if (event.event == "track_published") {
		launcher_(orchestrator_->onTrackPublished(event.roomName, event.track->type));
	} else if (event.event == "ingress_ended") {
		launcher_(orchestrator_->onIngressEnded(event.roomName));
	} else {
		logger_->debug("WebhookIgnored", {{"event", event.event}});
	}
}

} // namespace LiveVault::StreamLifecycle::Webhook
