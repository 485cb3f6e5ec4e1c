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

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <LiveVault/Async/DetachedTask.hpp>
#include <LiveVault/LiveKit/WebhookVerifier.hpp>
#include <LiveVault/Logger/ILogger.hpp>

#include <EgressOrchestrator.hpp>

namespace LiveVault::StreamLifecycle::Webhook {

struct WebhookResponse {
	int status = 200;
	std::string body;
};

/**
 * HTTP-facing webhook endpoint. Deliveries are authenticated and parsed
 * before anything is dispatched, so a rejected delivery changes no state.
 */
class WebhookReceiver {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

	WebhookReceiver(std::shared_ptr<const LiveKit::WebhookVerifier> verifier,
			std::shared_ptr<Egress::EgressOrchestrator> orchestrator, Async::TaskLauncher launcher,
			std::shared_ptr<const Logger::ILogger> logger = nullptr, Clock clock = nullptr);
	~WebhookReceiver() noexcept;

	WebhookReceiver(const WebhookReceiver &) = delete;
	WebhookReceiver &operator=(const WebhookReceiver &) = delete;

	/// 401 when the signature is invalid, 400 when the body is malformed, 200 otherwise.
	WebhookResponse handle(std::string_view body, std::string_view authorization);

private:
	void dispatch(const LiveKit::WebhookEvent &event);

	const std::shared_ptr<const LiveKit::WebhookVerifier> verifier_;
	const std::shared_ptr<Egress::EgressOrchestrator> orchestrator_;
	const Async::TaskLauncher launcher_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const Clock clock_;
};

} // namespace LiveVault::StreamLifecycle::Webhook
