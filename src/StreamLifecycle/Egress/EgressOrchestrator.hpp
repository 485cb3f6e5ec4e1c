/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Egress Module
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

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <LiveVault/Async/ITimer.hpp>
#include <LiveVault/Async/Task.hpp>
#include <LiveVault/LiveKit/ILiveKitApi.hpp>
#include <LiveVault/Logger/ILogger.hpp>

#include "EgressStateMachine.hpp"

namespace LiveVault::StreamLifecycle::Egress {

struct EgressOrchestratorOptions {
	RetryPolicy retry;
	/// RTMP destinations of the composite egress.
	std::vector<std::string> streamUrls;
	/// File output of the composite egress. "{room}" is replaced with the room name.
	std::optional<std::string> filePathTemplate;
};

/**
 * Drives the egress lifecycle of every room through the LiveKit API.
 * Must outlive the tasks it returns.
 */
class EgressOrchestrator {
public:
	EgressOrchestrator(std::shared_ptr<LiveKit::ILiveKitApi> api, std::shared_ptr<Async::ITimer> timer,
			   EgressOrchestratorOptions options, std::shared_ptr<const Logger::ILogger> logger = nullptr);
	~EgressOrchestrator() noexcept;

	EgressOrchestrator(const EgressOrchestrator &) = delete;
	EgressOrchestrator &operator=(const EgressOrchestrator &) = delete;

	Async::Task<void> onTrackPublished(std::string roomName, LiveKit::TrackType trackType);

	Async::Task<void> onIngressEnded(std::string roomName);

	[[nodiscard]] EgressPhase phaseOf(const std::string &roomName) const;

	[[nodiscard]] std::optional<std::string> egressIdFor(const std::string &roomName) const;

private:
	struct RoomEntry {
		RoomEgressState state;
		std::uint64_t episode = 0;
	};

	struct Applied {
		std::vector<EgressCommand> commands;
		std::uint64_t episode = 0;
	};

	Async::Task<void> dispatch(std::string roomName, EgressEvent event);

	Applied apply(const std::string &roomName, const EgressEvent &event, std::optional<std::uint64_t> episode);

	Async::Task<std::optional<EgressEvent>> execute(const std::string &roomName, EgressCommand command);

	std::optional<EgressEvent> queryParticipants(const std::string &roomName, int attempt);

	const std::shared_ptr<LiveKit::ILiveKitApi> api_;
	const std::shared_ptr<Async::ITimer> timer_;
	const EgressOrchestratorOptions options_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	mutable std::mutex mutex_;
	std::unordered_map<std::string, RoomEntry> rooms_;
	std::uint64_t nextEpisode_ = 1;
};

} // namespace LiveVault::StreamLifecycle::Egress
