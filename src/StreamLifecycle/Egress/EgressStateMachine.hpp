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

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <LiveVault/LiveKit/LiveKitTypes.hpp>

namespace LiveVault::StreamLifecycle::Egress {

enum class EgressPhase { Idle, TrackPending, Active };

std::string_view toString(EgressPhase phase) noexcept;

struct TrackPair {
	std::string audioTrackId;
	std::string videoTrackId;

	bool operator==(const TrackPair &) const = default;
};

struct RoomEgressState {
	EgressPhase phase = EgressPhase::Idle;
	/// Participant query attempt currently outstanding, starting at 1.
	int attempt = 0;
	bool startIssued = false;
	std::string egressId;

	bool operator==(const RoomEgressState &) const = default;
};

struct RetryPolicy {
	/// Total participant queries per video publish, the first one included.
	int maxAttempts = 2;
	std::chrono::milliseconds retryDelay{2000};
};

namespace Events {

struct TrackPublished {
	LiveKit::TrackType trackType = LiveKit::TrackType::Unknown;
};

struct ParticipantsResolved {
	int attempt = 0;
	/// Empty when no participant publishes both an audio and a video track, or when the query failed.
	std::optional<TrackPair> tracks;
};

struct EgressStarted {
	std::string egressId;
};

struct EgressStartFailed {
	std::string reason;
};

struct IngressEnded {};

} // namespace Events

using EgressEvent = std::variant<Events::TrackPublished, Events::ParticipantsResolved, Events::EgressStarted,
				 Events::EgressStartFailed, Events::IngressEnded>;

namespace Commands {

struct QueryParticipants {
	int attempt = 0;
	std::chrono::milliseconds delay{0};
};

struct StartEgress {
	TrackPair tracks;
};

struct StopEgress {
	std::string egressId;
};

struct Abandon {
	std::string reason;
};

} // namespace Commands

using EgressCommand =
	std::variant<Commands::QueryParticipants, Commands::StartEgress, Commands::StopEgress, Commands::Abandon>;

struct EgressTransition {
	RoomEgressState next;
	std::vector<EgressCommand> commands;
};

/**
 * Transition function of the per-room egress lifecycle.
 *
 * Idle -> TrackPending on the first video publish, TrackPending -> Active once the
 * egress job is reported started, and back to Idle when the ingress ends, the
 * participant lookup is exhausted, or the start fails. At most one StartEgress is
 * emitted per TrackPending episode. Events that do not apply to the current phase
 * leave the state unchanged and emit nothing, except an EgressStarted arriving
 * for a room that is no longer pending, which emits a StopEgress for the job.
 */
EgressTransition step(const RoomEgressState &current, const EgressEvent &event, const RetryPolicy &policy);

/// First participant that publishes both an audio and a video track.
std::optional<TrackPair> selectPublisherTracks(const std::vector<LiveKit::ParticipantInfo> &participants);

} // namespace LiveVault::StreamLifecycle::Egress
