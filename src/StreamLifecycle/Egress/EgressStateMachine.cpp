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

#include "EgressStateMachine.hpp"

#include <algorithm>

namespace LiveVault::StreamLifecycle::Egress {

std::string_view toString(EgressPhase phase) noexcept
{
	switch (phase) {
	case EgressPhase::Idle:
		return "idle";
	case EgressPhase::TrackPending:
		return "track_pending";
	case EgressPhase::Active:
		return "active";
	}
	return "unknown";
}

namespace {

EgressTransition unchanged(const RoomEgressState &current)
{
	return {current, {}};
}

EgressTransition onTrackPublished(const RoomEgressState &current, const Events::TrackPublished &event)
{
	if (event.trackType != LiveKit::TrackType::Video || current.phase != EgressPhase::Idle) {
		return unchanged(current);
	}

	RoomEgressState next;
	next.phase = EgressPhase::TrackPending;
	next.attempt = 1;
	return {next, {Commands::QueryParticipants{1, std::chrono::milliseconds{0}}}};
}

EgressTransition onParticipantsResolved(const RoomEgressState &current, const Events::ParticipantsResolved &event,
					const RetryPolicy &policy)
{
	if (current.phase != EgressPhase::TrackPending || current.startIssued || event.attempt != current.attempt) {
		return unchanged(current);
	}

	if (event.tracks) {
		RoomEgressState next = current;
		next.startIssued = true;
		return {next, {Commands::StartEgress{*event.tracks}}};
	}

	if (current.attempt < policy.maxAttempts) {
		RoomEgressState next = current;
		next.attempt = current.attempt + 1;
		return {next, {Commands::QueryParticipants{next.attempt, policy.retryDelay}}};
	}

	return {RoomEgressState{}, {Commands::Abandon{"ParticipantTracksNotFound"}}};
}

EgressTransition onEgressStarted(const RoomEgressState &current, const Events::EgressStarted &event)
{
	if (current.phase == EgressPhase::TrackPending && current.startIssued) {
		RoomEgressState next = current;
		next.phase = EgressPhase::Active;
		next.egressId = event.egressId;
		return {next, {}};
	}

	if (event.egressId.empty() || event.egressId == current.egressId) {
		return unchanged(current);
	}

	// The room ended while the start was in flight.
	return {current, {Commands::StopEgress{event.egressId}}};
}

EgressTransition onEgressStartFailed(const RoomEgressState &current, const Events::EgressStartFailed &event)
{
	if (current.phase != EgressPhase::TrackPending || !current.startIssued) {
		return unchanged(current);
	}
	return {RoomEgressState{}, {Commands::Abandon{event.reason}}};
}

EgressTransition onIngressEnded(const RoomEgressState &current)
{
	switch (current.phase) {
	case EgressPhase::Active:
		return {RoomEgressState{}, {Commands::StopEgress{current.egressId}}};
	case EgressPhase::TrackPending:
		return {RoomEgressState{}, {}};
	case EgressPhase::Idle:
		break;
	}
	return unchanged(current);
}

} // namespace

EgressTransition step(const RoomEgressState &current, const EgressEvent &event, const RetryPolicy &policy)
{
	if (const auto *e = std::get_if<Events::TrackPublished>(&event)) {
		return onTrackPublished(current, *e);
	} else if (const auto *e = std::get_if<Events::ParticipantsResolved>(&event)) {
		return onParticipantsResolved(current, *e, policy);
	} else if (const auto *e = std::get_if<Events::EgressStarted>(&event)) {
		return onEgressStarted(current, *e);
	} else if (const auto *e = std::get_if<Events::EgressStartFailed>(&event)) {
		return onEgressStartFailed(current, *e);
	} else {
		return onIngressEnded(current);
	}
}

std::optional<TrackPair> selectPublisherTracks(const std::vector<LiveKit::ParticipantInfo> &participants)
{
	for (const LiveKit::ParticipantInfo &participant : participants) {
		auto audio = std::find_if(participant.tracks.begin(), participant.tracks.end(),
					  [](const LiveKit::TrackInfo &t) { return t.type == LiveKit::TrackType::Audio; });
		auto video = std::find_if(participant.tracks.begin(), participant.tracks.end(),
					  [](const LiveKit::TrackInfo &t) { return t.type == LiveKit::TrackType::Video; });
		if (audio != participant.tracks.end() && video != participant.tracks.end()) {
			return TrackPair{audio->sid, video->sid};
		}
	}
	return std::nullopt;
}

} // namespace LiveVault::StreamLifecycle::Egress
