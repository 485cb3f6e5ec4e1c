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

#include "EgressOrchestrator.hpp"

#include <deque>
#include <exception>
#include <stdexcept>
#include <utility>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::StreamLifecycle::Egress {

namespace {

std::string expandFilePath(std::string pathTemplate, const std::string &roomName)
{
	static constexpr std::string_view kPlaceholder = "{room}";
	for (std::size_t pos = pathTemplate.find(kPlaceholder); pos != std::string::npos;
	     pos = pathTemplate.find(kPlaceholder, pos + roomName.size())) {
		pathTemplate.replace(pos, kPlaceholder.size(), roomName);
	}
	return pathTemplate;
}

} // namespace

EgressOrchestrator::EgressOrchestrator(std::shared_ptr<LiveKit::ILiveKitApi> api,
				       std::shared_ptr<Async::ITimer> timer, EgressOrchestratorOptions options,
				       std::shared_ptr<const Logger::ILogger> logger)
	: api_(std::move(api)),
	  timer_(std::move(timer)),
	  options_(std::move(options)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (!api_) {
		logger_->error("LiveKitApiIsNullError");
		throw std::invalid_argument("LiveKitApiIsNullError(EgressOrchestrator::EgressOrchestrator)");
	}
	if (!timer_) {
		logger_->error("TimerIsNullError");
		throw std::invalid_argument("TimerIsNullError(EgressOrchestrator::EgressOrchestrator)");
	}
	if (options_.retry.maxAttempts < 1) {
		logger_->error("InvalidRetryPolicyError", {{"maxAttempts", std::to_string(options_.retry.maxAttempts)}});
		throw std::invalid_argument("InvalidRetryPolicyError(EgressOrchestrator::EgressOrchestrator)");
	}
	if (options_.streamUrls.empty() && !options_.filePathTemplate) {
		logger_->error("EgressOutputIsEmptyError");
		throw std::invalid_argument("EgressOutputIsEmptyError(EgressOrchestrator::EgressOrchestrator)");
	}
}

EgressOrchestrator::~EgressOrchestrator() noexcept = default;

Async::Task<void> EgressOrchestrator::onTrackPublished(std::string roomName, LiveKit::TrackType trackType)
{
	logger_->info("TrackPublished", {{"room", roomName}, {"trackType", LiveKit::toString(trackType)}});
	co_await dispatch(std::move(roomName), Events::TrackPublished{trackType});
}

Async::Task<void> EgressOrchestrator::onIngressEnded(std::string roomName)
{
	logger_->info("IngressEnded", {{"room", roomName}});
	co_await dispatch(std::move(roomName), Events::IngressEnded{});
}

EgressPhase EgressOrchestrator::phaseOf(const std::string &roomName) const
{
	std::scoped_lock lock(mutex_);
	auto it = rooms_.find(roomName);
	return it == rooms_.end() ? EgressPhase::Idle : it->second.state.phase;
}

std::optional<std::string> EgressOrchestrator::egressIdFor(const std::string &roomName) const
{
	std::scoped_lock lock(mutex_);
	auto it = rooms_.find(roomName);
	if (it == rooms_.end() || it->second.state.phase != EgressPhase::Active) {
		return std::nullopt;
	}
	return it->second.state.egressId;
}

EgressOrchestrator::Applied EgressOrchestrator::apply(const std::string &roomName, const EgressEvent &event,
						      std::optional<std::uint64_t> episode)
{
	std::scoped_lock lock(mutex_);

	auto it = rooms_.find(roomName);
	const bool current = it != rooms_.end() && (!episode || it->second.episode == *episode);

	// Follow-ups of an episode that has already ended see an idle room.
	const RoomEgressState before = current ? it->second.state : RoomEgressState{};
	EgressTransition transition = step(before, event, options_.retry);

	Applied applied{std::move(transition.commands), current ? it->second.episode : episode.value_or(0)};

	if (transition.next.phase == EgressPhase::Idle) {
		if (current) {
			rooms_.erase(it);
		}
	} else if (current) {
		it->second.state = std::move(transition.next);
	} else if (before.phase == EgressPhase::Idle && it == rooms_.end()) {
		applied.episode = nextEpisode_++;
		rooms_.emplace(roomName, RoomEntry{std::move(transition.next), applied.episode});
	}

	return applied;
}

Async::Task<void> EgressOrchestrator::dispatch(std::string roomName, EgressEvent event)
{
	Applied applied = apply(roomName, event, std::nullopt);
	std::deque<EgressCommand> pending(applied.commands.begin(), applied.commands.end());

	while (!pending.empty()) {
		EgressCommand command = std::move(pending.front());
		pending.pop_front();

		std::optional<EgressEvent> followUp = co_await execute(roomName, std::move(command));
		if (!followUp) {
			continue;
		}

		Applied next = apply(roomName, *followUp, applied.episode);
		pending.insert(pending.end(), next.commands.begin(), next.commands.end());
	}
}

std::optional<EgressEvent> EgressOrchestrator::queryParticipants(const std::string &roomName, int attempt)
{
	try {
		std::vector<LiveKit::ParticipantInfo> participants = api_->listParticipants(roomName);
		std::optional<TrackPair> tracks = selectPublisherTracks(participants);
		if (!tracks) {
			logger_->warn("PublisherTracksNotFound", {{"room", roomName},
								  {"attempt", std::to_string(attempt)},
								  {"participants", std::to_string(participants.size())}});
		}
		return Events::ParticipantsResolved{attempt, std::move(tracks)};
	} catch (const std::exception &e) {
		logger_->warn("ListParticipantsFailed",
			      {{"room", roomName}, {"attempt", std::to_string(attempt)}, {"exception", e.what()}});
		return Events::ParticipantsResolved{attempt, std::nullopt};
	}
}

Async::Task<std::optional<EgressEvent>> EgressOrchestrator::execute(const std::string &roomName,
								    EgressCommand command)
{
	if (auto *query = std::get_if<Commands::QueryParticipants>(&command)) {
		if (query->delay.count() > 0) {
			logger_->info("ParticipantQueryDelayed",
				      {{"room", roomName}, {"delayMs", std::to_string(query->delay.count())}});
			co_await timer_->sleepFor(query->delay);
		}
		co_return queryParticipants(roomName, query->attempt);
	}

	if (auto *start = std::get_if<Commands::StartEgress>(&command)) {
		LiveKit::TrackCompositeEgressRequest request;
		request.roomName = roomName;
		request.audioTrackId = start->tracks.audioTrackId;
		request.videoTrackId = start->tracks.videoTrackId;
		request.streamUrls = options_.streamUrls;
		if (options_.filePathTemplate) {
			request.filePath = expandFilePath(*options_.filePathTemplate, roomName);
		}

		try {
			LiveKit::EgressInfo info = api_->startTrackCompositeEgress(request);
			logger_->info("EgressStarted", {{"room", roomName}, {"egressId", info.egressId}});
			co_return Events::EgressStarted{std::move(info.egressId)};
		} catch (const std::exception &e) {
			logger_->error("EgressStartFailed", {{"room", roomName}, {"exception", e.what()}});
			co_return Events::EgressStartFailed{e.what()};
		}
	}

	if (auto *stop = std::get_if<Commands::StopEgress>(&command)) {
		try {
			api_->stopEgress(stop->egressId);
			logger_->info("EgressStopped", {{"room", roomName}, {"egressId", stop->egressId}});
		} catch (const std::exception &e) {
			logger_->error("EgressStopFailed",
				       {{"room", roomName}, {"egressId", stop->egressId}, {"exception", e.what()}});
		}
		co_return std::nullopt;
	}

	if (auto *abandon = std::get_if<Commands::Abandon>(&command)) {
		logger_->warn("EgressAbandoned", {{"room", roomName}, {"reason", abandon->reason}});
	}
	co_return std::nullopt;
}

} // namespace LiveVault::StreamLifecycle::Egress
