/*
 * LiveVault - Test Support
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <LiveVault/LiveKit/ILiveKitApi.hpp>

namespace LiveVault::Tests {

inline LiveKit::ParticipantInfo makePublisher(const std::string &identity, const std::string &audioSid,
					      const std::string &videoSid)
{
	LiveKit::ParticipantInfo participant;
	participant.sid = "PA_" + identity;
	participant.identity = identity;
	participant.tracks.push_back({audioSid, LiveKit::TrackType::Audio, "audio", "microphone"});
	participant.tracks.push_back({videoSid, LiveKit::TrackType::Video, "video", "camera"});
	return participant;
}

/// Scripted room service. Each listParticipants call consumes the next scripted response.
class FakeLiveKitApi final : public LiveKit::ILiveKitApi {
public:
	std::vector<LiveKit::ParticipantInfo> listParticipants(const std::string &roomName) override
	{
		std::scoped_lock lock(mutex_);
		listCalls.push_back(roomName);
		if (participantResponses.empty())
			return {};
		std::vector<LiveKit::ParticipantInfo> response = std::move(participantResponses.front());
		participantResponses.pop_front();
		return response;
	}

	LiveKit::EgressInfo startTrackCompositeEgress(const LiveKit::TrackCompositeEgressRequest &request) override
	{
		std::scoped_lock lock(mutex_);
		startRequests.push_back(request);
		if (failStart)
			throw std::runtime_error("TwirpError(LiveKitApiClient::callTwirp):500:internal");
		return {fmt::format("EG_{}", startRequests.size()), request.roomName, "EGRESS_STARTING"};
	}

	LiveKit::EgressInfo stopEgress(const std::string &egressId) override
	{
		std::scoped_lock lock(mutex_);
		stoppedEgressIds.push_back(egressId);
		if (failStop)
			throw std::runtime_error("TwirpError(LiveKitApiClient::callTwirp):404:not_found");
		return {egressId, "", "EGRESS_ENDING"};
	}

	std::deque<std::vector<LiveKit::ParticipantInfo>> participantResponses;
	std::vector<std::string> listCalls;
	std::vector<LiveKit::TrackCompositeEgressRequest> startRequests;
	std::vector<std::string> stoppedEgressIds;
	bool failStart = false;
	bool failStop = false;

private:
	std::mutex mutex_;
};

} // namespace LiveVault::Tests
