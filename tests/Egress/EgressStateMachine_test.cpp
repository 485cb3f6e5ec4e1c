/*
 * LiveVault - Egress Module Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <EgressStateMachine.hpp>

#include "../TestSupport/FakeLiveKitApi.hpp"

using namespace LiveVault::StreamLifecycle::Egress;
using LiveVault::LiveKit::TrackType;

namespace {

const RetryPolicy kPolicy{2, std::chrono::milliseconds(2000)};

RoomEgressState pending(int attempt, bool startIssued)
{
	RoomEgressState state;
	state.phase = EgressPhase::TrackPending;
	state.attempt = attempt;
	state.startIssued = startIssued;
	return state;
}

RoomEgressState active(const std::string &egressId)
{
	RoomEgressState state = pending(1, true);
	state.phase = EgressPhase::Active;
	state.egressId = egressId;
	return state;
}

} // namespace

TEST(EgressStateMachineTest, VideoPublishOnIdleRoomQueriesParticipantsImmediately)
{
	EgressTransition t = step(RoomEgressState{}, Events::TrackPublished{TrackType::Video}, kPolicy);

	EXPECT_EQ(t.next, pending(1, false));
	ASSERT_EQ(t.commands.size(), 1u);
	const auto *query = std::get_if<Commands::QueryParticipants>(&t.commands[0]);
	ASSERT_NE(query, nullptr);
	EXPECT_EQ(query->attempt, 1);
	EXPECT_EQ(query->delay.count(), 0);
}

TEST(EgressStateMachineTest, NonVideoPublishIsIgnored)
{
	for (TrackType type : {TrackType::Audio, TrackType::Data, TrackType::Unknown}) {
		EgressTransition t = step(RoomEgressState{}, Events::TrackPublished{type}, kPolicy);
		EXPECT_EQ(t.next.phase, EgressPhase::Idle);
		EXPECT_TRUE(t.commands.empty());
	}
}

TEST(EgressStateMachineTest, DuplicateVideoPublishIsNoOp)
{
	for (const RoomEgressState &state : {pending(1, false), pending(2, true), active("EG_1")}) {
		EgressTransition t = step(state, Events::TrackPublished{TrackType::Video}, kPolicy);
		EXPECT_EQ(t.next, state);
		EXPECT_TRUE(t.commands.empty());
	}
}

TEST(EgressStateMachineTest, ResolvedTracksIssueExactlyOneStart)
{
	const TrackPair tracks{"TR_A", "TR_V"};
	EgressTransition first = step(pending(1, false), Events::ParticipantsResolved{1, tracks}, kPolicy);

	EXPECT_EQ(first.next, pending(1, true));
	ASSERT_EQ(first.commands.size(), 1u);
	const auto *start = std::get_if<Commands::StartEgress>(&first.commands[0]);
	ASSERT_NE(start, nullptr);
	EXPECT_EQ(start->tracks, tracks);

	EgressTransition again = step(first.next, Events::ParticipantsResolved{1, tracks}, kPolicy);
	EXPECT_EQ(again.next, first.next);
	EXPECT_TRUE(again.commands.empty());
}

TEST(EgressStateMachineTest, MissingTracksRetryOnceAfterDelayThenAbandon)
{
	EgressTransition retry = step(pending(1, false), Events::ParticipantsResolved{1, std::nullopt}, kPolicy);
	EXPECT_EQ(retry.next, pending(2, false));
	ASSERT_EQ(retry.commands.size(), 1u);
	const auto *query = std::get_if<Commands::QueryParticipants>(&retry.commands[0]);
	ASSERT_NE(query, nullptr);
	EXPECT_EQ(query->attempt, 2);
	EXPECT_EQ(query->delay, std::chrono::milliseconds(2000));

	EgressTransition giveUp = step(retry.next, Events::ParticipantsResolved{2, std::nullopt}, kPolicy);
	EXPECT_EQ(giveUp.next.phase, EgressPhase::Idle);
	ASSERT_EQ(giveUp.commands.size(), 1u);
	EXPECT_NE(std::get_if<Commands::Abandon>(&giveUp.commands[0]), nullptr);
}

TEST(EgressStateMachineTest, StaleParticipantResultIsIgnored)
{
	EgressTransition t = step(pending(2, false), Events::ParticipantsResolved{1, TrackPair{"A", "V"}}, kPolicy);
	EXPECT_EQ(t.next, pending(2, false));
	EXPECT_TRUE(t.commands.empty());
}

TEST(EgressStateMachineTest, StartedEgressActivatesRoom)
{
	EgressTransition t = step(pending(1, true), Events::EgressStarted{"EG_1"}, kPolicy);
	EXPECT_EQ(t.next, active("EG_1"));
	EXPECT_TRUE(t.commands.empty());
}

TEST(EgressStateMachineTest, StartedEgressForIdleRoomIsStopped)
{
	EgressTransition t = step(RoomEgressState{}, Events::EgressStarted{"EG_9"}, kPolicy);
	EXPECT_EQ(t.next.phase, EgressPhase::Idle);
	ASSERT_EQ(t.commands.size(), 1u);
	const auto *stop = std::get_if<Commands::StopEgress>(&t.commands[0]);
	ASSERT_NE(stop, nullptr);
	EXPECT_EQ(stop->egressId, "EG_9");
}

TEST(EgressStateMachineTest, FailedStartReturnsToIdle)
{
	EgressTransition t = step(pending(1, true), Events::EgressStartFailed{"boom"}, kPolicy);
	EXPECT_EQ(t.next.phase, EgressPhase::Idle);
	ASSERT_EQ(t.commands.size(), 1u);
	EXPECT_NE(std::get_if<Commands::Abandon>(&t.commands[0]), nullptr);
}

TEST(EgressStateMachineTest, IngressEndedStopsActiveEgress)
{
	EgressTransition t = step(active("EG_1"), Events::IngressEnded{}, kPolicy);
	EXPECT_EQ(t.next.phase, EgressPhase::Idle);
	ASSERT_EQ(t.commands.size(), 1u);
	const auto *stop = std::get_if<Commands::StopEgress>(&t.commands[0]);
	ASSERT_NE(stop, nullptr);
	EXPECT_EQ(stop->egressId, "EG_1");
}

TEST(EgressStateMachineTest, IngressEndedWithoutEgressIsNoOp)
{
	EgressTransition idle = step(RoomEgressState{}, Events::IngressEnded{}, kPolicy);
	EXPECT_EQ(idle.next.phase, EgressPhase::Idle);
	EXPECT_TRUE(idle.commands.empty());

	EgressTransition pendingRoom = step(pending(1, false), Events::IngressEnded{}, kPolicy);
	EXPECT_EQ(pendingRoom.next.phase, EgressPhase::Idle);
	EXPECT_TRUE(pendingRoom.commands.empty());
}

TEST(EgressStateMachineTest, SelectPublisherTracksPicksFirstCompleteParticipant)
{
	LiveVault::LiveKit::ParticipantInfo audioOnly;
	audioOnly.identity = "listener";
	audioOnly.tracks.push_back({"TR_X", TrackType::Audio, "", ""});

	std::vector<LiveVault::LiveKit::ParticipantInfo> participants{
		audioOnly, LiveVault::Tests::makePublisher("ingress", "TR_A", "TR_V"),
		LiveVault::Tests::makePublisher("other", "TR_A2", "TR_V2")};

	std::optional<TrackPair> tracks = selectPublisherTracks(participants);
	ASSERT_TRUE(tracks.has_value());
	EXPECT_EQ(tracks->audioTrackId, "TR_A");
	EXPECT_EQ(tracks->videoTrackId, "TR_V");

	EXPECT_FALSE(selectPublisherTracks({audioOnly}).has_value());
	EXPECT_FALSE(selectPublisherTracks({}).has_value());
}
