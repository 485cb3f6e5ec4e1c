/*
 * LiveVault - Egress Module Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <memory>

#include <LiveVault/Async/DetachedTask.hpp>
#include <LiveVault/Async/Join.hpp>

#include <EgressOrchestrator.hpp>

#include "../TestSupport/FakeLiveKitApi.hpp"
#include "../TestSupport/RecordingLogger.hpp"
#include "../TestSupport/Timers.hpp"

using namespace LiveVault::StreamLifecycle::Egress;
using LiveVault::Async::join;
using LiveVault::Async::launchDetached;
using LiveVault::LiveKit::TrackType;
using LiveVault::Tests::FakeLiveKitApi;
using LiveVault::Tests::ImmediateTimer;
using LiveVault::Tests::makePublisher;
using LiveVault::Tests::ManualTimer;
using LiveVault::Tests::RecordingLogger;

class EgressOrchestratorTest : public ::testing::Test {
protected:
	std::shared_ptr<EgressOrchestrator> makeOrchestrator(std::shared_ptr<LiveVault::Async::ITimer> timer)
	{
		EgressOrchestratorOptions options;
		options.retry = RetryPolicy{2, std::chrono::milliseconds(2000)};
		options.streamUrls = {"rtmp://media.example.com/live/abc"};
		options.filePathTemplate = "/recordings/{room}.mp4";
		return std::make_shared<EgressOrchestrator>(api, std::move(timer), options, logger);
	}

	std::shared_ptr<FakeLiveKitApi> api = std::make_shared<FakeLiveKitApi>();
	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
};

TEST_F(EgressOrchestratorTest, VideoPublishStartsEgressWithResolvedTracks)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));

	ASSERT_EQ(api->startRequests.size(), 1u);
	const auto &request = api->startRequests[0];
	EXPECT_EQ(request.roomName, "room-1");
	EXPECT_EQ(request.audioTrackId, "TR_A");
	EXPECT_EQ(request.videoTrackId, "TR_V");
	ASSERT_EQ(request.streamUrls.size(), 1u);
	EXPECT_EQ(request.filePath, "/recordings/room-1.mp4");

	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Active);
	EXPECT_EQ(orchestrator->egressIdFor("room-1"), "EG_1");
}

TEST_F(EgressOrchestratorTest, AudioPublishMakesNoCalls)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());

	join(orchestrator->onTrackPublished("room-1", TrackType::Audio));

	EXPECT_TRUE(api->listCalls.empty());
	EXPECT_TRUE(api->startRequests.empty());
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);
}

TEST_F(EgressOrchestratorTest, DuplicateVideoPublishIsNoOp)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	join(orchestrator->onTrackPublished("room-1", TrackType::Video));

	EXPECT_EQ(api->listCalls.size(), 1u);
	EXPECT_EQ(api->startRequests.size(), 1u);
	EXPECT_EQ(orchestrator->egressIdFor("room-1"), "EG_1");
}

TEST_F(EgressOrchestratorTest, RetriesOnceAfterDelayThenAbandons)
{
	auto timer = std::make_shared<ImmediateTimer>();
	auto orchestrator = makeOrchestrator(timer);

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));

	EXPECT_EQ(api->listCalls.size(), 2u);
	ASSERT_EQ(timer->delays.size(), 1u);
	EXPECT_EQ(timer->delays[0], std::chrono::milliseconds(2000));
	EXPECT_TRUE(api->startRequests.empty());
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Warn, "EgressAbandoned"));
}

TEST_F(EgressOrchestratorTest, RetrySucceedsWhenTracksAppearLater)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({});
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));

	EXPECT_EQ(api->listCalls.size(), 2u);
	EXPECT_EQ(api->startRequests.size(), 1u);
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Active);
}

TEST_F(EgressOrchestratorTest, IngressEndedStopsEgressOnce)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	join(orchestrator->onIngressEnded("room-1"));
	join(orchestrator->onIngressEnded("room-1"));

	ASSERT_EQ(api->stoppedEgressIds.size(), 1u);
	EXPECT_EQ(api->stoppedEgressIds[0], "EG_1");
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);
}

TEST_F(EgressOrchestratorTest, FailedStopStillClearsMapping)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	api->failStop = true;

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	join(orchestrator->onIngressEnded("room-1"));

	EXPECT_EQ(api->stoppedEgressIds.size(), 1u);
	EXPECT_FALSE(orchestrator->egressIdFor("room-1").has_value());
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Error, "EgressStopFailed"));
}

TEST_F(EgressOrchestratorTest, FailedStartReturnsRoomToIdle)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	api->failStart = true;

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);

	api->failStart = false;
	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Active);
	EXPECT_EQ(api->startRequests.size(), 2u);
}

TEST_F(EgressOrchestratorTest, DuplicateEventDuringRetryWindowDoesNotStartTwice)
{
	auto timer = std::make_shared<ManualTimer>();
	auto orchestrator = makeOrchestrator(timer);
	api->participantResponses.push_back({});
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	launchDetached(orchestrator->onTrackPublished("room-1", TrackType::Video), logger);
	ASSERT_EQ(timer->pending(), 1u);
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::TrackPending);

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	EXPECT_EQ(api->listCalls.size(), 1u);

	ASSERT_TRUE(timer->fireNext());
	EXPECT_EQ(api->startRequests.size(), 1u);
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Active);
}

TEST_F(EgressOrchestratorTest, IngressEndedDuringRetryWindowCancelsStart)
{
	auto timer = std::make_shared<ManualTimer>();
	auto orchestrator = makeOrchestrator(timer);
	api->participantResponses.push_back({});
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});

	launchDetached(orchestrator->onTrackPublished("room-1", TrackType::Video), logger);
	join(orchestrator->onIngressEnded("room-1"));
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);

	ASSERT_TRUE(timer->fireNext());
	EXPECT_TRUE(api->startRequests.empty());
	EXPECT_TRUE(api->stoppedEgressIds.empty());
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);
}

TEST_F(EgressOrchestratorTest, StaleRetryDoesNotLeakIntoNewEpisode)
{
	auto timer = std::make_shared<ManualTimer>();
	auto orchestrator = makeOrchestrator(timer);
	api->participantResponses.push_back({});

	launchDetached(orchestrator->onTrackPublished("room-1", TrackType::Video), logger);
	join(orchestrator->onIngressEnded("room-1"));

	api->participantResponses.push_back({});
	launchDetached(orchestrator->onTrackPublished("room-1", TrackType::Video), logger);
	ASSERT_EQ(timer->pending(), 2u);

	// The first episode's retry resolves tracks but belongs to an ended episode.
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	ASSERT_TRUE(timer->fireNext());
	EXPECT_TRUE(api->startRequests.empty());
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::TrackPending);

	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	ASSERT_TRUE(timer->fireNext());
	EXPECT_EQ(api->startRequests.size(), 1u);
	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Active);
}

TEST_F(EgressOrchestratorTest, RoomsAreIndependent)
{
	auto orchestrator = makeOrchestrator(std::make_shared<ImmediateTimer>());
	api->participantResponses.push_back({makePublisher("a", "TR_A1", "TR_V1")});
	api->participantResponses.push_back({makePublisher("b", "TR_A2", "TR_V2")});

	join(orchestrator->onTrackPublished("room-1", TrackType::Video));
	join(orchestrator->onTrackPublished("room-2", TrackType::Video));
	join(orchestrator->onIngressEnded("room-1"));

	EXPECT_EQ(orchestrator->phaseOf("room-1"), EgressPhase::Idle);
	EXPECT_EQ(orchestrator->egressIdFor("room-2"), "EG_2");
}

TEST_F(EgressOrchestratorTest, RejectsConfigurationWithoutOutputs)
{
	EgressOrchestratorOptions options;
	EXPECT_THROW(EgressOrchestrator(api, std::make_shared<ImmediateTimer>(), options, logger),
		     std::invalid_argument);
}
