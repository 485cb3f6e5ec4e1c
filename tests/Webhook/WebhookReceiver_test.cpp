/*
 * LiveVault - Webhook Module Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <LiveVault/Async/Join.hpp>
#include <LiveVault/Crypto/Digest.hpp>
#include <LiveVault/LiveKit/AccessToken.hpp>

#include <WebhookReceiver.hpp>

#include "../TestSupport/FakeLiveKitApi.hpp"
#include "../TestSupport/RecordingLogger.hpp"
#include "../TestSupport/Timers.hpp"

using namespace LiveVault::StreamLifecycle;
using LiveVault::Tests::FakeLiveKitApi;
using LiveVault::Tests::ImmediateTimer;
using LiveVault::Tests::makePublisher;
using LiveVault::Tests::RecordingLogger;

namespace {

constexpr const char *kApiKey = "APIwebhook";
constexpr const char *kApiSecret = "webhook-secret-with-enough-entropy";

std::string trackPublishedBody(const std::string &room, const std::string &type)
{
	nlohmann::json j = {{"event", "track_published"},
			    {"id", "EV_1"},
			    {"createdAt", "1700000000"},
			    {"room", {{"name", room}}},
			    {"track", {{"sid", "TR_V"}, {"type", type}}}};
	return j.dump();
}

std::string ingressEndedBody(const std::string &room)
{
	nlohmann::json j = {{"event", "ingress_ended"},
			    {"id", "EV_2"},
			    {"ingressInfo", {{"ingressId", "IN_1"}, {"roomName", room}}}};
	return j.dump();
}

} // namespace

class WebhookReceiverTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		Egress::EgressOrchestratorOptions options;
		options.streamUrls = {"rtmp://media.example.com/live/abc"};
		orchestrator = std::make_shared<Egress::EgressOrchestrator>(api, std::make_shared<ImmediateTimer>(),
									     options, logger);
		receiver = std::make_unique<Webhook::WebhookReceiver>(
			std::make_shared<LiveVault::LiveKit::WebhookVerifier>(kApiKey, kApiSecret), orchestrator,
			[](LiveVault::Async::Task<void> task) { LiveVault::Async::join(std::move(task)); }, logger);
	}

	static std::string sign(const std::string &body, const std::string &secret = kApiSecret)
	{
		LiveVault::LiveKit::AccessTokenOptions options;
		options.sha256 = LiveVault::Crypto::base64Encode(LiveVault::Crypto::sha256(body));
		return "Bearer " + LiveVault::LiveKit::createAccessToken(kApiKey, secret, options,
									  std::chrono::system_clock::now());
	}

	std::shared_ptr<FakeLiveKitApi> api = std::make_shared<FakeLiveKitApi>();
	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
	std::shared_ptr<Egress::EgressOrchestrator> orchestrator;
	std::unique_ptr<Webhook::WebhookReceiver> receiver;
};

TEST_F(WebhookReceiverTest, SignedVideoPublishStartsEgress)
{
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	const std::string body = trackPublishedBody("room-1", "VIDEO");

	Webhook::WebhookResponse response = receiver->handle(body, sign(body));

	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(api->startRequests.size(), 1u);
	EXPECT_EQ(orchestrator->phaseOf("room-1"), Egress::EgressPhase::Active);
}

TEST_F(WebhookReceiverTest, IngressEndedStopsEgress)
{
	api->participantResponses.push_back({makePublisher("ingress", "TR_A", "TR_V")});
	const std::string published = trackPublishedBody("room-1", "VIDEO");
	ASSERT_EQ(receiver->handle(published, sign(published)).status, 200);

	const std::string ended = ingressEndedBody("room-1");
	EXPECT_EQ(receiver->handle(ended, sign(ended)).status, 200);

	ASSERT_EQ(api->stoppedEgressIds.size(), 1u);
	EXPECT_EQ(api->stoppedEgressIds[0], "EG_1");
	EXPECT_EQ(orchestrator->phaseOf("room-1"), Egress::EgressPhase::Idle);
}

TEST_F(WebhookReceiverTest, WrongSecretIsRejectedWithoutStateChange)
{
	const std::string body = trackPublishedBody("room-1", "VIDEO");

	Webhook::WebhookResponse response = receiver->handle(body, sign(body, "another-secret"));

	EXPECT_EQ(response.status, 401);
	EXPECT_TRUE(api->listCalls.empty());
	EXPECT_EQ(orchestrator->phaseOf("room-1"), Egress::EgressPhase::Idle);
}

TEST_F(WebhookReceiverTest, TamperedBodyIsRejected)
{
	const std::string body = trackPublishedBody("room-1", "VIDEO");
	const std::string tampered = trackPublishedBody("room-2", "VIDEO");

	EXPECT_EQ(receiver->handle(tampered, sign(body)).status, 401);
	EXPECT_TRUE(api->listCalls.empty());
}

TEST_F(WebhookReceiverTest, MissingAuthorizationIsRejected)
{
	EXPECT_EQ(receiver->handle(trackPublishedBody("room-1", "VIDEO"), "").status, 401);
	EXPECT_TRUE(logger->contains(LiveVault::Logger::LogLevel::Warn, "WebhookUnauthorized"));
}

TEST_F(WebhookReceiverTest, MalformedBodyIsBadRequest)
{
	const std::string body = "{not json";
	EXPECT_EQ(receiver->handle(body, sign(body)).status, 400);

	const std::string noRoom = R"({"event":"track_published","track":{"sid":"TR_V","type":"VIDEO"}})";
	EXPECT_EQ(receiver->handle(noRoom, sign(noRoom)).status, 400);
	EXPECT_TRUE(api->listCalls.empty());
}

TEST_F(WebhookReceiverTest, AudioAndUnknownEventsAreAcknowledgedAndIgnored)
{
	const std::string audio = trackPublishedBody("room-1", "AUDIO");
	EXPECT_EQ(receiver->handle(audio, sign(audio)).status, 200);

	const std::string joined = R"({"event":"participant_joined","room":{"name":"room-1"}})";
	EXPECT_EQ(receiver->handle(joined, sign(joined)).status, 200);

	EXPECT_TRUE(api->listCalls.empty());
}
