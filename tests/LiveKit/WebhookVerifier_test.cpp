/*
 * LiveVault - LiveKit Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <LiveVault/Crypto/Digest.hpp>
#include <LiveVault/LiveKit/WebhookVerifier.hpp>

using namespace LiveVault::LiveKit;

class WebhookVerifierTest : public ::testing::Test {
protected:
	std::string authorizationFor(std::string_view body, std::string_view secret = "webhook-secret")
	{
		AccessTokenOptions options;
		options.sha256 = LiveVault::Crypto::base64Encode(LiveVault::Crypto::sha256(body));
		return createAccessToken("APIkey", secret, options, now);
	}

	const std::chrono::system_clock::time_point now{std::chrono::seconds(1700000000)};
	WebhookVerifier verifier{"APIkey", "webhook-secret"};
};

TEST_F(WebhookVerifierTest, AcceptsSignedBodyWithOrWithoutBearerPrefix)
{
	const std::string body = R"({"event":"room_started","room":{"name":"room-1"}})";

	WebhookEvent event = verifier.receive(body, authorizationFor(body), now);
	EXPECT_EQ(event.event, "room_started");
	EXPECT_EQ(event.roomName, "room-1");

	EXPECT_NO_THROW(verifier.verify(body, "Bearer " + authorizationFor(body), now));
}

TEST_F(WebhookVerifierTest, RejectsBodyDigestMismatch)
{
	const std::string body = R"({"event":"room_started"})";
	EXPECT_THROW(verifier.verify(body + " ", authorizationFor(body), now), TokenVerificationError);
}

TEST_F(WebhookVerifierTest, RejectsTokenWithoutDigest)
{
	const std::string token = createAccessToken("APIkey", "webhook-secret", AccessTokenOptions{}, now);
	EXPECT_THROW(verifier.verify("{}", token, now), TokenVerificationError);
}

TEST_F(WebhookVerifierTest, RejectsForeignSecret)
{
	const std::string body = "{}";
	EXPECT_THROW(verifier.verify(body, authorizationFor(body, "other-secret"), now), TokenVerificationError);
}

TEST_F(WebhookVerifierTest, ParseReportsMalformedPayloads)
{
	EXPECT_THROW(WebhookVerifier::parse("not json"), WebhookPayloadError);
	EXPECT_THROW(WebhookVerifier::parse(R"({"room":{"name":"x"}})"), WebhookPayloadError);
	EXPECT_THROW(WebhookVerifier::parse(R"({"event":42})"), WebhookPayloadError);
}

TEST_F(WebhookVerifierTest, RequiresCredentials)
{
	EXPECT_THROW(WebhookVerifier("", "secret"), std::invalid_argument);
}
