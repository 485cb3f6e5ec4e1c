/*
 * LiveVault - LiveKit Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <LiveVault/LiveKit/AccessToken.hpp>

using namespace LiveVault::LiveKit;

namespace {

constexpr const char *kKey = "APIkey";
constexpr const char *kSecret = "secret-of-reasonable-length";

const std::chrono::system_clock::time_point kNow{std::chrono::seconds(1700000000)};

} // namespace

TEST(AccessTokenTest, RoundTripCarriesGrantsAndClaims)
{
	AccessTokenOptions options;
	options.identity = "recorder";
	options.video.roomRecord = true;
	options.video.room = "room-1";

	const std::string token = createAccessToken(kKey, kSecret, options, kNow);
	nlohmann::json claims = verifyAccessToken(token, kKey, kSecret, kNow);

	EXPECT_EQ(claims.at("iss"), kKey);
	EXPECT_EQ(claims.at("sub"), "recorder");
	EXPECT_EQ(claims.at("exp"), 1700000600);
	EXPECT_EQ(claims.at("video").at("roomRecord"), true);
	EXPECT_EQ(claims.at("video").at("room"), "room-1");
	EXPECT_FALSE(claims.at("video").contains("roomAdmin"));
}

TEST(AccessTokenTest, RejectsWrongSecretAndIssuer)
{
	const std::string token = createAccessToken(kKey, kSecret, AccessTokenOptions{}, kNow);

	EXPECT_THROW(verifyAccessToken(token, kKey, "other-secret", kNow), TokenVerificationError);
	EXPECT_THROW(verifyAccessToken(token, "APIother", kSecret, kNow), TokenVerificationError);
}

TEST(AccessTokenTest, RejectsExpiredAndFutureTokens)
{
	AccessTokenOptions options;
	options.ttl = std::chrono::seconds(60);
	const std::string token = createAccessToken(kKey, kSecret, options, kNow);

	EXPECT_NO_THROW(verifyAccessToken(token, kKey, kSecret, kNow + std::chrono::seconds(65)));
	EXPECT_THROW(verifyAccessToken(token, kKey, kSecret, kNow + std::chrono::seconds(120)), TokenVerificationError);
	EXPECT_THROW(verifyAccessToken(token, kKey, kSecret, kNow - std::chrono::seconds(60)), TokenVerificationError);
}

TEST(AccessTokenTest, RejectsMalformedTokens)
{
	EXPECT_THROW(verifyAccessToken("", kKey, kSecret, kNow), TokenVerificationError);
	EXPECT_THROW(verifyAccessToken("a.b", kKey, kSecret, kNow), TokenVerificationError);
	EXPECT_THROW(verifyAccessToken("a.b.c", kKey, kSecret, kNow), TokenVerificationError);

	const std::string token = createAccessToken(kKey, kSecret, AccessTokenOptions{}, kNow);
	std::string tampered = token;
	tampered[tampered.find('.') + 2] ^= 1;
	EXPECT_THROW(verifyAccessToken(tampered, kKey, kSecret, kNow), TokenVerificationError);
}

TEST(AccessTokenTest, RequiresCredentials)
{
	EXPECT_THROW(createAccessToken("", kSecret, AccessTokenOptions{}, kNow), std::invalid_argument);
}
