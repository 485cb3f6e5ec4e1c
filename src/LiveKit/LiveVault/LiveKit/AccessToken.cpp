/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault LiveKit Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "AccessToken.hpp"

#include <cstdint>
#include <vector>

#include <fmt/format.h>

#include <LiveVault/Crypto/Digest.hpp>

namespace LiveVault::LiveKit {

namespace {

std::int64_t toUnixSeconds(std::chrono::system_clock::time_point time)
{
	return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

std::vector<std::string_view> splitToken(std::string_view token)
{
	std::vector<std::string_view> parts;
	std::size_t begin = 0;
	while (true) {
		std::size_t dot = token.find('.', begin);
		parts.push_back(token.substr(begin, dot == std::string_view::npos ? std::string_view::npos : dot - begin));
		if (dot == std::string_view::npos)
			break;
		begin = dot + 1;
	}
	return parts;
}

nlohmann::json decodeJsonPart(std::string_view part, const char *what)
{
	try {
		nlohmann::json j = nlohmann::json::parse(Crypto::base64Decode(part));
		if (!j.is_object()) {
			throw TokenVerificationError(fmt::format("TokenPartIsNotObjectError(verifyAccessToken):{}", what));
		}
		return j;
	} catch (const std::invalid_argument &) {
		throw TokenVerificationError(fmt::format("TokenPartDecodeError(verifyAccessToken):{}", what));
	} catch (const nlohmann::json::exception &) {
		throw TokenVerificationError(fmt::format("TokenPartDecodeError(verifyAccessToken):{}", what));
	}
}

} // anonymous namespace

void to_json(nlohmann::json &j, const VideoGrant &p)
{
	j = nlohmann::json::object();
	if (p.room.has_value())
		j["room"] = p.room.value();
	if (p.roomJoin)
		j["roomJoin"] = true;
	if (p.roomAdmin)
		j["roomAdmin"] = true;
	if (p.roomCreate)
		j["roomCreate"] = true;
	if (p.roomList)
		j["roomList"] = true;
	if (p.roomRecord)
		j["roomRecord"] = true;
	if (p.ingressAdmin)
		j["ingressAdmin"] = true;
	if (p.canPublish.has_value())
		j["canPublish"] = p.canPublish.value();
	if (p.canSubscribe.has_value())
		j["canSubscribe"] = p.canSubscribe.value();
}

std::string createAccessToken(std::string_view apiKey, std::string_view apiSecret, const AccessTokenOptions &options,
			      std::chrono::system_clock::time_point now)
{
	if (apiKey.empty() || apiSecret.empty()) {
		throw std::invalid_argument("ApiCredentialsAreEmptyError(createAccessToken)");
	}

	const nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};

	nlohmann::json claims{
		{"iss", apiKey},
		{"nbf", toUnixSeconds(now)},
		{"exp", toUnixSeconds(now + options.ttl)},
		{"video", options.video},
	};
	if (!options.identity.empty()) {
		claims["sub"] = options.identity;
		claims["jti"] = options.identity;
	}
	if (options.name.has_value()) {
		claims["name"] = options.name.value();
	}
	if (options.sha256.has_value()) {
		claims["sha256"] = options.sha256.value();
	}

	const std::string signingInput =
		fmt::format("{}.{}", Crypto::base64UrlEncode(header.dump()), Crypto::base64UrlEncode(claims.dump()));
	return fmt::format("{}.{}", signingInput, Crypto::base64UrlEncode(Crypto::hmacSha256(apiSecret, signingInput)));
}

nlohmann::json verifyAccessToken(std::string_view token, std::string_view apiKey, std::string_view apiSecret,
				 std::chrono::system_clock::time_point now, std::chrono::seconds leeway)
{
	std::vector<std::string_view> parts = splitToken(token);
	if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
		throw TokenVerificationError("MalformedTokenError(verifyAccessToken)");
	}

	nlohmann::json header = decodeJsonPart(parts[0], "header");
	if (header.value("alg", "") != "HS256") {
		throw TokenVerificationError("UnsupportedAlgorithmError(verifyAccessToken)");
	}

	const std::string signingInput = fmt::format("{}.{}", parts[0], parts[1]);
	const std::string expected = Crypto::base64UrlEncode(Crypto::hmacSha256(apiSecret, signingInput));
	std::string_view actual = parts[2];
	while (!actual.empty() && actual.back() == '=')
		actual.remove_suffix(1);
	if (!Crypto::constantTimeEquals(expected, actual)) {
		throw TokenVerificationError("SignatureMismatchError(verifyAccessToken)");
	}

	nlohmann::json claims = decodeJsonPart(parts[1], "claims");

	const auto issuer = claims.find("iss");
	if (issuer == claims.end() || !issuer->is_string() || issuer->get<std::string>() != apiKey) {
		throw TokenVerificationError("IssuerMismatchError(verifyAccessToken)");
	}

	const std::int64_t nowSeconds = toUnixSeconds(now);
	const auto exp = claims.find("exp");
	if (exp == claims.end() || !exp->is_number_integer() ||
	    exp->get<std::int64_t>() + leeway.count() < nowSeconds) {
		throw TokenVerificationError("TokenExpiredError(verifyAccessToken)");
	}
	if (const auto nbf = claims.find("nbf"); nbf != claims.end()) {
		if (!nbf->is_number_integer() || nbf->get<std::int64_t>() - leeway.count() > nowSeconds) {
			throw TokenVerificationError("TokenNotYetValidError(verifyAccessToken)");
		}
	}

	return claims;
}

} // namespace LiveVault::LiveKit
