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

#include "WebhookVerifier.hpp"

#include <nlohmann/json.hpp>

#include <LiveVault/Crypto/Digest.hpp>

namespace LiveVault::LiveKit {

WebhookVerifier::WebhookVerifier(std::string apiKey, std::string apiSecret)
	: apiKey_(std::move(apiKey)),
	  apiSecret_(std::move(apiSecret))
{
	if (apiKey_.empty() || apiSecret_.empty()) {
		throw std::invalid_argument("ApiCredentialsAreEmptyError(WebhookVerifier::WebhookVerifier)");
	}
}

void WebhookVerifier::verify(std::string_view body, std::string_view authorization,
			     std::chrono::system_clock::time_point now) const
{
	std::string_view token = authorization;
	if (token.starts_with("Bearer ")) {
		token.remove_prefix(7);
	}
	if (token.empty()) {
		throw TokenVerificationError("AuthorizationIsEmptyError(WebhookVerifier::verify)");
	}

	nlohmann::json claims = verifyAccessToken(token, apiKey_, apiSecret_, now);

	const auto digest = claims.find("sha256");
	if (digest == claims.end() || !digest->is_string()) {
		throw TokenVerificationError("BodyDigestMissingError(WebhookVerifier::verify)");
	}

	const std::string expected = Crypto::base64Encode(Crypto::sha256(body));
	if (!Crypto::constantTimeEquals(expected, digest->get<std::string>())) {
		throw TokenVerificationError("BodyDigestMismatchError(WebhookVerifier::verify)");
	}
}

WebhookEvent WebhookVerifier::parse(std::string_view body)
{
	try {
		return nlohmann::json::parse(body).get<WebhookEvent>();
	} catch (const nlohmann::json::exception &e) {
		throw WebhookPayloadError(std::string("MalformedWebhookError(WebhookVerifier::parse):") + e.what());
	} catch (const std::invalid_argument &e) {
		throw WebhookPayloadError(std::string("MalformedWebhookError(WebhookVerifier::parse):") + e.what());
	}
}

WebhookEvent WebhookVerifier::receive(std::string_view body, std::string_view authorization,
				      std::chrono::system_clock::time_point now) const
{
	verify(body, authorization, now);
	return parse(body);
}

} // namespace LiveVault::LiveKit
