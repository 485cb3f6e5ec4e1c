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

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace LiveVault::LiveKit {

class TokenVerificationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct VideoGrant {
	std::optional<std::string> room;
	bool roomJoin = false;
	bool roomAdmin = false;
	bool roomCreate = false;
	bool roomList = false;
	bool roomRecord = false;
	bool ingressAdmin = false;
	std::optional<bool> canPublish;
	std::optional<bool> canSubscribe;
};

void to_json(nlohmann::json &j, const VideoGrant &p);

struct AccessTokenOptions {
	std::string identity;
	std::optional<std::string> name;
	std::chrono::seconds ttl{600};
	VideoGrant video;
	/// base64 SHA-256 of a request body, carried by webhook tokens.
	std::optional<std::string> sha256;
};

/// HS256 JWT issued by `apiKey` and signed with `apiSecret`.
std::string createAccessToken(std::string_view apiKey, std::string_view apiSecret, const AccessTokenOptions &options,
			      std::chrono::system_clock::time_point now);

/**
 * Checks the signature, the algorithm, the issuer and the validity window
 * (with `leeway` either side) and returns the claims.
 * @throws TokenVerificationError
 */
nlohmann::json verifyAccessToken(std::string_view token, std::string_view apiKey, std::string_view apiSecret,
				 std::chrono::system_clock::time_point now,
				 std::chrono::seconds leeway = std::chrono::seconds(10));

} // namespace LiveVault::LiveKit
