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
#include <stdexcept>
#include <string>
#include <string_view>

#include "AccessToken.hpp"
#include "LiveKitTypes.hpp"

namespace LiveVault::LiveKit {

class WebhookPayloadError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Authenticates webhook deliveries. The Authorization header carries an
 * access token signed with the API secret whose "sha256" claim is the
 * base64 SHA-256 of the exact request body.
 */
class WebhookVerifier {
public:
	WebhookVerifier(std::string apiKey, std::string apiSecret);

	/// @throws TokenVerificationError
	void verify(std::string_view body, std::string_view authorization,
		    std::chrono::system_clock::time_point now) const;

	/// @throws WebhookPayloadError
	static WebhookEvent parse(std::string_view body);

	/// verify followed by parse.
	WebhookEvent receive(std::string_view body, std::string_view authorization,
			     std::chrono::system_clock::time_point now) const;

private:
	std::string apiKey_;
	std::string apiSecret_;
};

} // namespace LiveVault::LiveKit
