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
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <LiveVault/CurlHelper/CurlHandle.hpp>
#include <LiveVault/Logger/ILogger.hpp>

#include "AccessToken.hpp"
#include "ILiveKitApi.hpp"

namespace LiveVault::LiveKit {

struct LiveKitApiOptions {
	/// http(s) or ws(s) URL of the server; ws schemes are mapped to http.
	std::string apiUrl;
	std::string apiKey;
	std::string apiSecret;
	std::chrono::seconds tokenTtl{600};
	std::chrono::seconds connectTimeout{10};
	std::chrono::seconds requestTimeout{30};
};

/// Twirp JSON client for the RoomService and Egress services.
class LiveKitApiClient final : public ILiveKitApi {
public:
	LiveKitApiClient(LiveKitApiOptions options, std::shared_ptr<CurlHelper::CurlHandle> curl,
			 std::shared_ptr<const Logger::ILogger> logger);
	~LiveKitApiClient() noexcept override;

	LiveKitApiClient(const LiveKitApiClient &) = delete;
	LiveKitApiClient &operator=(const LiveKitApiClient &) = delete;

	std::vector<ParticipantInfo> listParticipants(const std::string &roomName) override;

	EgressInfo startTrackCompositeEgress(const TrackCompositeEgressRequest &request) override;

	EgressInfo stopEgress(const std::string &egressId) override;

	const std::string &baseUrl() const noexcept { return baseUrl_; }

private:
	nlohmann::json callTwirp(std::string_view service, std::string_view method, const nlohmann::json &body,
				 const VideoGrant &grant);

	const LiveKitApiOptions options_;
	const std::string baseUrl_;
	const std::shared_ptr<CurlHelper::CurlHandle> curl_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	// One easy handle, one transfer at a time.
	std::mutex curlMutex_;
};

/// Maps ws:// and wss:// to http:// and https:// and drops trailing slashes.
std::string toHttpBaseUrl(std::string_view url);

} // namespace LiveVault::LiveKit
