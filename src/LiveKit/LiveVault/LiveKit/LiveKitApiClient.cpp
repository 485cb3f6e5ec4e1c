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

#include "LiveKitApiClient.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <LiveVault/CurlHelper/CurlSlistHandle.hpp>
#include <LiveVault/CurlHelper/CurlWriteCallback.hpp>
#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::LiveKit {

namespace {

std::string doPost(CURL *curl, const std::string &url, const std::string &body, curl_slist *headers,
		   const LiveKitApiOptions &options, const Logger::ILogger &logger, long &status)
{
	if (!curl) {
		logger.error("CurlIsNullError");
		throw std::invalid_argument("CurlIsNullError(LiveKitApiClient::doPost)");
	}

	std::string readBuffer;

	curl_easy_reset(curl);

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connectTimeout.count()));
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.requestTimeout.count()));
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger.error("CurlPerformError", {{"url", url}, {"error", curl_easy_strerror(res)}});
		throw std::runtime_error(fmt::format("CurlPerformError(LiveKitApiClient::doPost):{}", curl_easy_strerror(res)));
	}

	if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
		status = 0;
	}
	return readBuffer;
}

} // anonymous namespace

std::string toHttpBaseUrl(std::string_view url)
{
	std::string result;
	if (url.starts_with("wss://")) {
		result = fmt::format("https://{}", url.substr(6));
	} else if (url.starts_with("ws://")) {
		result = fmt::format("http://{}", url.substr(5));
	} else {
		result = std::string(url);
	}
	while (!result.empty() && result.back() == '/')
		result.pop_back();
	return result;
}

LiveKitApiClient::LiveKitApiClient(LiveKitApiOptions options, std::shared_ptr<CurlHelper::CurlHandle> curl,
				   std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  baseUrl_(toHttpBaseUrl(options_.apiUrl)),
	  curl_(std::move(curl)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (!curl_) {
		logger_->error("CurlIsNullError");
		throw std::invalid_argument("CurlIsNullError(LiveKitApiClient::LiveKitApiClient)");
	}
	if (baseUrl_.empty()) {
		logger_->error("ApiUrlIsEmptyError");
		throw std::invalid_argument("ApiUrlIsEmptyError(LiveKitApiClient::LiveKitApiClient)");
	}
	if (options_.apiKey.empty() || options_.apiSecret.empty()) {
		logger_->error("ApiCredentialsAreEmptyError");
		throw std::invalid_argument("ApiCredentialsAreEmptyError(LiveKitApiClient::LiveKitApiClient)");
	}
}

LiveKitApiClient::~LiveKitApiClient() noexcept = default;

std::vector<ParticipantInfo> LiveKitApiClient::listParticipants(const std::string &roomName)
{
	if (roomName.empty()) {
		logger_->error("RoomNameIsEmptyError");
		throw std::invalid_argument("RoomNameIsEmptyError(LiveKitApiClient::listParticipants)");
	}

	VideoGrant grant;
	grant.room = roomName;
	grant.roomAdmin = true;

	nlohmann::json response = callTwirp("RoomService", "ListParticipants", {{"room", roomName}}, grant);

	std::vector<ParticipantInfo> participants;
	if (auto it = response.find("participants"); it != response.end() && it->is_array()) {
		for (const auto &participant : *it) {
			participants.push_back(participant.get<ParticipantInfo>());
		}
	}
	return participants;
}

EgressInfo LiveKitApiClient::startTrackCompositeEgress(const TrackCompositeEgressRequest &request)
{
	if (request.roomName.empty()) {
		logger_->error("RoomNameIsEmptyError");
		throw std::invalid_argument("RoomNameIsEmptyError(LiveKitApiClient::startTrackCompositeEgress)");
	}
	if (request.streamUrls.empty() && !request.filePath.has_value()) {
		logger_->error("EgressOutputIsEmptyError");
		throw std::invalid_argument("EgressOutputIsEmptyError(LiveKitApiClient::startTrackCompositeEgress)");
	}

	VideoGrant grant;
	grant.room = request.roomName;
	grant.roomRecord = true;

	EgressInfo info = callTwirp("Egress", "StartTrackCompositeEgress", request, grant).get<EgressInfo>();
	if (info.egressId.empty()) {
		logger_->error("EgressIdIsEmptyError", {{"room", request.roomName}});
		throw std::runtime_error("EgressIdIsEmptyError(LiveKitApiClient::startTrackCompositeEgress)");
	}
	return info;
}

EgressInfo LiveKitApiClient::stopEgress(const std::string &egressId)
{
	if (egressId.empty()) {
		logger_->error("EgressIdIsEmptyError");
		throw std::invalid_argument("EgressIdIsEmptyError(LiveKitApiClient::stopEgress)");
	}

	VideoGrant grant;
	grant.roomRecord = true;

	return callTwirp("Egress", "StopEgress", {{"egress_id", egressId}}, grant).get<EgressInfo>();
}

nlohmann::json LiveKitApiClient::callTwirp(std::string_view service, std::string_view method,
					   const nlohmann::json &body, const VideoGrant &grant)
{
	AccessTokenOptions tokenOptions;
	tokenOptions.ttl = options_.tokenTtl;
	tokenOptions.video = grant;
	const std::string token =
		createAccessToken(options_.apiKey, options_.apiSecret, tokenOptions, std::chrono::system_clock::now());

	CurlHelper::CurlSlistHandle headers;
	headers.append(fmt::format("Authorization: Bearer {}", token));
	headers.append("Content-Type: application/json");

	const std::string url = fmt::format("{}/twirp/livekit.{}/{}", baseUrl_, service, method);
	const std::string payload = body.dump();

	long status = 0;
	std::string responseBody;
	{
		std::scoped_lock lock(curlMutex_);
		responseBody = doPost(curl_->get(), url, payload, headers.get(), options_, *logger_, status);
	}

	nlohmann::json j = nlohmann::json::parse(responseBody, nullptr, false);
	if (status != 200) {
		std::string code = "unknown";
		std::string message;
		if (j.is_object()) {
			code = j.value("code", code);
			message = j.value("msg", message);
		}
		logger_->error("LiveKitApiError", {{"method", method},
						   {"status", std::to_string(status)},
						   {"code", code},
						   {"message", message}});
		throw std::runtime_error(fmt::format("LiveKitApiError(LiveKitApiClient::callTwirp):{}:{}", method, code));
	}
	if (j.is_discarded() || !j.is_object()) {
		logger_->error("LiveKitResponseParseError", {{"method", method}});
		throw std::runtime_error(fmt::format("ResponseParseError(LiveKitApiClient::callTwirp):{}", method));
	}

	logger_->debug("LiveKitApiCalled", {{"method", method}});
	return j;
}

} // namespace LiveVault::LiveKit
