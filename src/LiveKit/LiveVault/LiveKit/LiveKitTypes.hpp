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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace LiveVault::LiveKit {

enum class TrackType { Audio, Video, Data, Unknown };

std::string_view toString(TrackType type) noexcept;

struct TrackInfo {
	std::string sid;
	TrackType type = TrackType::Audio;
	std::string name;
	std::string source;
};

void from_json(const nlohmann::json &j, TrackInfo &p);

struct ParticipantInfo {
	std::string sid;
	std::string identity;
	std::string kind;
	std::vector<TrackInfo> tracks;
};

void from_json(const nlohmann::json &j, ParticipantInfo &p);

struct EgressInfo {
	std::string egressId;
	std::string roomName;
	std::string status;
};

void from_json(const nlohmann::json &j, EgressInfo &p);

struct TrackCompositeEgressRequest {
	std::string roomName;
	std::string audioTrackId;
	std::string videoTrackId;
	/// RTMP destinations. When empty, `filePath` must be set.
	std::vector<std::string> streamUrls;
	std::optional<std::string> filePath;
};

void to_json(nlohmann::json &j, const TrackCompositeEgressRequest &p);

struct WebhookEvent {
	std::string id;
	std::string event;
	/// Room the event concerns, taken from the room or the ingress info.
	std::string roomName;
	std::optional<TrackInfo> track;
	std::optional<std::string> ingressId;
	std::int64_t createdAt = 0;
};

void from_json(const nlohmann::json &j, WebhookEvent &p);

} // namespace LiveVault::LiveKit
