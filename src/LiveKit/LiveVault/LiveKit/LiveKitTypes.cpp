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

#include "LiveKitTypes.hpp"

#include <charconv>
#include <initializer_list>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace LiveVault::LiveKit {

namespace {

// Protobuf JSON may use either the original field name or its lowerCamelCase form.
const nlohmann::json *findField(const nlohmann::json &j, std::initializer_list<const char *> names)
{
	if (!j.is_object())
		return nullptr;
	for (const char *name : names) {
		if (auto it = j.find(name); it != j.end() && !it->is_null()) {
			return &*it;
		}
	}
	return nullptr;
}

std::string stringField(const nlohmann::json &j, std::initializer_list<const char *> names)
{
	const nlohmann::json *value = findField(j, names);
	if (!value)
		return {};
	if (!value->is_string()) {
		throw std::invalid_argument("FieldIsNotStringError(LiveKitTypes):" + std::string(*names.begin()));
	}
	return value->get<std::string>();
}

// Enums arrive as names or numbers; an omitted enum is its zero value, AUDIO.
TrackType parseTrackType(const nlohmann::json *value)
{
	if (!value)
		return TrackType::Audio;

	if (value->is_number_integer()) {
		switch (value->get<int>()) {
		case 0:
			return TrackType::Audio;
		case 1:
			return TrackType::Video;
		case 2:
			return TrackType::Data;
		default:
			return TrackType::Unknown;
		}
	}

	if (value->is_string()) {
		const std::string name = value->get<std::string>();
		if (name == "AUDIO")
			return TrackType::Audio;
		if (name == "VIDEO")
			return TrackType::Video;
		if (name == "DATA")
			return TrackType::Data;
	}
	return TrackType::Unknown;
}

std::int64_t parseInt64(const nlohmann::json *value)
{
	if (!value)
		return 0;
	if (value->is_number_integer())
		return value->get<std::int64_t>();
	if (value->is_string()) {
		// int64 fields are strings in protobuf JSON.
		const std::string text = value->get<std::string>();
		std::int64_t result = 0;
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
		if (ec == std::errc() && ptr == text.data() + text.size())
			return result;
	}
	throw std::invalid_argument("Int64ParseError(LiveKitTypes)");
}

} // anonymous namespace

std::string_view toString(TrackType type) noexcept
{
	switch (type) {
	case TrackType::Audio:
		return "AUDIO";
	case TrackType::Video:
		return "VIDEO";
	case TrackType::Data:
		return "DATA";
	case TrackType::Unknown:
		break;
	}
	return "UNKNOWN";
}

void from_json(const nlohmann::json &j, TrackInfo &p)
{
	p.sid = stringField(j, {"sid"});
	p.type = parseTrackType(findField(j, {"type"}));
	p.name = stringField(j, {"name"});
	if (const nlohmann::json *source = findField(j, {"source"}); source && source->is_string()) {
		p.source = source->get<std::string>();
	}
}

void from_json(const nlohmann::json &j, ParticipantInfo &p)
{
	p.sid = stringField(j, {"sid"});
	p.identity = stringField(j, {"identity"});
	if (const nlohmann::json *kind = findField(j, {"kind"}); kind && kind->is_string()) {
		p.kind = kind->get<std::string>();
	}

	p.tracks.clear();
	if (const nlohmann::json *tracks = findField(j, {"tracks"}); tracks && tracks->is_array()) {
		for (const auto &track : *tracks) {
			p.tracks.push_back(track.get<TrackInfo>());
		}
	}
}

void from_json(const nlohmann::json &j, EgressInfo &p)
{
	p.egressId = stringField(j, {"egress_id", "egressId"});
	p.roomName = stringField(j, {"room_name", "roomName"});
	if (const nlohmann::json *status = findField(j, {"status"}); status && status->is_string()) {
		p.status = status->get<std::string>();
	}
}

void to_json(nlohmann::json &j, const TrackCompositeEgressRequest &p)
{
	j = nlohmann::json{{"room_name", p.roomName}, {"audio_track_id", p.audioTrackId}};
	if (!p.videoTrackId.empty()) {
		j["video_track_id"] = p.videoTrackId;
	}
	if (!p.streamUrls.empty()) {
		j["stream"] = {{"protocol", "RTMP"}, {"urls", p.streamUrls}};
	}
	if (p.filePath.has_value()) {
		j["file"] = {{"filepath", p.filePath.value()}};
	}
}

void from_json(const nlohmann::json &j, WebhookEvent &p)
{
	p.event = stringField(j, {"event"});
	if (p.event.empty()) {
		throw std::invalid_argument("EventIsEmptyError(WebhookEvent::from_json)");
	}
	p.id = stringField(j, {"id"});
	p.createdAt = parseInt64(findField(j, {"created_at", "createdAt"}));

	if (const nlohmann::json *room = findField(j, {"room"})) {
		p.roomName = stringField(*room, {"name"});
	}

	if (const nlohmann::json *ingress = findField(j, {"ingress_info", "ingressInfo"})) {
		if (p.roomName.empty()) {
			p.roomName = stringField(*ingress, {"room_name", "roomName"});
		}
		std::string ingressId = stringField(*ingress, {"ingress_id", "ingressId"});
		if (!ingressId.empty()) {
			p.ingressId = std::move(ingressId);
		}
	}

	if (const nlohmann::json *track = findField(j, {"track"})) {
		p.track = track->get<TrackInfo>();
	}
}

} // namespace LiveVault::LiveKit
