/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Config Module
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "RecorderConfig.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <LiveVault/Logger/PrintLogger.hpp>

namespace LiveVault::StreamLifecycle::Config {

namespace {

template<typename T> void readIfPresent(const nlohmann::json &j, const char *key, T &out)
{
	auto it = j.find(key);
	if (it != j.end() && !it->is_null()) {
		out = it->get<T>();
	}
}

void readOptional(const nlohmann::json &j, const char *key, std::optional<std::string> &out)
{
	auto it = j.find(key);
	if (it != j.end() && !it->is_null()) {
		std::string value = it->get<std::string>();
		out = value.empty() ? std::nullopt : std::optional<std::string>(std::move(value));
	}
}

void readPath(const nlohmann::json &j, const char *key, std::filesystem::path &out)
{
	auto it = j.find(key);
	if (it != j.end() && !it->is_null()) {
		out = it->get<std::string>();
	}
}

void readLocal(const nlohmann::json &j, Storage::LocalStorageOptions &local)
{
	readPath(j, "recordingsPath", local.recordingsPath);
	readPath(j, "tempPath", local.tempPath);
	readIfPresent(j, "publicBaseUrl", local.publicBaseUrl);
	readIfPresent(j, "capacityBytes", local.capacityBytes);
}

void readRemote(const nlohmann::json &j, Storage::StorageSettings &storage)
{
	readIfPresent(j, "bucket", storage.remote.bucket);
	readIfPresent(j, "prefix", storage.remote.prefix);
	readOptional(j, "cdnDomain", storage.remote.cdnDomain);
	readIfPresent(j, "storageClass", storage.remote.storageClass);

	readIfPresent(j, "region", storage.remoteClient.region);
	readIfPresent(j, "endpoint", storage.remoteClient.endpoint);
	readIfPresent(j, "forcePathStyle", storage.remoteClient.forcePathStyle);
	readIfPresent(j, "accessKeyId", storage.remoteClient.credentials.accessKeyId);
	readIfPresent(j, "secretAccessKey", storage.remoteClient.credentials.secretAccessKey);
	readOptional(j, "sessionToken", storage.remoteClient.credentials.sessionToken);
}

void readLiveKit(const nlohmann::json &j, LiveKitSettings &liveKit)
{
	readIfPresent(j, "apiUrl", liveKit.apiUrl);
	readIfPresent(j, "apiKey", liveKit.apiKey);
	readIfPresent(j, "apiSecret", liveKit.apiSecret);
	readIfPresent(j, "egressStreamUrls", liveKit.egressStreamUrls);
	readOptional(j, "egressFilePath", liveKit.egressFilePath);
	readIfPresent(j, "participantMaxAttempts", liveKit.participantMaxAttempts);

	if (auto it = j.find("participantRetryDelayMs"); it != j.end() && !it->is_null()) {
		liveKit.participantRetryDelay = std::chrono::milliseconds(it->get<std::int64_t>());
	}
}

} // namespace

std::optional<std::string> systemEnvironment(const char *name)
{
	const char *value = std::getenv(name);
	if (value == nullptr) {
		return std::nullopt;
	}
	return std::string(value);
}

RecorderConfig RecorderConfig::fromJson(const nlohmann::json &j, const Logger::ILogger &logger)
{
	RecorderConfig config;
	if (!j.is_object()) {
		logger.error("ConfigIsNotObjectError");
		throw std::invalid_argument("ConfigIsNotObjectError(RecorderConfig::fromJson)");
	}

	try {
		if (auto it = j.find("logLevel"); it != j.end() && !it->is_null()) {
			const std::string text = it->get<std::string>();
			if (auto level = Logger::parseLogLevel(text)) {
				config.logLevel = *level;
			} else {
				logger.warn("UnknownLogLevel", {{"logLevel", text}});
			}
		}

		if (auto it = j.find("storage"); it != j.end() && it->is_object()) {
			readIfPresent(*it, "backend", config.storage.backend);
			if (auto local = it->find("local"); local != it->end() && local->is_object()) {
				readLocal(*local, config.storage.local);
			}
			if (auto remote = it->find("remote"); remote != it->end() && remote->is_object()) {
				readRemote(*remote, config.storage);
			}
		}

		if (auto it = j.find("cleanupMaxAgeHours"); it != j.end() && !it->is_null()) {
			config.cleanupMaxAge = std::chrono::hours(it->get<std::int64_t>());
		}
		if (auto it = j.find("defaultUrlExpirySeconds"); it != j.end() && !it->is_null()) {
			config.storage.remote.defaultUrlExpiry = std::chrono::seconds(it->get<std::int64_t>());
		}

		if (auto it = j.find("liveKit"); it != j.end() && it->is_object()) {
			readLiveKit(*it, config.liveKit);
		}
	} catch (const nlohmann::json::exception &e) {
		logger.error("ConfigValueTypeError", {{"exception", e.what()}});
		throw std::invalid_argument("ConfigValueTypeError(RecorderConfig::fromJson)");
	}

	config.storage.remoteClient.bucket = config.storage.remote.bucket;
	return config;
}

void RecorderConfig::applyEnvironment(const EnvironmentLookup &environment, const Logger::ILogger &logger)
{
	auto env = [&environment](const char *name) -> std::optional<std::string> {
		std::optional<std::string> value = environment(name);
		if (value && value->empty()) {
			return std::nullopt;
		}
		return value;
	};

	if (auto value = env("LOG_LEVEL")) {
		if (auto level = Logger::parseLogLevel(*value)) {
			logLevel = *level;
		} else {
			logger.warn("UnknownLogLevel", {{"logLevel", *value}});
		}
	}

	if (auto value = env("STORAGE_TYPE")) {
		storage.backend = *value;
	}
	if (auto value = env("LOCAL_RECORDINGS_PATH")) {
		storage.local.recordingsPath = *value;
	}
	if (auto value = env("LOCAL_TEMP_PATH")) {
		storage.local.tempPath = *value;
	}
	if (auto value = env("HTTP_PORT")) {
		storage.local.publicBaseUrl = fmt::format("http://localhost:{}/recordings", *value);
	}

	if (auto value = env("AWS_ACCESS_KEY_ID")) {
		storage.remoteClient.credentials.accessKeyId = *value;
	}
	if (auto value = env("AWS_SECRET_ACCESS_KEY")) {
		storage.remoteClient.credentials.secretAccessKey = *value;
	}
	if (auto value = env("AWS_SESSION_TOKEN")) {
		storage.remoteClient.credentials.sessionToken = *value;
	}
	if (auto value = env("AWS_REGION")) {
		storage.remoteClient.region = *value;
	}
	if (auto value = env("S3_BUCKET_NAME")) {
		storage.remote.bucket = *value;
	}
	if (auto value = env("S3_RECORDINGS_PREFIX")) {
		storage.remote.prefix = *value;
	}
	if (auto value = env("S3_ENDPOINT")) {
		storage.remoteClient.endpoint = *value;
		storage.remoteClient.forcePathStyle = true;
	}
	if (auto value = env("CLOUDFRONT_DOMAIN")) {
		storage.remote.cdnDomain = *value;
	}

	if (auto value = env("LIVEKIT_API_URL")) {
		liveKit.apiUrl = *value;
	}
	if (auto value = env("LIVEKIT_API_KEY")) {
		liveKit.apiKey = *value;
	}
	if (auto value = env("LIVEKIT_API_SECRET")) {
		liveKit.apiSecret = *value;
	}

	storage.remoteClient.bucket = storage.remote.bucket;
}

RecorderConfig RecorderConfig::load(const std::filesystem::path &path, const Logger::ILogger &logger,
				    const EnvironmentLookup &environment)
{
	RecorderConfig config;

	std::error_code ec;
	if (path.empty() || !std::filesystem::exists(path, ec)) {
		logger.info("ConfigFileNotFound", {{"path", path.string()}});
	} else {
		std::ifstream ifs(path);
		if (!ifs) {
			logger.error("ConfigFileOpenError", {{"path", path.string()}});
			throw std::runtime_error("ConfigFileOpenError(RecorderConfig::load)");
		}

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(ifs);
		} catch (const nlohmann::json::parse_error &e) {
			logger.error("ConfigFileParseError", {{"path", path.string()}, {"exception", e.what()}});
			throw std::runtime_error("ConfigFileParseError(RecorderConfig::load)");
		}

		config = fromJson(j, logger);
		logger.info("ConfigFileLoaded", {{"path", path.string()}});
	}

	if (environment) {
		config.applyEnvironment(environment, logger);
	}
	return config;
}

} // namespace LiveVault::StreamLifecycle::Config
