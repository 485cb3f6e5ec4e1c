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

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <LiveVault/Logger/ILogger.hpp>
#include <LiveVault/Storage/StorageFactory.hpp>

namespace LiveVault::StreamLifecycle::Config {

/// Returns the value of an environment variable, or nullopt when it is unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const char *name)>;

std::optional<std::string> systemEnvironment(const char *name);

struct LiveKitSettings {
	std::string apiUrl;
	std::string apiKey;
	std::string apiSecret;
	std::vector<std::string> egressStreamUrls;
	std::optional<std::string> egressFilePath;
	int participantMaxAttempts = 2;
	std::chrono::milliseconds participantRetryDelay{2000};

	/// Egress orchestration runs only with a server, credentials and an output.
	[[nodiscard]] bool enabled() const noexcept
	{
		return !apiUrl.empty() && !apiKey.empty() && !apiSecret.empty() &&
		       (!egressStreamUrls.empty() || egressFilePath.has_value());
	}
};

struct RecorderConfig {
	Logger::LogLevel logLevel = Logger::LogLevel::Info;
	Storage::StorageSettings storage;
	std::chrono::hours cleanupMaxAge{168};
	LiveKitSettings liveKit;

	/**
	 * Reads the JSON file at `path`, then applies environment overrides.
	 * A missing file yields the defaults.
	 *
	 * @throws std::runtime_error if the file exists but cannot be parsed.
	 */
	static RecorderConfig load(const std::filesystem::path &path, const Logger::ILogger &logger,
				   const EnvironmentLookup &environment = systemEnvironment);

	/// @throws std::invalid_argument on a value of the wrong type.
	static RecorderConfig fromJson(const nlohmann::json &j, const Logger::ILogger &logger);

	void applyEnvironment(const EnvironmentLookup &environment, const Logger::ILogger &logger);
};

} // namespace LiveVault::StreamLifecycle::Config
