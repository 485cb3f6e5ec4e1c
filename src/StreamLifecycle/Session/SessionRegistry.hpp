/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: GPL-3.0-or-later
 *
 * LiveVault - Session Module
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

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <LiveVault/Logger/ILogger.hpp>

namespace LiveVault::StreamLifecycle::Session {

/**
 * Stream keys currently being published, each mapped to the transport session
 * publishing it. A newer publish under the same key replaces the older one.
 */
class SessionRegistry {
public:
	explicit SessionRegistry(std::shared_ptr<const Logger::ILogger> logger = nullptr);
	~SessionRegistry() noexcept;

	SessionRegistry(const SessionRegistry &) = delete;
	SessionRegistry &operator=(const SessionRegistry &) = delete;

	/// @throws std::invalid_argument if streamKey is empty.
	void registerSession(std::string streamKey, std::string transportSessionId);

	/// Absent keys are ignored.
	void unregisterSession(std::string_view streamKey);

	/**
	 * Unregisters streamKey unless a different transport session now holds it.
	 * Returns false, leaving the newer session registered, when the key was superseded.
	 */
	[[nodiscard]] bool releaseSession(std::string_view streamKey, std::string_view transportSessionId);

	[[nodiscard]] bool contains(std::string_view streamKey) const;

	[[nodiscard]] std::size_t size() const;

private:
	const std::shared_ptr<const Logger::ILogger> logger_;

	mutable std::mutex mutex_;
	std::unordered_map<std::string, std::string> sessions_;
};

} // namespace LiveVault::StreamLifecycle::Session
