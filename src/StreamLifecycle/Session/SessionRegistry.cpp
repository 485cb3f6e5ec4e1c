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

#include "SessionRegistry.hpp"

#include <stdexcept>
#include <utility>

#include <LiveVault/Logger/NullLogger.hpp>

namespace LiveVault::StreamLifecycle::Session {

SessionRegistry::SessionRegistry(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
}

SessionRegistry::~SessionRegistry() noexcept = default;

void SessionRegistry::registerSession(std::string streamKey, std::string transportSessionId)
{
	if (streamKey.empty()) {
		logger_->warn("StreamKeyIsEmptyError", {{"sessionId", transportSessionId}});
		throw std::invalid_argument("StreamKeyIsEmptyError(SessionRegistry::registerSession)");
	}

	std::string previous;
	{
		std::scoped_lock lock(mutex_);
		auto [it, inserted] = sessions_.try_emplace(streamKey, transportSessionId);
		if (!inserted) {
			previous = std::exchange(it->second, transportSessionId);
		}
	}

	if (previous.empty()) {
		logger_->info("SessionRegistered", {{"streamKey", streamKey}, {"sessionId", transportSessionId}});
	} else {
		logger_->warn("SessionSuperseded",
			      {{"streamKey", streamKey}, {"previousSessionId", previous}, {"sessionId", transportSessionId}});
	}
}

void SessionRegistry::unregisterSession(std::string_view streamKey)
{
	bool removed = false;
	{
		std::scoped_lock lock(mutex_);
		if (auto it = sessions_.find(std::string(streamKey)); it != sessions_.end()) {
			sessions_.erase(it);
			removed = true;
		}
	}

	if (removed) {
		logger_->info("SessionUnregistered", {{"streamKey", streamKey}});
	}
}

bool SessionRegistry::releaseSession(std::string_view streamKey, std::string_view transportSessionId)
{
	std::string holder;
	{
		std::scoped_lock lock(mutex_);
		auto it = sessions_.find(std::string(streamKey));
		if (it == sessions_.end())
			return true;
		if (it->second != transportSessionId) {
			holder = it->second;
		} else {
			sessions_.erase(it);
		}
	}

	if (!holder.empty()) {
		logger_->warn("SessionReleaseIgnored",
			      {{"streamKey", streamKey}, {"sessionId", transportSessionId}, {"currentSessionId", holder}});
		return false;
	}

	logger_->info("SessionUnregistered", {{"streamKey", streamKey}});
	return true;
}

bool SessionRegistry::contains(std::string_view streamKey) const
{
	std::scoped_lock lock(mutex_);
	return sessions_.find(std::string(streamKey)) != sessions_.end();
}

std::size_t SessionRegistry::size() const
{
	std::scoped_lock lock(mutex_);
	return sessions_.size();
}

} // namespace LiveVault::StreamLifecycle::Session
