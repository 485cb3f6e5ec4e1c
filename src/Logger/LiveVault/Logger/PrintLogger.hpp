/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault Logger Library
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

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include "ILogger.hpp"

namespace LiveVault::Logger {

/**
 * Accepts "debug", "info", "warn"/"warning" and "error" in any case.
 * Returns std::nullopt for anything else so callers can decide on a fallback.
 */
inline std::optional<LogLevel> parseLogLevel(std::string_view text)
{
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lowered == "debug")
		return LogLevel::Debug;
	if (lowered == "info")
		return LogLevel::Info;
	if (lowered == "warn" || lowered == "warning")
		return LogLevel::Warn;
	if (lowered == "error")
		return LogLevel::Error;
	return std::nullopt;
}

class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info) noexcept : minLevel_(minLevel) {}
	~PrintLogger() override = default;

	LogLevel minLevel() const noexcept { return minLevel_; }

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level < minLevel_)
			return;

		std::ostream &os = level >= LogLevel::Warn ? std::clog : std::cout;

		std::scoped_lock lock(mutex_);
		switch (level) {
		case LogLevel::Debug:
			os << "level=DEBUG";
			break;
		case LogLevel::Info:
			os << "level=INFO";
			break;
		case LogLevel::Warn:
			os << "level=WARN";
			break;
		case LogLevel::Error:
			os << "level=ERROR";
			break;
		default:
			os << "level=UNKNOWN";
			break;
		}

		os << "\tname=" << name << "\tlocation=" << loc.file_name() << ":" << loc.line();
		for (const auto &field : context) {
			os << "\t" << field.key << "=" << field.value;
		}
		os << std::endl;
	}

private:
	const LogLevel minLevel_;
	mutable std::mutex mutex_;
};

} // namespace LiveVault::Logger
