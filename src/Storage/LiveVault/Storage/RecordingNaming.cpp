/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault Storage Library
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

#include "RecordingNaming.hpp"

#include <charconv>
#include <ctime>
#include <stdexcept>

#include <fmt/format.h>

namespace LiveVault::Storage {

namespace {

bool parseDigits(std::string_view text, std::size_t pos, std::size_t count, int &out) noexcept
{
	if (pos + count > text.size())
		return false;
	const char *first = text.data() + pos;
	const char *last = first + count;
	auto [ptr, ec] = std::from_chars(first, last, out);
	return ec == std::errc() && ptr == last;
}

} // anonymous namespace

std::string formatIsoTimestamp(std::chrono::system_clock::time_point time)
{
	using namespace std::chrono;

	const auto millis = duration_cast<milliseconds>(time.time_since_epoch());
	auto seconds = duration_cast<std::chrono::seconds>(millis);
	auto fraction = millis - seconds;
	if (fraction.count() < 0) {
		fraction += std::chrono::seconds(1);
		seconds -= std::chrono::seconds(1);
	}

	std::time_t tt = static_cast<std::time_t>(seconds.count());
	std::tm tm{};
	if (!gmtime_r(&tt, &tm)) {
		throw std::runtime_error("TimeConversionError(formatIsoTimestamp)");
	}

	return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
			   tm.tm_hour, tm.tm_min, tm.tm_sec, fraction.count());
}

std::string formatFileSafeTimestamp(std::chrono::system_clock::time_point time)
{
	std::string text = formatIsoTimestamp(time);
	for (char &c : text) {
		if (c == ':' || c == '.')
			c = '-';
	}
	return text;
}

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(std::string_view text)
{
	// 0123456789012345678
	// YYYY-MM-DDTHH:MM:SS
	if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
	    text[16] != ':' || text.back() != 'Z') {
		return std::nullopt;
	}

	std::tm tm{};
	int year = 0;
	int month = 0;
	if (!parseDigits(text, 0, 4, year) || !parseDigits(text, 5, 2, month) || !parseDigits(text, 8, 2, tm.tm_mday) ||
	    !parseDigits(text, 11, 2, tm.tm_hour) || !parseDigits(text, 14, 2, tm.tm_min) ||
	    !parseDigits(text, 17, 2, tm.tm_sec)) {
		return std::nullopt;
	}
	tm.tm_year = year - 1900;
	tm.tm_mon = month - 1;

	int millis = 0;
	std::string_view rest = text.substr(19, text.size() - 20);
	if (!rest.empty()) {
		if (rest.front() != '.' || rest.size() < 2)
			return std::nullopt;
		std::string_view digits = rest.substr(1, 3);
		if (!parseDigits(digits, 0, digits.size(), millis))
			return std::nullopt;
		for (std::size_t i = digits.size(); i < 3; ++i)
			millis *= 10;
	}

	std::time_t tt = timegm(&tm);
	if (tt == static_cast<std::time_t>(-1))
		return std::nullopt;

	return std::chrono::system_clock::from_time_t(tt) + std::chrono::milliseconds(millis);
}

std::string makeRecordingFileName(std::string_view streamKey, std::chrono::system_clock::time_point time,
				  std::string_view extension)
{
	return fmt::format("{}_{}{}", streamKey, formatFileSafeTimestamp(time), extension);
}

std::string streamKeyFromFileName(std::string_view fileName)
{
	return std::string(fileName.substr(0, fileName.find('_')));
}

bool isSafePathComponent(std::string_view name) noexcept
{
	if (name.empty() || name == "." || name == "..")
		return false;
	for (unsigned char c : name) {
		if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f)
			return false;
	}
	return true;
}

} // namespace LiveVault::Storage
