/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault CurlHelper Library
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
#include <cstddef>
#include <limits>
#include <map>
#include <new>
#include <string>
#include <string_view>

#include <curl/curl.h>

namespace LiveVault::CurlHelper {

/// Response header names are lower-cased. Later headers with the same name replace earlier ones.
using CurlHeaderMap = std::map<std::string, std::string>;

namespace Detail {

inline std::string_view trimHeaderValue(std::string_view value) noexcept
{
	while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
		value.remove_prefix(1);
	while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
		value.remove_suffix(1);
	return value;
}

} // namespace Detail

/// Collects "Name: value" lines into the CurlHeaderMap passed as CURLOPT_HEADERDATA.
inline std::size_t CurlHeaderMapCallback(char *buffer, std::size_t size, std::size_t nitems, void *userp) noexcept
{
	if (size != 0 && nitems > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nitems;
	std::string_view line(buffer, totalSize);

	std::size_t colon = line.find(':');
	if (colon == std::string_view::npos) {
		// Status line or the blank line ending the header block.
		return totalSize;
	}

	try {
		auto *headers = static_cast<CurlHeaderMap *>(userp);
		std::string name(line.substr(0, colon));
		std::transform(name.begin(), name.end(), name.begin(),
			       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		(*headers)[std::move(name)] = std::string(Detail::trimHeaderValue(line.substr(colon + 1)));
	} catch (const std::bad_alloc &) {
		return 0;
	}

	return totalSize;
}

} // namespace LiveVault::CurlHelper
