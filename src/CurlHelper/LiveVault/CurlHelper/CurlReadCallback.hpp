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

#include <cstddef>
#include <fstream>
#include <ios>
#include <limits>

#include <curl/curl.h>

namespace LiveVault::CurlHelper {

/// Streams an upload body from the std::ifstream passed as CURLOPT_READDATA.
inline std::size_t CurlIfstreamReadCallback(char *buffer, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_READFUNC_ABORT;
	}

	std::size_t totalSize = size * nmemb;

	if (totalSize > static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max())) {
		return CURL_READFUNC_ABORT;
	}

	if (totalSize == 0)
		return 0;

	auto *stream = static_cast<std::ifstream *>(userp);
	if (!stream || !stream->is_open()) {
		return CURL_READFUNC_ABORT;
	}
	if (stream->eof()) {
		return 0;
	}

	stream->read(buffer, static_cast<std::streamsize>(totalSize));
	if (stream->bad()) {
		return CURL_READFUNC_ABORT;
	}
	return static_cast<std::size_t>(stream->gcount());
}

} // namespace LiveVault::CurlHelper
