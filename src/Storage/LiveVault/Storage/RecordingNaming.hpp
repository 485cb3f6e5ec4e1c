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

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace LiveVault::Storage {

/// ISO 8601 UTC with milliseconds, e.g. "2025-03-04T05:06:07.089Z".
std::string formatIsoTimestamp(std::chrono::system_clock::time_point time);

/// formatIsoTimestamp with ':' and '.' replaced by '-', e.g. "2025-03-04T05-06-07-089Z".
std::string formatFileSafeTimestamp(std::chrono::system_clock::time_point time);

/// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z".
std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(std::string_view text);

/// "<streamKey>_<file safe timestamp><extension>". The extension includes its dot.
std::string makeRecordingFileName(std::string_view streamKey, std::chrono::system_clock::time_point time,
				  std::string_view extension);

/**
 * Text before the first '_'. A stream key that itself contains '_' cannot be
 * told apart from the timestamp separator and comes back truncated.
 */
std::string streamKeyFromFileName(std::string_view fileName);

/// False for empty names, "." and "..", and names containing separators or control characters.
bool isSafePathComponent(std::string_view name) noexcept;

} // namespace LiveVault::Storage
