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
#include <string>
#include <utility>
#include <vector>

#include "CurlHandle.hpp"

namespace LiveVault::CurlHelper {

class CurlUrlSearchParams {
public:
	explicit CurlUrlSearchParams(const CurlHandle &curl) : curl_(curl) {}

	~CurlUrlSearchParams() noexcept = default;

	CurlUrlSearchParams(const CurlUrlSearchParams &) = delete;
	CurlUrlSearchParams &operator=(const CurlUrlSearchParams &) = delete;

	void append(std::string name, std::string value) { params_.emplace_back(std::move(name), std::move(value)); }

	/// Orders parameters by name then value, as canonical signing strings require.
	void sort() { std::sort(params_.begin(), params_.end()); }

	bool empty() const noexcept { return params_.empty(); }

	std::string toString() const
	{
		std::string out;
		for (const auto &[key, value] : params_) {
			if (!out.empty())
				out += '&';
			out += curl_.escape(key);
			out += '=';
			out += curl_.escape(value);
		}
		return out;
	}

private:
	const CurlHandle &curl_;
	std::vector<std::pair<std::string, std::string>> params_;
};

} // namespace LiveVault::CurlHelper
