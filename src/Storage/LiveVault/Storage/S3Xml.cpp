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

#include "S3Xml.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "RecordingNaming.hpp"

namespace LiveVault::Storage {

namespace {

struct ElementRange {
	std::size_t contentBegin = 0;
	std::size_t contentEnd = 0;
	std::size_t end = 0;
};

std::optional<ElementRange> findElementRange(std::string_view xml, std::string_view tag, std::size_t from)
{
	const std::string open = fmt::format("<{}>", tag);
	const std::string close = fmt::format("</{}>", tag);

	std::size_t begin = xml.find(open, from);
	if (begin == std::string_view::npos)
		return std::nullopt;
	begin += open.size();

	std::size_t end = xml.find(close, begin);
	if (end == std::string_view::npos)
		return std::nullopt;

	return ElementRange{begin, end, end + close.size()};
}

} // anonymous namespace

std::string decodeXmlEntities(std::string_view text)
{
	static constexpr std::pair<std::string_view, char> entities[] = {
		{"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
	};

	std::string out;
	out.reserve(text.size());
	for (std::size_t i = 0; i < text.size();) {
		if (text[i] == '&') {
			bool matched = false;
			for (const auto &[entity, c] : entities) {
				if (text.substr(i, entity.size()) == entity) {
					out.push_back(c);
					i += entity.size();
					matched = true;
					break;
				}
			}
			if (matched)
				continue;
		}
		out.push_back(text[i]);
		++i;
	}
	return out;
}

std::optional<std::string> findXmlElement(std::string_view xml, std::string_view tag, std::size_t from)
{
	std::optional<ElementRange> range = findElementRange(xml, tag, from);
	if (!range)
		return std::nullopt;
	return decodeXmlEntities(xml.substr(range->contentBegin, range->contentEnd - range->contentBegin));
}

S3ListPage parseListObjectsV2(std::string_view xml)
{
	if (xml.find("<ListBucketResult") == std::string_view::npos) {
		throw std::runtime_error("UnexpectedListResponseError(parseListObjectsV2)");
	}

	S3ListPage page;
	page.isTruncated = findXmlElement(xml, "IsTruncated").value_or("false") == "true";
	if (page.isTruncated) {
		page.nextContinuationToken = findXmlElement(xml, "NextContinuationToken");
	}

	std::size_t from = 0;
	while (std::optional<ElementRange> range = findElementRange(xml, "Contents", from)) {
		std::string_view content = xml.substr(range->contentBegin, range->contentEnd - range->contentBegin);
		from = range->end;

		S3ObjectSummary summary;
		summary.key = findXmlElement(content, "Key").value_or("");
		if (summary.key.empty())
			continue;

		std::string size = findXmlElement(content, "Size").value_or("0");
		auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), summary.size);
		if (ec != std::errc()) {
			throw std::runtime_error("ObjectSizeParseError(parseListObjectsV2):" + summary.key);
		}

		if (std::optional<std::string> modified = findXmlElement(content, "LastModified")) {
			summary.lastModified = parseIsoTimestamp(*modified).value_or(std::chrono::system_clock::time_point{});
		}

		page.objects.push_back(std::move(summary));
	}

	return page;
}

std::optional<std::string> parseS3ErrorCode(std::string_view xml)
{
	std::optional<ElementRange> error = findElementRange(xml, "Error", 0);
	if (!error)
		return std::nullopt;
	return findXmlElement(xml.substr(error->contentBegin, error->contentEnd - error->contentBegin), "Code");
}

} // namespace LiveVault::Storage
