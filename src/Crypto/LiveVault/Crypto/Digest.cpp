/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * LiveVault Crypto Library
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

#include "Digest.hpp"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace LiveVault::Crypto {

std::string sha256(std::string_view data)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestLength = 0;
	if (EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
		throw std::runtime_error("DigestError(Crypto::sha256)");
	}
	return std::string(reinterpret_cast<const char *>(digest), digestLength);
}

std::string hmacSha256(std::string_view key, std::string_view data)
{
	unsigned char tag[EVP_MAX_MD_SIZE];
	unsigned int tagLength = 0;
	if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
		  reinterpret_cast<const unsigned char *>(data.data()), data.size(), tag, &tagLength)) {
		throw std::runtime_error("HmacError(Crypto::hmacSha256)");
	}
	return std::string(reinterpret_cast<const char *>(tag), tagLength);
}

std::string toHex(std::string_view bytes)
{
	static constexpr char digits[] = "0123456789abcdef";
	std::string out;
	out.reserve(bytes.size() * 2);
	for (unsigned char c : bytes) {
		out.push_back(digits[c >> 4]);
		out.push_back(digits[c & 0x0f]);
	}
	return out;
}

std::string base64Encode(std::string_view bytes)
{
	if (bytes.empty())
		return {};

	std::string out(4 * ((bytes.size() + 2) / 3), '\0');
	int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
				      reinterpret_cast<const unsigned char *>(bytes.data()), static_cast<int>(bytes.size()));
	if (written < 0) {
		throw std::runtime_error("EncodeError(Crypto::base64Encode)");
	}
	out.resize(static_cast<std::size_t>(written));
	return out;
}

std::string base64UrlEncode(std::string_view bytes)
{
	std::string out = base64Encode(bytes);
	while (!out.empty() && out.back() == '=')
		out.pop_back();
	for (char &c : out) {
		if (c == '+')
			c = '-';
		else if (c == '/')
			c = '_';
	}
	return out;
}

std::string base64Decode(std::string_view text)
{
	std::string normalized(text);
	for (char &c : normalized) {
		if (c == '-')
			c = '+';
		else if (c == '_')
			c = '/';
	}
	if (normalized.size() % 4 == 1) {
		throw std::invalid_argument("MalformedBase64Error(Crypto::base64Decode)");
	}
	while (normalized.size() % 4 != 0)
		normalized.push_back('=');

	if (normalized.empty())
		return {};

	std::string out(3 * normalized.size() / 4, '\0');
	int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
				      reinterpret_cast<const unsigned char *>(normalized.data()),
				      static_cast<int>(normalized.size()));
	if (decoded < 0) {
		throw std::invalid_argument("MalformedBase64Error(Crypto::base64Decode)");
	}

	// EVP_DecodeBlock counts padding bytes as zero output.
	std::size_t padding = 0;
	if (normalized.ends_with("=="))
		padding = 2;
	else if (normalized.ends_with('='))
		padding = 1;
	out.resize(static_cast<std::size_t>(decoded) - padding);
	return out;
}

bool constantTimeEquals(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;
	return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace LiveVault::Crypto
