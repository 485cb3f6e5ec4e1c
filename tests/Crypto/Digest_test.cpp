/*
 * LiveVault - Crypto Library Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <LiveVault/Crypto/Digest.hpp>

using namespace LiveVault::Crypto;

TEST(DigestTest, Sha256KnownVector)
{
	EXPECT_EQ(toHex(sha256("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
	EXPECT_EQ(toHex(sha256("")), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(DigestTest, HmacSha256Rfc4231Case2)
{
	EXPECT_EQ(toHex(hmacSha256("Jefe", "what do ya want for nothing?")),
		  "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(DigestTest, Base64Variants)
{
	EXPECT_EQ(base64Encode("hello"), "aGVsbG8=");
	EXPECT_EQ(base64Encode(""), "");
	EXPECT_EQ(base64UrlEncode("\xfb\xff"), "-_8");
	EXPECT_EQ(base64Decode("aGVsbG8="), "hello");
	EXPECT_EQ(base64Decode("aGVsbG8"), "hello");
	EXPECT_EQ(base64Decode("-_8"), "\xfb\xff");
	EXPECT_THROW(base64Decode("a*b="), std::invalid_argument);
}

TEST(DigestTest, ConstantTimeEquals)
{
	EXPECT_TRUE(constantTimeEquals("abc", "abc"));
	EXPECT_FALSE(constantTimeEquals("abc", "abd"));
	EXPECT_FALSE(constantTimeEquals("abc", "abcd"));
}
