#include "libmxoracle/impl/Utils.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace libmxoracle::_impl;

// Test valid port numbers
TEST(ParsePortTest, ValidPortNumbers) {
	EXPECT_EQ(parse_port("80"), 80);
	EXPECT_EQ(parse_port("443"), 443);
	EXPECT_EQ(parse_port("8448"), 8448);  // Matrix federation default
	EXPECT_EQ(parse_port("8008"), 8008);

	EXPECT_EQ(parse_port("0"), 0);
	EXPECT_EQ(parse_port("65535"), 65535);
}

TEST(ParsePortTest, InvalidInputs) {
	EXPECT_EQ(parse_port(""), std::nullopt);

	EXPECT_EQ(parse_port("abc"), std::nullopt);
	EXPECT_EQ(parse_port("port"), std::nullopt);

	EXPECT_EQ(parse_port("-80"), std::nullopt);
	EXPECT_EQ(parse_port("+80"), std::nullopt);
	EXPECT_EQ(parse_port(" 80"), std::nullopt);
}

TEST(ParsePortTest, OutOfRange) {
	EXPECT_EQ(parse_port("65536"), std::nullopt);
	EXPECT_EQ(parse_port("99999"), std::nullopt);
	EXPECT_EQ(parse_port("4294967295"), std::nullopt);
}

// Unlike a plain from_chars, trailing garbage makes the whole port invalid
TEST(ParsePortTest, NoPartialParsing) {
	EXPECT_EQ(parse_port("80abc"), std::nullopt);
	EXPECT_EQ(parse_port("443.5"), std::nullopt);
	EXPECT_EQ(parse_port("8448 "), std::nullopt);
	EXPECT_EQ(parse_port("8a0"), std::nullopt);
}

TEST(ParsePortTest, LeadingZeros) {
	EXPECT_EQ(parse_port("0080"), 80);
	EXPECT_EQ(parse_port("000000000008448"), 8448);
}

TEST(SplitPortTest, HostWithPort) {
	const auto result = split_port("example.org:8448");

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->first, "example.org");
	EXPECT_EQ(result->second, 8448);
}

TEST(SplitPortTest, SubstringOfLargerString) {
	std::string full = "matrix.example.org:443 trailing";
	const auto result = split_port(std::string_view{full}.substr(0, 22));

	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->first, "matrix.example.org");
	EXPECT_EQ(result->second, 443);
}

TEST(SplitPortTest, Rejected) {
	EXPECT_EQ(split_port("example.org"), std::nullopt);
	EXPECT_EQ(split_port("example.org:"), std::nullopt);
	EXPECT_EQ(split_port("example.org:http"), std::nullopt);
	EXPECT_EQ(split_port("example.org:70000"), std::nullopt);
	EXPECT_EQ(split_port("a:1:2"), std::nullopt);
	EXPECT_EQ(split_port("::1"), std::nullopt);
	EXPECT_EQ(split_port("2001:db8::1"), std::nullopt);
}

TEST(TrimTrailingDotTest, Trims) {
	EXPECT_EQ(trim_trailing_dot("example.org."), "example.org");
	EXPECT_EQ(trim_trailing_dot("example.org"), "example.org");
	EXPECT_EQ(trim_trailing_dot("."), "");
	EXPECT_EQ(trim_trailing_dot(""), "");
}
