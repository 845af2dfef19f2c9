#include "libmxoracle/impl/AddressClassifier.hpp"

#include <gtest/gtest.h>

#include "libmxoracle/ServerResolver.hpp"

using namespace libmxoracle;
using namespace libmxoracle::_impl;

namespace ip = boost::asio::ip;

TEST(ParseSocketLiteralTest, Ipv4WithPort) {
	EXPECT_EQ(parse_socket_literal("1.2.3.4:9999"), ip::tcp::endpoint(ip::make_address("1.2.3.4"), 9999));
}

TEST(ParseSocketLiteralTest, BracketedIpv6WithPort) {
	EXPECT_EQ(parse_socket_literal("[::1]:8448"), ip::tcp::endpoint(ip::make_address("::1"), 8448));
	EXPECT_EQ(parse_socket_literal("[2001:db8::1]:443"), ip::tcp::endpoint(ip::make_address("2001:db8::1"), 443));
}

TEST(ParseSocketLiteralTest, Rejected) {
	EXPECT_EQ(parse_socket_literal("1.2.3.4"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("1.2.3.4:"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("1.2.3.4:99999"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("1.2.3:80"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("example.org:80"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("::1"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("[::1]"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("[1.2.3.4]:80"), std::nullopt);
	EXPECT_EQ(parse_socket_literal("[::1]:"), std::nullopt);
}

TEST(ParseIpLiteralTest, Accepted) {
	EXPECT_EQ(parse_ip_literal("1.2.3.4"), ip::make_address("1.2.3.4"));
	EXPECT_EQ(parse_ip_literal("::1"), ip::make_address("::1"));
	EXPECT_EQ(parse_ip_literal("2001:db8::8448"), ip::make_address("2001:db8::8448"));
	EXPECT_EQ(parse_ip_literal("[::1]"), ip::make_address("::1"));
}

TEST(ParseIpLiteralTest, Rejected) {
	EXPECT_EQ(parse_ip_literal(""), std::nullopt);
	EXPECT_EQ(parse_ip_literal("example.org"), std::nullopt);
	EXPECT_EQ(parse_ip_literal("1.2.3.4:80"), std::nullopt);
	EXPECT_EQ(parse_ip_literal("256.1.1.1"), std::nullopt);
	EXPECT_EQ(parse_ip_literal("[1.2.3.4]"), std::nullopt);
}

TEST(ClassifyTest, Precedence) {
	const auto socket = classify("1.2.3.4:9999");
	ASSERT_TRUE(socket.has_value());
	EXPECT_TRUE(std::holds_alternative<ip::tcp::endpoint>(*socket));

	const auto address = classify("1.2.3.4");
	ASSERT_TRUE(address.has_value());
	EXPECT_TRUE(std::holds_alternative<ip::address>(*address));

	const auto host_port = classify("host.example:1234");
	ASSERT_TRUE(host_port.has_value());
	ASSERT_TRUE(std::holds_alternative<HostWithPort>(*host_port));
	EXPECT_EQ(std::get<HostWithPort>(*host_port).host, "host.example");
	EXPECT_EQ(std::get<HostWithPort>(*host_port).port, 1234);
}

// Bare IPv6 literals have colons all over the place and must never be taken for a host with port
TEST(ClassifyTest, BareIpv6IsAnIp) {
	for (const char* name : {"::1", "2001:db8::1", "fe80::1:2", "1:2:3:4:5:6:7:8"}) {
		const auto literal = classify(name);

		ASSERT_TRUE(literal.has_value()) << name;
		EXPECT_TRUE(std::holds_alternative<ip::address>(*literal)) << name;
	}
}

TEST(ClassifyTest, NoMatch) {
	EXPECT_EQ(classify("example.org"), std::nullopt);
	EXPECT_EQ(classify("example.org:"), std::nullopt);
	EXPECT_EQ(classify("example.org:port"), std::nullopt);
	EXPECT_EQ(classify(":8448"), std::nullopt);
	EXPECT_EQ(classify("a:b:c"), std::nullopt);
	EXPECT_EQ(classify(""), std::nullopt);
}

// =====================================================================================================================
TEST(ClassifyLiteralTest, MapsToResolvedServer) {
	EXPECT_EQ(classify_literal("1.2.3.4"), ResolvedServer{ResolvedServer::Ip{ip::make_address("1.2.3.4")}});
	EXPECT_EQ(classify_literal("1.2.3.4:9999"),
	          ResolvedServer{ResolvedServer::Socket{ip::tcp::endpoint(ip::make_address("1.2.3.4"), 9999)}});
	EXPECT_EQ(classify_literal("[::1]:8448"),
	          ResolvedServer{ResolvedServer::Socket{ip::tcp::endpoint(ip::make_address("::1"), 8448)}});
	EXPECT_EQ(classify_literal("host.example:1234"), ResolvedServer{ResolvedServer::HostPort{"host.example:1234"}});
	EXPECT_EQ(classify_literal("host.example"), std::nullopt);
}
