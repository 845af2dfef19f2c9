#include "libmxoracle/HttpClient.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <tuple>

#include "libmxoracle/Errors.hpp"
#include "libmxoracle/impl/CurlUtils.hpp"

using namespace libmxoracle;
using namespace libmxoracle::_impl;

TEST(IsConnectFailureTest, ConnectionNeverEstablished) {
	EXPECT_TRUE(is_connect_failure(CURLE_COULDNT_RESOLVE_HOST, false));
	EXPECT_TRUE(is_connect_failure(CURLE_COULDNT_RESOLVE_PROXY, false));
	EXPECT_TRUE(is_connect_failure(CURLE_COULDNT_CONNECT, false));
	EXPECT_TRUE(is_connect_failure(CURLE_SSL_CONNECT_ERROR, true));
	EXPECT_TRUE(is_connect_failure(CURLE_PEER_FAILED_VERIFICATION, true));
}

TEST(IsConnectFailureTest, FailuresAfterConnecting) {
	EXPECT_FALSE(is_connect_failure(CURLE_OPERATION_TIMEDOUT, true));
	EXPECT_FALSE(is_connect_failure(CURLE_WRITE_ERROR, true));
	EXPECT_FALSE(is_connect_failure(CURLE_RECV_ERROR, true));
	EXPECT_FALSE(is_connect_failure(CURLE_GOT_NOTHING, true));
	EXPECT_FALSE(is_connect_failure(CURLE_TOO_MANY_REDIRECTS, true));
}

// A dropped SYN ends in a timeout without any connection
TEST(IsConnectFailureTest, TimeoutBeforeConnecting) {
	EXPECT_TRUE(is_connect_failure(CURLE_OPERATION_TIMEDOUT, false));
}

// =====================================================================================================================
TEST(CurlHttpClientTest, ClosedPortIsConnectFailure) {
	CurlHttpClient::Options options{};
	options.timeout = std::chrono::seconds{5};
	const CurlHttpClient http{options};

	try {
		std::ignore = http.get("http://127.0.0.1:1/");
		ADD_FAILURE() << "Expected an HttpError";
	} catch (const HttpError& e) {
		EXPECT_TRUE(e.is_connect()) << e.what();
	}
}

TEST(CurlHttpClientTest, UnsupportedSchemeIsNotConnectFailure) {
	const CurlHttpClient http;

	try {
		std::ignore = http.get("gopher+nope://example.test/");
		ADD_FAILURE() << "Expected an HttpError";
	} catch (const HttpError& e) {
		EXPECT_FALSE(e.is_connect()) << e.what();
	}
}
