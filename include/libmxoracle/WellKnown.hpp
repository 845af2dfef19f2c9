#ifndef LIBMXORACLE_WELLKNOWN_HPP
#define LIBMXORACLE_WELLKNOWN_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "HttpClient.hpp"

namespace libmxoracle {

// GET /.well-known/matrix/server
struct ServerWellKnown {
	static constexpr std::string_view PATH{"/.well-known/matrix/server"};

	// The server name to delegate server-server communication to, with optional port ("m.server")
	std::string server;

	// Throws ParseError if the body is not JSON or lacks "m.server"
	[[nodiscard]] static ServerWellKnown parse(std::string_view body);
};

// GET /.well-known/matrix/client
struct ClientWellKnown {
	static constexpr std::string_view PATH{".well-known/matrix/client"};

	struct HomeserverInfo {
		std::string base_url;
	};
	struct IdentityServerInfo {
		std::string base_url;
	};

	HomeserverInfo homeserver;                            // "m.homeserver"
	std::optional<IdentityServerInfo> identity_server{};  // "m.identity_server"

	// Throws ParseError if the body is not JSON or does not have the expected shape
	[[nodiscard]] static ClientWellKnown parse(std::string_view body);
};

// GET /_matrix/client/versions. Only used to check that a homeserver is actually there.
struct Versions {
	static constexpr std::string_view PATH{"_matrix/client/versions"};

	std::vector<std::string> versions;
	std::map<std::string, bool> unstable_features{};

	[[nodiscard]] static Versions parse(std::string_view body);
};

// GET /_matrix/identity/api/v1
struct IdentityServerStatus {
	static constexpr std::string_view PATH{"_matrix/identity/api/v1"};
};

namespace _impl {

// Fetches the server well-known document. Only a connect failure is an error (ConnectError); any other failure means
// there is no delegation and yields nothing.
std::optional<ServerWellKnown> fetch_server_well_known(const HttpClient& http, const std::string& url);

}  // namespace _impl

}  // namespace libmxoracle

#endif  // LIBMXORACLE_WELLKNOWN_HPP
