#ifndef LIBMXORACLE_SERVERRESOLVER_HPP
#define LIBMXORACLE_SERVERRESOLVER_HPP

#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "DnsResolver.hpp"
#include "HttpClient.hpp"
#include "ResolvedServer.hpp"

namespace libmxoracle {

// Steps of the resolution that need no network access: socket literal, IP literal and host with port. Returns nothing
// if the name has to be looked up.
[[nodiscard]] std::optional<ResolvedServer> classify_literal(std::string_view name);

// Resolves server names for the server-server API.
class ServerResolver {
public:
	static constexpr boost::asio::ip::port_type DEFAULT_PORT{ResolvedServer::DEFAULT_PORT};
	static constexpr std::string_view DEFAULT_SCHEME{"https"};

	struct Options {
		// Scheme used to query the server well-known document
		std::string scheme{DEFAULT_SCHEME};
		// Port used to query the server well-known document. The scheme's default if not set.
		std::optional<boost::asio::ip::port_type> well_known_port{};
	};

protected:
	std::shared_ptr<const HttpClient> http;
	std::shared_ptr<const DnsResolver> dns;
	Options options;

	[[nodiscard]] std::string well_known_url(std::string_view name) const;
	[[nodiscard]] ResolvedServer resolve_srv_or_host(const std::string& name) const;

public:
	// Uses CurlHttpClient and SystemDnsResolver
	ServerResolver();
	ServerResolver(std::shared_ptr<const HttpClient> http, std::shared_ptr<const DnsResolver> dns);
	ServerResolver(std::shared_ptr<const HttpClient> http, std::shared_ptr<const DnsResolver> dns, Options options);

	// Runs the server name resolution. Throws ConnectError if the well-known endpoint of the name can't be connected
	// to, every other failure falls through to the next step.
	[[nodiscard]] ResolvedServer resolve(std::string_view name) const;

	// Turns a resolved server into something to connect to. Throws NoRecordsError if the host has no addresses and
	// DnsError if the lookup fails.
	[[nodiscard]] boost::asio::ip::tcp::endpoint socket(const ResolvedServer& server) const;
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_SERVERRESOLVER_HPP
