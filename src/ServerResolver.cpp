#include "libmxoracle/ServerResolver.hpp"

#include <boost/log/trivial.hpp>
#include <tuple>
#include <utility>
#include <variant>

#include "libmxoracle/Errors.hpp"
#include "libmxoracle/WellKnown.hpp"
#include "libmxoracle/impl/AddressClassifier.hpp"
#include "libmxoracle/impl/SrvResolver.hpp"
#include "libmxoracle/impl/Utils.hpp"

namespace libmxoracle {

std::optional<ResolvedServer> classify_literal(std::string_view name) {
	const std::optional<_impl::literal_t> literal = _impl::classify(name);

	if (!literal) {
		return std::nullopt;
	}

	if (const auto* endpoint = std::get_if<boost::asio::ip::tcp::endpoint>(&*literal)) {
		BOOST_LOG_TRIVIAL(info) << "\"" << name << "\" is a socket literal";
		return ResolvedServer{ResolvedServer::Socket{*endpoint}};
	}

	if (const auto* address = std::get_if<boost::asio::ip::address>(&*literal)) {
		BOOST_LOG_TRIVIAL(info) << "\"" << name << "\" is an IP literal";
		return ResolvedServer{ResolvedServer::Ip{*address}};
	}

	BOOST_LOG_TRIVIAL(info) << "\"" << name << "\" is a host with port";
	return ResolvedServer{ResolvedServer::HostPort{std::string{name}}};
}

ServerResolver::ServerResolver()
    : ServerResolver{std::make_shared<CurlHttpClient>(), std::make_shared<SystemDnsResolver>()} {}

ServerResolver::ServerResolver(std::shared_ptr<const HttpClient> http, std::shared_ptr<const DnsResolver> dns)
    : ServerResolver{std::move(http), std::move(dns), Options{}} {}

ServerResolver::ServerResolver(std::shared_ptr<const HttpClient> http, std::shared_ptr<const DnsResolver> dns,
                               Options options)
    : http{std::move(http)}, dns{std::move(dns)}, options{std::move(options)} {}

std::string ServerResolver::well_known_url(std::string_view name) const {
	std::string url = options.scheme + "://" + std::string{name};

	if (options.well_known_port) {
		url += ":" + std::to_string(*options.well_known_port);
	}

	return url + std::string{ServerWellKnown::PATH};
}

ResolvedServer ServerResolver::resolve_srv_or_host(const std::string& name) const {
	BOOST_LOG_TRIVIAL(debug) << "Looking up SRV record for \"" << name << "\"";
	if (std::optional<std::string> target = _impl::srv_lookup(*dns, name)) {
		BOOST_LOG_TRIVIAL(info) << "\"" << name << "\" has an SRV record pointing to " << *target;
		return ResolvedServer{ResolvedServer::Srv{std::move(*target), name}};
	}

	BOOST_LOG_TRIVIAL(info) << "Using \"" << name << "\" directly";
	return ResolvedServer{ResolvedServer::Host{name}};
}

ResolvedServer ServerResolver::resolve(std::string_view name) const {
	// 1. IP literal, with or without port
	// 2. Host with port
	BOOST_LOG_TRIVIAL(debug) << "Parsing \"" << name << "\" as a literal";
	if (std::optional<ResolvedServer> literal = classify_literal(name)) {
		return *std::move(literal);
	}

	// 3. Query the well-known endpoint
	const std::string url = well_known_url(name);
	BOOST_LOG_TRIVIAL(debug) << "Querying " << url;

	if (const std::optional<ServerWellKnown> well_known = _impl::fetch_server_well_known(*http, url)) {
		const std::string& delegated = well_known->server;
		BOOST_LOG_TRIVIAL(debug) << "\"" << name << "\" is delegated to \"" << delegated << "\"";

		// 3.1 Delegated IP literal, with or without port
		// 3.2 Delegated host with port
		if (std::optional<ResolvedServer> literal = classify_literal(delegated)) {
			return *std::move(literal);
		}

		// 3.3 SRV record of the delegated host
		// 3.4 Delegated host directly
		return resolve_srv_or_host(delegated);
	}

	// 4. SRV record of the name
	// 5. The name directly
	return resolve_srv_or_host(std::string{name});
}

boost::asio::ip::tcp::endpoint ServerResolver::socket(const ResolvedServer& server) const {
	std::string_view host;
	boost::asio::ip::port_type port = DEFAULT_PORT;

	if (const auto* ip = std::get_if<ResolvedServer::Ip>(&server.get_value())) {
		return {ip->address, DEFAULT_PORT};
	} else if (const auto* socket = std::get_if<ResolvedServer::Socket>(&server.get_value())) {
		return socket->endpoint;
	} else if (const auto* name = std::get_if<ResolvedServer::Host>(&server.get_value())) {
		host = name->name;
	} else {
		const std::string& with_port = server.is<ResolvedServer::HostPort>() ? server.get<ResolvedServer::HostPort>().name
		                                                                     : server.get<ResolvedServer::Srv>().target;
		const auto host_port = _impl::split_port(with_port);

		if (!host_port) {
			throw DnsError{"\"" + with_port + "\" is not a host with port"};
		}

		std::tie(host, port) = *host_port;
	}

	const addresses_t addresses = dns->lookup_address(host);

	// Naively use the first address
	if (addresses.empty()) {
		throw NoRecordsError{std::string{host}};
	}

	return {addresses.front(), port};
}

}  // namespace libmxoracle
