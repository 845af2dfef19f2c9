#include "libmxoracle/impl/AddressClassifier.hpp"

#include <string>

#include "libmxoracle/impl/Utils.hpp"

namespace libmxoracle::_impl {

namespace {

std::optional<boost::asio::ip::address_v6> parse_bracketed_v6(std::string_view name) {
	if ((name.size() < 2) || (name.front() != '[') || (name.back() != ']')) {
		return std::nullopt;
	}

	boost::system::error_code ec;
	const boost::asio::ip::address_v6 address =
	    boost::asio::ip::make_address_v6(std::string{name.substr(1, name.size() - 2)}, ec);

	if (ec.failed()) {
		return std::nullopt;
	}

	return address;
}

}  // namespace

std::optional<boost::asio::ip::tcp::endpoint> parse_socket_literal(std::string_view name) {
	boost::system::error_code ec;

	if (name.starts_with('[')) {
		const auto bracket = name.rfind("]:");
		if (bracket == std::string_view::npos) {
			return std::nullopt;
		}

		const auto address = parse_bracketed_v6(name.substr(0, bracket + 1));
		const auto port = parse_port(name.substr(bracket + 2));

		if (!address || !port) {
			return std::nullopt;
		}

		return boost::asio::ip::tcp::endpoint{*address, *port};
	}

	const auto host_port = split_port(name);
	if (!host_port) {
		return std::nullopt;
	}

	const boost::asio::ip::address_v4 address = boost::asio::ip::make_address_v4(std::string{host_port->first}, ec);

	if (ec.failed()) {
		return std::nullopt;
	}

	return boost::asio::ip::tcp::endpoint{address, host_port->second};
}

std::optional<boost::asio::ip::address> parse_ip_literal(std::string_view name) {
	if (const auto address = parse_bracketed_v6(name)) {
		return boost::asio::ip::address{*address};
	}

	boost::system::error_code ec;
	const boost::asio::ip::address address = boost::asio::ip::make_address(std::string{name}, ec);

	if (ec.failed()) {
		return std::nullopt;
	}

	return address;
}

std::optional<literal_t> classify(std::string_view name) {
	if (const auto endpoint = parse_socket_literal(name)) {
		return literal_t{*endpoint};
	}

	if (const auto address = parse_ip_literal(name)) {
		return literal_t{*address};
	}

	// IPv6 literals never get here in bracket form and have more than one colon otherwise, so they can't be
	// mistaken for a host with port
	if (const auto host_port = split_port(name); host_port && !host_port->first.empty()) {
		return literal_t{HostWithPort{host_port->first, host_port->second}};
	}

	return std::nullopt;
}

}  // namespace libmxoracle::_impl
