#ifndef LIBMXORACLE_ADDRESSCLASSIFIER_HPP
#define LIBMXORACLE_ADDRESSCLASSIFIER_HPP

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <optional>
#include <string_view>
#include <variant>

namespace libmxoracle::_impl {

struct HostWithPort {
	std::string_view host;
	boost::asio::ip::port_type port;
};

using literal_t = std::variant<boost::asio::ip::tcp::endpoint, boost::asio::ip::address, HostWithPort>;

// "1.2.3.4:8448" or "[::1]:8448"
std::optional<boost::asio::ip::tcp::endpoint> parse_socket_literal(std::string_view name);
// "1.2.3.4", "::1" or "[::1]"
std::optional<boost::asio::ip::address> parse_ip_literal(std::string_view name);

// Tries socket literal, IP literal and host with port, in that order. Never throws.
std::optional<literal_t> classify(std::string_view name);

}  // namespace libmxoracle::_impl

#endif  // LIBMXORACLE_ADDRESSCLASSIFIER_HPP
