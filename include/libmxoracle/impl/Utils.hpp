#ifndef LIBMXORACLE_UTILS_HPP
#define LIBMXORACLE_UTILS_HPP

#include <boost/asio/ip/basic_endpoint.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace libmxoracle::_impl {

// The whole string has to be a decimal number that fits into a port
std::optional<boost::asio::ip::port_type> parse_port(std::string_view port_string);

// Splits "host:port". Anything with more or less than exactly one colon, or with an invalid port, yields nothing.
std::optional<std::pair<std::string_view, boost::asio::ip::port_type>> split_port(std::string_view host);

std::string_view trim_trailing_dot(std::string_view name);

}  // namespace libmxoracle::_impl

#endif  // LIBMXORACLE_UTILS_HPP
