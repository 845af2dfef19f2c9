#include "libmxoracle/impl/Utils.hpp"

#include <charconv>

namespace libmxoracle::_impl {

std::optional<boost::asio::ip::port_type> parse_port(std::string_view port_str) {
	if (port_str.empty()) {
		return std::nullopt;
	}

	boost::asio::ip::port_type port_value;

	const char* const end = port_str.data() + port_str.size();
	const auto [ptr, ec] = std::from_chars(port_str.data(), end, port_value);

	if ((ec != std::errc()) || (ptr != end)) {
		return std::nullopt;
	}

	return port_value;
}

std::optional<std::pair<std::string_view, boost::asio::ip::port_type>> split_port(std::string_view host) {
	const auto colon = host.find(':');

	if ((colon == std::string_view::npos) || (host.find(':', colon + 1) != std::string_view::npos)) {
		return std::nullopt;
	}

	const std::optional<boost::asio::ip::port_type> port = parse_port(host.substr(colon + 1));

	if (!port) {
		return std::nullopt;
	}

	return std::pair{host.substr(0, colon), *port};
}

std::string_view trim_trailing_dot(std::string_view name) {
	while (!name.empty() && (name.back() == '.')) {
		name.remove_suffix(1);
	}

	return name;
}

}  // namespace libmxoracle::_impl
