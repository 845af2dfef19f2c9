#include "libmxoracle/ResolvedServer.hpp"

#include <sstream>

namespace libmxoracle {

namespace {

template <class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};

std::string endpoint_to_string(const boost::asio::ip::tcp::endpoint& endpoint) {
	std::ostringstream ss;
	ss << endpoint;
	return ss.str();
}

}  // namespace

std::string ResolvedServer::host_header() const {
	return std::visit(overloaded{
	                      [](const Ip& ip) { return ip.address.to_string(); },
	                      [](const Socket& socket) { return endpoint_to_string(socket.endpoint); },
	                      [](const Host& host) { return host.name; },
	                      [](const HostPort& host) { return host.name; },
	                      [](const Srv& srv) { return srv.host; },
	                  },
	                  value);
}

std::string ResolvedServer::address() const {
	return std::visit(overloaded{
	                      [](const Ip& ip) { return endpoint_to_string({ip.address, DEFAULT_PORT}); },
	                      [](const Socket& socket) { return endpoint_to_string(socket.endpoint); },
	                      [](const Host& host) { return host.name + ":" + std::to_string(DEFAULT_PORT); },
	                      [](const HostPort& host) { return host.name; },
	                      [](const Srv& srv) { return srv.target; },
	                  },
	                  value);
}

std::string ResolvedServer::to_string() const {
	return std::visit(overloaded{
	                      [](const Ip& ip) { return "Ip(" + ip.address.to_string() + ")"; },
	                      [](const Socket& socket) { return "Socket(" + endpoint_to_string(socket.endpoint) + ")"; },
	                      [](const Host& host) { return "Host(" + host.name + ")"; },
	                      [](const HostPort& host) { return "HostPort(" + host.name + ")"; },
	                      [](const Srv& srv) { return "Srv(" + srv.target + ", " + srv.host + ")"; },
	                  },
	                  value);
}

std::ostream& operator<<(std::ostream& os, const ResolvedServer& server) {
	return os << server.to_string();
}

}  // namespace libmxoracle
