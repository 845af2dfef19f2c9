#ifndef LIBMXORACLE_RESOLVEDSERVER_HPP
#define LIBMXORACLE_RESOLVEDSERVER_HPP

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace libmxoracle {

// Result of resolving a server name. Exactly one of the alternatives is held and the object is never modified after
// the resolver produced it.
class ResolvedServer {
public:
	static constexpr boost::asio::ip::port_type DEFAULT_PORT{8448};

	// IP address with implicit default port
	struct Ip {
		boost::asio::ip::address address;

		bool operator==(const Ip&) const = default;
	};
	// IP address with explicit port
	struct Socket {
		boost::asio::ip::tcp::endpoint endpoint;

		bool operator==(const Socket&) const = default;
	};
	// Host name with implicit default port
	struct Host {
		std::string name;

		bool operator==(const Host&) const = default;
	};
	// "host:port", exactly as it was given
	struct HostPort {
		std::string name;

		bool operator==(const HostPort&) const = default;
	};
	// Address from an SRV record ("target:port"), host name from the server name the record was looked up for
	struct Srv {
		std::string target;
		std::string host;

		bool operator==(const Srv&) const = default;
	};

	using value_t = std::variant<Ip, Socket, Host, HostPort, Srv>;

protected:
	value_t value;

public:
	template <class T>
	    requires std::is_constructible_v<value_t, T>
	ResolvedServer(T alternative) : value{std::move(alternative)} {}

	template <class T>
	[[nodiscard]] inline bool is() const {
		return std::holds_alternative<T>(value);
	}
	template <class T>
	[[nodiscard]] inline const T& get() const {
		return std::get<T>(value);
	}
	[[nodiscard]] inline const value_t& get_value() const {
		return value;
	}

	// The value to use for the Host HTTP header
	[[nodiscard]] std::string host_header() const;
	// The address to connect to, always with a port
	[[nodiscard]] std::string address() const;

	[[nodiscard]] std::string to_string() const;

	bool operator==(const ResolvedServer&) const = default;

	friend std::ostream& operator<<(std::ostream& os, const ResolvedServer& server);
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_RESOLVEDSERVER_HPP
