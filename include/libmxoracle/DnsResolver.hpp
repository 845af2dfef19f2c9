#ifndef LIBMXORACLE_DNSRESOLVER_HPP
#define LIBMXORACLE_DNSRESOLVER_HPP

#include <boost/asio/ip/address.hpp>
#include <compare>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace libmxoracle {

struct SrvRecord {
	const uint16_t priority;
	const uint16_t weight;
	const uint16_t port;
	const std::string target;

	// Records are ordered by priority only
	std::weak_ordering operator<=>(const SrvRecord&) const;
};

// Records with the same priority keep the order in which they were inserted
using records_t = std::multiset<SrvRecord>;
using addresses_t = std::vector<boost::asio::ip::address>;

// DNS capability used by the server resolver. Implementations must be usable from several threads at once.
class DnsResolver {
public:
	virtual ~DnsResolver() = default;

	// Queries the SRV records of a fully qualified service name (e.g. "_matrix._tcp.example.org"). Throws DnsError
	// if the query fails, including for NXDOMAIN.
	[[nodiscard]] virtual records_t lookup_srv(std::string_view qname) const = 0;

	// Forward lookup (A and AAAA) of a host name. Throws DnsError if the lookup fails.
	[[nodiscard]] virtual addresses_t lookup_address(std::string_view host) const = 0;
};

// Uses the system stub resolver: libresolv for SRV and getaddrinfo (through Boost.Asio) for addresses
class SystemDnsResolver : public DnsResolver {
public:
	[[nodiscard]] records_t lookup_srv(std::string_view qname) const override;
	[[nodiscard]] addresses_t lookup_address(std::string_view host) const override;
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_DNSRESOLVER_HPP
