#include "libmxoracle/DnsResolver.hpp"

#include <arpa/nameser.h>
#include <netinet/in.h>
#include <resolv.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/log/trivial.hpp>

#include "libmxoracle/Errors.hpp"

namespace libmxoracle {

std::weak_ordering SrvRecord::operator<=>(const SrvRecord& rhs) const {
	return this->priority <=> rhs.priority;
}

records_t SystemDnsResolver::lookup_srv(std::string_view qname) const {
	const std::string name{qname};

	// Large enough for any answer, including one retried over TCP
	std::vector<unsigned char> answer(NS_MAXMSG);
	const int len = res_query(name.c_str(), C_IN, T_SRV, answer.data(), static_cast<int>(answer.size()));
	if (len < 0) {
		throw DnsError("SRV query failed for " + name);
	}
	// res_query reports the full size of an answer that did not fit
	if (static_cast<std::size_t>(len) > answer.size()) {
		throw DnsError("Truncated SRV response for " + name);
	}

	ns_msg handle;
	if (ns_initparse(answer.data(), len, &handle) < 0) {
		throw DnsError("Malformed SRV response for " + name);
	}

	std::uint16_t count = ns_msg_count(handle, ns_s_an);
	records_t results;

	for (std::uint16_t i = 0; i < count; i++) {
		ns_rr rr;
		if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
			continue;  // skip malformed
		}

		if ((ns_rr_type(rr) != T_SRV) || (ns_rr_rdlen(rr) < 7)) {
			continue;
		}

		const unsigned char* rdata = ns_rr_rdata(rr);

		char target[NS_MAXDNAME];
		if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + 6, target, sizeof(target)) < 0) {
			continue;  // bad target, skip
		}

		results.emplace(static_cast<uint16_t>((rdata[0] << 8) | rdata[1]),
		                static_cast<uint16_t>((rdata[2] << 8) | rdata[3]),
		                static_cast<uint16_t>((rdata[4] << 8) | rdata[5]), target);
	}

	BOOST_LOG_TRIVIAL(trace) << "SRV " << name << " -> " << results.size() << " record(s)";

	return results;
}

addresses_t SystemDnsResolver::lookup_address(std::string_view host) const {
	boost::system::error_code ec;
	boost::asio::io_context io_context;
	boost::asio::ip::tcp::resolver resolver(io_context);

	// The port is supplied by the caller, only the addresses are of interest
	auto results = resolver.resolve(std::string{host}, "0", boost::asio::ip::resolver_base::numeric_service, ec);

	if (ec.failed()) {
		throw DnsError("Failed to resolve host \"" + std::string{host} + "\": " + ec.message());
	}

	addresses_t addresses;
	addresses.reserve(results.size());

	for (const auto& endpoint : results) {
		addresses.push_back(endpoint.endpoint().address());
	}

	return addresses;
}

}  // namespace libmxoracle
