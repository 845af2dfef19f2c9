#include "libmxoracle/impl/SrvResolver.hpp"

#include <boost/log/trivial.hpp>
#include <sstream>

#include "libmxoracle/Errors.hpp"
#include "libmxoracle/impl/Utils.hpp"

namespace libmxoracle::_impl {

std::string make_srv_name(std::string_view service, std::string_view proto, std::string_view domain) {
	std::ostringstream ss;
	ss << "_" << service << "._" << proto << "." << domain;
	return ss.str();
}

const SrvRecord* pick_record(const records_t& records) {
	if (records.empty()) {
		return nullptr;
	}

	return &*records.begin();
}

std::optional<std::string> srv_lookup(const DnsResolver& resolver, std::string_view name) {
	const std::string qname = make_srv_name("matrix", "tcp", name);

	std::optional<records_t> records;
	try {
		records.emplace(resolver.lookup_srv(qname));
	} catch (const DnsError& e) {
		BOOST_LOG_TRIVIAL(debug) << "No SRV record for " << qname << ": " << e.what();
		return std::nullopt;
	}

	const SrvRecord* record = pick_record(*records);
	if (record == nullptr) {
		BOOST_LOG_TRIVIAL(debug) << "Empty SRV answer for " << qname;
		return std::nullopt;
	}

	return std::string{trim_trailing_dot(record->target)} + ":" + std::to_string(record->port);
}

}  // namespace libmxoracle::_impl
