#ifndef LIBMXORACLE_SRVRESOLVER_HPP
#define LIBMXORACLE_SRVRESOLVER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "libmxoracle/DnsResolver.hpp"

namespace libmxoracle::_impl {

std::string make_srv_name(std::string_view service, std::string_view proto, std::string_view domain);

// Lowest priority wins, weight is not taken into account. Ties go to the first record in answer order.
const SrvRecord* pick_record(const records_t& records);

// Looks up "_matrix._tcp.<name>" and returns "<target>:<port>" of the picked record. Failed lookups and empty answers
// are not errors here, they just mean there is no SRV record.
std::optional<std::string> srv_lookup(const DnsResolver& resolver, std::string_view name);

}  // namespace libmxoracle::_impl

#endif  // LIBMXORACLE_SRVRESOLVER_HPP
