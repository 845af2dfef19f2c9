#include "libmxoracle/Errors.hpp"

namespace libmxoracle {

HttpError::HttpError(const std::string& what, bool connect) : Error{what}, connect{connect} {}

bool HttpError::is_connect() const noexcept {
	return connect;
}

ConnectError::ConnectError(const std::string& what) : HttpError{what, true} {}

NoRecordsError::NoRecordsError(const std::string& host) : DnsError{"No address records found for \"" + host + "\""} {}

HardFailure::HardFailure(Kind kind, const std::string& what) : ClientError{what}, kind_{kind} {}

auto HardFailure::kind() const noexcept -> Kind {
	return kind_;
}

std::string to_string(HardFailure::Kind kind) {
	switch (kind) {
		case HardFailure::Kind::Url:
			return "url";
		case HardFailure::Kind::Http:
			return "http";
	}

	return "unknown";
}

}  // namespace libmxoracle
