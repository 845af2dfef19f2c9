#include "libmxoracle/WellKnown.hpp"

#include <boost/json.hpp>
#include <boost/log/trivial.hpp>

#include "libmxoracle/Errors.hpp"

namespace libmxoracle {

namespace {

boost::json::string_view to_json(std::string_view str) {
	return {str.data(), str.size()};
}

boost::json::object parse_object(std::string_view body) {
	boost::system::error_code ec;
	boost::json::value parsed = boost::json::parse(to_json(body), ec);

	if (ec.failed()) {
		throw ParseError{"Response is not valid JSON: " + ec.message()};
	}
	if (!parsed.is_object()) {
		throw ParseError{"Response is not a JSON object"};
	}

	return std::move(parsed.as_object());
}

std::string get_string(const boost::json::object& object, std::string_view key) {
	const boost::json::value* value = object.if_contains(to_json(key));

	if ((value == nullptr) || !value->is_string()) {
		throw ParseError{"Expected a string at \"" + std::string{key} + "\""};
	}

	return value->get_string().c_str();
}

const boost::json::object& get_object(const boost::json::object& object, std::string_view key) {
	const boost::json::value* value = object.if_contains(to_json(key));

	if ((value == nullptr) || !value->is_object()) {
		throw ParseError{"Expected an object at \"" + std::string{key} + "\""};
	}

	return value->get_object();
}

}  // namespace

ServerWellKnown ServerWellKnown::parse(std::string_view body) {
	const boost::json::object parsed = parse_object(body);

	return ServerWellKnown{get_string(parsed, "m.server")};
}

ClientWellKnown ClientWellKnown::parse(std::string_view body) {
	const boost::json::object parsed = parse_object(body);

	ClientWellKnown well_known{{get_string(get_object(parsed, "m.homeserver"), "base_url")}};

	if (const boost::json::value* identity = parsed.if_contains("m.identity_server");
	    (identity != nullptr) && !identity->is_null()) {
		well_known.identity_server = IdentityServerInfo{get_string(get_object(parsed, "m.identity_server"), "base_url")};
	}

	return well_known;
}

Versions Versions::parse(std::string_view body) {
	const boost::json::object parsed = parse_object(body);

	const boost::json::value* versions = parsed.if_contains("versions");
	if ((versions == nullptr) || !versions->is_array()) {
		throw ParseError{"Expected an array at \"versions\""};
	}

	Versions result{};
	for (const boost::json::value& version : versions->get_array()) {
		if (!version.is_string()) {
			throw ParseError{"Expected only strings in \"versions\""};
		}

		result.versions.emplace_back(version.get_string().c_str());
	}

	if (parsed.contains("unstable_features")) {
		for (const boost::json::key_value_pair& feature : get_object(parsed, "unstable_features")) {
			if (!feature.value().is_bool()) {
				throw ParseError{"Expected a boolean for unstable feature \"" + std::string{feature.key_c_str()} + "\""};
			}

			result.unstable_features.emplace(feature.key_c_str(), feature.value().get_bool());
		}
	}

	return result;
}

namespace _impl {

std::optional<ServerWellKnown> fetch_server_well_known(const HttpClient& http, const std::string& url) {
	HttpResponse response;

	try {
		response = http.get(url);
	} catch (const HttpError& e) {
		// Only return an error on connection failure, skip to the next step for anything else
		if (e.is_connect()) {
			throw ConnectError{e.what()};
		}

		BOOST_LOG_TRIVIAL(debug) << "Fetching " << url << " failed: " << e.what();
		return std::nullopt;
	}

	if (!response.is_success()) {
		BOOST_LOG_TRIVIAL(debug) << "Fetching " << url << " returned status " << response.status;
		return std::nullopt;
	}

	try {
		return ServerWellKnown::parse(response.body);
	} catch (const ParseError& e) {
		BOOST_LOG_TRIVIAL(warning) << "Ignoring malformed server well-known document at " << url << ": " << e.what();
		return std::nullopt;
	}
}

}  // namespace _impl

}  // namespace libmxoracle
