#include "libmxoracle/ClientResolver.hpp"

#include <boost/log/trivial.hpp>
#include <utility>

#include "libmxoracle/Errors.hpp"

namespace libmxoracle {

namespace {

Url parse_delegated_url(const std::string& url) {
	try {
		return Url::parse(url);
	} catch (const UrlError& e) {
		throw HardFailure{HardFailure::Kind::Url, e.what()};
	}
}

Url join_delegated_url(const Url& base, std::string_view path) {
	try {
		return base.join(path);
	} catch (const UrlError& e) {
		throw HardFailure{HardFailure::Kind::Url, e.what()};
	}
}

}  // namespace

ClientResolver::ClientResolver() : ClientResolver{std::make_shared<CurlHttpClient>()} {}

ClientResolver::ClientResolver(std::shared_ptr<const HttpClient> http) : ClientResolver{std::move(http), Options{}} {}

ClientResolver::ClientResolver(std::shared_ptr<const HttpClient> http, Options options)
    : http{std::move(http)}, options{std::move(options)} {}

void ClientResolver::validate_homeserver(const Url& homeserver) const {
	const Url versions_url = join_delegated_url(homeserver, Versions::PATH);
	BOOST_LOG_TRIVIAL(debug) << "Validating homeserver at " << versions_url;

	try {
		const Versions versions = Versions::parse(http->get(versions_url.to_string()).body);
		BOOST_LOG_TRIVIAL(debug) << homeserver << " supports " << versions.versions.size() << " version(s)";
	} catch (const HttpError& e) {
		throw HardFailure{HardFailure::Kind::Http, e.what()};
	} catch (const ParseError& e) {
		throw HardFailure{HardFailure::Kind::Http, "Invalid versions response from " + versions_url.to_string() + ": " +
		                                               e.what()};
	}
}

void ClientResolver::validate_identity_server(const ClientWellKnown::IdentityServerInfo& identity_server) const {
	const Url identity_url = join_delegated_url(parse_delegated_url(identity_server.base_url), IdentityServerStatus::PATH);
	BOOST_LOG_TRIVIAL(debug) << "Validating identity server at " << identity_url;

	HttpResponse response;
	try {
		response = http->get(identity_url.to_string());
	} catch (const HttpError& e) {
		throw HardFailure{HardFailure::Kind::Http, e.what()};
	}

	if (response.is_error()) {
		throw HardFailure{HardFailure::Kind::Http,
		                  identity_url.to_string() + " returned status " + std::to_string(response.status)};
	}
}

Url ClientResolver::resolve(std::string_view domain) const {
	const Url base = parse_delegated_url(options.scheme + "://" + std::string{domain});
	const Url well_known_url = join_delegated_url(base, ClientWellKnown::PATH);

	// 1. Query the well-known endpoint of the account domain
	BOOST_LOG_TRIVIAL(debug) << "Querying " << well_known_url;

	HttpResponse response;
	try {
		response = http->get(well_known_url.to_string());
	} catch (const HttpError& e) {
		throw PromptFailure{e.what()};
	}

	// 2. No well-known document, the domain is the homeserver
	if (response.status == 404) {
		BOOST_LOG_TRIVIAL(info) << "No client well-known document for \"" << domain << "\", using " << base;
		return base;
	}

	// 3. Parse the document and the homeserver URL in it
	ClientWellKnown well_known;
	try {
		well_known = ClientWellKnown::parse(response.body);
	} catch (const ParseError& e) {
		throw PromptFailure{"Invalid client well-known document at " + well_known_url.to_string() + ": " + e.what()};
	}

	const Url homeserver = parse_delegated_url(well_known.homeserver.base_url);

	// 4. Check that there is a homeserver
	validate_homeserver(homeserver);

	// 5. Check the identity server, if there is one
	if (well_known.identity_server) {
		validate_identity_server(*well_known.identity_server);
	}

	BOOST_LOG_TRIVIAL(info) << "\"" << domain << "\" is served by " << homeserver;
	return homeserver;
}

}  // namespace libmxoracle
