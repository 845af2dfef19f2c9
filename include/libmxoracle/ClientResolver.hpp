#ifndef LIBMXORACLE_CLIENTRESOLVER_HPP
#define LIBMXORACLE_CLIENTRESOLVER_HPP

#include <memory>
#include <string>
#include <string_view>

#include "HttpClient.hpp"
#include "Url.hpp"
#include "WellKnown.hpp"

namespace libmxoracle {

// Resolves account domains to the base URL of the client-server API.
class ClientResolver {
public:
	static constexpr std::string_view DEFAULT_SCHEME{"https"};

	struct Options {
		// Scheme used to query the client well-known document of the account domain
		std::string scheme{DEFAULT_SCHEME};
	};

protected:
	std::shared_ptr<const HttpClient> http;
	Options options;

	void validate_homeserver(const Url& homeserver) const;
	void validate_identity_server(const ClientWellKnown::IdentityServerInfo& identity_server) const;

public:
	// Uses CurlHttpClient
	ClientResolver();
	explicit ClientResolver(std::shared_ptr<const HttpClient> http);
	ClientResolver(std::shared_ptr<const HttpClient> http, Options options);

	// Returns the homeserver base URL for the domain (which may include a port). Throws PromptFailure if the
	// well-known document could not be fetched or understood and HardFailure if the homeserver or identity server
	// it points to is broken.
	[[nodiscard]] Url resolve(std::string_view domain) const;
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_CLIENTRESOLVER_HPP
