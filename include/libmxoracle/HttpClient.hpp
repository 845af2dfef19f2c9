#ifndef LIBMXORACLE_HTTPCLIENT_HPP
#define LIBMXORACLE_HTTPCLIENT_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace libmxoracle {

struct HttpResponse {
	long status{0};
	std::string body{};

	[[nodiscard]] inline bool is_success() const {
		return (status >= 200) && (status < 300);
	}
	[[nodiscard]] inline bool is_error() const {
		return status >= 400;
	}
};

// Blocking GET capability used by both resolvers. Implementations must be usable from several threads at once.
class HttpClient {
public:
	virtual ~HttpClient() = default;

	// Returns the response for any status code. Throws HttpError if no response could be obtained, with
	// HttpError::is_connect() set if the connection itself failed.
	[[nodiscard]] virtual HttpResponse get(const std::string& url) const = 0;
};

class CurlHttpClient : public HttpClient {
public:
	static constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};
	static constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{5};

	struct Options {
		// Whole transfer
		std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
		// Until the TCP connection is up. Running out of it counts as a connect failure.
		std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT};
		bool follow_redirects{true};
		bool verify_peer{true};
		std::string user_agent{"libmxoracle"};
	};

protected:
	Options options;

public:
	CurlHttpClient();
	explicit CurlHttpClient(Options options);

	[[nodiscard]] HttpResponse get(const std::string& url) const override;
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_HTTPCLIENT_HPP
