#include "libmxoracle/HttpClient.hpp"

#include <curl/curl.h>

#include <boost/log/trivial.hpp>
#include <memory>
#include <mutex>
#include <utility>

#include "libmxoracle/Errors.hpp"
#include "libmxoracle/impl/CurlUtils.hpp"

namespace libmxoracle {

namespace _impl {

bool is_connect_failure(CURLcode code, bool connected) {
	switch (code) {
		case CURLE_COULDNT_RESOLVE_PROXY:
		case CURLE_COULDNT_RESOLVE_HOST:
		case CURLE_COULDNT_CONNECT:
		case CURLE_SSL_CONNECT_ERROR:
		case CURLE_PEER_FAILED_VERIFICATION:
			return true;
		case CURLE_OPERATION_TIMEDOUT:
			return !connected;
		default:
			return false;
	}
}

}  // namespace _impl

namespace {

struct CurlDeleter {
	void operator()(CURL* curl) const {
		curl_easy_cleanup(curl);
	}
};

using curl_ptr = std::unique_ptr<CURL, CurlDeleter>;

std::size_t write_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
	auto* body = static_cast<std::string*>(userdata);
	body->append(ptr, size * nmemb);
	return size * nmemb;
}

std::once_flag curl_init_flag;

}  // namespace

CurlHttpClient::CurlHttpClient() : CurlHttpClient{Options{}} {}

CurlHttpClient::CurlHttpClient(Options options) : options{std::move(options)} {
	std::call_once(curl_init_flag, [] {
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw HttpError{"curl_global_init failed", false};
		}
	});
}

HttpResponse CurlHttpClient::get(const std::string& url) const {
	curl_ptr curl{curl_easy_init()};
	if (!curl) {
		throw HttpError{"curl_easy_init failed", false};
	}

	HttpResponse response;

	curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
	curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options.verify_peer ? 1L : 0L);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options.verify_peer ? 2L : 0L);
	curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

	BOOST_LOG_TRIVIAL(trace) << "GET " << url;

	const CURLcode rc = curl_easy_perform(curl.get());
	if (rc != CURLE_OK) {
		// Zero until the TCP connection is up
		curl_off_t connect_time = 0;
		curl_easy_getinfo(curl.get(), CURLINFO_CONNECT_TIME_T, &connect_time);

		throw HttpError{"GET " + url + " failed: " + curl_easy_strerror(rc),
		                _impl::is_connect_failure(rc, connect_time > 0)};
	}

	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

	BOOST_LOG_TRIVIAL(trace) << "GET " << url << " -> " << response.status << " (" << response.body.size()
	                         << " bytes)";

	return response;
}

}  // namespace libmxoracle
