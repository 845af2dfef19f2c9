#include "libmxoracle/Url.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

#include "libmxoracle/Errors.hpp"

namespace libmxoracle {

namespace {

struct CurlUrlDeleter {
	void operator()(CURLU* handle) const {
		curl_url_cleanup(handle);
	}
};

using curl_url_ptr = std::unique_ptr<CURLU, CurlUrlDeleter>;

struct CurlFreeDeleter {
	void operator()(char* str) const {
		curl_free(str);
	}
};

using curl_str_ptr = std::unique_ptr<char, CurlFreeDeleter>;

curl_url_ptr make_handle() {
	curl_url_ptr handle{curl_url()};
	if (!handle) {
		throw UrlError{"curl_url failed"};
	}

	return handle;
}

void set_url(CURLU* handle, const std::string& input) {
	const CURLUcode rc = curl_url_set(handle, CURLUPART_URL, input.c_str(), CURLU_NON_SUPPORT_SCHEME);
	if (rc != CURLUE_OK) {
		throw UrlError{"Invalid URL \"" + input + "\": " + curl_url_strerror(rc)};
	}
}

std::string get_part(CURLU* handle, CURLUPart part, bool required) {
	char* raw = nullptr;
	const CURLUcode rc = curl_url_get(handle, part, &raw, 0);
	curl_str_ptr str{raw};

	if (rc != CURLUE_OK) {
		if (required) {
			throw UrlError{std::string{"URL is missing a required part: "} + curl_url_strerror(rc)};
		}

		return {};
	}

	return str.get();
}

}  // namespace

Url::Url(std::string normalized) : url{std::move(normalized)} {}

Url Url::parse(std::string_view input) {
	const std::string str{input};

	// Without CURLU_DEFAULT_SCHEME curl rejects relative references and bare host names
	curl_url_ptr handle = make_handle();
	set_url(handle.get(), str);

	if (get_part(handle.get(), CURLUPART_HOST, false).empty()) {
		throw UrlError{"URL \"" + str + "\" has no host"};
	}

	return Url{get_part(handle.get(), CURLUPART_URL, true)};
}

Url Url::join(std::string_view reference) const {
	curl_url_ptr handle = make_handle();
	set_url(handle.get(), url);

	// Setting a relative URL on a handle that holds an absolute one resolves it against the latter
	set_url(handle.get(), std::string{reference});

	return Url{get_part(handle.get(), CURLUPART_URL, true)};
}

std::ostream& operator<<(std::ostream& os, const Url& url) {
	return os << url.to_string();
}

}  // namespace libmxoracle
