#ifndef LIBMXORACLE_URL_HPP
#define LIBMXORACLE_URL_HPP

#include <ostream>
#include <string>
#include <string_view>

namespace libmxoracle {

// Absolute URL in normalized form (e.g. "https://example.org/"). Parsing and joining is done by the libcurl URL API.
class Url {
protected:
	std::string url;

	explicit Url(std::string normalized);

public:
	// Throws UrlError unless the input is an absolute URL with a scheme and a host
	[[nodiscard]] static Url parse(std::string_view input);

	// Resolves a reference against this URL, following the usual relative reference rules: "a/b" replaces the last path
	// segment, "/a/b" replaces the path. Throws UrlError.
	[[nodiscard]] Url join(std::string_view reference) const;

	[[nodiscard]] inline const std::string& to_string() const {
		return url;
	}

	bool operator==(const Url&) const = default;

	friend std::ostream& operator<<(std::ostream& os, const Url& url);
};

}  // namespace libmxoracle

#endif  // LIBMXORACLE_URL_HPP
