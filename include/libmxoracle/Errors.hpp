#ifndef LIBMXORACLE_ERRORS_HPP
#define LIBMXORACLE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace libmxoracle {

class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Thrown by HttpClient implementations when a request could not be completed
class HttpError : public Error {
protected:
	bool connect;

public:
	HttpError(const std::string& what, bool connect);

	// True if no connection to the remote host could be established at all (name resolution, TCP or TLS)
	[[nodiscard]] bool is_connect() const noexcept;
};

// The server well-known endpoint of the name being resolved could not be reached
class ConnectError : public HttpError {
public:
	explicit ConnectError(const std::string& what);
};

// A document did not have the expected shape
class ParseError : public Error {
public:
	using Error::Error;
};

class DnsError : public Error {
public:
	using Error::Error;
};

class NoRecordsError : public DnsError {
public:
	explicit NoRecordsError(const std::string& host);
};

class UrlError : public Error {
public:
	using Error::Error;
};

// Client discovery failures. Refer to the client-server API well-known section on how to treat them.
class ClientError : public Error {
public:
	using Error::Error;
};

// FAIL_PROMPT: the well-known endpoint of the account domain could not be queried or understood
class PromptFailure : public ClientError {
public:
	using ClientError::ClientError;
};

// FAIL_ERROR: the well-known document points somewhere that is broken
class HardFailure : public ClientError {
public:
	enum class Kind {
		Url,
		Http,
	};

protected:
	Kind kind_;

public:
	HardFailure(Kind kind, const std::string& what);

	[[nodiscard]] Kind kind() const noexcept;
};

std::string to_string(HardFailure::Kind kind);

}  // namespace libmxoracle

#endif  // LIBMXORACLE_ERRORS_HPP
