#ifndef LIBMXORACLE_CURLUTILS_HPP
#define LIBMXORACLE_CURLUTILS_HPP

#include <curl/curl.h>

namespace libmxoracle::_impl {

// Whether a failed transfer never got a connection to the remote host. A timeout only counts if no connection was
// established before it hit.
bool is_connect_failure(CURLcode code, bool connected);

}  // namespace libmxoracle::_impl

#endif  // LIBMXORACLE_CURLUTILS_HPP
