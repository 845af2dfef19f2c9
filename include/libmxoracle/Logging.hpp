#ifndef LIBMXORACLE_LOGGING_HPP
#define LIBMXORACLE_LOGGING_HPP

#include <boost/log/trivial.hpp>

namespace libmxoracle {

using log_level_t = boost::log::trivial::severity_level;

// All resolution steps are logged through the Boost.Log trivial logger. This only installs a severity filter on the
// global core, sinks are left to the application.
void set_log_level(log_level_t level);

}  // namespace libmxoracle

#endif  // LIBMXORACLE_LOGGING_HPP
