#include "libmxoracle/Logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace libmxoracle {

void set_log_level(log_level_t level) {
	boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

}  // namespace libmxoracle
