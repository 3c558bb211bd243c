#ifndef _VKGUARD_SRC_LOG_INCLUDED_
#define _VKGUARD_SRC_LOG_INCLUDED_

#include <spdlog/spdlog.h>

namespace vkguard::private_
{
// Library logger "vkguard" on stderr. Level from VKGUARD_LOG_LEVEL, warn by default.
spdlog::logger& log();

// Thread safe stdout logger used by the default debug report callback.
spdlog::logger& debug_output();

} // namespace vkguard::private_

#endif // _VKGUARD_SRC_LOG_INCLUDED_
