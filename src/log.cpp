#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <cstdlib>
#include <memory>

namespace
{
constexpr char const* const logger_name = "vkguard";
constexpr char const* const debug_logger_name = "vkguard.debug_report";

std::shared_ptr< spdlog::logger > make_log()
{
    auto result = spdlog::get( logger_name );
    if( !result )
    {
        result = spdlog::stderr_color_mt( logger_name );
    }
    auto level = spdlog::level::warn;
    if( auto const* const configured = std::getenv( "VKGUARD_LOG_LEVEL" ); nullptr != configured )
    {
        // Unknown names map to off.
        level = spdlog::level::from_str( configured );
    }
    result->set_level( level );
    return result;
}

std::shared_ptr< spdlog::logger > make_debug_output()
{
    auto result = spdlog::get( debug_logger_name );
    if( !result )
    {
        result = spdlog::stdout_logger_mt( debug_logger_name );
    }
    result->set_pattern( "%v" );
    result->set_level( spdlog::level::trace );
    result->flush_on( spdlog::level::trace );
    return result;
}

} // namespace

namespace vkguard::private_
{
spdlog::logger& log()
{
    static auto const logger = make_log();
    return *logger;
}

spdlog::logger& debug_output()
{
    static auto const logger = make_debug_output();
    return *logger;
}

} // namespace vkguard::private_
