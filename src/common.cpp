#include <vkguard/common.hpp>

#include "log.hpp"

#include <string>

namespace vkguard
{
std::string to_string( version const v )
{
    return std::to_string( v.major() ) + '.' + std::to_string( v.minor() ) + '.' + std::to_string( v.patch() );
}

char const* to_string( result const r ) noexcept
{
    switch( r )
    {
    case result::SUCCESS: return "VK_SUCCESS";
    case result::NOT_READY: return "VK_NOT_READY";
    case result::TIMEOUT: return "VK_TIMEOUT";
    case result::EVENT_SET: return "VK_EVENT_SET";
    case result::EVENT_RESET: return "VK_EVENT_RESET";
    case result::INCOMPLETE: return "VK_INCOMPLETE";
    case result::ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
    case result::ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
    case result::ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
    case result::ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
    case result::ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
    case result::ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
    case result::ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
    case result::ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
    case result::ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
    case result::ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
    case result::ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
    case result::ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
    case result::ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
    case result::SUBOPTIMAL_KHR: return "VK_SUBOPTIMAL_KHR";
    case result::ERROR_OUT_OF_DATE_KHR: return "VK_ERROR_OUT_OF_DATE_KHR";
    case result::ERROR_INCOMPATIBLE_DISPLAY_KHR: return "VK_ERROR_INCOMPATIBLE_DISPLAY_KHR";
    case result::ERROR_VALIDATION_FAILED_EXT: return "VK_ERROR_VALIDATION_FAILED_EXT";
    }
    return "unknown VkResult";
}

namespace dbg
{
char const* to_string( flag const f ) noexcept
{
    switch( f )
    {
    case flag::INFO: return "info";
    case flag::WARN: return "warning";
    case flag::PERF: return "performance";
    case flag::ERR: return "error";
    case flag::DEBUG: return "debug";
    }
    return "unknown";
}
} // namespace dbg

void check( VkResult const status, dbg::object const object, char const* const what )
{
    if( VK_SUCCESS == status )
    {
        return;
    }
    private_::log().debug( "{} failed: {}", what, to_string( static_cast< result >( status ) ) );
    switch( status )
    {
    case VK_ERROR_OUT_OF_HOST_MEMORY: throw out_of_host_memory( object, what );
    case VK_ERROR_OUT_OF_DEVICE_MEMORY: throw out_of_device_memory( object, what );
    default: throw driver_error( status, object, what );
    }
}

} // namespace vkguard
