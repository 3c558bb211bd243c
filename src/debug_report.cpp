#include <vkguard/debug_report.hpp>
#include <vkguard/instance.hpp>

#include "log.hpp"

#include <exception>

namespace vkguard::dbg
{
bool print_to_stdout( flag const flag, object const, uint64_t const, size_t const, int32_t const message_code, std::string_view const layer_prefix,
                      std::string_view const message )
{
    private_::debug_output().info( "[vkguard] [{}] [{}] code {}: {}", to_string( flag ), layer_prefix, message_code, message );
    return false;
}

report::report( vkguard::instance const& instance, flags const flags, callback_type cb )
    : report( instance.native(), instance.commands(), flags, std::move( cb ) )
{}

report::report( VkInstance const instance, instance_commands const& commands, flags const flags, callback_type cb )
    : base_type( instance, commands.vkDestroyDebugReportCallbackEXT )
    , state_( std::make_unique< state >( state{ std::move( cb ) } ) )
    , message_( commands.vkDebugReportMessageEXT )
    , flags_( flags )
{
    if( !commands.has_debug_report() )
    {
        throw driver_error( VK_ERROR_EXTENSION_NOT_PRESENT, object::DEBUG_REPORT_EXT, "debug report callback creation" );
    }
    if( !state_->callback )
    {
        throw validation_error( "callback", "empty debug report callback" );
    }

    VkDebugReportCallbackCreateInfoEXT const create_info{ .sType = VK_STRUCTURE_TYPE_DEBUG_REPORT_CALLBACK_CREATE_INFO_EXT,
                                                          .pNext = nullptr,
                                                          .flags = flags(),
                                                          .pfnCallback = &report::dispatch,
                                                          .pUserData = static_cast< void* >( state_.get() ) };
    check( commands.vkCreateDebugReportCallbackEXT( instance, &create_info, nullptr, pnative() ), object::DEBUG_REPORT_EXT,
           "debug report callback creation" );
    private_::log().debug( "debug report callback {:#x} registered", private_::handle_id( native() ) );
}

bool report::insert( flag const flag, object const object, int32_t const message_code, std::string_view const layer_prefix,
                     std::string const& message ) const
{
    if( nullptr == message_ || !*this )
    {
        return false;
    }
    std::string const prefix( layer_prefix );
    message_( source_native(), static_cast< VkDebugReportFlagsEXT >( flag ), static_cast< VkDebugReportObjectTypeEXT >( object ), 0, 0, message_code,
              prefix.c_str(), message.c_str() );
    return true;
}

VKAPI_ATTR VkBool32 VKAPI_CALL report::dispatch( VkDebugReportFlagsEXT const flag, VkDebugReportObjectTypeEXT const object_type, uint64_t const object,
                                                 size_t const location, int32_t const message_code, char const* const player_prefix,
                                                 char const* const pmessage, void* const puser_data )
{
    auto const* const registered = static_cast< state const* >( puser_data );
    try
    {
        return registered->callback( static_cast< dbg::flag >( flag ), static_cast< dbg::object >( object_type ), object, location, message_code,
                                     std::string_view( nullptr != player_prefix ? player_prefix : "" ),
                                     std::string_view( nullptr != pmessage ? pmessage : "" ) )
                 ? VK_TRUE
                 : VK_FALSE;
    }
    // Nothing may unwind into the driver.
    catch( std::exception const& ex )
    {
        private_::log().error( "debug report callback threw: {}", ex.what() );
        return VK_FALSE;
    }
    catch( ... )
    {
        private_::log().error( "debug report callback threw a non-standard exception" );
        return VK_FALSE;
    }
}

} // namespace vkguard::dbg
