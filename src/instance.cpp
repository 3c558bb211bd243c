#include <vkguard/instance.hpp>
#include <vkguard/physical_device.hpp>

#include "enumerate.hpp"
#include "log.hpp"
#include "resolve.hpp"

#include <algorithm>
#include <cstring>

namespace vkguard
{
instance::builder::builder() noexcept
    : basic_builder( VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO )
    , app_info_( vkguard::application_info().native() )
{}

instance instance::builder::build( vkguard::loader&& loader )
{
    require( version( app_info_.apiVersion ) >= version( 1, 0, 0 ), "application_info.api_version", "must be at least 1.0.0" );
    require_names( { info_.ppEnabledExtensionNames, info_.enabledExtensionCount }, "enabled_extensions" );
    require_names( { info_.ppEnabledLayerNames, info_.enabledLayerCount }, "enabled_layers" );

    VkInstanceCreateInfo info = info_;
    info.pApplicationInfo = &app_info_;

    std::vector< extension::id_type > extensions;
    if( print_debug_report_ )
    {
        std::span< extension::id_type const > const listed( info.ppEnabledExtensionNames, info.enabledExtensionCount );
        auto const listed_already = std::any_of( listed.begin(), listed.end(),
                                                 []( extension::id_type const name ) { return 0 == std::strcmp( name, extension::debug_report ); } );
        if( !listed_already )
        {
            extensions.assign( listed.begin(), listed.end() );
            extensions.push_back( extension::debug_report );
            info.enabledExtensionCount = static_cast< uint32_t >( extensions.size() );
            info.ppEnabledExtensionNames = extensions.data();
        }
    }

    VkInstance native = VK_NULL_HANDLE;
    check( loader.commands().vkCreateInstance( &info, nullptr, &native ), dbg::object::INSTANCE, "instance creation" );

    auto const destroy = reinterpret_cast< PFN_vkDestroyInstance >( loader.get_instance_proc_addr()( native, "vkDestroyInstance" ) );
    if( nullptr == destroy )
    {
        throw loader_error( "driver does not expose vkDestroyInstance" );
    }
    return instance( std::move( loader ), private_::source_handle< VkInstance >( native, destroy ), info, print_debug_report_, debug_report_flags_ );
}

instance::instance( vkguard::loader&& loader, private_::source_handle< VkInstance >&& handle, VkInstanceCreateInfo const& info,
                    bool const print_debug_report, dbg::flags const debug_report_flags )
    : loader_( std::move( loader ) )
    , commands_( std::make_unique< instance_commands >() )
    , handle_( std::move( handle ) )
    , extensions_( info.ppEnabledExtensionNames, info.ppEnabledExtensionNames + info.enabledExtensionCount )
    , api_version_( info.pApplicationInfo->apiVersion )
    , default_report_()
{
    auto const gpa = loader_.get_instance_proc_addr();
    auto const native = handle_.native();
    auto& table = *commands_;

    private_::resolve_required( gpa, native, "vkDestroyInstance", table.vkDestroyInstance );
    private_::resolve_required( gpa, native, "vkEnumeratePhysicalDevices", table.vkEnumeratePhysicalDevices );
    private_::resolve_required( gpa, native, "vkGetPhysicalDeviceProperties", table.vkGetPhysicalDeviceProperties );
    private_::resolve_required( gpa, native, "vkGetPhysicalDeviceFeatures", table.vkGetPhysicalDeviceFeatures );
    private_::resolve_required( gpa, native, "vkGetPhysicalDeviceMemoryProperties", table.vkGetPhysicalDeviceMemoryProperties );
    private_::resolve_required( gpa, native, "vkGetPhysicalDeviceQueueFamilyProperties", table.vkGetPhysicalDeviceQueueFamilyProperties );
    private_::resolve_required( gpa, native, "vkEnumerateDeviceExtensionProperties", table.vkEnumerateDeviceExtensionProperties );
    private_::resolve_required( gpa, native, "vkCreateDevice", table.vkCreateDevice );
    private_::resolve_required( gpa, native, "vkGetDeviceProcAddr", table.vkGetDeviceProcAddr );

    if( is_extension_enabled( extension::debug_report ) )
    {
        private_::resolve( gpa, native, "vkCreateDebugReportCallbackEXT", table.vkCreateDebugReportCallbackEXT );
        private_::resolve( gpa, native, "vkDestroyDebugReportCallbackEXT", table.vkDestroyDebugReportCallbackEXT );
        private_::resolve( gpa, native, "vkDebugReportMessageEXT", table.vkDebugReportMessageEXT );
    }
    if( is_extension_enabled( extension::khr_surface ) )
    {
        private_::resolve( gpa, native, "vkGetPhysicalDeviceSurfaceSupportKHR", table.vkGetPhysicalDeviceSurfaceSupportKHR );
    }

    private_::log().debug( "instance {:#x} created, api {}, {} extension(s)", private_::handle_id( native ), to_string( api_version_ ), extensions_.size() );

    if( print_debug_report )
    {
        default_report_.emplace( native, table, debug_report_flags, &dbg::print_to_stdout );
    }
}

instance::~instance()
{
    // The callback goes first: it is registered on the instance.
    default_report_.reset();
    if( handle_ )
    {
        private_::log().debug( "destroying instance {:#x}", private_::handle_id( handle_.native() ) );
    }
}

bool instance::is_extension_enabled( std::string_view const name ) const noexcept
{
    return std::find( extensions_.begin(), extensions_.end(), name ) != extensions_.end();
}

std::vector< physical_device > instance::enumerate_physical_devices() const
{
    auto const natives = private_::enumerate< VkPhysicalDevice >( commands_->vkEnumeratePhysicalDevices, dbg::object::INSTANCE,
                                                                  "physical device enumeration", native() );
    std::vector< physical_device > devices;
    devices.reserve( natives.size() );
    for( auto const native: natives )
    {
        devices.emplace_back( native, *commands_ );
    }
    private_::log().trace( "{} physical device(s) found", devices.size() );
    return devices;
}

} // namespace vkguard
