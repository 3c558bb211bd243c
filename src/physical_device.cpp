#include <vkguard/physical_device.hpp>

#include "enumerate.hpp"

namespace vkguard
{
unsigned physical_device::memory_property::find_memory_type_index( unsigned const memory_type_index_bits, flags const memory_type_flags ) const noexcept
{
    for( unsigned imt = 0; imt < memoryTypeCount; ++imt )
    {
        if( ( memory_type_index_bits & ( 1U << imt ) ) && ( memoryTypes[ imt ].propertyFlags & memory_type_flags() ) == memory_type_flags() )
        {
            return imt;
        }
    }
    return no_memory_type;
}

physical_device::physical_device( VkPhysicalDevice const native, instance_commands const& commands )
    : native_( native )
    , commands_( &commands )
{
    commands.vkGetPhysicalDeviceProperties( native_, &properties_ );
    commands.vkGetPhysicalDeviceFeatures( native_, &features_ );
    commands.vkGetPhysicalDeviceMemoryProperties( native_, &memory_properties_ );

    uint32_t count = 0;
    commands.vkGetPhysicalDeviceQueueFamilyProperties( native_, &count, nullptr );
    queue_families_.resize( count );
    if( 0 < count )
    {
        commands.vkGetPhysicalDeviceQueueFamilyProperties( native_, &count, queue_families_.data() );
        queue_families_.resize( count );
    }
}

std::vector< extension > physical_device::enumerate_extension_properties( layer::id_type const layer_id ) const
{
    return private_::enumerate< extension >( commands_->vkEnumerateDeviceExtensionProperties, dbg::object::PHYSICAL_DEVICE, "extension enumeration",
                                             native_, layer_id );
}

bool physical_device::supports_extension( std::string_view const name ) const
{
    return contains( enumerate_extension_properties(), name );
}

bool physical_device::supports_presentation( queue_family::id_type const family, VkSurfaceKHR const surface ) const
{
    if( nullptr == commands_ || !commands_->has_surface() )
    {
        throw validation_error( "surface", "VK_KHR_surface is not enabled on the instance" );
    }
    if( family >= queue_families_.size() )
    {
        throw validation_error( "family", "no such queue family" );
    }
    VkBool32 supported = VK_FALSE;
    check( commands_->vkGetPhysicalDeviceSurfaceSupportKHR( native_, family, surface, &supported ), dbg::object::SURFACE_KHR, "surface support query" );
    return VK_TRUE == supported;
}

std::optional< queue_family::id_type > physical_device::find_queue_family( queue_family::ability_flags const abilities, VkSurfaceKHR const surface ) const
{
    if( VK_NULL_HANDLE != surface && ( nullptr == commands_ || !commands_->has_surface() ) )
    {
        throw validation_error( "surface", "VK_KHR_surface is not enabled on the instance" );
    }
    auto const qualifies = [ & ]( queue_family::id_type const index ) {
        return queue_families_[ index ].does( abilities ) && 0 < queue_families_[ index ].count() &&
               ( VK_NULL_HANDLE == surface || supports_presentation( index, surface ) );
    };

    for( queue_family::id_type index = 0; index < queue_families_.size(); ++index )
    {
        if( queue_families_[ index ].queueFlags == abilities() && qualifies( index ) )
        {
            return index;
        }
    }
    for( queue_family::id_type index = 0; index < queue_families_.size(); ++index )
    {
        if( qualifies( index ) )
        {
            return index;
        }
    }
    return std::nullopt;
}

} // namespace vkguard
