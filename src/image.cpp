#include <vkguard/image.hpp>

#include "bind.hpp"
#include "log.hpp"

namespace vkguard
{
image::builder::builder() noexcept
    : basic_builder( VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO )
{
    info_.imageType = VK_IMAGE_TYPE_2D;
    info_.format = VK_FORMAT_UNDEFINED;
    info_.mipLevels = 1;
    info_.arrayLayers = 1;
    info_.samples = VK_SAMPLE_COUNT_1_BIT;
    info_.tiling = VK_IMAGE_TILING_OPTIMAL;
    info_.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    info_.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
}

image image::builder::build( device const& device ) const
{
    require( VK_FORMAT_UNDEFINED != info_.format, "format", "must be set" );
    require( 0 < info_.extent.width && 0 < info_.extent.height && 0 < info_.extent.depth, "extent", "every dimension must be non-zero" );
    require( VK_IMAGE_TYPE_3D == info_.imageType || 1 == info_.extent.depth, "extent", "depth above 1 needs a 3D image" );
    require( VK_IMAGE_TYPE_1D != info_.imageType || 1 == info_.extent.height, "extent", "height above 1 needs a 2D or 3D image" );
    require( 0 < info_.mipLevels, "mip_levels", "must be at least 1" );
    require( 0 < info_.arrayLayers, "array_layers", "must be at least 1" );
    require( 0 != info_.usage, "usage", "must be set" );
    require( VK_IMAGE_LAYOUT_UNDEFINED == info_.initialLayout || VK_IMAGE_LAYOUT_PREINITIALIZED == info_.initialLayout, "initial_layout",
             "must be undefined or preinitialized" );
    if( VK_SHARING_MODE_CONCURRENT == info_.sharingMode )
    {
        require( 1 < info_.queueFamilyIndexCount, "sharing", "concurrent sharing needs at least two queue families" );
        for( auto const family: std::span< queue_family::id_type const >( info_.pQueueFamilyIndices, info_.queueFamilyIndexCount ) )
        {
            require( family < device.physical().queue_families().size(), "sharing", "no such queue family" );
        }
    }
    return image( device, info_ );
}

image::image( device const& device, VkImageCreateInfo const& info )
    : base_type( device.native(), device.commands().vkDestroyImage )
    , commands_( &device.commands() )
    , format_( info.format )
    , extent_( info.extent )
    , mip_levels_( info.mipLevels )
    , array_layers_( info.arrayLayers )
    , usage_( static_cast< std::underlying_type_t< usage_flag > >( info.usage ) )
{
    check( commands_->vkCreateImage( device.native(), &info, nullptr, pnative() ), dbg::object::IMAGE, "image creation" );
    private_::log().trace( "image {:#x} created, {}x{}x{}", private_::handle_id( native() ), extent_.width, extent_.height, extent_.depth );
}

memory_requirements image::requirements() const
{
    VkMemoryRequirements native_requirements{};
    commands_->vkGetImageMemoryRequirements( source_native(), native(), &native_requirements );
    return memory_requirements( native_requirements );
}

void image::bind_memory( memory const& memory, VkDeviceSize const offset )
{
    if( bound_ )
    {
        throw already_bound_error( dbg::object::IMAGE );
    }
    private_::check_bind( source_native(), requirements(), memory, offset );
    check( commands_->vkBindImageMemory( source_native(), native(), memory.native(), offset ), dbg::object::IMAGE, "image memory binding" );
    bound_ = true;
}

VkResult image::bind_memory_unchecked( memory const& memory, VkDeviceSize const offset ) noexcept
{
    auto const status = commands_->vkBindImageMemory( source_native(), native(), memory.native(), offset );
    if( VK_SUCCESS == status )
    {
        bound_ = true;
    }
    return status;
}

} // namespace vkguard
