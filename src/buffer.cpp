#include <vkguard/buffer.hpp>

#include "bind.hpp"
#include "log.hpp"

namespace vkguard
{
buffer buffer::builder::build( device const& device ) const
{
    require( 0 < info_.size, "size", "must be set and non-zero" );
    require( 0 != info_.usage, "usage", "must be set" );
    if( VK_SHARING_MODE_CONCURRENT == info_.sharingMode )
    {
        require( 1 < info_.queueFamilyIndexCount, "sharing", "concurrent sharing needs at least two queue families" );
        for( auto const family: std::span< queue_family::id_type const >( info_.pQueueFamilyIndices, info_.queueFamilyIndexCount ) )
        {
            require( family < device.physical().queue_families().size(), "sharing", "no such queue family" );
        }
    }
    return buffer( device, info_ );
}

buffer::buffer( device const& device, VkBufferCreateInfo const& info )
    : base_type( device.native(), device.commands().vkDestroyBuffer )
    , commands_( &device.commands() )
    , size_( info.size )
    , usage_( static_cast< std::underlying_type_t< usage_flag > >( info.usage ) )
{
    check( commands_->vkCreateBuffer( device.native(), &info, nullptr, pnative() ), dbg::object::BUFFER, "buffer creation" );
    private_::log().trace( "buffer {:#x} created, {} bytes", private_::handle_id( native() ), size_ );
}

memory_requirements buffer::requirements() const
{
    VkMemoryRequirements native_requirements{};
    commands_->vkGetBufferMemoryRequirements( source_native(), native(), &native_requirements );
    return memory_requirements( native_requirements );
}

void buffer::bind_memory( memory const& memory, VkDeviceSize const offset )
{
    if( bound_ )
    {
        throw already_bound_error( dbg::object::BUFFER );
    }
    private_::check_bind( source_native(), requirements(), memory, offset );
    check( commands_->vkBindBufferMemory( source_native(), native(), memory.native(), offset ), dbg::object::BUFFER, "buffer memory binding" );
    bound_ = true;
}

VkResult buffer::bind_memory_unchecked( memory const& memory, VkDeviceSize const offset ) noexcept
{
    auto const status = commands_->vkBindBufferMemory( source_native(), native(), memory.native(), offset );
    if( VK_SUCCESS == status )
    {
        bound_ = true;
    }
    return status;
}

} // namespace vkguard
