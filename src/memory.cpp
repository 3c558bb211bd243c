#include <vkguard/memory.hpp>

#include "log.hpp"

#include <cstddef>
#include <utility>

namespace
{
constexpr VkDeviceSize align_down( VkDeviceSize const value, VkDeviceSize const alignment )
{
    return value - value % alignment;
}

constexpr VkDeviceSize align_up( VkDeviceSize const value, VkDeviceSize const alignment )
{
    return align_down( value + alignment - 1, alignment );
}

} // namespace

namespace vkguard
{
mapped_range::mapped_range( mapped_range&& range ) noexcept
    : owner_( std::exchange( range.owner_, nullptr ) )
    , data_( std::exchange( range.data_, nullptr ) )
    , offset_( std::exchange( range.offset_, 0 ) )
    , size_( std::exchange( range.size_, 0 ) )
    , mapped_offset_( std::exchange( range.mapped_offset_, 0 ) )
    , mapped_size_( std::exchange( range.mapped_size_, 0 ) )
{}

mapped_range& mapped_range::operator=( mapped_range&& range ) noexcept
{
    if( this != &range )
    {
        unmap();
        owner_ = std::exchange( range.owner_, nullptr );
        data_ = std::exchange( range.data_, nullptr );
        offset_ = std::exchange( range.offset_, 0 );
        size_ = std::exchange( range.size_, 0 );
        mapped_offset_ = std::exchange( range.mapped_offset_, 0 );
        mapped_size_ = std::exchange( range.mapped_size_, 0 );
    }
    return *this;
}

void mapped_range::flush() const
{
    if( nullptr == owner_ )
    {
        throw validation_error( "mapped_range", "not mapped" );
    }
    owner_->sync_range( mapped_offset_, mapped_size_, true );
}

void mapped_range::invalidate() const
{
    if( nullptr == owner_ )
    {
        throw validation_error( "mapped_range", "not mapped" );
    }
    owner_->sync_range( mapped_offset_, mapped_size_, false );
}

void mapped_range::unmap() noexcept
{
    if( nullptr != owner_ )
    {
        owner_->unmap_range();
    }
    owner_ = nullptr;
    data_ = nullptr;
    offset_ = 0;
    size_ = 0;
    mapped_offset_ = 0;
    mapped_size_ = 0;
}

memory memory::builder::build( device const& device ) const
{
    require( 0 < info_.allocationSize, "allocation_size", "must be set and non-zero" );
    require( unset_memory_type != info_.memoryTypeIndex, "memory_type_index", "must be set" );
    require( info_.memoryTypeIndex < device.physical().memory_properties().memoryTypeCount, "memory_type_index", "no such memory type on the device" );
    return memory( device, info_ );
}

memory::memory( device const& device, VkMemoryAllocateInfo const& info )
    : base_type( device.native(), device.commands().vkFreeMemory )
    , commands_( &device.commands() )
    , size_( info.allocationSize )
    , memory_type_index_( info.memoryTypeIndex )
    , properties_( device.physical().memory_properties().type_flags( info.memoryTypeIndex ) )
    , atom_size_( device.physical().properties().limits.nonCoherentAtomSize )
{
    if( 0 == atom_size_ )
    {
        atom_size_ = 1;
    }
    check( commands_->vkAllocateMemory( device.native(), &info, nullptr, pnative() ), dbg::object::DEVICE_MEMORY, "memory allocation" );
    private_::log().trace( "allocated {} bytes of memory type {} as {:#x}", size_, memory_type_index_, private_::handle_id( native() ) );
}

mapped_range memory::map( VkDeviceSize const offset, VkDeviceSize const size )
{
    if( !*this )
    {
        throw validation_error( "memory", "no allocation" );
    }
    if( mapped_ )
    {
        throw already_mapped_error();
    }
    if( !is_host_visible() )
    {
        throw validation_error( "memory_type_index", "memory type is not host visible" );
    }
    if( size_ <= offset )
    {
        throw validation_error( "offset", "outside the allocation" );
    }
    auto const length = VK_WHOLE_SIZE == size ? size_ - offset : size;
    if( 0 == length || size_ - offset < length )
    {
        throw validation_error( "size", "range outside the allocation" );
    }

    // Non-coherent memory is mapped in whole atoms (or up to the end of the allocation), so that
    // flush() and invalidate() never reach outside the mapping.
    auto mapped_offset = offset;
    auto mapped_size = length;
    if( !properties_.contains( physical_device::memory_property::flag::HOST_COHERENT ) )
    {
        mapped_offset = align_down( offset, atom_size_ );
        auto const end = align_up( offset + length, atom_size_ );
        mapped_size = ( size_ < end ? size_ : end ) - mapped_offset;
    }

    void* data = nullptr;
    check( commands_->vkMapMemory( source_native(), native(), mapped_offset, mapped_size, 0, &data ), dbg::object::DEVICE_MEMORY,
           "memory mapping" );
    mapped_ = true;
    return mapped_range( *this, static_cast< std::byte* >( data ) + ( offset - mapped_offset ), offset, length, mapped_offset, mapped_size );
}

void* memory::map_unchecked( VkDeviceSize const offset, VkDeviceSize const size ) const noexcept
{
    void* data = nullptr;
    if( VK_SUCCESS != commands_->vkMapMemory( source_native(), native(), offset, size, 0, &data ) )
    {
        return nullptr;
    }
    return data;
}

void memory::unmap_unchecked() const noexcept
{
    commands_->vkUnmapMemory( source_native(), native() );
}

void memory::unmap_range() noexcept
{
    if( mapped_ )
    {
        commands_->vkUnmapMemory( source_native(), native() );
        mapped_ = false;
    }
}

void memory::sync_range( VkDeviceSize const offset, VkDeviceSize const size, bool const flush ) const
{
    if( properties_.contains( physical_device::memory_property::flag::HOST_COHERENT ) )
    {
        return;
    }
    // The range is the mapping itself: atom aligned, or ending at the end of the allocation.
    VkMappedMemoryRange const range{
        .sType = VK_STRUCTURE_TYPE_MAPPED_MEMORY_RANGE, .pNext = nullptr, .memory = native(), .offset = offset, .size = size };
    if( flush )
    {
        check( commands_->vkFlushMappedMemoryRanges( source_native(), 1, &range ), dbg::object::DEVICE_MEMORY, "flush of mapped memory" );
    }
    else
    {
        check( commands_->vkInvalidateMappedMemoryRanges( source_native(), 1, &range ), dbg::object::DEVICE_MEMORY, "invalidation of mapped memory" );
    }
}

} // namespace vkguard
