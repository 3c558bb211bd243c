#ifndef _VKGUARD_MEMORY_INCLUDED_
#define _VKGUARD_MEMORY_INCLUDED_

#include <vkguard/builder.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/device.hpp>
#include <vkguard/handles.hpp>

#include <cstddef>
#include <limits>
#include <span>

namespace vkguard
{
class memory;

/// Scoped host view of a mapped memory range. Unmaps on destruction, on every exit path.
class mapped_range
{
public:
    mapped_range( mapped_range const& ) = delete;
    mapped_range& operator=( mapped_range const& ) = delete;
    mapped_range( mapped_range&& range ) noexcept;
    mapped_range& operator=( mapped_range&& range ) noexcept;
    ~mapped_range() noexcept { unmap(); }

    [[nodiscard]] void* data() const noexcept { return data_; }
    [[nodiscard]] VkDeviceSize offset() const noexcept { return offset_; }
    [[nodiscard]] VkDeviceSize size() const noexcept { return size_; }

    explicit operator bool() const noexcept { return nullptr != data_; }

    template< typename value_type >
    [[nodiscard]] std::span< value_type > as() const noexcept
    {
        return std::span< value_type >( static_cast< value_type* >( data_ ), static_cast< size_t >( size_ / sizeof( value_type ) ) );
    }

    // Only needed for memory types without HOST_COHERENT.
    void flush() const;
    void invalidate() const;

    void unmap() noexcept;

private:
    friend class memory;

    mapped_range( memory& owner, void* data, VkDeviceSize offset, VkDeviceSize size, VkDeviceSize mapped_offset, VkDeviceSize mapped_size ) noexcept
        : owner_( &owner )
        , data_( data )
        , offset_( offset )
        , size_( size )
        , mapped_offset_( mapped_offset )
        , mapped_size_( mapped_size )
    {}

    memory* owner_;
    void* data_;
    VkDeviceSize offset_;
    VkDeviceSize size_;
    // What the driver actually mapped: the requested range widened to whole atoms for
    // non-coherent memory. Flushes and invalidations cover exactly this range.
    VkDeviceSize mapped_offset_;
    VkDeviceSize mapped_size_;
};

/// A device memory allocation.
///
/// map() hands out a scoped mapped_range and refuses a second mapping while one is alive;
/// map_unchecked() skips that bookkeeping and every check. The memory must not be moved while
/// a mapped_range refers to it, and concurrent map() calls on one memory are not synchronised.
class memory : public private_::derived_handle< VkDevice, VkDeviceMemory >
{
public:
    using base_type = private_::derived_handle< VkDevice, VkDeviceMemory >;
    using property_flags = physical_device::memory_property::flags;

    static constexpr uint32_t const unset_memory_type = std::numeric_limits< uint32_t >::max();

    class builder : public basic_builder< VkMemoryAllocateInfo >
    {
    public:
        builder() noexcept
            : basic_builder( VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO )
        {
            info_.memoryTypeIndex = unset_memory_type;
        }

        builder& allocation_size( VkDeviceSize const size ) noexcept
        {
            info_.allocationSize = size;
            return *this;
        }

        // Selects the properties of the memory and the heap it comes from.
        builder& memory_type_index( uint32_t const index ) noexcept
        {
            info_.memoryTypeIndex = index;
            return *this;
        }

        memory build( device const& device ) const;
    };

    memory( memory&& ) noexcept = default;
    memory& operator=( memory&& ) noexcept = default;

    [[nodiscard]] VkDeviceSize size() const noexcept { return size_; }
    [[nodiscard]] uint32_t memory_type_index() const noexcept { return memory_type_index_; }
    [[nodiscard]] property_flags properties() const noexcept { return properties_; }
    [[nodiscard]] bool is_host_visible() const noexcept { return properties_.contains( physical_device::memory_property::flag::HOST_VISIBLE ); }
    [[nodiscard]] bool is_mapped() const noexcept { return mapped_; }

    // Checked: no live mapping, host visible type, range inside the allocation. On non-coherent
    // memory the driver maps the enclosing atom-aligned range; data() still points at offset.
    [[nodiscard]] mapped_range map( VkDeviceSize offset = 0, VkDeviceSize size = VK_WHOLE_SIZE );

    // Unchecked: direct vkMapMemory. Overlapping, out of range or repeated mappings are undefined
    // behaviour. Returns nullptr when the driver fails.
    [[nodiscard]] void* map_unchecked( VkDeviceSize offset, VkDeviceSize size ) const noexcept;
    void unmap_unchecked() const noexcept;

private:
    friend class mapped_range;
    friend class device;

    memory( device const& device, VkMemoryAllocateInfo const& info );

    void unmap_range() noexcept;
    void sync_range( VkDeviceSize offset, VkDeviceSize size, bool flush ) const;

    device_commands const* commands_{ nullptr };
    VkDeviceSize size_{ 0 };
    uint32_t memory_type_index_{ unset_memory_type };
    property_flags properties_;
    // nonCoherentAtomSize of the device, alignment of flushed and invalidated ranges.
    VkDeviceSize atom_size_{ 1 };
    bool mapped_{ false };
};

} // namespace vkguard

#endif // _VKGUARD_MEMORY_INCLUDED_
