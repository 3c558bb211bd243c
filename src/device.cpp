#include <vkguard/device.hpp>
#include <vkguard/memory.hpp>

#include "log.hpp"
#include "resolve.hpp"

#include <algorithm>

namespace vkguard
{
device::queue::queue( device_commands const& commands, VkDevice const device, family::id_type const family_index, id_type const index )
    : native_( VK_NULL_HANDLE )
    , family_( family_index )
    , index_( index )
    , commands_( &commands )
{
    commands.vkGetDeviceQueue( device, family_index, index, &native_ );
}

void device::queue::wait_idle() const
{
    if( nullptr == commands_ )
    {
        throw validation_error( "queue", "not a queue of a device" );
    }
    check( commands_->vkQueueWaitIdle( native_ ), dbg::object::QUEUE, "waiting for idle" );
}

device::builder::builder( vkguard::physical_device const& physical_device ) noexcept
    : basic_builder( VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO )
    , physical_device_( &physical_device )
{}

device device::builder::build()
{
    require( nullptr != physical_device_ && *physical_device_ && nullptr != physical_device_->commands(), "physical_device",
             "not an enumerated physical device" );
    require( 0 < info_.queueCreateInfoCount, "add_queues", "no queue requested" );
    require_names( { info_.ppEnabledExtensionNames, info_.enabledExtensionCount }, "enabled_extensions" );
    require_names( { info_.ppEnabledLayerNames, info_.enabledLayerCount }, "enabled_layers" );

    std::span< VkDeviceQueueCreateInfo const > const requests( info_.pQueueCreateInfos, info_.queueCreateInfoCount );
    for( auto request = requests.begin(); request != requests.end(); ++request )
    {
        require( 0 < request->queueCount && nullptr != request->pQueuePriorities, "add_queues", "request without priorities" );
        for( auto const priority: std::span< queue::priority_type const >( request->pQueuePriorities, request->queueCount ) )
        {
            require( 0.0F <= priority && priority <= 1.0F, "add_queues", "priority outside [0, 1]" );
        }
        auto const family = request->queueFamilyIndex;
        require( std::none_of( requests.begin(), request, [ family ]( VkDeviceQueueCreateInfo const& other ) { return other.queueFamilyIndex == family; } ),
                 "add_queues", "queue family requested twice" );
    }

    // Checked against the descriptor: the driver is not required to reject these.
    auto const& families = physical_device_->queue_families();
    for( auto const& request: requests )
    {
        if( families.size() <= request.queueFamilyIndex )
        {
            throw driver_error( VK_ERROR_INITIALIZATION_FAILED, dbg::object::DEVICE, "device creation: unknown queue family" );
        }
        if( families[ request.queueFamilyIndex ].count() < request.queueCount )
        {
            throw driver_error( VK_ERROR_INITIALIZATION_FAILED, dbg::object::DEVICE, "device creation: too many queues for the family" );
        }
    }

    auto const& commands = *physical_device_->commands();
    VkDevice native = VK_NULL_HANDLE;
    check( commands.vkCreateDevice( physical_device_->native(), &info_, nullptr, &native ), dbg::object::DEVICE, "device creation" );

    auto const destroy = reinterpret_cast< PFN_vkDestroyDevice >( commands.vkGetDeviceProcAddr( native, "vkDestroyDevice" ) );
    if( nullptr == destroy )
    {
        throw loader_error( "driver does not expose vkDestroyDevice" );
    }
    return device( *physical_device_, private_::source_handle< VkDevice >( native, destroy ), info_ );
}

device::device( vkguard::physical_device const& physical, private_::source_handle< VkDevice >&& handle, VkDeviceCreateInfo const& info )
    : commands_( std::make_unique< device_commands >() )
    , handle_( std::move( handle ) )
    , physical_( physical )
    , queue_sets_()
    , extensions_( info.ppEnabledExtensionNames, info.ppEnabledExtensionNames + info.enabledExtensionCount )
{
    auto const gdpa = physical_.commands()->vkGetDeviceProcAddr;
    auto const native = handle_.native();
    auto& table = *commands_;

    private_::resolve_required( gdpa, native, "vkDestroyDevice", table.vkDestroyDevice );
    private_::resolve_required( gdpa, native, "vkGetDeviceQueue", table.vkGetDeviceQueue );
    private_::resolve_required( gdpa, native, "vkDeviceWaitIdle", table.vkDeviceWaitIdle );
    private_::resolve_required( gdpa, native, "vkQueueWaitIdle", table.vkQueueWaitIdle );
    private_::resolve_required( gdpa, native, "vkAllocateMemory", table.vkAllocateMemory );
    private_::resolve_required( gdpa, native, "vkFreeMemory", table.vkFreeMemory );
    private_::resolve_required( gdpa, native, "vkMapMemory", table.vkMapMemory );
    private_::resolve_required( gdpa, native, "vkUnmapMemory", table.vkUnmapMemory );
    private_::resolve_required( gdpa, native, "vkFlushMappedMemoryRanges", table.vkFlushMappedMemoryRanges );
    private_::resolve_required( gdpa, native, "vkInvalidateMappedMemoryRanges", table.vkInvalidateMappedMemoryRanges );
    private_::resolve_required( gdpa, native, "vkCreateBuffer", table.vkCreateBuffer );
    private_::resolve_required( gdpa, native, "vkDestroyBuffer", table.vkDestroyBuffer );
    private_::resolve_required( gdpa, native, "vkGetBufferMemoryRequirements", table.vkGetBufferMemoryRequirements );
    private_::resolve_required( gdpa, native, "vkBindBufferMemory", table.vkBindBufferMemory );
    private_::resolve_required( gdpa, native, "vkCreateImage", table.vkCreateImage );
    private_::resolve_required( gdpa, native, "vkDestroyImage", table.vkDestroyImage );
    private_::resolve_required( gdpa, native, "vkGetImageMemoryRequirements", table.vkGetImageMemoryRequirements );
    private_::resolve_required( gdpa, native, "vkBindImageMemory", table.vkBindImageMemory );

    queue_sets_.reserve( info.queueCreateInfoCount );
    for( auto const& request: std::span< VkDeviceQueueCreateInfo const >( info.pQueueCreateInfos, info.queueCreateInfoCount ) )
    {
        queue_set set{ request.queueFamilyIndex, {} };
        set.queues.reserve( request.queueCount );
        for( queue::id_type index = 0; index < request.queueCount; ++index )
        {
            set.queues.push_back( queue( table, native, request.queueFamilyIndex, index ) );
        }
        queue_sets_.push_back( std::move( set ) );
    }

    private_::log().debug( "device {:#x} created on {}, {} queue set(s)", private_::handle_id( native ), physical_.properties().name(), queue_sets_.size() );
}

device::~device()
{
    if( handle_ )
    {
        private_::log().debug( "destroying device {:#x}", private_::handle_id( handle_.native() ) );
    }
}

device::queue const& device::get_queue( size_t const request, queue::id_type const index ) const
{
    return queue_sets_.at( request ).queues.at( index );
}

bool device::is_extension_enabled( std::string_view const name ) const noexcept
{
    return std::find( extensions_.begin(), extensions_.end(), name ) != extensions_.end();
}

void device::wait_idle() const
{
    check( commands_->vkDeviceWaitIdle( native() ), dbg::object::DEVICE, "waiting for idle" );
}

memory device::allocate_memory( memory_requirements const& requirements, physical_device::memory_property::flags const properties ) const
{
    auto const type_index = physical_.find_memory_type_index( requirements.memoryTypeBits, properties );
    if( physical_device::memory_property::no_memory_type == type_index )
    {
        throw validation_error( "memory_type", "no memory type satisfies the requirements" );
    }
    return allocate_memory( requirements.size, type_index );
}

memory device::allocate_memory( VkDeviceSize const size, uint32_t const memory_type_index ) const
{
    return memory::builder().allocation_size( size ).memory_type_index( memory_type_index ).build( *this );
}

} // namespace vkguard
