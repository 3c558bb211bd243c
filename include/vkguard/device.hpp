#ifndef _VKGUARD_DEVICE_INCLUDED_
#define _VKGUARD_DEVICE_INCLUDED_

#include <vkguard/builder.hpp>
#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/handles.hpp>
#include <vkguard/loader.hpp>
#include <vkguard/physical_device.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vkguard
{
class memory;

struct memory_requirements : public VkMemoryRequirements
{
    memory_requirements()
        : VkMemoryRequirements{}
    {}
    explicit memory_requirements( VkMemoryRequirements const& native )
        : VkMemoryRequirements( native )
    {}

    [[nodiscard]] VkDeviceSize bytes() const noexcept { return size; }
    [[nodiscard]] bool allows( uint32_t const memory_type_index ) const noexcept
    {
        return memory_type_index < 32 && 0 != ( memoryTypeBits & ( 1U << memory_type_index ) );
    }
};

/// Owner of a VkDevice, its function table and the queues requested at build time.
///
/// Resources created from the device keep a pointer to its table and must be destroyed first;
/// the device itself must be destroyed before its instance. Neither is checked.
class device
{
public:
    class queue
    {
    public:
        using family = queue_family;
        using id_type = uint32_t;
        using priority_type = float;

        enum class sharing
        {
            EXCLUSIVE = VK_SHARING_MODE_EXCLUSIVE,
            CONCURRENT = VK_SHARING_MODE_CONCURRENT,
        };

        // One entry of device::builder::add_queues(): a family and one priority per queue wanted
        // from it. The priorities are borrowed until build() returns.
        struct request : public VkDeviceQueueCreateInfo
        {
            request( family::id_type const family_index, std::span< priority_type const > const priorities ) noexcept
                : VkDeviceQueueCreateInfo{ .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
                                           .pNext = nullptr,
                                           .flags = 0,
                                           .queueFamilyIndex = family_index,
                                           .queueCount = static_cast< uint32_t >( priorities.size() ),
                                           .pQueuePriorities = priorities.empty() ? nullptr : priorities.data() }
            {}

            [[nodiscard]] family::id_type family_index() const noexcept { return queueFamilyIndex; }
            [[nodiscard]] std::span< priority_type const > priorities() const noexcept { return { pQueuePriorities, queueCount }; }
        };

        queue() = default;

        [[nodiscard]] VkQueue native() const noexcept { return native_; }
        [[nodiscard]] family::id_type family_index() const noexcept { return family_; }
        [[nodiscard]] id_type index() const noexcept { return index_; }

        explicit operator bool() const noexcept { return VK_NULL_HANDLE != native_; }

        void wait_idle() const;

    private:
        friend class device;

        queue( device_commands const& commands, VkDevice device, family::id_type family_index, id_type index );

        VkQueue native_{ VK_NULL_HANDLE };
        family::id_type family_{ family::IGNORE_FAMILY };
        id_type index_{ 0 };
        device_commands const* commands_{ nullptr };
    };

    // Queues of one request, in queue index order.
    struct queue_set
    {
        queue::family::id_type family_index;
        std::vector< queue > queues;
    };

    class builder : public basic_builder< VkDeviceCreateInfo >
    {
    public:
        static_assert( sizeof( queue::request ) == sizeof( VkDeviceQueueCreateInfo ) );

        explicit builder( vkguard::physical_device const& physical_device ) noexcept;

        // Sets the borrowed request list; a later call replaces it. Queues come back in this order.
        builder& add_queues( std::span< queue::request const > const requests ) noexcept
        {
            info_.queueCreateInfoCount = static_cast< uint32_t >( requests.size() );
            info_.pQueueCreateInfos = requests.empty() ? nullptr : requests.data();
            return *this;
        }

        builder& enabled_extensions( std::span< extension::id_type const > const names ) noexcept
        {
            info_.enabledExtensionCount = static_cast< uint32_t >( names.size() );
            info_.ppEnabledExtensionNames = names.empty() ? nullptr : names.data();
            return *this;
        }

        // Device layers are deprecated by the API but still honoured by older drivers.
        builder& enabled_layers( std::span< layer::id_type const > const names ) noexcept
        {
            info_.enabledLayerCount = static_cast< uint32_t >( names.size() );
            info_.ppEnabledLayerNames = names.empty() ? nullptr : names.data();
            return *this;
        }

        builder& enabled_features( physical_device::feature const& features ) noexcept
        {
            info_.pEnabledFeatures = &features;
            return *this;
        }

        device build();

    private:
        vkguard::physical_device const* physical_device_;
    };

    device( device&& ) noexcept = default;
    device& operator=( device&& ) = delete;
    device( device const& ) = delete;
    device& operator=( device const& ) = delete;
    ~device();

    explicit operator bool() const noexcept { return static_cast< bool >( handle_ ); }

    [[nodiscard]] VkDevice native() const noexcept { return handle_.native(); }
    [[nodiscard]] device_commands const& commands() const noexcept { return *commands_; }
    [[nodiscard]] vkguard::physical_device const& physical() const noexcept { return physical_; }

    // One set per request given to the builder, in request order.
    [[nodiscard]] std::vector< queue_set > const& queues() const noexcept { return queue_sets_; }
    // Throws std::out_of_range for a request or index the device was not built with.
    [[nodiscard]] queue const& get_queue( size_t request, queue::id_type index = 0 ) const;

    [[nodiscard]] bool is_extension_enabled( std::string_view name ) const noexcept;

    void wait_idle() const;

    // Picks the first memory type allowed by the requirements that has all the requested properties.
    [[nodiscard]] memory allocate_memory( memory_requirements const& requirements, physical_device::memory_property::flags properties ) const;
    [[nodiscard]] memory allocate_memory( VkDeviceSize size, uint32_t memory_type_index ) const;

private:
    device( vkguard::physical_device const& physical, private_::source_handle< VkDevice >&& handle, VkDeviceCreateInfo const& info );

    std::unique_ptr< device_commands > commands_;
    private_::source_handle< VkDevice > handle_;
    vkguard::physical_device physical_;
    std::vector< queue_set > queue_sets_;
    std::vector< std::string > extensions_;
};

} // namespace vkguard

#endif // _VKGUARD_DEVICE_INCLUDED_
