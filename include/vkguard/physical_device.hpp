#ifndef _VKGUARD_PHYSICAL_DEVICE_INCLUDED_
#define _VKGUARD_PHYSICAL_DEVICE_INCLUDED_

#include <vkguard/commands.hpp>
#include <vkguard/common.hpp>
#include <vkguard/loader.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace vkguard
{
struct queue_family : public VkQueueFamilyProperties
{
    enum class ability_flag : uint32_t
    {
        SUPPORTS_GRAPHICS = VK_QUEUE_GRAPHICS_BIT,
        SUPPORTS_COMPUTATION = VK_QUEUE_COMPUTE_BIT,
        SUPPORTS_TRANSFER = VK_QUEUE_TRANSFER_BIT,
        SUPPORTS_SPARSE_BINDING = VK_QUEUE_SPARSE_BINDING_BIT
    };

    using ability_flags = enum_flags< ability_flag >;
    using id_type = uint32_t;

    static constexpr id_type const IGNORE_FAMILY = VK_QUEUE_FAMILY_IGNORED;

    [[nodiscard]] bool does( ability_flags const abilities ) const { return ( queueFlags & abilities() ) == abilities(); }
    [[nodiscard]] uint32_t count() const noexcept { return queueCount; }
};
static_assert( sizeof( queue_family ) == sizeof( VkQueueFamilyProperties ) );

/// Read-only descriptor of a physical device, captured when the instance enumerates it.
///
/// Cheap to copy and owns nothing on the driver side. It refers to the instance's function table,
/// so it is only usable while the instance lives.
class physical_device
{
public:
    enum class kind
    {
        OTHER = VK_PHYSICAL_DEVICE_TYPE_OTHER,
        INTEGRATED_GPU = VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU,
        DISCRETE_GPU = VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU,
        VIRTUAL_GPU = VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU,
        CPU = VK_PHYSICAL_DEVICE_TYPE_CPU
    };

    struct property : public VkPhysicalDeviceProperties
    {
        property()
            : VkPhysicalDeviceProperties{}
        {}

        [[nodiscard]] version api_version() const noexcept { return version( apiVersion ); }
        [[nodiscard]] version driver_version() const noexcept { return version( driverVersion ); }
        [[nodiscard]] physical_device::kind kind() const noexcept { return static_cast< physical_device::kind >( deviceType ); }
        [[nodiscard]] std::string_view name() const noexcept { return std::string_view( static_cast< char const* >( deviceName ) ); }
    };

    class feature : public VkPhysicalDeviceFeatures
    {
    public:
        feature()
            : VkPhysicalDeviceFeatures{}
        {}
    };

    class memory_property : public VkPhysicalDeviceMemoryProperties
    {
    public:
        enum class flag : uint32_t
        {
            DEVICE_LOCAL = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
            HOST_VISIBLE = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT,
            HOST_COHERENT = VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
            HOST_CACHED = VK_MEMORY_PROPERTY_HOST_CACHED_BIT,
            LAZILY_ALLOCATED = VK_MEMORY_PROPERTY_LAZILY_ALLOCATED_BIT
        };
        using flags = enum_flags< flag >;

        static constexpr unsigned const no_memory_type = std::numeric_limits< unsigned >::max();

        memory_property()
            : VkPhysicalDeviceMemoryProperties{}
        {}

        // First type allowed by memory_type_index_bits having all of memory_type_flags, no_memory_type otherwise.
        [[nodiscard]] unsigned find_memory_type_index( unsigned memory_type_index_bits, flags memory_type_flags ) const noexcept;

        [[nodiscard]] flags type_flags( uint32_t const memory_type_index ) const noexcept
        {
            return memory_type_index < memoryTypeCount ? flags( memoryTypes[ memory_type_index ].propertyFlags ) : flags();
        }
    };

    physical_device() = default;
    physical_device( VkPhysicalDevice native, instance_commands const& commands );

    explicit operator bool() const noexcept { return VK_NULL_HANDLE != native_; }

    [[nodiscard]] VkPhysicalDevice native() const noexcept { return native_; }
    [[nodiscard]] instance_commands const* commands() const noexcept { return commands_; }

    [[nodiscard]] property const& properties() const noexcept { return properties_; }
    [[nodiscard]] feature const& features() const noexcept { return features_; }
    [[nodiscard]] memory_property const& memory_properties() const noexcept { return memory_properties_; }
    [[nodiscard]] std::vector< queue_family > const& queue_families() const noexcept { return queue_families_; }

    [[nodiscard]] std::vector< extension > enumerate_extension_properties( layer::id_type layer_id = nullptr ) const;
    [[nodiscard]] bool supports_extension( std::string_view name ) const;

    [[nodiscard]] unsigned find_memory_type_index( unsigned const memory_type_index_bits, memory_property::flags const memory_type_flags ) const noexcept
    {
        return memory_properties_.find_memory_type_index( memory_type_index_bits, memory_type_flags );
    }

    // The surface is opaque here; it is only handed to vkGetPhysicalDeviceSurfaceSupportKHR, which
    // requires VK_KHR_surface on the instance.
    [[nodiscard]] bool supports_presentation( queue_family::id_type family, VkSurfaceKHR surface ) const;

    // Prefers a family with exactly the requested abilities, then any family having them.
    // With a surface, only families able to present to it qualify.
    [[nodiscard]] std::optional< queue_family::id_type > find_queue_family( queue_family::ability_flags abilities,
                                                                            VkSurfaceKHR surface = VK_NULL_HANDLE ) const;

private:
    VkPhysicalDevice native_{ VK_NULL_HANDLE };
    instance_commands const* commands_{ nullptr };
    property properties_;
    feature features_;
    memory_property memory_properties_;
    std::vector< queue_family > queue_families_;
};

} // namespace vkguard

#endif // _VKGUARD_PHYSICAL_DEVICE_INCLUDED_
