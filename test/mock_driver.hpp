#ifndef _VKGUARD_TEST_MOCK_DRIVER_INCLUDED_
#define _VKGUARD_TEST_MOCK_DRIVER_INCLUDED_

#include <vkguard/common.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <type_traits>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// In-process stand-in for a Vulkan driver: every entry point is served from vkGetInstanceProcAddr,
// so the library is exercised without a GPU. Handles are plain counters, never dereferenced.
namespace vkguard::mock
{
struct settings
{
    // 0 hides vkEnumerateInstanceVersion, as a 1.0 loader does.
    uint32_t instance_version{ VK_MAKE_VERSION( 1, 1, 0 ) };
    std::vector< std::string > instance_extensions;
    std::vector< std::string > layers;
    // Entry point names the driver pretends not to know.
    std::vector< std::string > hidden_entry_points;

    uint32_t physical_device_count{ 1 };
    // The first count query reports one device less, as if one appeared between the two calls.
    bool grow_physical_devices{ false };
    VkResult enumerate_physical_devices_result{ VK_SUCCESS };

    std::vector< VkQueueFamilyProperties > queue_families;
    VkPhysicalDeviceMemoryProperties memory{};
    std::vector< std::string > device_extensions;
    VkDeviceSize non_coherent_atom_size{ 64 };
    bool surface_support{ true };

    bool out_of_host_memory{ false };
    VkResult bind_result{ VK_SUCCESS };
    VkResult wait_result{ VK_SUCCESS };
};

struct object_event
{
    std::string type;
    uint64_t id;
    bool created;
};

struct instance_record
{
    std::vector< std::string > extensions;
    uint32_t api_version;
};

struct device_record
{
    std::vector< std::string > extensions;
    std::vector< std::pair< uint32_t, uint32_t > > queue_requests;
};

struct memory_record
{
    VkDevice device;
    uint32_t type_index;
    VkDeviceSize size;
    std::vector< std::byte > storage;
    bool mapped{ false };
    VkDeviceSize mapped_offset{ 0 };
    VkDeviceSize mapped_size{ 0 };
};

struct resource_record
{
    VkDevice device;
    VkMemoryRequirements requirements;
    uint64_t bound_memory{ 0 };
    VkDeviceSize bound_offset{ 0 };
};

struct callback_record
{
    VkInstance instance;
    VkDebugReportFlagsEXT flags;
    PFN_vkDebugReportCallbackEXT callback;
    void* user_data;
};

class driver
{
public:
    static driver& get();

    // Default configuration, no live objects, counters cleared.
    void reset();

    [[nodiscard]] PFN_vkGetInstanceProcAddr entry_point() const noexcept;

    // Delivers a message to every registered callback whose flags match.
    void emit( VkDebugReportFlagsEXT flags, VkDebugReportObjectTypeEXT object_type, uint64_t object, int32_t code, char const* prefix,
               char const* message );
    // Same from a thread owned by the driver; returns that thread's id once it has finished.
    std::thread::id emit_from_driver_thread( VkDebugReportFlagsEXT flags, int32_t code, char const* message );

    [[nodiscard]] size_t live_objects() const;
    [[nodiscard]] size_t count_events( std::string const& type, bool created ) const;

    settings config;

    std::vector< object_event > events;
    size_t create_calls{ 0 };
    size_t map_calls{ 0 };
    size_t unmap_calls{ 0 };
    size_t flush_calls{ 0 };
    size_t invalidate_calls{ 0 };
    // Flushes and invalidations refused because the range was not inside the mapping or not atom aligned.
    size_t rejected_ranges{ 0 };
    size_t bind_calls{ 0 };
    size_t wait_calls{ 0 };
    VkMappedMemoryRange last_range{};

    std::map< uint64_t, instance_record > instances;
    std::map< uint64_t, device_record > devices;
    std::map< uint64_t, memory_record > memories;
    std::map< uint64_t, resource_record > buffers;
    std::map< uint64_t, resource_record > images;
    std::map< uint64_t, callback_record > callbacks;

    uint64_t next_id() { return ++last_id_; }
    void record( std::string type, uint64_t id, bool created );

private:
    driver() { reset(); }

    uint64_t last_id_{ 0x1000 };
};

// Default memory layout: 0 device local, 1 host visible and coherent, 2 host visible and cached.
// Heap 0 has 256 MiB, heap 1 64 MiB.
constexpr uint32_t const device_local_type = 0;
constexpr uint32_t const host_coherent_type = 1;
constexpr uint32_t const host_cached_type = 2;

template< typename vk_handle >
vk_handle make_handle( uint64_t const id ) noexcept
{
    if constexpr( std::is_pointer_v< vk_handle > )
    {
        return reinterpret_cast< vk_handle >( static_cast< std::uintptr_t >( id ) );
    }
    else
    {
        return static_cast< vk_handle >( id );
    }
}

} // namespace vkguard::mock

#endif // _VKGUARD_TEST_MOCK_DRIVER_INCLUDED_
