#ifndef _VKGUARD_COMMANDS_INCLUDED_
#define _VKGUARD_COMMANDS_INCLUDED_

#include <vkguard/common.hpp>

namespace vkguard
{
// Entry points resolved from vkGetInstanceProcAddr with a null instance.
struct global_commands
{
    PFN_vkGetInstanceProcAddr vkGetInstanceProcAddr{ nullptr };
    PFN_vkCreateInstance vkCreateInstance{ nullptr };
    PFN_vkEnumerateInstanceExtensionProperties vkEnumerateInstanceExtensionProperties{ nullptr };
    PFN_vkEnumerateInstanceLayerProperties vkEnumerateInstanceLayerProperties{ nullptr };
    // Vulkan 1.1, null on a 1.0 loader.
    PFN_vkEnumerateInstanceVersion vkEnumerateInstanceVersion{ nullptr };
};

// Instance level entry points. Extension entries stay null unless their extension was enabled.
struct instance_commands
{
    PFN_vkDestroyInstance vkDestroyInstance{ nullptr };
    PFN_vkEnumeratePhysicalDevices vkEnumeratePhysicalDevices{ nullptr };
    PFN_vkGetPhysicalDeviceProperties vkGetPhysicalDeviceProperties{ nullptr };
    PFN_vkGetPhysicalDeviceFeatures vkGetPhysicalDeviceFeatures{ nullptr };
    PFN_vkGetPhysicalDeviceMemoryProperties vkGetPhysicalDeviceMemoryProperties{ nullptr };
    PFN_vkGetPhysicalDeviceQueueFamilyProperties vkGetPhysicalDeviceQueueFamilyProperties{ nullptr };
    PFN_vkEnumerateDeviceExtensionProperties vkEnumerateDeviceExtensionProperties{ nullptr };
    PFN_vkCreateDevice vkCreateDevice{ nullptr };
    PFN_vkGetDeviceProcAddr vkGetDeviceProcAddr{ nullptr };

    // VK_EXT_debug_report
    PFN_vkCreateDebugReportCallbackEXT vkCreateDebugReportCallbackEXT{ nullptr };
    PFN_vkDestroyDebugReportCallbackEXT vkDestroyDebugReportCallbackEXT{ nullptr };
    PFN_vkDebugReportMessageEXT vkDebugReportMessageEXT{ nullptr };

    // VK_KHR_surface
    PFN_vkGetPhysicalDeviceSurfaceSupportKHR vkGetPhysicalDeviceSurfaceSupportKHR{ nullptr };

    [[nodiscard]] bool has_debug_report() const noexcept
    {
        return nullptr != vkCreateDebugReportCallbackEXT && nullptr != vkDestroyDebugReportCallbackEXT;
    }
    [[nodiscard]] bool has_surface() const noexcept { return nullptr != vkGetPhysicalDeviceSurfaceSupportKHR; }
};

// Device level entry points, resolved through vkGetDeviceProcAddr.
struct device_commands
{
    PFN_vkDestroyDevice vkDestroyDevice{ nullptr };
    PFN_vkGetDeviceQueue vkGetDeviceQueue{ nullptr };
    PFN_vkDeviceWaitIdle vkDeviceWaitIdle{ nullptr };
    PFN_vkQueueWaitIdle vkQueueWaitIdle{ nullptr };

    PFN_vkAllocateMemory vkAllocateMemory{ nullptr };
    PFN_vkFreeMemory vkFreeMemory{ nullptr };
    PFN_vkMapMemory vkMapMemory{ nullptr };
    PFN_vkUnmapMemory vkUnmapMemory{ nullptr };
    PFN_vkFlushMappedMemoryRanges vkFlushMappedMemoryRanges{ nullptr };
    PFN_vkInvalidateMappedMemoryRanges vkInvalidateMappedMemoryRanges{ nullptr };

    PFN_vkCreateBuffer vkCreateBuffer{ nullptr };
    PFN_vkDestroyBuffer vkDestroyBuffer{ nullptr };
    PFN_vkGetBufferMemoryRequirements vkGetBufferMemoryRequirements{ nullptr };
    PFN_vkBindBufferMemory vkBindBufferMemory{ nullptr };

    PFN_vkCreateImage vkCreateImage{ nullptr };
    PFN_vkDestroyImage vkDestroyImage{ nullptr };
    PFN_vkGetImageMemoryRequirements vkGetImageMemoryRequirements{ nullptr };
    PFN_vkBindImageMemory vkBindImageMemory{ nullptr };
};

} // namespace vkguard

#endif // _VKGUARD_COMMANDS_INCLUDED_
