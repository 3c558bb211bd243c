#include <vkguard/presentation.hpp>

namespace
{
constexpr vkguard::extension::id_type const instance_extension_names[] = {
    VK_KHR_SURFACE_EXTENSION_NAME,
#if defined( VK_USE_PLATFORM_WIN32_KHR )
    VK_KHR_WIN32_SURFACE_EXTENSION_NAME,
#endif
#if defined( VK_USE_PLATFORM_XLIB_KHR )
    VK_KHR_XLIB_SURFACE_EXTENSION_NAME,
#endif
#if defined( VK_USE_PLATFORM_XCB_KHR )
    VK_KHR_XCB_SURFACE_EXTENSION_NAME,
#endif
#if defined( VK_USE_PLATFORM_WAYLAND_KHR )
    VK_KHR_WAYLAND_SURFACE_EXTENSION_NAME,
#endif
#if defined( VK_USE_PLATFORM_ANDROID_KHR )
    VK_KHR_ANDROID_SURFACE_EXTENSION_NAME,
#endif
#if defined( VK_USE_PLATFORM_METAL_EXT )
    VK_EXT_METAL_SURFACE_EXTENSION_NAME,
#endif
};

constexpr vkguard::extension::id_type const device_extension_names[] = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };

} // namespace

namespace vkguard::presentation
{
std::span< extension::id_type const > instance_extensions() noexcept
{
    return instance_extension_names;
}

std::span< extension::id_type const > device_extensions() noexcept
{
    return device_extension_names;
}

} // namespace vkguard::presentation
